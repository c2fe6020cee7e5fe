#pragma once

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace fxfer::core {

// Position of a chunk inside TransferJob::files()
struct ChunkRef {
    std::size_t file = 0;
    std::size_t chunk = 0;
};

class ChunkQueue {
public:
    void push(ChunkRef ref) {
        std::lock_guard lock(mutex_);
        items_.push_back(ref);
    }

    [[nodiscard]] std::optional<ChunkRef> pop() {
        std::lock_guard lock(mutex_);
        if (items_.empty()) return std::nullopt;
        const auto ref = items_.front();
        items_.pop_front();
        return ref;
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard lock(mutex_);
        return items_.size();
    }

private:
    mutable std::mutex mutex_;
    std::deque<ChunkRef> items_;
};

} // namespace fxfer::core
