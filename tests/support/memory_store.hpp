#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "adapters/storage/storage_client.hpp"

namespace fxfer::testing {

/// In-memory StorageClient with fault injection hooks.
///
/// Directories are implicit (any prefix of an object path) or created by
/// mkdir(). Hooks run outside the store lock before the operation itself and
/// may fail it by returning an error.
class MemoryStore : public adapters::storage::StorageClient {
public:
    using Hook = std::function<infra::VoidResult(const std::string& path, std::uint64_t offset)>;

    auto info(const std::string& path) -> infra::Result<adapters::storage::EntryInfo> override;
    auto exists(const std::string& path) -> bool override;
    auto list(const std::string& path) -> infra::Result<std::vector<adapters::storage::EntryInfo>> override;
    auto ranged_read(const std::string& path, std::uint64_t offset, std::uint64_t length)
        -> infra::Result<std::vector<char>> override;
    auto ranged_write(const std::string& path, std::uint64_t offset, std::span<const char> data)
        -> infra::VoidResult override;
    auto touch(const std::string& path) -> infra::VoidResult override;
    auto mkdir(const std::string& path) -> infra::VoidResult override;
    auto remove(const std::string& path, bool recursive = false) -> infra::VoidResult override;

    void put(const std::string& path, std::string content);
    void put(const std::string& path, std::vector<char> content);
    [[nodiscard]] auto content(const std::string& path) const -> std::string;
    [[nodiscard]] auto object_count(const std::string& prefix = "") const -> std::size_t;
    [[nodiscard]] auto total_bytes(const std::string& prefix = "") const -> std::uint64_t;

    void set_read_hook(Hook hook) { std::lock_guard lock(mutex_); read_hook_ = std::move(hook); }
    void set_write_hook(Hook hook) { std::lock_guard lock(mutex_); write_hook_ = std::move(hook); }

    [[nodiscard]] auto reads() const -> std::size_t { return reads_.load(); }
    [[nodiscard]] auto writes() const -> std::size_t { return writes_.load(); }

    static auto normalize(const std::string& path) -> std::string;

private:
    [[nodiscard]] auto is_dir_locked_(const std::string& path) const -> bool;
    [[nodiscard]] auto hook_(const Hook& hook) const -> Hook;

    mutable std::mutex mutex_;
    std::map<std::string, std::vector<char>> objects_;
    std::set<std::string> dirs_;
    Hook read_hook_;
    Hook write_hook_;
    std::atomic<std::size_t> reads_{0};
    std::atomic<std::size_t> writes_{0};
};

} // namespace fxfer::testing
