#pragma once

#include <atomic>
#include <cstdint>
#include "adapters/storage/storage_client.hpp"
#include "core/job/transfer_types.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/retry.hpp"

namespace fxfer::core {

// Each call opens its own local handle.
class ChunkTransfer {
public:
    ChunkTransfer(adapters::storage::StorageClient& storage, infra::RetryPolicy policy);

    [[nodiscard]] auto transfer(Direction direction, const FileTransfer& file, const Chunk& chunk)
        -> infra::VoidResult;

    [[nodiscard]] auto retries() const -> std::uint64_t { return retries_.load(); }

private:
    [[nodiscard]] auto download_(const FileTransfer& file, const Chunk& chunk) -> infra::VoidResult;
    [[nodiscard]] auto upload_(const FileTransfer& file, const Chunk& chunk) -> infra::VoidResult;
    void on_retry_(const FileTransfer& file, const Chunk& chunk, int attempt, const infra::Error& err);

    adapters::storage::StorageClient& storage_;
    infra::RetryPolicy policy_;
    std::atomic<std::uint64_t> retries_{0};
};

} // namespace fxfer::core
