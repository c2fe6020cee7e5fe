#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "adapters/storage/storage_client.hpp"
#include "core/job/transfer_job.hpp"
#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/interrupt.hpp"
#include "infra/monitoring/monitoring.hpp"

namespace fxfer::core {

struct ChunkFailure {
    std::string source;
    std::uint64_t offset = 0;
    infra::Error error;
};

struct TransferStats {
    std::size_t files = 0;
    std::size_t total_chunks = 0;
    std::size_t transferred_chunks = 0;   // during this run
    std::uint64_t transferred_bytes = 0;  // during this run
    std::size_t remaining = 0;            // chunks still not done
    std::uint64_t retries = 0;
    bool interrupted = false;
    std::vector<ChunkFailure> failures;
    std::chrono::milliseconds elapsed{0};

    [[nodiscard]] auto complete() const -> bool { return remaining == 0; }
};

/// Runs the pending chunks of a TransferJob on a bounded worker pool.
///
/// run() returns when the queue is drained, or after a stop request once
/// in-flight chunks have finished. Failed chunks stay pending. Only a size or
/// checksum mismatch on a finished file aborts the run with an error.
class TransferEngine {
public:
    TransferEngine(adapters::storage::StorageClient& storage,
                   const infra::Config& config,
                   infra::ProgressMonitor& monitor);

    [[nodiscard]] auto run(TransferJob& job,
                           infra::InterruptController& interrupt,
                           std::optional<std::uint32_t> nthreads = std::nullopt)
        -> infra::Result<TransferStats>;

private:
    struct RunState;

    [[nodiscard]] auto prepare_destination_(const TransferJob& job, FileTransfer& file)
        -> infra::VoidResult;
    [[nodiscard]] auto finalize_file_(const TransferJob& job, const FileTransfer& file)
        -> infra::VoidResult;
    [[nodiscard]] auto remote_digest_(const std::string& path, std::uint64_t size, std::uint64_t block)
        -> infra::Result<std::uint64_t>;

    void worker_(RunState& state);

    adapters::storage::StorageClient& storage_;
    const infra::Config& config_;
    infra::ProgressMonitor& monitor_;
};

} // namespace fxfer::core
