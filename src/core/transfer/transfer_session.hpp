#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "adapters/storage/storage_client.hpp"
#include "core/job/job_registry.hpp"
#include "core/job/transfer_job.hpp"
#include "core/transfer/transfer_engine.hpp"
#include "infra/config/config.hpp"
#include "infra/interrupt.hpp"
#include "infra/monitoring/monitoring.hpp"

namespace fxfer::core {

struct TransferOptions {
    Direction direction = Direction::Download;
    std::string source;
    std::string destination;
    std::optional<std::uint32_t> threads;     // falls back to Config, then hardware concurrency
    std::optional<std::uint64_t> chunk_size;  // falls back to Config, then kDefaultChunkSize
    bool run = true;                          // false: plan only, no I/O until run()
    std::optional<bool> resume;               // falls back to Config::resume
    bool allow_empty = false;
};

/*

fxfer::core::TransferOptions opts{
    .direction = fxfer::core::Direction::Download,
    .source = "logs/2024", .destination = "/data/logs"};
auto session = fxfer::core::TransferSession::create(opts, store, config, interrupt, &registry);

*/
class TransferSession {
public:
    [[nodiscard]] static auto create(TransferOptions options,
                                     adapters::storage::StorageClient& storage,
                                     const infra::Config& config,
                                     infra::InterruptController& interrupt,
                                     JobRegistry* registry = nullptr,
                                     infra::ProgressMonitor* monitor = nullptr)
        -> infra::Result<std::unique_ptr<TransferSession>>;

private:
    struct PrivateTag { explicit PrivateTag() = default; };

public:
    TransferSession(PrivateTag,
                    TransferJob job,
                    adapters::storage::StorageClient& storage,
                    const infra::Config& config,
                    infra::InterruptController& interrupt,
                    JobRegistry* registry,
                    infra::ProgressMonitor* monitor,
                    bool resumed);

    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    // saves an incomplete job, forgets a completed one
    [[nodiscard]] auto run(std::optional<std::uint32_t> nthreads = std::nullopt)
        -> infra::Result<TransferStats>;

    // Persists the pending state (keep) or drops it from the registry.
    [[nodiscard]] auto save(bool keep = true) -> infra::VoidResult;

    [[nodiscard]] auto load() const -> infra::Result<std::map<std::string, JobRecord>>;

    [[nodiscard]] auto nchunks() const -> std::size_t { return job_.nchunks(); }
    [[nodiscard]] auto total_chunks() const -> std::size_t { return job_.total_chunks(); }
    [[nodiscard]] auto hash() const -> const std::string& { return job_.hash(); }
    [[nodiscard]] auto local_files() const -> std::vector<std::string> { return job_.local_paths(); }
    [[nodiscard]] auto remote_files() const -> std::vector<std::string> { return job_.remote_paths(); }
    [[nodiscard]] auto job() const -> const TransferJob& { return job_; }
    [[nodiscard]] auto resumed() const -> bool { return resumed_; }
    [[nodiscard]] auto last_stats() const -> const std::optional<TransferStats>& { return last_stats_; }

private:
    TransferJob job_;
    infra::InterruptController& interrupt_;
    JobRegistry* registry_;
    std::unique_ptr<infra::ProgressMonitor> own_monitor_;
    TransferEngine engine_;
    bool resumed_ = false;
    std::optional<TransferStats> last_stats_;
};

} // namespace fxfer::core
