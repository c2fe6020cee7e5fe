#include "transfer_session.hpp"

#include <spdlog/spdlog.h>
#include "core/job/job_identity.hpp"
#include "core/planner/path_expander.hpp"

namespace fxfer::core {

TransferSession::TransferSession(PrivateTag,
                                 TransferJob job,
                                 adapters::storage::StorageClient& storage,
                                 const infra::Config& config,
                                 infra::InterruptController& interrupt,
                                 JobRegistry* registry,
                                 infra::ProgressMonitor* monitor,
                                 bool resumed)
    : job_(std::move(job))
    , interrupt_(interrupt)
    , registry_(registry)
    , own_monitor_(monitor ? nullptr : std::make_unique<infra::ProgressMonitor>(false))
    , engine_(storage, config, monitor ? *monitor : *own_monitor_)
    , resumed_(resumed)
{}

auto TransferSession::create(TransferOptions options,
                             adapters::storage::StorageClient& storage,
                             const infra::Config& config,
                             infra::InterruptController& interrupt,
                             JobRegistry* registry,
                             infra::ProgressMonitor* monitor)
    -> infra::Result<std::unique_ptr<TransferSession>>
{
    JobParameters params{
        .direction = options.direction,
        .source = std::move(options.source),
        .destination = std::move(options.destination),
        .chunk_size = options.chunk_size.value_or(config.effective_chunk_size()),
        .threads = options.threads.value_or(config.effective_threads()),
    };

    std::optional<TransferJob> job;
    bool resumed = false;

    if (registry && options.resume.value_or(config.resume)) {
        const auto hash = compute_job_hash(params.key());
        auto record = registry->find(hash);
        if (!record) return std::unexpected(std::move(record.error()));

        if (*record) {
            auto restored = restore_job(**record);
            if (restored) {
                restored->set_threads(params.threads);
                spdlog::info("Resuming job {}: {} of {} chunk(s) remaining",
                             hash, restored->nchunks(), restored->total_chunks());
                job.emplace(std::move(*restored));
                resumed = true;
            } else {
                spdlog::warn("Ignoring saved state of job {}: {}", hash, restored.error().message);
            }
        }
    }

    if (!job) {
        planner::StorageLister remote(storage);
        planner::LocalLister local;
        auto& source_side = params.direction == Direction::Download
            ? static_cast<planner::PathLister&>(remote) : local;
        auto& destination_side = params.direction == Direction::Download
            ? static_cast<planner::PathLister&>(local) : remote;

        auto planned = TransferJob::plan(std::move(params), source_side, destination_side, options.allow_empty);
        if (!planned) return std::unexpected(std::move(planned.error()));
        job.emplace(std::move(*planned));
    }

    auto session = std::make_unique<TransferSession>(
        PrivateTag{}, std::move(*job), storage, config, interrupt, registry, monitor, resumed);

    if (options.run) {
        auto stats = session->run();
        if (!stats) return std::unexpected(std::move(stats.error()));
    }
    return session;
}

auto TransferSession::run(std::optional<std::uint32_t> nthreads) -> infra::Result<TransferStats> {
    auto stats = engine_.run(job_, interrupt_, nthreads);
    if (!stats) return stats;
    last_stats_ = *stats;

    if (registry_) {
        if (job_.complete()) {
            auto removed = registry_->remove(job_.hash());
            if (!removed) return std::unexpected(std::move(removed.error()));
            if (*removed) spdlog::info("Job {} finished; dropped its resume record", job_.hash());
        } else if (auto saved = registry_->save(job_); !saved) {
            return std::unexpected(std::move(saved.error()));
        }
    }
    return stats;
}

auto TransferSession::save(bool keep) -> infra::VoidResult {
    if (!registry_) {
        return std::unexpected(infra::make_error(infra::ErrorCode::RegistryError,
                                                 "No job registry attached"));
    }
    return registry_->save(job_, keep);
}

auto TransferSession::load() const -> infra::Result<std::map<std::string, JobRecord>> {
    if (!registry_) {
        return std::unexpected(infra::make_error(infra::ErrorCode::RegistryError,
                                                 "No job registry attached"));
    }
    return registry_->load();
}

} // namespace fxfer::core
