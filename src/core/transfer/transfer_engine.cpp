#include "transfer_engine.hpp"

#include <algorithm>
#include <atomic>
#include <future>
#include <mutex>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "adapters/fs.hpp"
#include "chunk_queue.hpp"
#include "chunk_transfer.hpp"
#include "core/planner/path_expander.hpp"
#include "infra/hash/xxhash_digest.hpp"
#include "infra/retry.hpp"
#include "infra/thread_pool/thread_pool.hpp"

namespace fxfer::core {

struct TransferEngine::RunState {
    TransferJob& job;
    infra::InterruptController& interrupt;
    ChunkQueue queue;
    ChunkTransfer transfer;

    // guards chunk statuses, failures and fatal
    std::mutex status_mutex;
    std::vector<ChunkFailure> failures;
    std::optional<infra::Error> fatal;
    std::atomic<bool> abort{false};

    std::atomic<std::size_t> chunks_done{0};
    std::atomic<std::uint64_t> bytes_done{0};

    RunState(TransferJob& j, infra::InterruptController& i,
             adapters::storage::StorageClient& storage, const infra::RetryPolicy& policy)
        : job(j), interrupt(i), transfer(storage, policy) {}
};

TransferEngine::TransferEngine(adapters::storage::StorageClient& storage,
                               const infra::Config& config,
                               infra::ProgressMonitor& monitor)
    : storage_(storage), config_(config), monitor_(monitor) {}

auto TransferEngine::run(TransferJob& job,
                         infra::InterruptController& interrupt,
                         std::optional<std::uint32_t> nthreads)
    -> infra::Result<TransferStats>
{
    const auto start = std::chrono::steady_clock::now();
    RunState state{job, interrupt, storage_, config_.retry};

    TransferStats stats;
    stats.files = job.files().size();
    stats.total_chunks = job.total_chunks();

    // Chunks left Failed by an earlier run go back into the queue.
    std::uint64_t queued_bytes = 0;
    for (std::size_t f = 0; f < job.files().size(); ++f) {
        auto& file = job.files()[f];
        if (file.complete()) continue;

        if (auto res = prepare_destination_(job, file); !res) {
            auto err = infra::log_and_return(std::move(res.error()));
            for (auto& chunk : file.chunks) {
                if (chunk.done()) continue;
                chunk.status = ChunkStatus::Failed;
                state.failures.push_back(ChunkFailure{file.source, chunk.offset, err});
            }
            continue;
        }

        for (std::size_t c = 0; c < file.chunks.size(); ++c) {
            auto& chunk = file.chunks[c];
            if (chunk.done()) continue;
            chunk.status = ChunkStatus::Pending;
            state.queue.push(ChunkRef{f, c});
            queued_bytes += chunk.length;
        }
    }

    const auto queued = state.queue.size();
    if (queued == 0 && state.failures.empty()) {
        spdlog::info("Job {} has nothing left to transfer", job.hash());
        stats.remaining = job.nchunks();
        return stats;
    }

    const std::uint32_t threads = std::max<std::uint32_t>(1, nthreads.value_or(job.params().threads));
    const auto workers = std::min<std::size_t>(threads, queued);
    spdlog::info("Starting {} of {} chunk(s) across {} file(s) with {} thread(s) [job {}]",
                 to_string(job.direction()), queued, stats.files, threads, job.hash());

    monitor_.set_total(queued, queued_bytes);
    if (workers > 0) {
        infra::ThreadPool pool{threads};
        std::vector<std::future<void>> futures;
        futures.reserve(workers);
        for (std::size_t i = 0; i < workers; ++i) {
            futures.push_back(pool.submit([this, &state] { worker_(state); }));
        }
        pool.wait();
        for (auto& f : futures) f.get();
    }

    stats.transferred_chunks = state.chunks_done.load();
    stats.transferred_bytes = state.bytes_done.load();
    stats.retries = state.transfer.retries();
    stats.remaining = job.nchunks();
    stats.failures = std::move(state.failures);
    stats.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    if (state.fatal) {
        return std::unexpected(infra::log_and_return(std::move(*state.fatal)));
    }

    if (interrupt.consume()) {
        stats.interrupted = stats.remaining > 0;
        spdlog::warn("Transfer interrupted: {} chunk(s) remaining [job {}]", stats.remaining, job.hash());
    }

    for (const auto& failure : stats.failures) {
        spdlog::error("{}", failure.error.message);
    }

    if (stats.complete()) {
        spdlog::info("Job {} complete: {} chunk(s), {} byte(s) in {} ms",
                     job.hash(), stats.transferred_chunks, stats.transferred_bytes, stats.elapsed.count());
    } else {
        spdlog::warn("Job {} incomplete: {} of {} chunk(s) remaining, {} failure(s)",
                     job.hash(), stats.remaining, stats.total_chunks, stats.failures.size());
    }
    return stats;
}

void TransferEngine::worker_(RunState& state) {
    const auto direction = state.job.direction();
    auto& files = state.job.files();

    // Cancellation is checked only here, between chunks.
    while (!state.interrupt.stop_requested() && !state.abort.load()) {
        const auto ref = state.queue.pop();
        if (!ref) break;

        auto& file = files[ref->file];
        auto& chunk = file.chunks[ref->chunk];
        {
            std::lock_guard lock(state.status_mutex);
            chunk.status = ChunkStatus::InFlight;
        }

        auto res = state.transfer.transfer(direction, file, chunk);

        bool file_finished = false;
        {
            std::lock_guard lock(state.status_mutex);
            if (res) {
                chunk.status = ChunkStatus::Done;
                file_finished = file.complete();
            } else {
                chunk.status = ChunkStatus::Failed;
                state.failures.push_back(ChunkFailure{file.source, chunk.offset, std::move(res.error())});
            }
        }
        if (!res) continue;

        state.chunks_done.fetch_add(1, std::memory_order_relaxed);
        state.bytes_done.fetch_add(chunk.length, std::memory_order_relaxed);
        monitor_.update(1, chunk.length);

        if (file_finished) {
            if (auto check = finalize_file_(state.job, file); !check) {
                std::lock_guard lock(state.status_mutex);
                if (!state.fatal) state.fatal = std::move(check.error());
                state.abort.store(true);
            }
        }
    }
}

auto TransferEngine::prepare_destination_(const TransferJob& job, FileTransfer& file)
    -> infra::VoidResult
{
    const auto parent = planner::parent_path(file.destination);
    bool fresh = file.untouched();

    // Done chunks of a destination that vanished between runs must be moved again.
    if (!fresh) {
        const bool present = job.direction() == Direction::Download
            ? adapters::fs::stat(file.destination).has_value()
            : storage_.exists(file.destination);
        if (!present) {
            spdlog::warn("{} is gone; restarting it from the first chunk", file.destination);
            for (auto& chunk : file.chunks) chunk.status = ChunkStatus::Pending;
            fresh = true;
        }
    }

    if (job.direction() == Direction::Download) {
        if (auto res = adapters::fs::create_directories(parent); !res) return res;

        auto out = adapters::fs::LocalFile::open_for_write(file.destination, /*truncate=*/fresh);
        if (!out) return std::unexpected(std::move(out.error()));
        return out->resize(file.size);
    }

    if (!parent.empty()) {
        auto res = infra::with_retry([&] { return storage_.mkdir(parent); }, config_.retry);
        if (!res) return res;
    }
    if (fresh) {
        return infra::with_retry([&] { return storage_.touch(file.destination); }, config_.retry);
    }
    return {};
}

auto TransferEngine::finalize_file_(const TransferJob& job, const FileTransfer& file)
    -> infra::VoidResult
{
    std::uint64_t actual = 0;
    if (job.direction() == Direction::Download) {
        const auto st = adapters::fs::stat(file.destination);
        if (!st) {
            return std::unexpected(infra::make_error(infra::ErrorCode::FileNotFound,
                fmt::format("Destination vanished: {}", file.destination)));
        }
        actual = st->size;
    } else {
        auto info = infra::with_retry([&] { return storage_.info(file.destination); }, config_.retry);
        if (!info) return std::unexpected(std::move(info.error()));
        actual = info->size;
    }

    if (actual != file.size) {
        return std::unexpected(infra::make_error(infra::ErrorCode::SizeMismatch,
            fmt::format("{} is {} byte(s), expected {}", file.destination, actual, file.size)));
    }

    if (config_.verify) {
        const auto& local = job.direction() == Direction::Download ? file.destination : file.source;
        const auto& remote = job.direction() == Direction::Download ? file.source : file.destination;

        auto local_hash = infra::XXHashDigest::hash_file(local);
        if (!local_hash) return std::unexpected(std::move(local_hash.error()));
        auto remote_hash = remote_digest_(remote, file.size, job.params().chunk_size);
        if (!remote_hash) return std::unexpected(std::move(remote_hash.error()));

        if (*local_hash != *remote_hash) {
            return std::unexpected(infra::make_error(infra::ErrorCode::ChecksumMismatch,
                fmt::format("Hash mismatch: {} ({:016x}) vs {} ({:016x})",
                            local, *local_hash, remote, *remote_hash)));
        }
    }

    spdlog::debug("Finished {} -> {} ({} byte(s))", file.source, file.destination, file.size);
    return {};
}

auto TransferEngine::remote_digest_(const std::string& path, std::uint64_t size, std::uint64_t block)
    -> infra::Result<std::uint64_t>
{
    infra::XXHashDigest digest;
    for (std::uint64_t offset = 0; offset < size; offset += block) {
        const auto length = std::min(block, size - offset);
        auto data = infra::with_retry([&] { return storage_.ranged_read(path, offset, length); }, config_.retry);
        if (!data) return std::unexpected(std::move(data.error()));
        digest.update(data->data(), data->size());
    }
    return digest.digest();
}

} // namespace fxfer::core
