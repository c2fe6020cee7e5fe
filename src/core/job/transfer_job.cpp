#include "transfer_job.hpp"

#include <algorithm>
#include <iterator>
#include <numeric>
#include <spdlog/spdlog.h>
#include "core/planner/chunk_planner.hpp"

namespace fxfer::core {

TransferJob::TransferJob(JobParameters params, std::vector<FileTransfer> files)
    : params_(std::move(params))
    , files_(std::move(files))
{
    auto key = normalize(params_.key());
    params_.source = std::move(key.source);
    params_.destination = std::move(key.destination);
    if (params_.threads == 0) params_.threads = 1;
    hash_ = compute_job_hash(params_.key());
}

auto TransferJob::plan(JobParameters params,
                       planner::PathLister& source_side,
                       planner::PathLister& destination_side,
                       bool allow_empty)
    -> infra::Result<TransferJob>
{
    if (params.chunk_size == 0) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
                                                 "Chunk size must be greater than zero"));
    }

    auto expansion = planner::expand(params.source, source_side);
    if (!expansion) {
        if (allow_empty && expansion.error().code == infra::ErrorCode::NoMatch) {
            spdlog::info("Nothing matches '{}'; planning an empty job", params.source);
            return TransferJob{std::move(params), {}};
        }
        return std::unexpected(std::move(expansion.error()));
    }

    const auto destinations = planner::map_destinations(*expansion, params.destination, destination_side);

    std::vector<FileTransfer> files;
    files.reserve(expansion->files.size());
    for (std::size_t i = 0; i < expansion->files.size(); ++i) {
        const auto& entry = expansion->files[i];
        auto chunks = planner::plan(entry.size, params.chunk_size, i);
        if (!chunks) return std::unexpected(std::move(chunks.error()));

        files.push_back(FileTransfer{
            .source = entry.path,
            .destination = destinations[i],
            .size = entry.size,
            .chunks = std::move(*chunks),
        });
    }

    TransferJob job{std::move(params), std::move(files)};
    spdlog::info("Planned {} {}: {} file(s), {} chunk(s), {} byte(s) [job {}]",
                 to_string(job.direction()), job.params().source,
                 job.files().size(), job.total_chunks(), job.total_bytes(), job.hash());
    return job;
}

auto TransferJob::nchunks() const -> std::size_t {
    return std::accumulate(files_.begin(), files_.end(), std::size_t{0},
        [](std::size_t acc, const FileTransfer& f) { return acc + f.pending_chunks(); });
}

auto TransferJob::total_chunks() const -> std::size_t {
    return std::accumulate(files_.begin(), files_.end(), std::size_t{0},
        [](std::size_t acc, const FileTransfer& f) { return acc + f.chunks.size(); });
}

auto TransferJob::total_bytes() const -> std::uint64_t {
    return std::accumulate(files_.begin(), files_.end(), std::uint64_t{0},
        [](std::uint64_t acc, const FileTransfer& f) { return acc + f.size; });
}

auto TransferJob::pending_bytes() const -> std::uint64_t {
    std::uint64_t total = 0;
    for (const auto& file : files_) {
        for (const auto& chunk : file.chunks) {
            if (!chunk.done()) total += chunk.length;
        }
    }
    return total;
}

auto TransferJob::source_paths() const -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(files_.size());
    std::ranges::transform(files_, std::back_inserter(out), &FileTransfer::source);
    return out;
}

auto TransferJob::destination_paths() const -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(files_.size());
    std::ranges::transform(files_, std::back_inserter(out), &FileTransfer::destination);
    return out;
}

auto TransferJob::local_paths() const -> std::vector<std::string> {
    return direction() == Direction::Download ? destination_paths() : source_paths();
}

auto TransferJob::remote_paths() const -> std::vector<std::string> {
    return direction() == Direction::Download ? source_paths() : destination_paths();
}

} // namespace fxfer::core
