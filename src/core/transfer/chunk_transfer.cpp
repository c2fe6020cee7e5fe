#include "chunk_transfer.hpp"

#include <vector>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "adapters/fs.hpp"

namespace fxfer::core {

ChunkTransfer::ChunkTransfer(adapters::storage::StorageClient& storage, infra::RetryPolicy policy)
    : storage_(storage)
    , policy_(policy)
{}

auto ChunkTransfer::transfer(Direction direction, const FileTransfer& file, const Chunk& chunk)
    -> infra::VoidResult
{
    auto res = direction == Direction::Download ? download_(file, chunk) : upload_(file, chunk);
    if (res) return res;

    const auto& cause = res.error();
    return std::unexpected(infra::make_error(infra::ErrorCode::ChunkTransferFailed,
        fmt::format("{} of {} [{}, {}) failed: {}: {}",
                    to_string(direction), file.source, chunk.offset, chunk.end(),
                    infra::to_string(cause.code), cause.message)));
}

void ChunkTransfer::on_retry_(const FileTransfer& file, const Chunk& chunk,
                              int attempt, const infra::Error& err)
{
    retries_.fetch_add(1, std::memory_order_relaxed);
    spdlog::warn("Retrying {} @ {} (attempt {} of {}): {}",
                 file.source, chunk.offset, attempt + 1, policy_.max_attempts, err.message);
}

auto ChunkTransfer::download_(const FileTransfer& file, const Chunk& chunk) -> infra::VoidResult {
    auto data = infra::with_retry([&] {
        return storage_.ranged_read(file.source, chunk.offset, chunk.length);
    }, policy_, [&](int attempt, const infra::Error& err) { on_retry_(file, chunk, attempt, err); });
    if (!data) return std::unexpected(std::move(data.error()));

    if (data->size() != chunk.length) {
        return std::unexpected(infra::make_error(infra::ErrorCode::IoError,
            fmt::format("Short read: got {} of {} byte(s)", data->size(), chunk.length)));
    }

    auto out = adapters::fs::LocalFile::open_for_write(file.destination);
    if (!out) return std::unexpected(std::move(out.error()));
    return out->write_at(chunk.offset, *data);
}

auto ChunkTransfer::upload_(const FileTransfer& file, const Chunk& chunk) -> infra::VoidResult {
    auto in = adapters::fs::LocalFile::open_for_read(file.source);
    if (!in) return std::unexpected(std::move(in.error()));

    std::vector<char> buffer(chunk.length);
    auto n = in->read_at(chunk.offset, buffer);
    if (!n) return std::unexpected(std::move(n.error()));
    if (*n != chunk.length) {
        return std::unexpected(infra::make_error(infra::ErrorCode::IoError,
            fmt::format("Short read: got {} of {} byte(s)", *n, chunk.length)));
    }

    return infra::with_retry([&] {
        return storage_.ranged_write(file.destination, chunk.offset, buffer);
    }, policy_, [&](int attempt, const infra::Error& err) { on_retry_(file, chunk, attempt, err); });
}

} // namespace fxfer::core
