#include "chunk_planner.hpp"
#include <algorithm>
#include <fmt/core.h>

namespace fxfer::core::planner {

auto plan(std::uint64_t file_size, std::uint64_t chunk_size, std::size_t file_index)
    -> infra::Result<std::vector<Chunk>>
{
    if (chunk_size == 0) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidArgument,
                                                 "Chunk size must be greater than zero"));
    }

    const auto n = chunk_count(file_size, chunk_size);
    std::vector<Chunk> chunks;
    chunks.reserve(static_cast<std::size_t>(n));

    for (std::uint64_t i = 0; i < n; ++i) {
        const std::uint64_t offset = i * chunk_size;
        chunks.push_back(Chunk{
            .file_index = file_index,
            .offset = offset,
            .length = std::min(chunk_size, file_size - offset),
        });
    }
    return chunks;
}

} // namespace fxfer::core::planner
