#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>
#include "core/job/transfer_types.hpp"
#include "infra/error_handler/error.hpp"

namespace fxfer::core::planner {

// A zero-byte file still gets one zero-length chunk.
[[nodiscard]] auto plan(std::uint64_t file_size, std::uint64_t chunk_size,
                        std::size_t file_index = 0)
    -> infra::Result<std::vector<Chunk>>;

[[nodiscard]] constexpr auto chunk_count(std::uint64_t file_size, std::uint64_t chunk_size)
    -> std::uint64_t
{
    if (chunk_size == 0) return 0;
    if (file_size == 0) return 1;
    return file_size / chunk_size + (file_size % chunk_size != 0 ? 1 : 0);
}

} // namespace fxfer::core::planner
