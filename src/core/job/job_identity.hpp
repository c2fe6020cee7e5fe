#pragma once

#include <cstdint>
#include <string>
#include "transfer_types.hpp"

namespace fxfer::core {

// thread count is not part of the key
struct JobKey {
    Direction direction = Direction::Download;
    std::string source;
    std::string destination;
    std::uint64_t chunk_size = 0;
};

// Lexically normalized copy; two keys naming the same job compare equal after this.
[[nodiscard]] auto normalize(JobKey key) -> JobKey;

// xxHash64 of the normalized key as 16 hex digits.
[[nodiscard]] auto compute_job_hash(const JobKey& key) -> std::string;

} // namespace fxfer::core
