#include "job_identity.hpp"
#include <fmt/core.h>
#include "core/planner/path_expander.hpp"
#include "infra/hash/xxhash_digest.hpp"

namespace fxfer::core {

auto normalize(JobKey key) -> JobKey {
    key.source = planner::normalize_path(key.source);
    key.destination = planner::normalize_path(key.destination);
    return key;
}

auto compute_job_hash(const JobKey& key) -> std::string {
    const auto norm = normalize(key);

    // '\0' cannot occur inside a path, so field boundaries are unambiguous
    infra::XXHashDigest digest;
    digest.update(to_string(norm.direction));
    digest.update(std::string_view("\0", 1));
    digest.update(norm.source);
    digest.update(std::string_view("\0", 1));
    digest.update(norm.destination);
    digest.update(std::string_view("\0", 1));
    digest.update(fmt::format("{}", norm.chunk_size));

    return infra::XXHashDigest::to_hex(digest.digest());
}

} // namespace fxfer::core
