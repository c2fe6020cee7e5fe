#include "xxhash_digest.hpp"
#include <fmt/core.h>
#include <fstream>
#include <new>
#include <vector>

namespace fxfer::infra {

XXHashDigest::XXHashDigest()
    : state_(XXH64_createState())
{
    if (!state_) {
        throw std::bad_alloc();
    }
    XXH64_reset(state_, 0);
}

XXHashDigest::~XXHashDigest() {
    XXH64_freeState(state_);
}

void XXHashDigest::update(const void* data, std::size_t size) {
    XXH64_update(state_, data, size);
}

auto XXHashDigest::digest() const -> XXH64_hash_t {
    return XXH64_digest(state_);
}

auto XXHashDigest::to_hex(XXH64_hash_t hash) -> std::string {
    return fmt::format("{:016x}", static_cast<std::uint64_t>(hash));
}

auto XXHashDigest::hash_file(const std::filesystem::path& path)
    -> std::expected<XXH64_hash_t, Error>
{
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(make_error(ErrorCode::FileNotFound,
                                          fmt::format("Cannot open file for hashing: {}", path.string())));
    }

    XXHashDigest digest;
    std::vector<char> buffer(BUFFER_SIZE);
    while (file.read(buffer.data(), buffer.size()) || file.gcount() > 0) {
        digest.update(buffer.data(), static_cast<std::size_t>(file.gcount()));
    }

    if (file.bad()) {
        return std::unexpected(make_error(ErrorCode::IoError,
                                          fmt::format("Error reading file: {}", path.string())));
    }

    return digest.digest();
}

} // namespace fxfer::infra
