#pragma once

#include <cstdint>
#include <filesystem>
#include <expected>
#include <string>
#include <string_view>
#include "../error_handler/error.hpp"
#include <xxhash.h>

namespace fxfer::infra {

// seed 0
class XXHashDigest {
public:
    XXHashDigest();
    ~XXHashDigest();

    XXHashDigest(const XXHashDigest&) = delete;
    XXHashDigest& operator=(const XXHashDigest&) = delete;

    void update(const void* data, std::size_t size);
    void update(std::string_view text) { update(text.data(), text.size()); }

    [[nodiscard]] auto digest() const -> XXH64_hash_t;

    // 16 lowercase hex digits
    [[nodiscard]] static auto to_hex(XXH64_hash_t hash) -> std::string;

    [[nodiscard]] static auto hash_file(const std::filesystem::path& path)
        -> std::expected<XXH64_hash_t, Error>;

private:
    XXH64_state_t* state_;

    static constexpr std::size_t BUFFER_SIZE = 4 * 1024 * 1024; // 4MB buffer
};

} // namespace fxfer::infra
