#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <expected>
#include <filesystem>
#include "../retry.hpp"

namespace fxfer::args_parser {
    struct CLIArgs;
}

namespace fxfer::infra {

inline constexpr std::uint64_t kDefaultChunkSize = 256ull * 1024 * 1024; // 256 MiB

struct Config {
    // Transfer
    std::optional<std::uint32_t> threads;
    std::optional<std::uint64_t> chunk_size;   // bytes
    RetryPolicy retry{};

    // Behavior
    bool verify = false;
    bool resume = true;
    bool progress = false;
    bool quiet = false;
    std::string log_level = "info";

    // Job registry file; empty means default_registry_path()
    std::filesystem::path registry;

    // CLI values take priority over file values
    void merge_with(const Config& other);

    [[nodiscard]] auto effective_threads() const -> std::uint32_t;
    [[nodiscard]] auto effective_chunk_size() const -> std::uint64_t;
    [[nodiscard]] auto registry_path() const -> std::filesystem::path;
};

// ./.fxfer.yaml, then $XDG_CONFIG_HOME/fxfer/config.yaml or ~/.config/fxfer/config.yaml
[[nodiscard]] auto load_config_from_file() -> std::expected<Config, std::string>;

[[nodiscard]] auto load_config_from_file(const std::filesystem::path& path)
    -> std::expected<Config, std::string>;

[[nodiscard]] auto config_from_cli(const args_parser::CLIArgs& args) -> Config;

[[nodiscard]] auto default_registry_path() -> std::filesystem::path;

} // namespace fxfer::infra
