#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <cstdlib>
#include <thread>
#include <system_error>

#include "config.hpp"
#include "../../cli/args_parser/args_parser.hpp"

namespace fxfer::infra {

    void Config::merge_with(const Config& other) {
        if (other.threads) threads = other.threads;
        if (other.chunk_size) chunk_size = other.chunk_size;
        if (other.verify) verify = true;
        if (!other.resume) resume = false;
        if (other.progress) progress = true;
        if (other.quiet) quiet = true;
        if (other.log_level != "info") log_level = other.log_level;
        if (!other.registry.empty()) registry = other.registry;
    }

    auto Config::effective_threads() const -> std::uint32_t {
        if (threads && *threads > 0) return *threads;
        const auto hw = std::thread::hardware_concurrency();
        return hw > 0 ? hw : 1;
    }

    auto Config::effective_chunk_size() const -> std::uint64_t {
        return chunk_size.value_or(kDefaultChunkSize);
    }

    auto Config::registry_path() const -> std::filesystem::path {
        return registry.empty() ? default_registry_path() : registry;
    }

    static auto config_home() -> std::filesystem::path {
        const char* xdg = std::getenv("XDG_CONFIG_HOME");
        if (xdg && *xdg && std::filesystem::exists(xdg)) {
            return std::filesystem::path(xdg) / "fxfer";
        }
        const char* home = std::getenv("HOME");
        if (home && *home) {
            return std::filesystem::path(home) / ".config" / "fxfer";
        }
        return std::filesystem::path(".fxfer");
    }

    static auto get_config_paths() -> std::vector<std::filesystem::path> {
        return {".fxfer.yaml", config_home() / "config.yaml"};
    }

    auto default_registry_path() -> std::filesystem::path {
        return config_home() / "jobs.yaml";
    }

    auto load_config_from_file(const std::filesystem::path& path)
        -> std::expected<Config, std::string>
    {
        try {
            YAML::Node config = YAML::LoadFile(path.string());
            Config cfg{};

            if (config["threads"]) cfg.threads = config["threads"].as<std::uint32_t>();
            if (config["chunk_size"]) {
                const auto chunk = config["chunk_size"].as<std::uint64_t>();
                if (chunk == 0) {
                    return std::unexpected(fmt::format("{}: chunk_size must be > 0", path.string()));
                }
                cfg.chunk_size = chunk;
            }

            if (const auto retry = config["retry"]) {
                if (retry["max_attempts"]) cfg.retry.max_attempts = retry["max_attempts"].as<int>();
                if (retry["initial_delay_ms"]) {
                    cfg.retry.initial_delay = std::chrono::milliseconds(retry["initial_delay_ms"].as<long>());
                }
                if (retry["backoff_factor"]) cfg.retry.backoff_factor = retry["backoff_factor"].as<double>();
            }

            if (config["verify"]) cfg.verify = config["verify"].as<bool>();
            if (config["resume"]) cfg.resume = config["resume"].as<bool>();
            if (config["progress"]) cfg.progress = config["progress"].as<bool>();
            if (config["quiet"]) cfg.quiet = config["quiet"].as<bool>();
            if (config["log_level"]) cfg.log_level = config["log_level"].as<std::string>();
            if (config["registry"]) cfg.registry = config["registry"].as<std::string>();

            spdlog::debug("Loaded config from {}", path.string());
            return cfg;

        } catch (const std::exception& e) {
            return std::unexpected(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
        }
    }

    auto load_config_from_file() -> std::expected<Config, std::string> {
        for (const auto& path : get_config_paths()) {
            std::error_code ec;
            if (!std::filesystem::exists(path, ec)) continue;
            return load_config_from_file(path);
        }

        // no file is not an error
        return Config{};
    }

    auto config_from_cli(const args_parser::CLIArgs& args) -> Config {
        Config cfg{};
        cfg.threads = args.threads;
        cfg.chunk_size = args.chunk_size;
        cfg.verify = args.verify;
        cfg.resume = !args.no_resume;
        cfg.progress = args.progress;
        cfg.quiet = args.quiet;
        if (args.log_level) cfg.log_level = *args.log_level;
        if (args.registry) cfg.registry = *args.registry;
        return cfg;
    }

} // namespace fxfer::infra
