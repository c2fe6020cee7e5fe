#include <fmt/core.h>

#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/interrupt.hpp"
#include "infra/monitoring/monitoring.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "adapters/storage/local_store.hpp"
#include "core/job/job_registry.hpp"
#include "core/transfer/transfer_session.hpp"
#include <spdlog/spdlog.h>
#include <chrono>

using ARGS = fxfer::args_parser::CLIArgs;
using Command = fxfer::args_parser::Command;

constexpr auto load_from_cli = fxfer::infra::config_from_cli;
constexpr auto args_parser = fxfer::args_parser::parse_args;

static auto
list_jobs(const fxfer::core::JobRegistry& registry)
-> int {
    auto records = registry.load();
    if (!records) {
        spdlog::error("Cannot read job registry: {}", records.error().message);
        return 1;
    }
    if (records->empty()) {
        fmt::print("No resumable jobs in {}\n", registry.path().string());
        return 0;
    }
    for (const auto& [hash, record] : *records) {
        fmt::print("{}  {:8}  {} -> {}  ({} file(s), {} chunk(s) remaining)\n",
                   hash, fxfer::core::to_string(record.params.direction),
                   record.params.source, record.params.destination,
                   record.files.size(), record.remaining());
    }
    return 0;
}

static auto
forget_job(fxfer::core::JobRegistry& registry, const std::string& hash)
-> int {
    auto removed = registry.remove(hash);
    if (!removed) {
        spdlog::error("Cannot update job registry: {}", removed.error().message);
        return 1;
    }
    if (!*removed) {
        spdlog::warn("No job {} in {}", hash, registry.path().string());
        return 1;
    }
    spdlog::info("Forgot job {}", hash);
    return 0;
}

static auto
run_transfer(const ARGS& args, const fxfer::infra::Config& config,
             fxfer::core::JobRegistry& registry)
-> int {
    fxfer::infra::InterruptController interrupt;
    fxfer::adapters::storage::LocalStore store(args.store_root);
    fxfer::infra::ProgressMonitor monitor(config.progress, config.quiet);

    fxfer::core::TransferOptions options{
        .direction = args.command == Command::Download
            ? fxfer::core::Direction::Download : fxfer::core::Direction::Upload,
        .source = args.source,
        .destination = args.destination,
        .run = false,
    };

    auto session = fxfer::core::TransferSession::create(
        options, store, config, interrupt, &registry, &monitor);
    if (!session) {
        return fxfer::infra::log_and_return(std::move(session.error())).to_exit_code();
    }

    if (args.plan_only) {
        const auto locals = (*session)->local_files();
        const auto remotes = (*session)->remote_files();
        for (std::size_t i = 0; i < locals.size(); ++i) {
            fmt::print("{}  <->  {}\n", remotes[i], locals[i]);
        }
        fmt::print("job {}: {} file(s), {} chunk(s), {} pending\n",
                   (*session)->hash(), locals.size(),
                   (*session)->total_chunks(), (*session)->nchunks());
        return 0;
    }

    auto stats = (*session)->run();
    if (!stats) {
        return fxfer::infra::log_and_return(std::move(stats.error())).to_exit_code();
    }

    if (!config.quiet) {
        spdlog::info("Chunks transferred: {}", stats->transferred_chunks);
        spdlog::info("Bytes transferred: {} ({:.2f} MB)",
                     stats->transferred_bytes, stats->transferred_bytes / 1024.0 / 1024.0);
        spdlog::info("Retries: {}", stats->retries);
        spdlog::info("Time elapsed: {:.2f} seconds", stats->elapsed.count() / 1000.0);
        if (stats->transferred_bytes > 0 && stats->elapsed.count() > 0) {
            const double speed_mbps = (stats->transferred_bytes / 1024.0 / 1024.0)
                                    / (stats->elapsed.count() / 1000.0);
            spdlog::info("Average speed: {:.2f} MB/s", speed_mbps);
        }
    }

    if (stats->complete()) {
        return 0;
    }
    spdlog::warn("Incomplete: {} chunk(s) remaining; rerun the same command to resume (job {})",
                 stats->remaining, (*session)->hash());
    return stats->interrupted ? 130 : 1;
}

int main(int argc, char** argv)
{
    try {
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

        fxfer::infra::install_signal_handler();

        auto args_opt = args_parser(argc, argv);
        if (!args_opt) {
            return 1; // --help or parse error
        }
        const auto& args = *args_opt;

        auto config_res = fxfer::infra::load_config_from_file();
        if (!config_res) {
            spdlog::error("Config error: {}", config_res.error());
            return 1;
        }
        auto config = config_res.value();

        spdlog::debug("Merging CLI config with file config...");
        config.merge_with(load_from_cli(args));

        spdlog::set_level(config.quiet ? spdlog::level::err
                                       : spdlog::level::from_str(config.log_level));

        fxfer::core::JobRegistry registry(config.registry_path());

        switch (args.command) {
            case Command::Jobs:
                return list_jobs(registry);
            case Command::Forget:
                return forget_job(registry, args.job_hash);
            case Command::Download:
            case Command::Upload:
                return run_transfer(args, config, registry);
        }
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
