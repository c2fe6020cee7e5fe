#include "args_parser.hpp"

#include <CLI/CLI.hpp>

namespace fxfer::args_parser {

namespace {

void add_transfer_options(CLI::App& cmd, CLIArgs& args) {
    cmd.add_option("--store-root", args.store_root, "Directory backing the object store")
        ->required()
        ->check(CLI::ExistingDirectory);
    cmd.add_option("-t,--threads", args.threads, "Worker threads (default: hardware concurrency)")
        ->check(CLI::PositiveNumber);
    cmd.add_option("-c,--chunk-size", args.chunk_size, "Chunk size in bytes (default: 256 MiB)")
        ->check(CLI::PositiveNumber);
    cmd.add_flag("--plan-only", args.plan_only, "Resolve files and chunks without moving data");
    cmd.add_flag("--no-resume", args.no_resume, "Ignore saved state and start over");
    cmd.add_flag("--verify", args.verify, "Compare xxHash64 digests of every finished file");
    cmd.add_flag("--progress", args.progress, "Show a progress bar");
}

} // namespace

std::optional<CLIArgs> parse_args(int argc, char const* const* argv)
{
    CLIArgs args;
    CLI::App app{"fxfer - chunked, resumable bulk transfer"};
    app.require_subcommand(1);

    app.add_option("--registry", args.registry, "Job registry file");
    app.add_option("--log-level", args.log_level, "trace|debug|info|warn|error")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error"}));
    app.add_flag("-q,--quiet", args.quiet, "Only report errors");

    auto* download = app.add_subcommand("download", "Copy store objects to the local disk");
    download->add_option("source", args.source, "Store path, directory or '*' glob")->required();
    download->add_option("destination", args.destination, "Local file or directory")->required();
    add_transfer_options(*download, args);

    auto* upload = app.add_subcommand("upload", "Copy local files into the store");
    upload->add_option("source", args.source, "Local path, directory or '*' glob")->required();
    upload->add_option("destination", args.destination, "Store path")->required();
    add_transfer_options(*upload, args);

    auto* jobs = app.add_subcommand("jobs", "List resumable jobs");

    auto* forget = app.add_subcommand("forget", "Drop a job from the registry");
    forget->add_option("hash", args.job_hash, "Job hash as printed by 'jobs'")->required();

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        app.exit(e);
        return std::nullopt;
    }

    if (*download) args.command = Command::Download;
    else if (*upload) args.command = Command::Upload;
    else if (*jobs) args.command = Command::Jobs;
    else if (*forget) args.command = Command::Forget;

    return args;
}

} // namespace fxfer::args_parser
