#pragma once

#include <string>
#include <cstdint>
#include <optional>

namespace fxfer::args_parser {

enum class Command { Download, Upload, Jobs, Forget };

struct CLIArgs
{
    Command command{Command::Jobs};
    std::string source;                          // download: store path, upload: local path
    std::string destination;                     // download: local path, upload: store path
    std::string store_root;                      // --store-root DIR
    std::string job_hash;                        // forget <hash>
    std::optional<std::uint32_t> threads;        // -t, --threads N
    std::optional<std::uint64_t> chunk_size;     // -c, --chunk-size BYTES
    std::optional<std::string> registry;         // --registry FILE
    std::optional<std::string> log_level;        // --log-level LEVEL
    bool plan_only{false};                       // --plan-only
    bool no_resume{false};                       // --no-resume
    bool verify{false};                          // --verify
    bool progress{false};                        // --progress
    bool quiet{false};                           // -q, --quiet
};

// nullopt after --help or a parse error
std::optional<CLIArgs> parse_args(int argc, char const* const* argv);

} // namespace fxfer::args_parser
