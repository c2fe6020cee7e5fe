#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "transfer_types.hpp"
#include "job_identity.hpp"
#include "core/planner/path_expander.hpp"
#include "infra/error_handler/error.hpp"

namespace fxfer::core {

struct JobParameters {
    Direction direction = Direction::Download;
    std::string source;          // literal path, directory or '*' glob
    std::string destination;     // destination root
    std::uint64_t chunk_size = 0;
    std::uint32_t threads = 1;

    [[nodiscard]] auto key() const -> JobKey {
        return JobKey{direction, source, destination, chunk_size};
    }
};

class TransferJob {
public:
    TransferJob(JobParameters params, std::vector<FileTransfer> files);

    // No data moves. NoMatch unless allow_empty.
    [[nodiscard]] static auto plan(JobParameters params,
                                   planner::PathLister& source_side,
                                   planner::PathLister& destination_side,
                                   bool allow_empty = false)
        -> infra::Result<TransferJob>;

    [[nodiscard]] auto params() const -> const JobParameters& { return params_; }
    [[nodiscard]] auto hash() const -> const std::string& { return hash_; }
    [[nodiscard]] auto direction() const -> Direction { return params_.direction; }

    [[nodiscard]] auto files() const -> const std::vector<FileTransfer>& { return files_; }
    [[nodiscard]] auto files() -> std::vector<FileTransfer>& { return files_; }

    // Chunks not yet done
    [[nodiscard]] auto nchunks() const -> std::size_t;
    [[nodiscard]] auto total_chunks() const -> std::size_t;
    [[nodiscard]] auto total_bytes() const -> std::uint64_t;
    [[nodiscard]] auto pending_bytes() const -> std::uint64_t;
    [[nodiscard]] auto complete() const -> bool { return nchunks() == 0; }

    [[nodiscard]] auto source_paths() const -> std::vector<std::string>;
    [[nodiscard]] auto destination_paths() const -> std::vector<std::string>;
    [[nodiscard]] auto local_paths() const -> std::vector<std::string>;
    [[nodiscard]] auto remote_paths() const -> std::vector<std::string>;

    void set_threads(std::uint32_t threads) { params_.threads = threads; }

private:
    JobParameters params_;
    std::string hash_;
    std::vector<FileTransfer> files_;
};

} // namespace fxfer::core
