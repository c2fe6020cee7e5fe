#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "transfer_job.hpp"
#include "infra/error_handler/error.hpp"

namespace fxfer::core {

struct FileRecord {
    std::string source;
    std::string destination;
    std::uint64_t size = 0;
    std::vector<std::uint64_t> pending;  // offsets of chunks not yet done
};

struct JobRecord {
    std::string hash;
    JobParameters params;
    std::vector<FileRecord> files;

    [[nodiscard]] auto remaining() const -> std::size_t;
};

[[nodiscard]] auto make_record(const TransferJob& job) -> JobRecord;

// Offsets not listed as pending come back as done.
[[nodiscard]] auto restore_job(const JobRecord& record) -> infra::Result<TransferJob>;

/// YAML file mapping job hash -> JobRecord. Every mutation re-reads the file
/// and replaces it atomically.
class JobRegistry {
public:
    explicit JobRegistry(std::filesystem::path path);

    JobRegistry(const JobRegistry&) = delete;
    JobRegistry& operator=(const JobRegistry&) = delete;

    // keep=false removes the job's record instead of writing it
    [[nodiscard]] auto save(const TransferJob& job, bool keep = true) -> infra::VoidResult;

    [[nodiscard]] auto load() const -> infra::Result<std::map<std::string, JobRecord>>;
    [[nodiscard]] auto find(const std::string& hash) const -> infra::Result<std::optional<JobRecord>>;

    // Returns false when there was no such record.
    [[nodiscard]] auto remove(const std::string& hash) -> infra::Result<bool>;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    [[nodiscard]] auto read_() const -> infra::Result<std::map<std::string, JobRecord>>;
    [[nodiscard]] auto write_(const std::map<std::string, JobRecord>& records) const -> infra::VoidResult;

    std::filesystem::path path_;
    mutable std::mutex mutex_;
};

} // namespace fxfer::core
