#include "job_registry.hpp"

#include <algorithm>
#include <fstream>
#include <set>
#include <system_error>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>
#include "core/planner/chunk_planner.hpp"
#include "adapters/fs.hpp"

namespace fxfer::core {

namespace {

auto registry_error(std::string_view what) -> infra::Error {
    return infra::make_error(infra::ErrorCode::RegistryError, what);
}

auto encode(const JobRecord& record) -> YAML::Node {
    YAML::Node node;
    node["direction"] = std::string(to_string(record.params.direction));
    node["source"] = record.params.source;
    node["destination"] = record.params.destination;
    node["chunk_size"] = record.params.chunk_size;
    node["threads"] = record.params.threads;

    YAML::Node files(YAML::NodeType::Sequence);
    for (const auto& file : record.files) {
        YAML::Node f;
        f["source"] = file.source;
        f["destination"] = file.destination;
        f["size"] = file.size;
        YAML::Node pending(YAML::NodeType::Sequence);
        for (const auto offset : file.pending) pending.push_back(offset);
        f["pending"] = pending;
        files.push_back(f);
    }
    node["files"] = files;
    return node;
}

auto decode(const std::string& hash, const YAML::Node& node) -> infra::Result<JobRecord> {
    JobRecord record;
    record.hash = hash;

    const auto direction = direction_from_string(node["direction"].as<std::string>());
    if (!direction) {
        return std::unexpected(registry_error(fmt::format("Job {}: bad direction", hash)));
    }
    record.params.direction = *direction;
    record.params.source = node["source"].as<std::string>();
    record.params.destination = node["destination"].as<std::string>();
    record.params.chunk_size = node["chunk_size"].as<std::uint64_t>();
    record.params.threads = node["threads"] ? node["threads"].as<std::uint32_t>() : 1;

    if (const auto files = node["files"]) {
        for (const auto& f : files) {
            FileRecord file;
            file.source = f["source"].as<std::string>();
            file.destination = f["destination"].as<std::string>();
            file.size = f["size"].as<std::uint64_t>();
            if (f["pending"]) {
                file.pending = f["pending"].as<std::vector<std::uint64_t>>();
            }
            record.files.push_back(std::move(file));
        }
    }
    return record;
}

} // namespace

auto JobRecord::remaining() const -> std::size_t {
    std::size_t n = 0;
    for (const auto& file : files) n += file.pending.size();
    return n;
}

auto make_record(const TransferJob& job) -> JobRecord {
    JobRecord record;
    record.hash = job.hash();
    record.params = job.params();
    record.files.reserve(job.files().size());

    for (const auto& file : job.files()) {
        FileRecord rec{
            .source = file.source,
            .destination = file.destination,
            .size = file.size,
        };
        for (const auto& chunk : file.chunks) {
            if (!chunk.done()) rec.pending.push_back(chunk.offset);
        }
        record.files.push_back(std::move(rec));
    }
    return record;
}

auto restore_job(const JobRecord& record) -> infra::Result<TransferJob> {
    std::vector<FileTransfer> files;
    files.reserve(record.files.size());

    for (std::size_t i = 0; i < record.files.size(); ++i) {
        const auto& rec = record.files[i];
        auto chunks = planner::plan(rec.size, record.params.chunk_size, i);
        if (!chunks) return std::unexpected(std::move(chunks.error()));

        const std::set<std::uint64_t> pending(rec.pending.begin(), rec.pending.end());
        std::size_t matched = 0;
        for (auto& chunk : *chunks) {
            if (pending.contains(chunk.offset)) {
                ++matched;
            } else {
                chunk.status = ChunkStatus::Done;
            }
        }
        if (matched != pending.size()) {
            return std::unexpected(registry_error(fmt::format(
                "Job {}: pending offsets of {} do not match its chunk plan", record.hash, rec.source)));
        }

        files.push_back(FileTransfer{
            .source = rec.source,
            .destination = rec.destination,
            .size = rec.size,
            .chunks = std::move(*chunks),
        });
    }

    TransferJob job{record.params, std::move(files)};
    if (job.hash() != record.hash) {
        return std::unexpected(registry_error(fmt::format(
            "Job {}: parameters hash to {}", record.hash, job.hash())));
    }
    return job;
}

// =============== JobRegistry ===============

JobRegistry::JobRegistry(std::filesystem::path path)
    : path_(std::move(path))
{}

auto JobRegistry::read_() const -> infra::Result<std::map<std::string, JobRecord>> {
    std::map<std::string, JobRecord> records;
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return records;
    }

    try {
        const YAML::Node root = YAML::LoadFile(path_.string());
        const YAML::Node jobs = root["jobs"];
        if (!jobs) return records;

        for (const auto& item : jobs) {
            const auto hash = item.first.as<std::string>();
            auto record = decode(hash, item.second);
            if (!record) return std::unexpected(std::move(record.error()));
            records.emplace(hash, std::move(*record));
        }
    } catch (const YAML::Exception& e) {
        return std::unexpected(registry_error(
            fmt::format("Cannot parse job registry {}: {}", path_.string(), e.what())));
    }
    return records;
}

auto JobRegistry::write_(const std::map<std::string, JobRecord>& records) const -> infra::VoidResult {
    if (auto res = adapters::fs::create_directories(path_.parent_path()); !res) {
        return res;
    }

    YAML::Node root;
    YAML::Node jobs(YAML::NodeType::Map);
    for (const auto& [hash, record] : records) {
        jobs[hash] = encode(record);
    }
    root["jobs"] = jobs;

    auto tmp = path_;
    tmp += ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::trunc);
        if (!ofs) {
            return std::unexpected(registry_error(fmt::format("Cannot write {}", tmp.string())));
        }
        ofs << root << '\n';
        if (!ofs.flush()) {
            return std::unexpected(registry_error(fmt::format("Cannot flush {}", tmp.string())));
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path_, ec);
    if (ec) {
        return std::unexpected(registry_error(
            fmt::format("Cannot replace {}: {}", path_.string(), ec.message())));
    }
    return {};
}

auto JobRegistry::save(const TransferJob& job, bool keep) -> infra::VoidResult {
    std::lock_guard lock(mutex_);

    auto records = read_();
    if (!records) return std::unexpected(std::move(records.error()));

    if (keep) {
        (*records)[job.hash()] = make_record(job);
        spdlog::debug("Saved job {} ({} chunk(s) remaining) to {}",
                      job.hash(), job.nchunks(), path_.string());
    } else {
        if (records->erase(job.hash()) == 0) return {};
        spdlog::debug("Removed job {} from {}", job.hash(), path_.string());
    }
    return write_(*records);
}

auto JobRegistry::load() const -> infra::Result<std::map<std::string, JobRecord>> {
    std::lock_guard lock(mutex_);
    return read_();
}

auto JobRegistry::find(const std::string& hash) const -> infra::Result<std::optional<JobRecord>> {
    std::lock_guard lock(mutex_);
    auto records = read_();
    if (!records) return std::unexpected(std::move(records.error()));

    auto it = records->find(hash);
    if (it == records->end()) return std::optional<JobRecord>{};
    return std::optional<JobRecord>{std::move(it->second)};
}

auto JobRegistry::remove(const std::string& hash) -> infra::Result<bool> {
    std::lock_guard lock(mutex_);
    auto records = read_();
    if (!records) return std::unexpected(std::move(records.error()));

    if (records->erase(hash) == 0) return false;
    if (auto res = write_(*records); !res) return std::unexpected(std::move(res.error()));
    spdlog::debug("Removed job {} from {}", hash, path_.string());
    return true;
}

} // namespace fxfer::core
