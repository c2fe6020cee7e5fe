#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>
#include "infra/error_handler/error.hpp"

namespace fxfer::adapters::fs {

struct FileStat {
    std::uint64_t size = 0;
    bool is_directory = false;
};

struct DirEntry {
    std::string name;
    FileStat stat;
};

class LocalFile {
public:
    LocalFile() = default;
    ~LocalFile();

    LocalFile(LocalFile&& other) noexcept;
    LocalFile& operator=(LocalFile&& other) noexcept;
    LocalFile(const LocalFile&) = delete;
    LocalFile& operator=(const LocalFile&) = delete;

    // Creates the file if missing; existing content is kept unless truncate is set.
    [[nodiscard]] static auto open_for_write(const std::filesystem::path& path, bool truncate = false)
        -> infra::Result<LocalFile>;

    [[nodiscard]] static auto open_for_read(const std::filesystem::path& path)
        -> infra::Result<LocalFile>;

    // Reads until buffer is full or EOF; returns the byte count read.
    [[nodiscard]] auto read_at(std::uint64_t offset, std::span<char> buffer) const
        -> infra::Result<std::size_t>;

    [[nodiscard]] auto write_at(std::uint64_t offset, std::span<const char> data) const
        -> infra::VoidResult;

    [[nodiscard]] auto resize(std::uint64_t size) const -> infra::VoidResult;
    [[nodiscard]] auto size() const -> infra::Result<std::uint64_t>;
    [[nodiscard]] auto sync() const -> infra::VoidResult;

    [[nodiscard]] auto is_open() const noexcept -> bool { return fd_ >= 0; }
    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    LocalFile(int fd, std::filesystem::path path) : fd_(fd), path_(std::move(path)) {}
    void close_() noexcept;

    int fd_ = -1;
    std::filesystem::path path_;
};

[[nodiscard]] auto create_directories(const std::filesystem::path& dir) -> infra::VoidResult;

// nullopt when the path does not exist
[[nodiscard]] auto stat(const std::filesystem::path& path) -> std::optional<FileStat>;

// Direct children sorted by name; symlinks are followed.
[[nodiscard]] auto list_dir(const std::filesystem::path& dir) -> infra::Result<std::vector<DirEntry>>;

} // namespace fxfer::adapters::fs
