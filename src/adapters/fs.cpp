#include "fs.hpp"

#include <algorithm>
#include <cerrno>
#include <system_error>
#include <utility>
#include <fmt/core.h>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fxfer::adapters::fs {

LocalFile::~LocalFile() {
    close_();
}

LocalFile::LocalFile(LocalFile&& other) noexcept
    : fd_(std::exchange(other.fd_, -1))
    , path_(std::move(other.path_))
{}

LocalFile& LocalFile::operator=(LocalFile&& other) noexcept {
    if (this != &other) {
        close_();
        fd_ = std::exchange(other.fd_, -1);
        path_ = std::move(other.path_);
    }
    return *this;
}

void LocalFile::close_() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

auto LocalFile::open_for_write(const std::filesystem::path& path, bool truncate)
    -> infra::Result<LocalFile>
{
    int flags = O_WRONLY | O_CREAT | O_CLOEXEC;
    if (truncate) flags |= O_TRUNC;

    const int fd = ::open(path.c_str(), flags, 0644);
    if (fd == -1) {
        return std::unexpected(infra::error_from_errno(errno,
            fmt::format("Cannot open {} for writing", path.string())));
    }
    return LocalFile{fd, path};
}

auto LocalFile::open_for_read(const std::filesystem::path& path)
    -> infra::Result<LocalFile>
{
    const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd == -1) {
        return std::unexpected(infra::error_from_errno(errno,
            fmt::format("Cannot open {} for reading", path.string())));
    }
    return LocalFile{fd, path};
}

auto LocalFile::read_at(std::uint64_t offset, std::span<char> buffer) const
    -> infra::Result<std::size_t>
{
    std::size_t done = 0;
    while (done < buffer.size()) {
        const ssize_t n = ::pread(fd_, buffer.data() + done, buffer.size() - done,
                                  static_cast<off_t>(offset + done));
        if (n == -1) {
            if (errno == EINTR) continue;
            return std::unexpected(infra::error_from_errno(errno,
                fmt::format("Read error in {} at offset {}", path_.string(), offset + done)));
        }
        if (n == 0) break; // EOF
        done += static_cast<std::size_t>(n);
    }
    return done;
}

auto LocalFile::write_at(std::uint64_t offset, std::span<const char> data) const
    -> infra::VoidResult
{
    std::size_t done = 0;
    while (done < data.size()) {
        const ssize_t n = ::pwrite(fd_, data.data() + done, data.size() - done,
                                   static_cast<off_t>(offset + done));
        if (n == -1) {
            if (errno == EINTR) continue;
            return std::unexpected(infra::error_from_errno(errno,
                fmt::format("Write error in {} at offset {}", path_.string(), offset + done)));
        }
        done += static_cast<std::size_t>(n);
    }
    return {};
}

auto LocalFile::resize(std::uint64_t size) const -> infra::VoidResult {
    if (::ftruncate(fd_, static_cast<off_t>(size)) == -1) {
        return std::unexpected(infra::error_from_errno(errno,
            fmt::format("Cannot resize {} to {} bytes", path_.string(), size)));
    }
    return {};
}

auto LocalFile::size() const -> infra::Result<std::uint64_t> {
    struct stat sb;
    if (::fstat(fd_, &sb) == -1) {
        return std::unexpected(infra::error_from_errno(errno,
            fmt::format("fstat failed for {}", path_.string())));
    }
    return static_cast<std::uint64_t>(sb.st_size);
}

auto LocalFile::sync() const -> infra::VoidResult {
    if (::fdatasync(fd_) == -1) {
        return std::unexpected(infra::error_from_errno(errno,
            fmt::format("fdatasync failed for {}", path_.string())));
    }
    return {};
}

auto create_directories(const std::filesystem::path& dir) -> infra::VoidResult {
    if (dir.empty()) return {};
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return std::unexpected(infra::error_from_errno(ec.value(),
            fmt::format("Cannot create directory {}", dir.string())));
    }
    return {};
}

auto stat(const std::filesystem::path& path) -> std::optional<FileStat> {
    struct ::stat sb;
    if (::stat(path.c_str(), &sb) == -1) {
        return std::nullopt;
    }
    return FileStat{
        .size = S_ISDIR(sb.st_mode) ? 0 : static_cast<std::uint64_t>(sb.st_size),
        .is_directory = S_ISDIR(sb.st_mode)
    };
}

auto list_dir(const std::filesystem::path& dir) -> infra::Result<std::vector<DirEntry>> {
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec) {
        return std::unexpected(infra::error_from_errno(ec.value(),
            fmt::format("Cannot list {}", dir.string())));
    }

    std::vector<DirEntry> entries;
    for (const auto& entry : it) {
        auto st = stat(entry.path());
        if (!st) continue; // dangling symlink or raced removal
        entries.push_back(DirEntry{entry.path().filename().string(), *st});
    }
    std::ranges::sort(entries, {}, &DirEntry::name);
    return entries;
}

} // namespace fxfer::adapters::fs
