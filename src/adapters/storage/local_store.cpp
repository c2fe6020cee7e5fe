#include "local_store.hpp"

#include <algorithm>
#include <system_error>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "adapters/fs.hpp"

namespace fxfer::adapters::storage {

namespace {

auto join(const std::string& parent, const std::string& name) -> std::string {
    return parent.empty() ? name : parent + "/" + name;
}

} // namespace

LocalStore::LocalStore(std::filesystem::path root)
    : root_(std::filesystem::absolute(std::move(root)).lexically_normal())
{}

auto LocalStore::resolve_(const std::string& path) const -> infra::Result<std::filesystem::path> {
    const auto rel = std::filesystem::path(path).relative_path().lexically_normal();
    for (const auto& part : rel) {
        if (part == "..") {
            return std::unexpected(infra::make_error(infra::ErrorCode::InvalidPath,
                fmt::format("Path escapes store root: {}", path)));
        }
    }
    if (rel.empty() || rel == ".") return root_;
    return root_ / rel;
}

auto LocalStore::info(const std::string& path) -> infra::Result<EntryInfo> {
    auto full = resolve_(path);
    if (!full) return std::unexpected(std::move(full.error()));

    auto st = fs::stat(*full);
    if (!st) {
        return std::unexpected(infra::make_error(infra::ErrorCode::FileNotFound,
            fmt::format("No such object: {}", path)));
    }
    return EntryInfo{
        .path = path,
        .size = st->size,
        .type = st->is_directory ? EntryType::Directory : EntryType::File
    };
}

auto LocalStore::exists(const std::string& path) -> bool {
    auto full = resolve_(path);
    return full && fs::stat(*full).has_value();
}

auto LocalStore::list(const std::string& path) -> infra::Result<std::vector<EntryInfo>> {
    auto full = resolve_(path);
    if (!full) return std::unexpected(std::move(full.error()));

    auto entries = fs::list_dir(*full);
    if (!entries) return std::unexpected(std::move(entries.error()));

    std::vector<EntryInfo> out;
    out.reserve(entries->size());
    for (const auto& entry : *entries) {
        out.push_back(EntryInfo{
            .path = join(path, entry.name),
            .size = entry.stat.size,
            .type = entry.stat.is_directory ? EntryType::Directory : EntryType::File
        });
    }
    return out;
}

auto LocalStore::ranged_read(const std::string& path, std::uint64_t offset, std::uint64_t length)
    -> infra::Result<std::vector<char>>
{
    auto full = resolve_(path);
    if (!full) return std::unexpected(std::move(full.error()));

    auto file = fs::LocalFile::open_for_read(*full);
    if (!file) return std::unexpected(std::move(file.error()));

    std::vector<char> buffer(length);
    auto n = file->read_at(offset, buffer);
    if (!n) return std::unexpected(std::move(n.error()));
    buffer.resize(*n);
    return buffer;
}

auto LocalStore::ranged_write(const std::string& path, std::uint64_t offset, std::span<const char> data)
    -> infra::VoidResult
{
    auto full = resolve_(path);
    if (!full) return std::unexpected(std::move(full.error()));

    auto file = fs::LocalFile::open_for_write(*full);
    if (!file) return std::unexpected(std::move(file.error()));
    return file->write_at(offset, data);
}

auto LocalStore::touch(const std::string& path) -> infra::VoidResult {
    auto full = resolve_(path);
    if (!full) return std::unexpected(std::move(full.error()));

    auto file = fs::LocalFile::open_for_write(*full, /*truncate=*/true);
    if (!file) return std::unexpected(std::move(file.error()));
    return {};
}

auto LocalStore::mkdir(const std::string& path) -> infra::VoidResult {
    auto full = resolve_(path);
    if (!full) return std::unexpected(std::move(full.error()));
    return fs::create_directories(*full);
}

auto LocalStore::remove(const std::string& path, bool recursive) -> infra::VoidResult {
    auto full = resolve_(path);
    if (!full) return std::unexpected(std::move(full.error()));
    if (*full == root_) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidPath,
            "Refusing to remove the store root"));
    }

    std::error_code ec;
    if (recursive) {
        std::filesystem::remove_all(*full, ec);
    } else {
        std::filesystem::remove(*full, ec);
    }
    if (ec) {
        return std::unexpected(infra::error_from_errno(ec.value(),
            fmt::format("Cannot remove {}", path)));
    }
    spdlog::debug("Removed {}", path);
    return {};
}

} // namespace fxfer::adapters::storage
