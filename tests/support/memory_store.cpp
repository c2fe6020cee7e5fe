#include "memory_store.hpp"

#include <algorithm>
#include <fmt/core.h>

namespace fxfer::testing {

using adapters::storage::EntryInfo;
using adapters::storage::EntryType;

namespace {

auto under(const std::string& path, const std::string& dir) -> bool {
    if (dir.empty()) return true;
    return path.size() > dir.size() && path.compare(0, dir.size(), dir) == 0 && path[dir.size()] == '/';
}

auto child_of(const std::string& path, const std::string& dir) -> std::string {
    const auto rest = dir.empty() ? path : path.substr(dir.size() + 1);
    const auto slash = rest.find('/');
    const auto name = slash == std::string::npos ? rest : rest.substr(0, slash);
    return dir.empty() ? name : dir + "/" + name;
}

auto missing(const std::string& path) -> infra::Error {
    return infra::make_error(infra::ErrorCode::FileNotFound, fmt::format("No such object: {}", path));
}

} // namespace

auto MemoryStore::normalize(const std::string& path) -> std::string {
    std::string out;
    for (std::size_t i = 0; i < path.size(); ++i) {
        if (path[i] == '/' && (out.empty() || out.back() == '/')) continue;
        out += path[i];
    }
    while (!out.empty() && out.back() == '/') out.pop_back();
    return out;
}

auto MemoryStore::is_dir_locked_(const std::string& path) const -> bool {
    if (path.empty() || dirs_.contains(path)) return true;
    const auto prefix = path + "/";
    auto it = objects_.lower_bound(prefix);
    return it != objects_.end() && it->first.compare(0, prefix.size(), prefix) == 0;
}

auto MemoryStore::hook_(const Hook& hook) const -> Hook {
    std::lock_guard lock(mutex_);
    return hook;
}

auto MemoryStore::info(const std::string& raw) -> infra::Result<EntryInfo> {
    const auto path = normalize(raw);
    std::lock_guard lock(mutex_);
    if (auto it = objects_.find(path); it != objects_.end()) {
        return EntryInfo{path, it->second.size(), EntryType::File};
    }
    if (is_dir_locked_(path)) {
        return EntryInfo{path, 0, EntryType::Directory};
    }
    return std::unexpected(missing(path));
}

auto MemoryStore::exists(const std::string& path) -> bool {
    return info(path).has_value();
}

auto MemoryStore::list(const std::string& raw) -> infra::Result<std::vector<EntryInfo>> {
    const auto path = normalize(raw);
    std::lock_guard lock(mutex_);
    if (!is_dir_locked_(path)) return std::unexpected(missing(path));

    std::map<std::string, EntryInfo> children;
    for (const auto& [name, data] : objects_) {
        if (!under(name, path)) continue;
        const auto child = child_of(name, path);
        if (child == name) children[child] = EntryInfo{child, data.size(), EntryType::File};
        else children.try_emplace(child, EntryInfo{child, 0, EntryType::Directory});
    }
    for (const auto& dir : dirs_) {
        if (!under(dir, path)) continue;
        const auto child = child_of(dir, path);
        children.try_emplace(child, EntryInfo{child, 0, EntryType::Directory});
    }

    std::vector<EntryInfo> out;
    out.reserve(children.size());
    for (auto& [_, entry] : children) out.push_back(std::move(entry));
    return out;
}

auto MemoryStore::ranged_read(const std::string& raw, std::uint64_t offset, std::uint64_t length)
    -> infra::Result<std::vector<char>>
{
    const auto path = normalize(raw);
    reads_.fetch_add(1);
    if (auto hook = hook_(read_hook_)) {
        if (auto res = hook(path, offset); !res) return std::unexpected(std::move(res.error()));
    }

    std::lock_guard lock(mutex_);
    auto it = objects_.find(path);
    if (it == objects_.end()) return std::unexpected(missing(path));

    const auto& data = it->second;
    if (offset >= data.size()) return std::vector<char>{};
    const auto end = std::min<std::uint64_t>(data.size(), offset + length);
    return std::vector<char>(data.begin() + static_cast<std::ptrdiff_t>(offset),
                             data.begin() + static_cast<std::ptrdiff_t>(end));
}

auto MemoryStore::ranged_write(const std::string& raw, std::uint64_t offset, std::span<const char> bytes)
    -> infra::VoidResult
{
    const auto path = normalize(raw);
    writes_.fetch_add(1);
    if (auto hook = hook_(write_hook_)) {
        if (auto res = hook(path, offset); !res) return res;
    }

    std::lock_guard lock(mutex_);
    auto& data = objects_[path];
    if (data.size() < offset + bytes.size()) data.resize(offset + bytes.size());
    std::ranges::copy(bytes, data.begin() + static_cast<std::ptrdiff_t>(offset));
    return {};
}

auto MemoryStore::touch(const std::string& raw) -> infra::VoidResult {
    std::lock_guard lock(mutex_);
    objects_[normalize(raw)].clear();
    return {};
}

auto MemoryStore::mkdir(const std::string& raw) -> infra::VoidResult {
    std::lock_guard lock(mutex_);
    auto path = normalize(raw);
    while (!path.empty()) {
        dirs_.insert(path);
        const auto slash = path.rfind('/');
        path = slash == std::string::npos ? std::string{} : path.substr(0, slash);
    }
    return {};
}

auto MemoryStore::remove(const std::string& raw, bool recursive) -> infra::VoidResult {
    const auto path = normalize(raw);
    std::lock_guard lock(mutex_);
    if (objects_.erase(path) > 0) return {};
    if (!is_dir_locked_(path)) return std::unexpected(missing(path));

    if (!recursive) {
        const bool has_children =
            std::ranges::any_of(objects_, [&](const auto& kv) { return under(kv.first, path); }) ||
            std::ranges::any_of(dirs_, [&](const auto& d) { return under(d, path); });
        if (has_children) {
            return std::unexpected(infra::make_error(infra::ErrorCode::PermissionDenied,
                fmt::format("Directory not empty: {}", path)));
        }
    }
    std::erase_if(objects_, [&](const auto& kv) { return under(kv.first, path); });
    std::erase_if(dirs_, [&](const auto& d) { return d == path || under(d, path); });
    return {};
}

void MemoryStore::put(const std::string& path, std::string content) {
    put(path, std::vector<char>(content.begin(), content.end()));
}

void MemoryStore::put(const std::string& path, std::vector<char> content) {
    std::lock_guard lock(mutex_);
    objects_[normalize(path)] = std::move(content);
}

auto MemoryStore::content(const std::string& path) const -> std::string {
    std::lock_guard lock(mutex_);
    auto it = objects_.find(normalize(path));
    return it == objects_.end() ? std::string{} : std::string(it->second.begin(), it->second.end());
}

auto MemoryStore::object_count(const std::string& prefix) const -> std::size_t {
    std::lock_guard lock(mutex_);
    const auto dir = normalize(prefix);
    return static_cast<std::size_t>(std::ranges::count_if(objects_,
        [&](const auto& kv) { return under(kv.first, dir); }));
}

auto MemoryStore::total_bytes(const std::string& prefix) const -> std::uint64_t {
    std::lock_guard lock(mutex_);
    const auto dir = normalize(prefix);
    std::uint64_t total = 0;
    for (const auto& [name, data] : objects_) {
        if (under(name, dir)) total += data.size();
    }
    return total;
}

} // namespace fxfer::testing
