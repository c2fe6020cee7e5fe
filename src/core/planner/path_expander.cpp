#include "path_expander.hpp"

#include <algorithm>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include "adapters/fs.hpp"

namespace fxfer::core::planner {

namespace {

struct SplitPath {
    std::string root;                  // "/" for absolute paths, "" otherwise
    std::vector<std::string> segments;
};

auto split(std::string_view path) -> SplitPath {
    SplitPath out;
    if (!path.empty() && path.front() == '/') out.root = "/";

    std::size_t pos = 0;
    while (pos <= path.size()) {
        const auto next = path.find('/', pos);
        const auto seg = path.substr(pos, next == std::string_view::npos ? std::string_view::npos : next - pos);
        if (!seg.empty() && seg != ".") out.segments.emplace_back(seg);
        if (next == std::string_view::npos) break;
        pos = next + 1;
    }
    return out;
}

auto assemble(const std::string& root, const std::vector<std::string>& segments, std::size_t count)
    -> std::string
{
    std::string out = root;
    for (std::size_t i = 0; i < count; ++i) {
        out = join_path(out, segments[i]);
    }
    return out;
}

auto not_found(const infra::Error& err) -> bool {
    return err.code == infra::ErrorCode::FileNotFound;
}

// Depth-first collection of every file under dir.
auto walk(PathLister& lister, const std::string& dir, std::vector<EntryInfo>& out) -> infra::VoidResult {
    auto kids = lister.children(dir);
    if (!kids) return std::unexpected(std::move(kids.error()));

    for (auto& kid : *kids) {
        if (kid.is_directory()) {
            if (auto res = walk(lister, kid.path, out); !res) return res;
        } else {
            out.push_back(std::move(kid));
        }
    }
    return {};
}

void sort_unique(std::vector<EntryInfo>& files) {
    std::ranges::sort(files, {}, &EntryInfo::path);
    const auto dup = std::ranges::unique(files, {}, &EntryInfo::path);
    files.erase(dup.begin(), dup.end());
}

auto no_match(const std::string& source) -> infra::Error {
    return infra::make_error(infra::ErrorCode::NoMatch,
                             fmt::format("No files found matching '{}'", source));
}

} // namespace

// =============== Listers ===============

auto StorageLister::stat(const std::string& path) -> std::optional<EntryInfo> {
    auto res = client_.info(path);
    if (!res) return std::nullopt;
    res->path = path;
    return *res;
}

auto StorageLister::children(const std::string& path) -> infra::Result<std::vector<EntryInfo>> {
    auto res = client_.list(path);
    if (!res) return res;
    for (auto& entry : *res) {
        entry.path = join_path(path, basename(entry.path));
    }
    return res;
}

auto LocalLister::stat(const std::string& path) -> std::optional<EntryInfo> {
    auto st = adapters::fs::stat(path.empty() ? "." : path);
    if (!st) return std::nullopt;
    return EntryInfo{
        .path = path,
        .size = st->size,
        .type = st->is_directory ? EntryType::Directory : EntryType::File
    };
}

auto LocalLister::children(const std::string& path) -> infra::Result<std::vector<EntryInfo>> {
    auto entries = adapters::fs::list_dir(path.empty() ? "." : path);
    if (!entries) return std::unexpected(std::move(entries.error()));

    std::vector<EntryInfo> out;
    out.reserve(entries->size());
    for (const auto& entry : *entries) {
        out.push_back(EntryInfo{
            .path = join_path(path, entry.name),
            .size = entry.stat.size,
            .type = entry.stat.is_directory ? EntryType::Directory : EntryType::File
        });
    }
    return out;
}

// =============== Path helpers ===============

auto normalize_path(std::string_view path) -> std::string {
    const auto parts = split(path);
    return assemble(parts.root, parts.segments, parts.segments.size());
}

auto join_path(std::string_view parent, std::string_view name) -> std::string {
    if (parent.empty()) return std::string(name);
    if (name.empty()) return std::string(parent);
    if (parent.back() == '/') return fmt::format("{}{}", parent, name);
    return fmt::format("{}/{}", parent, name);
}

auto basename(std::string_view path) -> std::string {
    while (path.size() > 1 && path.back() == '/') path.remove_suffix(1);
    const auto pos = path.rfind('/');
    return std::string(pos == std::string_view::npos ? path : path.substr(pos + 1));
}

auto parent_path(std::string_view path) -> std::string {
    const auto parts = split(path);
    if (parts.segments.empty()) return parts.root;
    return assemble(parts.root, parts.segments, parts.segments.size() - 1);
}

auto relative_to(std::string_view path, std::string_view base) -> std::string {
    if (base.empty()) return std::string(path);
    if (path.size() <= base.size()) return basename(path);
    if (base.back() == '/') return std::string(path.substr(base.size()));
    return std::string(path.substr(base.size() + 1));
}

auto has_wildcard(std::string_view path) -> bool {
    return path.find('*') != std::string_view::npos;
}

auto match_segment(std::string_view pattern, std::string_view name) -> bool {
    std::size_t p = 0;
    std::size_t n = 0;
    std::size_t star = std::string_view::npos;  // position of the last '*' seen
    std::size_t resume = 0;                     // name position that '*' currently absorbs up to

    while (n < name.size()) {
        if (p < pattern.size() && pattern[p] == '*') {
            star = p++;
            resume = n;
        } else if (p < pattern.size() && pattern[p] == name[n]) {
            ++p;
            ++n;
        } else if (star != std::string_view::npos) {
            p = star + 1;
            n = ++resume;
        } else {
            return false;
        }
    }
    while (p < pattern.size() && pattern[p] == '*') ++p;
    return p == pattern.size();
}

// =============== Expansion ===============

auto expand(const std::string& source, PathLister& lister) -> infra::Result<Expansion> {
    const auto parts = split(source);
    const auto normalized = assemble(parts.root, parts.segments, parts.segments.size());

    const auto first_wild = std::ranges::find_if(parts.segments,
        [](const std::string& seg) { return has_wildcard(seg); });

    Expansion out;

    if (first_wild == parts.segments.end()) {
        auto st = lister.stat(normalized);
        if (!st) return std::unexpected(no_match(source));

        if (!st->is_directory()) {
            out.files.push_back(std::move(*st));
            out.base = parent_path(normalized);
            out.single_file = true;
            return out;
        }

        out.base = normalized;
        if (auto res = walk(lister, normalized, out.files); !res) {
            return std::unexpected(std::move(res.error()));
        }
        if (out.files.empty()) return std::unexpected(no_match(source));
        sort_unique(out.files);
        spdlog::debug("Expanded directory '{}' into {} file(s)", source, out.files.size());
        return out;
    }

    const auto prefix_len = static_cast<std::size_t>(first_wild - parts.segments.begin());
    out.base = assemble(parts.root, parts.segments, prefix_len);

    std::vector<std::string> candidates{out.base};
    std::vector<EntryInfo> matched;

    for (std::size_t i = prefix_len; i < parts.segments.size(); ++i) {
        const auto& pattern = parts.segments[i];
        const bool last = i + 1 == parts.segments.size();
        std::vector<std::string> next;

        for (const auto& dir : candidates) {
            if (!has_wildcard(pattern)) {
                auto st = lister.stat(join_path(dir, pattern));
                if (!st) continue;
                if (last) matched.push_back(std::move(*st));
                else if (st->is_directory()) next.push_back(st->path);
                continue;
            }

            auto kids = lister.children(dir);
            if (!kids) {
                if (not_found(kids.error())) continue;
                return std::unexpected(std::move(kids.error()));
            }
            for (auto& kid : *kids) {
                if (!match_segment(pattern, basename(kid.path))) continue;
                if (last) matched.push_back(std::move(kid));
                else if (kid.is_directory()) next.push_back(kid.path);
            }
        }
        candidates = std::move(next);
    }

    for (auto& entry : matched) {
        if (entry.is_directory()) {
            if (auto res = walk(lister, entry.path, out.files); !res) {
                return std::unexpected(std::move(res.error()));
            }
        } else {
            out.files.push_back(std::move(entry));
        }
    }

    if (out.files.empty()) return std::unexpected(no_match(source));

    sort_unique(out.files);
    spdlog::debug("Expanded glob '{}' into {} file(s)", source, out.files.size());
    return out;
}

auto map_destinations(const Expansion& expansion, const std::string& dest_root,
                      PathLister& dest_lister) -> std::vector<std::string>
{
    const auto root = normalize_path(dest_root);
    std::vector<std::string> out;
    out.reserve(expansion.files.size());

    if (expansion.single_file && expansion.files.size() == 1) {
        const auto st = dest_lister.stat(root);
        if (st && st->is_directory()) {
            out.push_back(join_path(root, basename(expansion.files.front().path)));
        } else {
            out.push_back(root);
        }
        return out;
    }

    for (const auto& file : expansion.files) {
        out.push_back(join_path(root, relative_to(file.path, expansion.base)));
    }
    return out;
}

} // namespace fxfer::core::planner
