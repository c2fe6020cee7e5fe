#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "adapters/storage/storage_client.hpp"
#include "infra/error_handler/error.hpp"

namespace fxfer::core::planner {

using adapters::storage::EntryInfo;
using adapters::storage::EntryType;

class PathLister {
public:
    virtual ~PathLister() = default;

    // nullopt when nothing exists at path
    [[nodiscard]] virtual auto stat(const std::string& path) -> std::optional<EntryInfo> = 0;

    // Direct children; each entry's path is join(path, name).
    [[nodiscard]] virtual auto children(const std::string& path)
        -> infra::Result<std::vector<EntryInfo>> = 0;
};

class StorageLister final : public PathLister {
public:
    explicit StorageLister(adapters::storage::StorageClient& client) : client_(client) {}

    auto stat(const std::string& path) -> std::optional<EntryInfo> override;
    auto children(const std::string& path) -> infra::Result<std::vector<EntryInfo>> override;

private:
    adapters::storage::StorageClient& client_;
};

class LocalLister final : public PathLister {
public:
    auto stat(const std::string& path) -> std::optional<EntryInfo> override;
    auto children(const std::string& path) -> infra::Result<std::vector<EntryInfo>> override;
};

struct Expansion {
    std::vector<EntryInfo> files;  // sorted by path
    std::string base;              // longest non-wildcard prefix of the source
    bool single_file = false;      // source named exactly one file
};

// Collapses repeated '/', drops "." segments and a trailing '/'. "/" stays "/".
[[nodiscard]] auto normalize_path(std::string_view path) -> std::string;
[[nodiscard]] auto join_path(std::string_view parent, std::string_view name) -> std::string;
[[nodiscard]] auto basename(std::string_view path) -> std::string;
[[nodiscard]] auto parent_path(std::string_view path) -> std::string;
// path relative to base; base must be a path prefix of path
[[nodiscard]] auto relative_to(std::string_view path, std::string_view base) -> std::string;

[[nodiscard]] auto has_wildcard(std::string_view path) -> bool;

// Matches one path segment against a pattern where '*' stands for any run of
// characters (including none) that does not cross a '/'.
[[nodiscard]] auto match_segment(std::string_view pattern, std::string_view name) -> bool;

// NoMatch when nothing matches
[[nodiscard]] auto expand(const std::string& source, PathLister& lister) -> infra::Result<Expansion>;

/// A single literal file lands at dest_root/basename when dest_root is an
/// existing directory, at dest_root otherwise. Everything else keeps its path
/// relative to Expansion::base.
[[nodiscard]] auto map_destinations(const Expansion& expansion, const std::string& dest_root,
                                    PathLister& dest_lister) -> std::vector<std::string>;

} // namespace fxfer::core::planner
