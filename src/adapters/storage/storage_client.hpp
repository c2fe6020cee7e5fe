#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>
#include "infra/error_handler/error.hpp"

namespace fxfer::adapters::storage {

enum class EntryType { File, Directory };

struct EntryInfo {
    std::string path;        // store path, '/'-separated, no leading or trailing '/'
    std::uint64_t size = 0;  // 0 for directories
    EntryType type = EntryType::File;

    [[nodiscard]] auto is_directory() const -> bool { return type == EntryType::Directory; }
};

/// Remote hierarchical object store, as consumed by the transfer engine.
///
/// Paths are relative to the store root; the root itself is the empty path.
/// Implementations must be safe to call from several worker threads at once
/// as long as concurrent writes to one object target disjoint byte ranges.
///
/// Transient faults are reported as ErrorCode::NetworkTimeout or
/// ErrorCode::ServiceUnavailable so that ChunkTransfer can retry them.
class StorageClient {
public:
    virtual ~StorageClient() = default;

    [[nodiscard]] virtual auto info(const std::string& path) -> infra::Result<EntryInfo> = 0;
    [[nodiscard]] virtual auto exists(const std::string& path) -> bool = 0;

    // Direct children of a directory, sorted by path.
    [[nodiscard]] virtual auto list(const std::string& path) -> infra::Result<std::vector<EntryInfo>> = 0;

    // Returns fewer than length bytes only when the object ends first.
    [[nodiscard]] virtual auto ranged_read(const std::string& path, std::uint64_t offset,
                                           std::uint64_t length)
        -> infra::Result<std::vector<char>> = 0;

    // Writes data at offset, growing the object as needed. Creates the object if missing.
    [[nodiscard]] virtual auto ranged_write(const std::string& path, std::uint64_t offset,
                                            std::span<const char> data)
        -> infra::VoidResult = 0;

    // Creates an empty object, truncating an existing one.
    [[nodiscard]] virtual auto touch(const std::string& path) -> infra::VoidResult = 0;

    // Creates the directory and all missing parents.
    [[nodiscard]] virtual auto mkdir(const std::string& path) -> infra::VoidResult = 0;

    [[nodiscard]] virtual auto remove(const std::string& path, bool recursive = false) -> infra::VoidResult = 0;
};

} // namespace fxfer::adapters::storage
