#pragma once

#include <filesystem>
#include "storage_client.hpp"

namespace fxfer::adapters::storage {

// ".." components are rejected
class LocalStore final : public StorageClient {
public:
    explicit LocalStore(std::filesystem::path root);

    auto info(const std::string& path) -> infra::Result<EntryInfo> override;
    auto exists(const std::string& path) -> bool override;
    auto list(const std::string& path) -> infra::Result<std::vector<EntryInfo>> override;
    auto ranged_read(const std::string& path, std::uint64_t offset, std::uint64_t length)
        -> infra::Result<std::vector<char>> override;
    auto ranged_write(const std::string& path, std::uint64_t offset, std::span<const char> data)
        -> infra::VoidResult override;
    auto touch(const std::string& path) -> infra::VoidResult override;
    auto mkdir(const std::string& path) -> infra::VoidResult override;
    auto remove(const std::string& path, bool recursive = false) -> infra::VoidResult override;

    [[nodiscard]] auto root() const -> const std::filesystem::path& { return root_; }

private:
    [[nodiscard]] auto resolve_(const std::string& path) const -> infra::Result<std::filesystem::path>;

    std::filesystem::path root_;
};

} // namespace fxfer::adapters::storage
