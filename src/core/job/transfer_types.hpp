#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fxfer::core {

enum class Direction { Download, Upload };

enum class ChunkStatus { Pending, InFlight, Done, Failed };

[[nodiscard]] auto to_string(Direction direction) -> std::string_view;
[[nodiscard]] auto direction_from_string(std::string_view text) -> std::optional<Direction>;

struct Chunk {
    std::size_t file_index = 0;
    std::uint64_t offset = 0;
    std::uint64_t length = 0;
    ChunkStatus status = ChunkStatus::Pending;

    [[nodiscard]] auto done() const -> bool { return status == ChunkStatus::Done; }
    [[nodiscard]] auto end() const -> std::uint64_t { return offset + length; }
};

struct FileTransfer {
    std::string source;
    std::string destination;
    std::uint64_t size = 0;
    std::vector<Chunk> chunks;

    [[nodiscard]] auto pending_chunks() const -> std::size_t;
    [[nodiscard]] auto complete() const -> bool { return pending_chunks() == 0; }
    // No chunk of the file has been transferred yet
    [[nodiscard]] auto untouched() const -> bool;
};

} // namespace fxfer::core
