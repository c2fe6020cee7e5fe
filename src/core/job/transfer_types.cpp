#include "transfer_types.hpp"
#include <algorithm>

namespace fxfer::core {

auto to_string(Direction direction) -> std::string_view {
    return direction == Direction::Download ? "download" : "upload";
}

auto direction_from_string(std::string_view text) -> std::optional<Direction> {
    if (text == "download") return Direction::Download;
    if (text == "upload") return Direction::Upload;
    return std::nullopt;
}

auto FileTransfer::pending_chunks() const -> std::size_t {
    return static_cast<std::size_t>(
        std::ranges::count_if(chunks, [](const Chunk& c) { return !c.done(); }));
}

auto FileTransfer::untouched() const -> bool {
    return std::ranges::none_of(chunks, [](const Chunk& c) { return c.done(); });
}

} // namespace fxfer::core
