#pragma once

#include <optional>
#include <string_view>

namespace fullsync {

/// push: local instance is the source. pull: remote instance is the source.
enum class Direction {
    Push,
    Pull
};

enum class Method {
    Bulk,           ///< Whole snapshot, dump and restore
    Incremental     ///< Record by record, resumable from a cursor
};

[[nodiscard]] const char* to_string(Direction direction) noexcept;
[[nodiscard]] const char* to_string(Method method) noexcept;

[[nodiscard]] std::optional<Direction> direction_from_string(std::string_view text) noexcept;
[[nodiscard]] std::optional<Method> method_from_string(std::string_view text) noexcept;

} // namespace fullsync
