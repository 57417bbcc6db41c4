#include "fullsync/core/types.hpp"

namespace fullsync {

const char* to_string(Direction direction) noexcept {
    return direction == Direction::Push ? "push" : "pull";
}

const char* to_string(Method method) noexcept {
    return method == Method::Bulk ? "bulk" : "incremental";
}

std::optional<Direction> direction_from_string(std::string_view text) noexcept {
    if (text == "push") {
        return Direction::Push;
    }
    if (text == "pull") {
        return Direction::Pull;
    }
    return std::nullopt;
}

std::optional<Method> method_from_string(std::string_view text) noexcept {
    if (text == "bulk") {
        return Method::Bulk;
    }
    if (text == "incremental") {
        return Method::Incremental;
    }
    return std::nullopt;
}

} // namespace fullsync
