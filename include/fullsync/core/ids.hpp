#pragma once

#include <string>
#include <string_view>

namespace fullsync {

/// "<prefix>-<epoch ms>-<16 hex digits>", unique across processes in practice.
std::string generate_id(std::string_view prefix);

} // namespace fullsync
