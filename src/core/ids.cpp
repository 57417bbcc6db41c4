#include "fullsync/core/ids.hpp"

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

namespace fullsync {

std::string generate_id(std::string_view prefix) {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    std::ostringstream id;
    id << prefix << '-' << now << '-'
       << std::hex << std::setw(16) << std::setfill('0') << engine();
    return id.str();
}

} // namespace fullsync
