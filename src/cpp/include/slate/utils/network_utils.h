#pragma once

#include <string>

namespace slate {
namespace utils {

class NetworkUtils {
public:
    // TCP connect to host:port, each resolved address bounded by timeout_ms.
    // Host may be a name or an IPv4/IPv6 literal. True only if a connection
    // was established (something is listening).
    static bool can_connect(const std::string& host, int port, int timeout_ms);
};

} // namespace utils
} // namespace slate
