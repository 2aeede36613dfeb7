#pragma once

#include <string>

namespace slate {
namespace utils {

/**
 * Get the directory where the executable is located.
 * Lets us find the bundled sidecar regardless of the current working directory.
 */
std::string get_executable_dir();

/**
 * Find the sidecar server executable (slate-server.exe on Windows, slate-server on Unix).
 * Searches next to this executable, the current and parent directories,
 * then the common install locations.
 * @return Absolute path to the server binary, or empty string if not found.
 */
std::string find_server_executable();

} // namespace utils
} // namespace slate
