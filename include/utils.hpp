#ifndef UTILS_HPP
#define UTILS_HPP

#include <string>
#include <vector>
#include <filesystem>

// ANSI color codes for console output.
#define COLOR_RESET "\033[0m"
#define COLOR_DEBUG "\033[36m"
#define COLOR_INFO  "\033[32m"
#define COLOR_WARN  "\033[33m"
#define COLOR_ERROR "\033[31m"

namespace Rootstock {

/**
 * @brief Enables or disables debug-level log output.
 *
 * Debug output is off by default; `--verbose` or `verbose: true` in the
 * configuration turns it on.
 */
void set_verbose(bool enabled);

/**
 * @brief Logs a debug message to standard error with cyan coloring.
 *
 * Dropped unless verbose output is enabled.
 *
 * @param message The message to log.
 */
void log_debug(const std::string& message);

/**
 * @brief Logs an informational message to standard error with green coloring.
 *
 * @param message The message to log.
 */
void log_message(const std::string& message);

/**
 * @brief Logs a warning message to standard error with yellow coloring.
 *
 * @param message The warning message to log.
 */
void log_warning(const std::string& message);

/**
 * @brief Logs an error message to standard error with red coloring.
 *
 * @param message The error message to log.
 */
void log_error(const std::string& message);

// ---------------------------------------------------------------------------
// Other utility function declarations
// ---------------------------------------------------------------------------

/**
 * @brief Removes leading and trailing whitespace from a string.
 */
std::string trim(const std::string& input);

/**
 * @brief Returns true if `candidate` is `root` itself or lies below it.
 *
 * Both paths are compared component by component after lexical
 * normalization, so "/a/bc" is never considered to be inside "/a/b".
 */
bool isWithin(const std::filesystem::path& root,
              const std::filesystem::path& candidate);

/**
 * @brief Returns true if the string is usable as a single directory name.
 *
 * Rejects empty names, "." and "..", and names containing '/' or NUL.
 */
bool isSafeName(const std::string& name);

/**
 * @brief Returns the host machine architecture as reported by uname(2),
 *        e.g. "x86_64" or "aarch64".
 */
std::string hostArchitecture();

/**
 * @brief Joins a list of strings with the given separator.
 */
std::string join(const std::vector<std::string>& parts, const std::string& separator);

} // namespace Rootstock

#endif // UTILS_HPP
