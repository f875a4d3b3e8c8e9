#include "utils.hpp"

#include <atomic>
#include <iostream>
#include <mutex>
#include <sys/utsname.h>

namespace fs = std::filesystem;

namespace Rootstock {

namespace {

// Reader threads, workers and the CLI all log; keep lines whole.
std::mutex log_mutex;
std::atomic<bool> verbose_enabled{false};

void write_line(const char* color, const char* tag, const std::string& message)
{
    std::lock_guard<std::mutex> lock(log_mutex);
    std::cerr << color << tag << COLOR_RESET << message << std::endl;
}

} // namespace

void set_verbose(bool enabled)
{
    verbose_enabled.store(enabled);
}

void log_debug(const std::string& message)
{
    if (!verbose_enabled.load()) {
        return;
    }
    write_line(COLOR_DEBUG, "[DEBUG] ", message);
}

void log_message(const std::string& message)
{
    write_line(COLOR_INFO, "[INFO] ", message);
}

void log_warning(const std::string& message)
{
    write_line(COLOR_WARN, "[WARN] ", message);
}

void log_error(const std::string& message)
{
    write_line(COLOR_ERROR, "[ERROR] ", message);
}

std::string trim(const std::string& input)
{
    const char* whitespace = " \t\n\r\f\v";
    size_t first = input.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return "";
    }
    size_t last = input.find_last_not_of(whitespace);
    return input.substr(first, last - first + 1);
}

bool isWithin(const fs::path& root, const fs::path& candidate)
{
    fs::path normalRoot = root.lexically_normal();
    fs::path normalCandidate = candidate.lexically_normal();

    // "a/b/" and "a/b" must compare equal
    if (!normalRoot.empty() && normalRoot.filename().empty()) {
        normalRoot = normalRoot.parent_path();
    }

    auto rootIt = normalRoot.begin();
    auto candIt = normalCandidate.begin();
    for (; rootIt != normalRoot.end(); ++rootIt, ++candIt) {
        if (candIt == normalCandidate.end() || *rootIt != *candIt) {
            return false;
        }
    }

    // Anything left must not climb back out
    for (; candIt != normalCandidate.end(); ++candIt) {
        if (*candIt == "..") {
            return false;
        }
    }
    return true;
}

bool isSafeName(const std::string& name)
{
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    return name.find('/') == std::string::npos &&
           name.find('\0') == std::string::npos;
}

std::string hostArchitecture()
{
    struct utsname info {};
    if (uname(&info) != 0) {
        return "aarch64";
    }
    return info.machine;
}

std::string join(const std::vector<std::string>& parts, const std::string& separator)
{
    std::string result;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            result += separator;
        }
        result += parts[i];
    }
    return result;
}

} // namespace Rootstock
