#include "registry.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace Rootstock {

namespace {

    bool isTerminal(EnvironmentStatus status)
    {
        return status == EnvironmentStatus::Ready ||
               status == EnvironmentStatus::Error ||
               status == EnvironmentStatus::Cancelled;
    }

    bool canTransition(EnvironmentStatus from, EnvironmentStatus to)
    {
        if (isTerminal(from)) {
            return false;
        }
        if (to == EnvironmentStatus::Error || to == EnvironmentStatus::Cancelled) {
            return true;
        }
        return static_cast<int>(to) > static_cast<int>(from);
    }

    // bin/sh is usually an absolute link into busybox, so the link itself counts
    bool hasShell(const fs::path& root)
    {
        for (const char* candidate : {"bin/sh", "usr/bin/sh"}) {
            std::error_code ec;
            if (fs::exists(fs::symlink_status(root / candidate, ec))) {
                return true;
            }
        }
        return false;
    }

} // namespace

const char* environmentStatusName(EnvironmentStatus status)
{
    switch (status) {
        case EnvironmentStatus::Uninitialized:     return "uninitialized";
        case EnvironmentStatus::Downloading:       return "downloading";
        case EnvironmentStatus::Extracting:        return "extracting";
        case EnvironmentStatus::Configuring:       return "configuring";
        case EnvironmentStatus::InstallingRuntime: return "installing-runtime";
        case EnvironmentStatus::Ready:             return "ready";
        case EnvironmentStatus::Error:             return "error";
        case EnvironmentStatus::Cancelled:         return "cancelled";
    }
    return "unknown";
}

EnvironmentRegistry::EnvironmentRegistry(std::string provisioningRoot)
    : root_(std::move(provisioningRoot))
{
}

std::string EnvironmentRegistry::pathFor(const std::string& id) const
{
    if (!isSafeName(id)) {
        throw SetupError(ErrorKind::InvalidArgument, "Invalid environment id: '" + id + "'");
    }
    return (fs::path(root_) / id).string();
}

std::string EnvironmentRegistry::archivePathFor(const std::string& id) const
{
    if (!isSafeName(id)) {
        throw SetupError(ErrorKind::InvalidArgument, "Invalid environment id: '" + id + "'");
    }
    return (fs::path(root_) / ("rootfs_" + id + ".tar.gz")).string();
}

std::vector<EnvironmentEntry> EnvironmentRegistry::list() const
{
    std::vector<EnvironmentEntry> entries;
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        return entries;
    }

    for (fs::directory_iterator it(root_, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code statusEc;
        if (!it->is_directory(statusEc)) {
            continue;
        }
        EnvironmentEntry entry;
        entry.id = it->path().filename().string();
        entry.path = it->path().string();
        entry.exists = hasShell(it->path());
        entries.push_back(std::move(entry));
    }
    if (ec) {
        log_warning("Error while scanning " + root_ + ": " + ec.message());
    }

    std::sort(entries.begin(), entries.end(),
              [](const EnvironmentEntry& a, const EnvironmentEntry& b) { return a.id < b.id; });
    return entries;
}

bool EnvironmentRegistry::exists(const std::string& id) const
{
    return hasShell(pathFor(id));
}

bool EnvironmentRegistry::remove(const std::string& id)
{
    const std::string path = pathFor(id);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_.count(id)) {
            throw SetupError(ErrorKind::Busy, "Environment " + id + " is being provisioned");
        }
        records_.erase(id);
    }

    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        log_error("Failed to delete " + path + ": " + ec.message());
        return false;
    }
    return !fs::exists(fs::symlink_status(path, ec));
}

Environment EnvironmentRegistry::beginRun(const std::string& id, const std::string& distribution)
{
    Environment env;
    env.id = id;
    env.distribution = distribution;
    env.rootPath = pathFor(id);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_.insert(id).second) {
        throw SetupError(ErrorKind::Busy, "A setup for environment " + id + " is already running");
    }
    records_[id] = env;
    return env;
}

void EnvironmentRegistry::endRun(const std::string& id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    running_.erase(id);
}

bool EnvironmentRegistry::isRunning(const std::string& id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return running_.count(id) > 0;
}

Environment EnvironmentRegistry::transition(const std::string& id, EnvironmentStatus next,
                                            const std::string& message)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) {
        throw SetupError(ErrorKind::NotFound, "No record for environment " + id);
    }

    Environment& env = it->second;
    if (!canTransition(env.status, next)) {
        throw SetupError(ErrorKind::InvalidArgument,
                         std::string("Illegal status change for ") + id + ": " +
                         environmentStatusName(env.status) + " -> " + environmentStatusName(next));
    }

    env.status = next;
    if (next == EnvironmentStatus::Ready) {
        env.installedAt = std::chrono::system_clock::now();
    } else if (next == EnvironmentStatus::Error) {
        env.errorMessage = message;
    }
    log_debug("Environment " + id + " is now " + environmentStatusName(next));
    return env;
}

void EnvironmentRegistry::addWarning(const std::string& id, const std::string& warning)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it != records_.end()) {
        it->second.warnings.push_back(warning);
    }
}

std::optional<Environment> EnvironmentRegistry::find(const std::string& id) const
{
    const std::string path = pathFor(id);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find(id);
        if (it != records_.end()) {
            return it->second;
        }
    }

    if (!hasShell(path)) {
        return std::nullopt;
    }
    Environment env;
    env.id = id;
    env.rootPath = path;
    env.status = EnvironmentStatus::Ready;
    return env;
}

} // namespace Rootstock
