#include "service.hpp"
#include "errors.hpp"
#include "run_context.hpp"
#include "utils.hpp"

#include <filesystem>
#include <fstream>
#include <utility>

#include <sys/statvfs.h>

namespace fs = std::filesystem;

namespace Rootstock {

namespace {

    constexpr uint64_t kMegabyte = 1024 * 1024;

    template <typename T>
    std::future<T> failedFuture(const SetupError& error)
    {
        std::promise<T> promise;
        promise.set_exception(std::make_exception_ptr(error));
        return promise.get_future();
    }

    ExecutionResult rejected(const std::string& message)
    {
        ExecutionResult result;
        result.exitCode = -1;
        result.stderrText = message;
        return result;
    }

    // statvfs needs an existing path; walk up until one is found
    fs::path existingAncestor(fs::path path)
    {
        std::error_code ec;
        while (!path.empty() && !fs::exists(path, ec)) {
            fs::path parent = path.parent_path();
            if (parent == path) {
                break;
            }
            path = parent;
        }
        return path.empty() ? fs::path("/") : path;
    }

} // namespace

EnvironmentService::EnvironmentService(Config config)
    : config_(std::move(config)),
      registry_(config_.provisioningRoot),
      executor_(config_),
      provisioner_(config_, registry_, executor_),
      pool_(config_.workerThreads)
{
    std::error_code ec;
    fs::create_directories(config_.provisioningRoot, ec);
    if (ec) {
        log_warning("Cannot create provisioning root " + config_.provisioningRoot + ": " + ec.message());
    }
}

EnvironmentService::~EnvironmentService()
{
    shutdown();
}

std::future<Environment> EnvironmentService::installEnvironment(const std::string& distribution,
                                                                const std::string& envId)
{
    if (!isSafeName(envId)) {
        return failedFuture<Environment>(
            SetupError(ErrorKind::InvalidArgument, "Invalid environment id: '" + envId + "'"));
    }

    auto context = std::make_shared<RunContext>(envId);
    {
        std::lock_guard<std::mutex> lock(runsMutex_);
        if (stopping_) {
            return failedFuture<Environment>(
                SetupError(ErrorKind::Cancelled, "Service is shutting down"));
        }
        if (!setups_.emplace(envId, context).second) {
            return failedFuture<Environment>(
                SetupError(ErrorKind::Busy, "A setup for environment " + envId + " is already running"));
        }
    }

    auto task = [this, distribution, envId, context]() -> Environment {
        try {
            Environment env = provisioner_.provision(
                distribution, envId, *context,
                [this](const ProgressEvent& event) { progress_.publish(event); },
                [this](const std::string& line) { output_.publish(line); });
            releaseRun(envId, context);
            return env;
        } catch (...) {
            releaseRun(envId, context);
            throw;
        }
    };

    try {
        return pool_.submit(std::move(task));
    } catch (const std::runtime_error& e) {
        releaseRun(envId, context);
        return failedFuture<Environment>(SetupError(ErrorKind::Cancelled, e.what()));
    }
}

void EnvironmentService::releaseRun(const std::string& envId, const std::shared_ptr<RunContext>& context)
{
    std::lock_guard<std::mutex> lock(runsMutex_);
    auto it = setups_.find(envId);
    if (it != setups_.end() && it->second == context) {
        setups_.erase(it);
    }
}

bool EnvironmentService::isInstalled(const std::string& envId) const
{
    if (!isSafeName(envId)) {
        return false;
    }
    return registry_.exists(envId);
}

std::vector<EnvironmentEntry> EnvironmentService::listEnvironments() const
{
    return registry_.list();
}

bool EnvironmentService::deleteEnvironment(const std::string& envId)
{
    {
        std::lock_guard<std::mutex> lock(runsMutex_);
        if (setups_.count(envId)) {
            throw SetupError(ErrorKind::Busy, "Environment " + envId + " is being set up");
        }
    }
    bool removed = registry_.remove(envId);
    if (removed) {
        log_message("Deleted environment " + envId);
    }
    return removed;
}

std::optional<Environment> EnvironmentService::status(const std::string& envId) const
{
    if (!isSafeName(envId)) {
        return std::nullopt;
    }
    return registry_.find(envId);
}

ExecutionResult EnvironmentService::execute(const std::string& envId,
                                            const std::string& command,
                                            const std::string& workingDir,
                                            long timeoutMs)
{
    if (envId.empty()) {
        return rejected("environmentId is empty. Select or create an environment first.");
    }
    if (!isSafeName(envId)) {
        return rejected("Invalid environment id: '" + envId + "'");
    }

    if (!registry_.exists(envId)) {
        return rejected("Environment " + envId + " is not installed");
    }
    const std::string rootPath = registry_.pathFor(envId);

    ExecutionRequest request;
    request.environmentId = envId;
    request.command = command;
    request.workingDir = workingDir.empty() ? "/" : workingDir;
    request.timeoutMs = timeoutMs > 0 ? timeoutMs : config_.execTimeoutMs;

    auto context = std::make_shared<RunContext>(envId);
    {
        std::lock_guard<std::mutex> lock(runsMutex_);
        if (stopping_) {
            return rejected("Service is shutting down");
        }
        // The tree belongs to its provisioning run until that run ends
        if (setups_.count(envId) > 0) {
            return rejected("Environment " + envId + " is being set up. Try again when the setup has finished.");
        }
        executions_.insert(context);
    }

    ExecutionResult result = executor_.run(
        rootPath, request,
        [this](const std::string& line) { output_.publish(line); },
        context.get());

    {
        std::lock_guard<std::mutex> lock(runsMutex_);
        executions_.erase(context);
    }
    return result;
}

std::future<ExecutionResult> EnvironmentService::executeAsync(const std::string& envId,
                                                              const std::string& command,
                                                              const std::string& workingDir,
                                                              long timeoutMs)
{
    try {
        return pool_.submit([this, envId, command, workingDir, timeoutMs] {
            return execute(envId, command, workingDir, timeoutMs);
        });
    } catch (const std::runtime_error& e) {
        std::promise<ExecutionResult> promise;
        promise.set_value(rejected(e.what()));
        return promise.get_future();
    }
}

void EnvironmentService::cancelSetup()
{
    std::lock_guard<std::mutex> lock(runsMutex_);
    for (auto& entry : setups_) {
        log_message("Cancelling setup of " + entry.first);
        entry.second->cancel();
        entry.second->terminateChild();
    }
}

bool EnvironmentService::cancelSetup(const std::string& envId)
{
    std::lock_guard<std::mutex> lock(runsMutex_);
    auto it = setups_.find(envId);
    if (it == setups_.end()) {
        return false;
    }
    log_message("Cancelling setup of " + envId);
    it->second->cancel();
    it->second->terminateChild();
    return true;
}

std::string EnvironmentService::saveArtifactToSharedStorage(const std::string& sourcePath,
                                                            const std::string& fileName)
{
    std::error_code ec;
    if (!fs::is_regular_file(sourcePath, ec)) {
        throw SetupError(ErrorKind::NotFound, "Source file not found: " + sourcePath);
    }
    if (!isSafeName(fileName)) {
        throw SetupError(ErrorKind::InvalidArgument, "Invalid file name: '" + fileName + "'");
    }

    fs::path targetDir = fs::path(config_.sharedStorageDir) / "Rootstock";
    fs::create_directories(targetDir, ec);
    if (ec) {
        throw SetupError(ErrorKind::IoError,
                         "Cannot create " + targetDir.string() + ": " + ec.message());
    }

    fs::path target = targetDir / fileName;
    fs::copy_file(sourcePath, target, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        throw SetupError(ErrorKind::IoError,
                         "Cannot copy " + sourcePath + " to " + target.string() + ": " + ec.message());
    }
    log_message("Saved " + sourcePath + " to " + target.string());
    return target.string();
}

std::string EnvironmentService::toolVersion() const
{
    std::ifstream in(config_.toolVersionFile);
    std::string line;
    if (in && std::getline(in, line) && !trim(line).empty()) {
        return trim(line);
    }
    return "unknown";
}

StorageInfo EnvironmentService::storageInfo() const
{
    StorageInfo info;
    info.provisioningRoot = config_.provisioningRoot;
    info.hostDataDir = config_.hostDataDir;
    info.toolPath = config_.toolPath;
    info.toolPresent = executor_.toolAvailable();
    info.toolVersion = info.toolPresent ? toolVersion() : "";

    const fs::path probe = existingAncestor(config_.provisioningRoot);
    struct statvfs fsStats {};
    if (statvfs(probe.c_str(), &fsStats) == 0) {
        info.freeMb = static_cast<uint64_t>(fsStats.f_bavail) * fsStats.f_frsize / kMegabyte;
        info.totalMb = static_cast<uint64_t>(fsStats.f_blocks) * fsStats.f_frsize / kMegabyte;
    } else {
        log_warning("statvfs failed for " + probe.string());
    }
    return info;
}

std::string EnvironmentService::checkToolVersion()
{
    std::string message;
    if (executor_.toolAvailable()) {
        message = "proot version: " + toolVersion();
    } else {
        message = "proot not found at " + config_.toolPath;
    }

    ProgressEvent event;
    event.message = message;
    event.fraction = -1.0;
    progress_.publish(event);
    return message;
}

void EnvironmentService::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(runsMutex_);
        if (stopping_.exchange(true)) {
            return;
        }
        for (auto& entry : setups_) {
            entry.second->cancel();
            entry.second->terminateChild();
        }
        for (auto& context : executions_) {
            context->cancel();
            context->terminateChild();
        }
    }
    pool_.shutdown();
}

} // namespace Rootstock
