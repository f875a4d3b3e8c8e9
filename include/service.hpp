#ifndef SERVICE_HPP
#define SERVICE_HPP

#include "config.hpp"
#include "event_channel.hpp"
#include "provisioner.hpp"
#include "registry.hpp"
#include "sandbox_executor.hpp"
#include "worker_pool.hpp"

#include <atomic>
#include <cstdint>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace Rootstock {

class RunContext;

/**
 * @brief Storage and tool facts reported by EnvironmentService::storageInfo().
 */
struct StorageInfo
{
    std::string provisioningRoot;
    std::string hostDataDir;
    uint64_t freeMb  = 0;
    uint64_t totalMb = 0;
    std::string toolPath;
    bool toolPresent = false;
    std::string toolVersion;
};

/**
 * @class EnvironmentService
 * @brief The command/result boundary used by front ends.
 *
 * Setups and asynchronous executions run on a bounded worker pool. Each
 * setup gets its own RunContext, so cancelling one environment never
 * touches another.
 */
class EnvironmentService
{
public:
    explicit EnvironmentService(Config config);
    ~EnvironmentService();

    EnvironmentService(const EnvironmentService&) = delete;
    EnvironmentService& operator=(const EnvironmentService&) = delete;

    const Config& config() const { return config_; }

    /**
     * @brief Starts provisioning `envId` with the given distribution.
     *
     * The future yields the Ready environment, or throws SetupError:
     * InvalidArgument for a bad id, Busy if a setup for `envId` is
     * already running, Cancelled, or the kind of the failing step.
     */
    std::future<Environment> installEnvironment(const std::string& distribution,
                                                const std::string& envId);

    bool isInstalled(const std::string& envId) const;

    std::vector<EnvironmentEntry> listEnvironments() const;

    /**
     * @brief Removes the environment's tree. Deleting a missing
     *        environment succeeds.
     * @throws SetupError (InvalidArgument) for a bad id, (Busy) while a
     *         setup for it is running.
     */
    bool deleteEnvironment(const std::string& envId);

    /**
     * @brief Last known state of `envId`, if it exists on disk or was
     *        set up by this process.
     */
    std::optional<Environment> status(const std::string& envId) const;

    /**
     * @brief Runs one shell command inside `envId` on the calling thread.
     *
     * Problems are reported in the result (exit code -1 plus a message),
     * never thrown. `timeoutMs <= 0` selects the configured default.
     * Output lines are also published on output().
     */
    ExecutionResult execute(const std::string& envId,
                            const std::string& command,
                            const std::string& workingDir = "/",
                            long timeoutMs = 0);

    std::future<ExecutionResult> executeAsync(const std::string& envId,
                                              const std::string& command,
                                              const std::string& workingDir = "/",
                                              long timeoutMs = 0);

    /**
     * @brief Cancels every running setup.
     */
    void cancelSetup();

    /**
     * @brief Cancels the running setup of `envId`.
     * @return False if no setup for `envId` was running.
     */
    bool cancelSetup(const std::string& envId);

    /**
     * @brief Copies a file into `<sharedStorageDir>/Rootstock/<fileName>`,
     *        replacing any file already there.
     * @return The destination path.
     * @throws SetupError NotFound if `sourcePath` is not a regular file,
     *         InvalidArgument for a bad file name, IoError if the copy fails.
     */
    std::string saveArtifactToSharedStorage(const std::string& sourcePath,
                                            const std::string& fileName);

    StorageInfo storageInfo() const;

    /**
     * @brief Publishes the sandbox tool's version as an informational
     *        progress event (fraction -1) and returns the message.
     */
    std::string checkToolVersion();

    EventChannel<ProgressEvent>& progress() { return progress_; }
    EventChannel<std::string>& output() { return output_; }

    /**
     * @brief Cancels all setups, kills every supervised process group and
     *        waits for queued work to finish. Called by the destructor.
     */
    void shutdown();

private:
    std::string toolVersion() const;
    void releaseRun(const std::string& envId, const std::shared_ptr<RunContext>& context);

    Config config_;
    EnvironmentRegistry registry_;
    SandboxExecutor executor_;
    Provisioner provisioner_;
    EventChannel<ProgressEvent> progress_;
    EventChannel<std::string> output_;

    std::mutex runsMutex_;
    std::map<std::string, std::shared_ptr<RunContext>> setups_;
    std::set<std::shared_ptr<RunContext>> executions_;
    std::atomic<bool> stopping_{false};

    // Last member: destroyed first, so workers never outlive the state above
    WorkerPool pool_;
};

} // namespace Rootstock

#endif // SERVICE_HPP
