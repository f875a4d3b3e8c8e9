#ifndef SANDBOX_EXECUTOR_HPP
#define SANDBOX_EXECUTOR_HPP

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace Rootstock {

class Config;
class RunContext;

/**
 * @brief A shell command to run inside an environment.
 */
struct ExecutionRequest
{
    std::string environmentId;
    std::string command;
    std::string workingDir = "/";
    long timeoutMs         = 300000;
};

/**
 * @brief Captured outcome of one sandboxed command.
 *
 * exitCode is -1 when the tool is missing, the process could not be
 * started, or the timeout elapsed; the text in stderrText says which.
 */
struct ExecutionResult
{
    std::string stdoutText;
    std::string stderrText;
    int exitCode = -1;
    std::chrono::milliseconds elapsed{0};
    bool timedOut = false;
};

/**
 * @brief Receives each output line as it is read. stderr lines carry an
 *        "[err] " prefix. Called from reader threads.
 */
using OutputCallback = std::function<void(const std::string&)>;

/**
 * @brief The parts of the configuration the executor depends on.
 */
struct SandboxSettings
{
    std::string toolPath;
    std::string hostDataDir;
    std::string hostDataMount = "/data_internal";
    std::string kernelRelease = "4.14.111";
    std::string loader;
    long readerGraceMs = 3000;
};

/**
 * @brief argv and envp for one tool invocation.
 */
struct Invocation
{
    std::vector<std::string> argv;
    std::vector<std::string> env;
};

/**
 * @class SandboxExecutor
 * @brief Runs shell commands inside an extracted rootfs through proot.
 *
 * Every call spawns one proot process in its own process group, drains
 * its stdout and stderr on two reader threads, and enforces a wall-clock
 * timeout by killing the whole group.
 */
class SandboxExecutor
{
public:
    explicit SandboxExecutor(SandboxSettings settings);
    explicit SandboxExecutor(const Config& config);

    const SandboxSettings& settings() const { return settings_; }

    /**
     * @brief True if the sandbox tool binary exists.
     */
    bool toolAvailable() const;

    /**
     * @brief Picks the shell to run inside `rootPath`: /bin/bash,
     *        /usr/bin/bash, /bin/sh, in that order; /bin/sh if none exist.
     */
    static std::string resolveShell(const std::string& rootPath);

    /**
     * @brief Builds the proot command line and the child environment.
     *
     * @param rootPath   Host path of the rootfs.
     * @param workingDir Working directory inside the sandbox.
     * @param command    Shell command passed to `<shell> -c`.
     */
    Invocation buildInvocation(const std::string& rootPath,
                               const std::string& workingDir,
                               const std::string& command) const;

    /**
     * @brief Executes `request.command` inside `rootPath`.
     *
     * Never throws for process-level failures: a missing tool, a failed
     * spawn and a timeout are all reported through the result.
     *
     * @param rootPath Host path of the environment's rootfs.
     * @param request  Command, working directory and timeout.
     * @param output   Optional live-output subscriber.
     * @param context  Optional run context that records the child's
     *                 process group while it runs.
     */
    ExecutionResult run(const std::string& rootPath,
                        const ExecutionRequest& request,
                        const OutputCallback& output = nullptr,
                        RunContext* context = nullptr) const;

private:
    SandboxSettings settings_;
};

} // namespace Rootstock

#endif // SANDBOX_EXECUTOR_HPP
