#include "sandbox_executor.hpp"
#include "config.hpp"
#include "run_context.hpp"
#include "utils.hpp"

#include <atomic>
#include <filesystem>
#include <future>
#include <thread>
#include <utility>

// Required Linux/Unix Headers
#include <cerrno>
#include <csignal>
#include <cstring>     // strerror
#include <fcntl.h>     // O_CLOEXEC, open
#include <poll.h>
#include <sys/types.h> // pid_t
#include <sys/wait.h>  // waitpid, waitid
#include <unistd.h>    // fork, execve, pipe2, _exit

namespace fs = std::filesystem;

namespace Rootstock {

namespace {

    const char* kShellCandidates[] = {"/bin/bash", "/usr/bin/bash", "/bin/sh"};
    const char* kFallbackShell = "/bin/sh";
    const char* kSandboxPath = "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";

    // How often the supervisor checks whether the child has exited.
    constexpr auto kWaitPollInterval = std::chrono::milliseconds(10);

    // poll() timeout for readers, bounds how long abandoning them takes.
    constexpr int kReaderPollMs = 100;

    /**
     * One end of the child's output: accumulated text plus the live
     * subscriber it forwards lines to.
     */
    struct StreamReader
    {
        int fd = -1;
        std::string prefix;
        const OutputCallback* output = nullptr;
        std::string collected;
        std::atomic<bool> abandon{false};
        std::promise<void> finished;
    };

    void emitLine(StreamReader& reader, std::string line)
    {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        reader.collected += line;
        reader.collected += '\n';

        if (reader.output && *reader.output) {
            try {
                (*reader.output)(reader.prefix + line);
            } catch (const std::exception& e) {
                log_warning(std::string("Output subscriber threw: ") + e.what());
            }
        }
    }

    void drainStream(StreamReader& reader)
    {
        std::string pending;
        char buffer[4096];

        while (!reader.abandon.load()) {
            struct pollfd pfd {};
            pfd.fd = reader.fd;
            pfd.events = POLLIN;

            int rc = poll(&pfd, 1, kReaderPollMs);
            if (rc < 0) {
                if (errno == EINTR) {
                    continue;
                }
                break;
            }
            if (rc == 0) {
                continue;
            }

            ssize_t n = read(reader.fd, buffer, sizeof(buffer));
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN) {
                    continue;
                }
                break;
            }
            if (n == 0) {
                break; // EOF: every writer closed its end
            }

            pending.append(buffer, static_cast<size_t>(n));
            size_t pos;
            while ((pos = pending.find('\n')) != std::string::npos) {
                emitLine(reader, pending.substr(0, pos));
                pending.erase(0, pos + 1);
            }
        }

        if (!pending.empty()) {
            emitLine(reader, pending);
        }
        reader.finished.set_value();
    }

    void closeFd(int& fd)
    {
        if (fd >= 0) {
            close(fd);
            fd = -1;
        }
    }

    struct Pipe
    {
        int fds[2] = {-1, -1};
        ~Pipe()
        {
            closeFd(fds[0]);
            closeFd(fds[1]);
        }
    };

    int decodeStatus(int status)
    {
        if (WIFEXITED(status)) {
            return WEXITSTATUS(status);
        }
        if (WIFSIGNALED(status)) {
            return 128 + WTERMSIG(status);
        }
        return -1;
    }

    ExecutionResult failure(const std::string& message,
                            std::chrono::steady_clock::time_point start)
    {
        ExecutionResult result;
        result.exitCode = -1;
        result.stderrText = message;
        result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        return result;
    }

} // namespace

SandboxExecutor::SandboxExecutor(SandboxSettings settings)
    : settings_(std::move(settings))
{
}

SandboxExecutor::SandboxExecutor(const Config& config)
{
    settings_.toolPath      = config.toolPath;
    settings_.hostDataDir   = config.hostDataDir;
    settings_.hostDataMount = config.hostDataMount;
    settings_.kernelRelease = config.kernelRelease;
    settings_.loader        = config.loader;
    settings_.readerGraceMs = config.readerGraceMs;
}

bool SandboxExecutor::toolAvailable() const
{
    std::error_code ec;
    return !settings_.toolPath.empty() && fs::exists(settings_.toolPath, ec);
}

std::string SandboxExecutor::resolveShell(const std::string& rootPath)
{
    for (const char* candidate : kShellCandidates) {
        std::error_code ec;
        // Absolute links (bin/sh -> /bin/busybox) only resolve inside the sandbox
        fs::path onHost = fs::path(rootPath) / (candidate + 1);
        if (fs::exists(fs::symlink_status(onHost, ec))) {
            return candidate;
        }
    }
    return kFallbackShell;
}

Invocation SandboxExecutor::buildInvocation(const std::string& rootPath,
                                            const std::string& workingDir,
                                            const std::string& command) const
{
    Invocation inv;
    const std::string cwd = workingDir.empty() ? "/" : workingDir;

    // -k: fake kernel release, keeps proot away from seccomp probes that crash
    // --link2symlink: hard links become symlinks where link(2) is refused
    inv.argv = {
        settings_.toolPath,
        "--kill-on-exit",
        "-k", settings_.kernelRelease,
        "--link2symlink",
        "-r", rootPath,
        "-w", cwd,
        "-b", "/dev",
        "-b", "/proc",
        "-b", "/sys",
    };
    if (!settings_.hostDataDir.empty()) {
        inv.argv.push_back("-b");
        inv.argv.push_back(settings_.hostDataDir + ":" + settings_.hostDataMount);
    }
    inv.argv.push_back("-0");
    inv.argv.push_back(resolveShell(rootPath));
    inv.argv.push_back("-c");
    inv.argv.push_back(command);

    inv.env = {
        "HOME=/root",
        std::string("PATH=") + kSandboxPath,
        "LANG=C.UTF-8",
        "TERM=xterm-256color",
        "PROOT_TMP_DIR=" + (fs::path(rootPath) / "tmp").string(),
        "PYTHONDONTWRITEBYTECODE=1",
        "PIP_NO_CACHE_DIR=off",
        "PROOT_NO_SECCOMP=1",
    };
    if (!settings_.loader.empty()) {
        inv.env.push_back("PROOT_LOADER=" + settings_.loader);
    }
    return inv;
}

ExecutionResult SandboxExecutor::run(const std::string& rootPath,
                                     const ExecutionRequest& request,
                                     const OutputCallback& output,
                                     RunContext* context) const
{
    const auto start = std::chrono::steady_clock::now();

    if (!toolAvailable()) {
        return failure("Sandbox tool not found at " + settings_.toolPath +
                       ". Install proot there or set tool_path in the configuration.", start);
    }

    std::error_code ec;
    fs::create_directories(fs::path(rootPath) / "tmp", ec);
    if (!settings_.hostDataDir.empty()) {
        fs::create_directories(settings_.hostDataDir, ec);
    }

    Invocation inv = buildInvocation(rootPath, request.workingDir, request.command);
    log_debug("Running in " + rootPath + ": " + request.command);

    // Everything the child touches is prepared before fork()
    std::vector<char*> argv;
    for (auto& arg : inv.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<char*> envp;
    for (auto& var : inv.env) {
        envp.push_back(const_cast<char*>(var.c_str()));
    }
    envp.push_back(nullptr);

    const char* childDir = settings_.hostDataDir.empty() ? "/" : settings_.hostDataDir.c_str();

    Pipe outPipe, errPipe, execPipe;
    if (pipe2(outPipe.fds, O_CLOEXEC) != 0 ||
        pipe2(errPipe.fds, O_CLOEXEC) != 0 ||
        pipe2(execPipe.fds, O_CLOEXEC) != 0) {
        return failure(std::string("Failed to create pipes: ") + std::strerror(errno), start);
    }

    pid_t pid = fork();
    if (pid < 0) {
        return failure(std::string("Fork failed: ") + std::strerror(errno), start);
    }

    // --- Child Process ---
    if (pid == 0) {
        setpgid(0, 0);
        int devNull = open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (devNull >= 0) {
            dup2(devNull, STDIN_FILENO);
        }
        dup2(outPipe.fds[1], STDOUT_FILENO);
        dup2(errPipe.fds[1], STDERR_FILENO);

        int err = 0;
        if (chdir(childDir) != 0) {
            err = errno;
        } else {
            execve(argv[0], argv.data(), envp.data());
            err = errno;
        }
        ssize_t ignored = write(execPipe.fds[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // --- Parent Process ---
    setpgid(pid, pid); // also done by the child; whichever runs first wins
    closeFd(outPipe.fds[1]);
    closeFd(errPipe.fds[1]);
    closeFd(execPipe.fds[1]);

    int execErrno = 0;
    ssize_t n;
    do {
        n = read(execPipe.fds[0], &execErrno, sizeof(execErrno));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(execErrno))) {
        int status = 0;
        waitpid(pid, &status, 0);
        return failure("Failed to start " + settings_.toolPath + ": " + std::strerror(execErrno), start);
    }

    RunContext localContext(request.environmentId);
    RunContext& ctx = context ? *context : localContext;
    ctx.attachChild(pid);

    StreamReader outReader;
    outReader.fd = outPipe.fds[0];
    outReader.output = &output;

    StreamReader errReader;
    errReader.fd = errPipe.fds[0];
    errReader.prefix = "[err] ";
    errReader.output = &output;

    std::future<void> outDone = outReader.finished.get_future();
    std::future<void> errDone = errReader.finished.get_future();
    std::thread outThread(drainStream, std::ref(outReader));
    std::thread errThread(drainStream, std::ref(errReader));

    // Wait for exit without reaping, so the context never holds a stale pid
    const auto deadline = start + std::chrono::milliseconds(request.timeoutMs);
    bool exited = false;
    bool killedOnCancel = false;
    while (true) {
        // A cancel that raced with fork() never saw the child attached
        if (!killedOnCancel && ctx.isCancelled()) {
            killedOnCancel = ctx.terminateChild();
        }
        siginfo_t info {};
        int rc = waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT);
        if (rc == 0 && info.si_pid == pid) {
            exited = true;
            break;
        }
        if (rc != 0 && errno != EINTR) {
            log_warning(std::string("waitid failed: ") + std::strerror(errno));
            exited = true;
            break;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            break;
        }
        std::this_thread::sleep_for(kWaitPollInterval);
    }

    if (!exited) {
        log_warning("Command timed out after " + std::to_string(request.timeoutMs) +
                    "ms, killing process group " + std::to_string(pid));
        ctx.terminateChild();
    }
    ctx.detachChild();

    int status = 0;
    pid_t waited;
    do {
        waited = waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);

    // Bounded grace for the readers, whichever way the process ended
    const auto graceDeadline = std::chrono::steady_clock::now() +
                               std::chrono::milliseconds(settings_.readerGraceMs);
    outDone.wait_until(graceDeadline);
    errDone.wait_until(graceDeadline);
    outReader.abandon.store(true);
    errReader.abandon.store(true);
    outThread.join();
    errThread.join();

    ExecutionResult result;
    result.stdoutText = std::move(outReader.collected);
    result.stderrText = std::move(errReader.collected);

    if (!exited) {
        result.exitCode = -1;
        result.timedOut = true;
        result.stderrText += "Timed out after " + std::to_string(request.timeoutMs) + "ms";
    } else if (waited == pid) {
        result.exitCode = decodeStatus(status);
    } else {
        result.exitCode = -1;
        result.stderrText += "Lost track of sandbox process " + std::to_string(pid);
    }

    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    log_debug("Command finished with exit code " + std::to_string(result.exitCode) +
              " in " + std::to_string(result.elapsed.count()) + "ms");
    return result;
}

} // namespace Rootstock
