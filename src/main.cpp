#include <chrono>
#include <csignal>
#include <ctime>
#include <future>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include "config.hpp"
#include "errors.hpp"
#include "service.hpp"
#include "utils.hpp"

namespace {

volatile std::sig_atomic_t interrupted = 0;

void onInterrupt(int)
{
    interrupted = 1;
}

void printHelp()
{
    std::cout << "Rootstock\n"
              << "Usage: rootstock [--config FILE] [--verbose] command\n\n"
              << "Rootstock provisions Linux root filesystems under an unprivileged\n"
              << "account and runs commands inside them through proot.\n\n"
              << "Commands:\n"
              << "  install <distro> <id>             Download and set up an environment\n"
              << "  exec <id> [--cwd DIR] [--timeout MS] <command...>\n"
              << "                                    Run a shell command inside an environment\n"
              << "  list                              List environments\n"
              << "  status <id>                       Show the state of one environment\n"
              << "  delete <id>                       Delete an environment\n"
              << "  export <file> <name>              Copy a file to shared storage\n"
              << "  info                              Show storage and tool information\n"
              << "  config [--save FILE]              Print or save the effective configuration\n"
              << "  help                              Show this message\n";
}

std::string formatTime(std::chrono::system_clock::time_point when)
{
    std::time_t t = std::chrono::system_clock::to_time_t(when);
    std::tm local {};
    localtime_r(&t, &local);
    std::ostringstream out;
    out << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return out.str();
}

std::string lastLine(const std::string& text)
{
    std::string trimmed = Rootstock::trim(text);
    size_t pos = trimmed.find_last_of('\n');
    return pos == std::string::npos ? trimmed : trimmed.substr(pos + 1);
}

// Waits for `future`, running `onInterrupt` once if Ctrl-C is pressed meanwhile.
template <typename T, typename Fn>
T waitInterruptible(std::future<T>& future, Fn onInterrupt)
{
    bool handled = false;
    while (future.wait_for(std::chrono::milliseconds(200)) != std::future_status::ready) {
        if (interrupted && !handled) {
            handled = true;
            onInterrupt();
        }
    }
    return future.get();
}

int runInstall(Rootstock::EnvironmentService& service, const std::string& distro, const std::string& id)
{
    auto subscription = service.progress().subscribe([](const Rootstock::ProgressEvent& event) {
        if (event.fraction < 0) {
            Rootstock::log_message(event.message);
            return;
        }
        std::ostringstream line;
        line << "[" << std::setw(3) << static_cast<int>(event.fraction * 100 + 0.5) << "%] "
             << event.message;
        std::cout << line.str() << std::endl;
    });
    auto outputSubscription = service.output().subscribe([](const std::string& line) {
        Rootstock::log_debug(line);
    });
    service.checkToolVersion();

    std::future<Rootstock::Environment> pending = service.installEnvironment(distro, id);
    Rootstock::Environment env = waitInterruptible(pending, [&service, &id] {
        Rootstock::log_warning("Interrupted, cancelling setup of " + id + "...");
        service.cancelSetup(id);
    });

    service.progress().unsubscribe(subscription);
    service.output().unsubscribe(outputSubscription);

    for (const auto& warning : env.warnings) {
        Rootstock::log_warning(warning);
    }
    std::cout << "Environment " << env.id << " is ready at " << env.rootPath << std::endl;
    return 0;
}

int runExec(Rootstock::EnvironmentService& service, int argc, char* argv[], int first)
{
    std::string cwd = "/";
    long timeoutMs = 0;
    std::string id;
    std::vector<std::string> words;

    for (int i = first; i < argc; i++) {
        std::string arg = argv[i];
        if (id.empty()) {
            id = arg;
        }
        else if (words.empty() && arg == "--cwd") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --cwd requires a directory argument.\n";
                return 1;
            }
            cwd = argv[++i];
        }
        else if (words.empty() && arg == "--timeout") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --timeout requires a value in milliseconds.\n";
                return 1;
            }
            try {
                timeoutMs = std::stol(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: invalid timeout '" << argv[i] << "'.\n";
                return 1;
            }
        }
        else {
            words.push_back(arg);
        }
    }

    if (id.empty() || words.empty()) {
        std::cerr << "Usage: rootstock exec <id> [--cwd DIR] [--timeout MS] <command...>\n";
        return 1;
    }

    auto subscription = service.output().subscribe([](const std::string& line) {
        static const std::string errPrefix = "[err] ";
        if (line.compare(0, errPrefix.size(), errPrefix) == 0) {
            std::cerr << line.substr(errPrefix.size()) << std::endl;
        } else {
            std::cout << line << std::endl;
        }
    });

    std::future<Rootstock::ExecutionResult> pending =
        service.executeAsync(id, Rootstock::join(words, " "), cwd, timeoutMs);
    Rootstock::ExecutionResult result = waitInterruptible(pending, [&service] {
        Rootstock::log_warning("Interrupted, stopping command...");
        service.shutdown();
    });
    service.output().unsubscribe(subscription);

    Rootstock::log_debug("Finished in " + std::to_string(result.elapsed.count()) + "ms");
    if (result.timedOut) {
        Rootstock::log_error(std::string("[") + Rootstock::errorKindName(Rootstock::ErrorKind::ExecutionTimeout) +
                             "] " + lastLine(result.stderrText));
        return 1;
    }
    if (result.exitCode < 0) {
        Rootstock::log_error(lastLine(result.stderrText));
        return 1;
    }
    return result.exitCode;
}

int runStatus(Rootstock::EnvironmentService& service, const std::string& id)
{
    std::optional<Rootstock::Environment> env = service.status(id);
    if (!env) {
        std::cerr << "Environment " << id << " does not exist.\n";
        return 1;
    }

    std::cout << "Id:           " << env->id << "\n"
              << "Path:         " << env->rootPath << "\n"
              << "Status:       " << Rootstock::environmentStatusName(env->status) << "\n";
    if (!env->distribution.empty()) {
        std::cout << "Distribution: " << env->distribution << "\n";
    }
    if (env->installedAt) {
        std::cout << "Installed at: " << formatTime(*env->installedAt) << "\n";
    }
    if (!env->errorMessage.empty()) {
        std::cout << "Error:        " << env->errorMessage << "\n";
    }
    for (const auto& warning : env->warnings) {
        std::cout << "Warning:      " << warning << "\n";
    }
    return 0;
}

} // namespace

int main(int argc, char* argv[])
{
    std::string configPath;
    bool verbose = false;

    // Global options come before the command
    int index = 1;
    for (; index < argc; index++) {
        std::string arg = argv[index];
        if (arg == "--config") {
            if (index + 1 >= argc) {
                std::cerr << "Error: --config requires a file argument.\n";
                return 1;
            }
            configPath = argv[++index];
        }
        else if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        }
        else {
            break;
        }
    }

    // If no command is supplied, show the help message
    if (index >= argc) {
        printHelp();
        return 0;
    }

    std::string command = argv[index++];
    if (command == "help" || command == "--help" || command == "-h") {
        printHelp();
        return 0;
    }

    try {
        Rootstock::Config config = Rootstock::Config::loadFromFile(Rootstock::Config::resolvePath(configPath));
        Rootstock::set_verbose(verbose || config.verbose);

        // -------------------------------------------------------------
        // Config Command
        // -------------------------------------------------------------
        if (command == "config") {
            if (index < argc && std::string(argv[index]) == "--save") {
                if (argc - index != 2) {
                    std::cerr << "Usage: rootstock config [--save FILE]\n";
                    return 1;
                }
                config.saveToFile(argv[index + 1]);
                std::cout << "Configuration written to " << argv[index + 1] << std::endl;
                return 0;
            }
            config.print();
            return 0;
        }

        std::signal(SIGINT, onInterrupt);
        Rootstock::EnvironmentService service(config);

        // -------------------------------------------------------------
        // Install Command
        // -------------------------------------------------------------
        if (command == "install") {
            if (argc - index != 2) {
                std::cerr << "Usage: rootstock install <alpine|ubuntu> <id>\n";
                return 1;
            }
            return runInstall(service, argv[index], argv[index + 1]);
        }
        // -------------------------------------------------------------
        // Exec Command
        // -------------------------------------------------------------
        else if (command == "exec") {
            return runExec(service, argc, argv, index);
        }
        // -------------------------------------------------------------
        // List Command
        // -------------------------------------------------------------
        else if (command == "list") {
            std::vector<Rootstock::EnvironmentEntry> entries = service.listEnvironments();
            if (entries.empty()) {
                std::cout << "No environments in " << config.provisioningRoot << std::endl;
                return 0;
            }
            for (const auto& entry : entries) {
                std::cout << std::left << std::setw(24) << entry.id
                          << (entry.exists ? "installed  " : "incomplete ")
                          << entry.path << "\n";
            }
        }
        // -------------------------------------------------------------
        // Status Command
        // -------------------------------------------------------------
        else if (command == "status") {
            if (argc - index != 1) {
                std::cerr << "Usage: rootstock status <id>\n";
                return 1;
            }
            return runStatus(service, argv[index]);
        }
        // -------------------------------------------------------------
        // Delete Command
        // -------------------------------------------------------------
        else if (command == "delete") {
            if (argc - index != 1) {
                std::cerr << "Usage: rootstock delete <id>\n";
                return 1;
            }
            return service.deleteEnvironment(argv[index]) ? 0 : 1;
        }
        // -------------------------------------------------------------
        // Export Command
        // -------------------------------------------------------------
        else if (command == "export") {
            if (argc - index != 2) {
                std::cerr << "Usage: rootstock export <file> <name>\n";
                return 1;
            }
            std::cout << service.saveArtifactToSharedStorage(argv[index], argv[index + 1]) << std::endl;
        }
        // -------------------------------------------------------------
        // Info Command
        // -------------------------------------------------------------
        else if (command == "info") {
            Rootstock::StorageInfo info = service.storageInfo();
            std::cout << "Provisioning root: " << info.provisioningRoot << "\n"
                      << "Host data dir:     " << info.hostDataDir << "\n"
                      << "Free space:        " << info.freeMb << " MB of " << info.totalMb << " MB\n"
                      << "Sandbox tool:      " << info.toolPath
                      << (info.toolPresent ? "" : " (missing)") << "\n";
            if (info.toolPresent) {
                std::cout << "Tool version:      " << info.toolVersion << "\n";
            }
        }
        // -------------------------------------------------------------
        // Unknown Command
        // -------------------------------------------------------------
        else {
            std::cerr << "Unknown command: " << command << "\n";
            printHelp();
            return 1;
        }
    }
    catch (const Rootstock::SetupError& e) {
        Rootstock::log_error(std::string("[") + Rootstock::errorKindName(e.kind()) + "] " + e.what());
        return 1;
    }
    catch (const std::exception& e) {
        Rootstock::log_error(e.what());
        return 1;
    }

    return 0;
}
