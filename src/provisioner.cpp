#include "provisioner.hpp"
#include "config.hpp"
#include "downloader.hpp"
#include "errors.hpp"
#include "extractor.hpp"
#include "run_context.hpp"
#include "utils.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <utility>

namespace fs = std::filesystem;

namespace Rootstock {

namespace {

    // Progress schedule of one run
    constexpr double kVerifyStart    = 0.03;
    constexpr double kVerifyDone     = 0.06;
    constexpr double kDownloadStart  = 0.10;
    constexpr double kDownloadEnd    = 0.60;
    constexpr double kExtractStart   = 0.62;
    constexpr double kExtractDone    = 0.75;
    constexpr double kConfigureStart = 0.75;
    constexpr double kBootstrapStart = 0.78;
    constexpr double kUpgradeStart   = 0.90;
    constexpr double kReady          = 1.0;

    void checkpoint(const RunContext& context)
    {
        if (context.isCancelled()) {
            throw SetupError(ErrorKind::Cancelled, "Setup cancelled");
        }
    }

} // namespace

// ---------------------------------------------------------------------------
// ProgressReporter
// ---------------------------------------------------------------------------

ProgressReporter::ProgressReporter(std::string environmentId, ProgressSink sink)
    : environmentId_(std::move(environmentId)), sink_(std::move(sink))
{
}

void ProgressReporter::report(const std::string& message, double fraction)
{
    fraction = std::min(1.0, std::max(0.0, fraction));
    last_ = std::max(last_, fraction);
    log_debug("[" + environmentId_ + "] " + message);
    if (!sink_) {
        return;
    }

    ProgressEvent event;
    event.environmentId = environmentId_;
    event.message = message;
    event.fraction = last_;
    try {
        sink_(event);
    } catch (const std::exception& e) {
        log_warning(std::string("Progress subscriber threw: ") + e.what());
    }
}

// ---------------------------------------------------------------------------
// Provisioner
// ---------------------------------------------------------------------------

Provisioner::Provisioner(const Config& config,
                         EnvironmentRegistry& registry,
                         const SandboxExecutor& executor)
    : config_(config), registry_(registry), executor_(executor)
{
}

Environment Provisioner::provision(const std::string& distribution,
                                   const std::string& id,
                                   RunContext& context,
                                   const ProgressSink& progress,
                                   const OutputCallback& output)
{
    const DistributionProfile& profile = config_.distribution(distribution);
    Environment env = registry_.beginRun(id, profile.name);
    ProgressReporter reporter(id, progress);

    log_message("Setting up environment " + id + " (" + profile.name + ") in " + env.rootPath);

    ErrorKind failureKind = ErrorKind::IoError;
    std::string failureMessage;
    try {
        runSteps(env, context, reporter, output);
        registry_.endRun(id);
        log_message("Environment " + id + " is ready.");
        return env;
    } catch (const SetupError& e) {
        failureKind = e.kind();
        failureMessage = e.what();
    } catch (const std::exception& e) {
        // filesystem_error and friends from the steps
        failureMessage = e.what();
    }

    if (context.isCancelled()) {
        failureKind = ErrorKind::Cancelled;
    }
    // A tree from an earlier install is only replaced once extraction starts
    discard(env, env.status >= EnvironmentStatus::Extracting);

    if (failureKind == ErrorKind::Cancelled) {
        log_warning("Setup of " + id + " was cancelled.");
        registry_.transition(id, EnvironmentStatus::Cancelled);
        failureMessage = "Setup cancelled";
    } else {
        log_error("Setup of " + id + " failed [" + errorKindName(failureKind) + "]: " + failureMessage);
        registry_.transition(id, EnvironmentStatus::Error, failureMessage);
    }
    registry_.endRun(id);
    throw SetupError(failureKind, failureMessage);
}

void Provisioner::runSteps(Environment& env,
                           RunContext& context,
                           ProgressReporter& reporter,
                           const OutputCallback& output)
{
    const DistributionProfile& profile = config_.distribution(env.distribution);
    const std::string archivePath = registry_.archivePathFor(env.id);

    // Step 1: the sandbox tool must be there before anything is fetched
    checkpoint(context);
    reporter.report("Checking sandbox tool...", kVerifyStart);
    if (!executor_.toolAvailable()) {
        throw SetupError(ErrorKind::ToolMissing,
                         "Sandbox tool 'proot' not found at " + config_.toolPath +
                         ". Install it there or set tool_path in the configuration.");
    }
    reporter.report("Sandbox tool found", kVerifyDone);

    // Step 2: download
    checkpoint(context);
    env = registry_.transition(env.id, EnvironmentStatus::Downloading);
    const std::vector<std::string> sources = profile.sourcesFor(hostArchitecture());

    DownloadOptions options;
    options.progressStart = kDownloadStart;
    options.progressEnd = kDownloadEnd;

    DownloadResult download = Downloader::downloadWithFallback(
        sources, archivePath, options,
        [&reporter](const std::string& message, double fraction) {
            reporter.report(message, fraction);
        },
        [&reporter](size_t index, size_t count, const std::string& url) {
            log_debug("Source " + std::to_string(index) + "/" + std::to_string(count) + ": " + url);
            reporter.report("Trying source " + std::to_string(index) + "/" + std::to_string(count) + "...",
                            kDownloadStart);
        },
        &context);
    log_message("Downloaded " + std::to_string(download.bytes / 1048576) + " MB from " + download.url);

    // Step 3: extract
    checkpoint(context);
    env = registry_.transition(env.id, EnvironmentStatus::Extracting);
    reporter.report("Extracting root filesystem...", kExtractStart);
    ExtractStats stats = Extractor::extractTarGz(archivePath, env.rootPath);
    if (stats.rejected > 0) {
        log_warning(std::to_string(stats.rejected) + " archive entries pointed outside the environment and were skipped");
    }

    std::error_code ec;
    fs::remove(archivePath, ec);
    if (ec) {
        log_warning("Could not remove " + archivePath + ": " + ec.message());
    }
    reporter.report("Extracted " + std::to_string(stats.files) + " files", kExtractDone);

    // Step 4: network configuration, best effort
    checkpoint(context);
    env = registry_.transition(env.id, EnvironmentStatus::Configuring);
    reporter.report("Configuring network...", kConfigureStart);
    try {
        writeResolverConfig(env.rootPath);
    } catch (const SetupError& e) {
        log_warning(e.what());
        registry_.addWarning(env.id, std::string(errorKindName(e.kind())) + ": " + e.what());
    }

    // Step 5: language runtime
    checkpoint(context);
    env = registry_.transition(env.id, EnvironmentStatus::InstallingRuntime);
    reporter.report("Installing runtime (this can take a while)...", kBootstrapStart);
    runInSandbox(env, profile.bootstrapCommand, "bootstrap", context, output);

    checkpoint(context);
    reporter.report("Upgrading package manager...", kUpgradeStart);
    runInSandbox(env, profile.upgradeCommand, "upgrade", context, output);

    checkpoint(context);
    env = registry_.transition(env.id, EnvironmentStatus::Ready);
    reporter.report("Environment ready", kReady);
}

void Provisioner::runInSandbox(const Environment& env,
                               const std::string& command,
                               const std::string& step,
                               RunContext& context,
                               const OutputCallback& output)
{
    if (trim(command).empty()) {
        log_debug("No " + step + " command configured, skipping");
        return;
    }

    ExecutionRequest request;
    request.environmentId = env.id;
    request.command = command;
    request.workingDir = "/";
    request.timeoutMs = config_.installTimeoutMs;

    ExecutionResult result = executor_.run(env.rootPath, request, output, &context);
    checkpoint(context);

    if (result.exitCode != 0) {
        std::string detail = trim(result.stderrText);
        std::string warning = "The " + step + " command exited with code " +
                              std::to_string(result.exitCode) +
                              (detail.empty() ? "" : ": " + detail);
        log_warning(warning);
        registry_.addWarning(env.id, std::string(errorKindName(ErrorKind::RuntimeInstallFailed)) + ": " + warning);
    }
}

void Provisioner::writeResolverConfig(const std::string& rootPath) const
{
    fs::path etcDir = fs::path(rootPath) / "etc";
    fs::path resolvConf = etcDir / "resolv.conf";

    std::error_code ec;
    fs::create_directories(etcDir, ec);

    // Rootfs tarballs often ship resolv.conf as a link to a host-managed file
    fs::remove(resolvConf, ec);

    std::ofstream out(resolvConf, std::ios::trunc);
    if (!out) {
        throw SetupError(ErrorKind::ConfigurationFailed,
                         "Cannot write " + resolvConf.string());
    }
    for (const auto& server : config_.nameservers) {
        out << "nameserver " << server << "\n";
    }
    out.close();
    if (out.fail()) {
        throw SetupError(ErrorKind::ConfigurationFailed,
                         "Write error on " + resolvConf.string());
    }
}

void Provisioner::discard(const Environment& env, bool removeTree) const
{
    std::error_code ec;
    fs::remove(registry_.archivePathFor(env.id), ec);
    if (ec) {
        log_warning("Could not remove download artifact: " + ec.message());
    }
    if (!removeTree) {
        return;
    }
    fs::remove_all(env.rootPath, ec);
    if (ec) {
        log_warning("Could not remove partial environment " + env.rootPath + ": " + ec.message());
    }
}

} // namespace Rootstock
