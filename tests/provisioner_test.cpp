#include "errors.hpp"
#include "provisioner.hpp"
#include "registry.hpp"
#include "run_context.hpp"
#include "sandbox_executor.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <filesystem>

namespace fs = std::filesystem;
using namespace Rootstock;
using namespace Rootstock::Testing;

namespace {

class ProvisionerTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        config_ = testConfig(dir_);
        writeTarGz((dir_ / "mirror/rootfs.tar.gz").string(), minimalRootfs());
        setSources({fileUrl(dir_ / "mirror/missing.tar.gz"), fileUrl(dir_ / "mirror/rootfs.tar.gz")});
    }

    void setSources(const std::vector<std::string>& urls)
    {
        DistributionProfile& profile = config_.distributions["testdistro"];
        profile.sources["aarch64"] = urls;
        profile.sources["x86_64"] = urls;
    }

    ErrorKind provisionExpectingFailure(const std::string& id, RunContext& context,
                                        const ProgressSink& progress = nullptr)
    {
        EnvironmentRegistry registry(config_.provisioningRoot);
        SandboxExecutor executor(config_);
        Provisioner provisioner(config_, registry, executor);
        try {
            provisioner.provision("testdistro", id, context, progress);
        } catch (const SetupError& e) {
            lastStatus_ = registry.find(id);
            return e.kind();
        }
        ADD_FAILURE() << "provisioning unexpectedly succeeded";
        return ErrorKind::IoError;
    }

    fs::path envPath(const std::string& id) const { return fs::path(config_.provisioningRoot) / id; }
    fs::path archivePath(const std::string& id) const
    {
        return fs::path(config_.provisioningRoot) / ("rootfs_" + id + ".tar.gz");
    }

    TempDir dir_;
    Config config_;
    std::optional<Environment> lastStatus_;
};

} // namespace

TEST_F(ProvisionerTest, ProvisionsAReadyEnvironment)
{
    EnvironmentRegistry registry(config_.provisioningRoot);
    SandboxExecutor executor(config_);
    Provisioner provisioner(config_, registry, executor);
    RunContext context("dev");

    std::vector<ProgressEvent> events;
    std::vector<std::string> output;
    Environment env = provisioner.provision(
        "testdistro", "dev", context,
        [&events](const ProgressEvent& e) { events.push_back(e); },
        [&output](const std::string& line) { output.push_back(line); });

    EXPECT_EQ(env.status, EnvironmentStatus::Ready);
    EXPECT_EQ(env.distribution, "testdistro");
    EXPECT_TRUE(env.installedAt.has_value());
    EXPECT_TRUE(env.warnings.empty());
    EXPECT_EQ(env.rootPath, envPath("dev").string());

    EXPECT_TRUE(registry.exists("dev"));
    EXPECT_FALSE(registry.isRunning("dev"));
    EXPECT_FALSE(fs::exists(archivePath("dev")));
    EXPECT_EQ(readFile(envPath("dev") / "etc/resolv.conf"), "nameserver 9.9.9.9\n");
    EXPECT_NE(std::find(output.begin(), output.end(), "bootstrap-ran"), output.end());

    ASSERT_FALSE(events.empty());
    for (size_t i = 1; i < events.size(); ++i) {
        EXPECT_GE(events[i].fraction, events[i - 1].fraction) << events[i].message;
    }
    EXPECT_DOUBLE_EQ(events.back().fraction, 1.0);
    EXPECT_EQ(events.front().environmentId, "dev");

    auto hasMessage = [&events](const std::string& text) {
        return std::any_of(events.begin(), events.end(),
                           [&text](const ProgressEvent& e) { return e.message.find(text) != std::string::npos; });
    };
    EXPECT_TRUE(hasMessage("Trying source 1/2"));
    EXPECT_TRUE(hasMessage("Trying source 2/2"));
    EXPECT_TRUE(hasMessage("Extracting"));
}

TEST_F(ProvisionerTest, FailingRuntimeInstallIsOnlyAWarning)
{
    config_.distributions["testdistro"].upgradeCommand = "echo no network 1>&2; exit 3";
    EnvironmentRegistry registry(config_.provisioningRoot);
    SandboxExecutor executor(config_);
    Provisioner provisioner(config_, registry, executor);
    RunContext context("dev");

    Environment env = provisioner.provision("testdistro", "dev", context);

    EXPECT_EQ(env.status, EnvironmentStatus::Ready);
    ASSERT_EQ(env.warnings.size(), 1u);
    EXPECT_NE(env.warnings[0].find("RUNTIME_INSTALL_FAILED"), std::string::npos);
    EXPECT_NE(env.warnings[0].find("code 3"), std::string::npos);
}

TEST_F(ProvisionerTest, MissingToolFailsBeforeDownloading)
{
    config_.toolPath = (dir_ / "no-proot").string();
    RunContext context("dev");

    EXPECT_EQ(provisionExpectingFailure("dev", context), ErrorKind::ToolMissing);
    EXPECT_FALSE(fs::exists(archivePath("dev")));
    EXPECT_FALSE(fs::exists(envPath("dev")));
    ASSERT_TRUE(lastStatus_.has_value());
    EXPECT_EQ(lastStatus_->status, EnvironmentStatus::Error);
    EXPECT_NE(lastStatus_->errorMessage.find("no-proot"), std::string::npos);
}

TEST_F(ProvisionerTest, FailedReinstallKeepsTheInstalledTree)
{
    {
        EnvironmentRegistry registry(config_.provisioningRoot);
        SandboxExecutor executor(config_);
        Provisioner provisioner(config_, registry, executor);
        RunContext context("dev");
        provisioner.provision("testdistro", "dev", context);
    }
    ASSERT_TRUE(fs::exists(envPath("dev") / "bin/sh"));

    config_.toolPath = (dir_ / "no-proot").string();
    RunContext missingTool("dev");
    EXPECT_EQ(provisionExpectingFailure("dev", missingTool), ErrorKind::ToolMissing);
    EXPECT_TRUE(fs::exists(envPath("dev") / "bin/sh"));

    config_.toolPath = ROOTSTOCK_FAKE_PROOT;
    setSources({fileUrl(dir_ / "offline-1"), fileUrl(dir_ / "offline-2")});
    RunContext offline("dev");
    EXPECT_EQ(provisionExpectingFailure("dev", offline), ErrorKind::DownloadFailed);
    EXPECT_TRUE(fs::exists(envPath("dev") / "bin/sh"));
    EXPECT_FALSE(fs::exists(archivePath("dev")));
}

TEST_F(ProvisionerTest, ExhaustedSourcesLeaveNothingBehind)
{
    setSources({fileUrl(dir_ / "nope-1"), fileUrl(dir_ / "nope-2")});
    RunContext context("dev");

    EXPECT_EQ(provisionExpectingFailure("dev", context), ErrorKind::DownloadFailed);
    EXPECT_FALSE(fs::exists(archivePath("dev")));
    EXPECT_FALSE(fs::exists(envPath("dev")));
    ASSERT_TRUE(lastStatus_.has_value());
    EXPECT_EQ(lastStatus_->status, EnvironmentStatus::Error);
}

TEST_F(ProvisionerTest, CorruptArchiveFailsExtraction)
{
    writeFile(dir_ / "mirror/rootfs.tar.gz", "this is not gzip");
    RunContext context("dev");

    EXPECT_EQ(provisionExpectingFailure("dev", context), ErrorKind::ExtractionFailed);
    EXPECT_FALSE(fs::exists(envPath("dev")));
    EXPECT_FALSE(fs::exists(archivePath("dev")));
}

TEST_F(ProvisionerTest, CancelDuringDownloadReportsCancelled)
{
    RunContext context("dev");
    ProgressSink cancelOnDownload = [&context](const ProgressEvent& e) {
        if (e.message.rfind("Downloading", 0) == 0) {
            context.cancel();
        }
    };

    EXPECT_EQ(provisionExpectingFailure("dev", context, cancelOnDownload), ErrorKind::Cancelled);
    EXPECT_FALSE(fs::exists(archivePath("dev")));
    EXPECT_FALSE(fs::exists(envPath("dev")));
    ASSERT_TRUE(lastStatus_.has_value());
    EXPECT_EQ(lastStatus_->status, EnvironmentStatus::Cancelled);
    EXPECT_TRUE(lastStatus_->errorMessage.empty());
}

TEST_F(ProvisionerTest, CancelDuringBootstrapKillsTheCommand)
{
    config_.distributions["testdistro"].bootstrapCommand = "sleep 30";
    RunContext context("dev");
    ProgressSink cancelOnInstall = [&context](const ProgressEvent& e) {
        if (e.message.rfind("Installing runtime", 0) == 0) {
            context.cancel();
        }
    };

    const auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(provisionExpectingFailure("dev", context, cancelOnInstall), ErrorKind::Cancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));
    EXPECT_FALSE(fs::exists(envPath("dev")));
}

TEST_F(ProvisionerTest, ActiveRunMakesSecondRequestBusy)
{
    writeFile(envPath("dev") / "bin/sh", "");
    EnvironmentRegistry registry(config_.provisioningRoot);
    SandboxExecutor executor(config_);
    Provisioner provisioner(config_, registry, executor);
    registry.beginRun("dev", "testdistro");

    RunContext context("dev");
    try {
        provisioner.provision("testdistro", "dev", context);
        FAIL() << "expected Busy";
    } catch (const SetupError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Busy);
    }
    // The running setup's tree is untouched
    EXPECT_TRUE(fs::exists(envPath("dev") / "bin/sh"));
}

TEST_F(ProvisionerTest, InvalidIdIsRejected)
{
    RunContext context("../escape");
    EnvironmentRegistry registry(config_.provisioningRoot);
    SandboxExecutor executor(config_);
    Provisioner provisioner(config_, registry, executor);

    try {
        provisioner.provision("testdistro", "../escape", context);
        FAIL() << "expected InvalidArgument";
    } catch (const SetupError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidArgument);
    }
}

TEST_F(ProvisionerTest, ResolverConfigReplacesALink)
{
    EnvironmentRegistry registry(config_.provisioningRoot);
    SandboxExecutor executor(config_);
    Provisioner provisioner(config_, registry, executor);

    fs::create_directories(envPath("dev") / "etc");
    fs::create_symlink("/run/systemd/resolve/stub-resolv.conf", envPath("dev") / "etc/resolv.conf");
    provisioner.writeResolverConfig(envPath("dev").string());

    EXPECT_FALSE(fs::is_symlink(envPath("dev") / "etc/resolv.conf"));
    EXPECT_EQ(readFile(envPath("dev") / "etc/resolv.conf"), "nameserver 9.9.9.9\n");
}

TEST(ProgressReporterTest, ClampsAndNeverGoesBackwards)
{
    std::vector<double> seen;
    ProgressReporter reporter("env", [&seen](const ProgressEvent& e) { seen.push_back(e.fraction); });

    reporter.report("a", 0.5);
    reporter.report("b", 0.3);
    reporter.report("c", 1.7);
    reporter.report("d", -2.0);

    EXPECT_EQ(seen, (std::vector<double>{0.5, 0.5, 1.0, 1.0}));
    EXPECT_DOUBLE_EQ(reporter.last(), 1.0);
}
