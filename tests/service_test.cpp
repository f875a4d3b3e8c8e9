#include "errors.hpp"
#include "service.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <map>
#include <mutex>

namespace fs = std::filesystem;
using namespace Rootstock;
using namespace Rootstock::Testing;

namespace {

class ServiceTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        config_ = testConfig(dir_);
        writeTarGz((dir_ / "mirror/rootfs.tar.gz").string(), minimalRootfs());
        DistributionProfile& profile = config_.distributions["testdistro"];
        profile.sources["aarch64"] = {fileUrl(dir_ / "mirror/rootfs.tar.gz")};
        profile.sources["x86_64"] = profile.sources["aarch64"];
        writeFile(config_.toolVersionFile, "5.4.0\n");
    }

    template <typename T>
    ErrorKind failureOf(std::future<T>& future)
    {
        try {
            future.get();
        } catch (const SetupError& e) {
            return e.kind();
        }
        ADD_FAILURE() << "expected SetupError";
        return ErrorKind::IoError;
    }

    TempDir dir_;
    Config config_;
};

} // namespace

TEST_F(ServiceTest, InstallThenExecute)
{
    EnvironmentService service(config_);
    Environment env = service.installEnvironment("testdistro", "dev").get();
    EXPECT_EQ(env.status, EnvironmentStatus::Ready);

    ExecutionResult result = service.execute("dev", "echo hi && echo err 1>&2", "/", 5000);
    EXPECT_EQ(result.exitCode, 0);
    EXPECT_NE(result.stdoutText.find("hi"), std::string::npos);
    EXPECT_NE(result.stderrText.find("err"), std::string::npos);

    ASSERT_TRUE(service.status("dev").has_value());
    EXPECT_EQ(service.status("dev")->status, EnvironmentStatus::Ready);
}

TEST_F(ServiceTest, InstalledAndDeleteAreIdempotent)
{
    EnvironmentService service(config_);
    service.installEnvironment("testdistro", "dev").get();

    EXPECT_TRUE(service.isInstalled("dev"));
    EXPECT_TRUE(service.isInstalled("dev"));

    std::vector<EnvironmentEntry> entries = service.listEnvironments();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].id, "dev");
    EXPECT_TRUE(entries[0].exists);

    EXPECT_TRUE(service.deleteEnvironment("dev"));
    EXPECT_FALSE(service.isInstalled("dev"));
    EXPECT_TRUE(service.deleteEnvironment("dev"));
    EXPECT_TRUE(service.listEnvironments().empty());
}

TEST_F(ServiceTest, ExecuteReportsProblemsInline)
{
    EnvironmentService service(config_);

    ExecutionResult empty = service.execute("", "echo hi");
    EXPECT_EQ(empty.exitCode, -1);
    EXPECT_NE(empty.stderrText.find("environmentId is empty"), std::string::npos);

    ExecutionResult missing = service.execute("ghost", "echo hi");
    EXPECT_EQ(missing.exitCode, -1);
    EXPECT_NE(missing.stderrText.find("not installed"), std::string::npos);

    ExecutionResult invalid = service.execute("../etc", "echo hi");
    EXPECT_EQ(invalid.exitCode, -1);
}

TEST_F(ServiceTest, DirectoryWithoutShellIsNotInstalled)
{
    fs::create_directories(fs::path(config_.provisioningRoot) / "dev/etc");
    EnvironmentService service(config_);

    ExecutionResult result = service.execute("dev", "echo hi");
    EXPECT_EQ(result.exitCode, -1);
    EXPECT_NE(result.stderrText.find("not installed"), std::string::npos);
    EXPECT_TRUE(result.stdoutText.empty());
}

TEST_F(ServiceTest, ExecuteIsRefusedWhileTheEnvironmentIsBeingSetUp)
{
    writeFile(fs::path(config_.provisioningRoot) / "dev/bin/sh", "");
    config_.distributions["testdistro"].bootstrapCommand = "sleep 30";
    EnvironmentService service(config_);

    std::future<Environment> setup = service.installEnvironment("testdistro", "dev");
    ExecutionResult result = service.execute("dev", "echo hi");
    EXPECT_EQ(result.exitCode, -1);
    EXPECT_NE(result.stderrText.find("being set up"), std::string::npos);
    EXPECT_TRUE(result.stdoutText.empty());

    EXPECT_TRUE(service.cancelSetup("dev"));
    ASSERT_EQ(setup.wait_for(std::chrono::seconds(20)), std::future_status::ready);
    EXPECT_EQ(failureOf(setup), ErrorKind::Cancelled);
}

TEST_F(ServiceTest, ExecutionTimeoutComesBackAsResult)
{
    writeFile(fs::path(config_.provisioningRoot) / "dev/bin/sh", "");
    EnvironmentService service(config_);

    ExecutionResult result = service.execute("dev", "sleep 30", "/", 250);
    EXPECT_EQ(result.exitCode, -1);
    EXPECT_TRUE(result.timedOut);
    EXPECT_NE(result.stderrText.find("250ms"), std::string::npos);
}

TEST_F(ServiceTest, ExecuteAsyncAndOutputChannel)
{
    writeFile(fs::path(config_.provisioningRoot) / "dev/bin/sh", "");
    EnvironmentService service(config_);

    std::mutex mutex;
    std::vector<std::string> lines;
    auto handle = service.output().subscribe([&](const std::string& line) {
        std::lock_guard<std::mutex> lock(mutex);
        lines.push_back(line);
    });

    ExecutionResult result = service.executeAsync("dev", "echo async; echo oops 1>&2").get();
    EXPECT_EQ(result.exitCode, 0);
    EXPECT_EQ(result.stdoutText, "async\n");

    {
        std::lock_guard<std::mutex> lock(mutex);
        EXPECT_NE(std::find(lines.begin(), lines.end(), "async"), lines.end());
        EXPECT_NE(std::find(lines.begin(), lines.end(), "[err] oops"), lines.end());
    }
    EXPECT_TRUE(service.output().unsubscribe(handle));
}

TEST_F(ServiceTest, SecondSetupIsBusyAndCancelStopsTheFirst)
{
    config_.distributions["testdistro"].bootstrapCommand = "sleep 30";
    EnvironmentService service(config_);

    std::future<Environment> first = service.installEnvironment("testdistro", "dev");
    std::future<Environment> second = service.installEnvironment("testdistro", "dev");
    EXPECT_EQ(failureOf(second), ErrorKind::Busy);
    EXPECT_THROW(service.deleteEnvironment("dev"), SetupError);

    EXPECT_TRUE(service.cancelSetup("dev"));
    ASSERT_EQ(first.wait_for(std::chrono::seconds(20)), std::future_status::ready);
    EXPECT_EQ(failureOf(first), ErrorKind::Cancelled);

    EXPECT_FALSE(service.isInstalled("dev"));
    EXPECT_FALSE(service.cancelSetup("dev"));
}

TEST_F(ServiceTest, CancelAllOnlyTouchesRunningSetups)
{
    EnvironmentService service(config_);
    service.cancelSetup();
    EXPECT_FALSE(service.cancelSetup("nothing-running"));

    Environment env = service.installEnvironment("testdistro", "dev").get();
    EXPECT_EQ(env.status, EnvironmentStatus::Ready);
}

TEST_F(ServiceTest, DifferentEnvironmentsProvisionConcurrently)
{
    EnvironmentService service(config_);

    std::mutex mutex;
    std::map<std::string, std::vector<double>> fractions;
    service.progress().subscribe([&](const ProgressEvent& e) {
        std::lock_guard<std::mutex> lock(mutex);
        fractions[e.environmentId].push_back(e.fraction);
    });

    std::future<Environment> a = service.installEnvironment("testdistro", "a");
    std::future<Environment> b = service.installEnvironment("testdistro", "b");
    EXPECT_EQ(a.get().status, EnvironmentStatus::Ready);
    EXPECT_EQ(b.get().status, EnvironmentStatus::Ready);

    std::lock_guard<std::mutex> lock(mutex);
    for (const auto& id : {"a", "b"}) {
        const std::vector<double>& seen = fractions[id];
        ASSERT_FALSE(seen.empty()) << id;
        EXPECT_TRUE(std::is_sorted(seen.begin(), seen.end())) << id;
        EXPECT_DOUBLE_EQ(seen.back(), 1.0);
    }
}

TEST_F(ServiceTest, InvalidIdFailsThroughTheFuture)
{
    EnvironmentService service(config_);
    std::future<Environment> result = service.installEnvironment("testdistro", "a/b");
    EXPECT_EQ(failureOf(result), ErrorKind::InvalidArgument);
    EXPECT_FALSE(service.isInstalled("a/b"));
}

TEST_F(ServiceTest, MissingToolFailsThroughTheFuture)
{
    config_.toolPath = (dir_ / "absent-proot").string();
    EnvironmentService service(config_);
    std::future<Environment> result = service.installEnvironment("testdistro", "dev");
    EXPECT_EQ(failureOf(result), ErrorKind::ToolMissing);
}

TEST_F(ServiceTest, SavesArtifactsToSharedStorage)
{
    EnvironmentService service(config_);
    writeFile(dir_ / "build/app.bin", "v1");

    std::string saved = service.saveArtifactToSharedStorage((dir_ / "build/app.bin").string(), "app.bin");
    EXPECT_EQ(saved, (fs::path(config_.sharedStorageDir) / "Rootstock/app.bin").string());
    EXPECT_EQ(readFile(saved), "v1");

    writeFile(dir_ / "build/app.bin", "v2");
    service.saveArtifactToSharedStorage((dir_ / "build/app.bin").string(), "app.bin");
    EXPECT_EQ(readFile(saved), "v2");

    try {
        service.saveArtifactToSharedStorage((dir_ / "build/missing.bin").string(), "x.bin");
        FAIL() << "expected NotFound";
    } catch (const SetupError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NotFound);
    }
}

TEST_F(ServiceTest, StorageInfoAndToolVersion)
{
    EnvironmentService service(config_);

    StorageInfo info = service.storageInfo();
    EXPECT_EQ(info.provisioningRoot, config_.provisioningRoot);
    EXPECT_TRUE(info.toolPresent);
    EXPECT_EQ(info.toolVersion, "5.4.0");
    EXPECT_GT(info.totalMb, 0u);
    EXPECT_LE(info.freeMb, info.totalMb);

    std::vector<ProgressEvent> events;
    auto handle = service.progress().subscribe([&events](const ProgressEvent& e) { events.push_back(e); });
    std::string message = service.checkToolVersion();
    service.progress().unsubscribe(handle);

    EXPECT_NE(message.find("5.4.0"), std::string::npos);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_DOUBLE_EQ(events[0].fraction, -1.0);
    EXPECT_EQ(events[0].message, message);
}

TEST_F(ServiceTest, ShutdownRejectsNewWork)
{
    EnvironmentService service(config_);
    service.shutdown();

    std::future<Environment> result = service.installEnvironment("testdistro", "dev");
    EXPECT_EQ(failureOf(result), ErrorKind::Cancelled);
    EXPECT_EQ(service.execute("dev", "true").exitCode, -1);
}
