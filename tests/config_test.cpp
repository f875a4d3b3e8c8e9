#include "config.hpp"
#include "errors.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>

using namespace Rootstock;
using namespace Rootstock::Testing;

TEST(ConfigTest, DefaultsMatchTheSandboxConventions)
{
    Config config = Config::defaults();

    EXPECT_EQ(config.hostDataMount, "/data_internal");
    EXPECT_EQ(config.kernelRelease, "4.14.111");
    EXPECT_EQ(config.execTimeoutMs, 300000);
    EXPECT_EQ(config.installTimeoutMs, 1800000);
    EXPECT_EQ(config.readerGraceMs, 3000);
    EXPECT_EQ(config.nameservers, (std::vector<std::string>{"8.8.8.8", "1.1.1.1"}));
    ASSERT_EQ(config.distributions.count("alpine"), 1u);
    ASSERT_EQ(config.distributions.count("ubuntu"), 1u);
    EXPECT_EQ(config.distributions.at("alpine").sourcesFor("x86_64").size(), 2u);
    EXPECT_NE(config.distributions.at("alpine").bootstrapCommand.find("apk add"), std::string::npos);
    EXPECT_NE(config.distributions.at("ubuntu").bootstrapCommand.find("apt-get install"), std::string::npos);
}

TEST(ConfigTest, MissingFileYieldsDefaults)
{
    TempDir dir;
    Config config = Config::loadFromFile((dir / "absent.yaml").string());
    EXPECT_EQ(config.toolPath, Config::defaults().toolPath);
}

TEST(ConfigTest, FileOverridesDefaults)
{
    TempDir dir;
    writeFile(dir / "config.yaml",
              "provisioning_root: /srv/envs\n"
              "tool_path: /opt/proot\n"
              "worker_threads: 8\n"
              "exec_timeout_ms: 1000\n"
              "nameservers: [10.0.0.1]\n"
              "distributions:\n"
              "  alpine:\n"
              "    sources:\n"
              "      x86_64: [file:///mirror/alpine.tar.gz]\n"
              "  custom:\n"
              "    sources:\n"
              "      aarch64: [https://example.org/rootfs.tar.gz]\n"
              "    bootstrap: echo hello\n");

    Config config = Config::loadFromFile((dir / "config.yaml").string());

    EXPECT_EQ(config.provisioningRoot, "/srv/envs");
    EXPECT_EQ(config.toolPath, "/opt/proot");
    EXPECT_EQ(config.workerThreads, 8u);
    EXPECT_EQ(config.execTimeoutMs, 1000);
    EXPECT_EQ(config.nameservers, (std::vector<std::string>{"10.0.0.1"}));

    // Only the overridden architecture changes
    const DistributionProfile& alpine = config.distribution("alpine");
    EXPECT_EQ(alpine.sourcesFor("x86_64"), (std::vector<std::string>{"file:///mirror/alpine.tar.gz"}));
    EXPECT_EQ(alpine.sourcesFor("aarch64").size(), 2u);
    EXPECT_FALSE(alpine.bootstrapCommand.empty());

    const DistributionProfile& custom = config.distribution("custom");
    EXPECT_EQ(custom.name, "custom");
    EXPECT_EQ(custom.bootstrapCommand, "echo hello");
    // Unknown architectures fall back to aarch64
    EXPECT_EQ(custom.sourcesFor("riscv64"), (std::vector<std::string>{"https://example.org/rootfs.tar.gz"}));
    EXPECT_EQ(custom.sourcesFor("arm64"), custom.sourcesFor("aarch64"));
}

TEST(ConfigTest, UnknownDistributionFallsBackToAlpine)
{
    Config config = Config::defaults();
    EXPECT_EQ(config.distribution("gentoo").name, "alpine");
}

TEST(ConfigTest, InvalidYamlIsRejected)
{
    TempDir dir;
    writeFile(dir / "broken.yaml", "tool_path: [unterminated\n");
    try {
        Config::loadFromFile((dir / "broken.yaml").string());
        FAIL() << "expected InvalidArgument";
    } catch (const SetupError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidArgument);
    }

    writeFile(dir / "wrong-type.yaml", "worker_threads: many\n");
    EXPECT_THROW(Config::loadFromFile((dir / "wrong-type.yaml").string()), SetupError);
}

TEST(ConfigTest, SavedFileLoadsBackTheSameValues)
{
    TempDir dir;
    Config original = testConfig(dir);
    original.loader = "/opt/loader";
    original.verbose = true;
    original.distributions["testdistro"].sources["x86_64"] = {"file:///a", "file:///b"};

    const std::string path = (dir / "saved/config.yaml").string();
    original.saveToFile(path);

    YAML::Node raw = YAML::LoadFile(path);
    EXPECT_EQ(raw["tool_path"].as<std::string>(), original.toolPath);

    Config loaded = Config::loadFromFile(path);
    EXPECT_EQ(loaded.provisioningRoot, original.provisioningRoot);
    EXPECT_EQ(loaded.loader, "/opt/loader");
    EXPECT_TRUE(loaded.verbose);
    EXPECT_EQ(loaded.nameservers, original.nameservers);
    EXPECT_EQ(loaded.distribution("testdistro").sourcesFor("x86_64"),
              (std::vector<std::string>{"file:///a", "file:///b"}));
    EXPECT_EQ(loaded.distribution("testdistro").bootstrapCommand, "echo bootstrap-ran");
}

TEST(ConfigTest, ResolvePathPrefersExplicitThenEnvironment)
{
    EXPECT_EQ(Config::resolvePath("/tmp/explicit.yaml"), "/tmp/explicit.yaml");

    setenv("ROOTSTOCK_CONFIG", "/tmp/from-env.yaml", 1);
    EXPECT_EQ(Config::resolvePath(""), "/tmp/from-env.yaml");
    unsetenv("ROOTSTOCK_CONFIG");
    EXPECT_EQ(Config::resolvePath(""), "/etc/rootstock/config.yaml");
}
