#include "config.hpp"
#include "errors.hpp"
#include "utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <yaml-cpp/yaml.h>

namespace fs = std::filesystem;

namespace Rootstock {

namespace {

const char* kDefaultConfigPath = "/etc/rootstock/config.yaml";

std::string homeDirectory()
{
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return home;
    }
    return fs::temp_directory_path().string();
}

DistributionProfile alpineProfile()
{
    DistributionProfile p;
    p.name = "alpine";
    p.sources["aarch64"] = {
        "https://dl-cdn.alpinelinux.org/alpine/v3.19/releases/aarch64/alpine-minirootfs-3.19.1-aarch64.tar.gz",
        "https://github.com/alpinelinux/docker-alpine/raw/main/aarch64/alpine-minirootfs-3.19.0-aarch64.tar.gz",
    };
    p.sources["x86_64"] = {
        "https://dl-cdn.alpinelinux.org/alpine/v3.19/releases/x86_64/alpine-minirootfs-3.19.1-x86_64.tar.gz",
        "https://github.com/alpinelinux/docker-alpine/raw/main/x86_64/alpine-minirootfs-3.19.0-x86_64.tar.gz",
    };
    p.bootstrapCommand =
        "apk update -q 2>&1 && apk add --no-cache -q python3 py3-pip gcc musl-dev linux-headers python3-dev 2>&1";
    p.upgradeCommand = "pip3 install --upgrade pip setuptools wheel --quiet 2>&1 || true";
    return p;
}

DistributionProfile ubuntuProfile()
{
    DistributionProfile p;
    p.name = "ubuntu";
    p.sources["aarch64"] = {
        "https://cdimage.ubuntu.com/ubuntu-base/releases/22.04/release/ubuntu-base-22.04.3-base-arm64.tar.gz",
        "https://github.com/debuerreotype/docker-debian-artifacts/raw/dist-arm64/buster/rootfs.tar.gz",
    };
    p.sources["x86_64"] = {
        "https://cdimage.ubuntu.com/ubuntu-base/releases/22.04/release/ubuntu-base-22.04.3-base-amd64.tar.gz",
        "https://github.com/debuerreotype/docker-debian-artifacts/raw/dist-amd64/buster/rootfs.tar.gz",
    };
    p.bootstrapCommand =
        "apt-get update -qq 2>&1 | tail -3 && DEBIAN_FRONTEND=noninteractive apt-get install -y -qq "
        "python3 python3-pip python3-dev build-essential 2>&1";
    p.upgradeCommand = "pip3 install --upgrade pip setuptools wheel --quiet 2>&1 || true";
    return p;
}

std::vector<std::string> readStringList(const YAML::Node& node)
{
    std::vector<std::string> items;
    if (!node || !node.IsSequence()) {
        return items;
    }
    for (const auto& item : node) {
        if (item.IsScalar()) {
            items.push_back(item.as<std::string>());
        }
    }
    return items;
}

template <typename T>
void readScalar(const YAML::Node& root, const char* key, T& target)
{
    if (root[key] && root[key].IsScalar()) {
        target = root[key].as<T>();
    }
}

void mergeDistribution(DistributionProfile& profile, const YAML::Node& node)
{
    if (node["sources"] && node["sources"].IsMap()) {
        for (const auto& archEntry : node["sources"]) {
            profile.sources[archEntry.first.as<std::string>()] = readStringList(archEntry.second);
        }
    }
    readScalar(node, "bootstrap", profile.bootstrapCommand);
    readScalar(node, "upgrade", profile.upgradeCommand);
}

} // namespace

std::vector<std::string> DistributionProfile::sourcesFor(const std::string& arch) const
{
    std::string key = arch;
    if (key == "arm64") {
        key = "aarch64";
    } else if (key == "amd64") {
        key = "x86_64";
    }

    auto it = sources.find(key);
    if (it != sources.end()) {
        return it->second;
    }
    it = sources.find("aarch64");
    if (it != sources.end()) {
        return it->second;
    }
    return {};
}

Config Config::defaults()
{
    Config config;
    fs::path base = fs::path(homeDirectory()) / ".local" / "share" / "rootstock";

    config.provisioningRoot = (base / "linux_env").string();
    config.hostDataDir      = (base / "files").string();
    config.toolPath         = "/usr/bin/proot";
    config.toolVersionFile  = (base / "files" / "bin" / "proot.version").string();
    config.sharedStorageDir = (fs::path(homeDirectory()) / "Downloads").string();
    config.nameservers      = {"8.8.8.8", "1.1.1.1"};

    config.distributions["alpine"] = alpineProfile();
    config.distributions["ubuntu"] = ubuntuProfile();
    return config;
}

Config Config::loadFromFile(const std::string& path)
{
    Config config = defaults();

    if (!fs::exists(path)) {
        log_message("No configuration file at " + path + ", using built-in defaults.");
        return config;
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw SetupError(ErrorKind::InvalidArgument,
                         "Invalid configuration file " + path + ": " + e.what());
    }

    if (!root || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw SetupError(ErrorKind::InvalidArgument,
                         "Configuration file " + path + " must contain a YAML mapping");
    }

    try {
        readScalar(root, "provisioning_root", config.provisioningRoot);
        readScalar(root, "tool_path", config.toolPath);
        readScalar(root, "tool_version_file", config.toolVersionFile);
        readScalar(root, "host_data_dir", config.hostDataDir);
        readScalar(root, "host_data_mount", config.hostDataMount);
        readScalar(root, "shared_storage_dir", config.sharedStorageDir);
        readScalar(root, "kernel_release", config.kernelRelease);
        readScalar(root, "loader", config.loader);
        readScalar(root, "worker_threads", config.workerThreads);
        readScalar(root, "exec_timeout_ms", config.execTimeoutMs);
        readScalar(root, "install_timeout_ms", config.installTimeoutMs);
        readScalar(root, "reader_grace_ms", config.readerGraceMs);
        readScalar(root, "verbose", config.verbose);

        if (root["nameservers"]) {
            config.nameservers = readStringList(root["nameservers"]);
        }

        if (root["distributions"] && root["distributions"].IsMap()) {
            for (const auto& entry : root["distributions"]) {
                std::string name = entry.first.as<std::string>();
                DistributionProfile& profile = config.distributions[name];
                profile.name = name;
                mergeDistribution(profile, entry.second);
            }
        }
    } catch (const YAML::Exception& e) {
        throw SetupError(ErrorKind::InvalidArgument,
                         "Invalid value in configuration file " + path + ": " + e.what());
    }

    if (config.workerThreads == 0) {
        config.workerThreads = 1;
    }

    log_debug("Loaded configuration from " + path);
    return config;
}

std::string Config::resolvePath(const std::string& explicitPath)
{
    if (!explicitPath.empty()) {
        return explicitPath;
    }
    const char* fromEnv = std::getenv("ROOTSTOCK_CONFIG");
    if (fromEnv && *fromEnv) {
        return fromEnv;
    }
    return kDefaultConfigPath;
}

void Config::saveToFile(const std::string& path) const
{
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "provisioning_root"  << YAML::Value << provisioningRoot;
    out << YAML::Key << "tool_path"          << YAML::Value << toolPath;
    out << YAML::Key << "tool_version_file"  << YAML::Value << toolVersionFile;
    out << YAML::Key << "host_data_dir"      << YAML::Value << hostDataDir;
    out << YAML::Key << "host_data_mount"    << YAML::Value << hostDataMount;
    out << YAML::Key << "shared_storage_dir" << YAML::Value << sharedStorageDir;
    out << YAML::Key << "kernel_release"     << YAML::Value << kernelRelease;
    out << YAML::Key << "loader"             << YAML::Value << loader;
    out << YAML::Key << "nameservers"        << YAML::Value << nameservers;
    out << YAML::Key << "worker_threads"     << YAML::Value << workerThreads;
    out << YAML::Key << "exec_timeout_ms"    << YAML::Value << execTimeoutMs;
    out << YAML::Key << "install_timeout_ms" << YAML::Value << installTimeoutMs;
    out << YAML::Key << "reader_grace_ms"    << YAML::Value << readerGraceMs;
    out << YAML::Key << "verbose"            << YAML::Value << verbose;

    out << YAML::Key << "distributions" << YAML::Value << YAML::BeginMap;
    for (const auto& [name, profile] : distributions) {
        out << YAML::Key << name << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "sources" << YAML::Value << YAML::BeginMap;
        for (const auto& [arch, urls] : profile.sources) {
            out << YAML::Key << arch << YAML::Value << urls;
        }
        out << YAML::EndMap;
        out << YAML::Key << "bootstrap" << YAML::Value << profile.bootstrapCommand;
        out << YAML::Key << "upgrade"   << YAML::Value << profile.upgradeCommand;
        out << YAML::EndMap;
    }
    out << YAML::EndMap;
    out << YAML::EndMap;

    fs::path target(path);
    if (target.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(target.parent_path(), ec);
    }

    std::ofstream file(path, std::ios::trunc); // Truncate file to overwrite
    if (!file.is_open()) {
        throw SetupError(ErrorKind::IoError,
                         "Unable to open configuration file for writing: " + path);
    }

    file << "# Rootstock configuration\n";
    file << out.c_str() << "\n";
}

void Config::print() const
{
    std::cout << "Provisioning root : " << provisioningRoot << "\n"
              << "Sandbox tool      : " << toolPath << "\n"
              << "Host data dir     : " << hostDataDir << " -> " << hostDataMount << "\n"
              << "Shared storage    : " << sharedStorageDir << "\n"
              << "Kernel release    : " << kernelRelease << "\n"
              << "Nameservers       : " << join(nameservers, ", ") << "\n"
              << "Worker threads    : " << workerThreads << "\n"
              << "Exec timeout      : " << execTimeoutMs << " ms\n"
              << "Install timeout   : " << installTimeoutMs << " ms\n"
              << "Distributions:" << std::endl;
    for (const auto& [name, profile] : distributions) {
        std::cout << "  - " << name << std::endl;
        for (const auto& [arch, urls] : profile.sources) {
            for (const auto& url : urls) {
                std::cout << "      [" << arch << "] " << url << std::endl;
            }
        }
    }
}

const DistributionProfile& Config::distribution(const std::string& name) const
{
    auto it = distributions.find(name);
    if (it != distributions.end()) {
        return it->second;
    }

    it = distributions.find("alpine");
    if (it == distributions.end()) {
        throw SetupError(ErrorKind::InvalidArgument,
                         "Unknown distribution '" + name + "' and no alpine fallback configured");
    }
    log_warning("Unknown distribution '" + name + "', falling back to alpine.");
    return it->second;
}

} // namespace Rootstock
