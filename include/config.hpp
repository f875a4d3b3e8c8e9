#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <map>
#include <string>
#include <vector>

namespace Rootstock {

/**
 * @brief Per-distribution provisioning data: where the rootfs comes from
 *        and how the language runtime gets installed into it.
 */
struct DistributionProfile
{
    std::string name;

    /**
     * @brief Ordered rootfs tarball URLs keyed by machine architecture
     *        ("aarch64", "x86_64").
     */
    std::map<std::string, std::vector<std::string>> sources;

    /** Updates the package index and installs interpreter + toolchain. */
    std::string bootstrapCommand;

    /** Upgrades the language package manager after bootstrap. */
    std::string upgradeCommand;

    /**
     * @brief Returns the source list for an architecture. Debian-style
     *        names ("arm64", "amd64") are accepted; unknown architectures
     *        fall back to the aarch64 list.
     */
    std::vector<std::string> sourcesFor(const std::string& arch) const;
};

class Config
{
public:
    /** Directory holding one rootfs per environment. Must allow exec. */
    std::string provisioningRoot;

    /** The proot binary. */
    std::string toolPath;

    /** Optional file holding the installed tool's version string. */
    std::string toolVersionFile;

    /** Application private storage, bind-mounted into every sandbox. */
    std::string hostDataDir;
    std::string hostDataMount = "/data_internal";

    /** Export target for saveArtifactToSharedStorage. */
    std::string sharedStorageDir;

    /** Kernel release reported to sandboxed programs (proot -k). */
    std::string kernelRelease = "4.14.111";

    /** Exported as PROOT_LOADER when non-empty. */
    std::string loader;

    std::vector<std::string> nameservers;

    unsigned workerThreads   = 4;
    long execTimeoutMs       = 300000;
    long installTimeoutMs    = 1800000;
    long readerGraceMs       = 3000;
    bool verbose             = false;

    std::map<std::string, DistributionProfile> distributions;

    /**
     * @brief Built-in configuration. Paths are derived from $HOME.
     */
    static Config defaults();

    /**
     * @brief Loads configuration from a YAML file on disk, layered over
     *        the built-in defaults. A missing file yields the defaults.
     * @param path Path to the configuration file.
     * @return A fully populated Config instance.
     * @throws SetupError (InvalidArgument) if the file is not valid YAML.
     */
    static Config loadFromFile(const std::string& path);

    /**
     * @brief Picks the configuration file to use: the explicit path if
     *        given, else $ROOTSTOCK_CONFIG, else /etc/rootstock/config.yaml.
     */
    static std::string resolvePath(const std::string& explicitPath);

    /**
     * @brief Saves the current configuration to a YAML file.
     * @param path Path to the file where configuration should be saved.
     */
    void saveToFile(const std::string& path) const;

    /**
     * @brief Prints a readable summary of the configuration to standard output.
     */
    void print() const;

    /**
     * @brief Looks up a distribution profile. Unknown names resolve to
     *        "alpine".
     */
    const DistributionProfile& distribution(const std::string& name) const;
};

} // namespace Rootstock

#endif // CONFIG_HPP
