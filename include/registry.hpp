#ifndef REGISTRY_HPP
#define REGISTRY_HPP

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace Rootstock {

enum class EnvironmentStatus
{
    Uninitialized,
    Downloading,
    Extracting,
    Configuring,
    InstallingRuntime,
    Ready,
    Error,
    Cancelled
};

const char* environmentStatusName(EnvironmentStatus status);

/**
 * @brief A provisioned (or provisioning) environment.
 */
struct Environment
{
    std::string id;
    std::string distribution;
    std::string rootPath;
    EnvironmentStatus status = EnvironmentStatus::Uninitialized;

    /** Set only on the transition into Ready. */
    std::optional<std::chrono::system_clock::time_point> installedAt;

    /** Set only in Error. */
    std::string errorMessage;

    /** Non-fatal problems hit along the way (resolver write, bootstrap). */
    std::vector<std::string> warnings;
};

/**
 * @brief One directory found under the provisioning root.
 */
struct EnvironmentEntry
{
    std::string id;
    std::string path;
    bool exists = false; // a shell is present in the tree
};

/**
 * @class EnvironmentRegistry
 * @brief Catalog of environments under one provisioning root.
 *
 * Whether an environment is installed is read from the tree on disk. The
 * in-memory records only track runs started in this process.
 */
class EnvironmentRegistry
{
public:
    explicit EnvironmentRegistry(std::string provisioningRoot);

    const std::string& provisioningRoot() const { return root_; }

    /**
     * @brief Returns `<provisioningRoot>/<id>`.
     * @throws SetupError (InvalidArgument) if `id` is not a single path
     *         component.
     */
    std::string pathFor(const std::string& id) const;

    /**
     * @brief Path of the download artifact for `id`.
     */
    std::string archivePathFor(const std::string& id) const;

    /**
     * @brief Directories under the provisioning root, sorted by id.
     *        Plain files (download artifacts) are not reported.
     */
    std::vector<EnvironmentEntry> list() const;

    /**
     * @brief True if the tree for `id` holds a shell at bin/sh or usr/bin/sh.
     */
    bool exists(const std::string& id) const;

    /**
     * @brief Deletes the tree for `id` and forgets its record.
     * @return True if the tree is gone afterwards, including when it never
     *         existed.
     */
    bool remove(const std::string& id);

    /**
     * @brief Claims `id` for a provisioning run and resets its record to
     *        Uninitialized.
     * @throws SetupError (Busy) if a run for `id` is already active.
     */
    Environment beginRun(const std::string& id, const std::string& distribution);

    /**
     * @brief Releases the claim taken by beginRun().
     */
    void endRun(const std::string& id);

    bool isRunning(const std::string& id) const;

    /**
     * @brief Moves the record forward. Ready stamps installedAt; Error
     *        stores `message`.
     * @throws SetupError (InvalidArgument) for a backward transition or one
     *         out of a terminal state.
     */
    Environment transition(const std::string& id, EnvironmentStatus next,
                           const std::string& message = "");

    void addWarning(const std::string& id, const std::string& warning);

    /**
     * @brief Snapshot of the record for `id`. Environments installed by an
     *        earlier process are reported as Ready.
     */
    std::optional<Environment> find(const std::string& id) const;

private:
    std::string root_;
    mutable std::mutex mutex_;
    std::map<std::string, Environment> records_;
    std::set<std::string> running_;
};

} // namespace Rootstock

#endif // REGISTRY_HPP
