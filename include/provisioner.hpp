#ifndef PROVISIONER_HPP
#define PROVISIONER_HPP

#include "event_channel.hpp"
#include "registry.hpp"
#include "sandbox_executor.hpp"

#include <functional>
#include <string>
#include <vector>

namespace Rootstock {

class Config;
class RunContext;

using ProgressSink = std::function<void(const ProgressEvent&)>;

/**
 * @class ProgressReporter
 * @brief Publishes the progress of one run, clamping fractions into
 *        [0, 1] and never letting them go backwards.
 */
class ProgressReporter
{
public:
    ProgressReporter(std::string environmentId, ProgressSink sink);

    void report(const std::string& message, double fraction);

    double last() const { return last_; }

private:
    std::string environmentId_;
    ProgressSink sink_;
    double last_ = 0.0;
};

/**
 * @class Provisioner
 * @brief Takes an environment from nothing to a rootfs with a working
 *        language runtime.
 *
 * Steps, in order: check for the sandbox tool, download the rootfs
 * tarball, extract it, write the resolver configuration, then run the
 * distribution's bootstrap and upgrade commands inside the sandbox.
 * Cancellation is checked between every step.
 */
class Provisioner
{
public:
    Provisioner(const Config& config,
                EnvironmentRegistry& registry,
                const SandboxExecutor& executor);

    /**
     * @brief Runs the whole pipeline for `id` on the calling thread.
     *
     * @param distribution Profile name; unknown names fall back to alpine.
     * @param id           Environment id, a single path component.
     * @param context      Cancellation token and child-process slot for
     *                     this run.
     * @param progress     Optional progress observer.
     * @param output       Optional observer for the bootstrap commands'
     *                     output lines.
     * @return The environment in state Ready.
     * @throws SetupError with kind Cancelled if the run was cancelled, or
     *         the kind of the failing step otherwise. In both cases the
     *         download artifact and the partial tree are removed.
     */
    Environment provision(const std::string& distribution,
                          const std::string& id,
                          RunContext& context,
                          const ProgressSink& progress = nullptr,
                          const OutputCallback& output = nullptr);

    /**
     * @brief Writes etc/resolv.conf under `rootPath` with the configured
     *        nameservers.
     * @throws SetupError (ConfigurationFailed) if the file cannot be written.
     */
    void writeResolverConfig(const std::string& rootPath) const;

private:
    void runSteps(Environment& env,
                  RunContext& context,
                  ProgressReporter& reporter,
                  const OutputCallback& output);

    void runInSandbox(const Environment& env,
                      const std::string& command,
                      const std::string& step,
                      RunContext& context,
                      const OutputCallback& output);

    // Removes the downloaded archive, and the tree too once extraction began.
    void discard(const Environment& env, bool removeTree) const;

    const Config& config_;
    EnvironmentRegistry& registry_;
    const SandboxExecutor& executor_;
};

} // namespace Rootstock

#endif // PROVISIONER_HPP
