#ifndef RUN_CONTEXT_HPP
#define RUN_CONTEXT_HPP

#include <atomic>
#include <mutex>
#include <string>
#include <sys/types.h>

namespace Rootstock {

/**
 * @class RunContext
 * @brief State owned by a single provisioning run or command execution:
 *        its cooperative cancellation flag and the process group of the
 *        child it is currently supervising.
 *
 * One context is created per run and passed explicitly through the
 * pipeline and the executor, so runs for different environments never
 * share a flag or a process handle.
 */
class RunContext
{
public:
    explicit RunContext(std::string environmentId = "");

    RunContext(const RunContext&) = delete;
    RunContext& operator=(const RunContext&) = delete;

    const std::string& environmentId() const { return environmentId_; }

    /**
     * @brief Requests cooperative cancellation. Takes effect at the next
     *        checkpoint of whoever is running with this context.
     */
    void cancel();

    bool isCancelled() const;

    /**
     * @brief Records the process group id of the child being supervised.
     */
    void attachChild(pid_t processGroup);

    /**
     * @brief Forgets the child. Called before the child is reaped so a
     *        recycled pid can never be signalled.
     */
    void detachChild();

    /**
     * @brief Returns the supervised process group, or -1.
     */
    pid_t child() const;

    /**
     * @brief Sends SIGKILL to the supervised process group, if any.
     * @return True if a signal was delivered.
     */
    bool terminateChild();

private:
    std::string environmentId_;
    std::atomic<bool> cancelled_{false};
    mutable std::mutex childMutex_;
    pid_t child_ = -1;
};

} // namespace Rootstock

#endif // RUN_CONTEXT_HPP
