#include "run_context.hpp"
#include "utils.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <utility>

namespace Rootstock {

RunContext::RunContext(std::string environmentId)
    : environmentId_(std::move(environmentId))
{
}

void RunContext::cancel()
{
    cancelled_.store(true);
}

bool RunContext::isCancelled() const
{
    return cancelled_.load();
}

void RunContext::attachChild(pid_t processGroup)
{
    std::lock_guard<std::mutex> lock(childMutex_);
    child_ = processGroup;
}

void RunContext::detachChild()
{
    std::lock_guard<std::mutex> lock(childMutex_);
    child_ = -1;
}

pid_t RunContext::child() const
{
    std::lock_guard<std::mutex> lock(childMutex_);
    return child_;
}

bool RunContext::terminateChild()
{
    std::lock_guard<std::mutex> lock(childMutex_);
    if (child_ <= 0) {
        return false;
    }
    if (kill(-child_, SIGKILL) != 0) {
        if (errno != ESRCH) {
            log_warning("Failed to kill process group " + std::to_string(child_) +
                        ": " + std::strerror(errno));
        }
        return false;
    }
    return true;
}

} // namespace Rootstock
