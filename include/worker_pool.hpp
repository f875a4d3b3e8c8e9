#ifndef WORKER_POOL_HPP
#define WORKER_POOL_HPP

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace Rootstock {

/**
 * @class WorkerPool
 * @brief Fixed number of worker threads draining a FIFO task queue.
 *
 * Exceptions thrown by a task are delivered through its future.
 */
class WorkerPool
{
public:
    explicit WorkerPool(unsigned threads);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Queues `fn` and returns a future for its result.
     * @throws std::runtime_error after shutdown().
     */
    template <typename Fn>
    std::future<typename std::invoke_result<Fn>::type> submit(Fn fn)
    {
        using Result = typename std::invoke_result<Fn>::type;
        auto task = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
        std::future<Result> future = task->get_future();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                throw std::runtime_error("Worker pool is shut down");
            }
            queue_.emplace_back([task] { (*task)(); });
        }
        wake_.notify_one();
        return future;
    }

    /**
     * @brief Stops accepting work, finishes everything already queued and
     *        joins the workers. Safe to call more than once.
     */
    void shutdown();

    size_t size() const { return workers_.size(); }

private:
    void workerLoop();

    std::mutex mutex_;
    std::condition_variable wake_;
    std::deque<std::function<void()>> queue_;
    std::vector<std::thread> workers_;
    bool stopping_ = false;
};

} // namespace Rootstock

#endif // WORKER_POOL_HPP
