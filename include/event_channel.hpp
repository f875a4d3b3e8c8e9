#ifndef EVENT_CHANNEL_HPP
#define EVENT_CHANNEL_HPP

#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace Rootstock {

/**
 * @brief One step of a provisioning run.
 *
 * `fraction` is in [0, 1] and never decreases within a run; -1 marks an
 * informational notice that is not part of any run.
 */
struct ProgressEvent
{
    std::string environmentId;
    std::string message;
    double fraction = 0.0;
};

/**
 * @class EventChannel
 * @brief Typed publish/subscribe stream.
 *
 * Subscribers are called synchronously on the publishing thread, in
 * subscription order. A subscriber may unsubscribe itself, or anyone
 * else, from inside its callback; the change applies from the next
 * publish on.
 */
template <typename Event>
class EventChannel
{
public:
    using Handler = std::function<void(const Event&)>;
    using Subscription = size_t;

    Subscription subscribe(Handler handler)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Subscription id = nextId_++;
        handlers_.emplace(id, std::move(handler));
        return id;
    }

    /**
     * @return False if the handle was unknown or already removed.
     */
    bool unsubscribe(Subscription id)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return handlers_.erase(id) > 0;
    }

    void publish(const Event& event) const
    {
        std::vector<Handler> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            snapshot.reserve(handlers_.size());
            for (const auto& entry : handlers_) {
                snapshot.push_back(entry.second);
            }
        }
        for (const auto& handler : snapshot) {
            handler(event);
        }
    }

    size_t subscriberCount() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return handlers_.size();
    }

private:
    mutable std::mutex mutex_;
    std::map<Subscription, Handler> handlers_;
    Subscription nextId_ = 1;
};

} // namespace Rootstock

#endif // EVENT_CHANNEL_HPP
