#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace mp::engine
{

// Latest-value-wins state holder. Subscribers are notified only when the
// value actually changes; a new subscriber immediately sees the current value.
template <typename T> class Observable
{
  public:
    using Handler = std::function<void(T const &)>;
    using SubscriptionId = std::size_t;

    Observable() = default;
    explicit Observable(T initial) : value_(std::move(initial)) {}

    Observable(Observable const &) = delete;
    Observable &operator=(Observable const &) = delete;

    T get() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return value_;
    }

    // Returns false when the value was unchanged and nobody was notified.
    bool set(T value)
    {
        std::vector<Handler> handlers_copy;
        T snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (value_ == value)
            {
                return false;
            }
            value_ = std::move(value);
            snapshot = value_;
            handlers_copy.reserve(handlers_.size());
            for (auto const &entry : handlers_)
            {
                handlers_copy.push_back(entry.second);
            }
        }
        for (auto const &handler : handlers_copy)
        {
            handler(snapshot);
        }
        return true;
    }

    SubscriptionId subscribe(Handler handler)
    {
        T snapshot;
        SubscriptionId id = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            id = next_id_++;
            handlers_.emplace_back(id, handler);
            snapshot = value_;
        }
        handler(snapshot);
        return id;
    }

    void unsubscribe(SubscriptionId id)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::erase_if(handlers_,
                      [id](auto const &entry) { return entry.first == id; });
    }

    std::size_t subscriber_count() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return handlers_.size();
    }

  private:
    mutable std::mutex mutex_;
    T value_{};
    std::vector<std::pair<SubscriptionId, Handler>> handlers_;
    SubscriptionId next_id_ = 1;
};

} // namespace mp::engine
