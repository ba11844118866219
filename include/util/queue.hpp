#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace util
{
// Unbounded blocking multi-producer/multi-consumer queue
template <typename T>
class UnboundedBlockingQueue
{
  public:
    UnboundedBlockingQueue() = default;

    // Non-copyable
    UnboundedBlockingQueue(const UnboundedBlockingQueue &)            = delete;
    UnboundedBlockingQueue &operator=(const UnboundedBlockingQueue &) = delete;

    // Non-movable
    UnboundedBlockingQueue(UnboundedBlockingQueue &&) = delete;

    ~UnboundedBlockingQueue() = default;

    void put(T v)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            q_.emplace_back(std::move(v));
        }
        cv_not_empty_.notify_one();
    }

    T take()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_not_empty_.wait(lock, [this] { return !q_.empty(); });
        T v = std::move(q_.front());
        q_.pop_front();
        return v;
    }

    // nullopt on timeout
    template <typename Rep, typename Period>
    std::optional<T> take_for(std::chrono::duration<Rep, Period> timeout)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_not_empty_.wait_for(lock, timeout, [this] { return !q_.empty(); }))
            return std::nullopt;
        T v = std::move(q_.front());
        q_.pop_front();
        return v;
    }

    std::size_t size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return q_.size();
    }

  private:
    std::deque<T>           q_;
    mutable std::mutex      mutex_;
    std::condition_variable cv_not_empty_;
};

}  // namespace util
