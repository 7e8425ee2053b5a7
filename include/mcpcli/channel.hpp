#ifndef MCPCLI_CHANNEL_HPP
#define MCPCLI_CHANNEL_HPP

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace mcpcli
{

/**
 * Bounded, closable FIFO between threads.
 *
 * With capacity 0 the channel is a rendezvous: send() returns only after a
 * receiver has taken the item, so a producer can never run ahead of its
 * consumer. With capacity N, send() blocks while N items are buffered.
 *
 * close() wakes every waiter. After close, send() fails and receive() keeps
 * returning buffered items until the channel is empty, then std::nullopt.
 */
template <typename T>
class Channel
{
  public:
    explicit Channel(size_t capacity = 0) : capacity_(capacity) {}

    // No copy, no move (waiters hold references)
    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /// Returns false if the channel was closed before the item was accepted.
    bool send(T item)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] { return closed_ || queue_.size() < slots(); });
        if (closed_)
            return false;

        const uint64_t seq = ++sent_;
        queue_.emplace_back(seq, std::move(item));
        not_empty_.notify_one();

        if (capacity_ > 0)
            return true;

        taken_.wait(lock, [this, seq] { return closed_ || received_ >= seq; });
        if (received_ >= seq)
            return true;

        // Closed before any receiver took it: withdraw the item
        auto it = std::find_if(queue_.begin(), queue_.end(),
                               [seq](const auto& entry) { return entry.first == seq; });
        if (it != queue_.end())
            queue_.erase(it);
        not_full_.notify_all();
        return false;
    }

    /// Blocks until an item is available. std::nullopt means closed and drained.
    std::optional<T> receive()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return closed_ || !queue_.empty(); });
        return pop_locked();
    }

    /// Like receive(), but gives up after timeout (check is_closed() to tell the cases apart).
    std::optional<T> receive_for(std::chrono::milliseconds timeout)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); });
        return pop_locked();
    }

    std::optional<T> try_receive()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return pop_locked();
    }

    void close()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        not_empty_.notify_all();
        not_full_.notify_all();
        taken_.notify_all();
    }

    bool is_closed() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t capacity() const
    {
        return capacity_;
    }

  private:
    size_t slots() const
    {
        return capacity_ == 0 ? 1 : capacity_;
    }

    std::optional<T> pop_locked()
    {
        if (queue_.empty())
            return std::nullopt;

        std::optional<T> item(std::move(queue_.front().second));
        received_ = queue_.front().first;
        queue_.pop_front();
        not_full_.notify_all();
        taken_.notify_all();
        return item;
    }

    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::condition_variable taken_;
    std::deque<std::pair<uint64_t, T>> queue_;
    uint64_t sent_ = 0;
    uint64_t received_ = 0;
    bool closed_ = false;
};

} // namespace mcpcli

#endif // MCPCLI_CHANNEL_HPP
