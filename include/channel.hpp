#ifndef CHANNEL_HPP
#define CHANNEL_HPP
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace procutil {

/**
 * @brief Unbounded multi-producer queue that can be closed.
 *
 * Producers call push() from any thread; the consumer blocks in pop() until
 * an item arrives or the channel is closed and drained. Closing is
 * idempotent and wakes every waiting consumer.
 */
template <typename T> class Channel {
  public:
    /**
     * @brief Append an item.
     *
     * @return `false` if the channel was already closed and the item was
     *         dropped.
     */
    bool push(T item) {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (closed_)
                return false;
            items_.push_back(std::move(item));
        }
        cv_.notify_one();
        return true;
    }

    /**
     * @brief Take the next item, blocking while the channel is open and empty.
     *
     * @return The item, or `std::nullopt` once the channel is closed and empty.
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lk(mtx_);
        cv_.wait(lk, [this] { return !items_.empty() || closed_; });
        if (items_.empty())
            return std::nullopt;
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lk(mtx_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return closed_;
    }

  private:
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<T> items_;
    bool closed_ = false;
};

} // namespace procutil

#endif // CHANNEL_HPP
