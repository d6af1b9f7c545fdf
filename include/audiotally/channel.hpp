#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace audiotally {

// Bounded multi-producer / multi-consumer FIFO.
//
// send() blocks while the channel is full; receive() blocks while it is empty
// and returns std::nullopt once the channel is closed and drained. Each item
// is delivered to exactly one receiver.
template <typename T> class Channel {
  public:
    explicit Channel(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    Channel(const Channel &) = delete;
    Channel &operator=(const Channel &) = delete;

    void send(T value) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock,
                       [this] { return closed_ || items_.size() < capacity_; });
        if (closed_) {
            throw std::logic_error("send on closed channel");
        }
        items_.push_back(std::move(value));
        lock.unlock();
        not_empty_.notify_one();
    }

    std::optional<T> receive() {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return closed_ || !items_.empty(); });
        if (items_.empty()) {
            return std::nullopt; // closed and drained
        }
        T value = std::move(items_.front());
        items_.pop_front();
        lock.unlock();
        not_full_.notify_one();
        return value;
    }

    // No more sends. Pending items stay receivable.
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    size_t capacity() const { return capacity_; }

  private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> items_;
    bool closed_ = false;
};

} // namespace audiotally
