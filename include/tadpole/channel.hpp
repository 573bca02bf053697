#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace Tadpole {

// Unbounded multi-producer queue. Once closed, pushes are dropped and
// receivers drain what is left, then get nullopt.
template<typename T>
class Channel {
private:
    std::deque<T> queue;
    mutable std::mutex mutex;
    std::condition_variable ready;
    bool closed = false;

public:
    bool push(T value) {
        {
            std::lock_guard lock(mutex);
            if (closed)
                return false;
            queue.push_back(std::move(value));
        }
        ready.notify_one();
        return true;
    }

    // Blocks until a value arrives or the channel is closed and empty
    std::optional<T> pop() {
        std::unique_lock lock(mutex);
        ready.wait(lock, [this] { return closed || !queue.empty(); });
        return take_locked();
    }

    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex);
        ready.wait_for(lock, timeout, [this] { return closed || !queue.empty(); });
        return take_locked();
    }

    void close() {
        {
            std::lock_guard lock(mutex);
            closed = true;
        }
        ready.notify_all();
    }

    bool is_closed() const {
        std::lock_guard lock(mutex);
        return closed;
    }

private:
    std::optional<T> take_locked() {
        if (queue.empty())
            return std::nullopt;
        T value = std::move(queue.front());
        queue.pop_front();
        return value;
    }
};

}
