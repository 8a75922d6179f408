#pragma once
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace hdrguard {

// Many producers, one consumer.
template <class T>
class Channel {
public:
    void send(T v) {
        {
            std::lock_guard<std::mutex> lk(m_);
            q_.push_back(std::move(v));
        }
        cv_.notify_one();
    }

    // Blocks until a value arrives; nullopt once closed and drained.
    std::optional<T> receive() {
        std::unique_lock<std::mutex> lk(m_);
        cv_.wait(lk, [&]{ return closed_ || !q_.empty(); });
        if (q_.empty()) return std::nullopt;
        T v = std::move(q_.front());
        q_.pop_front();
        return v;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lk(m_);
            closed_ = true;
        }
        cv_.notify_all();
    }

private:
    std::mutex m_;
    std::condition_variable cv_;
    std::deque<T> q_;
    bool closed_{false};
};

} // namespace hdrguard
