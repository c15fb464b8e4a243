#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>

namespace beamdrop::core {

// Bounded multi-producer channel. send() blocks while the channel is full,
// so a slow consumer throttles the producing session.
template<typename T>
class EventChannel {
public:
    explicit EventChannel(std::size_t capacity = 32)
        : capacity_(capacity == 0 ? 1 : capacity) {}
    
    static std::shared_ptr<EventChannel<T>> create(std::size_t capacity = 32) {
        return std::make_shared<EventChannel<T>>(capacity);
    }
    
    // Returns false once the channel is closed; the event is dropped.
    bool send(T value) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] { return closed_ || queue_.size() < capacity_; });
        if (closed_) {
            return false;
        }
        queue_.push_back(std::move(value));
        not_empty_.notify_one();
        return true;
    }
    
    // Blocks until an event arrives. Returns nullopt once closed and drained.
    std::optional<T> recv() {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return closed_ || !queue_.empty(); });
        return pop_locked();
    }
    
    std::optional<T> try_recv() {
        std::lock_guard<std::mutex> lock(mutex_);
        return pop_locked();
    }
    
    template<typename Rep, typename Period>
    std::optional<T> recv_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); });
        return pop_locked();
    }
    
    // Pending events remain readable after close.
    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        not_empty_.notify_all();
        not_full_.notify_all();
    }
    
    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }
    
    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }
    
    std::size_t capacity() const { return capacity_; }

private:
    std::optional<T> pop_locked() {
        if (queue_.empty()) {
            return std::nullopt;
        }
        T value = std::move(queue_.front());
        queue_.pop_front();
        not_full_.notify_one();
        return value;
    }
    
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<T> queue_;
    bool closed_ = false;
};

}
