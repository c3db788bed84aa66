#ifndef PRIVATE_ANALYTICS_PIPELINE_QUEUE_HPP
#define PRIVATE_ANALYTICS_PIPELINE_QUEUE_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

namespace private_analytics {

// Bounded queue between the instrumentation layer and the pipeline worker.
// Producers never block; a full or closed queue refuses the item.
template <typename T>
class EventQueue {
    mutable std::mutex _mutex;
    std::condition_variable _not_empty;
    std::deque<T> _items;
    std::size_t _capacity;
    bool _closed = false;
public:
    explicit EventQueue(std::size_t capacity) : _capacity(capacity) {}

    bool try_push(T item) {
        std::lock_guard<std::mutex> lock(this->_mutex);
        if (this->_closed || this->_items.size() >= this->_capacity) return false;
        this->_items.push_back(std::move(item));
        this->_not_empty.notify_one();
        return true;
    }

    // blocks until an item arrives; false once closed and drained
    bool pop(T& out) {
        std::unique_lock<std::mutex> lock(this->_mutex);
        this->_not_empty.wait(lock, [this]() { return this->_closed || !this->_items.empty(); });
        if (this->_items.empty()) return false;
        out = std::move(this->_items.front());
        this->_items.pop_front();
        return true;
    }

    void close() {
        std::lock_guard<std::mutex> lock(this->_mutex);
        this->_closed = true;
        this->_not_empty.notify_all();
    }

    // drops every queued item; returns how many were dropped
    std::size_t clear() {
        std::lock_guard<std::mutex> lock(this->_mutex);
        std::size_t dropped = this->_items.size();
        this->_items.clear();
        return dropped;
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(this->_mutex);
        return this->_closed;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(this->_mutex);
        return this->_items.size();
    }

    std::size_t capacity() const { return this->_capacity; }
};

} // namespace private_analytics

#endif //PRIVATE_ANALYTICS_PIPELINE_QUEUE_HPP
