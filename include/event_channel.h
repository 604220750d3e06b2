#pragma once

#include <condition_variable>
#include <deque>
#include <exception>
#include <mutex>

#include "imports.h"

// Append only FIFO between the thread producing synthesis events and the thread consuming them.
// The producer closes the channel once, either cleanly or with the error that ended production.
template <typename T>
class event_channel {
    std::mutex rw_mutex;
    std::condition_variable condition;
    std::deque<T> queue;
    bool closed = false;
    std::exception_ptr error = nullptr;

public:
    void send(T value) {
        std::lock_guard<std::mutex> lock(rw_mutex);
        KOKORO_ASSERT(!closed);
        queue.push_back(std::move(value));
        condition.notify_one();
    }

    void close() {
        std::lock_guard<std::mutex> lock(rw_mutex);
        closed = true;
        condition.notify_all();
    }

    void close_with_error(std::exception_ptr ep) {
        std::lock_guard<std::mutex> lock(rw_mutex);
        closed = true;
        error = ep;
        condition.notify_all();
    }

    // Blocks until a value is available. Values sent before the channel was closed are always delivered
    // first; afterwards this returns false, or rethrows the error the channel was closed with.
    bool recv(T & out) {
        std::unique_lock<std::mutex> lock(rw_mutex);
        condition.wait(lock, [&]{
            return !queue.empty() || closed;
        });
        if (!queue.empty()) {
            out = std::move(queue.front());
            queue.pop_front();
            return true;
        }
        if (error) {
            std::rethrow_exception(error);
        }
        return false;
    }

    bool is_closed() {
        std::lock_guard<std::mutex> lock(rw_mutex);
        return closed;
    }

    size_t size() {
        std::lock_guard<std::mutex> lock(rw_mutex);
        return queue.size();
    }
};
