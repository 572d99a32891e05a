/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_rca_core_CConcurrentQueue_h
#define INCLUDED_rca_core_CConcurrentQueue_h

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <utility>

namespace rca {
namespace core {

//! \brief A thread safe multi-producer multi-consumer queue.
//!
//! DESCRIPTION:\n
//! Popping from an empty queue blocks until an item is pushed. Pushing
//! never blocks, so tasks running on a pool are free to schedule further
//! tasks on the same pool.
//!
//! The pushEmplace method forwards the constructor arguments and constructs
//! the object in-place. Example usage,
//! \code
//! CConcurrentQueue<std::pair<double, double>> queue;
//! queue.pushEmplace(0.0, 1.0);
//! \endcode
//!
//! \tparam T the type of the objects of the queue.
template<typename T>
class CConcurrentQueue final {
public:
    CConcurrentQueue() = default;

    CConcurrentQueue(const CConcurrentQueue& other) = delete;
    CConcurrentQueue(CConcurrentQueue&& other) = delete;
    CConcurrentQueue& operator=(const CConcurrentQueue& other) = delete;
    CConcurrentQueue& operator=(CConcurrentQueue&& other) = delete;

    //! Get the number of items waiting to be popped.
    std::size_t size() const {
        std::unique_lock<std::mutex> lock{m_Mutex};
        return m_Elements.size();
    }

    void push(T value) {
        {
            std::unique_lock<std::mutex> lock{m_Mutex};
            m_Elements.push_back(std::move(value));
        }
        m_Condition.notify_one();
    }

    template<typename... ARGS>
    void pushEmplace(ARGS&&... args) {
        {
            std::unique_lock<std::mutex> lock{m_Mutex};
            m_Elements.emplace_back(std::forward<ARGS>(args)...);
        }
        m_Condition.notify_one();
    }

    T pop() {
        std::unique_lock<std::mutex> lock{m_Mutex};
        m_Condition.wait(lock, [this] { return m_Elements.empty() == false; });
        T result{std::move(m_Elements.front())};
        m_Elements.pop_front();
        return result;
    }

private:
    mutable std::mutex m_Mutex;
    std::condition_variable m_Condition;
    std::deque<T> m_Elements;
};
}
}

#endif // INCLUDED_rca_core_CConcurrentQueue_h
