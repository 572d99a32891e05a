/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <core/CStaticThreadPool.h>

#include <core/CLogger.h>

#include <algorithm>
#include <exception>

namespace rca {
namespace core {
namespace {
std::size_t computeSize(std::size_t hint) {
    std::size_t bound{std::thread::hardware_concurrency()};
    std::size_t size{bound > 0 ? std::min(hint, bound) : hint};
    return std::max(size, std::size_t{1});
}
}

CStaticThreadPool::CStaticThreadPool(std::size_t size) : m_Busy{false} {
    size = computeSize(size);
    m_Pool.reserve(size);
    for (std::size_t id = 0; id < size; ++id) {
        try {
            m_Pool.emplace_back([this] { this->worker(); });
        } catch (const std::exception& e) {
            LOG_ERROR(<< "Failed to start pool thread " << id << ": " << e.what());
            this->shutdown();
            throw;
        }
    }
}

CStaticThreadPool::~CStaticThreadPool() {
    this->shutdown();
}

std::size_t CStaticThreadPool::size() const {
    return m_Pool.size();
}

void CStaticThreadPool::schedule(TTask&& task) {
    if (task == nullptr) {
        return;
    }
    m_TaskQueue.push(CWrappedTask{std::forward<TTask>(task)});
}

bool CStaticThreadPool::busy() const {
    return m_Busy.load();
}

void CStaticThreadPool::busy(bool value) {
    m_Busy.store(value);
}

void CStaticThreadPool::shutdown() {
    // Signal to each thread that it is finished. Each worker pops exactly
    // one stop task, after everything scheduled before it.
    for (std::size_t id = 0; id < m_Pool.size(); ++id) {
        m_TaskQueue.push(CWrappedTask{});
    }

    for (auto& thread : m_Pool) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    m_Pool.clear();
}

void CStaticThreadPool::worker() {
    while (true) {
        CWrappedTask task{m_TaskQueue.pop()};
        if (task.isStop()) {
            break;
        }
        task();
    }
}

CStaticThreadPool::CWrappedTask::CWrappedTask(TTask&& task)
    : m_Task{std::forward<TTask>(task)} {
}

bool CStaticThreadPool::CWrappedTask::isStop() const {
    return m_Task == nullptr;
}

void CStaticThreadPool::CWrappedTask::operator()() {
    if (m_Task != nullptr) {
        try {
            m_Task();
        } catch (const std::exception& e) {
            LOG_ERROR(<< "Failed executing task with error '" << e.what() << "'");
        }
    }
}
}
}
