/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <core/Concurrency.h>

#include <core/CLogger.h>

#include <exception>

namespace rca {
namespace core {

void CImmediateExecutor::schedule(TTask&& f) {
    f();
}

std::size_t CImmediateExecutor::concurrency() const {
    return 1;
}

bool CImmediateExecutor::busy() const {
    return false;
}

void CImmediateExecutor::busy(bool) {
}

CThreadPoolExecutor::CThreadPoolExecutor(std::size_t size)
    : m_ThreadPool{size} {
}

void CThreadPoolExecutor::schedule(TTask&& f) {
    m_ThreadPool.schedule(std::forward<TTask>(f));
}

std::size_t CThreadPoolExecutor::concurrency() const {
    return m_ThreadPool.size();
}

bool CThreadPoolExecutor::busy() const {
    return m_ThreadPool.busy();
}

void CThreadPoolExecutor::busy(bool value) {
    m_ThreadPool.busy(value);
}

TExecutorUPtr makeExecutor(std::size_t threads) {
    if (threads > 0) {
        try {
            return std::make_unique<CThreadPoolExecutor>(threads);
        } catch (const std::exception& e) {
            LOG_ERROR(<< "Failed to create thread pool with '" << e.what()
                      << "'. Falling back to running single threaded");
        }
    }
    // We'll just have to execute in the calling thread.
    return std::make_unique<CImmediateExecutor>();
}
}
}
