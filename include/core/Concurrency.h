/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_rca_core_Concurrency_h
#define INCLUDED_rca_core_Concurrency_h

#include <core/CStaticThreadPool.h>
#include <core/ImportExport.h>

#include <functional>
#include <future>
#include <memory>
#include <type_traits>
#include <vector>

namespace rca {
namespace core {

//! \brief The base executor hierarchy.
class CORE_EXPORT CExecutor {
public:
    using TTask = std::function<void()>;

public:
    virtual ~CExecutor() = default;
    virtual void schedule(TTask&& f) = 0;
    //! The number of tasks which can run concurrently.
    virtual std::size_t concurrency() const = 0;
    virtual bool busy() const = 0;
    virtual void busy(bool value) = 0;
};

//! \brief Executes a function immediately (on the calling thread).
class CORE_EXPORT CImmediateExecutor final : public CExecutor {
public:
    void schedule(TTask&& f) override;
    std::size_t concurrency() const override;
    bool busy() const override;
    void busy(bool) override;
};

//! \brief Executes a function in a thread pool.
class CORE_EXPORT CThreadPoolExecutor final : public CExecutor {
public:
    explicit CThreadPoolExecutor(std::size_t size);

    void schedule(TTask&& f) override;
    std::size_t concurrency() const override;
    bool busy() const override;
    void busy(bool value) override;

private:
    CStaticThreadPool m_ThreadPool;
};

using TExecutorUPtr = std::unique_ptr<CExecutor>;

//! Make an executor which runs at most \p threads tasks concurrently.
//!
//! \note If \p threads is zero, or a thread pool can't be created, tasks
//! execute in the thread which schedules them.
CORE_EXPORT
TExecutorUPtr makeExecutor(std::size_t threads);

//! A version of std::async which uses a specified executor.
//!
//! Exceptions thrown by \p f are captured in the returned future.
template<typename FUNCTION>
auto async(CExecutor& executor, FUNCTION&& f) {
    using TResult = std::result_of_t<std::decay_t<FUNCTION>()>;
    auto task = std::make_shared<std::packaged_task<TResult()>>(std::forward<FUNCTION>(f));
    std::future<TResult> result{task->get_future()};
    executor.schedule([task] { (*task)(); });
    return result;
}

//! Wait for all \p futures to be ready.
template<typename R>
void waitForAll(const std::vector<std::future<R>>& futures) {
    for (const auto& future : futures) {
        if (future.valid()) {
            future.wait();
        }
    }
}
}
}

#endif // INCLUDED_rca_core_Concurrency_h
