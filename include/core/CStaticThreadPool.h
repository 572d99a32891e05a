/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_rca_core_CStaticThreadPool_h
#define INCLUDED_rca_core_CStaticThreadPool_h

#include <core/CConcurrentQueue.h>
#include <core/ImportExport.h>

#include <atomic>
#include <cstddef>
#include <functional>
#include <thread>
#include <vector>

namespace rca {
namespace core {

//! \brief A minimal fixed size thread pool.
//!
//! IMPLEMENTATION:\n
//! This purposely has very limited interface and is intended to mainly support
//! CThreadPoolExecutor which provides the mechanism by which we expose the thread
//! pool to the rest of the code via calls to core::async.
//!
//! Exceptions thrown by a task are caught and logged by the worker which ran
//! it, so they never terminate the pool.
class CORE_EXPORT CStaticThreadPool {
public:
    using TTask = std::function<void()>;

public:
    explicit CStaticThreadPool(std::size_t size);

    ~CStaticThreadPool();

    CStaticThreadPool(const CStaticThreadPool&) = delete;
    CStaticThreadPool(CStaticThreadPool&&) = delete;
    CStaticThreadPool& operator=(const CStaticThreadPool&) = delete;
    CStaticThreadPool& operator=(CStaticThreadPool&&) = delete;

    //! Get the number of threads in the pool.
    std::size_t size() const;

    //! Schedule a Callable type to be executed by a thread in the pool.
    void schedule(TTask&& task);

    //! Check if the thread pool has been marked as busy.
    bool busy() const;

    //! Mark the thread pool as busy.
    void busy(bool busy);

private:
    class CWrappedTask {
    public:
        CWrappedTask() = default;
        explicit CWrappedTask(TTask&& task);

        //! An empty task tells the worker which pops it to exit.
        bool isStop() const;
        void operator()();

    private:
        TTask m_Task;
    };
    using TWrappedTaskQueue = CConcurrentQueue<CWrappedTask>;
    using TThreadVec = std::vector<std::thread>;

private:
    void shutdown();
    void worker();

private:
    std::atomic_bool m_Busy;
    TWrappedTaskQueue m_TaskQueue;
    TThreadVec m_Pool;
};
}
}

#endif // INCLUDED_rca_core_CStaticThreadPool_h
