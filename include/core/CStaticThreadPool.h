/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#ifndef INCLUDED_greenweb_core_CStaticThreadPool_h
#define INCLUDED_greenweb_core_CStaticThreadPool_h

#include <core/ImportExport.h>

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace greenweb {
namespace core {

//! \brief
//! A minimal fixed size thread pool for running computations off the
//! caller's thread.
//!
//! DESCRIPTION:\n
//! The pool has a fixed number of worker threads which take tasks from a
//! single queue in the order they were scheduled.
//!
//! IMPLEMENTATION DECISIONS:\n
//! Tasks are not expected to throw: if one does the exception is logged and
//! the worker carries on.  Callers who need a result or an error should
//! deliver it through a promise captured by the task.
//!
//! Destruction waits for every queued task to run.  Hence the pool should
//! be destroyed before anything its tasks reference.
//!
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

    //! Schedule a task.  Tasks scheduled after shutdown has begun are run
    //! on the calling thread.
    void schedule(TTask&& task);

private:
    using TTaskDeque = std::deque<TTask>;
    using TThreadVec = std::vector<std::thread>;

private:
    void shutdown();
    void worker();
    static void run(TTask& task);

private:
    std::mutex m_Mutex;
    std::condition_variable m_Condition;
    bool m_Done{false};
    TTaskDeque m_Tasks;
    TThreadVec m_Pool;
};
}
}

#endif // INCLUDED_greenweb_core_CStaticThreadPool_h
