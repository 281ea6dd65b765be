/*
 * Copyright Elasticsearch B.V. and/or licensed to Elasticsearch B.V. under one
 * or more contributor license agreements. Licensed under the Elastic License;
 * you may not use this file except in compliance with the Elastic License.
 */
#include <core/CStaticThreadPool.h>

#include <core/CLogger.h>

#include <algorithm>
#include <exception>

namespace greenweb {
namespace core {

CStaticThreadPool::CStaticThreadPool(std::size_t size) {
    size = std::max(size, std::size_t{1});
    m_Pool.reserve(size);
    for (std::size_t id = 0; id < size; ++id) {
        m_Pool.emplace_back([this] { this->worker(); });
    }
}

CStaticThreadPool::~CStaticThreadPool() {
    this->shutdown();
}

void CStaticThreadPool::schedule(TTask&& task) {
    {
        std::unique_lock<std::mutex> lock{m_Mutex};
        if (m_Done == false) {
            m_Tasks.push_back(std::move(task));
            lock.unlock();
            m_Condition.notify_one();
            return;
        }
    }
    LOG_WARN(<< "Thread pool is shutting down: running task on the calling thread");
    run(task);
}

void CStaticThreadPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock{m_Mutex};
        m_Done = true;
    }
    m_Condition.notify_all();
    for (auto& thread : m_Pool) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    m_Pool.clear();
}

void CStaticThreadPool::worker() {
    for (;;) {
        TTask task;
        {
            std::unique_lock<std::mutex> lock{m_Mutex};
            m_Condition.wait(lock, [this] { return m_Done || m_Tasks.empty() == false; });
            if (m_Tasks.empty()) {
                // Only reachable once shutdown has started
                return;
            }
            task = std::move(m_Tasks.front());
            m_Tasks.pop_front();
        }
        run(task);
    }
}

void CStaticThreadPool::run(TTask& task) {
    try {
        if (task) {
            task();
        }
    } catch (const std::exception& e) {
        LOG_ERROR(<< "Thread pool task failed: " << e.what());
    }
}
}
}
