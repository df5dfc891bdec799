//
// Created by cv2 on 10/4/25.
//

#include "libkeel/worker_pool.h"
#include "libkeel/logging.h"

#include <stdexcept>

namespace keel {

    WorkerPool::WorkerPool(std::size_t threads) {
        if (threads == 0) {
            threads = 1;
        }
        m_workers.reserve(threads);
        for (std::size_t i = 0; i < threads; ++i) {
            m_workers.emplace_back([this] { worker_loop(); });
        }
    }

    WorkerPool::~WorkerPool() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_stopping = true;
        }
        m_condition.notify_all();
        for (auto& worker : m_workers) {
            worker.join();
        }
    }

    void WorkerPool::enqueue(Task task, Task on_cancel) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_stopping) {
                throw std::runtime_error("enqueue on a stopped worker pool");
            }
            m_jobs.push_back(Job{std::move(task), std::move(on_cancel)});
        }
        m_condition.notify_one();
    }

    std::size_t WorkerPool::cancel_pending() {
        std::deque<Job> withdrawn;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            withdrawn.swap(m_jobs);
        }

        // Handlers run without the lock held; they are free to touch the pool's callers.
        for (auto& job : withdrawn) {
            if (job.on_cancel) {
                job.on_cancel();
            }
        }
        return withdrawn.size();
    }

    void WorkerPool::worker_loop() {
        while (true) {
            Job job;
            {
                std::unique_lock<std::mutex> lock(m_mutex);
                m_condition.wait(lock, [this] { return m_stopping || !m_jobs.empty(); });
                if (m_stopping && m_jobs.empty()) {
                    return;
                }
                job = std::move(m_jobs.front());
                m_jobs.pop_front();
            }

            // One bad job must not take the worker down with it.
            try {
                job.run();
            } catch (const std::exception& e) {
                log::error(std::string("Worker task threw: ") + e.what());
            }
        }
    }

} // namespace keel
