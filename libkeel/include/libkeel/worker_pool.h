//
// Created by cv2 on 10/4/25.
//

#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace keel {

    // Fixed-size pool of worker threads fed from one FIFO queue. Lives for a
    // single executor invocation; the destructor drains the queue and joins.
    class WorkerPool {
    public:
        using Task = std::function<void()>;

        explicit WorkerPool(std::size_t threads);
        ~WorkerPool();

        WorkerPool(const WorkerPool&) = delete;
        WorkerPool& operator=(const WorkerPool&) = delete;

        // `on_cancel` runs instead of `task` if the job is withdrawn by cancel_pending().
        void enqueue(Task task, Task on_cancel = {});

        // Removes every job no worker has picked up yet and runs its cancel
        // handler on the calling thread. Returns how many jobs were withdrawn.
        std::size_t cancel_pending();

        std::size_t size() const { return m_workers.size(); }

    private:
        struct Job {
            Task run;
            Task on_cancel;
        };

        void worker_loop();

        std::vector<std::thread> m_workers;
        std::deque<Job> m_jobs;
        std::mutex m_mutex;
        std::condition_variable m_condition;
        bool m_stopping = false;
    };

} // namespace keel
