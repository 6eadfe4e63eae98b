#pragma once

/**
 * ThreadPool.hpp
 *
 * Fixed set of worker threads serving a FIFO task queue. Used to run
 * blocking HTTP transfers off the queue manager's thread.
 */

#include "Logger.hpp"

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace reelq::core {

class ThreadPool {
public:
    using Task = std::function<void()>;

    /**
     * @param workers Number of threads, at least one is started
     */
    explicit ThreadPool(size_t workers) {
        if (workers == 0) {
            workers = 1;
        }
        m_threads.reserve(workers);
        for (size_t i = 0; i < workers; ++i) {
            m_threads.emplace_back(&ThreadPool::run, this);
        }
    }

    ~ThreadPool() {
        shutdown();
    }

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    /**
     * Queue a task
     * @return false once shutdown() has begun; the task is not run
     */
    bool post(Task task) {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_closed) {
                return false;
            }
            m_tasks.push_back(std::move(task));
        }
        m_wakeup.notify_one();
        return true;
    }

    /**
     * Stop accepting tasks, run what is already queued and join the workers.
     * Safe to call more than once. Must not be called from a worker.
     */
    void shutdown() {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_closed && m_threads.empty()) {
                return;
            }
            m_closed = true;
        }
        m_wakeup.notify_all();

        for (auto& thread : m_threads) {
            if (thread.joinable()) {
                thread.join();
            }
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        m_threads.clear();
    }

    size_t workerCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_threads.size();
    }

    size_t queuedTasks() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_tasks.size();
    }

private:
    void run() {
        for (;;) {
            Task task;
            {
                std::unique_lock<std::mutex> lock(m_mutex);
                m_wakeup.wait(lock, [this] { return m_closed || !m_tasks.empty(); });
                if (m_tasks.empty()) {
                    return; // closed and drained
                }
                task = std::move(m_tasks.front());
                m_tasks.pop_front();
            }

            try {
                task();
            } catch (const std::exception& e) {
                LOG_ERROR("Pool task threw: {}", e.what());
            }
        }
    }

    mutable std::mutex m_mutex;
    std::condition_variable m_wakeup;
    std::deque<Task> m_tasks;
    std::vector<std::thread> m_threads;
    bool m_closed{false};
};

} // namespace reelq::core
