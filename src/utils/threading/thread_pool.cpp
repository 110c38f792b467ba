#include "huddle/utils/threading.hpp"
#include "huddle/utils/logger.hpp"

#include <algorithm>

namespace huddle {
namespace utils {

ThreadPool::ThreadPool(size_t num_threads, size_t max_queued_tasks)
    : m_thread_count(std::max<size_t>(1, num_threads))
    , m_max_queued_tasks(max_queued_tasks) {
    m_workers.reserve(m_thread_count);

    for (size_t i = 0; i < m_thread_count; ++i) {
        m_workers.emplace_back([this](std::stop_token stop_token) {
            worker_thread(stop_token);
        });
    }
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::shutdown() {
    {
        std::lock_guard lock(m_queue_mutex);
        if (m_shutdown.exchange(true)) {
            return;
        }
    }

    m_condition.notify_all();

    for (auto& worker : m_workers) {
        if (worker.joinable()) {
            worker.request_stop();
        }
    }

    // jthread joins on destruction
    m_workers.clear();

    std::lock_guard lock(m_queue_mutex);
    if (!m_tasks.empty()) {
        HUDDLE_LOG_DEBUG("ThreadPool", "Discarding " + std::to_string(m_tasks.size()) +
            " queued task(s) on shutdown");
        m_tasks = {};
    }
}

void ThreadPool::worker_thread(std::stop_token stop_token) {
    while (!stop_token.stop_requested() && !m_shutdown.load()) {
        std::function<void()> task;

        {
            std::unique_lock lock(m_queue_mutex);
            m_condition.wait(lock, [this, &stop_token] {
                return !m_tasks.empty() || m_shutdown.load() || stop_token.stop_requested();
            });

            if (m_shutdown.load() || stop_token.stop_requested()) {
                break;
            }

            task = std::move(m_tasks.front());
            m_tasks.pop();
        }

        // packaged_task stores exceptions in its future; this only sees
        // failures raised while running the wrapper itself
        try {
            task();
        } catch (const std::exception& e) {
            HUDDLE_LOG_ERROR("ThreadPool", "Task failed: " + std::string(e.what()));
        }
    }
}

} // namespace utils
} // namespace huddle
