#pragma once

#include <atomic>
#include <concepts>
#include <condition_variable>
#include <expected>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <stop_token>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace huddle {
namespace utils {

// Error types for thread pool operations
enum class ThreadPoolError {
    Shutdown,
    QueueFull
};

template<typename F>
concept Callable = std::is_invocable_v<F>;

template<typename F, typename... Args>
concept CallableWith = std::is_invocable_v<F, Args...>;

class ThreadPool {
public:
    explicit ThreadPool(size_t num_threads = std::thread::hardware_concurrency(),
                        size_t max_queued_tasks = 0);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    // Submit work with automatic return type deduction (throws on shutdown)
    template<Callable F>
    auto submit(F&& f) -> std::future<std::invoke_result_t<F>>;

    template<typename F, typename... Args>
    requires CallableWith<F, Args...>
    auto submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>>;

    // Non-throwing variant; QueueFull when max_queued_tasks is reached
    template<Callable F>
    auto try_submit(F&& f) -> std::expected<std::future<std::invoke_result_t<F>>, ThreadPoolError>;

    void shutdown();

    [[nodiscard]] size_t size() const { return m_thread_count; }
    [[nodiscard]] bool is_shutdown() const { return m_shutdown.load(); }

private:
    std::vector<std::jthread> m_workers;
    std::queue<std::function<void()>> m_tasks;
    mutable std::mutex m_queue_mutex;
    std::condition_variable m_condition;
    std::atomic<bool> m_shutdown{false};
    size_t m_thread_count;
    size_t m_max_queued_tasks;

    void worker_thread(std::stop_token stop_token);
};

// Template implementations for ThreadPool
template<Callable F>
auto ThreadPool::submit(F&& f) -> std::future<std::invoke_result_t<F>> {
    auto result = try_submit(std::forward<F>(f));
    if (!result) {
        throw std::runtime_error(result.error() == ThreadPoolError::Shutdown
            ? "enqueue on stopped ThreadPool"
            : "ThreadPool queue is full");
    }
    return std::move(*result);
}

template<typename F, typename... Args>
requires CallableWith<F, Args...>
auto ThreadPool::submit(F&& f, Args&&... args) -> std::future<std::invoke_result_t<F, Args...>> {
    return submit([f = std::forward<F>(f), ...args = std::forward<Args>(args)]() mutable {
        return f(args...);
    });
}

template<Callable F>
auto ThreadPool::try_submit(F&& f) -> std::expected<std::future<std::invoke_result_t<F>>, ThreadPoolError> {
    using return_type = std::invoke_result_t<F>;

    auto task = std::make_shared<std::packaged_task<return_type()>>(
        std::forward<F>(f)
    );

    std::future<return_type> res = task->get_future();
    {
        std::unique_lock<std::mutex> lock(m_queue_mutex);

        if (m_shutdown.load()) {
            return std::unexpected(ThreadPoolError::Shutdown);
        }
        if (m_max_queued_tasks != 0 && m_tasks.size() >= m_max_queued_tasks) {
            return std::unexpected(ThreadPoolError::QueueFull);
        }

        m_tasks.emplace([task]() { (*task)(); });
    }
    m_condition.notify_one();
    return res;
}

} // namespace utils
} // namespace huddle
