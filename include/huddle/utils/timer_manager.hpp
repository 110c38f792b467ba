#pragma once

#include "huddle/core/models.hpp"
#include "huddle/utils/threading.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <compare>
#include <condition_variable>
#include <cstdint>
#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace huddle::utils {

enum class TimerError {
    Stopped,
    InvalidCallback
};

/**
 * @brief Keyed one-shot timers backed by a single scheduler thread
 *
 * At most one timer exists per (key, kind). Starting a timer replaces the
 * previous one for the same pair; superseded heap entries are skipped when
 * they surface. Due callbacks run on an internal ThreadPool, never under
 * the manager's lock, and exceptions they throw are logged and contained.
 *
 * shutdown() joins the pool and must not be called from inside a callback.
 */
class TimerManager {
public:
    using Clock = std::chrono::steady_clock;
    using Callback = std::function<void()>;
    using TimerId = std::uint64_t;

    // Longer delays are clamped so the deadline stays representable
    static constexpr std::chrono::milliseconds MAX_DELAY{std::chrono::hours{24 * 365}};

    explicit TimerManager(std::size_t worker_threads = 2);
    ~TimerManager();

    TimerManager(const TimerManager&) = delete;
    TimerManager& operator=(const TimerManager&) = delete;
    TimerManager(TimerManager&&) = delete;
    TimerManager& operator=(TimerManager&&) = delete;

    std::expected<TimerId, TimerError> start(const std::string& key, core::TimerKind kind,
                                             std::chrono::milliseconds delay, Callback callback);

    // Returns true if a pending or dispatched-but-not-started timer was dropped
    bool cancel(const std::string& key, core::TimerKind kind);

    [[nodiscard]] bool is_pending(const std::string& key, core::TimerKind kind) const;
    [[nodiscard]] std::size_t pending_count() const;
    [[nodiscard]] std::size_t failed_callback_count() const { return m_failed_callbacks.load(); }
    [[nodiscard]] bool is_stopped() const;

    void shutdown();

private:
    struct TimerKey {
        std::string key;
        core::TimerKind kind;

        auto operator<=>(const TimerKey&) const = default;
    };

    struct Entry {
        TimerId id;
        Clock::time_point deadline;
        Callback callback;
    };

    struct Scheduled {
        Clock::time_point deadline;
        TimerId id;
        TimerKey key;

        bool operator>(const Scheduled& other) const {
            if (deadline != other.deadline) {
                return deadline > other.deadline;
            }
            return id > other.id;
        }
    };

    void scheduler_loop(std::stop_token stop_token);
    void dispatch(TimerKey key, TimerId id, Callback callback);
    void run_callback(const TimerKey& key, TimerId id, const Callback& callback);
    void compact_locked();
    static std::string describe(const TimerKey& key);

    std::unique_ptr<ThreadPool> m_pool;

    mutable std::mutex m_mutex;
    std::condition_variable_any m_condition;
    std::map<TimerKey, Entry> m_timers;
    std::map<TimerKey, TimerId> m_dispatched;
    std::vector<Scheduled> m_heap;  // min-heap on deadline; may hold superseded entries
    TimerId m_next_id = 1;
    bool m_stopped = false;

    std::atomic<std::size_t> m_failed_callbacks{0};
    std::jthread m_scheduler;
};

} // namespace huddle::utils
