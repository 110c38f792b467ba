#include "huddle/utils/timer_manager.hpp"
#include "huddle/utils/logger.hpp"

namespace huddle::utils {

namespace {

// Rebuild the heap once superseded entries dominate it
constexpr std::size_t COMPACTION_FLOOR = 64;

}

TimerManager::TimerManager(std::size_t worker_threads)
    : m_pool(std::make_unique<ThreadPool>(worker_threads)) {
    m_scheduler = std::jthread([this](std::stop_token stop_token) {
        scheduler_loop(stop_token);
    });
    HUDDLE_LOG_DEBUG("TimerManager", "Started with " + std::to_string(m_pool->size()) + " callback workers");
}

TimerManager::~TimerManager() {
    shutdown();
}

std::expected<TimerManager::TimerId, TimerError> TimerManager::start(
    const std::string& key, core::TimerKind kind,
    std::chrono::milliseconds delay, Callback callback) {
    if (!callback) {
        return std::unexpected(TimerError::InvalidCallback);
    }

    if (delay > MAX_DELAY) {
        HUDDLE_LOG_WARNING("TimerManager", "Delay of " + std::to_string(delay.count()) + "ms for '" + key +
                           "' clamped to " + std::to_string(MAX_DELAY.count()) + "ms");
        delay = MAX_DELAY;
    }
    const auto deadline = Clock::now() + std::max(delay, std::chrono::milliseconds::zero());
    TimerKey timer_key{key, kind};
    TimerId id = 0;

    {
        std::lock_guard lock(m_mutex);
        if (m_stopped) {
            return std::unexpected(TimerError::Stopped);
        }

        id = m_next_id++;

        // A dispatched-but-not-started predecessor must not run any more
        m_dispatched.erase(timer_key);
        m_timers.insert_or_assign(timer_key, Entry{id, deadline, std::move(callback)});

        m_heap.push_back(Scheduled{deadline, id, timer_key});
        std::push_heap(m_heap.begin(), m_heap.end(), std::greater<>{});

        if (m_heap.size() > COMPACTION_FLOOR && m_heap.size() > 2 * m_timers.size()) {
            compact_locked();
        }
    }
    m_condition.notify_one();

    HUDDLE_LOG_DEBUG("TimerManager", "Scheduled " + describe(timer_key) + " #" + std::to_string(id) +
                     " in " + std::to_string(delay.count()) + "ms");
    return id;
}

bool TimerManager::cancel(const std::string& key, core::TimerKind kind) {
    TimerKey timer_key{key, kind};
    bool removed = false;

    {
        std::lock_guard lock(m_mutex);
        removed = m_timers.erase(timer_key) > 0;
        removed = m_dispatched.erase(timer_key) > 0 || removed;
    }

    if (removed) {
        HUDDLE_LOG_DEBUG("TimerManager", "Cancelled " + describe(timer_key));
    }
    return removed;
}

bool TimerManager::is_pending(const std::string& key, core::TimerKind kind) const {
    std::lock_guard lock(m_mutex);
    return m_timers.contains(TimerKey{key, kind});
}

std::size_t TimerManager::pending_count() const {
    std::lock_guard lock(m_mutex);
    return m_timers.size();
}

bool TimerManager::is_stopped() const {
    std::lock_guard lock(m_mutex);
    return m_stopped;
}

void TimerManager::shutdown() {
    std::size_t dropped = 0;
    {
        std::lock_guard lock(m_mutex);
        if (m_stopped) {
            return;
        }
        m_stopped = true;
        dropped = m_timers.size();
        m_timers.clear();
        m_dispatched.clear();
        m_heap.clear();
    }

    m_scheduler.request_stop();
    m_condition.notify_all();
    if (m_scheduler.joinable()) {
        m_scheduler.join();
    }
    m_pool->shutdown();

    HUDDLE_LOG_DEBUG("TimerManager", "Shut down, dropped " + std::to_string(dropped) + " pending timers");
}

void TimerManager::scheduler_loop(std::stop_token stop_token) {
    std::unique_lock lock(m_mutex);

    while (!stop_token.stop_requested()) {
        if (m_heap.empty()) {
            m_condition.wait(lock, stop_token, [this] { return !m_heap.empty(); });
            continue;
        }

        const auto next_deadline = m_heap.front().deadline;
        if (next_deadline > Clock::now()) {
            // Wake early when an earlier deadline is pushed
            m_condition.wait_until(lock, stop_token, next_deadline, [this, next_deadline] {
                return !m_heap.empty() && m_heap.front().deadline < next_deadline;
            });
            continue;
        }

        std::pop_heap(m_heap.begin(), m_heap.end(), std::greater<>{});
        Scheduled due = std::move(m_heap.back());
        m_heap.pop_back();

        auto it = m_timers.find(due.key);
        if (it == m_timers.end() || it->second.id != due.id) {
            continue;  // superseded or cancelled
        }

        Callback callback = std::move(it->second.callback);
        m_timers.erase(it);
        m_dispatched.insert_or_assign(due.key, due.id);

        lock.unlock();
        dispatch(std::move(due.key), due.id, std::move(callback));
        lock.lock();
    }
}

void TimerManager::dispatch(TimerKey key, TimerId id, Callback callback) {
    auto submitted = m_pool->try_submit([this, key, id, callback = std::move(callback)]() {
        run_callback(key, id, callback);
    });

    if (!submitted) {
        HUDDLE_LOG_WARNING("TimerManager", "Could not dispatch " + describe(key) + " #" + std::to_string(id) +
                           (submitted.error() == ThreadPoolError::Shutdown ? ": pool stopped" : ": pool saturated"));
        std::lock_guard lock(m_mutex);
        auto it = m_dispatched.find(key);
        if (it != m_dispatched.end() && it->second == id) {
            m_dispatched.erase(it);
        }
    }
}

void TimerManager::run_callback(const TimerKey& key, TimerId id, const Callback& callback) {
    {
        std::lock_guard lock(m_mutex);
        auto it = m_dispatched.find(key);
        if (m_stopped || it == m_dispatched.end() || it->second != id) {
            HUDDLE_LOG_DEBUG("TimerManager", "Skipping superseded " + describe(key) + " #" + std::to_string(id));
            return;
        }
        m_dispatched.erase(it);
    }

    try {
        callback();
    } catch (const std::exception& e) {
        m_failed_callbacks.fetch_add(1);
        HUDDLE_LOG_ERROR("TimerManager", "Callback for " + describe(key) + " threw: " + e.what());
    }
}

void TimerManager::compact_locked() {
    const auto before = m_heap.size();
    std::erase_if(m_heap, [this](const Scheduled& scheduled) {
        auto it = m_timers.find(scheduled.key);
        return it == m_timers.end() || it->second.id != scheduled.id;
    });
    std::make_heap(m_heap.begin(), m_heap.end(), std::greater<>{});
    HUDDLE_LOG_DEBUG("TimerManager", "Compacted heap from " + std::to_string(before) +
                     " to " + std::to_string(m_heap.size()) + " entries");
}

std::string TimerManager::describe(const TimerKey& key) {
    return std::string(core::to_string(key.kind)) + " timer for '" + key.key + "'";
}

} // namespace huddle::utils
