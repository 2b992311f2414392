#include <labyrinth/core/timer.hpp>
#include <iterator>
#include <utility>
#include <vector>

namespace labyrinth::core {

TimerHandle TimerManager::add(float period, int firings, Callback callback) {
    Countdown countdown;
    countdown.callback = std::move(callback);
    countdown.period = period;
    countdown.remaining = period;
    countdown.firings_left = firings;

    TimerHandle handle{++m_last_id};
    m_countdowns.emplace(handle.id, std::move(countdown));
    ++m_created;
    return handle;
}

TimerManager::Countdown* TimerManager::lookup(TimerHandle handle) {
    auto it = m_countdowns.find(handle.id);
    if (it == m_countdowns.end() || it->second.done) {
        return nullptr;
    }
    return &it->second;
}

const TimerManager::Countdown* TimerManager::lookup(TimerHandle handle) const {
    auto it = m_countdowns.find(handle.id);
    if (it == m_countdowns.end() || it->second.done) {
        return nullptr;
    }
    return &it->second;
}

// ============================================================================
// Creation
// ============================================================================

TimerHandle TimerManager::set_timeout(float delay, Callback callback) {
    return add(delay, 1, std::move(callback));
}

TimerHandle TimerManager::set_interval(float interval, Callback callback) {
    return add(interval, REPEAT_FOREVER, std::move(callback));
}

TimerHandle TimerManager::set_interval(float interval, int count, Callback callback) {
    return add(interval, count > 0 ? count : 1, std::move(callback));
}

// ============================================================================
// Control
// ============================================================================

void TimerManager::cancel(TimerHandle handle) {
    if (auto* countdown = lookup(handle)) {
        countdown->done = true;
    }
}

void TimerManager::cancel_all() {
    for (auto& [id, countdown] : m_countdowns) {
        countdown.done = true;
    }
}

void TimerManager::pause(TimerHandle handle) {
    if (auto* countdown = lookup(handle)) {
        countdown->paused = true;
    }
}

void TimerManager::resume(TimerHandle handle) {
    if (auto* countdown = lookup(handle)) {
        countdown->paused = false;
    }
}

bool TimerManager::is_active(TimerHandle handle) const {
    return lookup(handle) != nullptr;
}

bool TimerManager::is_paused(TimerHandle handle) const {
    const auto* countdown = lookup(handle);
    return countdown && countdown->paused;
}

float TimerManager::get_remaining(TimerHandle handle) const {
    const auto* countdown = lookup(handle);
    return countdown ? countdown->remaining : 0.0f;
}

void TimerManager::reset(TimerHandle handle) {
    if (auto* countdown = lookup(handle)) {
        countdown->remaining = countdown->period;
    }
}

// ============================================================================
// Update
// ============================================================================

void TimerManager::update(float dt) {
    m_fired_last_update = 0;

    // Work out every firing before running any callback, so callbacks see a
    // consistent set of timers and new ones wait for the next update
    std::vector<std::pair<uint64_t, bool>> due;
    for (auto& [id, countdown] : m_countdowns) {
        if (countdown.done || countdown.paused) {
            continue;
        }

        countdown.remaining -= dt;
        while (countdown.remaining <= 0.0f) {
            bool last = countdown.firings_left == 1 || countdown.period <= 0.0f;
            due.emplace_back(id, last);
            if (last) {
                break;
            }
            if (countdown.firings_left > 1) {
                --countdown.firings_left;
            }
            countdown.remaining += countdown.period;
        }
    }

    for (const auto& [id, last] : due) {
        auto* countdown = lookup(TimerHandle{id});
        if (!countdown || countdown->paused) {
            continue;
        }
        if (last) {
            countdown->done = true;
        }

        // Copy: the callback may add timers, which must not move this one
        Callback callback = countdown->callback;
        if (callback) {
            callback();
            ++m_fired_last_update;
        }
    }

    for (auto it = m_countdowns.begin(); it != m_countdowns.end();) {
        it = it->second.done ? m_countdowns.erase(it) : std::next(it);
    }
}

TimerManager::Stats TimerManager::get_stats() const {
    Stats stats;
    for (const auto& [id, countdown] : m_countdowns) {
        if (!countdown.done) {
            ++stats.active_timers;
        }
    }
    stats.timers_fired_this_frame = m_fired_last_update;
    stats.total_timers_created = m_created;
    return stats;
}

} // namespace labyrinth::core
