#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>

namespace labyrinth::core {

struct TimerHandle {
    uint64_t id = 0;

    bool valid() const { return id != 0; }
    explicit operator bool() const { return valid(); }

    bool operator==(const TimerHandle&) const = default;
};

// ============================================================================
// TimerManager - Countdowns advanced by the host loop
// ============================================================================
//
// There is no clock of its own: time only moves when update(dt) is called,
// so a paused game simply stops calling it. Due callbacks fire in creation
// order. A callback may cancel or pause any timer, including one due in the
// same update, and timers it creates start counting on the next update.

class TimerManager {
public:
    using Callback = std::function<void()>;

    static constexpr int REPEAT_FOREVER = -1;

    TimerManager() = default;

    TimerManager(const TimerManager&) = delete;
    TimerManager& operator=(const TimerManager&) = delete;

    // Fires once after delay seconds
    TimerHandle set_timeout(float delay, Callback callback);

    // Fires every interval seconds until cancelled
    TimerHandle set_interval(float interval, Callback callback);

    // Fires every interval seconds, count times
    TimerHandle set_interval(float interval, int count, Callback callback);

    void cancel(TimerHandle handle);
    void cancel_all();

    void pause(TimerHandle handle);
    void resume(TimerHandle handle);

    // False once a timer is cancelled or has fired for the last time
    bool is_active(TimerHandle handle) const;
    bool is_paused(TimerHandle handle) const;

    // Seconds until the next firing, 0 for an unknown handle
    float get_remaining(TimerHandle handle) const;

    // Start the current period over
    void reset(TimerHandle handle);

    void update(float dt);

    struct Stats {
        size_t active_timers = 0;
        size_t timers_fired_this_frame = 0;
        size_t total_timers_created = 0;
    };

    Stats get_stats() const;

private:
    struct Countdown {
        Callback callback;
        float period = 0.0f;
        float remaining = 0.0f;
        int firings_left = 1;       // REPEAT_FOREVER for plain intervals
        bool paused = false;
        bool done = false;
    };

    TimerHandle add(float period, int firings, Callback callback);
    Countdown* lookup(TimerHandle handle);
    const Countdown* lookup(TimerHandle handle) const;

    // Keyed by handle id, which also gives creation order
    std::map<uint64_t, Countdown> m_countdowns;
    uint64_t m_last_id = 0;
    size_t m_fired_last_update = 0;
    size_t m_created = 0;
};

} // namespace labyrinth::core
