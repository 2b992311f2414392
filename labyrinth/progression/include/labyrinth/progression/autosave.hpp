#pragma once

#include <labyrinth/progression/progression_controller.hpp>
#include <labyrinth/progression/snapshot_store.hpp>
#include <labyrinth/core/timer.hpp>
#include <labyrinth/events/game_events.hpp>
#include <string>

namespace labyrinth::progression {

struct AutosaveConfig {
    bool enabled = true;
    float interval = 30.0f;         // Seconds of play between saves
    std::string slot = "autosave";
};

// ============================================================================
// AutosaveScheduler - Periodic snapshot writes on a repeating timer
// ============================================================================
//
// The timer lives exactly as long as the scheduler. A failed write is
// logged and published as ErrorOccurred; the game carries on.

class AutosaveScheduler {
public:
    AutosaveScheduler(core::TimerManager& timers,
                      const ProgressionController& progression,
                      ISnapshotStore& store,
                      events::GameEventBus& bus,
                      AutosaveConfig config = {});
    ~AutosaveScheduler();

    AutosaveScheduler(const AutosaveScheduler&) = delete;
    AutosaveScheduler& operator=(const AutosaveScheduler&) = delete;

    // Starts the repeating timer (no-op when disabled or already running)
    void start();
    void stop();
    bool is_running() const;

    // Write the autosave slot now; publishes GameSaved{autosave} on success
    bool trigger();

    const AutosaveConfig& config() const { return m_config; }
    size_t save_count() const { return m_save_count; }
    size_t failure_count() const { return m_failure_count; }

private:
    core::TimerManager& m_timers;
    const ProgressionController& m_progression;
    ISnapshotStore& m_store;
    events::GameEventBus& m_bus;
    AutosaveConfig m_config;

    core::TimerHandle m_timer;
    size_t m_save_count = 0;
    size_t m_failure_count = 0;
};

} // namespace labyrinth::progression
