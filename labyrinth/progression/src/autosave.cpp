#include <labyrinth/progression/autosave.hpp>
#include <labyrinth/core/errors.hpp>
#include <labyrinth/core/log.hpp>

namespace labyrinth::progression {

AutosaveScheduler::AutosaveScheduler(core::TimerManager& timers,
                                     const ProgressionController& progression,
                                     ISnapshotStore& store,
                                     events::GameEventBus& bus,
                                     AutosaveConfig config)
    : m_timers(timers)
    , m_progression(progression)
    , m_store(store)
    , m_bus(bus)
    , m_config(std::move(config)) {}

AutosaveScheduler::~AutosaveScheduler() {
    stop();
}

void AutosaveScheduler::start() {
    if (!m_config.enabled || is_running()) {
        return;
    }
    if (m_config.interval <= 0.0f) {
        core::log(core::LogLevel::Warn, "[Autosave] Ignoring non-positive interval: {}", m_config.interval);
        return;
    }

    m_timer = m_timers.set_interval(m_config.interval, [this]() { trigger(); });
    core::log(core::LogLevel::Debug, "[Autosave] Every {}s to slot '{}'", m_config.interval, m_config.slot);
}

void AutosaveScheduler::stop() {
    if (m_timer) {
        m_timers.cancel(m_timer);
        m_timer = {};
    }
}

bool AutosaveScheduler::is_running() const {
    return m_timer && m_timers.is_active(m_timer);
}

bool AutosaveScheduler::trigger() {
    if (!m_config.enabled) {
        return false;
    }

    try {
        m_store.write(m_config.slot, m_progression.serialize().dump(2));
    } catch (const core::PersistenceError& e) {
        ++m_failure_count;
        core::log(core::LogLevel::Warn, "[Autosave] Failed: {}", e.what());
        m_bus.publish(events::ErrorOccurred{core::ErrorKind::Persistence, "autosave", e.what()});
        return false;
    }

    ++m_save_count;
    m_bus.publish(events::GameSaved{m_config.slot, true});
    return true;
}

} // namespace labyrinth::progression
