#include <labyrinth/game/game.hpp>
#include <labyrinth/core/log.hpp>

namespace labyrinth::game {

Game::Game(const content::ContentStore& content,
           progression::ISnapshotStore& store,
           GameConfig config)
    : m_content(content)
    , m_store(store)
    , m_config(std::move(config))
    , m_progression(content, m_bus, m_config.victory)
    , m_quiz(content, m_progression, m_timers, m_bus, m_config.quiz)
    , m_achievements(content.achievements())
    , m_autosave(m_timers, m_progression, store, m_bus, m_config.autosave) {
    m_progression.set_player_name(m_config.player_name);
    m_quiz.set_outcome_callback([this](const events::QuestionAnswered&) { settle(); });
    m_autosave.start();

    core::log(core::LogLevel::Info, "[Game] Started in {} ({} rooms, {} questions)",
              m_progression.current_room_id(), content.room_count(), content.question_count());
}

// ============================================================================
// Command Boundary
// ============================================================================

template<typename Fn>
CommandResult Game::run_command(const char* command, Fn&& fn) {
    try {
        return fn();
    } catch (const core::GameError& e) {
        return report_error(command, e);
    }
}

CommandResult Game::report_error(const char* command, const core::GameError& error) {
    core::log(core::LogLevel::Warn, "[Game] {} failed ({}): {}",
              command, core::get_error_kind_name(error.kind()), error.what());
    m_bus.publish(events::ErrorOccurred{error.kind(), command, error.what()});
    return CommandResult{false, error.kind(), error.what()};
}

void Game::settle() {
    auto completed = m_progression.check_victory();
    evaluate_achievements();
    if (completed) {
        m_autosave.trigger();
    }
}

void Game::evaluate_achievements() {
    const auto stats = m_progression.statistics();
    const auto newly_satisfied = m_achievements.evaluate(stats, m_progression.state().unlocked_achievement_ids);

    for (const auto& id : newly_satisfied) {
        const auto* def = m_achievements.find(id);
        if (!def || !m_progression.grant_achievement(id)) {
            continue;
        }

        core::log(core::LogLevel::Info, "[Game] Achievement unlocked: {} (+{})", def->display_name, def->points);

        events::AchievementUnlocked event;
        event.achievement_id = def->achievement_id;
        event.name = def->display_name;
        event.description = def->description;
        event.points = def->points;
        event.unlocked_count = static_cast<int>(m_progression.state().unlocked_achievement_ids.size());
        m_bus.publish(event);

        if (def->points != 0) {
            m_progression.apply_score_delta(def->points, events::ScoreReason::AchievementReward);
        }
    }
}

// ============================================================================
// Commands
// ============================================================================

CommandResult Game::move_to_room(const std::string& room_id) {
    return run_command("move_to_room", [&]() {
        m_progression.move_to_room(room_id);
        settle();
        return CommandResult::ok("Moved to " + room_id);
    });
}

CommandResult Game::request_question() {
    return run_command("request_question", [&]() {
        const auto& question = m_quiz.request_question(m_progression.current_room_id());
        return CommandResult::ok(question.id);
    });
}

CommandResult Game::submit_answer(int option_index) {
    return run_command("submit_answer", [&]() {
        auto outcome = m_quiz.submit_answer(option_index);
        return CommandResult::ok(outcome.correct ? "correct" : "incorrect");
    });
}

CommandResult Game::skip() {
    return run_command("skip", [&]() {
        m_quiz.skip();
        return CommandResult::ok("skipped");
    });
}

CommandResult Game::request_hint() {
    return run_command("request_hint", [&]() {
        return CommandResult::ok(m_quiz.request_hint());
    });
}

CommandResult Game::pause() {
    return run_command("pause", [&]() {
        if (m_paused) {
            throw core::StateError(core::StateErrorCode::InvalidTimerTransition, "Game is already paused");
        }
        if (m_quiz.timer_state() == quiz::TimerState::Running) {
            m_quiz.pause();
        }
        m_paused = true;
        core::log(core::LogLevel::Debug, "[Game] Paused");
        return CommandResult::ok("paused");
    });
}

CommandResult Game::resume() {
    return run_command("resume", [&]() {
        if (!m_paused) {
            throw core::StateError(core::StateErrorCode::InvalidTimerTransition, "Game is not paused");
        }
        if (m_quiz.timer_state() == quiz::TimerState::Paused) {
            m_quiz.resume();
        }
        m_paused = false;
        core::log(core::LogLevel::Debug, "[Game] Resumed");
        return CommandResult::ok("resumed");
    });
}

CommandResult Game::save() {
    return run_command("save", [&]() {
        m_store.write(m_config.save_slot, m_progression.serialize().dump(2));
        core::log(core::LogLevel::Info, "[Game] Saved to slot '{}'", m_config.save_slot);
        m_bus.publish(events::GameSaved{m_config.save_slot, false});
        return CommandResult::ok(m_config.save_slot);
    });
}

CommandResult Game::load() {
    return run_command("load", [&]() {
        std::string slot = m_config.save_slot;
        auto text = m_store.read(slot);
        if (!text) {
            slot = m_config.autosave.slot;
            text = m_store.read(slot);
        }
        if (!text) {
            throw core::PersistenceError("No saved game");
        }

        try {
            auto snapshot = progression::parse_snapshot_text(*text);
            m_progression.restore(snapshot);
        } catch (const core::PersistenceError& e) {
            // Discard the snapshot and start over
            core::log(core::LogLevel::Warn, "[Game] Saved game in slot '{}' is unusable, starting fresh", slot);
            m_quiz.abandon();
            m_quiz.set_adaptive_state(quiz::make_adaptive_state(m_config.quiz.difficulty));
            m_progression.reset();
            m_paused = false;
            m_bus.publish(events::GameReset{m_progression.current_room_id()});
            throw;
        }

        m_quiz.abandon();
        m_quiz.set_adaptive_state(quiz::make_adaptive_state(m_config.quiz.difficulty));
        m_paused = false;
        m_bus.publish(events::GameLoaded{slot});
        return CommandResult::ok(slot);
    });
}

CommandResult Game::reset() {
    return run_command("reset", [&]() {
        m_quiz.abandon();
        m_quiz.set_adaptive_state(quiz::make_adaptive_state(m_config.quiz.difficulty));
        m_progression.reset();
        m_paused = false;
        m_bus.publish(events::GameReset{m_progression.current_room_id()});
        return CommandResult::ok(m_progression.current_room_id());
    });
}

// ============================================================================
// Update
// ============================================================================

void Game::update(float dt) {
    if (m_paused || dt <= 0.0f) {
        return;
    }

    try {
        m_progression.add_play_time(dt);
        m_timers.update(dt);
    } catch (const core::GameError& e) {
        report_error("update", e);
    }
}

} // namespace labyrinth::game
