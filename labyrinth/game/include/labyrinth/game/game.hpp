#pragma once

#include <labyrinth/game/game_config.hpp>
#include <labyrinth/achievements/achievement_engine.hpp>
#include <labyrinth/content/content_store.hpp>
#include <labyrinth/core/errors.hpp>
#include <labyrinth/core/timer.hpp>
#include <labyrinth/events/game_events.hpp>
#include <labyrinth/progression/autosave.hpp>
#include <labyrinth/progression/progression_controller.hpp>
#include <labyrinth/progression/snapshot_store.hpp>
#include <labyrinth/quiz/quiz_engine.hpp>
#include <string>

namespace labyrinth::game {

// ============================================================================
// CommandResult
// ============================================================================

struct CommandResult {
    bool success = true;
    core::ErrorKind error = core::ErrorKind::None;
    std::string message;

    explicit operator bool() const { return success; }

    static CommandResult ok(std::string message = {}) {
        return CommandResult{true, core::ErrorKind::None, std::move(message)};
    }
};

// ============================================================================
// Game - Command surface over the progression, quiz and achievement engines
// ============================================================================
//
// Owns the event bus, the timers and the three engines; borrows the content
// and the snapshot store, which must outlive it.
//
// Every command catches core::GameError, publishes ErrorOccurred, and
// returns a failed CommandResult with the state unchanged.
//
// Events caused by one command arrive in this order:
//   1. RoomChanged, QuestionAnswered or HintUsed
//   2. ScoreChanged for the answer points or skip penalty (when non-zero)
//   3. RoomUnlocked for each newly opened neighbour, in connection order
//   4. GameCompleted, then ScoreChanged for the completion bonus
//   5. per new achievement, in declaration order: AchievementUnlocked,
//      then ScoreChanged for its reward
//   6. GameSaved when completion triggered an autosave
// A countdown expiring inside update() produces the same sequence from
// step 1.

class Game {
public:
    Game(const content::ContentStore& content,
         progression::ISnapshotStore& store,
         GameConfig config = {});
    ~Game() = default;

    Game(const Game&) = delete;
    Game& operator=(const Game&) = delete;

    // ========================================================================
    // Commands
    // ========================================================================

    CommandResult move_to_room(const std::string& room_id);

    // Asks a question in the current room
    CommandResult request_question();

    CommandResult submit_answer(int option_index);
    CommandResult skip();
    CommandResult request_hint();

    // Freezes play time, timers and the active question (focus loss)
    CommandResult pause();
    CommandResult resume();

    CommandResult save();

    // Reads the save slot, falling back to the autosave slot. A corrupt or
    // incompatible snapshot resets to a fresh game. Either way the game
    // leaves the paused state; with no snapshot at all nothing changes.
    CommandResult load();

    CommandResult reset();

    // Advance play time and timers by dt seconds
    void update(float dt);

    // ========================================================================
    // Access
    // ========================================================================

    events::GameEventBus& events() { return m_bus; }

    const content::ContentStore& content() const { return m_content; }
    const progression::ProgressionController& progression() const { return m_progression; }
    const quiz::QuizEngine& quiz() const { return m_quiz; }
    const achievements::AchievementEngine& achievements() const { return m_achievements; }
    const progression::AutosaveScheduler& autosave() const { return m_autosave; }
    const GameConfig& config() const { return m_config; }

    progression::PlayerStatistics statistics() const { return m_progression.statistics(); }
    bool is_paused() const { return m_paused; }

private:
    template<typename Fn>
    CommandResult run_command(const char* command, Fn&& fn);

    CommandResult report_error(const char* command, const core::GameError& error);

    // Victory check, achievement pass and completion autosave
    void settle();
    void evaluate_achievements();

    const content::ContentStore& m_content;
    progression::ISnapshotStore& m_store;
    GameConfig m_config;

    events::GameEventBus m_bus;
    core::TimerManager m_timers;
    progression::ProgressionController m_progression;
    quiz::QuizEngine m_quiz;
    achievements::AchievementEngine m_achievements;
    progression::AutosaveScheduler m_autosave;

    bool m_paused = false;
};

} // namespace labyrinth::game
