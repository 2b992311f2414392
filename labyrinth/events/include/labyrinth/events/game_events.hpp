#pragma once

#include <labyrinth/core/errors.hpp>
#include <labyrinth/core/event_bus.hpp>
#include <string>
#include <vector>
#include <variant>
#include <cstdint>

namespace labyrinth::events {

// ============================================================================
// Room Events
// ============================================================================

struct RoomChanged {
    std::string from_room_id;
    std::string to_room_id;
    bool first_visit = false;
};

struct RoomUnlocked {
    std::string room_id;
    std::string unlocked_from;      // Room whose question opened it
};

// ============================================================================
// Quiz Events
// ============================================================================

struct QuestionPresented {
    std::string question_id;
    std::string room_id;
    std::string prompt;
    std::vector<std::string> options;
    std::string category;
    int difficulty = 0;
    int points = 0;
    float time_limit = 0.0f;
    bool has_hint = false;
};

struct QuestionAnswered {
    std::string question_id;
    std::string room_id;
    int selected_index = -1;        // -1 when skipped or timed out
    int correct_index = 0;
    bool correct = false;
    bool skipped = false;
    bool timed_out = false;
    bool hint_used = false;
    int64_t points_awarded = 0;     // Negative for a skip penalty
    int time_bonus = 0;
    float time_taken = 0.0f;        // Seconds, pauses excluded
    std::string explanation;
};

struct HintUsed {
    std::string question_id;
    std::string hint;
};

struct TimerTick {
    std::string question_id;
    float time_remaining = 0.0f;
    float time_limit = 0.0f;
};

// ============================================================================
// Score and Completion Events
// ============================================================================

enum class ScoreReason : uint8_t {
    Answer,
    SkipPenalty,
    CompletionBonus,
    AchievementReward
};

struct ScoreChanged {
    int64_t delta = 0;
    int64_t score = 0;
    ScoreReason reason = ScoreReason::Answer;
};

struct AchievementUnlocked {
    std::string achievement_id;
    std::string name;
    std::string description;
    int points = 0;
    int unlocked_count = 0;
};

struct GameCompleted {
    int64_t final_score = 0;
    int completion_bonus = 0;
    int exploration_bonus = 0;
    int accuracy_bonus = 0;
    int speed_bonus = 0;
    int rooms_visited = 0;
    int rooms_total = 0;
    int questions_answered = 0;
    int questions_total = 0;
    int correct_answers = 0;
    double accuracy = 0.0;
    double play_time_seconds = 0.0;
    int performance_score = 0;
    bool perfect_game = false;
    bool speed_run = false;
};

// ============================================================================
// Session Events
// ============================================================================

struct ErrorOccurred {
    core::ErrorKind kind = core::ErrorKind::None;
    std::string command;
    std::string message;
};

struct GameSaved {
    std::string slot;
    bool autosave = false;
};

struct GameLoaded {
    std::string slot;
};

struct GameReset {
    std::string start_room_id;
};

// ============================================================================
// Event Variant
// ============================================================================

using GameEvent = std::variant<
    RoomChanged,
    RoomUnlocked,
    QuestionPresented,
    QuestionAnswered,
    HintUsed,
    TimerTick,
    ScoreChanged,
    AchievementUnlocked,
    GameCompleted,
    ErrorOccurred,
    GameSaved,
    GameLoaded,
    GameReset
>;

using GameEventBus = core::EventBus<GameEvent>;

inline const char* get_score_reason_name(ScoreReason reason) {
    switch (reason) {
        case ScoreReason::Answer:            return "answer";
        case ScoreReason::SkipPenalty:       return "skip penalty";
        case ScoreReason::CompletionBonus:   return "completion bonus";
        case ScoreReason::AchievementReward: return "achievement reward";
    }
    return "unknown";
}

} // namespace labyrinth::events
