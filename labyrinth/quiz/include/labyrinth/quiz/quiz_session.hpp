#pragma once

#include <labyrinth/quiz/adaptive_difficulty.hpp>
#include <cstdint>
#include <string>

namespace labyrinth::quiz {

// ============================================================================
// Timer State
// ============================================================================
//
//   Idle --request--> Running <--pause/resume--> Paused
//   Running/Paused --answer/skip--> Answered
//   Running --countdown reaches zero--> Expired
//   Answered/Expired --request--> Running (next question)

enum class TimerState : uint8_t {
    Idle,
    Running,
    Paused,
    Expired,
    Answered
};

inline const char* get_timer_state_name(TimerState state) {
    switch (state) {
        case TimerState::Idle:     return "Idle";
        case TimerState::Running:  return "Running";
        case TimerState::Paused:   return "Paused";
        case TimerState::Expired:  return "Expired";
        case TimerState::Answered: return "Answered";
    }
    return "Unknown";
}

// ============================================================================
// QuizSession - The one question currently in play
// ============================================================================

struct QuizSession {
    std::string question_id;
    std::string room_id;            // Room the question was asked from
    float time_limit = 0.0f;
    float time_remaining = 0.0f;    // Updated on each tick
    TimerState state = TimerState::Idle;
    bool hint_used = false;
    AdaptiveState adaptive;         // Streaks/target when the question was chosen

    bool is_active() const { return state == TimerState::Running || state == TimerState::Paused; }
};

} // namespace labyrinth::quiz
