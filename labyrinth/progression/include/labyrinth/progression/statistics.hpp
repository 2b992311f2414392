#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace labyrinth::progression {

// ============================================================================
// PlayerStatistics - Read-only view handed to achievement triggers and UI
// ============================================================================

struct PlayerStatistics {
    int rooms_visited = 0;
    int rooms_total = 0;
    std::set<std::string> visited_room_ids;

    int questions_answered = 0;
    int questions_total = 0;
    int correct_answers = 0;
    double accuracy = 0.0;          // 0..1, 0 when nothing answered

    int current_streak = 0;
    int best_streak = 0;
    int incorrect_streak = 0;
    int best_comeback = 0;
    int hints_used = 0;
    int questions_skipped = 0;
    int questions_timed_out = 0;
    std::vector<float> correct_answer_times;

    int64_t score = 0;
    double elapsed_play_seconds = 0.0;
    bool completed = false;

    double explored_ratio() const {
        return rooms_total > 0 ? static_cast<double>(rooms_visited) / rooms_total : 0.0;
    }

    double answered_ratio() const {
        return questions_total > 0 ? static_cast<double>(questions_answered) / questions_total : 0.0;
    }

    int incorrect_answers() const { return questions_answered - correct_answers; }
};

} // namespace labyrinth::progression
