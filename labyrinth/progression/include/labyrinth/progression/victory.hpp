#pragma once

#include <labyrinth/progression/progression_state.hpp>
#include <labyrinth/progression/statistics.hpp>

namespace labyrinth::progression {

// ============================================================================
// VictoryConfig - Thresholds and bonus constants
// ============================================================================

struct VictoryConfig {
    double min_explored_ratio = 0.8;
    double min_answered_ratio = 0.7;
    double min_accuracy = 0.7;

    int completion_bonus = 500;
    int exploration_bonus_per_room = 10;
    int accuracy_bonus_scale = 1000;        // floor(accuracy * scale)
    int speed_bonus = 750;
    double speed_threshold_seconds = 600.0; // Strictly below earns the speed bonus
};

// All three thresholds met
bool is_victory(const PlayerStatistics& stats, const VictoryConfig& config);

CompletionBonuses compute_bonuses(const PlayerStatistics& stats, const VictoryConfig& config);

// Weighted percentage: accuracy 50%, exploration 30%, questions answered 20%
int compute_performance_score(const PlayerStatistics& stats);

// S, A, B, C, D or F
char get_performance_grade(int performance_score);

// Completed with every room visited and no incorrect answer
bool is_perfect_game(const PlayerStatistics& stats);

} // namespace labyrinth::progression
