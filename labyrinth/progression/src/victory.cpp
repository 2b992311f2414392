#include <labyrinth/progression/victory.hpp>
#include <cmath>

namespace labyrinth::progression {

bool is_victory(const PlayerStatistics& stats, const VictoryConfig& config) {
    return stats.explored_ratio() >= config.min_explored_ratio &&
           stats.answered_ratio() >= config.min_answered_ratio &&
           stats.accuracy >= config.min_accuracy;
}

CompletionBonuses compute_bonuses(const PlayerStatistics& stats, const VictoryConfig& config) {
    CompletionBonuses bonuses;
    bonuses.completion = config.completion_bonus;
    bonuses.exploration = stats.rooms_visited * config.exploration_bonus_per_room;
    // Epsilon keeps 0.7 * 1000 from flooring to 699
    bonuses.accuracy = static_cast<int>(std::floor(stats.accuracy * config.accuracy_bonus_scale + 1e-9));
    bonuses.speed = stats.elapsed_play_seconds < config.speed_threshold_seconds ? config.speed_bonus : 0;
    return bonuses;
}

int compute_performance_score(const PlayerStatistics& stats) {
    double weighted = stats.accuracy * 100.0 * 0.5 +
                      stats.explored_ratio() * 100.0 * 0.3 +
                      stats.answered_ratio() * 100.0 * 0.2;
    return static_cast<int>(std::lround(weighted));
}

char get_performance_grade(int performance_score) {
    if (performance_score >= 95) return 'S';
    if (performance_score >= 90) return 'A';
    if (performance_score >= 80) return 'B';
    if (performance_score >= 70) return 'C';
    if (performance_score >= 60) return 'D';
    return 'F';
}

bool is_perfect_game(const PlayerStatistics& stats) {
    return stats.completed &&
           stats.rooms_total > 0 && stats.rooms_visited == stats.rooms_total &&
           stats.questions_answered > 0 && stats.correct_answers == stats.questions_answered;
}

} // namespace labyrinth::progression
