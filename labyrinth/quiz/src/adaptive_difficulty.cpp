#include <labyrinth/quiz/adaptive_difficulty.hpp>
#include <algorithm>
#include <cmath>
#include <cstdlib>

namespace labyrinth::quiz {

using content::Difficulty;

AdaptiveState make_adaptive_state(const DifficultyConfig& config) {
    AdaptiveState state;
    state.target = config.initial;
    return state;
}

Difficulty raise_difficulty(Difficulty difficulty) {
    if (difficulty == content::MAX_DIFFICULTY) return difficulty;
    return static_cast<Difficulty>(static_cast<int>(difficulty) + 1);
}

Difficulty lower_difficulty(Difficulty difficulty) {
    if (difficulty == content::MIN_DIFFICULTY) return difficulty;
    return static_cast<Difficulty>(static_cast<int>(difficulty) - 1);
}

AdaptiveState apply_outcome(const AdaptiveState& state, bool correct, const DifficultyConfig& config) {
    AdaptiveState next = state;

    if (correct) {
        next.incorrect_streak = 0;
        ++next.correct_streak;
        if (next.correct_streak >= config.raise_after_correct) {
            next.target = raise_difficulty(next.target);
            next.correct_streak = 0;
        }
    } else {
        next.correct_streak = 0;
        ++next.incorrect_streak;
        if (next.incorrect_streak >= config.lower_after_incorrect) {
            next.target = lower_difficulty(next.target);
            next.incorrect_streak = 0;
        }
    }

    return next;
}

std::optional<Difficulty> nearest_difficulty(Difficulty target, const std::vector<Difficulty>& available) {
    std::optional<Difficulty> best;
    int best_distance = 0;

    for (Difficulty candidate : available) {
        int distance = std::abs(static_cast<int>(candidate) - static_cast<int>(target));
        if (!best || distance < best_distance ||
            (distance == best_distance && candidate < *best)) {
            best = candidate;
            best_distance = distance;
        }
    }

    return best;
}

int compute_time_bonus(float time_remaining, float time_limit, int max_bonus, bool hint_used) {
    if (hint_used || time_limit <= 0.0f || max_bonus <= 0) {
        return 0;
    }

    double fraction = std::clamp(static_cast<double>(time_remaining) / time_limit, 0.0, 1.0);
    // Epsilon absorbs float tick drift (8 of 10 seconds must give 0.8)
    int bonus = static_cast<int>(std::floor(max_bonus * fraction + 1e-6));
    return std::clamp(bonus, 0, max_bonus);
}

} // namespace labyrinth::quiz
