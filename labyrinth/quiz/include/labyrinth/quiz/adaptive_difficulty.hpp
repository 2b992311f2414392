#pragma once

#include <labyrinth/content/question.hpp>
#include <optional>
#include <vector>

namespace labyrinth::quiz {

// ============================================================================
// Adaptive Difficulty
// ============================================================================

struct DifficultyConfig {
    int raise_after_correct = 3;        // Consecutive correct answers to step up
    int lower_after_incorrect = 2;      // Consecutive misses (incl. skips/timeouts) to step down
    content::Difficulty initial = content::Difficulty::Easy;
};

struct AdaptiveState {
    content::Difficulty target = content::Difficulty::Easy;
    int correct_streak = 0;
    int incorrect_streak = 0;

    bool operator==(const AdaptiveState& other) const = default;
};

AdaptiveState make_adaptive_state(const DifficultyConfig& config);

// Streak bookkeeping after one finalized answer. A tier change resets the
// streak that caused it.
AdaptiveState apply_outcome(const AdaptiveState& state, bool correct, const DifficultyConfig& config);

content::Difficulty raise_difficulty(content::Difficulty difficulty);
content::Difficulty lower_difficulty(content::Difficulty difficulty);

// Tier nearest to target among the available ones; equal distance goes to
// the easier tier. nullopt when nothing is available.
std::optional<content::Difficulty> nearest_difficulty(content::Difficulty target,
                                                      const std::vector<content::Difficulty>& available);

// floor(max_bonus * remaining / limit), clamped to [0, max_bonus]; 0 after a hint
int compute_time_bonus(float time_remaining, float time_limit, int max_bonus, bool hint_used);

} // namespace labyrinth::quiz
