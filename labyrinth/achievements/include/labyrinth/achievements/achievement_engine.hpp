#pragma once

#include <labyrinth/content/achievement_definition.hpp>
#include <labyrinth/progression/statistics.hpp>
#include <set>
#include <string>
#include <vector>

namespace labyrinth::achievements {

// ============================================================================
// Achievement Progress
// ============================================================================

struct AchievementProgress {
    std::string achievement_id;
    int current = 0;
    int target = 1;
    bool satisfied = false;

    float percent() const {
        if (satisfied) return 100.0f;
        if (target <= 0) return 0.0f;
        float value = 100.0f * static_cast<float>(current) / static_cast<float>(target);
        return value > 100.0f ? 100.0f : value;
    }
};

struct AchievementSummary {
    int unlocked_count = 0;
    int total_count = 0;
    int earned_points = 0;
    int total_points = 0;

    float completion_percent() const {
        return total_count > 0 ? 100.0f * unlocked_count / total_count : 0.0f;
    }
};

struct CategorySummary {
    std::string category;
    int unlocked = 0;
    int total = 0;
};

// ============================================================================
// Trigger Predicates
// ============================================================================

bool is_trigger_satisfied(const content::AchievementTrigger& trigger, const progression::PlayerStatistics& stats);

// Correct answers given in under `seconds`
int count_quick_answers(const progression::PlayerStatistics& stats, float seconds);

// ============================================================================
// AchievementEngine - Stateless rule evaluator
// ============================================================================
//
// Holds only the definitions. Which achievements are unlocked lives in the
// ProgressionState; evaluate() is a pure function of its arguments.

class AchievementEngine {
public:
    explicit AchievementEngine(const std::vector<content::AchievementDefinition>& definitions);

    // Ids whose trigger holds and that are not in `unlocked`, in declaration
    // order. Every trigger sees the same statistics.
    std::vector<std::string> evaluate(const progression::PlayerStatistics& stats,
                                      const std::set<std::string>& unlocked) const;

    AchievementProgress progress(const content::AchievementDefinition& definition,
                                 const progression::PlayerStatistics& stats) const;

    // Sorted by display_order, declaration order breaking ties
    std::vector<const content::AchievementDefinition*> display_list() const;

    AchievementSummary summary(const std::set<std::string>& unlocked) const;
    std::vector<CategorySummary> category_summary(const std::set<std::string>& unlocked) const;

    const content::AchievementDefinition* find(const std::string& achievement_id) const;
    const std::vector<content::AchievementDefinition>& definitions() const { return m_definitions; }

private:
    const std::vector<content::AchievementDefinition>& m_definitions;
};

} // namespace labyrinth::achievements
