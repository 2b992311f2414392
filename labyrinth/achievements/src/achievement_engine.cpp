#include <labyrinth/achievements/achievement_engine.hpp>
#include <labyrinth/progression/victory.hpp>
#include <algorithm>
#include <cmath>

namespace labyrinth::achievements {

using content::TriggerType;
using progression::PlayerStatistics;

int count_quick_answers(const PlayerStatistics& stats, float seconds) {
    return static_cast<int>(std::count_if(stats.correct_answer_times.begin(), stats.correct_answer_times.end(),
        [seconds](float t) { return t < seconds; }));
}

bool is_trigger_satisfied(const content::AchievementTrigger& trigger, const PlayerStatistics& stats) {
    switch (trigger.type) {
        case TriggerType::CorrectAnswers:
            return stats.correct_answers >= trigger.value;
        case TriggerType::TotalQuestions:
            return stats.questions_answered >= trigger.value;
        case TriggerType::RoomsVisited:
            return stats.rooms_visited >= trigger.value;
        case TriggerType::QuickAnswers:
            return count_quick_answers(stats, trigger.time_limit) >= trigger.value;
        case TriggerType::ConsecutiveCorrect:
            return stats.best_streak >= trigger.value;
        case TriggerType::ComebackCorrect:
            return stats.best_comeback >= trigger.value;
        case TriggerType::AccuracyWithMinimum:
            return stats.questions_answered >= trigger.min_questions &&
                   stats.questions_answered > 0 &&
                   stats.accuracy + 1e-9 >= trigger.accuracy;
        case TriggerType::CompletionTime:
            return stats.completed && stats.elapsed_play_seconds <= trigger.value;
        case TriggerType::AllRoomsVisited:
            return stats.rooms_total > 0 && stats.rooms_visited >= stats.rooms_total;
        case TriggerType::SpecificRoomVisited:
            return stats.visited_room_ids.contains(trigger.room_id);
        case TriggerType::GameCompleted:
            return stats.completed;
        case TriggerType::GameCompletedPerfect:
            return progression::is_perfect_game(stats);
        case TriggerType::ScoreReached:
            return stats.score >= trigger.value;
    }
    return false;
}

// ============================================================================
// AchievementEngine
// ============================================================================

AchievementEngine::AchievementEngine(const std::vector<content::AchievementDefinition>& definitions)
    : m_definitions(definitions) {}

std::vector<std::string> AchievementEngine::evaluate(const PlayerStatistics& stats,
                                                     const std::set<std::string>& unlocked) const {
    std::vector<std::string> newly_satisfied;
    for (const auto& def : m_definitions) {
        if (unlocked.contains(def.achievement_id)) {
            continue;
        }
        if (is_trigger_satisfied(def.trigger, stats)) {
            newly_satisfied.push_back(def.achievement_id);
        }
    }
    return newly_satisfied;
}

AchievementProgress AchievementEngine::progress(const content::AchievementDefinition& definition,
                                                const PlayerStatistics& stats) const {
    const auto& trigger = definition.trigger;

    AchievementProgress result;
    result.achievement_id = definition.achievement_id;
    result.target = std::max(1, trigger.value);
    result.satisfied = is_trigger_satisfied(trigger, stats);

    switch (trigger.type) {
        case TriggerType::CorrectAnswers:
            result.current = stats.correct_answers;
            break;
        case TriggerType::TotalQuestions:
            result.current = stats.questions_answered;
            break;
        case TriggerType::RoomsVisited:
            result.current = stats.rooms_visited;
            break;
        case TriggerType::QuickAnswers:
            result.current = count_quick_answers(stats, trigger.time_limit);
            break;
        case TriggerType::ConsecutiveCorrect:
            result.current = stats.best_streak;
            break;
        case TriggerType::ComebackCorrect:
            result.current = stats.best_comeback;
            break;
        case TriggerType::AccuracyWithMinimum:
            // Percentage points once enough questions are in
            result.target = static_cast<int>(std::lround(trigger.accuracy * 100.0));
            result.current = stats.questions_answered >= trigger.min_questions
                ? static_cast<int>(std::lround(stats.accuracy * 100.0))
                : 0;
            break;
        case TriggerType::AllRoomsVisited:
            result.current = stats.rooms_visited;
            result.target = std::max(1, stats.rooms_total);
            break;
        case TriggerType::ScoreReached:
            result.current = static_cast<int>(std::clamp<int64_t>(stats.score, 0, result.target));
            break;
        case TriggerType::CompletionTime:
        case TriggerType::SpecificRoomVisited:
        case TriggerType::GameCompleted:
        case TriggerType::GameCompletedPerfect:
            result.target = 1;
            result.current = result.satisfied ? 1 : 0;
            break;
    }

    result.current = std::min(result.current, result.target);
    return result;
}

std::vector<const content::AchievementDefinition*> AchievementEngine::display_list() const {
    std::vector<const content::AchievementDefinition*> list;
    list.reserve(m_definitions.size());
    for (const auto& def : m_definitions) {
        list.push_back(&def);
    }
    std::stable_sort(list.begin(), list.end(),
        [](const content::AchievementDefinition* a, const content::AchievementDefinition* b) {
            return a->display_order < b->display_order;
        });
    return list;
}

AchievementSummary AchievementEngine::summary(const std::set<std::string>& unlocked) const {
    AchievementSummary result;
    for (const auto& def : m_definitions) {
        ++result.total_count;
        result.total_points += def.points;
        if (unlocked.contains(def.achievement_id)) {
            ++result.unlocked_count;
            result.earned_points += def.points;
        }
    }
    return result;
}

std::vector<CategorySummary> AchievementEngine::category_summary(const std::set<std::string>& unlocked) const {
    std::vector<CategorySummary> result;
    for (const auto& def : m_definitions) {
        auto it = std::find_if(result.begin(), result.end(),
            [&def](const CategorySummary& s) { return s.category == def.category; });
        if (it == result.end()) {
            result.push_back({def.category, 0, 0});
            it = result.end() - 1;
        }
        ++it->total;
        if (unlocked.contains(def.achievement_id)) {
            ++it->unlocked;
        }
    }
    return result;
}

const content::AchievementDefinition* AchievementEngine::find(const std::string& achievement_id) const {
    for (const auto& def : m_definitions) {
        if (def.achievement_id == achievement_id) {
            return &def;
        }
    }
    return nullptr;
}

} // namespace labyrinth::achievements
