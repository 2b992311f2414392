#pragma once

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace labyrinth::progression {

// Current snapshot schema written by ProgressionController::serialize()
inline constexpr uint32_t SNAPSHOT_SCHEMA_VERSION = 2;
inline constexpr const char* SNAPSHOT_FORMAT = "labyrinth-progress";

// ============================================================================
// CompletionBonuses - Awarded once, when the victory condition first holds
// ============================================================================

struct CompletionBonuses {
    int completion = 0;
    int exploration = 0;
    int accuracy = 0;
    int speed = 0;

    int64_t total() const { return int64_t{completion} + exploration + accuracy + speed; }

    bool operator==(const CompletionBonuses& other) const = default;
};

// ============================================================================
// ProgressionState - Everything that survives a save/load
// ============================================================================

struct ProgressionState {
    uint32_t schema_version = SNAPSHOT_SCHEMA_VERSION;
    std::string player_name;

    std::string current_room_id;
    std::set<std::string> unlocked_room_ids;
    std::set<std::string> visited_room_ids;         // Always a subset of unlocked
    std::set<std::string> answered_question_ids;
    std::set<std::string> unlocked_achievement_ids;

    int64_t score = 0;                              // May go negative
    int questions_answered = 0;                     // == answered_question_ids.size()
    int correct_answers = 0;
    double elapsed_play_seconds = 0.0;
    bool completed = false;

    // Streaks and counters read by achievement triggers
    int current_streak = 0;
    int best_streak = 0;
    int incorrect_streak = 0;
    int best_comeback = 0;          // Longest incorrect run ended by a correct answer
    int hints_used = 0;
    int questions_skipped = 0;
    int questions_timed_out = 0;
    std::vector<float> correct_answer_times;
    std::map<std::string, int> correct_by_category;

    CompletionBonuses bonuses;

    bool operator==(const ProgressionState& other) const = default;
};

// ============================================================================
// AnswerRecord - A finalized quiz outcome applied to the statistics
// ============================================================================

struct AnswerRecord {
    std::string question_id;
    bool correct = false;
    bool skipped = false;
    bool timed_out = false;
    bool hint_used = false;
    float time_taken = 0.0f;
};

} // namespace labyrinth::progression
