#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace labyrinth::content {

// ============================================================================
// Trigger Type
// ============================================================================

enum class TriggerType : uint8_t {
    CorrectAnswers,         // correct_answers >= value
    TotalQuestions,         // questions_answered >= value
    RoomsVisited,           // visited rooms >= value
    QuickAnswers,           // correct answers faster than time_limit >= value
    ConsecutiveCorrect,     // best correct streak >= value
    ComebackCorrect,        // correct answer right after >= value incorrect ones
    AccuracyWithMinimum,    // accuracy >= accuracy once min_questions answered
    CompletionTime,         // completed within value seconds of play
    AllRoomsVisited,
    SpecificRoomVisited,    // room_id visited
    GameCompleted,
    GameCompletedPerfect,   // completed, every room visited, no wrong answer
    ScoreReached            // score >= value
};

const char* get_trigger_type_name(TriggerType type);
bool parse_trigger_type(std::string_view name, TriggerType& out_type);

// ============================================================================
// Achievement Rarity (display only)
// ============================================================================

enum class AchievementRarity : uint8_t {
    Common,
    Uncommon,
    Rare,
    Epic,
    Legendary
};

const char* get_rarity_name(AchievementRarity rarity);
bool parse_rarity(std::string_view name, AchievementRarity& out_rarity);

// ============================================================================
// Achievement Trigger
// ============================================================================

struct AchievementTrigger {
    TriggerType type = TriggerType::GameCompleted;
    int value = 1;
    int min_questions = 0;          // AccuracyWithMinimum
    double accuracy = 0.0;          // AccuracyWithMinimum, 0..1
    float time_limit = 10.0f;       // QuickAnswers, seconds
    std::string room_id;            // SpecificRoomVisited

    bool operator==(const AchievementTrigger& other) const = default;
};

// ============================================================================
// Achievement Definition
// ============================================================================

struct AchievementDefinition {
    std::string achievement_id;
    std::string display_name;
    std::string description;
    std::string category = "misc";
    int points = 0;
    AchievementRarity rarity = AchievementRarity::Common;
    AchievementTrigger trigger;
    int display_order = 0;
};

// Deserialize {id, name, description, points, rarity, category, trigger{...}}
std::optional<AchievementDefinition> deserialize_achievement(const nlohmann::json& j, std::string& out_error);

// ============================================================================
// Achievement Builder
// ============================================================================

class AchievementBuilder {
public:
    AchievementBuilder& id(const std::string& achievement_id);
    AchievementBuilder& name(const std::string& display_name);
    AchievementBuilder& description(const std::string& desc);
    AchievementBuilder& category(const std::string& cat);
    AchievementBuilder& points(int pts);
    AchievementBuilder& rarity(AchievementRarity r);
    AchievementBuilder& trigger(TriggerType type, int value = 1);
    AchievementBuilder& accuracy(double min_accuracy, int min_questions);
    AchievementBuilder& time_limit(float seconds);
    AchievementBuilder& room(const std::string& room_id);
    AchievementBuilder& order(int display_order);

    AchievementDefinition build() const;

private:
    AchievementDefinition m_def;
};

inline AchievementBuilder achievement() { return AchievementBuilder{}; }

} // namespace labyrinth::content
