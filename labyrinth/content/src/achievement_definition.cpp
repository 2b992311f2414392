#include <labyrinth/content/achievement_definition.hpp>
#include <labyrinth/content/json_loader.hpp>
#include <array>
#include <utility>

namespace labyrinth::content {

// ============================================================================
// Name Tables
// ============================================================================

namespace {

constexpr std::array<std::pair<TriggerType, const char*>, 13> TRIGGER_NAMES = {{
    {TriggerType::CorrectAnswers, "correct_answers"},
    {TriggerType::TotalQuestions, "total_questions"},
    {TriggerType::RoomsVisited, "rooms_visited"},
    {TriggerType::QuickAnswers, "quick_answers"},
    {TriggerType::ConsecutiveCorrect, "consecutive_correct"},
    {TriggerType::ComebackCorrect, "comeback_correct"},
    {TriggerType::AccuracyWithMinimum, "accuracy_with_minimum"},
    {TriggerType::CompletionTime, "completion_time"},
    {TriggerType::AllRoomsVisited, "all_rooms_visited"},
    {TriggerType::SpecificRoomVisited, "specific_room_visited"},
    {TriggerType::GameCompleted, "game_completed"},
    {TriggerType::GameCompletedPerfect, "game_completed_perfect"},
    {TriggerType::ScoreReached, "score_reached"},
}};

constexpr std::array<std::pair<AchievementRarity, const char*>, 5> RARITY_NAMES = {{
    {AchievementRarity::Common, "common"},
    {AchievementRarity::Uncommon, "uncommon"},
    {AchievementRarity::Rare, "rare"},
    {AchievementRarity::Epic, "epic"},
    {AchievementRarity::Legendary, "legendary"},
}};

// Deserialize the trigger object: {type, value, min_questions, accuracy, time_limit, room_id}
bool deserialize_trigger(const nlohmann::json& j, AchievementTrigger& trigger, std::string& error) {
    using namespace json_helpers;

    if (!require_string(j, "type", error)) {
        return false;
    }

    std::string type_name = j["type"].get<std::string>();
    if (!parse_trigger_type(type_name, trigger.type)) {
        error = "unknown trigger type '" + type_name + "'";
        return false;
    }

    if (!read_int(j, "value", 1, trigger.value, error) ||
        !read_int(j, "min_questions", 0, trigger.min_questions, error)) {
        return false;
    }
    trigger.accuracy = get_double(j, "accuracy", 0.0);
    trigger.time_limit = get_float(j, "time_limit", 10.0f);
    trigger.room_id = get_string(j, "room_id");
    return true;
}

} // anonymous namespace

const char* get_trigger_type_name(TriggerType type) {
    for (const auto& [value, name] : TRIGGER_NAMES) {
        if (value == type) return name;
    }
    return "unknown";
}

bool parse_trigger_type(std::string_view name, TriggerType& out_type) {
    for (const auto& [value, type_name] : TRIGGER_NAMES) {
        if (name == type_name) {
            out_type = value;
            return true;
        }
    }
    return false;
}

const char* get_rarity_name(AchievementRarity rarity) {
    for (const auto& [value, name] : RARITY_NAMES) {
        if (value == rarity) return name;
    }
    return "unknown";
}

bool parse_rarity(std::string_view name, AchievementRarity& out_rarity) {
    for (const auto& [value, rarity_name] : RARITY_NAMES) {
        if (name == rarity_name) {
            out_rarity = value;
            return true;
        }
    }
    return false;
}

// ============================================================================
// JSON Deserialization
// ============================================================================

std::optional<AchievementDefinition> deserialize_achievement(const nlohmann::json& j, std::string& out_error) {
    using namespace json_helpers;

    // Required: id
    if (!require_string(j, "id", out_error)) {
        return std::nullopt;
    }

    AchievementDefinition def;
    def.achievement_id = j["id"].get<std::string>();

    if (!require_string(j, "name", out_error) ||
        !require_object(j, "trigger", out_error)) {
        out_error = "Achievement '" + def.achievement_id + "': " + out_error;
        return std::nullopt;
    }

    def.display_name = j["name"].get<std::string>();
    def.description = get_string(j, "description");
    def.category = get_string(j, "category", "misc");
    if (!read_int(j, "points", 0, def.points, out_error) ||
        !read_int(j, "display_order", 0, def.display_order, out_error)) {
        out_error = "Achievement '" + def.achievement_id + "': " + out_error;
        return std::nullopt;
    }

    std::string rarity = get_string(j, "rarity", "common");
    if (!parse_rarity(rarity, def.rarity)) {
        out_error = "Achievement '" + def.achievement_id + "': unknown rarity '" + rarity + "'";
        return std::nullopt;
    }

    std::string trigger_error;
    if (!deserialize_trigger(j["trigger"], def.trigger, trigger_error)) {
        out_error = "Achievement '" + def.achievement_id + "': " + trigger_error;
        return std::nullopt;
    }

    return def;
}

// ============================================================================
// AchievementBuilder
// ============================================================================

AchievementBuilder& AchievementBuilder::id(const std::string& achievement_id) {
    m_def.achievement_id = achievement_id;
    return *this;
}

AchievementBuilder& AchievementBuilder::name(const std::string& display_name) {
    m_def.display_name = display_name;
    return *this;
}

AchievementBuilder& AchievementBuilder::description(const std::string& desc) {
    m_def.description = desc;
    return *this;
}

AchievementBuilder& AchievementBuilder::category(const std::string& cat) {
    m_def.category = cat;
    return *this;
}

AchievementBuilder& AchievementBuilder::points(int pts) {
    m_def.points = pts;
    return *this;
}

AchievementBuilder& AchievementBuilder::rarity(AchievementRarity r) {
    m_def.rarity = r;
    return *this;
}

AchievementBuilder& AchievementBuilder::trigger(TriggerType type, int value) {
    m_def.trigger.type = type;
    m_def.trigger.value = value;
    return *this;
}

AchievementBuilder& AchievementBuilder::accuracy(double min_accuracy, int min_questions) {
    m_def.trigger.type = TriggerType::AccuracyWithMinimum;
    m_def.trigger.accuracy = min_accuracy;
    m_def.trigger.min_questions = min_questions;
    return *this;
}

AchievementBuilder& AchievementBuilder::time_limit(float seconds) {
    m_def.trigger.time_limit = seconds;
    return *this;
}

AchievementBuilder& AchievementBuilder::room(const std::string& room_id) {
    m_def.trigger.type = TriggerType::SpecificRoomVisited;
    m_def.trigger.room_id = room_id;
    return *this;
}

AchievementBuilder& AchievementBuilder::order(int display_order) {
    m_def.display_order = display_order;
    return *this;
}

AchievementDefinition AchievementBuilder::build() const {
    return m_def;
}

} // namespace labyrinth::content
