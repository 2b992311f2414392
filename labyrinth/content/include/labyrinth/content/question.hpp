#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace labyrinth::content {

// ============================================================================
// Difficulty
// ============================================================================

enum class Difficulty : uint8_t {
    Easy,
    Medium,
    Hard
};

constexpr Difficulty MIN_DIFFICULTY = Difficulty::Easy;
constexpr Difficulty MAX_DIFFICULTY = Difficulty::Hard;

const char* get_difficulty_name(Difficulty difficulty);
bool parse_difficulty(std::string_view name, Difficulty& out_difficulty);

// ============================================================================
// Question
// ============================================================================

struct Question {
    std::string id;
    std::string prompt;
    std::vector<std::string> options;
    int correct_index = 0;
    std::string category = "general";
    Difficulty difficulty = Difficulty::Medium;
    int points = 100;
    std::string hint;           // Empty = no hint
    std::string explanation;

    int option_count() const { return static_cast<int>(options.size()); }
    bool has_hint() const { return !hint.empty(); }
    bool is_correct(int option_index) const { return option_index == correct_index; }
};

// Deserialize {id, prompt, options[], correct_index, category, difficulty, points, hint, explanation}
// Range checks (option bounds, points) are left to ContentStore validation
std::optional<Question> deserialize_question(const nlohmann::json& j, std::string& out_error);

} // namespace labyrinth::content
