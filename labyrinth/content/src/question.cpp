#include <labyrinth/content/question.hpp>
#include <labyrinth/content/json_loader.hpp>

namespace labyrinth::content {

const char* get_difficulty_name(Difficulty difficulty) {
    switch (difficulty) {
        case Difficulty::Easy:   return "easy";
        case Difficulty::Medium: return "medium";
        case Difficulty::Hard:   return "hard";
    }
    return "unknown";
}

bool parse_difficulty(std::string_view name, Difficulty& out_difficulty) {
    if (name == "easy") {
        out_difficulty = Difficulty::Easy;
    } else if (name == "medium") {
        out_difficulty = Difficulty::Medium;
    } else if (name == "hard") {
        out_difficulty = Difficulty::Hard;
    } else {
        return false;
    }
    return true;
}

std::optional<Question> deserialize_question(const nlohmann::json& j, std::string& out_error) {
    using namespace json_helpers;

    if (!require_string(j, "id", out_error)) {
        return std::nullopt;
    }

    Question question;
    question.id = j["id"].get<std::string>();

    if (!require_string(j, "prompt", out_error) ||
        !require_array(j, "options", out_error) ||
        !require_int(j, "correct_index", out_error) ||
        !require_int(j, "points", out_error)) {
        out_error = "Question '" + question.id + "': " + out_error;
        return std::nullopt;
    }

    question.prompt = j["prompt"].get<std::string>();
    question.correct_index = j["correct_index"].get<int>();
    question.points = j["points"].get<int>();
    question.category = get_string(j, "category", "general");
    question.hint = get_string(j, "hint");
    question.explanation = get_string(j, "explanation");

    for (const auto& option : j["options"]) {
        if (!option.is_string()) {
            out_error = "Question '" + question.id + "': options must be strings";
            return std::nullopt;
        }
        question.options.push_back(option.get<std::string>());
    }

    std::string difficulty = get_string(j, "difficulty", "medium");
    if (!parse_difficulty(difficulty, question.difficulty)) {
        out_error = "Question '" + question.id + "': unknown difficulty '" + difficulty + "'";
        return std::nullopt;
    }

    return question;
}

} // namespace labyrinth::content
