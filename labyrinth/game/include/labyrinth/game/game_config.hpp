#pragma once

#include <labyrinth/quiz/quiz_engine.hpp>
#include <labyrinth/progression/victory.hpp>
#include <labyrinth/progression/autosave.hpp>
#include <labyrinth/core/log.hpp>
#include <nlohmann/json.hpp>
#include <string>

namespace labyrinth::game {

inline constexpr const char* DEFAULT_CONFIG_FILE = "labyrinth.json";

struct PathsConfig {
    std::string content_directory = "data";
    std::string save_directory = "saves";
};

// ============================================================================
// GameConfig - Tunables read from labyrinth.json
// ============================================================================
//
// {
//   "quiz":     { time_limit, tick_interval, max_time_bonus, skip_penalty,
//                 raise_after_correct, lower_after_incorrect,
//                 initial_difficulty, selection_seed },
//   "victory":  { min_explored_ratio, min_answered_ratio, min_accuracy,
//                 completion_bonus, exploration_bonus_per_room,
//                 accuracy_bonus_scale, speed_bonus, speed_threshold_seconds },
//   "autosave": { enabled, interval, slot, save_slot },
//   "paths":    { content_directory, save_directory },
//   "player_name": "...",
//   "log_level": "info"
// }

struct GameConfig {
    quiz::QuizConfig quiz;
    progression::VictoryConfig victory;
    progression::AutosaveConfig autosave;
    std::string save_slot = "save";
    PathsConfig paths;
    std::string player_name;
    core::LogLevel log_level = core::LogLevel::Info;

    // Missing keys keep their current value. Returns false (and logs) when
    // the file cannot be read or holds a value of the wrong type.
    bool load(const std::string& path);
    bool save(const std::string& path) const;

    // Throws nlohmann::json::exception on mistyped values
    void apply_json(const nlohmann::json& j);
    nlohmann::json to_json() const;

    // Clamp values into usable ranges; logs each correction
    void validate();
};

} // namespace labyrinth::game
