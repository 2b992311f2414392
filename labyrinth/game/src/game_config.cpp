#include <labyrinth/game/game_config.hpp>
#include <algorithm>
#include <fstream>

namespace labyrinth::game {

using json = nlohmann::json;

namespace {

template<typename T>
void clamp_setting(T& value, T min_value, T max_value, const char* name) {
    T clamped = std::clamp(value, min_value, max_value);
    if (clamped != value) {
        core::log(core::LogLevel::Warn, "[Config] {} = {} out of range, using {}", name, value, clamped);
        value = clamped;
    }
}

} // anonymous namespace

// ============================================================================
// Persistence
// ============================================================================

bool GameConfig::load(const std::string& path) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            core::log(core::LogLevel::Warn, "[Config] Could not open config file: {}", path);
            return false;
        }

        json j = json::parse(file);
        apply_json(j);
        validate();
        core::log(core::LogLevel::Info, "[Config] Loaded config from: {}", path);
        return true;
    } catch (const json::exception& e) {
        core::log(core::LogLevel::Error, "[Config] Failed to load config: {}", e.what());
        return false;
    }
}

bool GameConfig::save(const std::string& path) const {
    std::ofstream file(path);
    if (!file.is_open()) {
        core::log(core::LogLevel::Error, "[Config] Could not open config file for writing: {}", path);
        return false;
    }

    file << to_json().dump(4);
    core::log(core::LogLevel::Info, "[Config] Saved config to: {}", path);
    return file.good();
}

void GameConfig::apply_json(const json& j) {
    // Quiz
    if (j.contains("quiz")) {
        auto& q = j["quiz"];
        if (q.contains("time_limit")) quiz.time_limit = q["time_limit"];
        if (q.contains("tick_interval")) quiz.tick_interval = q["tick_interval"];
        if (q.contains("max_time_bonus")) quiz.max_time_bonus = q["max_time_bonus"];
        if (q.contains("skip_penalty")) quiz.skip_penalty = q["skip_penalty"];
        if (q.contains("raise_after_correct")) quiz.difficulty.raise_after_correct = q["raise_after_correct"];
        if (q.contains("lower_after_incorrect")) quiz.difficulty.lower_after_incorrect = q["lower_after_incorrect"];
        if (q.contains("selection_seed")) quiz.selection_seed = q["selection_seed"];
        if (q.contains("initial_difficulty")) {
            std::string name = q["initial_difficulty"].get<std::string>();
            if (!content::parse_difficulty(name, quiz.difficulty.initial)) {
                core::log(core::LogLevel::Warn, "[Config] Unknown difficulty '{}', keeping {}",
                          name, content::get_difficulty_name(quiz.difficulty.initial));
            }
        }
    }

    // Victory
    if (j.contains("victory")) {
        auto& v = j["victory"];
        if (v.contains("min_explored_ratio")) victory.min_explored_ratio = v["min_explored_ratio"];
        if (v.contains("min_answered_ratio")) victory.min_answered_ratio = v["min_answered_ratio"];
        if (v.contains("min_accuracy")) victory.min_accuracy = v["min_accuracy"];
        if (v.contains("completion_bonus")) victory.completion_bonus = v["completion_bonus"];
        if (v.contains("exploration_bonus_per_room")) victory.exploration_bonus_per_room = v["exploration_bonus_per_room"];
        if (v.contains("accuracy_bonus_scale")) victory.accuracy_bonus_scale = v["accuracy_bonus_scale"];
        if (v.contains("speed_bonus")) victory.speed_bonus = v["speed_bonus"];
        if (v.contains("speed_threshold_seconds")) victory.speed_threshold_seconds = v["speed_threshold_seconds"];
    }

    // Autosave
    if (j.contains("autosave")) {
        auto& a = j["autosave"];
        if (a.contains("enabled")) autosave.enabled = a["enabled"];
        if (a.contains("interval")) autosave.interval = a["interval"];
        if (a.contains("slot")) autosave.slot = a["slot"].get<std::string>();
        if (a.contains("save_slot")) save_slot = a["save_slot"].get<std::string>();
    }

    // Paths
    if (j.contains("paths")) {
        auto& p = j["paths"];
        if (p.contains("content_directory")) paths.content_directory = p["content_directory"].get<std::string>();
        if (p.contains("save_directory")) paths.save_directory = p["save_directory"].get<std::string>();
    }

    if (j.contains("player_name")) player_name = j["player_name"].get<std::string>();

    if (j.contains("log_level")) {
        std::string name = j["log_level"].get<std::string>();
        if (!core::parse_log_level(name, log_level)) {
            core::log(core::LogLevel::Warn, "[Config] Unknown log level '{}', keeping {}",
                      name, core::get_log_level_name(log_level));
        }
    }
}

json GameConfig::to_json() const {
    json j;

    j["quiz"] = {
        {"time_limit", quiz.time_limit},
        {"tick_interval", quiz.tick_interval},
        {"max_time_bonus", quiz.max_time_bonus},
        {"skip_penalty", quiz.skip_penalty},
        {"raise_after_correct", quiz.difficulty.raise_after_correct},
        {"lower_after_incorrect", quiz.difficulty.lower_after_incorrect},
        {"initial_difficulty", content::get_difficulty_name(quiz.difficulty.initial)},
        {"selection_seed", quiz.selection_seed}
    };

    j["victory"] = {
        {"min_explored_ratio", victory.min_explored_ratio},
        {"min_answered_ratio", victory.min_answered_ratio},
        {"min_accuracy", victory.min_accuracy},
        {"completion_bonus", victory.completion_bonus},
        {"exploration_bonus_per_room", victory.exploration_bonus_per_room},
        {"accuracy_bonus_scale", victory.accuracy_bonus_scale},
        {"speed_bonus", victory.speed_bonus},
        {"speed_threshold_seconds", victory.speed_threshold_seconds}
    };

    j["autosave"] = {
        {"enabled", autosave.enabled},
        {"interval", autosave.interval},
        {"slot", autosave.slot},
        {"save_slot", save_slot}
    };

    j["paths"] = {
        {"content_directory", paths.content_directory},
        {"save_directory", paths.save_directory}
    };

    j["player_name"] = player_name;
    j["log_level"] = core::get_log_level_name(log_level);
    return j;
}

// ============================================================================
// Validation
// ============================================================================

void GameConfig::validate() {
    clamp_setting(quiz.time_limit, 1.0f, 3600.0f, "quiz.time_limit");
    clamp_setting(quiz.tick_interval, 0.01f, quiz.time_limit, "quiz.tick_interval");
    clamp_setting(quiz.max_time_bonus, 0, 10000, "quiz.max_time_bonus");
    clamp_setting(quiz.skip_penalty, 0, 10000, "quiz.skip_penalty");
    clamp_setting(quiz.difficulty.raise_after_correct, 1, 100, "quiz.raise_after_correct");
    clamp_setting(quiz.difficulty.lower_after_incorrect, 1, 100, "quiz.lower_after_incorrect");

    clamp_setting(victory.min_explored_ratio, 0.0, 1.0, "victory.min_explored_ratio");
    clamp_setting(victory.min_answered_ratio, 0.0, 1.0, "victory.min_answered_ratio");
    clamp_setting(victory.min_accuracy, 0.0, 1.0, "victory.min_accuracy");
    clamp_setting(victory.completion_bonus, 0, 1000000, "victory.completion_bonus");
    clamp_setting(victory.exploration_bonus_per_room, 0, 1000000, "victory.exploration_bonus_per_room");
    clamp_setting(victory.accuracy_bonus_scale, 0, 1000000, "victory.accuracy_bonus_scale");
    clamp_setting(victory.speed_bonus, 0, 1000000, "victory.speed_bonus");
    clamp_setting(victory.speed_threshold_seconds, 0.0, 86400.0, "victory.speed_threshold_seconds");

    clamp_setting(autosave.interval, 1.0f, 86400.0f, "autosave.interval");

    if (autosave.slot.empty()) {
        core::log(core::LogLevel::Warn, "[Config] Empty autosave slot, using 'autosave'");
        autosave.slot = "autosave";
    }
    if (save_slot.empty()) {
        core::log(core::LogLevel::Warn, "[Config] Empty save slot, using 'save'");
        save_slot = "save";
    }
    if (save_slot == autosave.slot) {
        core::log(core::LogLevel::Warn, "[Config] Save and autosave share slot '{}'", save_slot);
    }
}

} // namespace labyrinth::game
