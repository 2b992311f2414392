#include "commands.hpp"
#include <labyrinth/content/content_store.hpp>
#include <labyrinth/core/errors.hpp>
#include <labyrinth/core/log.hpp>
#include <labyrinth/game/game.hpp>
#include <labyrinth/progression/snapshot_store.hpp>
#include <labyrinth/progression/victory.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <vector>

namespace labyrinth::cli {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

std::optional<content::ContentStore> load_content(const std::string& content_dir) {
    try {
        return content::ContentStore::load_from_directory(content_dir);
    } catch (const core::DataError& e) {
        std::cerr << "Content in " << content_dir << " is invalid:\n";
        for (const auto& violation : e.violations()) {
            std::cerr << "  - " << violation << "\n";
        }
        return std::nullopt;
    }
}

// Echo engine events to the terminal. Failed commands surface here through
// ErrorOccurred, so the REPL does not print CommandResult errors itself.
std::vector<core::ScopedConnection> attach_printer(events::GameEventBus& bus) {
    std::vector<core::ScopedConnection> connections;

    connections.push_back(bus.subscribe<events::QuestionPresented>([](const events::QuestionPresented& e) {
        std::cout << "\n[" << e.category << ", " << e.points << " points, " << e.time_limit << "s"
                  << (e.has_hint ? ", hint available" : "") << "]\n" << e.prompt << "\n";
        for (size_t i = 0; i < e.options.size(); ++i) {
            std::cout << "  " << i << ") " << e.options[i] << "\n";
        }
    }));
    connections.push_back(bus.subscribe<events::QuestionAnswered>([](const events::QuestionAnswered& e) {
        if (e.timed_out) {
            std::cout << "Time is up! ";
        } else if (e.skipped) {
            std::cout << "Skipped. ";
        } else {
            std::cout << (e.correct ? "Correct! " : "Wrong. ");
        }
        std::cout << "The answer was option " << e.correct_index << ".";
        if (e.time_bonus > 0) {
            std::cout << " Time bonus: " << e.time_bonus << ".";
        }
        std::cout << "\n";
        if (!e.explanation.empty()) {
            std::cout << e.explanation << "\n";
        }
    }));
    connections.push_back(bus.subscribe<events::HintUsed>([](const events::HintUsed& e) {
        std::cout << "Hint: " << e.hint << "\n";
    }));
    connections.push_back(bus.subscribe<events::ScoreChanged>([](const events::ScoreChanged& e) {
        std::cout << (e.delta >= 0 ? "+" : "") << e.delta << " (" << events::get_score_reason_name(e.reason)
                  << "), score " << e.score << "\n";
    }));
    connections.push_back(bus.subscribe<events::RoomUnlocked>([](const events::RoomUnlocked& e) {
        std::cout << "Unlocked: " << e.room_id << "\n";
    }));
    connections.push_back(bus.subscribe<events::RoomChanged>([](const events::RoomChanged& e) {
        std::cout << "You enter " << e.to_room_id << (e.first_visit ? " for the first time" : "") << ".\n";
    }));
    connections.push_back(bus.subscribe<events::AchievementUnlocked>([](const events::AchievementUnlocked& e) {
        std::cout << "*** Achievement: " << e.name << " (+" << e.points << ") ***\n";
    }));
    connections.push_back(bus.subscribe<events::GameCompleted>([](const events::GameCompleted& e) {
        std::cout << "\n=== Victory! ===\n"
                  << "Completion " << e.completion_bonus << ", exploration " << e.exploration_bonus
                  << ", accuracy " << e.accuracy_bonus << ", speed " << e.speed_bonus << "\n"
                  << "Final score " << e.final_score << ", grade "
                  << progression::get_performance_grade(e.performance_score)
                  << (e.perfect_game ? " (perfect game)" : "") << "\n";
    }));
    connections.push_back(bus.subscribe<events::TimerTick>([](const events::TimerTick& e) {
        if (e.time_remaining > 0.0f && e.time_remaining <= 5.0f) {
            std::cout << "(" << e.time_remaining << "s left)\n";
        }
    }));
    connections.push_back(bus.subscribe<events::GameSaved>([](const events::GameSaved& e) {
        if (!e.autosave) {
            std::cout << "Saved to slot '" << e.slot << "'.\n";
        }
    }));
    connections.push_back(bus.subscribe<events::GameLoaded>([](const events::GameLoaded& e) {
        std::cout << "Loaded slot '" << e.slot << "'.\n";
    }));
    connections.push_back(bus.subscribe<events::GameReset>([](const events::GameReset& e) {
        std::cout << "New game, starting in " << e.start_room_id << ".\n";
    }));
    connections.push_back(bus.subscribe<events::ErrorOccurred>([](const events::ErrorOccurred& e) {
        std::cout << "! " << e.message << "\n";
    }));

    return connections;
}

void print_room(const game::Game& game) {
    const auto& progression = game.progression();
    const content::Room* room = game.content().find_room(progression.current_room_id());

    std::cout << "\n== " << room->name << " ==\n" << room->description << "\n";
    std::cout << "Exits:";
    for (const auto& neighbor : game.content().neighbors(room->id)) {
        std::cout << " " << neighbor << (progression.is_unlocked(neighbor) ? "" : " (locked)");
    }
    std::cout << "\n";
}

void print_stats(const game::Game& game) {
    auto stats = game.statistics();
    int performance = progression::compute_performance_score(stats);

    std::cout << std::fixed << std::setprecision(1)
              << "Score:     " << stats.score << "\n"
              << "Rooms:     " << stats.rooms_visited << "/" << stats.rooms_total << "\n"
              << "Questions: " << stats.questions_answered << "/" << stats.questions_total
              << " (" << stats.correct_answers << " correct, " << stats.accuracy * 100.0 << "%)\n"
              << "Streak:    " << stats.current_streak << " (best " << stats.best_streak << ")\n"
              << "Play time: " << stats.elapsed_play_seconds << "s\n"
              << "Grade:     " << progression::get_performance_grade(performance)
              << " (" << performance << ")\n";

    for (const auto& category : game.quiz().category_stats()) {
        std::cout << "  " << category.category << ": " << category.answered << "/" << category.total;
        if (category.answered > 0) {
            std::cout << " (" << category.correct << " correct, " << category.accuracy() * 100.0 << "%)";
        }
        std::cout << "\n";
    }

    auto analysis = game.quiz().strengths_and_weaknesses();
    auto print_categories = [](const char* label, const std::vector<quiz::CategoryStats>& categories) {
        if (categories.empty()) return;
        std::cout << label;
        for (size_t i = 0; i < categories.size(); ++i) {
            std::cout << (i == 0 ? " " : ", ") << categories[i].category;
        }
        std::cout << "\n";
    };
    print_categories("Strengths:", analysis.strengths);
    print_categories("Weaknesses:", analysis.weaknesses);
    std::cout.unsetf(std::ios::floatfield);
}

void print_achievements(const game::Game& game) {
    const auto& unlocked = game.progression().state().unlocked_achievement_ids;
    auto stats = game.statistics();

    for (const auto* def : game.achievements().display_list()) {
        auto progress = game.achievements().progress(*def, stats);
        bool earned = unlocked.contains(def->achievement_id);
        std::cout << (earned ? "[x] " : "[ ] ") << def->display_name << " - " << def->description;
        if (!earned) {
            std::cout << " (" << progress.current << "/" << progress.target << ")";
        }
        std::cout << "\n";
    }

    auto summary = game.achievements().summary(unlocked);
    std::cout << summary.unlocked_count << "/" << summary.total_count << " unlocked, "
              << summary.earned_points << "/" << summary.total_points << " points\n";
}

void print_play_help() {
    std::cout << R"(Commands:
  look            Describe the current room
  go <room>       Move to an unlocked room
  ask             Get a question in this room
  answer <n>      Answer the current question
  hint            Show the hint (forfeits the time bonus)
  skip            Skip the question (penalty)
  pause, resume   Freeze or continue the clock
  stats           Show statistics
  achievements    List achievements
  save, load      Save or restore progress
  reset           Start over
  quit            Leave the game
)";
}

} // anonymous namespace

// ============================================================================
// validate
// ============================================================================

Result cmd_validate(const std::string& content_dir) {
    if (!fs::is_directory(content_dir)) {
        std::cerr << "Error: Not a directory: " << content_dir << "\n";
        return Result::FileError;
    }

    auto store = load_content(content_dir);
    if (!store) {
        return Result::DataError;
    }

    std::cout << "Content OK: " << store->room_count() << " rooms, " << store->question_count()
              << " questions, " << store->achievements().size() << " achievements\n";
    std::cout << "Start room: " << store->start_room().id << "\n";
    for (const auto& category : store->categories()) {
        std::cout << "  " << category << ": " << store->question_count_in_category(category) << " questions\n";
    }
    return Result::Success;
}

// ============================================================================
// play
// ============================================================================

Result cmd_play(const std::string& content_dir, const std::string& config_path, const std::string& save_dir) {
    game::GameConfig config;
    if (!config_path.empty()) {
        if (!config.load(config_path)) {
            std::cerr << "Error: Could not load config: " << config_path << "\n";
            return Result::FileError;
        }
    } else if (fs::exists(game::DEFAULT_CONFIG_FILE) && !config.load(game::DEFAULT_CONFIG_FILE)) {
        std::cerr << "Warning: Ignoring unreadable " << game::DEFAULT_CONFIG_FILE << "\n";
    }
    if (!save_dir.empty()) {
        config.paths.save_directory = save_dir;
    }
    core::set_log_level(config.log_level);

    auto store = load_content(content_dir);
    if (!store) {
        return Result::DataError;
    }

    progression::FileSnapshotStore snapshots(config.paths.save_directory);
    game::Game game(*store, snapshots, config);
    auto connections = attach_printer(game.events());

    std::cout << "Welcome to the Labyrinth. Type 'help' for commands.\n";
    print_room(game);

    auto last = std::chrono::steady_clock::now();
    std::string line;

    while (true) {
        std::cout << "> " << std::flush;
        if (!std::getline(std::cin, line)) {
            break;
        }

        // Time spent reading counts as play time
        auto now = std::chrono::steady_clock::now();
        game.update(std::chrono::duration<float>(now - last).count());
        last = now;

        std::istringstream input(line);
        std::string verb;
        input >> verb;

        if (verb.empty()) {
            continue;
        } else if (verb == "quit" || verb == "exit") {
            break;
        } else if (verb == "help") {
            print_play_help();
        } else if (verb == "look") {
            print_room(game);
        } else if (verb == "go") {
            std::string room_id;
            input >> room_id;
            if (game.move_to_room(room_id)) {
                print_room(game);
            }
        } else if (verb == "ask") {
            game.request_question();
        } else if (verb == "answer") {
            int option = -1;
            if (!(input >> option)) {
                std::cout << "Usage: answer <option number>\n";
                continue;
            }
            game.submit_answer(option);
        } else if (verb == "hint") {
            game.request_hint();
        } else if (verb == "skip") {
            game.skip();
        } else if (verb == "pause") {
            if (game.pause()) std::cout << "Paused.\n";
        } else if (verb == "resume") {
            if (game.resume()) std::cout << "Resumed.\n";
        } else if (verb == "stats") {
            print_stats(game);
        } else if (verb == "achievements") {
            print_achievements(game);
        } else if (verb == "save") {
            game.save();
        } else if (verb == "load") {
            if (game.load()) print_room(game);
        } else if (verb == "reset") {
            game.reset();
            print_room(game);
        } else {
            std::cout << "Unknown command '" << verb << "'. Type 'help'.\n";
        }
    }

    std::cout << "Goodbye.\n";
    return Result::Success;
}

// ============================================================================
// stats
// ============================================================================

Result cmd_stats(const std::string& save_dir) {
    progression::FileSnapshotStore snapshots(save_dir);
    auto slots = snapshots.list_slots();
    if (slots.empty()) {
        std::cerr << "No saves found in " << save_dir << "\n";
        return Result::FileError;
    }

    for (const auto& slot : slots) {
        std::cout << "[" << slot << "]\n";
        try {
            auto text = snapshots.read(slot);
            if (!text) continue;
            json snapshot = progression::parse_snapshot_text(*text);

            if (!snapshot.contains("schema_version")) {
                std::cout << "  legacy save (version 1), score " << snapshot.value("score", 0) << "\n";
                continue;
            }

            std::cout << "  player:    " << snapshot.value("player_name", std::string()) << "\n"
                      << "  room:      " << snapshot.value("current_room_id", std::string()) << "\n"
                      << "  score:     " << snapshot.value("score", int64_t{0}) << "\n"
                      << "  answered:  " << snapshot.value("questions_answered", 0)
                      << " (" << snapshot.value("correct_answers", 0) << " correct)\n"
                      << "  visited:   " << snapshot.value("visited_room_ids", json::array()).size() << " rooms\n"
                      << "  play time: " << snapshot.value("elapsed_play_seconds", 0.0) << "s\n"
                      << "  completed: " << (snapshot.value("completed", false) ? "yes" : "no") << "\n";

            json by_category = snapshot.value("statistics", json::object()).value("correct_by_category", json::object());
            for (const auto& [category, correct] : by_category.items()) {
                std::cout << "  correct in " << category << ": " << correct.get<int>() << "\n";
            }
        } catch (const core::PersistenceError& e) {
            std::cout << "  unreadable: " << e.what() << "\n";
        } catch (const json::type_error& e) {
            std::cout << "  malformed: " << e.what() << "\n";
        }
    }
    return Result::Success;
}

// ============================================================================
// help
// ============================================================================

void cmd_help() {
    std::cout << R"(Labyrinth CLI - Knowledge quiz adventure

Usage: labyrinth-cli <command> [options]

Commands:
  validate <dir>    Check rooms.json, questions.json and achievements.json

  play <dir>        Play using the content in <dir>
                      --config <file>    Load settings (default: ./labyrinth.json if present)
                      --save-dir <dir>   Where saves are written (default: saves)

  stats <dir>       Summarize the saves in <dir>

  help              Show this help message

Examples:
  labyrinth-cli validate data
  labyrinth-cli play data --config config/labyrinth.json
  labyrinth-cli stats saves
)";
}

} // namespace labyrinth::cli
