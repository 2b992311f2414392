#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <labyrinth/progression/progression_controller.hpp>
#include <labyrinth/core/errors.hpp>
#include <test_content.hpp>

using namespace labyrinth;
using namespace labyrinth::progression;
using Catch::Matchers::WithinAbs;

namespace {

class ProgressionFixture {
protected:
    ProgressionFixture()
        : content(test::make_castle())
        , recorder(bus)
        , progression(content, bus) {}

    AnswerRecord answer(const std::string& id, bool correct, float time_taken = 5.0f) {
        AnswerRecord record;
        record.question_id = id;
        record.correct = correct;
        record.time_taken = time_taken;
        return record;
    }

    content::ContentStore content;
    events::GameEventBus bus;
    test::EventRecorder recorder;
    ProgressionController progression;
};

// Ten rooms in a line, one hundred general questions
content::ContentStore make_corridor() {
    std::vector<content::Room> rooms;
    for (int i = 0; i < 10; ++i) {
        std::vector<std::string> connections;
        if (i < 9) connections.push_back("r" + std::to_string(i + 1));
        rooms.push_back(test::make_room("r" + std::to_string(i), connections, "general", i == 0));
    }
    std::vector<content::Question> questions;
    for (int i = 0; i < 100; ++i) {
        questions.push_back(test::make_question("q" + std::to_string(i), "general", content::Difficulty::Easy));
    }
    return content::ContentStore::from_definitions(rooms, questions, {});
}

} // anonymous namespace

TEST_CASE_METHOD(ProgressionFixture, "ProgressionController starts at the start room", "[progression][controller]") {
    const auto& state = progression.state();

    REQUIRE(state.current_room_id == "entrance");
    REQUIRE(state.unlocked_room_ids == std::set<std::string>{"entrance"});
    REQUIRE(state.visited_room_ids == std::set<std::string>{"entrance"});
    REQUIRE(state.score == 0);
    REQUIRE(state.questions_answered == 0);
    REQUIRE_FALSE(state.completed);
    REQUIRE(state.schema_version == SNAPSHOT_SCHEMA_VERSION);

    auto stats = progression.statistics();
    REQUIRE(stats.rooms_visited == 1);
    REQUIRE(stats.rooms_total == 5);
    REQUIRE(stats.questions_total == 5);
    REQUIRE(stats.accuracy == 0.0);
}

TEST_CASE_METHOD(ProgressionFixture, "ProgressionController movement", "[progression][controller]") {
    SECTION("Moving to a locked room fails and changes nothing") {
        try {
            progression.move_to_room("library");
            FAIL("Expected StateError");
        } catch (const core::StateError& e) {
            REQUIRE(e.code() == core::StateErrorCode::InvalidMove);
        }
        REQUIRE(progression.current_room_id() == "entrance");
        REQUIRE_FALSE(progression.is_visited("library"));
        REQUIRE(recorder.received.empty());
    }

    SECTION("Unknown room") {
        try {
            progression.move_to_room("cellar");
            FAIL("Expected StateError");
        } catch (const core::StateError& e) {
            REQUIRE(e.code() == core::StateErrorCode::UnknownRoom);
        }
    }

    SECTION("Moving to an unlocked room visits it") {
        progression.unlock_neighbors("entrance");
        recorder.clear();

        progression.move_to_room("library");
        REQUIRE(progression.current_room_id() == "library");
        REQUIRE(progression.is_visited("library"));

        const auto& moved = recorder.last<events::RoomChanged>();
        REQUIRE(moved.from_room_id == "entrance");
        REQUIRE(moved.to_room_id == "library");
        REQUIRE(moved.first_visit);

        progression.move_to_room("entrance");
        progression.move_to_room("library");
        REQUIRE_FALSE(recorder.last<events::RoomChanged>().first_visit);
        REQUIRE(progression.state().visited_room_ids.size() == 2);
    }

    SECTION("Available rooms are unlocked neighbours") {
        REQUIRE(progression.available_rooms().empty());
        progression.unlock_neighbors("entrance");
        REQUIRE(progression.available_rooms() == std::vector<std::string>{"library", "garden"});
    }
}

TEST_CASE_METHOD(ProgressionFixture, "ProgressionController unlocking", "[progression][controller]") {
    SECTION("Unlocks only rooms reachable from an unlocked room") {
        REQUIRE_FALSE(progression.unlock_room("tower"));
        REQUIRE_FALSE(progression.is_unlocked("tower"));
        REQUIRE(recorder.count<events::RoomUnlocked>() == 0);
    }

    SECTION("Unknown room") {
        REQUIRE_FALSE(progression.unlock_room("cellar"));
    }

    SECTION("Unlock is idempotent") {
        REQUIRE(progression.unlock_room("library", "entrance"));
        REQUIRE_FALSE(progression.unlock_room("library", "entrance"));
        REQUIRE(recorder.count<events::RoomUnlocked>() == 1);
        REQUIRE(recorder.last<events::RoomUnlocked>().unlocked_from == "entrance");
    }

    SECTION("Neighbours unlock in connection order") {
        auto unlocked = progression.unlock_neighbors("entrance");
        REQUIRE(unlocked == std::vector<std::string>{"library", "garden"});

        auto unlocks = recorder.all<events::RoomUnlocked>();
        REQUIRE(unlocks.size() == 2);
        REQUIRE(unlocks[0].room_id == "library");
        REQUIRE(unlocks[1].room_id == "garden");

        REQUIRE(progression.unlock_neighbors("entrance").empty());
    }

    SECTION("Unlocking never visits") {
        progression.unlock_neighbors("entrance");
        REQUIRE_FALSE(progression.is_visited("library"));
    }
}

TEST_CASE_METHOD(ProgressionFixture, "ProgressionController scoring", "[progression][scoring]") {
    SECTION("Score may go negative") {
        REQUIRE(progression.apply_score_delta(-10, events::ScoreReason::SkipPenalty) == -10);
        REQUIRE(progression.state().score == -10);

        const auto& changed = recorder.last<events::ScoreChanged>();
        REQUIRE(changed.delta == -10);
        REQUIRE(changed.score == -10);
        REQUIRE(changed.reason == events::ScoreReason::SkipPenalty);
    }

    SECTION("Answers update the counters") {
        progression.record_answer(answer("g1", true, 3.0f));
        progression.record_answer(answer("g2", false));

        const auto& state = progression.state();
        REQUIRE(state.questions_answered == 2);
        REQUIRE(state.correct_answers == 1);
        REQUIRE(state.answered_question_ids == std::set<std::string>{"g1", "g2"});
        REQUIRE(state.correct_answer_times == std::vector<float>{3.0f});
        REQUIRE_THAT(progression.statistics().accuracy, WithinAbs(0.5, 0.0001));
    }

    SECTION("A question is answered at most once") {
        progression.record_answer(answer("g1", false));
        try {
            progression.record_answer(answer("g1", true));
            FAIL("Expected StateError");
        } catch (const core::StateError& e) {
            REQUIRE(e.code() == core::StateErrorCode::QuestionAlreadyAnswered);
        }
        REQUIRE(progression.state().questions_answered == 1);
        REQUIRE(progression.state().correct_answers == 0);
    }

    SECTION("Unknown question") {
        try {
            progression.record_answer(answer("zz", true));
            FAIL("Expected StateError");
        } catch (const core::StateError& e) {
            REQUIRE(e.code() == core::StateErrorCode::UnknownQuestion);
        }
    }

    SECTION("Streaks and comebacks") {
        progression.record_answer(answer("g1", true));
        progression.record_answer(answer("g2", true));
        progression.record_answer(answer("h1", false));
        progression.record_answer(answer("n1", false));
        progression.record_answer(answer("s1", true));

        const auto& state = progression.state();
        REQUIRE(state.best_streak == 2);
        REQUIRE(state.current_streak == 1);
        REQUIRE(state.incorrect_streak == 0);
        REQUIRE(state.best_comeback == 2);
    }

    SECTION("Skips, timeouts and hints are counted") {
        auto skipped = answer("g1", false);
        skipped.skipped = true;
        auto timed_out = answer("g2", false);
        timed_out.timed_out = true;
        auto hinted = answer("h1", true);
        hinted.hint_used = true;

        progression.record_answer(skipped);
        progression.record_answer(timed_out);
        progression.record_answer(hinted);

        const auto& state = progression.state();
        REQUIRE(state.questions_skipped == 1);
        REQUIRE(state.questions_timed_out == 1);
        REQUIRE(state.hints_used == 1);
        REQUIRE(state.questions_answered == 3);
        REQUIRE(state.correct_answers == 1);
    }
}

TEST_CASE_METHOD(ProgressionFixture, "ProgressionController achievements and play time", "[progression][controller]") {
    SECTION("Grant achievement once") {
        REQUIRE(progression.grant_achievement("explorer"));
        REQUIRE_FALSE(progression.grant_achievement("explorer"));
        REQUIRE_FALSE(progression.grant_achievement("unknown"));
        REQUIRE(progression.state().unlocked_achievement_ids == std::set<std::string>{"explorer"});
    }

    SECTION("Play time accumulates") {
        progression.add_play_time(1.5);
        progression.add_play_time(-3.0);
        progression.add_play_time(0.5);
        REQUIRE_THAT(progression.state().elapsed_play_seconds, WithinAbs(2.0, 0.0001));
    }

    SECTION("Reset keeps the player name") {
        progression.set_player_name("Ada");
        progression.unlock_neighbors("entrance");
        progression.move_to_room("garden");
        progression.apply_score_delta(50, events::ScoreReason::Answer);

        progression.reset();
        REQUIRE(progression.state().player_name == "Ada");
        REQUIRE(progression.current_room_id() == "entrance");
        REQUIRE(progression.state().score == 0);
        REQUIRE(progression.state().unlocked_room_ids.size() == 1);
    }
}

TEST_CASE("ProgressionController victory", "[progression][victory]") {
    auto corridor = make_corridor();
    events::GameEventBus bus;
    test::EventRecorder recorder(bus);
    ProgressionController progression(corridor, bus);

    // Visit r0..r7
    for (int i = 0; i < 7; ++i) {
        progression.unlock_neighbors("r" + std::to_string(i));
        progression.move_to_room("r" + std::to_string(i + 1));
    }

    REQUIRE_FALSE(progression.check_victory().has_value());

    // 75 of 100 answered, 54 of those correct
    for (int i = 0; i < 75; ++i) {
        AnswerRecord record;
        record.question_id = "q" + std::to_string(i);
        record.correct = i < 54;
        record.time_taken = 4.0f;
        progression.record_answer(record);
    }

    auto stats = progression.statistics();
    REQUIRE_THAT(stats.explored_ratio(), WithinAbs(0.8, 1e-9));
    REQUIRE_THAT(stats.answered_ratio(), WithinAbs(0.75, 1e-9));
    REQUIRE_THAT(stats.accuracy, WithinAbs(0.72, 1e-9));

    progression.add_play_time(120.0);
    recorder.clear();

    auto completed = progression.check_victory();
    REQUIRE(completed.has_value());
    REQUIRE(progression.is_completed());

    REQUIRE(completed->completion_bonus == 500);
    REQUIRE(completed->exploration_bonus == 80);
    REQUIRE(completed->accuracy_bonus == 720);
    REQUIRE(completed->speed_bonus == 750);
    REQUIRE(completed->speed_run);
    REQUIRE(completed->final_score == 2050);
    REQUIRE(completed->rooms_visited == 8);
    REQUIRE(completed->questions_answered == 75);
    REQUIRE_FALSE(completed->perfect_game);

    REQUIRE(progression.state().score == 2050);
    REQUIRE(progression.state().bonuses.total() == 2050);

    // GameCompleted precedes the bonus score change
    REQUIRE(recorder.kinds() == std::vector<size_t>{
        test::event_index<events::GameCompleted>(),
        test::event_index<events::ScoreChanged>()});
    REQUIRE(recorder.last<events::ScoreChanged>().reason == events::ScoreReason::CompletionBonus);

    SECTION("Completion happens once") {
        REQUIRE_FALSE(progression.check_victory().has_value());
        REQUIRE(recorder.count<events::GameCompleted>() == 1);
        REQUIRE(progression.state().score == 2050);
    }

    SECTION("Play time freezes after completion") {
        progression.add_play_time(30.0);
        REQUIRE_THAT(progression.state().elapsed_play_seconds, WithinAbs(120.0, 1e-9));
    }
}

TEST_CASE("ProgressionController victory needs every threshold", "[progression][victory]") {
    auto corridor = make_corridor();
    events::GameEventBus bus;
    ProgressionController progression(corridor, bus);

    for (int i = 0; i < 7; ++i) {
        progression.unlock_neighbors("r" + std::to_string(i));
        progression.move_to_room("r" + std::to_string(i + 1));
    }

    // 75 answered but only 50 correct: accuracy 0.667
    for (int i = 0; i < 75; ++i) {
        AnswerRecord record;
        record.question_id = "q" + std::to_string(i);
        record.correct = i < 50;
        progression.record_answer(record);
    }

    REQUIRE_FALSE(progression.check_victory().has_value());
    REQUIRE_FALSE(progression.is_completed());
    REQUIRE(progression.state().score == 0);
}
