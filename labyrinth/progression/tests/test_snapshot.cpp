#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <labyrinth/progression/progression_controller.hpp>
#include <labyrinth/progression/snapshot_store.hpp>
#include <labyrinth/core/errors.hpp>
#include <test_content.hpp>

using namespace labyrinth;
using namespace labyrinth::progression;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::WithinAbs;
using json = nlohmann::json;

namespace {

class SnapshotFixture {
protected:
    SnapshotFixture()
        : content(test::make_castle())
        , progression(content, bus) {}

    // Two rooms explored, two questions answered, one achievement
    void play_a_little() {
        progression.set_player_name("Ada");
        progression.unlock_neighbors("entrance");
        progression.move_to_room("library");

        AnswerRecord first;
        first.question_id = "g1";
        first.correct = true;
        first.time_taken = 2.5f;
        progression.record_answer(first);

        AnswerRecord second;
        second.question_id = "h1";
        second.skipped = true;
        progression.record_answer(second);

        progression.apply_score_delta(140, events::ScoreReason::Answer);
        progression.apply_score_delta(-10, events::ScoreReason::SkipPenalty);
        progression.grant_achievement("first_correct");
        progression.add_play_time(12.5);
    }

    void require_rejected(const json& snapshot, const std::string& reason) {
        ProgressionState before = progression.state();
        try {
            progression.restore(snapshot);
            FAIL("Expected PersistenceError");
        } catch (const core::PersistenceError& e) {
            REQUIRE_THAT(std::string(e.what()), ContainsSubstring(reason));
        }
        REQUIRE(progression.state() == before);
    }

    content::ContentStore content;
    events::GameEventBus bus;
    ProgressionController progression;
};

} // anonymous namespace

TEST_CASE_METHOD(SnapshotFixture, "Snapshot document layout", "[progression][snapshot]") {
    play_a_little();
    json j = progression.serialize();

    REQUIRE(j["format"] == SNAPSHOT_FORMAT);
    REQUIRE(j["schema_version"] == SNAPSHOT_SCHEMA_VERSION);
    REQUIRE(j["player_name"] == "Ada");
    REQUIRE(j["current_room_id"] == "library");
    REQUIRE(j["unlocked_room_ids"] == json::array({"entrance", "garden", "library"}));
    REQUIRE(j["visited_room_ids"] == json::array({"entrance", "library"}));
    REQUIRE(j["answered_question_ids"] == json::array({"g1", "h1"}));
    REQUIRE(j["score"] == 130);
    REQUIRE(j["statistics"]["questions_skipped"] == 1);
    REQUIRE(j["statistics"]["correct_by_category"] == json{{"general", 1}});
    REQUIRE(j["bonuses"]["completion"] == 0);
}

TEST_CASE_METHOD(SnapshotFixture, "Snapshot round trip restores identical state", "[progression][snapshot]") {
    play_a_little();
    std::string text = progression.serialize().dump(2);

    events::GameEventBus other_bus;
    ProgressionController restored(content, other_bus);
    restored.restore(parse_snapshot_text(text));

    REQUIRE(restored.state() == progression.state());
    REQUIRE(restored.current_room_id() == "library");
    REQUIRE_THAT(restored.state().elapsed_play_seconds, WithinAbs(12.5, 1e-9));
}

TEST_CASE_METHOD(SnapshotFixture, "Snapshot restore rejects bad documents", "[progression][snapshot]") {
    play_a_little();
    json good = progression.serialize();

    SECTION("Not an object") {
        require_rejected(json::array({1, 2}), "not a JSON object");
    }

    SECTION("No version") {
        json j = good;
        j.erase("schema_version");
        require_rejected(j, "no schema_version");
    }

    SECTION("Future version") {
        json j = good;
        j["schema_version"] = 99u;
        require_rejected(j, "Unsupported snapshot version: 99");
    }

    SECTION("Version zero") {
        json j = good;
        j["schema_version"] = 0u;
        require_rejected(j, "Unsupported snapshot version: 0");
    }

    SECTION("Version wider than 32 bits") {
        json j = good;
        j["schema_version"] = 4294967298ULL;
        j["score"] = 777;
        require_rejected(j, "Unsupported snapshot version: 4294967298");
    }

    SECTION("Score beyond 64-bit signed range") {
        json j = good;
        j["score"] = 18446744073709551615ULL;
        require_rejected(j, "'score' is out of range");
    }

    SECTION("Wrong format") {
        json j = good;
        j["format"] = "something-else";
        require_rejected(j, "format");
    }

    SECTION("Mistyped field") {
        json j = good;
        j["score"] = "lots";
        require_rejected(j, "'score'");
    }

    SECTION("Negative counter") {
        json j = good;
        j["statistics"]["hints_used"] = -1;
        require_rejected(j, "out of range");
    }

    SECTION("Unknown room") {
        json j = good;
        j["unlocked_room_ids"].push_back("cellar");
        require_rejected(j, "unknown room cellar");
    }

    SECTION("Unknown question") {
        json j = good;
        j["answered_question_ids"].push_back("zz");
        j["questions_answered"] = 3;
        require_rejected(j, "unknown question zz");
    }

    SECTION("Visited room that is locked") {
        json j = good;
        j["visited_room_ids"].push_back("tower");
        require_rejected(j, "visited room tower is not unlocked");
    }

    SECTION("Current room not visited") {
        json j = good;
        j["current_room_id"] = "garden";
        require_rejected(j, "current room garden is not visited");
    }

    SECTION("Unlocked room cut off from the start") {
        json j = good;
        j["unlocked_room_ids"] = json::array({"entrance", "library", "garden", "vault"});
        require_rejected(j, "not connected to the start room");
    }

    SECTION("Answer count mismatch") {
        json j = good;
        j["questions_answered"] = 5;
        require_rejected(j, "questions_answered");
    }

    SECTION("More correct than answered") {
        json j = good;
        j["correct_answers"] = 3;
        require_rejected(j, "correct_answers exceeds");
    }

    SECTION("Category correct count above its answers") {
        json j = good;
        j["statistics"]["correct_by_category"]["science"] = 1;
        require_rejected(j, "category science exceed");
    }

    SECTION("Category correct counts above the total") {
        json j = good;
        j["statistics"]["correct_by_category"]["history"] = 1;
        require_rejected(j, "correct_by_category exceeds correct_answers");
    }

    SECTION("Mistyped category count") {
        json j = good;
        j["statistics"]["correct_by_category"]["general"] = "one";
        require_rejected(j, "'general'");
    }

    SECTION("Negative play time") {
        json j = good;
        j["elapsed_play_seconds"] = -4.0;
        require_rejected(j, "elapsed_play_seconds");
    }

    SECTION("Corrupt text") {
        REQUIRE_THROWS_AS(parse_snapshot_text("{\"format\": "), core::PersistenceError);
    }
}

TEST_CASE_METHOD(SnapshotFixture, "Snapshots without category counts still restore", "[progression][snapshot]") {
    play_a_little();
    json j = progression.serialize();
    j["statistics"].erase("correct_by_category");

    events::GameEventBus other_bus;
    ProgressionController restored(content, other_bus);
    restored.restore(j);

    REQUIRE(restored.state().correct_by_category.empty());
    REQUIRE(restored.state().correct_answers == 1);
}

TEST_CASE_METHOD(SnapshotFixture, "Browser saves migrate to the current schema", "[progression][migration]") {
    json legacy = {
        {"playerName", "Grace"},
        {"currentRoomId", "library"},
        {"unlockedRooms", {"entrance", "library", "garden"}},
        {"visitedRooms", {"entrance", "library"}},
        {"answeredQuestions", {"g1", "h1", "g1"}},
        {"score", 250},
        {"startTime", 1000},
        {"saveTime", 61000},
        {"gameCompleted", false}
    };

    SECTION("Fields are carried over") {
        progression.restore(legacy);

        const auto& state = progression.state();
        REQUIRE(state.schema_version == SNAPSHOT_SCHEMA_VERSION);
        REQUIRE(state.player_name == "Grace");
        REQUIRE(state.current_room_id == "library");
        REQUIRE(state.unlocked_room_ids == std::set<std::string>{"entrance", "garden", "library"});
        REQUIRE(state.answered_question_ids == std::set<std::string>{"g1", "h1"});
        REQUIRE(state.questions_answered == 2);
        REQUIRE(state.correct_answers == 0);
        REQUIRE(state.score == 250);
        REQUIRE_THAT(state.elapsed_play_seconds, WithinAbs(60.0, 1e-9));
        REQUIRE(state.unlocked_achievement_ids.empty());
        REQUIRE(state.correct_by_category.empty());
    }

    SECTION("Missing room lists default to the start room") {
        json minimal = {{"currentRoomId", "entrance"}};
        progression.restore(minimal);
        REQUIRE(progression.state().unlocked_room_ids == std::set<std::string>{"entrance"});
        REQUIRE(progression.state().score == 0);
    }

    SECTION("Malformed legacy fields fail the migration") {
        json broken = legacy;
        broken["visitedRooms"] = "entrance";
        play_a_little();
        require_rejected(broken, "Migration from snapshot version 1 failed");
    }

    SECTION("Registered migrations replace the built-in one") {
        progression.register_migration(1, [](json&, uint32_t) { return false; });
        require_rejected(legacy, "Migration from snapshot version 1 failed");
    }
}
