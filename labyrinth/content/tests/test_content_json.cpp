#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <labyrinth/content/content_store.hpp>
#include <labyrinth/content/json_loader.hpp>
#include <labyrinth/core/errors.hpp>
#include <filesystem>
#include <fstream>

using namespace labyrinth;
using namespace labyrinth::content;
using Catch::Matchers::WithinAbs;
using json = nlohmann::json;

namespace {

json rooms_doc() {
    return json::parse(R"({
        "rooms": [
            {"id": "hall", "name": "Hall", "description": "Start", "connections": ["study"],
             "preferred_category": "general", "is_starting_room": true},
            {"id": "study", "name": "Study", "connections": [], "preferred_category": "history"}
        ]
    })");
}

json questions_doc() {
    return json::parse(R"({
        "questions": [
            {"id": "q1", "prompt": "One?", "options": ["a", "b"], "correct_index": 0,
             "category": "general", "difficulty": "easy", "points": 100, "hint": "first"},
            {"id": "q2", "prompt": "Two?", "options": ["a", "b", "c"], "correct_index": 2,
             "category": "history", "difficulty": "hard", "points": 200, "explanation": "c it is"}
        ]
    })");
}

json achievements_doc() {
    return json::parse(R"({
        "achievements": [
            {"id": "quick", "name": "Quick", "description": "Fast answers", "category": "speed",
             "points": 40, "rarity": "rare",
             "trigger": {"type": "quick_answers", "value": 3, "time_limit": 5}},
            {"id": "studious", "name": "Studious", "points": 10, "display_order": 2,
             "trigger": {"type": "specific_room_visited", "room_id": "study"}}
        ]
    })");
}

class ContentDirectoryFixture {
protected:
    ContentDirectoryFixture() {
        m_directory = std::filesystem::temp_directory_path() / "labyrinth_content_test";
        std::filesystem::remove_all(m_directory);
        std::filesystem::create_directories(m_directory);
    }

    ~ContentDirectoryFixture() {
        std::error_code ec;
        std::filesystem::remove_all(m_directory, ec);
    }

    void write_file(const char* name, const std::string& text) {
        std::ofstream file(m_directory / name);
        file << text;
    }

    std::filesystem::path m_directory;
};

} // anonymous namespace

TEST_CASE("ContentStore parses JSON documents", "[content][json]") {
    auto store = ContentStore::from_json(rooms_doc(), questions_doc(), achievements_doc());

    REQUIRE(store.room_count() == 2);
    REQUIRE(store.start_room().id == "hall");
    REQUIRE(store.find_room("study")->preferred_category == "history");
    REQUIRE(store.are_adjacent("study", "hall"));

    const auto* q2 = store.find_question("q2");
    REQUIRE(q2 != nullptr);
    REQUIRE(q2->difficulty == Difficulty::Hard);
    REQUIRE(q2->correct_index == 2);
    REQUIRE(q2->explanation == "c it is");
    REQUIRE_FALSE(q2->has_hint());
    REQUIRE(store.find_question("q1")->hint == "first");

    const auto* quick = store.find_achievement("quick");
    REQUIRE(quick != nullptr);
    REQUIRE(quick->trigger.type == TriggerType::QuickAnswers);
    REQUIRE(quick->trigger.value == 3);
    REQUIRE_THAT(quick->trigger.time_limit, WithinAbs(5.0f, 0.001f));
    REQUIRE(quick->rarity == AchievementRarity::Rare);

    const auto* studious = store.find_achievement("studious");
    REQUIRE(studious->trigger.room_id == "study");
    REQUIRE(studious->category == "misc");
    REQUIRE(studious->display_order == 2);
}

TEST_CASE("ContentStore JSON errors name their file", "[content][json]") {
    SECTION("Missing array key") {
        try {
            auto store = ContentStore::from_json(json::object(), questions_doc(), achievements_doc());
            FAIL("Expected DataError");
        } catch (const core::DataError& e) {
            REQUIRE(e.violations().front() == "rooms.json: Missing key 'rooms' in JSON");
        }
    }

    SECTION("Unknown difficulty") {
        auto questions = questions_doc();
        questions["questions"][0]["difficulty"] = "brutal";
        try {
            auto store = ContentStore::from_json(rooms_doc(), questions, achievements_doc());
            FAIL("Expected DataError");
        } catch (const core::DataError& e) {
            REQUIRE(e.violations().front().find("questions.json: Item 0") == 0);
            REQUIRE(e.violations().front().find("unknown difficulty 'brutal'") != std::string::npos);
        }
    }

    SECTION("Integers wider than int") {
        auto questions = questions_doc();
        questions["questions"][0] = json::parse(R"({"id": "wide", "prompt": "?", "options": ["a", "b"],
            "correct_index": 4294967296, "points": 4294967396})");
        try {
            auto store = ContentStore::from_json(rooms_doc(), questions, achievements_doc());
            FAIL("Expected DataError");
        } catch (const core::DataError& e) {
            REQUIRE(e.violations().size() == 1);
            REQUIRE(e.violations().front() ==
                    "questions.json: Item 0: Question 'wide': Field 'correct_index' is out of range: 4294967296");
        }
    }

    SECTION("Unknown trigger type") {
        auto achievements = achievements_doc();
        achievements["achievements"][1]["trigger"]["type"] = "moon_landing";
        REQUIRE_THROWS_AS(ContentStore::from_json(rooms_doc(), questions_doc(), achievements),
                          core::DataError);
    }
}

TEST_CASE("Question deserialization", "[content][json]") {
    std::string error;

    SECTION("Points are required") {
        auto j = questions_doc()["questions"][0];
        j.erase("points");
        REQUIRE_FALSE(deserialize_question(j, error).has_value());
        REQUIRE(error == "Question 'q1': Missing required field 'points'");
    }

    SECTION("Options must be strings") {
        auto j = questions_doc()["questions"][0];
        j["options"] = json::array({"a", 2});
        REQUIRE_FALSE(deserialize_question(j, error).has_value());
        REQUIRE(error.find("options must be strings") != std::string::npos);
    }

    SECTION("Integers outside the int range are rejected") {
        auto j = questions_doc()["questions"][0];
        j["points"] = 4294967396;
        REQUIRE_FALSE(deserialize_question(j, error).has_value());
        REQUIRE(error == "Question 'q1': Field 'points' is out of range: 4294967396");

        j["points"] = 100;
        j["correct_index"] = -2147483649LL;
        REQUIRE_FALSE(deserialize_question(j, error).has_value());
        REQUIRE(error.find("'correct_index' is out of range") != std::string::npos);

        j["correct_index"] = 1;
        REQUIRE(deserialize_question(j, error).has_value());
    }

    SECTION("Defaults") {
        json j = {{"id", "bare"}, {"prompt", "?"}, {"options", {"x", "y"}},
                  {"correct_index", 1}, {"points", 10}};
        auto question = deserialize_question(j, error);
        REQUIRE(question.has_value());
        REQUIRE(question->category == "general");
        REQUIRE(question->difficulty == Difficulty::Medium);
    }
}

TEST_CASE("Room deserialization", "[content][json]") {
    std::string error;

    json j = {{"id", "hall"}, {"name", "Hall"}, {"connections", {"a", 3}}};
    REQUIRE_FALSE(deserialize_room(j, error).has_value());
    REQUIRE(error.find("connections must be room id strings") != std::string::npos);

    json no_name = {{"id", "hall"}, {"connections", json::array()}};
    REQUIRE_FALSE(deserialize_room(no_name, error).has_value());
    REQUIRE(error == "Room 'hall': Missing required field 'name'");
}

TEST_CASE("Trigger and rarity names", "[content][achievement]") {
    TriggerType type = TriggerType::GameCompleted;
    REQUIRE(parse_trigger_type("comeback_correct", type));
    REQUIRE(type == TriggerType::ComebackCorrect);
    REQUIRE(std::string(get_trigger_type_name(TriggerType::AccuracyWithMinimum)) == "accuracy_with_minimum");
    REQUIRE_FALSE(parse_trigger_type("bogus", type));

    AchievementRarity rarity = AchievementRarity::Common;
    REQUIRE(parse_rarity("legendary", rarity));
    REQUIRE(rarity == AchievementRarity::Legendary);
    REQUIRE(std::string(get_rarity_name(AchievementRarity::Epic)) == "epic");
}

TEST_CASE("Achievement deserialization", "[content][achievement]") {
    std::string error;
    auto j = achievements_doc()["achievements"][0];

    SECTION("Optional integers keep their defaults") {
        auto bare = json{{"id", "bare"}, {"name", "Bare"}, {"trigger", {{"type", "game_completed"}}}};
        auto def = deserialize_achievement(bare, error);
        REQUIRE(def.has_value());
        REQUIRE(def->points == 0);
        REQUIRE(def->trigger.value == 1);
    }

    SECTION("Wide reward points are rejected") {
        j["points"] = 4294967296ULL;
        REQUIRE_FALSE(deserialize_achievement(j, error).has_value());
        REQUIRE(error == "Achievement 'quick': Field 'points' is out of range: 4294967296");
    }

    SECTION("Wide trigger values are rejected") {
        j["trigger"]["value"] = 8589934595LL;
        REQUIRE_FALSE(deserialize_achievement(j, error).has_value());
        REQUIRE(error.find("'value' is out of range") != std::string::npos);
    }

    SECTION("Mistyped optional integers are rejected") {
        j["display_order"] = "first";
        REQUIRE_FALSE(deserialize_achievement(j, error).has_value());
        REQUIRE(error.find("display_order") != std::string::npos);
    }
}

TEST_CASE("AchievementBuilder", "[content][achievement]") {
    auto def = achievement()
        .id("sharp")
        .name("Sharp")
        .description("90% over ten")
        .category("mastery")
        .points(75)
        .rarity(AchievementRarity::Epic)
        .accuracy(0.9, 10)
        .order(3)
        .build();

    REQUIRE(def.achievement_id == "sharp");
    REQUIRE(def.display_name == "Sharp");
    REQUIRE(def.category == "mastery");
    REQUIRE(def.points == 75);
    REQUIRE(def.rarity == AchievementRarity::Epic);
    REQUIRE(def.trigger.type == TriggerType::AccuracyWithMinimum);
    REQUIRE(def.trigger.min_questions == 10);
    REQUIRE_THAT(def.trigger.accuracy, WithinAbs(0.9, 0.0001));
    REQUIRE(def.display_order == 3);
}

TEST_CASE_METHOD(ContentDirectoryFixture, "ContentStore loads a content directory", "[content][json]") {
    SECTION("All files present") {
        write_file(ROOMS_FILE, rooms_doc().dump());
        write_file(QUESTIONS_FILE, questions_doc().dump());
        write_file(ACHIEVEMENTS_FILE, achievements_doc().dump());

        auto store = ContentStore::load_from_directory(m_directory.string());
        REQUIRE(store.room_count() == 2);
        REQUIRE(store.question_count() == 2);
    }

    SECTION("Missing file") {
        write_file(ROOMS_FILE, rooms_doc().dump());
        write_file(QUESTIONS_FILE, questions_doc().dump());

        try {
            auto store = ContentStore::load_from_directory(m_directory.string());
            FAIL("Expected DataError");
        } catch (const core::DataError& e) {
            REQUIRE(e.violations().size() == 1);
            REQUIRE(e.violations()[0].find("Failed to open file") != std::string::npos);
        }
    }

    SECTION("Malformed JSON") {
        write_file(ROOMS_FILE, "{ \"rooms\": [ ");
        write_file(QUESTIONS_FILE, questions_doc().dump());
        write_file(ACHIEVEMENTS_FILE, achievements_doc().dump());

        REQUIRE_THROWS_AS(ContentStore::load_from_directory(m_directory.string()), core::DataError);
    }
}

TEST_CASE("Shipped content is consistent", "[content][json][data]") {
    auto store = ContentStore::load_from_directory(std::string(LABYRINTH_SOURCE_DIR) + "/data");

    REQUIRE(store.room_count() == 8);
    REQUIRE(store.question_count() == 17);
    REQUIRE(store.achievements().size() == 12);
    REQUIRE(store.start_room().id == "entrance");

    // Every room prefers a category that has questions
    for (const auto& room : store.rooms()) {
        INFO(room.id);
        REQUIRE(store.question_count_in_category(room.preferred_category) > 0);
    }
}
