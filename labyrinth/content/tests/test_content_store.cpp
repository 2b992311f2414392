#include <catch2/catch_test_macros.hpp>
#include <labyrinth/content/content_store.hpp>
#include <labyrinth/core/errors.hpp>
#include <test_content.hpp>
#include <algorithm>
#include <limits>

using namespace labyrinth;
using namespace labyrinth::content;
using test::make_question;
using test::make_room;

namespace {

bool has_violation(const std::vector<std::string>& violations, const std::string& text) {
    return std::any_of(violations.begin(), violations.end(),
        [&text](const std::string& v) { return v.find(text) != std::string::npos; });
}

} // anonymous namespace

TEST_CASE("ContentStore builds from valid definitions", "[content][store]") {
    auto store = test::make_castle();

    REQUIRE(store.room_count() == 5);
    REQUIRE(store.question_count() == 5);
    REQUIRE(store.achievements().size() == 3);
    REQUIRE(store.start_room().id == "entrance");

    SECTION("Lookup") {
        REQUIRE(store.find_room("library") != nullptr);
        REQUIRE(store.find_room("cellar") == nullptr);
        REQUIRE(store.has_question("s1"));
        REQUIRE(store.find_question("s1")->points == 150);
        REQUIRE(store.has_achievement("explorer"));
        REQUIRE_FALSE(store.has_achievement("nope"));
    }

    SECTION("Declaration order is kept") {
        REQUIRE(store.rooms()[0].id == "entrance");
        REQUIRE(store.rooms()[4].id == "vault");
        REQUIRE(store.questions()[2].id == "h1");
    }
}

TEST_CASE("ContentStore room graph is undirected", "[content][graph]") {
    auto store = test::make_castle();

    SECTION("Own connections come first") {
        REQUIRE(store.neighbors("entrance") == std::vector<std::string>{"library", "garden"});
        REQUIRE(store.neighbors("library") == std::vector<std::string>{"tower", "entrance"});
    }

    SECTION("Reverse edges are added") {
        REQUIRE(store.neighbors("garden") == std::vector<std::string>{"entrance"});
        REQUIRE(store.neighbors("tower") == std::vector<std::string>{"library", "vault"});
        REQUIRE(store.are_adjacent("tower", "vault"));
        REQUIRE(store.are_adjacent("vault", "tower"));
    }

    SECTION("Unrelated rooms are not adjacent") {
        REQUIRE_FALSE(store.are_adjacent("entrance", "tower"));
        REQUIRE(store.neighbors("cellar").empty());
    }

    SECTION("Mutual listing is not duplicated") {
        auto rooms = test::castle_rooms();
        rooms[1].connections.push_back("entrance");
        auto mutual = ContentStore::from_definitions(rooms, test::castle_questions(), {});
        REQUIRE(mutual.neighbors("library") == std::vector<std::string>{"tower", "entrance"});
        REQUIRE(mutual.neighbors("entrance") == std::vector<std::string>{"library", "garden"});
    }
}

TEST_CASE("ContentStore categories", "[content][store]") {
    auto store = test::make_castle();

    REQUIRE(store.categories() == std::vector<std::string>{"general", "history", "nature", "science"});
    REQUIRE(store.question_count_in_category("general") == 2);
    REQUIRE(store.question_count_in_category("art") == 0);
}

TEST_CASE("ContentStore validation reports room problems", "[content][validation]") {
    auto questions = test::castle_questions();

    SECTION("No rooms") {
        auto violations = ContentStore::validate({}, questions, {});
        REQUIRE(has_violation(violations, "At least one room"));
    }

    SECTION("Duplicate room id") {
        auto rooms = test::castle_rooms();
        rooms.push_back(make_room("garden", {}, "nature"));
        auto violations = ContentStore::validate(rooms, questions, {});
        REQUIRE(has_violation(violations, "Duplicate room id: garden"));
    }

    SECTION("Missing start room") {
        std::vector<Room> rooms = {make_room("a", {"b"}, "general"), make_room("b", {}, "general")};
        auto violations = ContentStore::validate(rooms, questions, {});
        REQUIRE(has_violation(violations, "No room is marked as the starting room"));
    }

    SECTION("Several start rooms") {
        std::vector<Room> rooms = {make_room("a", {"b"}, "general", true), make_room("b", {}, "general", true)};
        auto violations = ContentStore::validate(rooms, questions, {});
        REQUIRE(has_violation(violations, "Multiple rooms"));
    }

    SECTION("Dangling connection") {
        auto rooms = test::castle_rooms();
        rooms[2].connections.push_back("dungeon");
        auto violations = ContentStore::validate(rooms, questions, {});
        REQUIRE(has_violation(violations, "garden references non-existent room: dungeon"));
    }

    SECTION("Self connection") {
        auto rooms = test::castle_rooms();
        rooms[3].connections.push_back("tower");
        auto violations = ContentStore::validate(rooms, questions, {});
        REQUIRE(has_violation(violations, "tower connects to itself"));
    }
}

TEST_CASE("ContentStore validation reports question problems", "[content][validation]") {
    auto rooms = test::castle_rooms();

    SECTION("No questions") {
        auto violations = ContentStore::validate(rooms, {}, {});
        REQUIRE(has_violation(violations, "At least one question"));
    }

    SECTION("Duplicate question id") {
        auto questions = test::castle_questions();
        questions.push_back(make_question("g1", "general", Difficulty::Hard));
        auto violations = ContentStore::validate(rooms, questions, {});
        REQUIRE(has_violation(violations, "Duplicate question id: g1"));
    }

    SECTION("Too few options") {
        auto questions = test::castle_questions();
        questions[0].options = {"only"};
        questions[0].correct_index = 0;
        auto violations = ContentStore::validate(rooms, questions, {});
        REQUIRE(has_violation(violations, "g1 must have at least 2 options"));
    }

    SECTION("Answer index out of bounds") {
        auto questions = test::castle_questions();
        questions[1].correct_index = 4;
        auto violations = ContentStore::validate(rooms, questions, {});
        REQUIRE(has_violation(violations, "g2 has correct_index 4"));

        questions[1].correct_index = -1;
        violations = ContentStore::validate(rooms, questions, {});
        REQUIRE(has_violation(violations, "g2 has correct_index -1"));
    }

    SECTION("Non-positive points") {
        auto questions = test::castle_questions();
        questions[2].points = 0;
        auto violations = ContentStore::validate(rooms, questions, {});
        REQUIRE(has_violation(violations, "h1 must have a positive points value"));
    }

    SECTION("Points above the content cap") {
        auto questions = test::castle_questions();
        questions[3].points = MAX_CONTENT_POINTS;
        REQUIRE(ContentStore::validate(rooms, questions, {}).empty());

        questions[3].points = std::numeric_limits<int>::max();
        auto violations = ContentStore::validate(rooms, questions, {});
        REQUIRE(violations.size() == 1);
        REQUIRE(has_violation(violations, "n1 points exceed 1000000"));
    }
}

TEST_CASE("ContentStore validation reports achievement problems", "[content][validation]") {
    auto rooms = test::castle_rooms();
    auto questions = test::castle_questions();

    SECTION("Duplicate achievement id") {
        auto achievements = test::castle_achievements();
        achievements.push_back(achievements[0]);
        auto violations = ContentStore::validate(rooms, questions, achievements);
        REQUIRE(has_violation(violations, "Duplicate achievement id: first_correct"));
    }

    SECTION("Unknown room in a room trigger") {
        std::vector<AchievementDefinition> achievements = {
            achievement().id("lost").name("Lost").room("catacombs").build()
        };
        auto violations = ContentStore::validate(rooms, questions, achievements);
        REQUIRE(has_violation(violations, "lost references non-existent room: catacombs"));
    }

    SECTION("Accuracy outside 0..1") {
        std::vector<AchievementDefinition> achievements = {
            achievement().id("sharp").name("Sharp").accuracy(1.5, 3).build()
        };
        auto violations = ContentStore::validate(rooms, questions, achievements);
        REQUIRE(has_violation(violations, "sharp accuracy must be within 0..1"));
    }

    SECTION("Reward points above the content cap") {
        std::vector<AchievementDefinition> achievements = {
            achievement().id("jackpot").name("Jackpot").points(std::numeric_limits<int>::max()).build(),
            achievement().id("curse").name("Curse").points(std::numeric_limits<int>::min()).build()
        };
        auto violations = ContentStore::validate(rooms, questions, achievements);
        REQUIRE(violations.size() == 2);
        REQUIRE(has_violation(violations, "jackpot points exceed"));
        REQUIRE(has_violation(violations, "curse points exceed"));
    }
}

TEST_CASE("ContentStore factory throws DataError with every violation", "[content][validation]") {
    auto rooms = test::castle_rooms();
    rooms[2].connections.push_back("dungeon");
    auto questions = test::castle_questions();
    questions[0].points = -5;

    try {
        auto store = ContentStore::from_definitions(rooms, questions, {});
        FAIL("Expected DataError");
    } catch (const core::DataError& e) {
        REQUIRE(e.violations().size() == 2);
        REQUIRE(has_violation(e.violations(), "dungeon"));
        REQUIRE(has_violation(e.violations(), "g1 must have a positive points value"));
    }
}
