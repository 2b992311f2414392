#include <labyrinth/content/content_store.hpp>
#include <labyrinth/content/json_loader.hpp>
#include <labyrinth/core/errors.hpp>
#include <labyrinth/core/log.hpp>
#include <algorithm>
#include <filesystem>
#include <unordered_set>

namespace labyrinth::content {

namespace {

const std::vector<std::string> EMPTY_NEIGHBORS;

template<typename T>
void append_errors(const LoadResult<T>& result, const std::string& source, std::vector<std::string>& violations) {
    for (const auto& err : result.errors) {
        violations.push_back(source + ": " + err);
    }
}

} // anonymous namespace

// ============================================================================
// Validation
// ============================================================================

std::vector<std::string> ContentStore::validate(const std::vector<Room>& rooms,
                                                const std::vector<Question>& questions,
                                                const std::vector<AchievementDefinition>& achievements) {
    std::vector<std::string> violations;

    // Rooms
    if (rooms.empty()) {
        violations.push_back("At least one room must be defined");
    }

    std::unordered_set<std::string> room_ids;
    int start_rooms = 0;
    for (const auto& room : rooms) {
        if (room.id.empty()) {
            violations.push_back("Room with empty id");
            continue;
        }
        if (!room_ids.insert(room.id).second) {
            violations.push_back("Duplicate room id: " + room.id);
        }
        if (room.is_starting_room) {
            ++start_rooms;
        }
    }

    if (!rooms.empty() && start_rooms == 0) {
        violations.push_back("No room is marked as the starting room");
    } else if (start_rooms > 1) {
        violations.push_back("Multiple rooms are marked as the starting room (" +
                             std::to_string(start_rooms) + ")");
    }

    for (const auto& room : rooms) {
        for (const auto& connection : room.connections) {
            if (!room_ids.contains(connection)) {
                violations.push_back("Room " + room.id + " references non-existent room: " + connection);
            } else if (connection == room.id) {
                violations.push_back("Room " + room.id + " connects to itself");
            }
        }
    }

    // Questions
    if (questions.empty()) {
        violations.push_back("At least one question must be defined");
    }

    std::unordered_set<std::string> question_ids;
    for (const auto& question : questions) {
        if (question.id.empty()) {
            violations.push_back("Question with empty id");
            continue;
        }
        if (!question_ids.insert(question.id).second) {
            violations.push_back("Duplicate question id: " + question.id);
        }
        if (question.options.size() < 2) {
            violations.push_back("Question " + question.id + " must have at least 2 options");
        }
        if (question.correct_index < 0 || question.correct_index >= question.option_count()) {
            violations.push_back("Question " + question.id + " has correct_index " +
                                 std::to_string(question.correct_index) + " outside its " +
                                 std::to_string(question.options.size()) + " options");
        }
        if (question.points <= 0) {
            violations.push_back("Question " + question.id + " must have a positive points value");
        } else if (question.points > MAX_CONTENT_POINTS) {
            violations.push_back("Question " + question.id + " points exceed " + std::to_string(MAX_CONTENT_POINTS));
        }
    }

    // Achievements
    std::unordered_set<std::string> achievement_ids;
    for (const auto& def : achievements) {
        if (def.achievement_id.empty()) {
            violations.push_back("Achievement with empty id");
            continue;
        }
        if (!achievement_ids.insert(def.achievement_id).second) {
            violations.push_back("Duplicate achievement id: " + def.achievement_id);
        }
        if (def.points > MAX_CONTENT_POINTS || def.points < -MAX_CONTENT_POINTS) {
            violations.push_back("Achievement " + def.achievement_id + " points exceed " +
                                 std::to_string(MAX_CONTENT_POINTS) + " in magnitude");
        }
        if (def.trigger.type == TriggerType::SpecificRoomVisited && !room_ids.contains(def.trigger.room_id)) {
            violations.push_back("Achievement " + def.achievement_id + " references non-existent room: " +
                                 def.trigger.room_id);
        }
        if (def.trigger.type == TriggerType::AccuracyWithMinimum &&
            (def.trigger.accuracy < 0.0 || def.trigger.accuracy > 1.0)) {
            violations.push_back("Achievement " + def.achievement_id + " accuracy must be within 0..1");
        }
    }

    return violations;
}

// ============================================================================
// Factories
// ============================================================================

ContentStore ContentStore::from_definitions(std::vector<Room> rooms,
                                            std::vector<Question> questions,
                                            std::vector<AchievementDefinition> achievements) {
    auto violations = validate(rooms, questions, achievements);
    if (!violations.empty()) {
        for (const auto& violation : violations) {
            core::log(core::LogLevel::Error, "[Content] {}", violation);
        }
        throw core::DataError(std::move(violations));
    }

    ContentStore store;
    store.m_rooms = std::move(rooms);
    store.m_questions = std::move(questions);
    store.m_achievements = std::move(achievements);
    store.build_indices();

    // Warn about categories no question can satisfy
    for (const auto& room : store.m_rooms) {
        if (store.question_count_in_category(room.preferred_category) == 0) {
            core::log(core::LogLevel::Warn, "[Content] Room {} prefers unused question category: {}",
                      room.id, room.preferred_category);
        }
    }

    core::log(core::LogLevel::Info, "[Content] Loaded {} rooms, {} questions, {} achievements",
              store.m_rooms.size(), store.m_questions.size(), store.m_achievements.size());
    return store;
}

ContentStore ContentStore::from_json(const nlohmann::json& rooms_doc,
                                     const nlohmann::json& questions_doc,
                                     const nlohmann::json& achievements_doc) {
    auto rooms = parse_json_array<Room>(rooms_doc, deserialize_room, "rooms");
    auto questions = parse_json_array<Question>(questions_doc, deserialize_question, "questions");
    auto achievements = parse_json_array<AchievementDefinition>(achievements_doc, deserialize_achievement,
                                                                "achievements");

    std::vector<std::string> violations;
    append_errors(rooms, ROOMS_FILE, violations);
    append_errors(questions, QUESTIONS_FILE, violations);
    append_errors(achievements, ACHIEVEMENTS_FILE, violations);

    if (!violations.empty()) {
        // Report structural problems together with the cross-reference ones
        auto more = validate(rooms.items, questions.items, achievements.items);
        violations.insert(violations.end(), more.begin(), more.end());
        for (const auto& violation : violations) {
            core::log(core::LogLevel::Error, "[Content] {}", violation);
        }
        throw core::DataError(std::move(violations));
    }

    return from_definitions(std::move(rooms.items), std::move(questions.items), std::move(achievements.items));
}

ContentStore ContentStore::load_from_directory(const std::string& directory) {
    namespace fs = std::filesystem;
    core::log(core::LogLevel::Info, "[Content] Loading content from: {}", directory);

    std::vector<std::string> violations;
    nlohmann::json docs[3];
    const char* files[3] = {ROOMS_FILE, QUESTIONS_FILE, ACHIEVEMENTS_FILE};

    for (int i = 0; i < 3; ++i) {
        std::string error;
        auto doc = load_json_file((fs::path(directory) / files[i]).string(), error);
        if (!doc) {
            violations.push_back(error);
            continue;
        }
        docs[i] = std::move(*doc);
    }

    if (!violations.empty()) {
        throw core::DataError(std::move(violations));
    }

    return from_json(docs[0], docs[1], docs[2]);
}

// ============================================================================
// Indexing
// ============================================================================

void ContentStore::build_indices() {
    m_room_index.clear();
    m_question_index.clear();
    m_achievement_index.clear();
    m_adjacency.clear();

    for (size_t i = 0; i < m_rooms.size(); ++i) {
        m_room_index[m_rooms[i].id] = i;
        if (m_rooms[i].is_starting_room) {
            m_start_index = i;
        }
    }
    for (size_t i = 0; i < m_questions.size(); ++i) {
        m_question_index[m_questions[i].id] = i;
    }
    for (size_t i = 0; i < m_achievements.size(); ++i) {
        m_achievement_index[m_achievements[i].achievement_id] = i;
    }

    auto add_edge = [this](const std::string& from, const std::string& to) {
        auto& list = m_adjacency[from];
        if (std::find(list.begin(), list.end(), to) == list.end()) {
            list.push_back(to);
        }
    };

    // Own connections first so declared order wins
    for (const auto& room : m_rooms) {
        m_adjacency[room.id];
        for (const auto& connection : room.connections) {
            add_edge(room.id, connection);
        }
    }
    for (const auto& room : m_rooms) {
        for (const auto& connection : room.connections) {
            add_edge(connection, room.id);
        }
    }
}

// ============================================================================
// Lookup
// ============================================================================

const Room* ContentStore::find_room(const std::string& room_id) const {
    auto it = m_room_index.find(room_id);
    return it != m_room_index.end() ? &m_rooms[it->second] : nullptr;
}

const Question* ContentStore::find_question(const std::string& question_id) const {
    auto it = m_question_index.find(question_id);
    return it != m_question_index.end() ? &m_questions[it->second] : nullptr;
}

const AchievementDefinition* ContentStore::find_achievement(const std::string& achievement_id) const {
    auto it = m_achievement_index.find(achievement_id);
    return it != m_achievement_index.end() ? &m_achievements[it->second] : nullptr;
}

const std::vector<std::string>& ContentStore::neighbors(const std::string& room_id) const {
    auto it = m_adjacency.find(room_id);
    return it != m_adjacency.end() ? it->second : EMPTY_NEIGHBORS;
}

bool ContentStore::are_adjacent(const std::string& a, const std::string& b) const {
    const auto& list = neighbors(a);
    return std::find(list.begin(), list.end(), b) != list.end();
}

std::vector<std::string> ContentStore::categories() const {
    std::vector<std::string> result;
    for (const auto& question : m_questions) {
        if (std::find(result.begin(), result.end(), question.category) == result.end()) {
            result.push_back(question.category);
        }
    }
    return result;
}

size_t ContentStore::question_count_in_category(const std::string& category) const {
    return static_cast<size_t>(std::count_if(m_questions.begin(), m_questions.end(),
        [&category](const Question& q) { return q.category == category; }));
}

} // namespace labyrinth::content
