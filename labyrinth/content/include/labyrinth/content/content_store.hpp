#pragma once

#include <labyrinth/content/room.hpp>
#include <labyrinth/content/question.hpp>
#include <labyrinth/content/achievement_definition.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <unordered_map>

namespace labyrinth::content {

// ============================================================================
// Content file names inside a content directory
// ============================================================================

inline constexpr const char* ROOMS_FILE = "rooms.json";
inline constexpr const char* QUESTIONS_FILE = "questions.json";
inline constexpr const char* ACHIEVEMENTS_FILE = "achievements.json";

// Upper bound for question points and the magnitude of achievement rewards
inline constexpr int MAX_CONTENT_POINTS = 1000000;

// ============================================================================
// ContentStore - Immutable rooms, questions and achievements
// ============================================================================
//
// Built once at startup. Every factory validates the whole data set and
// throws core::DataError listing all violations; a store that exists is
// always consistent (unique ids, resolvable connections, one start room,
// answer indices within bounds).

class ContentStore {
public:
    static ContentStore from_definitions(std::vector<Room> rooms,
                                         std::vector<Question> questions,
                                         std::vector<AchievementDefinition> achievements);

    // Documents shaped {"rooms": [...]}, {"questions": [...]}, {"achievements": [...]}
    static ContentStore from_json(const nlohmann::json& rooms_doc,
                                  const nlohmann::json& questions_doc,
                                  const nlohmann::json& achievements_doc);

    // Reads rooms.json, questions.json and achievements.json from directory
    static ContentStore load_from_directory(const std::string& directory);

    // Returns every structural violation (empty = valid)
    static std::vector<std::string> validate(const std::vector<Room>& rooms,
                                             const std::vector<Question>& questions,
                                             const std::vector<AchievementDefinition>& achievements);

    // ========================================================================
    // Lookup
    // ========================================================================

    const Room* find_room(const std::string& room_id) const;
    const Question* find_question(const std::string& question_id) const;
    const AchievementDefinition* find_achievement(const std::string& achievement_id) const;

    bool has_room(const std::string& room_id) const { return find_room(room_id) != nullptr; }
    bool has_question(const std::string& question_id) const { return find_question(question_id) != nullptr; }
    bool has_achievement(const std::string& achievement_id) const { return find_achievement(achievement_id) != nullptr; }

    const Room& start_room() const { return m_rooms[m_start_index]; }

    // Declaration order
    const std::vector<Room>& rooms() const { return m_rooms; }
    const std::vector<Question>& questions() const { return m_questions; }
    const std::vector<AchievementDefinition>& achievements() const { return m_achievements; }

    size_t room_count() const { return m_rooms.size(); }
    size_t question_count() const { return m_questions.size(); }

    // ========================================================================
    // Room Graph
    // ========================================================================

    // Undirected neighbours: the room's own connections first, then rooms
    // that list it, without duplicates
    const std::vector<std::string>& neighbors(const std::string& room_id) const;
    bool are_adjacent(const std::string& a, const std::string& b) const;

    // ========================================================================
    // Categories
    // ========================================================================

    std::vector<std::string> categories() const;
    size_t question_count_in_category(const std::string& category) const;

private:
    ContentStore() = default;

    void build_indices();

    std::vector<Room> m_rooms;
    std::vector<Question> m_questions;
    std::vector<AchievementDefinition> m_achievements;

    std::unordered_map<std::string, size_t> m_room_index;
    std::unordered_map<std::string, size_t> m_question_index;
    std::unordered_map<std::string, size_t> m_achievement_index;
    std::unordered_map<std::string, std::vector<std::string>> m_adjacency;
    size_t m_start_index = 0;
};

} // namespace labyrinth::content
