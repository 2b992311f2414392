#pragma once

#include <labyrinth/progression/progression_state.hpp>
#include <labyrinth/progression/statistics.hpp>
#include <labyrinth/progression/victory.hpp>
#include <labyrinth/content/content_store.hpp>
#include <labyrinth/events/game_events.hpp>
#include <nlohmann/json.hpp>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace labyrinth::progression {

// Upgrades a snapshot document in place from from_version to from_version + 1.
// Returns false when the document cannot be migrated.
using SnapshotMigrationFunc = std::function<bool(nlohmann::json&, uint32_t)>;

// ============================================================================
// ProgressionController - Room graph, score and completion state
// ============================================================================
//
// Owns the ProgressionState of one player. Every mutation either succeeds
// completely or throws core::StateError / core::PersistenceError leaving the
// state untouched. Events are published on the bus as state changes.

class ProgressionController {
public:
    ProgressionController(const content::ContentStore& content,
                          events::GameEventBus& bus,
                          VictoryConfig victory = {});

    ProgressionController(const ProgressionController&) = delete;
    ProgressionController& operator=(const ProgressionController&) = delete;

    // ========================================================================
    // State Queries
    // ========================================================================

    const ProgressionState& state() const { return m_state; }
    const std::string& current_room_id() const { return m_state.current_room_id; }

    bool is_unlocked(const std::string& room_id) const { return m_state.unlocked_room_ids.contains(room_id); }
    bool is_visited(const std::string& room_id) const { return m_state.visited_room_ids.contains(room_id); }
    bool is_answered(const std::string& question_id) const { return m_state.answered_question_ids.contains(question_id); }
    bool is_completed() const { return m_state.completed; }

    PlayerStatistics statistics() const;

    // Unlocked rooms adjacent to the current room
    std::vector<std::string> available_rooms() const;

    const content::ContentStore& content() const { return m_content; }

    // ========================================================================
    // Room Graph
    // ========================================================================

    // Throws StateError{UnknownRoom} or StateError{InvalidMove}
    void move_to_room(const std::string& room_id);

    // Idempotent. Returns true only on the locked -> unlocked transition.
    // Refuses rooms not adjacent to an unlocked room.
    bool unlock_room(const std::string& room_id, const std::string& unlocked_from = "");

    // Unlocks every room adjacent to room_id, returns the new ones in order
    std::vector<std::string> unlock_neighbors(const std::string& room_id);

    // ========================================================================
    // Scoring
    // ========================================================================

    // Returns the new score
    int64_t apply_score_delta(int64_t delta, events::ScoreReason reason);

    // Throws StateError{QuestionAlreadyAnswered} / StateError{UnknownQuestion}
    void record_answer(const AnswerRecord& record);

    // Publishes GameCompleted and applies the bonuses the first time the
    // victory condition holds
    std::optional<events::GameCompleted> check_victory();

    // Returns true when newly granted
    bool grant_achievement(const std::string& achievement_id);

    // Play time stops accumulating once the game is completed
    void add_play_time(double seconds);

    void set_player_name(const std::string& name) { m_state.player_name = name; }

    const VictoryConfig& victory_config() const { return m_victory; }
    void set_victory_config(const VictoryConfig& config) { m_victory = config; }

    // ========================================================================
    // Persistence
    // ========================================================================

    nlohmann::json serialize() const;

    // Migrates, validates against the content and replaces the state.
    // Throws PersistenceError and applies nothing on failure.
    void restore(const nlohmann::json& snapshot);

    // Fresh state at the start room (player name is kept)
    void reset();

    // Migrations are applied sequentially: v1 -> v2 -> ... -> current
    void register_migration(uint32_t from_version, SnapshotMigrationFunc migration);

private:
    ProgressionState make_initial_state() const;
    ProgressionState parse_snapshot(const nlohmann::json& snapshot) const;
    void validate_snapshot_state(const ProgressionState& state) const;
    uint32_t detect_version(const nlohmann::json& snapshot) const;
    void apply_migrations(nlohmann::json& snapshot, uint32_t version) const;
    bool migrate_browser_save(nlohmann::json& snapshot) const;
    bool is_adjacent_to_unlocked(const std::string& room_id) const;

    const content::ContentStore& m_content;
    events::GameEventBus& m_bus;
    VictoryConfig m_victory;
    ProgressionState m_state;
    std::map<uint32_t, SnapshotMigrationFunc> m_migrations;
};

} // namespace labyrinth::progression
