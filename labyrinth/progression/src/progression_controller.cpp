#include <labyrinth/progression/progression_controller.hpp>
#include <labyrinth/core/errors.hpp>
#include <labyrinth/core/log.hpp>
#include <algorithm>
#include <cmath>
#include <deque>
#include <limits>

namespace labyrinth::progression {

using nlohmann::json;

namespace {

// ============================================================================
// Snapshot Field Readers - throw PersistenceError on missing/mistyped fields
// ============================================================================

[[noreturn]] void field_error(const char* key, const char* expected) {
    throw core::PersistenceError(std::string("Snapshot field '") + key + "' is missing or not " + expected);
}

std::string read_string(const json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_string()) field_error(key, "a string");
    return j[key].get<std::string>();
}

int64_t read_integer(const json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_number_integer()) field_error(key, "an integer");
    if (j[key].is_number_unsigned() &&
        j[key].get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        throw core::PersistenceError(std::string("Snapshot field '") + key + "' is out of range");
    }
    return j[key].get<int64_t>();
}

int read_count(const json& j, const char* key) {
    int64_t value = read_integer(j, key);
    if (value < 0 || value > std::numeric_limits<int>::max()) {
        throw core::PersistenceError(std::string("Snapshot field '") + key + "' is out of range");
    }
    return static_cast<int>(value);
}

double read_number(const json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_number()) field_error(key, "a number");
    return j[key].get<double>();
}

bool read_bool(const json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_boolean()) field_error(key, "a boolean");
    return j[key].get<bool>();
}

const json& read_object(const json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_object()) field_error(key, "an object");
    return j[key];
}

std::set<std::string> read_id_set(const json& j, const char* key) {
    if (!j.contains(key) || !j[key].is_array()) field_error(key, "an array");
    std::set<std::string> ids;
    for (const auto& item : j[key]) {
        if (!item.is_string()) field_error(key, "an array of strings");
        ids.insert(item.get<std::string>());
    }
    return ids;
}

json to_json_array(const std::set<std::string>& ids) {
    json arr = json::array();
    for (const auto& id : ids) {
        arr.push_back(id);
    }
    return arr;
}

// Browser saves stored ids as plain arrays; absent means the default
bool copy_id_array(const json& from, const char* from_key, json& to, const char* to_key, const json& fallback) {
    if (!from.contains(from_key)) {
        to[to_key] = fallback;
        return true;
    }
    if (!from[from_key].is_array()) return false;
    for (const auto& item : from[from_key]) {
        if (!item.is_string()) return false;
    }
    to[to_key] = from[from_key];
    return true;
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

ProgressionController::ProgressionController(const content::ContentStore& content,
                                             events::GameEventBus& bus,
                                             VictoryConfig victory)
    : m_content(content)
    , m_bus(bus)
    , m_victory(victory) {
    m_state = make_initial_state();

    register_migration(1, [this](json& snapshot, uint32_t /*from*/) {
        return migrate_browser_save(snapshot);
    });
}

ProgressionState ProgressionController::make_initial_state() const {
    ProgressionState state;
    const std::string& start = m_content.start_room().id;
    state.current_room_id = start;
    state.unlocked_room_ids.insert(start);
    state.visited_room_ids.insert(start);
    return state;
}

// ============================================================================
// Queries
// ============================================================================

PlayerStatistics ProgressionController::statistics() const {
    PlayerStatistics stats;
    stats.rooms_visited = static_cast<int>(m_state.visited_room_ids.size());
    stats.rooms_total = static_cast<int>(m_content.room_count());
    stats.visited_room_ids = m_state.visited_room_ids;

    stats.questions_answered = m_state.questions_answered;
    stats.questions_total = static_cast<int>(m_content.question_count());
    stats.correct_answers = m_state.correct_answers;
    stats.accuracy = m_state.questions_answered > 0
        ? static_cast<double>(m_state.correct_answers) / m_state.questions_answered
        : 0.0;

    stats.current_streak = m_state.current_streak;
    stats.best_streak = m_state.best_streak;
    stats.incorrect_streak = m_state.incorrect_streak;
    stats.best_comeback = m_state.best_comeback;
    stats.hints_used = m_state.hints_used;
    stats.questions_skipped = m_state.questions_skipped;
    stats.questions_timed_out = m_state.questions_timed_out;
    stats.correct_answer_times = m_state.correct_answer_times;

    stats.score = m_state.score;
    stats.elapsed_play_seconds = m_state.elapsed_play_seconds;
    stats.completed = m_state.completed;
    return stats;
}

std::vector<std::string> ProgressionController::available_rooms() const {
    std::vector<std::string> rooms;
    for (const auto& neighbor : m_content.neighbors(m_state.current_room_id)) {
        if (is_unlocked(neighbor)) {
            rooms.push_back(neighbor);
        }
    }
    return rooms;
}

// ============================================================================
// Room Graph
// ============================================================================

void ProgressionController::move_to_room(const std::string& room_id) {
    if (!m_content.has_room(room_id)) {
        throw core::StateError(core::StateErrorCode::UnknownRoom, "Unknown room: " + room_id);
    }
    if (!is_unlocked(room_id)) {
        throw core::StateError(core::StateErrorCode::InvalidMove, "Room is locked: " + room_id);
    }

    events::RoomChanged event;
    event.from_room_id = m_state.current_room_id;
    event.to_room_id = room_id;
    event.first_visit = m_state.visited_room_ids.insert(room_id).second;
    m_state.current_room_id = room_id;

    core::log(core::LogLevel::Debug, "[Progression] Moved {} -> {}", event.from_room_id, room_id);
    m_bus.publish(event);
}

bool ProgressionController::is_adjacent_to_unlocked(const std::string& room_id) const {
    const auto& neighbors = m_content.neighbors(room_id);
    return std::any_of(neighbors.begin(), neighbors.end(),
        [this](const std::string& id) { return is_unlocked(id); });
}

bool ProgressionController::unlock_room(const std::string& room_id, const std::string& unlocked_from) {
    if (!m_content.has_room(room_id)) {
        core::log(core::LogLevel::Warn, "[Progression] Cannot unlock unknown room: {}", room_id);
        return false;
    }
    if (is_unlocked(room_id)) {
        return false;
    }
    if (!is_adjacent_to_unlocked(room_id)) {
        core::log(core::LogLevel::Warn, "[Progression] Refusing to unlock unreachable room: {}", room_id);
        return false;
    }

    m_state.unlocked_room_ids.insert(room_id);
    core::log(core::LogLevel::Info, "[Progression] Unlocked room: {}", room_id);
    m_bus.publish(events::RoomUnlocked{room_id, unlocked_from});
    return true;
}

std::vector<std::string> ProgressionController::unlock_neighbors(const std::string& room_id) {
    std::vector<std::string> unlocked;
    for (const auto& neighbor : m_content.neighbors(room_id)) {
        if (unlock_room(neighbor, room_id)) {
            unlocked.push_back(neighbor);
        }
    }
    return unlocked;
}

// ============================================================================
// Scoring
// ============================================================================

int64_t ProgressionController::apply_score_delta(int64_t delta, events::ScoreReason reason) {
    m_state.score += delta;
    core::log(core::LogLevel::Debug, "[Progression] Score {} ({}): {}",
              delta, events::get_score_reason_name(reason), m_state.score);
    m_bus.publish(events::ScoreChanged{delta, m_state.score, reason});
    return m_state.score;
}

void ProgressionController::record_answer(const AnswerRecord& record) {
    if (!m_content.has_question(record.question_id)) {
        throw core::StateError(core::StateErrorCode::UnknownQuestion,
                               "Unknown question: " + record.question_id);
    }
    if (is_answered(record.question_id)) {
        throw core::StateError(core::StateErrorCode::QuestionAlreadyAnswered,
                               "Question already answered: " + record.question_id);
    }

    m_state.answered_question_ids.insert(record.question_id);
    ++m_state.questions_answered;

    if (record.correct) {
        ++m_state.correct_answers;
        if (m_state.incorrect_streak > 0) {
            m_state.best_comeback = std::max(m_state.best_comeback, m_state.incorrect_streak);
        }
        m_state.incorrect_streak = 0;
        ++m_state.current_streak;
        m_state.best_streak = std::max(m_state.best_streak, m_state.current_streak);
        m_state.correct_answer_times.push_back(record.time_taken);
        ++m_state.correct_by_category[m_content.find_question(record.question_id)->category];
    } else {
        m_state.current_streak = 0;
        ++m_state.incorrect_streak;
    }

    if (record.skipped) ++m_state.questions_skipped;
    if (record.timed_out) ++m_state.questions_timed_out;
    if (record.hint_used) ++m_state.hints_used;
}

std::optional<events::GameCompleted> ProgressionController::check_victory() {
    if (m_state.completed) {
        return std::nullopt;
    }

    PlayerStatistics stats = statistics();
    if (!is_victory(stats, m_victory)) {
        return std::nullopt;
    }

    m_state.completed = true;
    m_state.bonuses = compute_bonuses(stats, m_victory);
    stats.completed = true;

    events::GameCompleted event;
    event.completion_bonus = m_state.bonuses.completion;
    event.exploration_bonus = m_state.bonuses.exploration;
    event.accuracy_bonus = m_state.bonuses.accuracy;
    event.speed_bonus = m_state.bonuses.speed;
    event.final_score = m_state.score + m_state.bonuses.total();
    event.rooms_visited = stats.rooms_visited;
    event.rooms_total = stats.rooms_total;
    event.questions_answered = stats.questions_answered;
    event.questions_total = stats.questions_total;
    event.correct_answers = stats.correct_answers;
    event.accuracy = stats.accuracy;
    event.play_time_seconds = stats.elapsed_play_seconds;
    event.performance_score = compute_performance_score(stats);
    event.perfect_game = is_perfect_game(stats);
    event.speed_run = m_state.bonuses.speed > 0;

    core::log(core::LogLevel::Info, "[Progression] Game completed: score {} + bonus {}",
              m_state.score, m_state.bonuses.total());

    m_bus.publish(event);
    apply_score_delta(m_state.bonuses.total(), events::ScoreReason::CompletionBonus);
    return event;
}

bool ProgressionController::grant_achievement(const std::string& achievement_id) {
    if (!m_content.has_achievement(achievement_id)) {
        core::log(core::LogLevel::Warn, "[Progression] Cannot grant unknown achievement: {}", achievement_id);
        return false;
    }
    return m_state.unlocked_achievement_ids.insert(achievement_id).second;
}

void ProgressionController::add_play_time(double seconds) {
    if (m_state.completed || seconds <= 0.0) {
        return;
    }
    m_state.elapsed_play_seconds += seconds;
}

// ============================================================================
// Persistence
// ============================================================================

json ProgressionController::serialize() const {
    json j;
    j["format"] = SNAPSHOT_FORMAT;
    j["schema_version"] = SNAPSHOT_SCHEMA_VERSION;
    j["player_name"] = m_state.player_name;
    j["current_room_id"] = m_state.current_room_id;
    j["unlocked_room_ids"] = to_json_array(m_state.unlocked_room_ids);
    j["visited_room_ids"] = to_json_array(m_state.visited_room_ids);
    j["answered_question_ids"] = to_json_array(m_state.answered_question_ids);
    j["unlocked_achievement_ids"] = to_json_array(m_state.unlocked_achievement_ids);
    j["score"] = m_state.score;
    j["questions_answered"] = m_state.questions_answered;
    j["correct_answers"] = m_state.correct_answers;
    j["elapsed_play_seconds"] = m_state.elapsed_play_seconds;
    j["completed"] = m_state.completed;

    json& stats = j["statistics"];
    stats["current_streak"] = m_state.current_streak;
    stats["best_streak"] = m_state.best_streak;
    stats["incorrect_streak"] = m_state.incorrect_streak;
    stats["best_comeback"] = m_state.best_comeback;
    stats["hints_used"] = m_state.hints_used;
    stats["questions_skipped"] = m_state.questions_skipped;
    stats["questions_timed_out"] = m_state.questions_timed_out;
    stats["correct_answer_times"] = m_state.correct_answer_times;
    stats["correct_by_category"] = m_state.correct_by_category;

    json& bonuses = j["bonuses"];
    bonuses["completion"] = m_state.bonuses.completion;
    bonuses["exploration"] = m_state.bonuses.exploration;
    bonuses["accuracy"] = m_state.bonuses.accuracy;
    bonuses["speed"] = m_state.bonuses.speed;
    return j;
}

void ProgressionController::restore(const json& snapshot) {
    if (!snapshot.is_object()) {
        throw core::PersistenceError("Snapshot is not a JSON object");
    }

    json migrated = snapshot;
    uint32_t version = detect_version(migrated);
    apply_migrations(migrated, version);

    ProgressionState restored = parse_snapshot(migrated);
    validate_snapshot_state(restored);

    m_state = std::move(restored);
    core::log(core::LogLevel::Info, "[Progression] Restored snapshot (v{}): room {}, score {}",
              version, m_state.current_room_id, m_state.score);
}

void ProgressionController::reset() {
    std::string player_name = m_state.player_name;
    m_state = make_initial_state();
    m_state.player_name = player_name;
    core::log(core::LogLevel::Info, "[Progression] Reset to start room: {}", m_state.current_room_id);
}

void ProgressionController::register_migration(uint32_t from_version, SnapshotMigrationFunc migration) {
    m_migrations[from_version] = std::move(migration);
}

uint32_t ProgressionController::detect_version(const json& snapshot) const {
    if (snapshot.contains("schema_version")) {
        if (!snapshot["schema_version"].is_number_unsigned()) {
            throw core::PersistenceError("Snapshot schema_version is not a version number");
        }
        uint64_t version = snapshot["schema_version"].get<uint64_t>();
        if (version == 0 || version > SNAPSHOT_SCHEMA_VERSION) {
            throw core::PersistenceError("Unsupported snapshot version: " + std::to_string(version));
        }
        return static_cast<uint32_t>(version);
    }
    // Browser saves carried no version field
    if (snapshot.contains("currentRoomId")) {
        return 1;
    }
    throw core::PersistenceError("Snapshot has no schema_version");
}

void ProgressionController::apply_migrations(json& snapshot, uint32_t version) const {
    if (version == 0 || version > SNAPSHOT_SCHEMA_VERSION) {
        throw core::PersistenceError("Unsupported snapshot version: " + std::to_string(version));
    }

    while (version < SNAPSHOT_SCHEMA_VERSION) {
        auto it = m_migrations.find(version);
        if (it == m_migrations.end()) {
            throw core::PersistenceError("No migration from snapshot version " + std::to_string(version));
        }
        if (!it->second(snapshot, version)) {
            throw core::PersistenceError("Migration from snapshot version " + std::to_string(version) + " failed");
        }
        ++version;
        snapshot["schema_version"] = version;
        core::log(core::LogLevel::Info, "[Progression] Migrated snapshot to version {}", version);
    }
}

bool ProgressionController::migrate_browser_save(json& snapshot) const {
    const json start = json::array({m_content.start_room().id});

    json out;
    out["format"] = SNAPSHOT_FORMAT;
    out["schema_version"] = 2;

    if (snapshot.contains("playerName") && !snapshot["playerName"].is_string()) return false;
    out["player_name"] = snapshot.contains("playerName") ? snapshot["playerName"].get<std::string>() : "";

    if (!snapshot["currentRoomId"].is_string()) return false;
    out["current_room_id"] = snapshot["currentRoomId"];

    if (!copy_id_array(snapshot, "unlockedRooms", out, "unlocked_room_ids", start) ||
        !copy_id_array(snapshot, "visitedRooms", out, "visited_room_ids", start) ||
        !copy_id_array(snapshot, "answeredQuestions", out, "answered_question_ids", json::array())) {
        return false;
    }
    out["unlocked_achievement_ids"] = json::array();

    int64_t score = 0;
    if (snapshot.contains("score")) {
        if (!snapshot["score"].is_number()) return false;
        score = static_cast<int64_t>(std::llround(snapshot["score"].get<double>()));
    }
    out["score"] = score;

    // Correctness was never stored, so migrated answers count as incorrect
    std::set<std::string> answered;
    for (const auto& id : out["answered_question_ids"]) {
        answered.insert(id.get<std::string>());
    }
    out["answered_question_ids"] = to_json_array(answered);
    out["questions_answered"] = answered.size();
    out["correct_answers"] = 0;

    double elapsed = 0.0;
    if (snapshot.contains("startTime") && snapshot["startTime"].is_number() &&
        snapshot.contains("saveTime") && snapshot["saveTime"].is_number()) {
        double millis = snapshot["saveTime"].get<double>() - snapshot["startTime"].get<double>();
        elapsed = millis > 0.0 ? millis / 1000.0 : 0.0;
    }
    out["elapsed_play_seconds"] = elapsed;

    if (snapshot.contains("gameCompleted") && !snapshot["gameCompleted"].is_boolean()) return false;
    out["completed"] = snapshot.contains("gameCompleted") && snapshot["gameCompleted"].get<bool>();

    out["statistics"] = {
        {"current_streak", 0}, {"best_streak", 0}, {"incorrect_streak", 0},
        {"best_comeback", 0}, {"hints_used", 0}, {"questions_skipped", 0},
        {"questions_timed_out", 0}, {"correct_answer_times", json::array()},
        {"correct_by_category", json::object()}
    };
    out["bonuses"] = {{"completion", 0}, {"exploration", 0}, {"accuracy", 0}, {"speed", 0}};

    snapshot = std::move(out);
    return true;
}

ProgressionState ProgressionController::parse_snapshot(const json& snapshot) const {
    if (read_string(snapshot, "format") != SNAPSHOT_FORMAT) {
        throw core::PersistenceError("Snapshot format is not " + std::string(SNAPSHOT_FORMAT));
    }

    ProgressionState state;
    state.schema_version = SNAPSHOT_SCHEMA_VERSION;
    state.player_name = read_string(snapshot, "player_name");
    state.current_room_id = read_string(snapshot, "current_room_id");
    state.unlocked_room_ids = read_id_set(snapshot, "unlocked_room_ids");
    state.visited_room_ids = read_id_set(snapshot, "visited_room_ids");
    state.answered_question_ids = read_id_set(snapshot, "answered_question_ids");
    state.unlocked_achievement_ids = read_id_set(snapshot, "unlocked_achievement_ids");
    state.score = read_integer(snapshot, "score");
    state.questions_answered = read_count(snapshot, "questions_answered");
    state.correct_answers = read_count(snapshot, "correct_answers");
    state.elapsed_play_seconds = read_number(snapshot, "elapsed_play_seconds");
    state.completed = read_bool(snapshot, "completed");

    const json& stats = read_object(snapshot, "statistics");
    state.current_streak = read_count(stats, "current_streak");
    state.best_streak = read_count(stats, "best_streak");
    state.incorrect_streak = read_count(stats, "incorrect_streak");
    state.best_comeback = read_count(stats, "best_comeback");
    state.hints_used = read_count(stats, "hints_used");
    state.questions_skipped = read_count(stats, "questions_skipped");
    state.questions_timed_out = read_count(stats, "questions_timed_out");

    if (!stats.contains("correct_answer_times") || !stats["correct_answer_times"].is_array()) {
        field_error("correct_answer_times", "an array");
    }
    for (const auto& time : stats["correct_answer_times"]) {
        if (!time.is_number()) field_error("correct_answer_times", "an array of numbers");
        state.correct_answer_times.push_back(time.get<float>());
    }

    // Absent in saves written before per-category tracking
    if (stats.contains("correct_by_category")) {
        const json& by_category = read_object(stats, "correct_by_category");
        for (auto it = by_category.begin(); it != by_category.end(); ++it) {
            state.correct_by_category[it.key()] = read_count(by_category, it.key().c_str());
        }
    }

    const json& bonuses = read_object(snapshot, "bonuses");
    state.bonuses.completion = read_count(bonuses, "completion");
    state.bonuses.exploration = read_count(bonuses, "exploration");
    state.bonuses.accuracy = read_count(bonuses, "accuracy");
    state.bonuses.speed = read_count(bonuses, "speed");
    return state;
}

void ProgressionController::validate_snapshot_state(const ProgressionState& state) const {
    auto fail = [](const std::string& message) {
        throw core::PersistenceError("Snapshot does not match content: " + message);
    };

    for (const auto& id : state.unlocked_room_ids) {
        if (!m_content.has_room(id)) fail("unknown room " + id);
    }
    for (const auto& id : state.visited_room_ids) {
        if (!state.unlocked_room_ids.contains(id)) fail("visited room " + id + " is not unlocked");
    }
    for (const auto& id : state.answered_question_ids) {
        if (!m_content.has_question(id)) fail("unknown question " + id);
    }
    for (const auto& id : state.unlocked_achievement_ids) {
        if (!m_content.has_achievement(id)) fail("unknown achievement " + id);
    }

    const std::string& start = m_content.start_room().id;
    if (!state.visited_room_ids.contains(start)) fail("start room " + start + " is not visited");
    if (!state.visited_room_ids.contains(state.current_room_id)) {
        fail("current room " + state.current_room_id + " is not visited");
    }

    if (static_cast<size_t>(state.questions_answered) != state.answered_question_ids.size()) {
        fail("questions_answered does not match the answered question ids");
    }
    if (state.correct_answers > state.questions_answered) {
        fail("correct_answers exceeds questions_answered");
    }

    int64_t categorized_correct = 0;
    for (const auto& entry : state.correct_by_category) {
        const std::string& category = entry.first;
        size_t answered = std::count_if(state.answered_question_ids.begin(), state.answered_question_ids.end(),
            [&](const std::string& id) {
                const auto* question = m_content.find_question(id);
                return question && question->category == category;
            });
        if (static_cast<size_t>(entry.second) > answered) {
            fail("correct answers in category " + category + " exceed its answered questions");
        }
        categorized_correct += entry.second;
    }
    if (categorized_correct > state.correct_answers) {
        fail("correct_by_category exceeds correct_answers");
    }
    if (state.elapsed_play_seconds < 0.0 || !std::isfinite(state.elapsed_play_seconds)) {
        fail("elapsed_play_seconds is negative");
    }

    // Every unlocked room must be reachable from the start through unlocked rooms
    std::set<std::string> reached{start};
    std::deque<std::string> frontier{start};
    while (!frontier.empty()) {
        std::string room = frontier.front();
        frontier.pop_front();
        for (const auto& neighbor : m_content.neighbors(room)) {
            if (state.unlocked_room_ids.contains(neighbor) && reached.insert(neighbor).second) {
                frontier.push_back(neighbor);
            }
        }
    }
    if (reached.size() != state.unlocked_room_ids.size()) {
        fail("unlocked rooms are not connected to the start room");
    }
}

} // namespace labyrinth::progression
