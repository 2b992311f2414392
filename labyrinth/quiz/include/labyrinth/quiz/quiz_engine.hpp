#pragma once

#include <labyrinth/quiz/quiz_session.hpp>
#include <labyrinth/quiz/adaptive_difficulty.hpp>
#include <labyrinth/content/content_store.hpp>
#include <labyrinth/progression/progression_controller.hpp>
#include <labyrinth/core/timer.hpp>
#include <labyrinth/events/game_events.hpp>
#include <cstdint>
#include <functional>
#include <random>
#include <string>
#include <vector>

namespace labyrinth::quiz {

struct QuizConfig {
    float time_limit = 30.0f;       // Seconds per question
    float tick_interval = 1.0f;     // TimerTick cadence
    int max_time_bonus = 50;
    int skip_penalty = 10;          // Subtracted from the score
    DifficultyConfig difficulty;
    uint32_t selection_seed = 0;    // 0 = seed from std::random_device
};

struct CategoryStats {
    std::string category;
    int total = 0;
    int answered = 0;
    int correct = 0;

    // 0 when nothing in the category was answered
    double accuracy() const { return answered > 0 ? static_cast<double>(correct) / answered : 0.0; }
};

// Categories with at least MIN_ANSWERED answers, split by accuracy.
// Strengths are sorted best first, weaknesses worst first.
struct CategoryAnalysis {
    static constexpr int MIN_ANSWERED = 2;
    static constexpr double STRENGTH_ACCURACY = 0.8;
    static constexpr double WEAKNESS_ACCURACY = 0.6;

    std::vector<CategoryStats> strengths;
    std::vector<CategoryStats> weaknesses;
};

// ============================================================================
// QuizEngine - Question selection and the countdown state machine
// ============================================================================
//
// One session at a time. Every way a session ends (answer, skip, expiry)
// goes through the same outcome path:
//   record_answer -> QuestionAnswered -> ScoreChanged -> RoomUnlocked...
//   -> outcome callback (victory and achievement checks by the owner)
// A rejected command throws core::StateError and changes nothing.

class QuizEngine {
public:
    using OutcomeCallback = std::function<void(const events::QuestionAnswered&)>;

    QuizEngine(const content::ContentStore& content,
               progression::ProgressionController& progression,
               core::TimerManager& timers,
               events::GameEventBus& bus,
               QuizConfig config = {});
    ~QuizEngine();

    QuizEngine(const QuizEngine&) = delete;
    QuizEngine& operator=(const QuizEngine&) = delete;

    // ========================================================================
    // Commands
    // ========================================================================

    // Idle/Answered/Expired -> Running. Throws NoQuestionsAvailable when the
    // bank is exhausted.
    const content::Question& request_question(const std::string& room_id);

    events::QuestionAnswered submit_answer(int option_index);
    events::QuestionAnswered skip();

    // Returns the hint text and forfeits the time bonus
    std::string request_hint();

    void pause();
    void resume();

    // Drops the session without scoring it (reset, load)
    void abandon();

    // ========================================================================
    // Queries
    // ========================================================================

    const QuizSession& session() const { return m_session; }
    TimerState timer_state() const { return m_session.state; }
    bool has_active_session() const { return m_session.is_active(); }

    // Remaining seconds including the part of the current tick already elapsed
    float time_remaining() const;

    // Question of the active (or last finished) session, nullptr when Idle
    const content::Question* current_question() const;

    const AdaptiveState& adaptive_state() const { return m_adaptive; }
    void set_adaptive_state(const AdaptiveState& state) { m_adaptive = state; }

    // Answered/correct/total per category, in first-seen category order
    std::vector<CategoryStats> category_stats() const;
    CategoryAnalysis strengths_and_weaknesses() const;

    const QuizConfig& config() const { return m_config; }

    void set_outcome_callback(OutcomeCallback callback) { m_on_outcome = std::move(callback); }

private:
    const content::Question* select_question(const content::Room& room);
    void require_active(const char* operation) const;
    void on_tick();
    void stop_timer();
    events::QuestionAnswered finalize(int selected_index, bool skipped, bool timed_out);

    const content::ContentStore& m_content;
    progression::ProgressionController& m_progression;
    core::TimerManager& m_timers;
    events::GameEventBus& m_bus;
    QuizConfig m_config;

    QuizSession m_session;
    AdaptiveState m_adaptive;
    core::TimerHandle m_tick_timer;
    OutcomeCallback m_on_outcome;
    std::mt19937 m_rng;
};

} // namespace labyrinth::quiz
