#include <labyrinth/quiz/quiz_engine.hpp>
#include <labyrinth/core/errors.hpp>
#include <labyrinth/core/log.hpp>
#include <algorithm>

namespace labyrinth::quiz {

using core::StateError;
using core::StateErrorCode;

QuizEngine::QuizEngine(const content::ContentStore& content,
                       progression::ProgressionController& progression,
                       core::TimerManager& timers,
                       events::GameEventBus& bus,
                       QuizConfig config)
    : m_content(content)
    , m_progression(progression)
    , m_timers(timers)
    , m_bus(bus)
    , m_config(std::move(config))
    , m_adaptive(make_adaptive_state(m_config.difficulty))
    , m_rng(m_config.selection_seed != 0 ? m_config.selection_seed : std::random_device{}()) {}

QuizEngine::~QuizEngine() {
    stop_timer();
}

// ============================================================================
// Selection
// ============================================================================

const content::Question* QuizEngine::select_question(const content::Room& room) {
    std::vector<const content::Question*> pool;
    for (const auto& question : m_content.questions()) {
        if (question.category == room.preferred_category && !m_progression.is_answered(question.id)) {
            pool.push_back(&question);
        }
    }

    if (pool.empty()) {
        for (const auto& question : m_content.questions()) {
            if (!m_progression.is_answered(question.id)) {
                pool.push_back(&question);
            }
        }
        if (!pool.empty()) {
            core::log(core::LogLevel::Debug, "[Quiz] Category '{}' exhausted, widening to all categories",
                      room.preferred_category);
        }
    }

    if (pool.empty()) {
        return nullptr;
    }

    std::vector<content::Difficulty> tiers;
    tiers.reserve(pool.size());
    for (const auto* question : pool) {
        tiers.push_back(question->difficulty);
    }
    content::Difficulty tier = *nearest_difficulty(m_adaptive.target, tiers);

    pool.erase(std::remove_if(pool.begin(), pool.end(),
        [tier](const content::Question* q) { return q->difficulty != tier; }), pool.end());

    std::uniform_int_distribution<size_t> pick(0, pool.size() - 1);
    return pool[pick(m_rng)];
}

const content::Question& QuizEngine::request_question(const std::string& room_id) {
    if (m_session.is_active()) {
        throw StateError(StateErrorCode::InvalidTimerTransition,
                         std::string("Cannot request a question while the timer is ") +
                         get_timer_state_name(m_session.state));
    }

    const content::Room* room = m_content.find_room(room_id);
    if (!room) {
        throw StateError(StateErrorCode::UnknownRoom, "Unknown room: " + room_id);
    }
    if (!m_progression.is_unlocked(room_id)) {
        throw StateError(StateErrorCode::InvalidMove, "Cannot ask a question from locked room: " + room_id);
    }

    const content::Question* question = select_question(*room);
    if (!question) {
        throw core::NoQuestionsAvailable("Every question has been answered");
    }

    m_session = QuizSession{};
    m_session.question_id = question->id;
    m_session.room_id = room_id;
    m_session.time_limit = m_config.time_limit;
    m_session.time_remaining = m_config.time_limit;
    m_session.state = TimerState::Running;
    m_session.adaptive = m_adaptive;

    stop_timer();
    m_tick_timer = m_timers.set_interval(m_config.tick_interval, [this]() { on_tick(); });

    core::log(core::LogLevel::Debug, "[Quiz] Presenting {} ({}, {}) in {}", question->id, question->category,
              content::get_difficulty_name(question->difficulty), room_id);

    events::QuestionPresented event;
    event.question_id = question->id;
    event.room_id = room_id;
    event.prompt = question->prompt;
    event.options = question->options;
    event.category = question->category;
    event.difficulty = static_cast<int>(question->difficulty);
    event.points = question->points;
    event.time_limit = m_session.time_limit;
    event.has_hint = question->has_hint();
    m_bus.publish(event);

    return *question;
}

// ============================================================================
// Timer
// ============================================================================

void QuizEngine::on_tick() {
    if (m_session.state != TimerState::Running) {
        return;
    }

    m_session.time_remaining = std::max(0.0f, m_session.time_remaining - m_config.tick_interval);
    m_bus.publish(events::TimerTick{m_session.question_id, m_session.time_remaining, m_session.time_limit});

    if (m_session.time_remaining <= 0.0f) {
        core::log(core::LogLevel::Info, "[Quiz] Time expired for {}", m_session.question_id);
        finalize(-1, false, true);
    }
}

void QuizEngine::stop_timer() {
    if (m_tick_timer) {
        m_timers.cancel(m_tick_timer);
        m_tick_timer = {};
    }
}

float QuizEngine::time_remaining() const {
    if (!m_session.is_active() || !m_tick_timer) {
        return m_session.time_remaining;
    }
    float into_tick = m_config.tick_interval - m_timers.get_remaining(m_tick_timer);
    return std::clamp(m_session.time_remaining - into_tick, 0.0f, m_session.time_limit);
}

void QuizEngine::require_active(const char* operation) const {
    if (!m_session.is_active()) {
        throw StateError(StateErrorCode::InvalidTimerTransition,
                         std::string("Cannot ") + operation + " while the timer is " +
                         get_timer_state_name(m_session.state));
    }
}

void QuizEngine::pause() {
    if (m_session.state != TimerState::Running) {
        throw StateError(StateErrorCode::InvalidTimerTransition,
                         std::string("Cannot pause while the timer is ") + get_timer_state_name(m_session.state));
    }
    m_timers.pause(m_tick_timer);
    m_session.state = TimerState::Paused;
    core::log(core::LogLevel::Debug, "[Quiz] Paused with {}s left", time_remaining());
}

void QuizEngine::resume() {
    if (m_session.state != TimerState::Paused) {
        throw StateError(StateErrorCode::InvalidTimerTransition,
                         std::string("Cannot resume while the timer is ") + get_timer_state_name(m_session.state));
    }
    m_timers.resume(m_tick_timer);
    m_session.state = TimerState::Running;
}

void QuizEngine::abandon() {
    stop_timer();
    if (m_session.is_active()) {
        core::log(core::LogLevel::Debug, "[Quiz] Abandoned {}", m_session.question_id);
    }
    m_session = QuizSession{};
}

// ============================================================================
// Answering
// ============================================================================

events::QuestionAnswered QuizEngine::submit_answer(int option_index) {
    require_active("answer");

    const content::Question* question = current_question();
    if (option_index < 0 || option_index >= question->option_count()) {
        throw StateError(StateErrorCode::InvalidOption,
                         "Option " + std::to_string(option_index) + " is outside 0.." +
                         std::to_string(question->option_count() - 1));
    }

    return finalize(option_index, false, false);
}

events::QuestionAnswered QuizEngine::skip() {
    require_active("skip");
    return finalize(-1, true, false);
}

std::string QuizEngine::request_hint() {
    require_active("request a hint");

    if (m_session.hint_used) {
        throw StateError(StateErrorCode::HintAlreadyUsed, "Hint already used for " + m_session.question_id);
    }

    const content::Question* question = current_question();
    if (!question->has_hint()) {
        throw StateError(StateErrorCode::HintUnavailable, "No hint for " + m_session.question_id);
    }

    m_session.hint_used = true;
    m_bus.publish(events::HintUsed{question->id, question->hint});
    return question->hint;
}

events::QuestionAnswered QuizEngine::finalize(int selected_index, bool skipped, bool timed_out) {
    const content::Question* question = current_question();
    float remaining = timed_out ? 0.0f : time_remaining();
    bool correct = !skipped && !timed_out && question->is_correct(selected_index);

    events::QuestionAnswered event;
    event.question_id = question->id;
    event.room_id = m_session.room_id;
    event.selected_index = selected_index;
    event.correct_index = question->correct_index;
    event.correct = correct;
    event.skipped = skipped;
    event.timed_out = timed_out;
    event.hint_used = m_session.hint_used;
    event.time_bonus = correct
        ? compute_time_bonus(remaining, m_session.time_limit, m_config.max_time_bonus, m_session.hint_used)
        : 0;
    event.points_awarded = correct ? int64_t{question->points} + event.time_bonus
                                   : (skipped ? -int64_t{m_config.skip_penalty} : 0);
    event.time_taken = std::max(0.0f, m_session.time_limit - remaining);
    event.explanation = question->explanation;

    progression::AnswerRecord record;
    record.question_id = question->id;
    record.correct = correct;
    record.skipped = skipped;
    record.timed_out = timed_out;
    record.hint_used = m_session.hint_used;
    record.time_taken = event.time_taken;

    // Throws before anything is touched
    m_progression.record_answer(record);

    stop_timer();
    m_session.time_remaining = remaining;
    m_session.state = timed_out ? TimerState::Expired : TimerState::Answered;
    m_adaptive = apply_outcome(m_adaptive, correct, m_config.difficulty);

    core::log(core::LogLevel::Info, "[Quiz] {} {}: {} points",
              question->id, correct ? "correct" : (skipped ? "skipped" : (timed_out ? "timed out" : "incorrect")),
              event.points_awarded);

    m_bus.publish(event);

    if (event.points_awarded != 0) {
        m_progression.apply_score_delta(event.points_awarded,
            skipped ? events::ScoreReason::SkipPenalty : events::ScoreReason::Answer);
    }

    if (correct) {
        m_progression.unlock_neighbors(m_session.room_id);
    }

    if (m_on_outcome) {
        m_on_outcome(event);
    }

    return event;
}

// ============================================================================
// Queries
// ============================================================================

const content::Question* QuizEngine::current_question() const {
    if (m_session.question_id.empty()) {
        return nullptr;
    }
    return m_content.find_question(m_session.question_id);
}

std::vector<CategoryStats> QuizEngine::category_stats() const {
    const auto& correct_by_category = m_progression.state().correct_by_category;

    std::vector<CategoryStats> result;
    for (const auto& category : m_content.categories()) {
        CategoryStats stats;
        stats.category = category;
        auto correct = correct_by_category.find(category);
        if (correct != correct_by_category.end()) {
            stats.correct = correct->second;
        }
        for (const auto& question : m_content.questions()) {
            if (question.category != category) continue;
            ++stats.total;
            if (m_progression.is_answered(question.id)) {
                ++stats.answered;
            }
        }
        result.push_back(stats);
    }
    return result;
}

CategoryAnalysis QuizEngine::strengths_and_weaknesses() const {
    CategoryAnalysis analysis;
    for (const auto& stats : category_stats()) {
        if (stats.answered < CategoryAnalysis::MIN_ANSWERED) continue;
        if (stats.accuracy() >= CategoryAnalysis::STRENGTH_ACCURACY) {
            analysis.strengths.push_back(stats);
        } else if (stats.accuracy() < CategoryAnalysis::WEAKNESS_ACCURACY) {
            analysis.weaknesses.push_back(stats);
        }
    }

    std::stable_sort(analysis.strengths.begin(), analysis.strengths.end(),
        [](const CategoryStats& a, const CategoryStats& b) { return a.accuracy() > b.accuracy(); });
    std::stable_sort(analysis.weaknesses.begin(), analysis.weaknesses.end(),
        [](const CategoryStats& a, const CategoryStats& b) { return a.accuracy() < b.accuracy(); });
    return analysis;
}

} // namespace labyrinth::quiz
