#pragma once

#include <stdexcept>
#include <string>
#include <vector>
#include <cstdint>

namespace labyrinth::core {

// ============================================================================
// Error Kinds
// ============================================================================

enum class ErrorKind : uint8_t {
    None,
    Data,                   // Malformed/inconsistent content, fatal at load
    State,                  // Illegal transition, rejected with no state change
    Persistence,            // Corrupt or incompatible snapshot
    NoQuestionsAvailable    // Question bank exhausted
};

enum class StateErrorCode : uint8_t {
    InvalidMove,            // Target room is not unlocked
    UnknownRoom,
    UnknownQuestion,
    InvalidTimerTransition, // Quiz command from the wrong timer state
    InvalidOption,          // Answer index outside the option list
    HintAlreadyUsed,
    HintUnavailable,
    QuestionAlreadyAnswered
};

const char* get_error_kind_name(ErrorKind kind);
const char* get_state_error_name(StateErrorCode code);

// ============================================================================
// GameError - Base of every error the engine reports
// ============================================================================

class GameError : public std::runtime_error {
public:
    GameError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    ErrorKind kind() const { return m_kind; }

private:
    ErrorKind m_kind;
};

// Content failed validation; carries every violation found
class DataError : public GameError {
public:
    explicit DataError(std::vector<std::string> violations);

    const std::vector<std::string>& violations() const { return m_violations; }

private:
    std::vector<std::string> m_violations;
};

class StateError : public GameError {
public:
    StateError(StateErrorCode code, const std::string& message)
        : GameError(ErrorKind::State, message), m_code(code) {}

    StateErrorCode code() const { return m_code; }

private:
    StateErrorCode m_code;
};

class PersistenceError : public GameError {
public:
    explicit PersistenceError(const std::string& message)
        : GameError(ErrorKind::Persistence, message) {}
};

class NoQuestionsAvailable : public GameError {
public:
    explicit NoQuestionsAvailable(const std::string& message)
        : GameError(ErrorKind::NoQuestionsAvailable, message) {}
};

} // namespace labyrinth::core
