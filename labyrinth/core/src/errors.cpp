#include <labyrinth/core/errors.hpp>

namespace labyrinth::core {

namespace {

std::string join_violations(const std::vector<std::string>& violations) {
    std::string message = "Content validation failed with " +
                          std::to_string(violations.size()) + " violation(s)";
    for (const auto& violation : violations) {
        message += "\n  - " + violation;
    }
    return message;
}

} // anonymous namespace

DataError::DataError(std::vector<std::string> violations)
    : GameError(ErrorKind::Data, join_violations(violations))
    , m_violations(std::move(violations)) {}

const char* get_error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                 return "None";
        case ErrorKind::Data:                 return "DataError";
        case ErrorKind::State:                return "StateError";
        case ErrorKind::Persistence:          return "PersistenceError";
        case ErrorKind::NoQuestionsAvailable: return "NoQuestionsAvailable";
    }
    return "Unknown";
}

const char* get_state_error_name(StateErrorCode code) {
    switch (code) {
        case StateErrorCode::InvalidMove:             return "InvalidMove";
        case StateErrorCode::UnknownRoom:             return "UnknownRoom";
        case StateErrorCode::UnknownQuestion:         return "UnknownQuestion";
        case StateErrorCode::InvalidTimerTransition:  return "InvalidTimerTransition";
        case StateErrorCode::InvalidOption:           return "InvalidOption";
        case StateErrorCode::HintAlreadyUsed:         return "HintAlreadyUsed";
        case StateErrorCode::HintUnavailable:         return "HintUnavailable";
        case StateErrorCode::QuestionAlreadyAnswered: return "QuestionAlreadyAnswered";
    }
    return "Unknown";
}

} // namespace labyrinth::core
