/**
 * PokeBattle Engine - Error Types
 *
 * Every engine failure is an EngineError carrying an ErrorKind.
 * Evaluation converts InvalidAction/MissingEntity into marked error
 * results; Advance lets everything propagate.
 */

#pragma once

#include "types.hpp"
#include <stdexcept>
#include <string>

namespace pokebattle {

class EngineError : public std::runtime_error {
public:
    EngineError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind)
    {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// Action references a nonexistent move/bench slot, or is not legal now
class InvalidAction : public EngineError {
public:
    explicit InvalidAction(const std::string& message)
        : EngineError(ErrorKind::INVALID_ACTION, message) {}
};

// No active Pokemon on a side (or an id that resolves to nothing)
class MissingEntity : public EngineError {
public:
    explicit MissingEntity(const std::string& message)
        : EngineError(ErrorKind::MISSING_ENTITY, message) {}
};

class UnsupportedFormat : public EngineError {
public:
    explicit UnsupportedFormat(const std::string& format_id)
        : EngineError(ErrorKind::UNSUPPORTED_FORMAT, "format not supported: " + format_id) {}
};

// Always an engine bug: HP out of range, boost out of range, etc.
class StateInvariantViolation : public EngineError {
public:
    explicit StateInvariantViolation(const std::string& message)
        : EngineError(ErrorKind::STATE_INVARIANT_VIOLATION, message) {}
};

} // namespace pokebattle
