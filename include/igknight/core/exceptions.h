// include/igknight/core/exceptions.h
#ifndef IGKNIGHT_CORE_EXCEPTIONS_H
#define IGKNIGHT_CORE_EXCEPTIONS_H

#include <string>
#include <stdexcept>

namespace igknight {
namespace core {

/**
 * @brief Base class for every error raised by the rules engine
 */
class EngineException : public std::runtime_error {
public:
    explicit EngineException(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Malformed input: FEN string, square label, move label or SAN token
 *
 * Raised while decoding external text, never while executing a move.
 */
class FormatError : public EngineException {
public:
    explicit FormatError(const std::string& message)
        : EngineException(message) {}
};

/**
 * @brief A well-formed move that is not in the legal-move set
 *
 * Expected and non-fatal; callers answer "rejected" rather than "malformed".
 */
class IllegalMoveError : public EngineException {
public:
    IllegalMoveError(const std::string& message, const std::string& move)
        : EngineException(message), move_(move) {}
    const std::string& getMove() const { return move_; }
private:
    std::string move_;
};

/**
 * @brief The board lacks a king where one is required
 *
 * Indicates upstream corruption and must not be retried.
 */
class CorruptStateError : public EngineException {
public:
    explicit CorruptStateError(const std::string& message)
        : EngineException(message) {}
};

} // namespace core
} // namespace igknight

#endif // IGKNIGHT_CORE_EXCEPTIONS_H
