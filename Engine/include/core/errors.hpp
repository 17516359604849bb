/**
 * @file errors.hpp
 * @brief Exception hierarchy shared by the parser, automaton and loader.
 */

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace Lexigraph {

/**
 * @brief Base class for every error raised by the engine.
 */
class LexigraphError : public std::runtime_error {
public:
    explicit LexigraphError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief Empty or malformed word, symbol, sequence or identifier.
 *
 * Caller error; retrying with the same input fails the same way.
 */
class InvalidInputError : public LexigraphError {
public:
    explicit InvalidInputError(const std::string& message) : LexigraphError(message) {}
};

/**
 * @brief A symbol sequence does not exist in the automaton.
 *
 * Signals "not found"; position() is the index of the first symbol that had
 * no outgoing transition.
 */
class NoSuchPathError : public LexigraphError {
public:
    NoSuchPathError(std::size_t position, std::string symbol_key)
        : LexigraphError("no transition on '" + symbol_key + "' at position " + std::to_string(position)),
          position_(position),
          symbol_key_(std::move(symbol_key)) {}

    std::size_t position() const { return position_; }
    const std::string& symbol_key() const { return symbol_key_; }

private:
    std::size_t position_;
    std::string symbol_key_;
};

} // namespace Lexigraph
