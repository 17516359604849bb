/**
 * @file symbol.hpp
 * @brief Transition label: a morpheme or a phoneme
 *
 * A Symbol is identified by its key alone. The display label, gloss and
 * frequency travel with it for charting but never take part in equality,
 * ordering or hashing.
 */

#pragma once

#include <export.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace Lexigraph {

class LEXIGRAPH_API Symbol {
public:
    /**
     * @throws InvalidInputError if key is empty
     */
    explicit Symbol(std::string key,
                    std::optional<std::string> label = std::nullopt,
                    std::string gloss = std::string(),
                    uint64_t frequency = 0);

    const std::string& key() const { return key_; }
    const std::optional<std::string>& label() const { return label_; }
    const std::string& gloss() const { return gloss_; }
    uint64_t frequency() const { return frequency_; }

    /**
     * @brief Text to print on a chart edge: the label when present, else the key.
     */
    const std::string& display() const { return label_ ? *label_ : key_; }

    bool operator==(const Symbol& other) const { return key_ == other.key_; }
    bool operator!=(const Symbol& other) const { return key_ != other.key_; }
    bool operator<(const Symbol& other) const { return key_ < other.key_; }

private:
    std::string key_;
    std::optional<std::string> label_;
    std::string gloss_;
    uint64_t frequency_;
};

struct SymbolHash {
    size_t operator()(const Symbol& s) const { return std::hash<std::string>{}(s.key()); }
};

using SymbolSequence = std::vector<Symbol>;

/**
 * @brief Build a sequence of bare symbols from keys.
 */
LEXIGRAPH_API SymbolSequence make_sequence(const std::vector<std::string>& keys);

LEXIGRAPH_API std::vector<std::string> sequence_keys(const SymbolSequence& sequence);

/**
 * @brief Keys joined with a separator, e.g. "un+break+able".
 */
LEXIGRAPH_API std::string join_keys(const SymbolSequence& sequence, const std::string& separator = "+");

} // namespace Lexigraph
