/**
 * @file state_automaton.hpp
 * @brief Prefix-sharing state automaton over symbol sequences
 *
 * Every inserted sequence walks from the root, reusing an existing transition
 * whenever the current state already has one for the next symbol key and
 * creating a state otherwise. Shared prefixes therefore collapse onto one
 * path; suffixes are never shared, so each path keeps its own terminal state
 * and the records attached to it.
 *
 * States and records live in dense arenas. A StateId/RecordId is an index
 * into them, assigned at creation and never reused (until clear()).
 */

#pragma once

#include <export.hpp>
#include <hashing/blake3_pipeline.hpp>
#include <symbols/symbol.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Lexigraph {

using StateId = size_t;
using RecordId = size_t;

constexpr StateId ROOT_STATE = 0;

/**
 * @brief Provenance of one inserted path: the word (or pronunciation) it came from.
 */
struct WordRecord {
    std::string surface;         // word or pronunciation string
    std::string language;        // profile code
    SymbolSequence symbols;      // filled in by Automaton::insert
    uint64_t frequency = 0;
    std::string part_of_speech;  // empty when unknown

    /**
     * @brief BLAKE3 over (language, surface, part of speech, symbol keys).
     */
    BLAKE3Pipeline::Hash fingerprint() const;
};

struct Transition {
    StateId source;
    Symbol symbol;
    StateId target;
};

struct State {
    StateId id = 0;
    size_t depth = 0;                               // symbols consumed from the root
    bool accepting = false;
    uint64_t visits = 0;                            // distinct records whose path touches this state
    std::map<std::string, Transition> transitions;  // symbol key -> transition
    std::vector<RecordId> records;                  // records ending here
};

class LEXIGRAPH_API Automaton {
public:
    Automaton();

    /**
     * @brief Insert a sequence and attach its record to the final state.
     *
     * A record whose fingerprint is already stored is not stored twice; the
     * call then returns the state it already ends at and changes nothing.
     *
     * @throws InvalidInputError on an empty sequence
     * @return Terminal (accepting) state
     */
    StateId insert(const SymbolSequence& sequence, WordRecord record);

    const std::map<std::string, Transition>& transitions_from(StateId state) const;
    bool is_accepting(StateId state) const;

    /**
     * @brief Replay a sequence from the root.
     * @return Visited states, root first; size() == sequence.size() + 1
     * @throws NoSuchPathError at the first symbol without a transition
     * @throws InvalidInputError on an empty sequence
     */
    std::vector<StateId> path_for(const SymbolSequence& sequence) const;

    /**
     * @brief Final state of a sequence if its whole path exists.
     */
    std::optional<StateId> find(const SymbolSequence& sequence) const;

    /**
     * @brief True when the path exists and ends in an accepting state.
     */
    bool accepts(const SymbolSequence& sequence) const;

    const State& state(StateId id) const;
    const WordRecord& record(RecordId id) const;
    StateId record_state(RecordId id) const;

    const std::vector<State>& states() const { return states_; }
    const std::vector<WordRecord>& records() const { return records_; }

    size_t state_count() const { return states_.size(); }
    size_t transition_count() const { return transition_count_; }
    size_t accepting_count() const { return accepting_count_; }
    size_t record_count() const { return records_.size(); }

    /**
     * @brief Drop everything but a fresh root.
     */
    void clear();

    /**
     * @brief Re-insert every record of `other`, in its record order.
     *
     * Used to combine automatons built independently (one per worker).
     */
    void merge_from(const Automaton& other);

private:
    StateId add_state(size_t depth);
    void check_state(StateId id) const;

    std::vector<State> states_;
    std::vector<WordRecord> records_;
    std::vector<StateId> record_states_;
    std::unordered_map<BLAKE3Pipeline::Hash, RecordId, HashHasher> by_fingerprint_;
    size_t transition_count_ = 0;
    size_t accepting_count_ = 0;
};

} // namespace Lexigraph
