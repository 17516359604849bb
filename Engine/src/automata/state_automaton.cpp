/**
 * @file state_automaton.cpp
 * @brief Arena-backed prefix-sharing automaton
 */

#include <automata/state_automaton.hpp>
#include <core/errors.hpp>
#include <utility>

namespace Lexigraph {

BLAKE3Pipeline::Hash WordRecord::fingerprint() const {
    std::vector<std::string> fields;
    fields.reserve(symbols.size() + 3);
    fields.push_back(language);
    fields.push_back(surface);
    fields.push_back(part_of_speech);
    for (const auto& s : symbols) fields.push_back(s.key());
    return BLAKE3Pipeline::hash_fields(fields);
}

Automaton::Automaton() {
    add_state(0);
}

StateId Automaton::add_state(size_t depth) {
    State s;
    s.id = states_.size();
    s.depth = depth;
    states_.push_back(std::move(s));
    return states_.back().id;
}

void Automaton::check_state(StateId id) const {
    if (id >= states_.size()) {
        throw InvalidInputError("unknown state id " + std::to_string(id));
    }
}

StateId Automaton::insert(const SymbolSequence& sequence, WordRecord record) {
    if (sequence.empty()) {
        throw InvalidInputError("cannot insert an empty sequence for '" + record.surface + "'");
    }

    record.symbols = sequence;
    const auto fp = record.fingerprint();
    auto known = by_fingerprint_.find(fp);
    if (known != by_fingerprint_.end()) {
        return record_states_[known->second];
    }

    StateId current = ROOT_STATE;
    ++states_[current].visits;

    for (const auto& symbol : sequence) {
        auto it = states_[current].transitions.find(symbol.key());
        if (it != states_[current].transitions.end()) {
            current = it->second.target;
        } else {
            // add_state may reallocate; take the depth before touching states_
            size_t depth = states_[current].depth + 1;
            StateId child = add_state(depth);
            states_[current].transitions.emplace(symbol.key(), Transition{current, symbol, child});
            ++transition_count_;
            current = child;
        }
        ++states_[current].visits;
    }

    State& terminal = states_[current];
    if (!terminal.accepting) {
        terminal.accepting = true;
        ++accepting_count_;
    }

    RecordId rid = records_.size();
    records_.push_back(std::move(record));
    record_states_.push_back(current);
    by_fingerprint_.emplace(fp, rid);
    terminal.records.push_back(rid);
    return current;
}

const std::map<std::string, Transition>& Automaton::transitions_from(StateId state) const {
    check_state(state);
    return states_[state].transitions;
}

bool Automaton::is_accepting(StateId state) const {
    check_state(state);
    return states_[state].accepting;
}

std::vector<StateId> Automaton::path_for(const SymbolSequence& sequence) const {
    if (sequence.empty()) throw InvalidInputError("cannot trace an empty sequence");

    std::vector<StateId> path;
    path.reserve(sequence.size() + 1);
    StateId current = ROOT_STATE;
    path.push_back(current);

    for (size_t i = 0; i < sequence.size(); ++i) {
        const auto& out = states_[current].transitions;
        auto it = out.find(sequence[i].key());
        if (it == out.end()) throw NoSuchPathError(i, sequence[i].key());
        current = it->second.target;
        path.push_back(current);
    }
    return path;
}

std::optional<StateId> Automaton::find(const SymbolSequence& sequence) const {
    if (sequence.empty()) return std::nullopt;
    StateId current = ROOT_STATE;
    for (const auto& symbol : sequence) {
        const auto& out = states_[current].transitions;
        auto it = out.find(symbol.key());
        if (it == out.end()) return std::nullopt;
        current = it->second.target;
    }
    return current;
}

bool Automaton::accepts(const SymbolSequence& sequence) const {
    auto s = find(sequence);
    return s && states_[*s].accepting;
}

const State& Automaton::state(StateId id) const {
    check_state(id);
    return states_[id];
}

const WordRecord& Automaton::record(RecordId id) const {
    if (id >= records_.size()) {
        throw InvalidInputError("unknown record id " + std::to_string(id));
    }
    return records_[id];
}

StateId Automaton::record_state(RecordId id) const {
    if (id >= record_states_.size()) {
        throw InvalidInputError("unknown record id " + std::to_string(id));
    }
    return record_states_[id];
}

void Automaton::clear() {
    states_.clear();
    records_.clear();
    record_states_.clear();
    by_fingerprint_.clear();
    transition_count_ = 0;
    accepting_count_ = 0;
    add_state(0);
}

void Automaton::merge_from(const Automaton& other) {
    if (&other == this) return;
    for (const auto& rec : other.records_) {
        insert(rec.symbols, rec);
    }
}

} // namespace Lexigraph
