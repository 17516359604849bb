/**
 * @file chart_view.hpp
 * @brief Read-only traversal and export of an automaton for chart renderers
 *
 * Every listing is deterministic: states in breadth-first order with children
 * by ascending id, edges by symbol key. Two views over equal automatons
 * produce identical output.
 */

#pragma once

#include <export.hpp>
#include <automata/state_automaton.hpp>
#include <map>
#include <string>
#include <vector>

namespace Lexigraph {

struct ChartNode {
    StateId id;
    size_t depth;
    bool accepting;
    uint64_t visits;
};

struct ChartEdge {
    StateId source;
    StateId target;
    std::string key;
    std::string label;   // display text (label or key)
    std::string gloss;
};

/**
 * @brief Flat snapshot of a chart
 */
struct ChartData {
    std::vector<ChartNode> states;                          // breadth-first
    std::vector<ChartEdge> transitions;                     // grouped by source, in state order
    std::map<StateId, std::vector<WordRecord>> accepting;   // accepting state -> its records
};

/**
 * @brief The states and edges one sequence follows
 */
struct ChartPath {
    std::vector<StateId> states;  // root first
    std::vector<ChartEdge> edges; // edges[i] leads from states[i] to states[i + 1]
};

struct ChartStats {
    size_t states = 0;
    size_t transitions = 0;
    size_t accepting = 0;
    size_t records = 0;
    size_t max_depth = 0;
    size_t max_branching = 0;
};

class LEXIGRAPH_API ChartView {
public:
    explicit ChartView(const Automaton& automaton) : automaton_(automaton) {}

    std::vector<StateId> reachable_states() const;

    /**
     * @brief Edges leaving a state, sorted by symbol key.
     * @throws InvalidInputError for an unknown state
     */
    std::vector<ChartEdge> outgoing(StateId state) const;

    /**
     * @brief Records ending at a state (empty for non-accepting states).
     */
    std::vector<WordRecord> records_at(StateId state) const;

    /**
     * @brief Records whose path ends at or passes through a state, by record id.
     *
     * The chart is a tree, so these are the records ending anywhere in the
     * subtree below the state. The count equals the state's `visits`.
     * @throws InvalidInputError for an unknown state
     */
    std::vector<WordRecord> records_through(StateId state) const;

    /**
     * @brief Path of a sequence for emphasis in a rendered chart.
     * @throws NoSuchPathError when the sequence is not in the automaton
     */
    ChartPath highlight(const SymbolSequence& sequence) const;

    ChartData snapshot() const;
    ChartStats stats() const;

private:
    static ChartEdge to_edge(const Transition& t);

    const Automaton& automaton_;
};

} // namespace Lexigraph
