#include <query/chart_view.hpp>
#include <algorithm>
#include <queue>

namespace Lexigraph {

ChartEdge ChartView::to_edge(const Transition& t) {
    return ChartEdge{t.source, t.target, t.symbol.key(), t.symbol.display(), t.symbol.gloss()};
}

std::vector<StateId> ChartView::reachable_states() const {
    std::vector<StateId> order;
    order.reserve(automaton_.state_count());
    std::vector<bool> seen(automaton_.state_count(), false);

    std::queue<StateId> frontier;
    frontier.push(ROOT_STATE);
    seen[ROOT_STATE] = true;

    while (!frontier.empty()) {
        StateId s = frontier.front();
        frontier.pop();
        order.push_back(s);

        std::vector<StateId> children;
        for (const auto& [key, t] : automaton_.transitions_from(s)) {
            if (!seen[t.target]) children.push_back(t.target);
        }
        std::sort(children.begin(), children.end());
        for (StateId c : children) {
            seen[c] = true;
            frontier.push(c);
        }
    }
    return order;
}

std::vector<ChartEdge> ChartView::outgoing(StateId state) const {
    std::vector<ChartEdge> out;
    for (const auto& [key, t] : automaton_.transitions_from(state)) {
        out.push_back(to_edge(t));
    }
    return out;
}

std::vector<WordRecord> ChartView::records_at(StateId state) const {
    std::vector<WordRecord> out;
    for (RecordId rid : automaton_.state(state).records) {
        out.push_back(automaton_.record(rid));
    }
    return out;
}

std::vector<WordRecord> ChartView::records_through(StateId state) const {
    std::vector<RecordId> ids;
    std::vector<StateId> pending{state};
    while (!pending.empty()) {
        const State& s = automaton_.state(pending.back());
        pending.pop_back();
        ids.insert(ids.end(), s.records.begin(), s.records.end());
        for (const auto& [key, t] : s.transitions) pending.push_back(t.target);
    }
    std::sort(ids.begin(), ids.end());

    std::vector<WordRecord> out;
    out.reserve(ids.size());
    for (RecordId rid : ids) out.push_back(automaton_.record(rid));
    return out;
}

ChartPath ChartView::highlight(const SymbolSequence& sequence) const {
    ChartPath path;
    path.states = automaton_.path_for(sequence);
    path.edges.reserve(sequence.size());
    for (size_t i = 0; i < sequence.size(); ++i) {
        const auto& out = automaton_.transitions_from(path.states[i]);
        path.edges.push_back(to_edge(out.at(sequence[i].key())));
    }
    return path;
}

ChartData ChartView::snapshot() const {
    ChartData data;
    for (StateId id : reachable_states()) {
        const State& s = automaton_.state(id);
        data.states.push_back(ChartNode{s.id, s.depth, s.accepting, s.visits});
        for (const auto& [key, t] : s.transitions) {
            data.transitions.push_back(to_edge(t));
        }
        if (s.accepting) data.accepting.emplace(id, records_at(id));
    }
    return data;
}

ChartStats ChartView::stats() const {
    ChartStats st;
    st.states = automaton_.state_count();
    st.transitions = automaton_.transition_count();
    st.accepting = automaton_.accepting_count();
    st.records = automaton_.record_count();
    for (const State& s : automaton_.states()) {
        st.max_depth = std::max(st.max_depth, s.depth);
        st.max_branching = std::max(st.max_branching, s.transitions.size());
    }
    return st;
}

} // namespace Lexigraph
