/**
 * @file test_chart_view.cpp
 * @brief Unit tests for read-only chart traversal and export
 */

#include <gtest/gtest.h>
#include <automata/state_automaton.hpp>
#include <core/errors.hpp>
#include <query/chart_view.hpp>
#include <string>
#include <vector>

using namespace Lexigraph;

namespace {

WordRecord record_for(const std::string& surface, const std::string& pos = std::string()) {
    WordRecord r;
    r.surface = surface;
    r.language = "en";
    r.part_of_speech = pos;
    return r;
}

// root -un-> 1 -do-> 2 -able-> 3
//                      -ing->  4
// root -cat-> 5
// root -break-> 6
Automaton sample() {
    Automaton a;
    a.insert(make_sequence({"un", "do", "able"}), record_for("undoable"));
    a.insert(make_sequence({"un", "do", "ing"}), record_for("undoing"));
    a.insert(make_sequence({"cat"}), record_for("cat", "noun"));
    a.insert(SymbolSequence{Symbol("break", std::string("Break"), "shatter", 3)}, record_for("break"));
    return a;
}

} // anonymous namespace

TEST(ChartViewTest, BreadthFirstByAscendingId) {
    Automaton a = sample();
    ChartView view(a);

    EXPECT_EQ(view.reachable_states(), (std::vector<StateId>{0, 1, 5, 6, 2, 3, 4}));
}

TEST(ChartViewTest, OutgoingSortedByKey) {
    Automaton a = sample();
    ChartView view(a);

    auto root = view.outgoing(ROOT_STATE);
    ASSERT_EQ(root.size(), 3u);
    EXPECT_EQ(root[0].key, "break");
    EXPECT_EQ(root[1].key, "cat");
    EXPECT_EQ(root[2].key, "un");

    EXPECT_EQ(root[0].label, "Break");
    EXPECT_EQ(root[0].gloss, "shatter");
    EXPECT_EQ(root[1].label, "cat");
    EXPECT_EQ(root[2].target, 1u);

    EXPECT_TRUE(view.outgoing(3).empty());
    EXPECT_THROW(view.outgoing(99), InvalidInputError);
}

TEST(ChartViewTest, RecordsAtAcceptingStates) {
    Automaton a = sample();
    ChartView view(a);

    auto at_cat = view.records_at(5);
    ASSERT_EQ(at_cat.size(), 1u);
    EXPECT_EQ(at_cat[0].surface, "cat");
    EXPECT_EQ(at_cat[0].part_of_speech, "noun");

    EXPECT_TRUE(view.records_at(1).empty());
}

TEST(ChartViewTest, RecordsThroughSharedStates) {
    Automaton a = sample();
    ChartView view(a);

    // "do" is not accepting but both un-do words pass through it
    auto through_do = view.records_through(2);
    ASSERT_EQ(through_do.size(), 2u);
    EXPECT_EQ(through_do[0].surface, "undoable");
    EXPECT_EQ(through_do[1].surface, "undoing");
    EXPECT_TRUE(view.records_at(2).empty());

    auto through_ing = view.records_through(4);
    ASSERT_EQ(through_ing.size(), 1u);
    EXPECT_EQ(through_ing[0].surface, "undoing");

    EXPECT_EQ(view.records_through(ROOT_STATE).size(), a.record_count());
    for (const State& s : a.states()) {
        EXPECT_EQ(view.records_through(s.id).size(), s.visits) << "state " << s.id;
    }

    EXPECT_THROW(view.records_through(99), InvalidInputError);
}

TEST(ChartViewTest, HighlightFollowsPath) {
    Automaton a = sample();
    ChartView view(a);

    ChartPath path = view.highlight(make_sequence({"un", "do", "ing"}));
    EXPECT_EQ(path.states, (std::vector<StateId>{0, 1, 2, 4}));
    ASSERT_EQ(path.edges.size(), 3u);
    EXPECT_EQ(path.edges[0].key, "un");
    EXPECT_EQ(path.edges[2].source, 2u);
    EXPECT_EQ(path.edges[2].target, 4u);

    EXPECT_THROW(view.highlight(make_sequence({"un", "tie"})), NoSuchPathError);
}

TEST(ChartViewTest, SnapshotIsComplete) {
    Automaton a = sample();
    ChartView view(a);
    ChartData data = view.snapshot();

    ASSERT_EQ(data.states.size(), a.state_count());
    EXPECT_EQ(data.states[0].id, ROOT_STATE);
    EXPECT_EQ(data.transitions.size(), a.transition_count());
    EXPECT_EQ(data.accepting.size(), 4u);
    ASSERT_EQ(data.accepting.count(3), 1u);
    EXPECT_EQ(data.accepting.at(3)[0].surface, "undoable");

    // Edges are grouped by source in breadth-first state order
    EXPECT_EQ(data.transitions[0].source, ROOT_STATE);
    EXPECT_EQ(data.transitions[3].source, 1u);
    EXPECT_EQ(data.transitions[3].key, "do");
}

TEST(ChartViewTest, SnapshotIsReproducible) {
    Automaton a = sample();
    Automaton b = sample();
    ChartData da = ChartView(a).snapshot();
    ChartData db = ChartView(b).snapshot();

    ASSERT_EQ(da.transitions.size(), db.transitions.size());
    for (size_t i = 0; i < da.transitions.size(); ++i) {
        EXPECT_EQ(da.transitions[i].source, db.transitions[i].source);
        EXPECT_EQ(da.transitions[i].target, db.transitions[i].target);
        EXPECT_EQ(da.transitions[i].key, db.transitions[i].key);
    }
}

TEST(ChartViewTest, Stats) {
    Automaton a = sample();
    ChartStats st = ChartView(a).stats();

    EXPECT_EQ(st.states, 7u);
    EXPECT_EQ(st.transitions, 6u);
    EXPECT_EQ(st.accepting, 4u);
    EXPECT_EQ(st.records, 4u);
    EXPECT_EQ(st.max_depth, 3u);
    EXPECT_EQ(st.max_branching, 3u);
}

TEST(ChartViewTest, EmptyAutomaton) {
    Automaton a;
    ChartView view(a);

    EXPECT_EQ(view.reachable_states(), (std::vector<StateId>{0}));
    ChartData data = view.snapshot();
    EXPECT_EQ(data.states.size(), 1u);
    EXPECT_TRUE(data.transitions.empty());
    EXPECT_TRUE(data.accepting.empty());
}
