/**
 * @file test_symbol.cpp
 * @brief Unit tests for Symbol identity and sequence helpers
 */

#include <gtest/gtest.h>
#include <core/errors.hpp>
#include <symbols/symbol.hpp>
#include <unordered_set>

using namespace Lexigraph;

TEST(SymbolTest, EqualityUsesKeyOnly) {
    Symbol a("er.agent", std::string("er"), "one who", 10);
    Symbol b("er.agent");
    Symbol c("er.comparative", std::string("er"));

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_TRUE(a < c);
}

TEST(SymbolTest, HashFollowsKey) {
    std::unordered_set<Symbol, SymbolHash> set;
    set.insert(Symbol("break", std::string("Break")));
    set.insert(Symbol("break"));
    set.insert(Symbol("able"));

    EXPECT_EQ(set.size(), 2u);
}

TEST(SymbolTest, EmptyKeyRejected) {
    EXPECT_THROW(Symbol(""), InvalidInputError);
}

TEST(SymbolTest, LabelEqualToKeyIsDropped) {
    Symbol s("cat", std::string("cat"));
    EXPECT_FALSE(s.label().has_value());
    EXPECT_EQ(s.display(), "cat");

    Symbol t("er.agent", std::string("er"));
    ASSERT_TRUE(t.label().has_value());
    EXPECT_EQ(t.display(), "er");
}

TEST(SymbolTest, SequenceHelpers) {
    auto seq = make_sequence({"un", "break", "able"});
    ASSERT_EQ(seq.size(), 3u);
    EXPECT_EQ(sequence_keys(seq), (std::vector<std::string>{"un", "break", "able"}));
    EXPECT_EQ(join_keys(seq), "un+break+able");
    EXPECT_EQ(join_keys(seq, " "), "un break able");
}

// ============================================================================
// Export macro
// ============================================================================

#define LEXIGRAPH_TEST_STR_(x) #x
#define LEXIGRAPH_TEST_STR(x) LEXIGRAPH_TEST_STR_(x)

TEST(ExportMacroTest, StaticBuildHasNoLinkageDecoration) {
    // lexigraph_engine is static; no dllimport or visibility attribute may leak in
    EXPECT_STREQ(LEXIGRAPH_TEST_STR(LEXIGRAPH_API), "");
}
