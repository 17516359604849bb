/**
 * @file test_ipa_transcriber.cpp
 * @brief Unit tests for IPA tokenization and grapheme-to-phoneme fallback
 */

#include <gtest/gtest.h>
#include <core/errors.hpp>
#include <language/builtin_profiles.hpp>
#include <parsing/ipa_transcriber.hpp>
#include <string>
#include <vector>

using namespace Lexigraph;

using Keys = std::vector<std::string>;

// ============================================================================
// Dictionary and rules, English
// ============================================================================

class EnglishTranscriberTest : public ::testing::Test {
protected:
    LanguageProfile en = english_profile();

    Keys transcribe(const std::string& word) const {
        return sequence_keys(transcribe_ipa(word, en));
    }
};

TEST_F(EnglishTranscriberTest, CatByRules) {
    EXPECT_EQ(transcribe("cat"), (Keys{"k", "æ", "t"}));
}

TEST_F(EnglishTranscriberTest, DictionaryHitWins) {
    EXPECT_EQ(transcribe("the"), (Keys{"ð", "ə"}));
    EXPECT_EQ(transcribe("church"), (Keys{"t͡ʃ", "ɜː", "t͡ʃ"}));
}

TEST_F(EnglishTranscriberTest, StressDotsAndOptionalSegmentsDropped) {
    // "ˈwɔː.tə(ɹ)"
    EXPECT_EQ(transcribe("Water"), (Keys{"w", "ɔː", "t", "ə"}));
}

TEST_F(EnglishTranscriberTest, MultiLetterGraphemesMunchedFirst) {
    EXPECT_EQ(transcribe("ship"), (Keys{"ʃ", "ɪ", "p"}));
    EXPECT_EQ(transcribe("match"), (Keys{"m", "æ", "t͡ʃ"}));
    EXPECT_EQ(transcribe("queen"), (Keys{"k", "w", "iː", "n"}));
    EXPECT_EQ(transcribe("box"), (Keys{"b", "ɒ", "k", "s"}));
}

TEST_F(EnglishTranscriberTest, TopPronunciationAndAll) {
    EXPECT_EQ(transcribe("read"), (Keys{"ɹ", "iː", "d"}));

    auto all = transcribe_all("read", en);
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(sequence_keys(all[0]), (Keys{"ɹ", "iː", "d"}));
    EXPECT_EQ(sequence_keys(all[1]), (Keys{"ɹ", "ɛ", "d"}));

    auto fallback = transcribe_all("cat", en);
    ASSERT_EQ(fallback.size(), 1u);
    EXPECT_EQ(sequence_keys(fallback[0]), (Keys{"k", "æ", "t"}));
}

TEST_F(EnglishTranscriberTest, EmptyWordFails) {
    EXPECT_THROW(transcribe_ipa("", en), InvalidInputError);
    EXPECT_THROW(transcribe_all("  ", en), InvalidInputError);
}

// ============================================================================
// Rule table behavior
// ============================================================================

TEST(IpaTranscriberTest, EarlierRuleWinsEqualLength) {
    LanguageProfile p("xx", "Test");
    p.add_grapheme_rule("c", {"k"});
    p.add_grapheme_rule("c", {"s"});

    EXPECT_EQ(sequence_keys(transcribe_ipa("cc", p)), (Keys{"k", "k"}));
}

TEST(IpaTranscriberTest, UncoveredRunsBecomeOpaque) {
    LanguageProfile p("xx", "Test");
    p.add_grapheme_rule("a", {"a"});

    EXPECT_EQ(sequence_keys(transcribe_ipa("xyaz", p)), (Keys{"xy", "a", "z"}));
    EXPECT_EQ(sequence_keys(transcribe_ipa("xyz", p)), (Keys{"xyz"}));
}

TEST(IpaTranscriberTest, SilentRules) {
    LanguageProfile p("xx", "Test");
    p.add_grapheme_rule("b", {"b"});
    p.add_grapheme_rule("e", {});

    EXPECT_EQ(sequence_keys(transcribe_ipa("be", p)), (Keys{"b"}));
    // Nothing audible left: fall back to the word itself
    EXPECT_EQ(sequence_keys(transcribe_ipa("e", p)), (Keys{"e"}));
}

// ============================================================================
// Tokenization of raw IPA
// ============================================================================

TEST(IpaTokenizeTest, DelimitersAndStressRemoved) {
    LanguageProfile p("xx", "Test");
    EXPECT_EQ(sequence_keys(tokenize_ipa("/ˈkæt/", p)), (Keys{"k", "æ", "t"}));
    EXPECT_EQ(sequence_keys(tokenize_ipa("[ˌæ.ˈbæk]", p)), (Keys{"æ", "b", "æ", "k"}));
}

TEST(IpaTokenizeTest, DiacriticsAttachToPrevious) {
    LanguageProfile p("xx", "Test");
    EXPECT_EQ(sequence_keys(tokenize_ipa("kʰæt", p)), (Keys{"kʰ", "æ", "t"}));
    EXPECT_EQ(sequence_keys(tokenize_ipa("bʌtn̩", p)), (Keys{"b", "ʌ", "t", "n̩"}));
    EXPECT_EQ(sequence_keys(tokenize_ipa("fɑːð", p)), (Keys{"f", "ɑː", "ð"}));
}

TEST(IpaTokenizeTest, TieBarJoinsNeighbours) {
    LanguageProfile p("xx", "Test");
    EXPECT_EQ(sequence_keys(tokenize_ipa("t͡ʃɪp", p)), (Keys{"t͡ʃ", "ɪ", "p"}));
}

TEST(IpaTokenizeTest, InventoryDrivesMaximalMunch) {
    LanguageProfile bare("xx", "Test");
    EXPECT_EQ(sequence_keys(tokenize_ipa("paɪ", bare)), (Keys{"p", "a", "ɪ"}));

    LanguageProfile p("xx", "Test");
    p.add_phoneme("aɪ");
    EXPECT_EQ(sequence_keys(tokenize_ipa("paɪ", p)), (Keys{"p", "aɪ"}));
}

TEST(IpaTokenizeTest, OptionalSegmentsCanBeKept) {
    LanguageProfile p("xx", "Test");
    TranscriberConfig keep;
    keep.drop_optional_segments = false;
    IpaTranscriber t(p, keep);

    EXPECT_EQ(sequence_keys(t.tokenize("tə(ɹ)")), (Keys{"t", "ə", "ɹ"}));
    EXPECT_EQ(sequence_keys(tokenize_ipa("tə(ɹ)", p)), (Keys{"t", "ə"}));
}

TEST(IpaTokenizeTest, NothingLeftFails) {
    LanguageProfile p("xx", "Test");
    EXPECT_THROW(tokenize_ipa("", p), InvalidInputError);
    EXPECT_THROW(tokenize_ipa("ˈ. (ə)", p), InvalidInputError);
}

TEST(IpaTokenizeTest, BadDictionaryEntrySurfacesOnTranscribe) {
    LanguageProfile p("xx", "Test");
    p.add_pronunciation("hm", "(hm)");

    EXPECT_THROW(transcribe_ipa("hm", p), InvalidInputError);
}
