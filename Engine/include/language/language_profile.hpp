/**
 * @file language_profile.hpp
 * @brief Language resources consumed by the segmentation/transcription parser
 *
 * A profile bundles, for one language:
 * - Morpheme dictionary (fragment -> morpheme key, kind, frequency, gloss)
 * - Pronunciation dictionary (word -> one or more IPA transcriptions)
 * - Grapheme-to-phoneme rule table (ordered)
 * - Phoneme inventory used to split raw IPA strings
 *
 * Profiles are plain values passed to the parser. Nothing here is global, so
 * several languages coexist and tests build their own small profiles.
 */

#pragma once

#include <export.hpp>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace Lexigraph {

enum class MorphemeKind {
    Root,    // free morpheme
    Prefix,  // bound, word-initial
    Suffix   // bound, word-final
};

LEXIGRAPH_API const char* to_string(MorphemeKind kind);

struct MorphemeEntry {
    std::u32string fragment;   // normalized spelling
    std::string key;           // symbol identity
    MorphemeKind kind = MorphemeKind::Root;
    uint64_t frequency = 0;
    std::string gloss;
};

struct Pronunciation {
    std::string ipa;                    // raw transcription as given
    std::vector<std::string> phonemes;  // pre-split phonemes; empty means split `ipa` on use
};

struct GraphemeRule {
    std::u32string pattern;             // normalized grapheme
    std::vector<std::string> phonemes;  // may be empty (silent letter)
};

/**
 * @brief Normalize a surface word: trim, lowercase, drop ASCII punctuation.
 * @throws InvalidInputError on empty result, inner whitespace or control characters
 */
LEXIGRAPH_API std::u32string normalize_word(const std::string& word);

class LEXIGRAPH_API LanguageProfile {
public:
    LanguageProfile(std::string code, std::string name);

    const std::string& code() const { return code_; }
    const std::string& name() const { return name_; }

    // ------------------------------------------------------------------
    // Building
    // ------------------------------------------------------------------

    /**
     * @brief Register a morpheme spelled `fragment` with identity `key`.
     *
     * Re-adding the same (fragment, key, kind) replaces its frequency and gloss.
     */
    LanguageProfile& add_morpheme(const std::string& fragment, const std::string& key, MorphemeKind kind,
                                  uint64_t frequency = 0, const std::string& gloss = std::string());

    LanguageProfile& add_root(const std::string& fragment, uint64_t frequency = 0, const std::string& gloss = std::string());
    LanguageProfile& add_prefix(const std::string& fragment, uint64_t frequency = 0, const std::string& gloss = std::string());
    LanguageProfile& add_suffix(const std::string& fragment, uint64_t frequency = 0, const std::string& gloss = std::string());

    /**
     * @brief Add a raw IPA transcription, split against the inventory on use.
     */
    LanguageProfile& add_pronunciation(const std::string& word, const std::string& ipa);
    LanguageProfile& add_pronunciation(const std::string& word, const std::vector<std::string>& phonemes);

    /**
     * @brief Append a grapheme-to-phoneme rule. Earlier rules win ties.
     */
    LanguageProfile& add_grapheme_rule(const std::string& grapheme, const std::vector<std::string>& phonemes);

    LanguageProfile& add_phoneme(const std::string& phoneme);

    // ------------------------------------------------------------------
    // Lookup
    // ------------------------------------------------------------------

    /**
     * @brief Entries spelled `fragment` of the given kind, best first.
     *
     * Order: highest frequency, then lexicographically smallest key.
     */
    std::vector<const MorphemeEntry*> lookup_morphemes(const std::u32string& fragment, MorphemeKind kind) const;

    /**
     * @brief First entry of lookup_morphemes(), or nullptr.
     */
    const MorphemeEntry* best_morpheme(const std::u32string& fragment, MorphemeKind kind) const;

    /**
     * @brief Pronunciations of a normalized word in insertion order, or nullptr.
     */
    const std::vector<Pronunciation>* pronunciations(const std::u32string& word) const;

    const std::vector<GraphemeRule>& grapheme_rules() const { return rules_; }

    bool has_phoneme(const std::u32string& phoneme) const { return phonemes_.count(phoneme) > 0; }

    size_t max_phoneme_length() const { return max_phoneme_len_; }
    size_t max_grapheme_length() const { return max_grapheme_len_; }
    size_t max_fragment_length(MorphemeKind kind) const;

    size_t morpheme_count() const { return morpheme_count_; }
    size_t pronunciation_count() const { return pronunciations_.size(); }

private:
    void register_phoneme(const std::string& phoneme);

    std::string code_;
    std::string name_;

    std::unordered_map<std::u32string, std::vector<MorphemeEntry>> morphemes_;
    size_t morpheme_count_ = 0;
    size_t max_root_len_ = 0;
    size_t max_prefix_len_ = 0;
    size_t max_suffix_len_ = 0;

    std::unordered_map<std::u32string, std::vector<Pronunciation>> pronunciations_;

    std::vector<GraphemeRule> rules_;
    size_t max_grapheme_len_ = 0;

    std::unordered_set<std::u32string> phonemes_;
    size_t max_phoneme_len_ = 0;
};

} // namespace Lexigraph
