/**
 * @file ipa_transcriber.hpp
 * @brief Word -> phoneme symbols (pronunciation dictionary, then G2P rules)
 *
 * Dictionary transcriptions are cleaned and split into phonemes:
 * - Stress marks (ˈ ˌ), syllable dots and whitespace are dropped
 * - Parenthesized optional segments are dropped, e.g. "wɔːtə(ɹ)" -> "wɔːtə"
 * - Splitting is maximal munch against the profile's phoneme inventory
 * - Combining diacritics, modifier letters and the length mark attach to
 *   the preceding phoneme; a tie bar joins its neighbours into one phoneme
 *
 * Out-of-dictionary words go through the ordered grapheme rules. Letters no
 * rule covers come through as opaque symbols rather than failing.
 */

#pragma once

#include <export.hpp>
#include <language/language_profile.hpp>
#include <symbols/symbol.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace Lexigraph {

struct TranscriberConfig {
    bool drop_optional_segments = true;  // false keeps "(ɹ)" as ɹ
};

class LEXIGRAPH_API IpaTranscriber {
public:
    explicit IpaTranscriber(const LanguageProfile& profile, const TranscriberConfig& config = TranscriberConfig());

    /**
     * @brief Top-ranked transcription of a word.
     * @throws InvalidInputError for malformed words or unusable dictionary IPA
     */
    SymbolSequence transcribe(const std::string& word) const;

    /**
     * @brief Every dictionary transcription in rank order; the rule-based
     *        transcription alone when the word is not in the dictionary.
     */
    std::vector<SymbolSequence> transcribe_all(const std::string& word) const;

    /**
     * @brief Split a raw IPA string into phoneme symbols.
     * @throws InvalidInputError if nothing is left after cleaning
     */
    SymbolSequence tokenize(const std::string& ipa) const;

    /**
     * @brief Rule-based transcription of an already-normalized word.
     */
    SymbolSequence apply_rules(const std::u32string& word) const;

private:
    SymbolSequence from_pronunciation(const Pronunciation& pronunciation) const;
    std::u32string clean(const std::u32string& ipa) const;

    const LanguageProfile& profile_;
    TranscriberConfig config_;
    std::unordered_map<std::u32string, size_t> first_rule_;  // pattern -> earliest rule index
};

LEXIGRAPH_API SymbolSequence transcribe_ipa(const std::string& word, const LanguageProfile& profile);
LEXIGRAPH_API std::vector<SymbolSequence> transcribe_all(const std::string& word, const LanguageProfile& profile);
LEXIGRAPH_API SymbolSequence tokenize_ipa(const std::string& ipa, const LanguageProfile& profile);

} // namespace Lexigraph
