/**
 * @file ipa_transcriber.cpp
 * @brief IPA cleaning, phoneme splitting and grapheme-to-phoneme fallback
 */

#include <parsing/ipa_transcriber.hpp>
#include <core/errors.hpp>
#include <utils/unicode.hpp>
#include <algorithm>

namespace Lexigraph {

namespace {

// Marks that belong to the phoneme before them
bool attaches_left(char32_t cp) {
    return (is_combining_mark(cp) && !is_tie_bar(cp)) || is_ipa_modifier(cp);
}

bool is_delimiter(char32_t cp) {
    return cp == U'.' || cp == U'/' || cp == U'[' || cp == U']' || cp == U'|';
}

} // anonymous namespace

IpaTranscriber::IpaTranscriber(const LanguageProfile& profile, const TranscriberConfig& config)
    : profile_(profile), config_(config) {
    const auto& rules = profile_.grapheme_rules();
    for (size_t i = 0; i < rules.size(); ++i) {
        first_rule_.emplace(rules[i].pattern, i);  // emplace keeps the earliest
    }
}

std::u32string IpaTranscriber::clean(const std::u32string& ipa) const {
    std::u32string out;
    out.reserve(ipa.size());
    int depth = 0;
    for (char32_t cp : ipa) {
        if (cp == U'(') { ++depth; continue; }
        if (cp == U')') { if (depth > 0) --depth; continue; }
        if (depth > 0 && config_.drop_optional_segments) continue;
        if (is_stress_mark(cp) || is_whitespace(cp) || is_delimiter(cp)) continue;
        out.push_back(cp);
    }
    return out;
}

SymbolSequence IpaTranscriber::tokenize(const std::string& ipa) const {
    const std::u32string s = clean(utf8_to_utf32(ipa));

    SymbolSequence out;
    std::u32string phoneme;
    const size_t n = s.size();
    size_t i = 0;

    while (i < n) {
        // Maximal munch against the inventory, single codepoint as fallback
        size_t len = 1;
        for (size_t l = std::min(profile_.max_phoneme_length(), n - i); l >= 2; --l) {
            if (profile_.has_phoneme(s.substr(i, l))) { len = l; break; }
        }
        phoneme = s.substr(i, len);
        i += len;

        while (i < n) {
            if (is_tie_bar(s[i])) {
                phoneme.push_back(s[i++]);
                if (i < n) phoneme.push_back(s[i++]);
            } else if (attaches_left(s[i])) {
                phoneme.push_back(s[i++]);
            } else {
                break;
            }
        }
        out.emplace_back(utf32_to_utf8(phoneme));
    }

    if (out.empty()) {
        throw InvalidInputError("no phonemes in IPA string '" + ipa + "'");
    }
    return out;
}

SymbolSequence IpaTranscriber::apply_rules(const std::u32string& word) const {
    SymbolSequence out;
    const size_t n = word.size();
    size_t i = 0;
    size_t opaque_start = n;  // n means no open run

    auto flush = [&](size_t stop) {
        if (opaque_start < stop) {
            out.emplace_back(utf32_to_utf8(word.data() + opaque_start, stop - opaque_start));
        }
        opaque_start = n;
    };

    while (i < n) {
        const GraphemeRule* rule = nullptr;
        size_t len = std::min(profile_.max_grapheme_length(), n - i);
        for (; len >= 1; --len) {
            auto it = first_rule_.find(word.substr(i, len));
            if (it != first_rule_.end()) {
                rule = &profile_.grapheme_rules()[it->second];
                break;
            }
        }

        if (!rule) {
            if (opaque_start == n) opaque_start = i;
            ++i;
            continue;
        }

        flush(i);
        for (const auto& p : rule->phonemes) out.emplace_back(p);
        i += len;
    }
    flush(n);

    // Every matched rule was silent
    if (out.empty()) out.emplace_back(utf32_to_utf8(word));
    return out;
}

SymbolSequence IpaTranscriber::from_pronunciation(const Pronunciation& pronunciation) const {
    if (!pronunciation.phonemes.empty()) return make_sequence(pronunciation.phonemes);
    return tokenize(pronunciation.ipa);
}

SymbolSequence IpaTranscriber::transcribe(const std::string& word) const {
    const std::u32string w = normalize_word(word);
    const auto* prons = profile_.pronunciations(w);
    if (prons && !prons->empty()) return from_pronunciation(prons->front());
    return apply_rules(w);
}

std::vector<SymbolSequence> IpaTranscriber::transcribe_all(const std::string& word) const {
    const std::u32string w = normalize_word(word);
    std::vector<SymbolSequence> out;
    const auto* prons = profile_.pronunciations(w);
    if (prons && !prons->empty()) {
        for (const auto& p : *prons) out.push_back(from_pronunciation(p));
    } else {
        out.push_back(apply_rules(w));
    }
    return out;
}

SymbolSequence transcribe_ipa(const std::string& word, const LanguageProfile& profile) {
    return IpaTranscriber(profile).transcribe(word);
}

std::vector<SymbolSequence> transcribe_all(const std::string& word, const LanguageProfile& profile) {
    return IpaTranscriber(profile).transcribe_all(word);
}

SymbolSequence tokenize_ipa(const std::string& ipa, const LanguageProfile& profile) {
    return IpaTranscriber(profile).tokenize(ipa);
}

} // namespace Lexigraph
