/**
 * @file language_profile.cpp
 * @brief Dictionary and rule-table storage for one language
 */

#include <language/language_profile.hpp>
#include <core/errors.hpp>
#include <utils/unicode.hpp>
#include <algorithm>
#include <utility>

namespace Lexigraph {

const char* to_string(MorphemeKind kind) {
    switch (kind) {
        case MorphemeKind::Root:   return "root";
        case MorphemeKind::Prefix: return "prefix";
        case MorphemeKind::Suffix: return "suffix";
    }
    return "unknown";
}

std::u32string normalize_word(const std::string& word) {
    std::u32string cps = utf8_to_utf32(word);

    size_t first = 0;
    while (first < cps.size() && is_whitespace(cps[first])) ++first;
    size_t last = cps.size();
    while (last > first && is_whitespace(cps[last - 1])) --last;

    std::u32string out;
    out.reserve(last - first);
    for (size_t i = first; i < last; ++i) {
        char32_t cp = cps[i];
        if (is_whitespace(cp)) {
            throw InvalidInputError("word contains whitespace: '" + word + "'");
        }
        if (is_control(cp)) {
            throw InvalidInputError("word contains control characters: '" + word + "'");
        }
        if (is_ascii_punctuation(cp)) continue;
        out.push_back(to_lower(cp));
    }

    if (out.empty()) {
        throw InvalidInputError("word is empty after normalization: '" + word + "'");
    }
    return out;
}

LanguageProfile::LanguageProfile(std::string code, std::string name)
    : code_(std::move(code)), name_(std::move(name)) {
    if (code_.empty()) throw InvalidInputError("language code must not be empty");
}

LanguageProfile& LanguageProfile::add_morpheme(const std::string& fragment, const std::string& key, MorphemeKind kind,
                                               uint64_t frequency, const std::string& gloss) {
    if (key.empty()) throw InvalidInputError("morpheme key must not be empty");
    std::u32string norm = normalize_word(fragment);

    auto& entries = morphemes_[norm];
    auto existing = std::find_if(entries.begin(), entries.end(), [&](const MorphemeEntry& e) {
        return e.key == key && e.kind == kind;
    });
    if (existing != entries.end()) {
        existing->frequency = frequency;
        existing->gloss = gloss;
    } else {
        entries.push_back(MorphemeEntry{norm, key, kind, frequency, gloss});
        ++morpheme_count_;
    }

    // Keep the preferred entry first: frequency desc, then key asc
    std::sort(entries.begin(), entries.end(), [](const MorphemeEntry& a, const MorphemeEntry& b) {
        if (a.frequency != b.frequency) return a.frequency > b.frequency;
        return a.key < b.key;
    });

    size_t& max_len = kind == MorphemeKind::Root ? max_root_len_
                    : kind == MorphemeKind::Prefix ? max_prefix_len_
                    : max_suffix_len_;
    max_len = std::max(max_len, norm.size());
    return *this;
}

LanguageProfile& LanguageProfile::add_root(const std::string& fragment, uint64_t frequency, const std::string& gloss) {
    return add_morpheme(fragment, utf32_to_utf8(normalize_word(fragment)), MorphemeKind::Root, frequency, gloss);
}

LanguageProfile& LanguageProfile::add_prefix(const std::string& fragment, uint64_t frequency, const std::string& gloss) {
    return add_morpheme(fragment, utf32_to_utf8(normalize_word(fragment)), MorphemeKind::Prefix, frequency, gloss);
}

LanguageProfile& LanguageProfile::add_suffix(const std::string& fragment, uint64_t frequency, const std::string& gloss) {
    return add_morpheme(fragment, utf32_to_utf8(normalize_word(fragment)), MorphemeKind::Suffix, frequency, gloss);
}

LanguageProfile& LanguageProfile::add_pronunciation(const std::string& word, const std::string& ipa) {
    std::u32string norm = normalize_word(word);
    std::u32string raw = utf8_to_utf32(ipa);
    if (std::all_of(raw.begin(), raw.end(), [](char32_t cp) { return is_whitespace(cp); })) {
        throw InvalidInputError("empty pronunciation for '" + word + "'");
    }

    auto& list = pronunciations_[norm];
    bool duplicate = std::any_of(list.begin(), list.end(), [&](const Pronunciation& p) {
        return p.phonemes.empty() && p.ipa == ipa;
    });
    if (!duplicate) list.push_back(Pronunciation{ipa, {}});
    return *this;
}

LanguageProfile& LanguageProfile::add_pronunciation(const std::string& word, const std::vector<std::string>& phonemes) {
    std::u32string norm = normalize_word(word);
    if (phonemes.empty()) throw InvalidInputError("empty pronunciation for '" + word + "'");
    for (const auto& p : phonemes) register_phoneme(p);

    auto& list = pronunciations_[norm];
    bool duplicate = std::any_of(list.begin(), list.end(), [&](const Pronunciation& p) {
        return p.phonemes == phonemes;
    });
    if (!duplicate) {
        std::string joined;
        for (const auto& p : phonemes) joined += p;
        list.push_back(Pronunciation{joined, phonemes});
    }
    return *this;
}

LanguageProfile& LanguageProfile::add_grapheme_rule(const std::string& grapheme, const std::vector<std::string>& phonemes) {
    std::u32string pattern = normalize_word(grapheme);
    for (const auto& p : phonemes) register_phoneme(p);
    rules_.push_back(GraphemeRule{pattern, phonemes});
    max_grapheme_len_ = std::max(max_grapheme_len_, pattern.size());
    return *this;
}

LanguageProfile& LanguageProfile::add_phoneme(const std::string& phoneme) {
    register_phoneme(phoneme);
    return *this;
}

void LanguageProfile::register_phoneme(const std::string& phoneme) {
    std::u32string cps = utf8_to_utf32(phoneme);
    if (cps.empty()) throw InvalidInputError("phoneme must not be empty");
    max_phoneme_len_ = std::max(max_phoneme_len_, cps.size());
    phonemes_.insert(std::move(cps));
}

std::vector<const MorphemeEntry*> LanguageProfile::lookup_morphemes(const std::u32string& fragment, MorphemeKind kind) const {
    std::vector<const MorphemeEntry*> out;
    auto it = morphemes_.find(fragment);
    if (it == morphemes_.end()) return out;
    for (const auto& e : it->second) {
        if (e.kind == kind) out.push_back(&e);
    }
    return out;
}

const MorphemeEntry* LanguageProfile::best_morpheme(const std::u32string& fragment, MorphemeKind kind) const {
    auto it = morphemes_.find(fragment);
    if (it == morphemes_.end()) return nullptr;
    for (const auto& e : it->second) {
        if (e.kind == kind) return &e;
    }
    return nullptr;
}

const std::vector<Pronunciation>* LanguageProfile::pronunciations(const std::u32string& word) const {
    auto it = pronunciations_.find(word);
    return it == pronunciations_.end() ? nullptr : &it->second;
}

size_t LanguageProfile::max_fragment_length(MorphemeKind kind) const {
    switch (kind) {
        case MorphemeKind::Root:   return max_root_len_;
        case MorphemeKind::Prefix: return max_prefix_len_;
        case MorphemeKind::Suffix: return max_suffix_len_;
    }
    return 0;
}

} // namespace Lexigraph
