/**
 * @file morpheme_segmenter.cpp
 * @brief Morpheme segmentation over a LanguageProfile
 */

#include <parsing/morpheme_segmenter.hpp>
#include <utils/unicode.hpp>
#include <algorithm>
#include <utility>

namespace Lexigraph {

namespace {

Symbol entry_symbol(const MorphemeEntry& entry) {
    return Symbol(entry.key, utf32_to_utf8(entry.fragment), entry.gloss, entry.frequency);
}

Symbol opaque_symbol(const std::u32string& word, size_t begin, size_t end) {
    return Symbol(utf32_to_utf8(word.data() + begin, end - begin));
}

} // anonymous namespace

MorphemeSegmenter::MorphemeSegmenter(const LanguageProfile& profile, const SegmenterConfig& config)
    : profile_(profile), config_(config) {}

bool MorphemeSegmenter::is_root(const std::u32string& word, size_t begin, size_t end) const {
    return profile_.best_morpheme(word.substr(begin, end - begin), MorphemeKind::Root) != nullptr;
}

bool MorphemeSegmenter::is_covered(const std::u32string& word, size_t begin, size_t end) const {
    if (is_root(word, begin, end)) return true;
    std::vector<bool> dead(end + 1, false);
    std::vector<const MorphemeEntry*> pieces;
    return cover_with_roots(word, begin, end, dead, pieces);
}

std::optional<MorphemeSegmenter::Peel> MorphemeSegmenter::best_peel(
    const std::u32string& word, size_t begin, size_t end, MorphemeKind kind) const {

    const size_t span = end - begin;
    const size_t max_len = std::min(profile_.max_fragment_length(kind), span - 1);

    std::optional<Peel> longest;
    for (size_t len = max_len; len >= 1; --len) {
        std::u32string fragment = kind == MorphemeKind::Prefix
            ? word.substr(begin, len)
            : word.substr(end - len, len);
        const MorphemeEntry* entry = profile_.best_morpheme(fragment, kind);
        if (!entry) continue;

        size_t rest_begin = kind == MorphemeKind::Prefix ? begin + len : begin;
        size_t rest_end = kind == MorphemeKind::Prefix ? end : end - len;
        bool leaves_root = is_covered(word, rest_begin, rest_end);
        if (!leaves_root && span - len < config_.min_stem_length) continue;

        Peel peel{entry, len, leaves_root};
        if (leaves_root) return peel;  // longest peel that exposes a root or a compound of roots
        if (!longest) longest = peel;
    }
    return longest;
}

bool MorphemeSegmenter::cover_with_roots(const std::u32string& word, size_t pos, size_t end,
                                         std::vector<bool>& dead,
                                         std::vector<const MorphemeEntry*>& pieces) const {
    if (pos == end) return true;
    if (dead[pos]) return false;

    const size_t max_len = std::min(profile_.max_fragment_length(MorphemeKind::Root), end - pos);
    for (size_t len = max_len; len >= std::max<size_t>(config_.min_root_length, 1); --len) {
        const MorphemeEntry* entry = profile_.best_morpheme(word.substr(pos, len), MorphemeKind::Root);
        if (!entry) continue;
        pieces.push_back(entry);
        if (cover_with_roots(word, pos + len, end, dead, pieces)) return true;
        pieces.pop_back();
    }

    dead[pos] = true;
    return false;
}

void MorphemeSegmenter::segment_core(const std::u32string& word, size_t begin, size_t end,
                                     SymbolSequence& out) const {
    if (const MorphemeEntry* root = profile_.best_morpheme(word.substr(begin, end - begin), MorphemeKind::Root)) {
        out.push_back(entry_symbol(*root));
        return;
    }

    // Compound: the whole core must be covered by known roots
    std::vector<bool> dead(end + 1, false);
    std::vector<const MorphemeEntry*> pieces;
    if (cover_with_roots(word, begin, end, dead, pieces)) {
        for (const MorphemeEntry* piece : pieces) out.push_back(entry_symbol(*piece));
        return;
    }

    out.push_back(opaque_symbol(word, begin, end));
}

SymbolSequence MorphemeSegmenter::segment(const std::string& word) const {
    const std::u32string w = normalize_word(word);

    if (const MorphemeEntry* root = profile_.best_morpheme(w, MorphemeKind::Root)) {
        return {entry_symbol(*root)};
    }

    SymbolSequence prefixes;
    SymbolSequence suffixes;  // collected outside-in
    size_t begin = 0;
    size_t end = w.size();

    while (end - begin > 1 && !is_covered(w, begin, end)) {
        auto prefix = best_peel(w, begin, end, MorphemeKind::Prefix);
        auto suffix = best_peel(w, begin, end, MorphemeKind::Suffix);

        bool take_prefix;
        if (prefix && prefix->leaves_root) take_prefix = true;
        else if (suffix && suffix->leaves_root) take_prefix = false;
        else if (prefix) take_prefix = true;
        else if (suffix) take_prefix = false;
        else break;

        if (take_prefix) {
            prefixes.push_back(entry_symbol(*prefix->entry));
            begin += prefix->length;
        } else {
            suffixes.push_back(entry_symbol(*suffix->entry));
            end -= suffix->length;
        }
    }

    SymbolSequence out = std::move(prefixes);
    segment_core(w, begin, end, out);
    out.insert(out.end(), suffixes.rbegin(), suffixes.rend());
    return out;
}

SymbolSequence segment_morphemes(const std::string& word, const LanguageProfile& profile,
                                 const SegmenterConfig& config) {
    return MorphemeSegmenter(profile, config).segment(word);
}

} // namespace Lexigraph
