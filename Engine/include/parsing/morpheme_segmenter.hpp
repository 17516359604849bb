/**
 * @file morpheme_segmenter.hpp
 * @brief Dictionary-first morpheme segmentation with affix-peeling fallback
 *
 * Pipeline for one word:
 *   1. Exact root hit in the morpheme dictionary -> one symbol
 *   2. Peel prefixes/suffixes from both ends until nothing more comes off
 *   3. Remaining core: exact root, full cover by roots (compounds), or one
 *      opaque symbol
 *
 * Equal-spelling dictionary entries are resolved by frequency, then key.
 */

#pragma once

#include <export.hpp>
#include <language/language_profile.hpp>
#include <symbols/symbol.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Lexigraph {

struct SegmenterConfig {
    size_t min_stem_length = 3;  // Codepoints a peel must leave unless the rest is a root or compound of roots
    size_t min_root_length = 2;  // Shortest root accepted as a piece of a compound core
};

class LEXIGRAPH_API MorphemeSegmenter {
public:
    explicit MorphemeSegmenter(const LanguageProfile& profile, const SegmenterConfig& config = SegmenterConfig());

    /**
     * @brief Segment a surface word into morpheme symbols.
     * @throws InvalidInputError for empty or malformed words
     */
    SymbolSequence segment(const std::string& word) const;

    const SegmenterConfig& config() const { return config_; }

private:
    struct Peel {
        const MorphemeEntry* entry = nullptr;
        size_t length = 0;
        bool leaves_root = false;
    };

    std::optional<Peel> best_peel(const std::u32string& word, size_t begin, size_t end, MorphemeKind kind) const;
    bool is_root(const std::u32string& word, size_t begin, size_t end) const;
    bool is_covered(const std::u32string& word, size_t begin, size_t end) const;  // root or compound of roots
    void segment_core(const std::u32string& word, size_t begin, size_t end, SymbolSequence& out) const;
    bool cover_with_roots(const std::u32string& word, size_t pos, size_t end,
                          std::vector<bool>& dead, std::vector<const MorphemeEntry*>& pieces) const;

    const LanguageProfile& profile_;
    SegmenterConfig config_;
};

/**
 * @brief Convenience wrapper: segment one word with the given profile.
 */
LEXIGRAPH_API SymbolSequence segment_morphemes(const std::string& word, const LanguageProfile& profile,
                                               const SegmenterConfig& config = SegmenterConfig());

} // namespace Lexigraph
