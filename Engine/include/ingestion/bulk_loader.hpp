/**
 * @file bulk_loader.hpp
 * @brief Populate an automaton from the top entries of a vocabulary
 *
 * Each entry is parsed (morpheme segmentation or IPA transcription, per the
 * configured mode) and inserted as one WordRecord. An entry that fails to
 * parse is skipped and reported; the rest of the load carries on.
 *
 * The parallel variant splits the pulled entries into contiguous chunks,
 * builds one automaton per chunk under OpenMP and merges them in chunk order,
 * which yields exactly the automaton a sequential load would have built.
 */

#pragma once

#include <export.hpp>
#include <automata/state_automaton.hpp>
#include <ingestion/vocabulary_source.hpp>
#include <language/language_profile.hpp>
#include <parsing/ipa_transcriber.hpp>
#include <parsing/morpheme_segmenter.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Lexigraph {

enum class ChartMode {
    Morphemes,  // word -> morpheme symbols
    Phonemes    // word -> phoneme symbols
};

LEXIGRAPH_API const char* to_string(ChartMode mode);

/**
 * @brief Parse "morphemes" / "phonemes" (case-sensitive).
 */
LEXIGRAPH_API std::optional<ChartMode> parse_chart_mode(const std::string& text);

/**
 * @brief Loader configuration
 */
struct LoaderConfig {
    ChartMode mode = ChartMode::Morphemes;
    size_t top_n = 1000;                // Default entry budget per load
    bool all_pronunciations = false;    // Phoneme mode: one record per dictionary pronunciation
    size_t workers = 0;                 // add_common_parallel threads, 0 = OpenMP default
    size_t progress_interval = 10000;   // Bulk log every N entries, 0 = never

    SegmenterConfig segmenter;
    TranscriberConfig transcriber;
};

struct LoadDiagnostic {
    size_t rank;         // 1-based position in the source
    std::string word;    // as supplied by the source
    std::string reason;
};

/**
 * @brief Outcome of one add_common call
 */
struct LoadReport {
    size_t requested = 0;      // Entries pulled from the source
    size_t inserted = 0;       // Entries parsed and inserted
    size_t skipped = 0;        // Entries that failed (== diagnostics.size())
    size_t new_records = 0;    // Records not already in the automaton
    size_t states_before = 0;
    size_t states_after = 0;
    double elapsed_ms = 0.0;
    std::vector<LoadDiagnostic> diagnostics;
};

class LEXIGRAPH_API BulkLoader {
public:
    explicit BulkLoader(const LoaderConfig& config = LoaderConfig());

    /**
     * @brief Insert up to `top_n` entries of `source` into `automaton`.
     *
     * Reading starts wherever the source currently stands; call reset() on
     * it to start again from the top.
     */
    LoadReport add_common(Automaton& automaton, const LanguageProfile& profile,
                          VocabularySource& source, size_t top_n) const;

    LoadReport add_common(Automaton& automaton, const LanguageProfile& profile, VocabularySource& source) const {
        return add_common(automaton, profile, source, config_.top_n);
    }

    /**
     * @brief Same result as add_common(), parsed and built on `config().workers` threads.
     */
    LoadReport add_common_parallel(Automaton& automaton, const LanguageProfile& profile,
                                   VocabularySource& source, size_t top_n) const;

    LoadReport add_common_parallel(Automaton& automaton, const LanguageProfile& profile, VocabularySource& source) const {
        return add_common_parallel(automaton, profile, source, config_.top_n);
    }

    /**
     * @brief Symbol sequences one word contributes under the current mode.
     * @throws InvalidInputError when the word cannot be parsed
     */
    std::vector<SymbolSequence> parse(const std::string& word, const LanguageProfile& profile) const;

    const LoaderConfig& config() const { return config_; }
    void set_config(const LoaderConfig& config) { config_ = config; }

private:
    struct RankedEntry {
        size_t rank;
        VocabularyEntry entry;
    };

    std::vector<RankedEntry> pull(VocabularySource& source, size_t top_n) const;
    void insert_range(Automaton& automaton, const LanguageProfile& profile,
                      const std::vector<RankedEntry>& entries, size_t begin, size_t end,
                      LoadReport& report) const;
    void finish(const Automaton& automaton, const LanguageProfile& profile, size_t records_before,
                double elapsed_ms, LoadReport& report) const;

    LoaderConfig config_;
};

} // namespace Lexigraph
