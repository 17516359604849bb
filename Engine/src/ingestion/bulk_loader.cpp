/**
 * @file bulk_loader.cpp
 * @brief Sequential and OpenMP-parallel vocabulary loading
 */

#include <ingestion/bulk_loader.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <utils/unicode.hpp>
#include <algorithm>
#include <exception>
#include <iomanip>
#include <sstream>
#include <omp.h>

namespace Lexigraph {

namespace {

std::vector<SymbolSequence> parse_word(const std::string& word, const MorphemeSegmenter& segmenter,
                                       const IpaTranscriber& transcriber, const LoaderConfig& config) {
    if (config.mode == ChartMode::Morphemes) return {segmenter.segment(word)};
    if (config.all_pronunciations) return transcriber.transcribe_all(word);
    return {transcriber.transcribe(word)};
}

} // anonymous namespace

const char* to_string(ChartMode mode) {
    switch (mode) {
        case ChartMode::Morphemes: return "morphemes";
        case ChartMode::Phonemes:  return "phonemes";
    }
    return "unknown";
}

std::optional<ChartMode> parse_chart_mode(const std::string& text) {
    if (text == "morphemes") return ChartMode::Morphemes;
    if (text == "phonemes") return ChartMode::Phonemes;
    return std::nullopt;
}

BulkLoader::BulkLoader(const LoaderConfig& config) : config_(config) {}

std::vector<SymbolSequence> BulkLoader::parse(const std::string& word, const LanguageProfile& profile) const {
    MorphemeSegmenter segmenter(profile, config_.segmenter);
    IpaTranscriber transcriber(profile, config_.transcriber);
    return parse_word(word, segmenter, transcriber, config_);
}

std::vector<BulkLoader::RankedEntry> BulkLoader::pull(VocabularySource& source, size_t top_n) const {
    std::vector<RankedEntry> out;
    out.reserve(std::min<size_t>(top_n, 1 << 16));
    for (size_t rank = 1; rank <= top_n; ++rank) {
        auto entry = source.next();
        if (!entry) break;
        out.push_back(RankedEntry{rank, std::move(*entry)});
    }
    return out;
}

void BulkLoader::insert_range(Automaton& automaton, const LanguageProfile& profile,
                              const std::vector<RankedEntry>& entries, size_t begin, size_t end,
                              LoadReport& report) const {
    MorphemeSegmenter segmenter(profile, config_.segmenter);
    IpaTranscriber transcriber(profile, config_.transcriber);
    const bool log_progress = config_.progress_interval > 0 && omp_in_parallel() == 0;

    for (size_t i = begin; i < end; ++i) {
        const auto& item = entries[i];
        try {
            const std::string surface = utf32_to_utf8(normalize_word(item.entry.word));
            // Parse every sequence before inserting any, so a failure leaves no partial entry
            auto sequences = parse_word(item.entry.word, segmenter, transcriber, config_);
            for (const auto& seq : sequences) {
                WordRecord record;
                record.surface = surface;
                record.language = profile.code();
                record.frequency = item.entry.frequency;
                record.part_of_speech = item.entry.part_of_speech;
                automaton.insert(seq, std::move(record));
            }
            ++report.inserted;
        } catch (const LexigraphError& e) {
            report.diagnostics.push_back(LoadDiagnostic{item.rank, item.entry.word, e.what()});
        }

        if (log_progress && (i - begin + 1) % config_.progress_interval == 0) {
            Logger::bulk(std::to_string(i - begin + 1) + " / " + std::to_string(end - begin) +
                         " words, " + std::to_string(automaton.state_count()) + " states");
        }
    }
}

void BulkLoader::finish(const Automaton& automaton, const LanguageProfile& profile, size_t records_before,
                        double elapsed_ms, LoadReport& report) const {
    report.skipped = report.diagnostics.size();
    report.new_records = automaton.record_count() - records_before;
    report.states_after = automaton.state_count();
    report.elapsed_ms = elapsed_ms;

    for (const auto& d : report.diagnostics) {
        Logger::warn("Skipped #" + std::to_string(d.rank) + " '" + d.word + "': " + d.reason);
    }

    std::ostringstream msg;
    msg << "Loaded " << report.inserted << "/" << report.requested << " " << profile.code()
        << " words (" << to_string(config_.mode) << "): "
        << report.states_before << " -> " << report.states_after << " states, "
        << report.skipped << " skipped, "
        << std::fixed << std::setprecision(0) << report.elapsed_ms << "ms";
    Logger::success(msg.str());
}

LoadReport BulkLoader::add_common(Automaton& automaton, const LanguageProfile& profile,
                                  VocabularySource& source, size_t top_n) const {
    Timer timer;
    LoadReport report;
    report.states_before = automaton.state_count();
    const size_t records_before = automaton.record_count();

    Logger::step("Loading top " + std::to_string(top_n) + " " + profile.code() + " words");
    auto entries = pull(source, top_n);
    report.requested = entries.size();

    insert_range(automaton, profile, entries, 0, entries.size(), report);

    finish(automaton, profile, records_before, timer.elapsed_ms(), report);
    return report;
}

LoadReport BulkLoader::add_common_parallel(Automaton& automaton, const LanguageProfile& profile,
                                           VocabularySource& source, size_t top_n) const {
    Timer timer;
    LoadReport report;
    report.states_before = automaton.state_count();
    const size_t records_before = automaton.record_count();

    auto entries = pull(source, top_n);
    report.requested = entries.size();
    const size_t n = entries.size();

    size_t workers = config_.workers > 0 ? config_.workers : static_cast<size_t>(omp_get_max_threads());
    workers = std::max<size_t>(1, std::min(workers, n));
    const size_t chunk = n == 0 ? 0 : (n + workers - 1) / workers;

    Logger::step("Loading top " + std::to_string(top_n) + " " + profile.code() + " words on " +
                 std::to_string(workers) + " workers");

    std::vector<Automaton> locals(workers);
    std::vector<LoadReport> partial(workers);
    std::vector<std::exception_ptr> errors(workers);

    #pragma omp parallel for schedule(static, 1) num_threads(static_cast<int>(workers))
    for (size_t w = 0; w < workers; ++w) {
        const size_t begin = std::min(n, w * chunk);
        const size_t end = std::min(n, begin + chunk);
        try {
            insert_range(locals[w], profile, entries, begin, end, partial[w]);
        } catch (...) {
            // Exceptions must not leave an OpenMP region; rethrown below
            errors[w] = std::current_exception();
        }
    }

    for (const auto& e : errors) {
        if (e) std::rethrow_exception(e);
    }

    // Merge in chunk order: same ids and record order as a sequential load
    for (size_t w = 0; w < workers; ++w) {
        automaton.merge_from(locals[w]);
        report.inserted += partial[w].inserted;
        report.diagnostics.insert(report.diagnostics.end(),
                                  partial[w].diagnostics.begin(), partial[w].diagnostics.end());
        Logger::bulk("Merged chunk " + std::to_string(w + 1) + "/" + std::to_string(workers) + ": " +
                     std::to_string(locals[w].record_count()) + " records");
    }

    finish(automaton, profile, records_before, timer.elapsed_ms(), report);
    return report;
}

} // namespace Lexigraph
