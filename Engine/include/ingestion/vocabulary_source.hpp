/**
 * @file vocabulary_source.hpp
 * @brief Ranked word sources feeding the bulk loader
 */

#pragma once

#include <export.hpp>
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace Lexigraph {

struct VocabularyEntry {
    std::string word;
    uint64_t frequency = 0;
    std::string part_of_speech;  // empty when unknown
};

/**
 * @brief Interface for any vocabulary (frequency list, lexicon, test fixture).
 *
 * Generator pattern: entries come out most frequent first, one at a time.
 */
class LEXIGRAPH_API VocabularySource {
public:
    virtual ~VocabularySource() = default;

    // Next entry by rank. Returns std::nullopt when exhausted.
    virtual std::optional<VocabularyEntry> next() = 0;

    // Rewind to the most frequent entry
    virtual void reset() = 0;
};

/**
 * @brief In-memory source ranked by frequency, highest first.
 *
 * Equal frequencies keep their input order.
 */
class LEXIGRAPH_API RankedVocabulary : public VocabularySource {
public:
    RankedVocabulary() = default;
    explicit RankedVocabulary(std::vector<VocabularyEntry> entries);

    /**
     * @brief Parse a frequency list: one "word count [part-of-speech]" per line.
     *
     * Blank lines and lines starting with '#' are ignored.
     *
     * @throws InvalidInputError on a missing or non-numeric count (message carries the line number)
     */
    static RankedVocabulary from_frequency_list(std::istream& in);

    std::optional<VocabularyEntry> next() override;
    void reset() override { cursor_ = 0; }

    size_t size() const { return entries_.size(); }
    const std::vector<VocabularyEntry>& entries() const { return entries_; }

private:
    std::vector<VocabularyEntry> entries_;
    size_t cursor_ = 0;
};

} // namespace Lexigraph
