#include <ingestion/vocabulary_source.hpp>
#include <core/errors.hpp>
#include <algorithm>
#include <charconv>
#include <sstream>
#include <utility>

namespace Lexigraph {

RankedVocabulary::RankedVocabulary(std::vector<VocabularyEntry> entries)
    : entries_(std::move(entries)) {
    std::stable_sort(entries_.begin(), entries_.end(), [](const VocabularyEntry& a, const VocabularyEntry& b) {
        return a.frequency > b.frequency;
    });
}

RankedVocabulary RankedVocabulary::from_frequency_list(std::istream& in) {
    std::vector<VocabularyEntry> entries;
    std::string line;
    size_t line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') line.pop_back();

        std::istringstream fields(line);
        std::string word, count, pos;
        if (!(fields >> word) || word[0] == '#') continue;

        if (!(fields >> count)) {
            throw InvalidInputError("line " + std::to_string(line_no) + ": missing count for '" + word + "'");
        }
        uint64_t frequency = 0;
        auto [end, ec] = std::from_chars(count.data(), count.data() + count.size(), frequency);
        if (ec != std::errc() || end != count.data() + count.size()) {
            throw InvalidInputError("line " + std::to_string(line_no) + ": bad count '" + count + "'");
        }
        fields >> pos;

        entries.push_back(VocabularyEntry{word, frequency, pos});
    }

    return RankedVocabulary(std::move(entries));
}

std::optional<VocabularyEntry> RankedVocabulary::next() {
    if (cursor_ >= entries_.size()) return std::nullopt;
    return entries_[cursor_++];
}

} // namespace Lexigraph
