#include <symbols/symbol.hpp>
#include <core/errors.hpp>
#include <utility>

namespace Lexigraph {

Symbol::Symbol(std::string key, std::optional<std::string> label, std::string gloss, uint64_t frequency)
    : key_(std::move(key)), label_(std::move(label)), gloss_(std::move(gloss)), frequency_(frequency) {
    if (key_.empty()) throw InvalidInputError("symbol key must not be empty");
    if (label_ && (label_->empty() || *label_ == key_)) label_.reset();
}

SymbolSequence make_sequence(const std::vector<std::string>& keys) {
    SymbolSequence out;
    out.reserve(keys.size());
    for (const auto& k : keys) out.emplace_back(k);
    return out;
}

std::vector<std::string> sequence_keys(const SymbolSequence& sequence) {
    std::vector<std::string> out;
    out.reserve(sequence.size());
    for (const auto& s : sequence) out.push_back(s.key());
    return out;
}

std::string join_keys(const SymbolSequence& sequence, const std::string& separator) {
    std::string out;
    for (size_t i = 0; i < sequence.size(); ++i) {
        if (i > 0) out += separator;
        out += sequence[i].key();
    }
    return out;
}

} // namespace Lexigraph
