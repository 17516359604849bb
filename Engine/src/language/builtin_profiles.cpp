#include <language/builtin_profiles.hpp>
#include <string>
#include <vector>

namespace Lexigraph {

namespace {

struct AffixRow {
    const char* fragment;
    uint64_t frequency;
    const char* gloss;
};

struct RuleRow {
    const char* grapheme;
    std::vector<std::string> phonemes;
};

const AffixRow EN_PREFIXES[] = {
    {"un",    9000, "not"},
    {"re",    8000, "again"},
    {"in",    6000, "not"},
    {"dis",   5000, "opposite of"},
    {"pre",   3000, "before"},
    {"mis",   2000, "wrongly"},
    {"over",  2500, "too much"},
    {"under", 2200, "too little"},
    {"non",   1500, "not"},
};

const AffixRow EN_SUFFIXES[] = {
    {"s",     20000, "plural"},
    {"es",    6000,  "plural"},
    {"ed",    15000, "past"},
    {"ing",   14000, "progressive"},
    {"er",    9000,  "agent"},
    {"ly",    8000,  "manner"},
    {"able",  4000,  "can be"},
    {"ible",  1500,  "can be"},
    {"ness",  3500,  "state of"},
    {"ment",  3000,  "result of"},
    {"ful",   2500,  "full of"},
    {"less",  2400,  "without"},
    {"tion",  5000,  "act of"},
};

const AffixRow EN_ROOTS[] = {
    {"the",    60000, ""},
    {"one",    9000,  ""},
    {"go",     8000,  "move"},
    {"do",     8000,  "perform"},
    {"make",   7000,  "create"},
    {"read",   6000,  "interpret text"},
    {"use",    6000,  "employ"},
    {"work",   6000,  "labour"},
    {"home",   5500,  "dwelling"},
    {"help",   5000,  "assist"},
    {"play",   5000,  "amuse"},
    {"kind",   4500,  "benevolent"},
    {"run",    4500,  "move fast"},
    {"book",   4000,  "bound text"},
    {"water",  4000,  "liquid"},
    {"walk",   3500,  "move on foot"},
    {"care",   3500,  "attention"},
    {"hope",   3000,  "expect"},
    {"fast",   3000,  "quick"},
    {"break",  3000,  "shatter"},
    {"case",   2800,  "container"},
    {"house",  2700,  "building"},
    {"teach",  2500,  "instruct"},
    {"church", 2000,  "place of worship"},
    {"dog",    2000,  "canine"},
    {"cat",    1800,  "feline"},
    {"sing",   1500,  "vocalize"},
    {"view",   1500,  "see"},
};

// Multi-letter graphemes first; maximal munch decides, not order
const RuleRow EN_RULES[] = {
    {"tch", {"t͡ʃ"}},
    {"ch",  {"t͡ʃ"}},
    {"sh",  {"ʃ"}},
    {"th",  {"θ"}},
    {"ng",  {"ŋ"}},
    {"ph",  {"f"}},
    {"ck",  {"k"}},
    {"wh",  {"w"}},
    {"qu",  {"k", "w"}},
    {"ee",  {"iː"}},
    {"ea",  {"iː"}},
    {"oo",  {"uː"}},
    {"ai",  {"eɪ"}},
    {"ay",  {"eɪ"}},
    {"ou",  {"aʊ"}},
    {"ow",  {"aʊ"}},
    {"oi",  {"ɔɪ"}},
    {"a",   {"æ"}},
    {"b",   {"b"}},
    {"c",   {"k"}},
    {"d",   {"d"}},
    {"e",   {"ɛ"}},
    {"f",   {"f"}},
    {"g",   {"ɡ"}},
    {"h",   {"h"}},
    {"i",   {"ɪ"}},
    {"j",   {"d͡ʒ"}},
    {"k",   {"k"}},
    {"l",   {"l"}},
    {"m",   {"m"}},
    {"n",   {"n"}},
    {"o",   {"ɒ"}},
    {"p",   {"p"}},
    {"r",   {"ɹ"}},
    {"s",   {"s"}},
    {"t",   {"t"}},
    {"u",   {"ʌ"}},
    {"v",   {"v"}},
    {"w",   {"w"}},
    {"x",   {"k", "s"}},
    {"y",   {"j"}},
    {"z",   {"z"}},
};

const char* const EN_EXTRA_PHONEMES[] = {
    "ð", "ə", "ɜː", "ɔː", "ɑː", "aɪ", "əʊ", "ɪə", "eə", "ʊə", "ʊ", "ʒ", "ɔ", "e", "i", "u",
};

} // anonymous namespace

LanguageProfile english_profile() {
    LanguageProfile en("en", "English");

    for (const auto& row : EN_PREFIXES) en.add_prefix(row.fragment, row.frequency, row.gloss);
    for (const auto& row : EN_SUFFIXES) en.add_suffix(row.fragment, row.frequency, row.gloss);
    for (const auto& row : EN_ROOTS)    en.add_root(row.fragment, row.frequency, row.gloss);

    for (const auto& row : EN_RULES) en.add_grapheme_rule(row.grapheme, row.phonemes);
    for (const char* p : EN_EXTRA_PHONEMES) en.add_phoneme(p);

    en.add_pronunciation("the", "ðə");
    en.add_pronunciation("one", "wʌn");
    en.add_pronunciation("water", "ˈwɔː.tə(ɹ)");
    en.add_pronunciation("church", "t͡ʃɜːt͡ʃ");
    en.add_pronunciation("read", "ɹiːd");
    en.add_pronunciation("read", "ɹɛd");
    en.add_pronunciation("house", "haʊs");
    en.add_pronunciation("one", "wɒn");

    return en;
}

} // namespace Lexigraph
