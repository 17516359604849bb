#include <config/engine_config.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <stdexcept>

namespace Lexigraph {

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

size_t env_size(const char* name, size_t fallback) {
    const char* raw = std::getenv(name);
    if (!raw) return fallback;

    std::string value(raw);
    size_t out = 0;
    auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
    if (value.empty() || ec != std::errc() || end != value.data() + value.size()) {
        throw std::runtime_error(std::string(name) + ": expected a non-negative integer, got '" + value + "'");
    }
    return out;
}

bool env_bool(const char* name, bool fallback) {
    const char* raw = std::getenv(name);
    if (!raw) return fallback;

    std::string value = lowercase(raw);
    if (value == "1" || value == "true" || value == "yes" || value == "on") return true;
    if (value == "0" || value == "false" || value == "no" || value == "off") return false;
    throw std::runtime_error(std::string(name) + ": expected a boolean, got '" + std::string(raw) + "'");
}

} // anonymous namespace

std::optional<Logger::Level> parse_log_level(const std::string& text) {
    std::string value = lowercase(text);
    if (value == "bulk")    return Logger::Level::Bulk;
    if (value == "info")    return Logger::Level::Info;
    if (value == "step")    return Logger::Level::Step;
    if (value == "success") return Logger::Level::Success;
    if (value == "warning" || value == "warn") return Logger::Level::Warning;
    if (value == "error")   return Logger::Level::Error;
    if (value == "quiet")   return Logger::Level::Quiet;
    return std::nullopt;
}

EngineConfig EngineConfig::load_from_env() {
    EngineConfig config;

    config.loader.top_n = env_size("LEXIGRAPH_TOP_N", config.loader.top_n);
    config.loader.workers = env_size("LEXIGRAPH_WORKERS", config.loader.workers);
    config.loader.segmenter.min_stem_length =
        env_size("LEXIGRAPH_MIN_STEM", config.loader.segmenter.min_stem_length);
    config.loader.all_pronunciations =
        env_bool("LEXIGRAPH_ALL_PRONUNCIATIONS", config.loader.all_pronunciations);

    if (const char* mode = std::getenv("LEXIGRAPH_MODE")) {
        auto parsed = parse_chart_mode(lowercase(mode));
        if (!parsed) {
            throw std::runtime_error(std::string("LEXIGRAPH_MODE: expected morphemes or phonemes, got '") + mode + "'");
        }
        config.loader.mode = *parsed;
    }

    if (const char* level = std::getenv("LEXIGRAPH_LOG_LEVEL")) {
        auto parsed = parse_log_level(level);
        if (!parsed) {
            throw std::runtime_error(std::string("LEXIGRAPH_LOG_LEVEL: unknown level '") + level + "'");
        }
        config.log_level = *parsed;
    }

    return config;
}

} // namespace Lexigraph
