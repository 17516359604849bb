/**
 * @file engine_config.hpp
 * @brief Top-level settings, with environment overrides
 *
 * Environment variables (all optional):
 *   LEXIGRAPH_TOP_N               entries per bulk load
 *   LEXIGRAPH_WORKERS             parallel load threads (0 = OpenMP default)
 *   LEXIGRAPH_MODE                morphemes | phonemes
 *   LEXIGRAPH_MIN_STEM            shortest stem an affix peel may leave
 *   LEXIGRAPH_ALL_PRONUNCIATIONS  1/0, true/false, yes/no, on/off
 *   LEXIGRAPH_LOG_LEVEL           bulk | info | step | success | warning | error | quiet
 */

#pragma once

#include <export.hpp>
#include <ingestion/bulk_loader.hpp>
#include <utils/logger.hpp>
#include <optional>
#include <string>

namespace Lexigraph {

struct LEXIGRAPH_API EngineConfig {
    LoaderConfig loader;  // includes segmenter and transcriber settings
    Logger::Level log_level = Logger::Level::Info;

    /**
     * @brief Defaults overridden by any LEXIGRAPH_* variables that are set.
     * @throws std::runtime_error on a malformed value
     */
    static EngineConfig load_from_env();

    /**
     * @brief Push the log level to the global Logger.
     */
    void apply() const { Logger::set_threshold(log_level); }
};

LEXIGRAPH_API std::optional<Logger::Level> parse_log_level(const std::string& text);

} // namespace Lexigraph
