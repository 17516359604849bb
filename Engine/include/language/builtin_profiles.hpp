/**
 * @file builtin_profiles.hpp
 * @brief Small seed profiles shipped with the library
 */

#pragma once

#include <export.hpp>
#include <language/language_profile.hpp>

namespace Lexigraph {

/**
 * @brief English seed profile ("en").
 *
 * Common derivational affixes, a few dozen roots, a handful of dictionary
 * pronunciations and a compact grapheme-to-phoneme table. Enough to chart
 * everyday vocabulary; real lexicons are loaded into a profile by the caller.
 */
LEXIGRAPH_API LanguageProfile english_profile();

} // namespace Lexigraph
