#pragma once

#include <string>

namespace vrm {
namespace lookup {

/**
 * @brief True for Unicode White_Space code points (ASCII included)
 */
bool is_whitespace(char32_t cp);

/**
 * @brief Strip leading and trailing whitespace
 *
 * Input is read as UTF-8, so non-ASCII spaces such as U+00A0 and U+3000 are
 * stripped too.
 */
std::string trim(const std::string &raw);

/**
 * @brief True for code points removed from a plate before lookup (whitespace and '-')
 */
bool is_plate_separator(char32_t cp);

/**
 * @brief Normalize a registration mark for the upstream query
 *
 * Removes every whitespace code point and every hyphen, then upper-cases the
 * ASCII remainder. No UK plate grammar is checked: "ab 12-cde" -> "AB12CDE",
 * "" -> "". Normalizing an already normalized plate returns it unchanged.
 */
std::string normalize_plate(const std::string &plate);

}  // namespace lookup
}  // namespace vrm
