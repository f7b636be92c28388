/**
 * @file numeric.hpp
 * @brief Numeric-to-text rules.
 *
 * - Integers: plain decimal, leading '-' for negatives, no exponent.
 * - Floats: the shortest decimal that parses back to the same binary value
 *   (std::to_chars shortest form), so 1.0 renders as "1" and 1e20 as
 *   "1e+20". The float32 and float64 renderings use the precision of their
 *   own type: float32 0.1 renders as "0.1", not "0.10000000149011612".
 * - NaN and infinities have no JSON representation and render as "null".
 *   The output cannot tell them apart from a decoded nil.
 */

#ifndef MSGJSON_NUMERIC_HPP
#define MSGJSON_NUMERIC_HPP

#include <string>

#include "config.hpp"

namespace msgjson {

/// Append an unsigned integer in decimal.
void append_uint(std::string& out, std::uint64_t value);

/// Append a signed integer in decimal.
void append_int(std::string& out, std::int64_t value);

/// Append a single-precision value using the shortest round-trip form.
void append_float(std::string& out, float value);

/// Append a double-precision value using the shortest round-trip form.
void append_double(std::string& out, double value);

} // namespace msgjson

#endif // MSGJSON_NUMERIC_HPP
