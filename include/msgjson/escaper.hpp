/**
 * @file escaper.hpp
 * @brief JSON string literal escaping, safe for JavaScript embedding.
 *
 * JSON allows the raw code points U+2028 (LINE SEPARATOR) and U+2029
 * (PARAGRAPH SEPARATOR) inside strings, but JavaScript source treats them
 * as line terminators. Escaped output here is valid for both.
 *
 * @see https://www.rfc-editor.org/rfc/rfc8259#section-7 JSON strings
 * @see https://tc39.es/proposal-json-superset/
 */

#ifndef MSGJSON_ESCAPER_HPP
#define MSGJSON_ESCAPER_HPP

#include <string>

#include "config.hpp"
#include "error.hpp"

namespace msgjson {

/**
 * @brief Check that a byte run is well-formed UTF-8.
 *
 * Rejects overlong forms, surrogate code points (U+D800..U+DFFF), code
 * points above U+10FFFF and truncated sequences.
 *
 * @param data Bytes to check (may be null if length is 0)
 * @param length Number of bytes
 * @return true if the bytes are well-formed UTF-8
 */
bool is_valid_utf8(const std::uint8_t* data, std::size_t length) noexcept;

/**
 * @brief Append a quoted, escaped string literal.
 *
 * Validates the input, then writes @c "..." with:
 * - @c " and @c \ backslash-escaped
 * - U+0000..U+001F as @c \\b @c \\f @c \\n @c \\r @c \\t or @c \\u00XX
 * - U+2028 and U+2029 as @c \\u2028 and @c \\u2029
 * - @c / as @c \\/ when @p escape_slashes is set
 *
 * Nothing is appended when validation fails.
 *
 * @param data UTF-8 bytes
 * @param length Number of bytes
 * @param[out] out Output text
 * @param escape_slashes Also escape forward slashes
 * @return Error::Ok, or Error::InvalidEncoding
 */
Error append_escaped(const std::uint8_t* data, std::size_t length, std::string& out,
                     bool escape_slashes = false);

} // namespace msgjson

#endif // MSGJSON_ESCAPER_HPP
