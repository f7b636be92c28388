/**
 * @file binary.hpp
 * @brief Text encodings for MessagePack bin payloads.
 *
 * JSON has no byte-string type, so bin 8/16/32 payloads are rendered as a
 * JSON string holding a text encoding of the bytes.
 *
 * @see https://www.rfc-editor.org/rfc/rfc4648#section-4 Base 64 Encoding
 */

#ifndef MSGJSON_BINARY_HPP
#define MSGJSON_BINARY_HPP

#include <string>

#include "config.hpp"

namespace msgjson {

/**
 * @brief Text encoding used for binary payloads.
 */
enum class BinaryEncoding {
    Base64, ///< RFC 4648 standard alphabet, '=' padded
    Hex     ///< Two lowercase hex digits per byte
};

/**
 * @brief Append bytes as base64 (no quotes).
 */
void append_base64(std::string& out, const std::uint8_t* data, std::size_t length);

/**
 * @brief Append bytes as lowercase hex (no quotes).
 */
void append_hex(std::string& out, const std::uint8_t* data, std::size_t length);

/**
 * @brief Append bytes as a quoted JSON string in the given encoding.
 *
 * Neither alphabet contains characters that need escaping.
 */
void append_binary(std::string& out, const std::uint8_t* data, std::size_t length,
                   BinaryEncoding encoding);

} // namespace msgjson

#endif // MSGJSON_BINARY_HPP
