/**
 * @file msgjson.hpp
 * @brief High-level msgjson API.
 *
 * Provides decode_to_json() (error codes) and to_json() (exceptions) for
 * converting one MessagePack value into text that is valid JSON and can be
 * evaluated verbatim as a JavaScript expression.
 *
 * @see https://github.com/msgpack/msgpack/blob/master/spec.md MessagePack specification
 */

#ifndef MSGJSON_HPP
#define MSGJSON_HPP

#include <string>
#include <vector>

#include "binary.hpp"
#include "bytecursor.hpp"
#include "config.hpp"
#include "decoder.hpp"
#include "error.hpp"
#include "escaper.hpp"
#include "format.hpp"
#include "numeric.hpp"

namespace msgjson {

/**
 * @brief Decode one MessagePack value into JSON text.
 *
 * Bytes after the first complete value are ignored unless
 * Options::allow_trailing_bytes is false.
 *
 * @param data Input bytes
 * @param size Input size in bytes
 * @param[out] out JSON text; empty on failure
 * @param options Decoding options
 * @return Error::Ok on success
 */
inline Error decode_to_json(const std::uint8_t* data, std::size_t size, std::string& out,
                            const Options& options = Options()) {
    Decoder decoder(options);
    return decoder.decode(data, size, out);
}

#if !MSGJSON_NO_EXCEPTIONS

/**
 * @brief Decode one MessagePack value into JSON text, throwing on failure.
 *
 * @param data Input bytes
 * @param size Input size in bytes
 * @param options Decoding options
 * @return JSON text
 * @throws DecodeException subclass matching the failure
 */
std::string to_json(const std::uint8_t* data, std::size_t size,
                    const Options& options = Options());

/**
 * @brief Decode one MessagePack value held in a vector.
 */
inline std::string to_json(const std::vector<std::uint8_t>& buffer,
                           const Options& options = Options()) {
    return to_json(buffer.data(), buffer.size(), options);
}

/**
 * @brief Throw the exception matching a failed decode.
 *
 * @param error Failure code (must not be Error::Ok)
 * @param decoder Decoder holding the failure diagnostics
 */
[[noreturn]] void throw_decode_error(Error error, const Decoder& decoder);

#endif // !MSGJSON_NO_EXCEPTIONS

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace msgjson

#endif // MSGJSON_HPP
