/**
 * @file decoder.hpp
 * @brief MessagePack to JSON text decoder.
 *
 * Single-pass recursive descent: each value is read from a ByteCursor and
 * rendered straight into one output string, with no intermediate value
 * tree. Containers recurse once per nesting level, bounded by
 * Options::max_depth.
 */

#ifndef MSGJSON_DECODER_HPP
#define MSGJSON_DECODER_HPP

#include <string>

#include "binary.hpp"
#include "bytecursor.hpp"
#include "config.hpp"
#include "error.hpp"
#include "format.hpp"

namespace msgjson {

/**
 * @brief Run-time decoder configuration.
 */
struct Options {
    /// Deepest container nesting accepted (a top-level array is depth 1)
    std::size_t max_depth = MAX_DEPTH;

    /// Ignore bytes after the first complete value; false fails with TrailingBytes
    bool allow_trailing_bytes = true;

    /// Rendering of bin 8/16/32 payloads
    BinaryEncoding binary_encoding = BinaryEncoding::Base64;

    /// Emit '/' as "\/" inside strings
    bool escape_slashes = false;

    /// Wrap non-string map keys in a JSON string, e.g. {"1":true}
    bool quote_non_string_keys = false;
};

/**
 * @brief MessagePack decoder producing JSON-and-JavaScript-safe text.
 *
 * A Decoder holds only its options and the diagnostics of the last call;
 * it keeps no reference to any input buffer. Use one instance per thread.
 */
class Decoder {
public:
    /**
     * @brief Construct decoder with configuration.
     *
     * @param options Decoding options
     */
    explicit Decoder(const Options& options = Options()) noexcept : options_(options) {}

    /**
     * @brief Decode one MessagePack value into JSON text.
     *
     * @param data Input bytes (may be null if size is 0)
     * @param size Input size in bytes
     * @param[out] out Replaced with the JSON text; left empty on failure
     * @return Error::Ok on success
     */
    Error decode(const std::uint8_t* data, std::size_t size, std::string& out);

    /**
     * @brief Tag byte that caused the last Error::UnsupportedType.
     */
    std::uint8_t error_tag() const noexcept {
        return error_tag_;
    }

    /**
     * @brief Offset of the value that failed in the last decode.
     *
     * For Error::TrailingBytes this is the first unconsumed byte.
     */
    std::size_t error_offset() const noexcept {
        return error_offset_;
    }

    /**
     * @brief Bytes consumed by the last successful decode.
     */
    std::size_t bytes_consumed() const noexcept {
        return consumed_;
    }

    const Options& options() const noexcept {
        return options_;
    }

private:
    Error decode_value(ByteCursor& cursor, std::size_t depth, std::string& out);
    Error decode_array(ByteCursor& cursor, std::uint64_t count, std::size_t depth,
                       std::string& out);
    Error decode_map(ByteCursor& cursor, std::uint64_t count, std::size_t depth,
                     std::string& out);
    Error decode_key(ByteCursor& cursor, std::size_t depth, std::string& out);

    Error fail(Error error, std::size_t offset) noexcept {
        error_offset_ = offset;
        return error;
    }

    Options options_;

    // Diagnostics of the last decode() call
    std::uint8_t error_tag_ = 0;
    std::size_t error_offset_ = 0;
    std::size_t consumed_ = 0;
};

} // namespace msgjson

#endif // MSGJSON_DECODER_HPP
