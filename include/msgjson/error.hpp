/**
 * @file error.hpp
 * @brief msgjson error handling.
 *
 * Provides both exception-based and error-code-based error handling.
 * The decoding core only ever returns error codes; the exception types
 * are raised by the throwing convenience API (to_json()).
 */

#ifndef MSGJSON_ERROR_HPP
#define MSGJSON_ERROR_HPP

#include "config.hpp"

#if !MSGJSON_NO_EXCEPTIONS
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#endif

namespace msgjson {

/**
 * @brief Error codes for error-code-based error handling.
 */
enum class Error {
    Ok = 0,               ///< Success
    OutOfBounds = -1,     ///< Read past the end of the input buffer
    UnsupportedType = -2, ///< Tag byte matches no supported format
    InvalidEncoding = -3, ///< String payload is not well-formed UTF-8
    InvalidKey = -4,      ///< Map key rendered as null
    DepthExceeded = -5,   ///< Container nesting deeper than the limit
    TrailingBytes = -6    ///< Bytes left after the value (strict mode)
};

/**
 * @brief Get error message for error code.
 * @param error Error code
 * @return Human-readable error message
 */
inline const char* error_string(Error error) noexcept {
    switch (error) {
    case Error::Ok:
        return "Success";
    case Error::OutOfBounds:
        return "Unexpected end of input";
    case Error::UnsupportedType:
        return "Unsupported MessagePack type";
    case Error::InvalidEncoding:
        return "String is not valid UTF-8";
    case Error::InvalidKey:
        return "Invalid map key";
    case Error::DepthExceeded:
        return "Maximum nesting depth exceeded";
    case Error::TrailingBytes:
        return "Trailing bytes after value";
    default:
        return "Unknown error";
    }
}

#if !MSGJSON_NO_EXCEPTIONS

/**
 * @brief Base exception for msgjson decode errors.
 */
class DecodeException : public std::runtime_error {
public:
    DecodeException(const std::string& message, Error code, std::size_t offset = 0)
        : std::runtime_error(message), error_code_(code), offset_(offset) {}

    Error code() const noexcept {
        return error_code_;
    }

    /// Input offset at which decoding stopped.
    std::size_t offset() const noexcept {
        return offset_;
    }

private:
    Error error_code_;
    std::size_t offset_;
};

/**
 * @brief Exception for reads past the end of the input.
 */
class OutOfBoundsException : public DecodeException {
public:
    explicit OutOfBoundsException(const std::string& message, std::size_t offset = 0)
        : DecodeException(message, Error::OutOfBounds, offset) {}
};

/**
 * @brief Exception for an unrecognized tag byte.
 */
class UnsupportedTypeException : public DecodeException {
public:
    UnsupportedTypeException(const std::string& message, std::uint8_t tag, std::size_t offset = 0)
        : DecodeException(message, Error::UnsupportedType, offset), tag_(tag) {}

    std::uint8_t tag() const noexcept {
        return tag_;
    }

private:
    std::uint8_t tag_;
};

/**
 * @brief Exception for malformed UTF-8 in a string payload.
 */
class InvalidEncodingException : public DecodeException {
public:
    explicit InvalidEncodingException(const std::string& message, std::size_t offset = 0)
        : DecodeException(message, Error::InvalidEncoding, offset) {}
};

/**
 * @brief Exception for a map key that decodes to null.
 */
class InvalidKeyException : public DecodeException {
public:
    explicit InvalidKeyException(const std::string& message, std::size_t offset = 0)
        : DecodeException(message, Error::InvalidKey, offset) {}
};

/**
 * @brief Exception for nesting beyond the configured depth.
 */
class DepthExceededException : public DecodeException {
public:
    explicit DepthExceededException(const std::string& message, std::size_t offset = 0)
        : DecodeException(message, Error::DepthExceeded, offset) {}
};

/**
 * @brief Exception for unconsumed input in strict mode.
 */
class TrailingBytesException : public DecodeException {
public:
    explicit TrailingBytesException(const std::string& message, std::size_t offset = 0)
        : DecodeException(message, Error::TrailingBytes, offset) {}
};

#endif // !MSGJSON_NO_EXCEPTIONS

} // namespace msgjson

#endif // MSGJSON_ERROR_HPP
