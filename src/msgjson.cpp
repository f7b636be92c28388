/**
 * @file msgjson.cpp
 * @brief Throwing decode API.
 */

#include <msgjson/msgjson.hpp>

#include <cstdio>

namespace msgjson {

#if !MSGJSON_NO_EXCEPTIONS

void throw_decode_error(Error error, const Decoder& decoder) {
    const std::size_t offset = decoder.error_offset();
    std::string message = error_string(error);

    if (error == Error::UnsupportedType) {
        char tag_text[8];
        std::snprintf(tag_text, sizeof(tag_text), "0x%02x", decoder.error_tag());
        message += " ";
        message += tag_text;
    }
    message += " at offset " + std::to_string(offset);

    switch (error) {
    case Error::OutOfBounds:
        throw OutOfBoundsException(message, offset);
    case Error::UnsupportedType:
        throw UnsupportedTypeException(message, decoder.error_tag(), offset);
    case Error::InvalidEncoding:
        throw InvalidEncodingException(message, offset);
    case Error::InvalidKey:
        throw InvalidKeyException(message, offset);
    case Error::DepthExceeded:
        throw DepthExceededException(message, offset);
    case Error::TrailingBytes:
        throw TrailingBytesException(message, offset);
    default:
        throw DecodeException(message, error, offset);
    }
}

std::string to_json(const std::uint8_t* data, std::size_t size, const Options& options) {
    Decoder decoder(options);
    std::string out;

    Error result = decoder.decode(data, size, out);
    if (result != Error::Ok) {
        throw_decode_error(result, decoder);
    }

    return out;
}

#endif // !MSGJSON_NO_EXCEPTIONS

} // namespace msgjson
