/**
 * @file binary.cpp
 * @brief Base64 and hex rendering of binary payloads.
 */

#include <msgjson/binary.hpp>

namespace msgjson {

namespace {

constexpr char BASE64_TABLE[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
                                "abcdefghijklmnopqrstuvwxyz"
                                "0123456789+/";

constexpr char HEX_DIGITS[] = "0123456789abcdef";

} // namespace

void append_base64(std::string& out, const std::uint8_t* data, std::size_t length) {
    out.reserve(out.size() + ((length + 2) / 3) * 4);

    // Three input bytes become four output characters
    std::size_t i = 0;
    for (; i + 3 <= length; i += 3) {
        std::uint32_t bits = (static_cast<std::uint32_t>(data[i]) << 16) |
                             (static_cast<std::uint32_t>(data[i + 1]) << 8) | data[i + 2];
        out.push_back(BASE64_TABLE[bits >> 18]);
        out.push_back(BASE64_TABLE[(bits >> 12) & 0x3fU]);
        out.push_back(BASE64_TABLE[(bits >> 6) & 0x3fU]);
        out.push_back(BASE64_TABLE[bits & 0x3fU]);
    }

    std::size_t tail = length - i;
    if (tail == 2) {
        std::uint32_t bits = (static_cast<std::uint32_t>(data[i]) << 16) |
                             (static_cast<std::uint32_t>(data[i + 1]) << 8);
        out.push_back(BASE64_TABLE[bits >> 18]);
        out.push_back(BASE64_TABLE[(bits >> 12) & 0x3fU]);
        out.push_back(BASE64_TABLE[(bits >> 6) & 0x3fU]);
        out.push_back('=');
    } else if (tail == 1) {
        std::uint32_t bits = static_cast<std::uint32_t>(data[i]) << 16;
        out.push_back(BASE64_TABLE[bits >> 18]);
        out.push_back(BASE64_TABLE[(bits >> 12) & 0x3fU]);
        out.append("==");
    }
}

void append_hex(std::string& out, const std::uint8_t* data, std::size_t length) {
    out.reserve(out.size() + length * 2);
    for (std::size_t i = 0; i < length; ++i) {
        out.push_back(HEX_DIGITS[data[i] >> 4]);
        out.push_back(HEX_DIGITS[data[i] & 0x0fU]);
    }
}

void append_binary(std::string& out, const std::uint8_t* data, std::size_t length,
                   BinaryEncoding encoding) {
    out.push_back('"');
    if (encoding == BinaryEncoding::Hex) {
        append_hex(out, data, length);
    } else {
        append_base64(out, data, length);
    }
    out.push_back('"');
}

} // namespace msgjson
