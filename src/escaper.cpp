/**
 * @file escaper.cpp
 * @brief UTF-8 validation and JSON/JavaScript string escaping.
 */

#include <msgjson/escaper.hpp>

namespace msgjson {

namespace {

constexpr char HEX_DIGITS[] = "0123456789abcdef";

// Single-character escape for c, or 0 if c needs \u00XX or no escape.
inline char short_escape(std::uint8_t c) noexcept {
    switch (c) {
    case 0x08:
        return 'b';
    case 0x09:
        return 't';
    case 0x0a:
        return 'n';
    case 0x0c:
        return 'f';
    case 0x0d:
        return 'r';
    case 0x22:
        return '"';
    case 0x5c:
        return '\\';
    default:
        return 0;
    }
}

inline bool is_continuation(std::uint8_t c) noexcept {
    return (c & 0xc0U) == 0x80U;
}

} // namespace

bool is_valid_utf8(const std::uint8_t* data, std::size_t length) noexcept {
    std::size_t i = 0;

    while (i < length) {
        std::uint8_t lead = data[i];

        if (lead < 0x80U) [[likely]] {
            ++i;
            continue;
        }

        // Sequence length and the allowed range of the second byte
        // (Unicode Table 3-7, well-formed byte sequences).
        std::size_t seq_len;
        std::uint8_t lo = 0x80U;
        std::uint8_t hi = 0xbfU;

        if (lead >= 0xc2U && lead <= 0xdfU) {
            seq_len = 2;
        } else if (lead == 0xe0U) {
            seq_len = 3;
            lo = 0xa0U;
        } else if (lead == 0xedU) {
            seq_len = 3;
            hi = 0x9fU;
        } else if (lead >= 0xe1U && lead <= 0xefU) {
            seq_len = 3;
        } else if (lead == 0xf0U) {
            seq_len = 4;
            lo = 0x90U;
        } else if (lead == 0xf4U) {
            seq_len = 4;
            hi = 0x8fU;
        } else if (lead >= 0xf1U && lead <= 0xf3U) {
            seq_len = 4;
        } else {
            // 0x80..0xc1 (stray continuation, overlong 2-byte) or 0xf5..0xff
            return false;
        }

        if (length - i < seq_len) {
            return false;
        }

        std::uint8_t second = data[i + 1];
        if (second < lo || second > hi) {
            return false;
        }
        for (std::size_t k = 2; k < seq_len; ++k) {
            if (!is_continuation(data[i + k])) {
                return false;
            }
        }

        i += seq_len;
    }

    return true;
}

Error append_escaped(const std::uint8_t* data, std::size_t length, std::string& out,
                     bool escape_slashes) {
    if (!is_valid_utf8(data, length)) {
        return Error::InvalidEncoding;
    }

    out.reserve(out.size() + length + 2);
    out.push_back('"');

    std::size_t i = 0;
    while (i < length) {
        std::uint8_t c = data[i];

        if (c >= 0x20U && c != 0x22U && c != 0x5cU && c != 0x2fU && c != 0xe2U) [[likely]] {
            out.push_back(static_cast<char>(c));
            ++i;
            continue;
        }

        if (c == 0xe2U) {
            // U+2028 = E2 80 A8, U+2029 = E2 80 A9; input is already validated
            // so a lead byte 0xe2 is always followed by two continuation bytes.
            if (data[i + 1] == 0x80U && (data[i + 2] == 0xa8U || data[i + 2] == 0xa9U)) {
                out.append(data[i + 2] == 0xa8U ? "\\u2028" : "\\u2029");
            } else {
                out.append(reinterpret_cast<const char*>(data + i), 3);
            }
            i += 3;
            continue;
        }

        if (c == 0x2fU) {
            if (escape_slashes) {
                out.push_back('\\');
            }
            out.push_back('/');
            ++i;
            continue;
        }

        char esc = short_escape(c);
        if (esc != 0) {
            out.push_back('\\');
            out.push_back(esc);
        } else {
            // Remaining control characters
            out.append("\\u00");
            out.push_back(HEX_DIGITS[c >> 4]);
            out.push_back(HEX_DIGITS[c & 0x0fU]);
        }
        ++i;
    }

    out.push_back('"');
    return Error::Ok;
}

} // namespace msgjson
