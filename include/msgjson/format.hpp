/**
 * @file format.hpp
 * @brief MessagePack format table.
 *
 * Maps every tag byte to the family it belongs to and to the size of the
 * header or payload that follows it. The decoder dispatches on this table
 * and nothing else, so this file is the one place the format is described.
 *
 * Supported families (ext, fixext and timestamp are not):
 * | tag            | family           | follows                        |
 * |----------------|------------------|--------------------------------|
 * | 0x00 - 0x7f    | positive fixint  | -                              |
 * | 0x80 - 0x8f    | fixmap           | count in low nibble            |
 * | 0x90 - 0x9f    | fixarray         | count in low nibble            |
 * | 0xa0 - 0xbf    | fixstr           | length in low 5 bits           |
 * | 0xc0           | nil              | -                              |
 * | 0xc2 / 0xc3    | false / true     | -                              |
 * | 0xc4 - 0xc6    | bin 8/16/32      | 1/2/4-byte length              |
 * | 0xca / 0xcb    | float 32/64      | 4/8-byte IEEE-754 payload      |
 * | 0xcc - 0xcf    | uint 8/16/32/64  | 1/2/4/8-byte payload           |
 * | 0xd0 - 0xd3    | int 8/16/32/64   | 1/2/4/8-byte payload           |
 * | 0xd9 - 0xdb    | str 8/16/32      | 1/2/4-byte length              |
 * | 0xdc / 0xdd    | array 16/32      | 2/4-byte count                 |
 * | 0xde / 0xdf    | map 16/32        | 2/4-byte count                 |
 * | 0xe0 - 0xff    | negative fixint  | -                              |
 *
 * @see https://github.com/msgpack/msgpack/blob/master/spec.md#formats
 */

#ifndef MSGJSON_FORMAT_HPP
#define MSGJSON_FORMAT_HPP

#include "config.hpp"

namespace msgjson {

namespace tag {
inline constexpr std::uint8_t POSITIVE_FIXINT_MAX = 0x7f;
inline constexpr std::uint8_t FIXMAP = 0x80;
inline constexpr std::uint8_t FIXARRAY = 0x90;
inline constexpr std::uint8_t FIXSTR = 0xa0;
inline constexpr std::uint8_t NIL = 0xc0;
inline constexpr std::uint8_t NEVER_USED = 0xc1;
inline constexpr std::uint8_t BOOL_FALSE = 0xc2;
inline constexpr std::uint8_t BOOL_TRUE = 0xc3;
inline constexpr std::uint8_t BIN8 = 0xc4;
inline constexpr std::uint8_t BIN16 = 0xc5;
inline constexpr std::uint8_t BIN32 = 0xc6;
inline constexpr std::uint8_t EXT8 = 0xc7;
inline constexpr std::uint8_t EXT16 = 0xc8;
inline constexpr std::uint8_t EXT32 = 0xc9;
inline constexpr std::uint8_t FLOAT32 = 0xca;
inline constexpr std::uint8_t FLOAT64 = 0xcb;
inline constexpr std::uint8_t UINT8 = 0xcc;
inline constexpr std::uint8_t UINT16 = 0xcd;
inline constexpr std::uint8_t UINT32 = 0xce;
inline constexpr std::uint8_t UINT64 = 0xcf;
inline constexpr std::uint8_t INT8 = 0xd0;
inline constexpr std::uint8_t INT16 = 0xd1;
inline constexpr std::uint8_t INT32 = 0xd2;
inline constexpr std::uint8_t INT64 = 0xd3;
inline constexpr std::uint8_t FIXEXT1 = 0xd4;
inline constexpr std::uint8_t FIXEXT16 = 0xd8;
inline constexpr std::uint8_t STR8 = 0xd9;
inline constexpr std::uint8_t STR16 = 0xda;
inline constexpr std::uint8_t STR32 = 0xdb;
inline constexpr std::uint8_t ARRAY16 = 0xdc;
inline constexpr std::uint8_t ARRAY32 = 0xdd;
inline constexpr std::uint8_t MAP16 = 0xde;
inline constexpr std::uint8_t MAP32 = 0xdf;
inline constexpr std::uint8_t NEGATIVE_FIXINT_MIN = 0xe0;
} // namespace tag

/**
 * @brief Value family a tag byte belongs to.
 */
enum class Kind : std::uint8_t {
    PositiveFixint,
    NegativeFixint,
    Nil,
    False,
    True,
    Uint,
    Int,
    Float32,
    Float64,
    String,
    Binary,
    Array,
    Map,
    Unsupported
};

/**
 * @brief Classification of one tag byte.
 *
 * For Uint, Int, Float32 and Float64, @c width is the payload size.
 * For String, Binary, Array and Map, @c width is the size of the length or
 * count header; a width of 0 means the fix-form, with the length or count
 * held in @c inline_count.
 */
struct TagInfo {
    Kind kind;
    std::uint8_t width;
    std::uint8_t inline_count;
};

/**
 * @brief Classify a tag byte.
 *
 * @param t Tag byte
 * @return Family, header/payload width and inline count
 */
constexpr TagInfo classify(std::uint8_t t) noexcept {
    if (t <= tag::POSITIVE_FIXINT_MAX) {
        return {Kind::PositiveFixint, 0, 0};
    }
    if (t >= tag::NEGATIVE_FIXINT_MIN) {
        return {Kind::NegativeFixint, 0, 0};
    }
    if (t < tag::FIXARRAY) {
        return {Kind::Map, 0, static_cast<std::uint8_t>(t & 0x0fU)};
    }
    if (t < tag::FIXSTR) {
        return {Kind::Array, 0, static_cast<std::uint8_t>(t & 0x0fU)};
    }
    if (t < tag::NIL) {
        return {Kind::String, 0, static_cast<std::uint8_t>(t - tag::FIXSTR)};
    }

    switch (t) {
    case tag::NIL:
        return {Kind::Nil, 0, 0};
    case tag::BOOL_FALSE:
        return {Kind::False, 0, 0};
    case tag::BOOL_TRUE:
        return {Kind::True, 0, 0};
    case tag::BIN8:
        return {Kind::Binary, 1, 0};
    case tag::BIN16:
        return {Kind::Binary, 2, 0};
    case tag::BIN32:
        return {Kind::Binary, 4, 0};
    case tag::FLOAT32:
        return {Kind::Float32, 4, 0};
    case tag::FLOAT64:
        return {Kind::Float64, 8, 0};
    case tag::UINT8:
        return {Kind::Uint, 1, 0};
    case tag::UINT16:
        return {Kind::Uint, 2, 0};
    case tag::UINT32:
        return {Kind::Uint, 4, 0};
    case tag::UINT64:
        return {Kind::Uint, 8, 0};
    case tag::INT8:
        return {Kind::Int, 1, 0};
    case tag::INT16:
        return {Kind::Int, 2, 0};
    case tag::INT32:
        return {Kind::Int, 4, 0};
    case tag::INT64:
        return {Kind::Int, 8, 0};
    case tag::STR8:
        return {Kind::String, 1, 0};
    case tag::STR16:
        return {Kind::String, 2, 0};
    case tag::STR32:
        return {Kind::String, 4, 0};
    case tag::ARRAY16:
        return {Kind::Array, 2, 0};
    case tag::ARRAY32:
        return {Kind::Array, 4, 0};
    case tag::MAP16:
        return {Kind::Map, 2, 0};
    case tag::MAP32:
        return {Kind::Map, 4, 0};
    default:
        // 0xc1, ext 8/16/32 and fixext 1..16
        return {Kind::Unsupported, 0, 0};
    }
}

} // namespace msgjson

#endif // MSGJSON_FORMAT_HPP
