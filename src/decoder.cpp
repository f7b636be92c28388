/**
 * @file decoder.cpp
 * @brief Tag dispatch and container decoding.
 */

#include <msgjson/decoder.hpp>
#include <msgjson/escaper.hpp>
#include <msgjson/numeric.hpp>

#include <bit>

namespace msgjson {

namespace {

// Reinterpret the low `width` bytes of raw as a two's-complement integer.
inline std::int64_t to_signed(std::uint64_t raw, std::size_t width) noexcept {
    switch (width) {
    case 1:
        return static_cast<std::int8_t>(static_cast<std::uint8_t>(raw));
    case 2:
        return static_cast<std::int16_t>(static_cast<std::uint16_t>(raw));
    case 4:
        return static_cast<std::int32_t>(static_cast<std::uint32_t>(raw));
    default:
        return static_cast<std::int64_t>(raw);
    }
}

} // namespace

Error Decoder::decode(const std::uint8_t* data, std::size_t size, std::string& out) {
    error_tag_ = 0;
    error_offset_ = 0;
    consumed_ = 0;
    out.clear();

    ByteCursor cursor(data, size);
    Error status = decode_value(cursor, 0, out);

    if (status == Error::Ok && !options_.allow_trailing_bytes && cursor.remaining() > 0) {
        status = fail(Error::TrailingBytes, cursor.position());
    }

    if (status != Error::Ok) {
        out.clear();
        return status;
    }

    consumed_ = cursor.position();
    return Error::Ok;
}

Error Decoder::decode_value(ByteCursor& cursor, std::size_t depth, std::string& out) {
    const std::size_t start = cursor.position();

    std::uint8_t t = 0;
    if (cursor.read_tag(t) != Error::Ok) {
        return fail(Error::OutOfBounds, start);
    }

    const TagInfo info = classify(t);

    switch (info.kind) {
    case Kind::PositiveFixint:
        append_uint(out, t);
        return Error::Ok;

    case Kind::NegativeFixint:
        append_int(out, static_cast<std::int64_t>(t) - 256);
        return Error::Ok;

    case Kind::Nil:
        out.append("null");
        return Error::Ok;

    case Kind::False:
        out.append("false");
        return Error::Ok;

    case Kind::True:
        out.append("true");
        return Error::Ok;

    case Kind::Uint:
    case Kind::Int:
    case Kind::Float32:
    case Kind::Float64: {
        std::uint64_t raw = 0;
        if (cursor.read_be_uint(info.width, raw) != Error::Ok) {
            return fail(Error::OutOfBounds, start);
        }

        if (info.kind == Kind::Uint) {
            append_uint(out, raw);
        } else if (info.kind == Kind::Int) {
            append_int(out, to_signed(raw, info.width));
        } else if (info.kind == Kind::Float32) {
            append_float(out, std::bit_cast<float>(static_cast<std::uint32_t>(raw)));
        } else {
            append_double(out, std::bit_cast<double>(raw));
        }
        return Error::Ok;
    }

    case Kind::String:
    case Kind::Binary:
    case Kind::Array:
    case Kind::Map: {
        // Fix-forms carry the length in the tag, the rest in a header
        std::uint64_t length = info.inline_count;
        if (info.width != 0 && cursor.read_be_uint(info.width, length) != Error::Ok) {
            return fail(Error::OutOfBounds, start);
        }

        if (info.kind == Kind::Array || info.kind == Kind::Map) {
            if (depth >= options_.max_depth) {
                return fail(Error::DepthExceeded, start);
            }
            return info.kind == Kind::Array ? decode_array(cursor, length, depth + 1, out)
                                            : decode_map(cursor, length, depth + 1, out);
        }

        if (length > cursor.remaining()) {
            return fail(Error::OutOfBounds, start);
        }
        const std::uint8_t* bytes = nullptr;
        if (cursor.read_raw(static_cast<std::size_t>(length), bytes) != Error::Ok) {
            return fail(Error::OutOfBounds, start);
        }

        if (info.kind == Kind::Binary) {
            append_binary(out, bytes, static_cast<std::size_t>(length), options_.binary_encoding);
            return Error::Ok;
        }

        Error status =
            append_escaped(bytes, static_cast<std::size_t>(length), out, options_.escape_slashes);
        if (status != Error::Ok) {
            return fail(status, start);
        }
        return Error::Ok;
    }

    case Kind::Unsupported:
    default:
        error_tag_ = t;
        return fail(Error::UnsupportedType, start);
    }
}

Error Decoder::decode_array(ByteCursor& cursor, std::uint64_t count, std::size_t depth,
                            std::string& out) {
    out.push_back('[');
    for (std::uint64_t i = 0; i < count; ++i) {
        if (i != 0) {
            out.push_back(',');
        }
        Error status = decode_value(cursor, depth, out);
        if (status != Error::Ok) {
            return status;
        }
    }
    out.push_back(']');

    return Error::Ok;
}

Error Decoder::decode_map(ByteCursor& cursor, std::uint64_t count, std::size_t depth,
                          std::string& out) {
    out.push_back('{');
    for (std::uint64_t i = 0; i < count; ++i) {
        if (i != 0) {
            out.push_back(',');
        }

        Error status = decode_key(cursor, depth, out);
        if (status != Error::Ok) {
            return status;
        }

        out.push_back(':');

        status = decode_value(cursor, depth, out);
        if (status != Error::Ok) {
            return status;
        }
    }
    out.push_back('}');

    return Error::Ok;
}

Error Decoder::decode_key(ByteCursor& cursor, std::size_t depth, std::string& out) {
    const std::size_t key_offset = cursor.position();
    const std::size_t key_start = out.size();

    Error status = decode_value(cursor, depth, out);
    if (status != Error::Ok) {
        return status;
    }

    // nil, and floats without a JSON form, render as null
    if (out.compare(key_start, std::string::npos, "null") == 0) {
        return fail(Error::InvalidKey, key_offset);
    }

    if (options_.quote_non_string_keys && out[key_start] != '"') {
        std::string key = out.substr(key_start);
        out.resize(key_start);
        status = append_escaped(reinterpret_cast<const std::uint8_t*>(key.data()), key.size(), out,
                                options_.escape_slashes);
        if (status != Error::Ok) {
            return fail(status, key_offset);
        }
    }

    return Error::Ok;
}

} // namespace msgjson
