/**
 * @file numeric.cpp
 * @brief Integer and floating-point rendering.
 */

#include <msgjson/numeric.hpp>

#include <charconv>
#include <cmath>

namespace msgjson {

namespace {

// Largest shortest-form output: "-2.2250738585072014e-308" (24 chars)
constexpr std::size_t NUMBER_BUFFER_SIZE = 32;

template <typename T> void append_chars(std::string& out, T value) {
    char buffer[NUMBER_BUFFER_SIZE];
    auto result = std::to_chars(buffer, buffer + sizeof(buffer), value);
    out.append(buffer, result.ptr);
}

template <typename T> void append_floating(std::string& out, T value) {
    if (!std::isfinite(value)) {
        out.append("null");
        return;
    }
    append_chars(out, value);
}

} // namespace

void append_uint(std::string& out, std::uint64_t value) {
    append_chars(out, value);
}

void append_int(std::string& out, std::int64_t value) {
    append_chars(out, value);
}

void append_float(std::string& out, float value) {
    append_floating(out, value);
}

void append_double(std::string& out, double value) {
    append_floating(out, value);
}

} // namespace msgjson
