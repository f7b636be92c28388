/**
 * @file bytecursor.hpp
 * @brief Sequential, bounds-checked byte reading from MessagePack data.
 *
 * The byte cursor provides forward-only access to an immutable input
 * buffer. Multi-byte quantities are read big-endian, one byte at a time.
 */

#ifndef MSGJSON_BYTECURSOR_HPP
#define MSGJSON_BYTECURSOR_HPP

#include "config.hpp"
#include "error.hpp"

namespace msgjson {

/**
 * @brief Forward-only reader over a caller-owned byte buffer.
 *
 * The cursor never owns or copies the buffer. A failed read leaves the
 * position unchanged.
 */
class ByteCursor {
public:
    /**
     * @brief Construct a byte cursor.
     *
     * @param data Pointer to source data buffer (may be null if size is 0)
     * @param size Number of valid bytes in buffer
     */
    ByteCursor(const std::uint8_t* data, std::size_t size) noexcept
        : data_(data), size_(size), pos_(0) {}

    /**
     * @brief Read a single tag byte.
     *
     * @param[out] tag Byte read
     * @return Error::Ok, or Error::OutOfBounds if no bytes remain
     */
    inline Error read_tag(std::uint8_t& tag) noexcept {
        if (pos_ >= size_) [[unlikely]] {
            return Error::OutOfBounds;
        }
        tag = data_[pos_++];
        return Error::Ok;
    }

    /**
     * @brief Read a big-endian unsigned integer.
     *
     * @param width Number of bytes (1, 2, 4 or 8)
     * @param[out] value Assembled value
     * @return Error::Ok, or Error::OutOfBounds if fewer than width bytes remain
     */
    Error read_be_uint(std::size_t width, std::uint64_t& value) noexcept {
        if (width == 0 || width > MAX_UINT_WIDTH) [[unlikely]] {
            return Error::OutOfBounds;
        }
        if (width > remaining()) [[unlikely]] {
            return Error::OutOfBounds;
        }

        std::uint64_t result = 0;
        for (std::size_t i = 0; i < width; ++i) {
            result = (result << 8) | data_[pos_ + i];
        }
        pos_ += width;
        value = result;
        return Error::Ok;
    }

    /**
     * @brief Borrow a run of raw bytes.
     *
     * @param length Number of bytes to take (0 is allowed)
     * @param[out] bytes Pointer to the first byte, valid while the buffer lives
     * @return Error::Ok, or Error::OutOfBounds if fewer than length bytes remain
     */
    Error read_raw(std::size_t length, const std::uint8_t*& bytes) noexcept {
        if (length > remaining()) [[unlikely]] {
            return Error::OutOfBounds;
        }
        bytes = data_ + pos_;
        pos_ += length;
        return Error::Ok;
    }

    /**
     * @brief Get current byte position.
     *
     * @return Number of bytes already consumed
     */
    [[nodiscard]] std::size_t position() const noexcept {
        return pos_;
    }

    /**
     * @brief Get remaining bytes.
     */
    [[nodiscard]] std::size_t remaining() const noexcept {
        return size_ - pos_;
    }

    [[nodiscard]] std::size_t size() const noexcept {
        return size_;
    }

private:
    const std::uint8_t* data_;
    std::size_t size_;
    std::size_t pos_;
};

} // namespace msgjson

#endif // MSGJSON_BYTECURSOR_HPP
