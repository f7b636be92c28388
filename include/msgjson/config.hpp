/**
 * @file config.hpp
 * @brief msgjson compile-time configuration.
 *
 * MessagePack to JavaScript-safe JSON text conversion.
 *
 * @see https://github.com/msgpack/msgpack/blob/master/spec.md MessagePack specification
 */

#ifndef MSGJSON_CONFIG_HPP
#define MSGJSON_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace msgjson {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// Default maximum container nesting depth
#ifndef MSGJSON_MAX_DEPTH
#define MSGJSON_MAX_DEPTH 512U
#endif

inline constexpr std::size_t MAX_DEPTH = MSGJSON_MAX_DEPTH;

/// Widths accepted by ByteCursor::read_be_uint()
inline constexpr std::size_t MAX_UINT_WIDTH = 8U;

/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define MSGJSON_NO_EXCEPTIONS=1 to disable the throwing API.
 * @{
 */
#ifndef MSGJSON_NO_EXCEPTIONS
#define MSGJSON_NO_EXCEPTIONS 0
#endif
/** @} */

} // namespace msgjson

#endif // MSGJSON_CONFIG_HPP
