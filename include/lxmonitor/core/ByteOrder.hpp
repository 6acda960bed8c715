#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace lxmonitor::core {

// Callers bounds-check before reading; these never look past data[n-1].

inline std::uint16_t readUInt16Le(const std::uint8_t* data) {
    return static_cast<std::uint16_t>(data[0])
         | static_cast<std::uint16_t>(data[1]) << 8;
}

inline std::uint16_t readUInt16Be(const std::uint8_t* data) {
    return static_cast<std::uint16_t>(data[0]) << 8
         | static_cast<std::uint16_t>(data[1]);
}

inline std::uint32_t readUInt32Be(const std::uint8_t* data) {
    return (static_cast<std::uint32_t>(data[0]) << 24)
         | (static_cast<std::uint32_t>(data[1]) << 16)
         | (static_cast<std::uint32_t>(data[2]) << 8)
         |  static_cast<std::uint32_t>(data[3]);
}

/**
 * @brief Read a fixed-width, NUL-padded text field.
 *
 * Stops at the first NUL (or the end of the field) and decodes the bytes as
 * UTF-8; malformed sequences are replaced by U+FFFD instead of failing, since
 * node names come from arbitrary firmware.
 */
std::string readFixedString(const std::uint8_t* data, std::size_t width);

/// Lossy UTF-8 cleanup of an arbitrary byte run.
std::string decodeUtf8Lossy(const std::uint8_t* data, std::size_t size);

} // namespace lxmonitor::core
