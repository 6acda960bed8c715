#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <utility>
#include <vector>

namespace lxmonitor::core {

/**
 * @brief Append-only packet builder.
 *
 * Art-Net mixes byte orders inside a single header (opcode little-endian,
 * protocol version big-endian) so both flavours are explicit in the name.
 */
class ByteBuffer {
public:
    explicit ByteBuffer(std::size_t reserveBytes = 64);

    void clear();
    void appendUInt8(std::uint8_t value);
    void appendUInt16Le(std::uint16_t value);
    void appendUInt16Be(std::uint16_t value);
    void appendUInt32Be(std::uint32_t value);
    void appendBytes(const std::uint8_t* data, std::size_t size);
    void appendLiteral(std::string_view text);
    void appendZeros(std::size_t count);

    const std::uint8_t* data() const { return buffer.data(); }
    std::size_t size() const { return buffer.size(); }

    std::vector<std::uint8_t> release() { return std::move(buffer); }
    const std::vector<std::uint8_t>& bytes() const { return buffer; }

private:
    std::vector<std::uint8_t> buffer;
};

} // namespace lxmonitor::core
