#include "lxmonitor/core/ByteBuffer.hpp"

namespace lxmonitor::core {

ByteBuffer::ByteBuffer(std::size_t reserveBytes) {
    buffer.reserve(reserveBytes);
}

void ByteBuffer::clear() {
    buffer.clear();
}

void ByteBuffer::appendUInt8(std::uint8_t value) {
    buffer.push_back(value);
}

void ByteBuffer::appendUInt16Le(std::uint16_t value) {
    buffer.push_back(static_cast<std::uint8_t>(value & 0xFFu));
    buffer.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFu));
}

void ByteBuffer::appendUInt16Be(std::uint16_t value) {
    buffer.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFu));
    buffer.push_back(static_cast<std::uint8_t>(value & 0xFFu));
}

void ByteBuffer::appendUInt32Be(std::uint32_t value) {
    buffer.push_back(static_cast<std::uint8_t>((value >> 24) & 0xFFu));
    buffer.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFFu));
    buffer.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFu));
    buffer.push_back(static_cast<std::uint8_t>(value & 0xFFu));
}

void ByteBuffer::appendBytes(const std::uint8_t* data, std::size_t size) {
    if (!data || size == 0) return;
    buffer.insert(buffer.end(), data, data + size);
}

void ByteBuffer::appendLiteral(std::string_view text) {
    for (char c : text) {
        buffer.push_back(static_cast<std::uint8_t>(c));
    }
}

void ByteBuffer::appendZeros(std::size_t count) {
    buffer.insert(buffer.end(), count, 0);
}

} // namespace lxmonitor::core
