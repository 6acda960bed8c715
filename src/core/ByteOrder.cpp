#include "lxmonitor/core/ByteOrder.hpp"

#include <cstring>

namespace lxmonitor::core {
namespace {

constexpr char REPLACEMENT_CHARACTER[] = "\xEF\xBF\xBD";

bool isContinuation(std::uint8_t byte) {
    return (byte & 0xC0u) == 0x80u;
}

struct Utf8Scan {
    std::size_t length; // bytes consumed, never 0
    bool valid;
};

// Scan one sequence at data[0]. An ill-formed sequence consumes its maximal
// subpart: the longest prefix that could still have begun a valid sequence,
// or just the lead byte when even that is impossible.
Utf8Scan scanSequence(const std::uint8_t* data, std::size_t remaining) {
    const std::uint8_t lead = data[0];
    if (lead < 0x80u) return {1, true};

    std::size_t length = 0;
    std::uint8_t lowerBound = 0x80u;
    std::uint8_t upperBound = 0xBFu;

    if (lead >= 0xC2u && lead <= 0xDFu) {
        length = 2;
    } else if (lead >= 0xE0u && lead <= 0xEFu) {
        length = 3;
        if (lead == 0xE0u) lowerBound = 0xA0u;
        if (lead == 0xEDu) upperBound = 0x9Fu; // no UTF-16 surrogates
    } else if (lead >= 0xF0u && lead <= 0xF4u) {
        length = 4;
        if (lead == 0xF0u) lowerBound = 0x90u;
        if (lead == 0xF4u) upperBound = 0x8Fu;
    } else {
        return {1, false};
    }

    if (remaining < 2 || data[1] < lowerBound || data[1] > upperBound) {
        return {1, false};
    }
    std::size_t consumed = 2;
    while (consumed < length && consumed < remaining && isContinuation(data[consumed])) {
        ++consumed;
    }
    return {consumed, consumed == length};
}

} // namespace

std::string decodeUtf8Lossy(const std::uint8_t* data, std::size_t size) {
    std::string out;
    if (!data || size == 0) return out;
    out.reserve(size);

    std::size_t i = 0;
    while (i < size) {
        const Utf8Scan scan = scanSequence(data + i, size - i);
        if (scan.valid) {
            out.append(reinterpret_cast<const char*>(data + i), scan.length);
        } else {
            out.append(REPLACEMENT_CHARACTER);
        }
        i += scan.length;
    }
    return out;
}

std::string readFixedString(const std::uint8_t* data, std::size_t width) {
    if (!data || width == 0) return {};
    const void* nul = std::memchr(data, 0, width);
    const std::size_t length = nul
        ? static_cast<std::size_t>(static_cast<const std::uint8_t*>(nul) - data)
        : width;
    return decodeUtf8Lossy(data, length);
}

} // namespace lxmonitor::core
