#include "common/utils/id.h"
#include <array>
#include <cstdint>
#include <random>

namespace agentgraph {

std::string generate_uuid() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dist;

    std::array<uint8_t, 16> bytes{};
    uint64_t hi = dist(engine);
    uint64_t lo = dist(engine);
    for (int i = 0; i < 8; ++i) {
        bytes[i] = static_cast<uint8_t>(hi >> (8 * i));
        bytes[8 + i] = static_cast<uint8_t>(lo >> (8 * i));
    }
    bytes[6] = static_cast<uint8_t>((bytes[6] & 0x0F) | 0x40); // version 4
    bytes[8] = static_cast<uint8_t>((bytes[8] & 0x3F) | 0x80); // variant 10

    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(36);
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            out.push_back('-');
        }
        out.push_back(kHex[bytes[i] >> 4]);
        out.push_back(kHex[bytes[i] & 0x0F]);
    }
    return out;
}

} // namespace agentgraph
