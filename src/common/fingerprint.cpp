#include "common/fingerprint.hpp"

#include "common/crc32c.hpp"

namespace semdiff {

namespace {

/// Seeds chained in front of the content so the four 32-bit lanes differ.
constexpr uint32_t LANE_SEEDS[4] = {0x00000000, 0x9E3779B9, 0x85EBCA6B, 0xC2B2AE35};

uint32_t lane(uint32_t seed, const uint8_t* bytes, size_t len) {
    uint32_t crc = crc32c_extend(0, &seed, sizeof(seed));
    crc = crc32c_extend(crc, bytes, len);
    uint64_t length = len;
    return crc32c_extend(crc, &length, sizeof(length));
}

} // namespace

std::string Fingerprint::to_hex() const {
    static constexpr char HEX[] = "0123456789abcdef";
    std::string out(32, '0');
    uint64_t vals[2] = {high, low};
    for (int v = 0; v < 2; ++v) {
        uint64_t val = vals[v];
        for (int i = 15; i >= 0; --i) {
            out[static_cast<size_t>(v * 16 + i)] = HEX[val & 0xF];
            val >>= 4;
        }
    }
    return out;
}

Fingerprint fingerprint_bytes(const void* data, size_t len) {
    if (!data || len == 0) {
        return {};
    }
    const auto* bytes = static_cast<const uint8_t*>(data);
    uint64_t hi = (static_cast<uint64_t>(lane(LANE_SEEDS[0], bytes, len)) << 32) |
                  lane(LANE_SEEDS[1], bytes, len);
    uint64_t lo = (static_cast<uint64_t>(lane(LANE_SEEDS[2], bytes, len)) << 32) |
                  lane(LANE_SEEDS[3], bytes, len);
    if (hi == 0 && lo == 0) {
        lo = 1; // zero is reserved for "no body"
    }
    return {hi, lo};
}

Fingerprint fingerprint_string(std::string_view str) {
    return fingerprint_bytes(str.data(), str.size());
}

} // namespace semdiff
