//! # CRC32C Hash Utility
//!
//! CRC32C (Castagnoli polynomial) used as the building block of entity
//! fingerprints. The lookup table is generated at compile time from the
//! reflected polynomial.

#ifndef SEMDIFF_COMMON_CRC32C_HPP
#define SEMDIFF_COMMON_CRC32C_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace semdiff {

// ============================================================================
// CRC32C Lookup Table
// ============================================================================

/// Reflected form of the Castagnoli polynomial 0x1EDC6F41.
inline constexpr uint32_t CRC32C_POLY_REFLECTED = 0x82F63B78;

[[nodiscard]] constexpr auto make_crc32c_table() -> std::array<uint32_t, 256> {
    std::array<uint32_t, 256> table{};
    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t crc = i;
        for (int bit = 0; bit < 8; ++bit) {
            crc = (crc & 1) ? (crc >> 1) ^ CRC32C_POLY_REFLECTED : crc >> 1;
        }
        table[i] = crc;
    }
    return table;
}

inline constexpr std::array<uint32_t, 256> CRC32C_TABLE = make_crc32c_table();

// ============================================================================
// CRC32C Functions
// ============================================================================

/// Continues a CRC32C computation from a previous value.
///
/// `crc32c_extend(crc32c(a), b)` equals `crc32c(a + b)`.
[[nodiscard]] inline uint32_t crc32c_extend(uint32_t previous, const void* data,
                                            size_t len) noexcept {
    const auto* bytes = static_cast<const uint8_t*>(data);
    uint32_t crc = previous ^ 0xFFFFFFFF;
    for (size_t i = 0; i < len; ++i) {
        crc = CRC32C_TABLE[(crc ^ bytes[i]) & 0xFF] ^ (crc >> 8);
    }
    return crc ^ 0xFFFFFFFF;
}

/// Computes the CRC32C of a byte array.
[[nodiscard]] inline uint32_t crc32c(const void* data, size_t len) noexcept {
    return crc32c_extend(0, data, len);
}

[[nodiscard]] inline uint32_t crc32c(std::string_view str) noexcept {
    return crc32c(str.data(), str.size());
}

} // namespace semdiff

#endif // SEMDIFF_COMMON_CRC32C_HPP
