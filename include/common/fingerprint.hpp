//! # Fingerprints
//!
//! 128-bit fingerprints of canonical text. Entity bodies are reduced to a
//! canonical structural serialization and fingerprinted, so the differ can
//! classify a body as unchanged without keeping or comparing the text.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace semdiff {

/// 128-bit content fingerprint.
struct Fingerprint {
    uint64_t high = 0;
    uint64_t low = 0;

    bool operator==(const Fingerprint& other) const = default;

    /// True for the fingerprint of "no content" (a body-less declaration).
    [[nodiscard]] bool is_zero() const {
        return high == 0 && low == 0;
    }

    /// Returns a 32-character lower-case hex string.
    [[nodiscard]] std::string to_hex() const;
};

/// Computes a fingerprint from raw bytes. Empty input yields the zero fingerprint.
[[nodiscard]] Fingerprint fingerprint_bytes(const void* data, size_t len);

/// Computes a fingerprint from a string.
[[nodiscard]] Fingerprint fingerprint_string(std::string_view str);

} // namespace semdiff
