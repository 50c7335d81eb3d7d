#pragma once

#include <span>

#include <cstdint>
#include <cstring>

namespace darian::detail {

// ============================================================================
// Big-endian (network order) field access for the state codec
// ============================================================================

#if defined(__BYTE_ORDER__) && defined(__ORDER_LITTLE_ENDIAN__)
inline constexpr bool is_little_endian = (__BYTE_ORDER__ == __ORDER_LITTLE_ENDIAN__);
#else
inline constexpr bool is_little_endian = true;
#endif

inline uint32_t host_to_network32(uint32_t value) noexcept {
    if constexpr (is_little_endian) {
        return __builtin_bswap32(value);
    } else {
        return value;
    }
}

inline uint32_t network_to_host32(uint32_t value) noexcept {
    return host_to_network32(value);
}

/// Store a signed 32-bit value at out[0..4) in network order
inline void write_i32(std::span<uint8_t> out, int32_t value) noexcept {
    uint32_t raw = host_to_network32(static_cast<uint32_t>(value));
    std::memcpy(out.data(), &raw, sizeof(raw));
}

/// Load a signed 32-bit value from in[0..4) in network order
inline int32_t read_i32(std::span<const uint8_t> in) noexcept {
    uint32_t raw = 0;
    std::memcpy(&raw, in.data(), sizeof(raw));
    return static_cast<int32_t>(network_to_host32(raw));
}

} // namespace darian::detail
