/**
 * @file endian.hh
 * @brief Little-endian helpers for the 32-bit chunk length field
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>

#include <riff/riff_config.h>

namespace riff {
    // Platform endianness detection using CMake-generated config
#if LIBRIFF_BIG_ENDIAN
    constexpr bool is_big_endian = true;
    constexpr bool is_little_endian = false;
#else
    constexpr bool is_big_endian = false;
    constexpr bool is_little_endian = true;
#endif

    inline std::uint32_t swap32(std::uint32_t x) {
        return ((x << 24) | ((x << 8) & 0x00FF0000) |
                ((x >> 8) & 0x0000FF00) | (x >> 24));
    }

    // Conditional byte swapping based on platform
    inline std::uint32_t swap32le(std::uint32_t x) {
        return is_little_endian ? x : swap32(x);
    }

    inline std::uint32_t read_u32le(const std::byte* src) {
        std::uint32_t value;
        std::memcpy(&value, src, sizeof(value));
        return swap32le(value);
    }

    inline void write_u32le(std::byte* dst, std::uint32_t value) {
        value = swap32le(value);
        std::memcpy(dst, &value, sizeof(value));
    }
}
