//
// Created by igor on 10/08/2025.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>

#include <pngchunk/pngchunk_config.h>

namespace pngchunk {
    // Host byte order, detected at configure time
#if PNGCHUNK_BIG_ENDIAN
    constexpr bool is_big_endian = true;
#else
    constexpr bool is_big_endian = false;
#endif

    inline uint32_t swap32(uint32_t x) {
        return (x >> 24) | ((x >> 8) & 0x0000FF00u) |
               ((x << 8) & 0x00FF0000u) | (x << 24);
    }

    // Converts between host order and network (big-endian) order
    inline uint32_t swap32be(uint32_t x) {
        if constexpr (is_big_endian) {
            return x;
        } else {
            return swap32(x);
        }
    }

    // Every integer field of a chunk is a big-endian u32
    inline uint32_t load_be32(const std::byte* src) {
        uint32_t raw;
        std::memcpy(&raw, src, sizeof(raw));
        return swap32be(raw);
    }

    inline void store_be32(uint32_t value, std::byte* dst) {
        const uint32_t raw = swap32be(value);
        std::memcpy(dst, &raw, sizeof(raw));
    }
}
