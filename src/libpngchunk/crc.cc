//
// Created by igor on 15/08/2025.
//

#include "crc.hh"

#include <algorithm>
#include <limits>

#include <zlib.h>

namespace pngchunk {

    crc32_accumulator::crc32_accumulator()
        : m_value(static_cast<std::uint32_t>(::crc32(0L, Z_NULL, 0))) {}

    void crc32_accumulator::update(const void* data, std::size_t size) {
        auto p = static_cast<const Bytef*>(data);
        uLong crc = m_value;

        // zlib takes uInt lengths
        while (size > 0) {
            std::size_t block = std::min<std::size_t>(size, std::numeric_limits<uInt>::max());
            crc = ::crc32(crc, p, static_cast<uInt>(block));
            p += block;
            size -= block;
        }
        m_value = static_cast<std::uint32_t>(crc);
    }
}
