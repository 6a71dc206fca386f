//
// Created by igor on 15/08/2025.
//

#pragma once

#include <cstddef>
#include <cstdint>

namespace pngchunk {

    // Incremental CRC-32/ISO-HDLC (zlib crc32)
    class crc32_accumulator {
    public:
        crc32_accumulator();

        void update(const void* data, std::size_t size);

        [[nodiscard]] std::uint32_t value() const { return m_value; }

    private:
        std::uint32_t m_value;
    };
}
