//
// Created by igor on 12/08/2025.
//

#pragma once

#include <iosfwd>
#include <cstddef>
#include <cstdint>
#include <vector>

#include <pngchunk/exceptions.hh>

namespace pngchunk {

    // Sequential reader over an input stream - throws on stream failure
    class reader {
        public:
            explicit reader(std::istream& is);

            // Returns the number of bytes read, short only at end of stream
            std::size_t read(void* dst, std::size_t size);

            // Appends up to size bytes to buffer, reading in bounded blocks
            std::size_t append(std::vector<std::byte>& buffer, std::size_t size);

            // Stream position of the next byte, counted from where reading started
            [[nodiscard]] std::uint64_t offset() const { return m_start + m_consumed; }

        private:
            std::istream& m_stream;
            std::uint64_t m_start;    // Stream position at construction, 0 if not seekable
            std::uint64_t m_consumed; // Bytes read so far
    };
}
