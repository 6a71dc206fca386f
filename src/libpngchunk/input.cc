//
// Created by igor on 12/08/2025.
//

#include <istream>
#include <algorithm>

#include "input.hh"

namespace pngchunk {
    namespace {
        // Upper bound of a single read; the buffer only grows as data arrives
        constexpr std::size_t read_block = 64 * 1024;
    }

    reader::reader(std::istream& is)
        : m_stream(is), m_start(0), m_consumed(0) {
        // tellg() sets failbit on streams without positioning support
        auto state = m_stream.rdstate();
        std::streampos pos = m_stream.tellg();
        if (pos != std::streampos(-1)) {
            m_start = static_cast<std::uint64_t>(pos);
        }
        m_stream.clear(state);
    }

    std::size_t reader::read(void* dst, std::size_t size) {
        THROW_IO_UNLESS(dst, "Null buffer in read");

        if (size == 0) {
            return 0;
        }

        if (m_stream.eof()) {
            return 0;
        }
        THROW_IO_UNLESS(m_stream.good(), "Stream in bad state");

        m_stream.read(static_cast<char*>(dst), static_cast<std::streamsize>(size));
        std::size_t bytes_read = static_cast<std::size_t>(m_stream.gcount());

        THROW_IO_IF(m_stream.bad(), "Stream read failed");
        m_consumed += bytes_read;
        return bytes_read;
    }

    std::size_t reader::append(std::vector<std::byte>& buffer, std::size_t size) {
        std::size_t total = 0;
        while (total < size) {
            std::size_t block = std::min(read_block, size - total);
            std::size_t old_size = buffer.size();
            buffer.resize(old_size + block);

            std::size_t actual = read(buffer.data() + old_size, block);
            buffer.resize(old_size + actual);
            total += actual;

            if (actual != block) {
                break;
            }
        }
        return total;
    }
}
