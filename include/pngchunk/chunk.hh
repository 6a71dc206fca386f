/**
 * @file chunk.hh
 * @brief PNG chunk record: length, type, payload and CRC-32
 * @author Igor
 * @date 15/08/2025
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

#include <pngchunk/export_pngchunk.h>
#include <pngchunk/chunk_type.hh>
#include <pngchunk/chunk_error.hh>
#include <pngchunk/parse_options.hh>

namespace pngchunk {

    /**
     * @class chunk
     * @brief One chunk of a PNG stream
     *
     * Wire layout, all integers big-endian:
     * @code
     *   length (4) | type (4) | payload (length) | crc (4)
     * @endcode
     * The CRC-32 (ISO-HDLC polynomial) covers the payload followed by
     * the 4 type bytes, in that order.
     *
     * A chunk is immutable. It either comes from the constructor, which
     * computes length and crc, or from parse(), which only produces a chunk
     * whose declared CRC matches the recomputed one.
     */
    class PNGCHUNK_EXPORT chunk {
    public:
        /// Size of length + type + crc
        static constexpr std::size_t overhead = 12;

        /**
         * @brief Build a chunk from a type and a payload
         * @throws encode_error if the payload does not fit the 32-bit length field
         */
        chunk(chunk_type type, std::vector<std::byte> data);

        [[nodiscard]] std::uint32_t length() const noexcept { return m_length; }
        [[nodiscard]] const chunk_type& type() const noexcept { return m_type; }
        [[nodiscard]] const std::vector<std::byte>& data() const noexcept { return m_data; }
        [[nodiscard]] std::uint32_t crc() const noexcept { return m_crc; }

        /**
         * @brief Payload as text
         * @return The payload bytes as a string, or decode_error if they are
         *         not well-formed UTF-8
         */
        [[nodiscard]] result<std::string> data_as_text() const;

        /**
         * @brief Encode to the on-wire layout
         * @return overhead + length() bytes
         */
        [[nodiscard]] std::vector<std::byte> serialize() const;

        [[nodiscard]] std::size_t serialized_size() const noexcept {
            return overhead + m_length;
        }

        /**
         * @brief Decode one chunk from the start of a buffer
         *
         * Bytes after the CRC field are left alone and reported as a
         * "trailing_data" warning. A type with its reserved bit set is
         * accepted and reported as a "reserved_bit" warning.
         *
         * @param data Serialized bytes
         * @param size Number of bytes available at data
         * @param options Size limit and warning handler
         * @return The chunk, or too_short, not_alphabetic, size_limit,
         *         truncated or checksum_mismatch
         */
        static result<chunk> parse(const std::byte* data, std::size_t size,
                                   const parse_options& options = {});

        static result<chunk> parse(const std::vector<std::byte>& bytes,
                                   const parse_options& options = {});

        /**
         * @brief CRC-32 over payload followed by the type bytes
         */
        static std::uint32_t compute_crc(const std::vector<std::byte>& data, const chunk_type& type);

        /// Short summary: type, length and crc
        [[nodiscard]] std::string to_string() const;

        bool operator==(const chunk& o) const {
            return m_type == o.m_type && m_crc == o.m_crc && m_data == o.m_data;
        }
        bool operator!=(const chunk& o) const { return !(*this == o); }

    private:
        chunk(chunk_type type, std::vector<std::byte> data, std::uint32_t verified_crc);

        chunk_type m_type;
        std::vector<std::byte> m_data;
        std::uint32_t m_length;
        std::uint32_t m_crc;
    };

    PNGCHUNK_EXPORT std::ostream& operator<<(std::ostream& os, const chunk& c);

} // namespace pngchunk
