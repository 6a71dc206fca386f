//
// Created by igor on 15/08/2025.
//

#include <pngchunk/chunk.hh>
#include <pngchunk/endian.hh>
#include <pngchunk/exceptions.hh>

#include <algorithm>
#include <cstring>
#include <limits>
#include <ostream>
#include <sstream>
#include <string_view>

#include "crc.hh"

namespace pngchunk {
    namespace {
        constexpr std::size_t length_field = 4;
        constexpr std::size_t type_field = 4;
        constexpr std::size_t crc_field = 4;

        void warn(const parse_options& options, std::uint64_t offset,
                  std::string_view category, const std::string& message) {
            if (options.on_warning) {
                options.on_warning(offset, category, message);
            }
        }

        // Length of the well-formed UTF-8 sequence starting at p, 0 if malformed
        std::size_t utf8_sequence_length(const unsigned char* p, std::size_t available) {
            const unsigned char lead = p[0];
            if (lead < 0x80) {
                return 1;
            }

            std::size_t len;
            std::uint32_t cp;
            if ((lead & 0xE0) == 0xC0) {
                len = 2;
                cp = lead & 0x1F;
            } else if ((lead & 0xF0) == 0xE0) {
                len = 3;
                cp = lead & 0x0F;
            } else if ((lead & 0xF8) == 0xF0) {
                len = 4;
                cp = lead & 0x07;
            } else {
                return 0;
            }

            if (available < len) {
                return 0;
            }
            for (std::size_t i = 1; i < len; i++) {
                if ((p[i] & 0xC0) != 0x80) {
                    return 0;
                }
                cp = (cp << 6) | (p[i] & 0x3F);
            }

            // Overlong forms, surrogates and values past U+10FFFF
            static constexpr std::uint32_t min_cp[] = {0, 0, 0x80, 0x800, 0x10000};
            if (cp < min_cp[len] || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
                return 0;
            }
            return len;
        }
    }

    chunk::chunk(chunk_type type, std::vector<std::byte> data)
        : m_type(std::move(type))
        , m_data(std::move(data))
        , m_length(0)
        , m_crc(0) {
        THROW_ENCODE_IF(m_data.size() > std::numeric_limits<std::uint32_t>::max(),
                        "Chunk ", m_type.to_string(), " payload of ", m_data.size(),
                        " bytes does not fit the 32-bit length field");
        m_length = static_cast<std::uint32_t>(m_data.size());
        m_crc = compute_crc(m_data, m_type);
    }

    chunk::chunk(chunk_type type, std::vector<std::byte> data, std::uint32_t verified_crc)
        : m_type(std::move(type))
        , m_data(std::move(data))
        , m_length(static_cast<std::uint32_t>(m_data.size()))
        , m_crc(verified_crc) {}

    std::uint32_t chunk::compute_crc(const std::vector<std::byte>& data, const chunk_type& type) {
        const auto code = type.bytes();

        crc32_accumulator crc;
        crc.update(data.data(), data.size());
        crc.update(code.data(), code.size());
        return crc.value();
    }

    result<std::string> chunk::data_as_text() const {
        const auto* p = reinterpret_cast<const unsigned char*>(m_data.data());
        std::size_t pos = 0;
        while (pos < m_data.size()) {
            std::size_t len = utf8_sequence_length(p + pos, m_data.size() - pos);
            if (len == 0) {
                return chunk_error(decode_error{pos});
            }
            pos += len;
        }
        return std::string(reinterpret_cast<const char*>(m_data.data()), m_data.size());
    }

    std::vector<std::byte> chunk::serialize() const {
        std::vector<std::byte> out(serialized_size());
        std::byte* p = out.data();

        store_be32(m_length, p);
        p += length_field;
        m_type.to_bytes(p);
        p += type_field;
        std::copy(m_data.begin(), m_data.end(), p);
        p += m_data.size();
        store_be32(m_crc, p);

        return out;
    }

    result<chunk> chunk::parse(const std::byte* data, std::size_t size, const parse_options& options) {
        if (size < overhead) {
            return chunk_error(too_short{overhead, size});
        }

        const std::uint32_t length = load_be32(data);

        chunk_type::code_type code;
        std::memcpy(code.data(), data + length_field, type_field);
        auto type = chunk_type::from_bytes(code);
        if (!type) {
            return type.error();
        }

        if (length > options.max_chunk_size) {
            return chunk_error(size_limit{length, options.max_chunk_size});
        }

        const std::size_t header = length_field + type_field;
        const std::size_t after_header = size - header;
        if (after_header - crc_field < length) {
            return chunk_error(truncated{length, after_header});
        }

        const std::byte* payload = data + header;
        const std::uint32_t declared = load_be32(payload + length);

        std::vector<std::byte> bytes(payload, payload + length);
        const std::uint32_t computed = compute_crc(bytes, *type);
        if (declared != computed) {
            return chunk_error(checksum_mismatch{declared, computed});
        }

        if (!type->is_valid()) {
            warn(options, length_field, "reserved_bit",
                 build_error_msg("Chunk type ", type->to_string(), " has the reserved bit set"));
        }

        const std::size_t consumed = overhead + length;
        if (size > consumed) {
            warn(options, consumed, "trailing_data",
                 build_error_msg(size - consumed, " bytes follow chunk ", type->to_string(),
                                 " at offset ", consumed));
        }

        return chunk(std::move(*type), std::move(bytes), declared);
    }

    result<chunk> chunk::parse(const std::vector<std::byte>& bytes, const parse_options& options) {
        return parse(bytes.data(), bytes.size(), options);
    }

    std::string chunk::to_string() const {
        std::ostringstream oss;
        oss << *this;
        return oss.str();
    }

    std::ostream& operator<<(std::ostream& os, const chunk& c) {
        auto flags = os.flags();
        os << "Chunk " << c.type() << " (" << c.length() << " bytes, crc 0x"
           << std::hex << c.crc() << ')';
        os.flags(flags);
        return os;
    }

} // namespace pngchunk
