//
// Created by igor on 16/08/2025.
//

#include <pngchunk/chunk_stream.hh>
#include <pngchunk/endian.hh>
#include <pngchunk/exceptions.hh>

#include <array>
#include <ostream>

#include "input.hh"

namespace pngchunk {

    result<chunk> read_chunk(std::istream& stream, const parse_options& options) {
        reader in(stream);
        const std::uint64_t start = in.offset();

        std::array<std::byte, 4> length_field{};
        std::size_t got = in.read(length_field.data(), length_field.size());
        if (got != length_field.size()) {
            return chunk_error(too_short{chunk::overhead, got});
        }
        const std::uint32_t length = load_be32(length_field.data());

        chunk_type::code_type code{};
        got = in.read(code.data(), code.size());
        if (got != code.size()) {
            return chunk_error(too_short{chunk::overhead, length_field.size() + got});
        }

        // Reject garbage before allocating for the payload
        auto type = chunk_type::from_bytes(code);
        if (!type) {
            return type.error();
        }
        if (length > options.max_chunk_size) {
            return chunk_error(size_limit{length, options.max_chunk_size});
        }

        std::vector<std::byte> buffer(8);
        store_be32(length, buffer.data());
        type->to_bytes(buffer.data() + 4);
        in.append(buffer, static_cast<std::size_t>(length) + 4);

        parse_options local = options;
        if (options.on_warning) {
            local.on_warning = [&options, start](std::uint64_t offset, std::string_view category,
                                                 std::string_view message) {
                options.on_warning(start + offset, category, message);
            };
        }
        return chunk::parse(buffer, local);
    }

    void write_chunk(std::ostream& stream, const chunk& c) {
        THROW_IO_UNLESS(stream.good(), "Stream in bad state");

        auto bytes = c.serialize();
        stream.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        THROW_IO_UNLESS(stream.good(), "Failed to write chunk ", c.type().to_string(),
                        " (", bytes.size(), " bytes)");
    }

} // namespace pngchunk
