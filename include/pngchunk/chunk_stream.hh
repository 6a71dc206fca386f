/**
 * @file chunk_stream.hh
 * @brief Reading and writing single chunks through iostreams
 * @author Igor
 * @date 16/08/2025
 */

#pragma once

#include <iosfwd>

#include <pngchunk/export_pngchunk.h>
#include <pngchunk/chunk.hh>
#include <pngchunk/parse_options.hh>

namespace pngchunk {

    /**
     * @brief Read one serialized chunk from the current stream position
     *
     * Consumes at most serialized_size() bytes. Malformed or short input is
     * reported through the result the same way chunk::parse() does; warning
     * offsets are absolute stream positions.
     *
     * @param stream Binary input stream
     * @param options Size limit and warning handler
     * @throws io_error if the stream is in a bad state or a read fails
     */
    PNGCHUNK_EXPORT result<chunk> read_chunk(std::istream& stream, const parse_options& options = {});

    /**
     * @brief Write the serialized form of a chunk
     * @throws io_error if the stream fails
     */
    PNGCHUNK_EXPORT void write_chunk(std::ostream& stream, const chunk& c);

} // namespace pngchunk
