/**
 * @file parse_options.hh
 * @brief Parsing options for PNG chunks
 * @author Igor
 * @date 14/08/2025
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace pngchunk {

    /**
     * @struct parse_options
     * @brief Configuration options for parsing serialized chunks
     *
     * Controls the accepted payload size and receives warnings about
     * inputs that are accepted but unusual.
     */
    struct parse_options {
        /**
         * @brief Maximum accepted payload length in bytes
         *
         * Chunks declaring a larger length are rejected with size_limit.
         * Default accepts every value of the 32-bit length field.
         */
        std::uint64_t max_chunk_size = 0xFFFFFFFFu;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Offset of the chunk the warning refers to
         * @param category Warning category ("reserved_bit", "trailing_data")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * If set, will be called for non-fatal issues during parsing.
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace pngchunk
