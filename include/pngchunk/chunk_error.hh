/**
 * @file chunk_error.hh
 * @brief Error values and the result<T> wrapper returned by fallible operations
 * @author Igor
 * @date 15/08/2025
 *
 * Every way a chunk or a chunk type can be rejected is one alternative of
 * chunk_error. Operations return result<T> instead of throwing, so a
 * rejected input never yields a partially built object.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <utility>
#include <variant>

#include <pngchunk/export_pngchunk.h>
#include <pngchunk/exceptions.hh>

namespace pngchunk {

    /// A chunk type byte outside A-Z / a-z
    struct not_alphabetic {
        std::uint8_t value = 0;      ///< Offending byte
        std::size_t position = 0;    ///< Index of the byte within the code (0-3)
    };

    /// Fewer bytes than the fixed-size fields need
    struct too_short {
        std::size_t required = 0;
        std::size_t available = 0;
    };

    /// Payload or trailing CRC cut short of the declared length
    struct truncated {
        std::uint32_t declared = 0;  ///< Payload length from the header
        std::size_t available = 0;   ///< Bytes present after the header
    };

    /// Declared CRC differs from the one computed over payload and type
    struct checksum_mismatch {
        std::uint32_t declared = 0;
        std::uint32_t computed = 0;
    };

    /// Payload is not well-formed UTF-8 text
    struct decode_error {
        std::size_t offset = 0;      ///< Offset of the first invalid byte
    };

    /// Declared length above parse_options::max_chunk_size
    struct size_limit {
        std::uint32_t declared = 0;
        std::uint64_t limit = 0;
    };

    using chunk_error = std::variant<
        not_alphabetic,
        too_short,
        truncated,
        checksum_mismatch,
        decode_error,
        size_limit
    >;

    /**
     * @brief Render a diagnostic message for an error value
     */
    PNGCHUNK_EXPORT std::string describe(const chunk_error& err);

    PNGCHUNK_EXPORT std::ostream& operator<<(std::ostream& os, const chunk_error& err);

    /**
     * @class result
     * @brief Either a value of type T or a chunk_error
     *
     * value() on a failed result throws parse_error carrying describe(error()).
     */
    template<typename T>
    class result {
    public:
        result(T value)
            : m_storage(std::in_place_index<0>, std::move(value)) {}

        result(chunk_error err)
            : m_storage(std::in_place_index<1>, std::move(err)) {}

        [[nodiscard]] bool has_value() const noexcept { return m_storage.index() == 0; }
        explicit operator bool() const noexcept { return has_value(); }

        [[nodiscard]] T& value() & {
            ensure_value();
            return std::get<0>(m_storage);
        }

        [[nodiscard]] const T& value() const & {
            ensure_value();
            return std::get<0>(m_storage);
        }

        [[nodiscard]] T&& value() && {
            ensure_value();
            return std::get<0>(std::move(m_storage));
        }

        // Precondition: has_value() is false
        [[nodiscard]] const chunk_error& error() const {
            return std::get<1>(m_storage);
        }

        // Precondition: has_value() is true
        T& operator*() & { return std::get<0>(m_storage); }
        const T& operator*() const & { return std::get<0>(m_storage); }
        T* operator->() { return &std::get<0>(m_storage); }
        const T* operator->() const { return &std::get<0>(m_storage); }

        // True if the result failed with error alternative E
        template<typename E>
        [[nodiscard]] bool failed_with() const noexcept {
            return !has_value() && std::holds_alternative<E>(std::get<1>(m_storage));
        }

    private:
        void ensure_value() const {
            THROW_PARSE_IF(!has_value(), describe(std::get<1>(m_storage)));
        }

        std::variant<T, chunk_error> m_storage;
    };

} // namespace pngchunk
