//
// Created by igor on 10/08/2025.
//
#pragma once
#include <array>
#include <cstdint>
#include <cstring>
#include <functional>
#include <iosfwd>
#include <string>
#include <string_view>

#include <pngchunk/export_pngchunk.h>
#include <pngchunk/chunk_error.hh>

namespace pngchunk {
    class PNGCHUNK_EXPORT chunk_type {
    public:
        using code_type = std::array<std::uint8_t, 4>;

        // Case bit of an ASCII letter: clear for uppercase, set for lowercase
        static constexpr std::uint8_t property_bit = 1u << 5;

        // Validating constructors; fail with not_alphabetic
        static result<chunk_type> from_bytes(const code_type& code);

        // Uses the first 4 bytes of text; fails with too_short below 4 bytes
        static result<chunk_type> from_text(std::string_view text);

        [[nodiscard]] static bool is_alphabetic(std::uint8_t c) noexcept {
            return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
        }

        [[nodiscard]] code_type bytes() const { return m_code; }

        // Ancillary chunks have a lowercase first letter
        [[nodiscard]] bool is_critical() const noexcept { return !has_property_bit(0); }
        [[nodiscard]] bool is_public() const noexcept { return !has_property_bit(1); }
        [[nodiscard]] bool is_reserved_bit_valid() const noexcept { return !has_property_bit(2); }
        [[nodiscard]] bool is_safe_to_copy() const noexcept { return has_property_bit(3); }

        // Only the reserved bit is checked
        [[nodiscard]] bool is_valid() const noexcept { return is_reserved_bit_valid(); }

        [[nodiscard]] std::string to_string() const {
            return {reinterpret_cast<const char*>(m_code.data()), m_code.size()};
        }

        // Write to bytes
        void to_bytes(void* dest) const {
            std::memcpy(dest, m_code.data(), m_code.size());
        }

        // Comparison operators
        bool operator==(const chunk_type& o) const { return m_code == o.m_code; }
        bool operator!=(const chunk_type& o) const { return !(*this == o); }
        bool operator<(const chunk_type& o) const { return m_code < o.m_code; }
        bool operator<=(const chunk_type& o) const { return m_code <= o.m_code; }
        bool operator>(const chunk_type& o) const { return m_code > o.m_code; }
        bool operator>=(const chunk_type& o) const { return m_code >= o.m_code; }

    private:
        explicit chunk_type(const code_type& code) : m_code(code) {}

        [[nodiscard]] bool has_property_bit(std::size_t index) const noexcept {
            return (m_code[index] & property_bit) != 0;
        }

        code_type m_code;
    };

    // Stream output as a quoted string, e.g. 'IHDR'
    PNGCHUNK_EXPORT std::ostream& operator<<(std::ostream& os, const chunk_type& t);

    // Hash function
    struct chunk_type_hash {
        std::size_t operator()(const chunk_type& t) const noexcept {
            std::uint32_t v;
            t.to_bytes(&v);
            return (static_cast<std::size_t>(v) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };
}
// Specialization for std::hash
namespace std {
    template<>
    struct hash<pngchunk::chunk_type> {
        std::size_t operator()(const pngchunk::chunk_type& t) const noexcept {
            return pngchunk::chunk_type_hash{}(t);
        }
    };
}
