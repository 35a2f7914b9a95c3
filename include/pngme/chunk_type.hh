//
// Four-letter PNG chunk type code.
//
#pragma once
#include <array>
#include <cstring>
#include <cstdint>
#include <string>
#include <string_view>
#include <functional>
#include <ostream>

#include <pngme/export_pngme.h>

namespace pngme {
    /**
     * @class chunk_type
     * @brief Four ASCII letters naming a chunk
     *
     * The case of each letter carries one property bit (PNG, section 5.4):
     * byte 0 ancillary, byte 1 private, byte 2 reserved, byte 3 safe-to-copy.
     * A chunk_type can only be built from four letters; every constructor
     * and factory throws invalid_chunk_type otherwise.
     */
    class PNGME_EXPORT chunk_type {
    public:
        // Constructor from 4 individual chars
        constexpr chunk_type(char c0, char c1, char c2, char c3)
            : m_bytes{ c0, c1, c2, c3 } {
            if (!(is_letter(c0) && is_letter(c1) && is_letter(c2) && is_letter(c3))) {
                reject(m_bytes);
            }
        }

        // Constructor from raw bytes
        static chunk_type from_bytes(const void* data);
        static chunk_type from_bytes(const std::array<std::uint8_t, 4>& bytes);

        // Parse from text; must be exactly four letters
        static chunk_type parse(std::string_view text);

        [[nodiscard]] std::array<std::uint8_t, 4> bytes() const {
            std::array<std::uint8_t, 4> result;
            std::memcpy(result.data(), m_bytes.data(), 4);
            return result;
        }

        // Write to bytes
        void to_bytes(void* dest) const {
            std::memcpy(dest, m_bytes.data(), 4);
        }

        [[nodiscard]] std::string to_string() const {
            return {m_bytes.data(), 4};
        }

        [[nodiscard]] std::string_view to_string_view() const {
            return {m_bytes.data(), 4};
        }

        // Property bits
        [[nodiscard]] constexpr bool is_critical() const { return is_upper(m_bytes[0]); }
        [[nodiscard]] constexpr bool is_public() const { return is_upper(m_bytes[1]); }
        [[nodiscard]] constexpr bool is_reserved_bit_valid() const { return is_upper(m_bytes[2]); }
        [[nodiscard]] constexpr bool is_safe_to_copy() const { return !is_upper(m_bytes[3]); }
        [[nodiscard]] constexpr bool is_valid() const { return is_reserved_bit_valid(); }

        // Comparison operators
        bool operator==(const chunk_type& o) const { return m_bytes == o.m_bytes; }
        bool operator!=(const chunk_type& o) const { return !(*this == o); }
        bool operator<(const chunk_type& o) const { return m_bytes < o.m_bytes; }
        bool operator<=(const chunk_type& o) const { return m_bytes <= o.m_bytes; }
        bool operator>(const chunk_type& o) const { return m_bytes > o.m_bytes; }
        bool operator>=(const chunk_type& o) const { return m_bytes >= o.m_bytes; }

        static constexpr bool is_letter(char c) {
            return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
        }

        friend std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
            return os.write(t.m_bytes.data(), 4);
        }

    private:
        static constexpr bool is_upper(char c) {
            return c >= 'A' && c <= 'Z';
        }

        [[noreturn]] static void reject(const std::array<char, 4>& bytes);

        std::array<char, 4> m_bytes;
    };

    // Hash function
    struct chunk_type_hash {
        std::size_t operator()(const chunk_type& t) const noexcept {
            std::uint32_t v;
            t.to_bytes(&v);
            return (static_cast<std::size_t>(v) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

    // User-defined literal: "IEND"_ct
    inline chunk_type operator""_ct(const char* str, std::size_t len) {
        return chunk_type::parse(std::string_view(str, len));
    }

    // Well-known critical chunks
    namespace chunk_types {
        inline constexpr chunk_type IHDR('I', 'H', 'D', 'R');
        inline constexpr chunk_type PLTE('P', 'L', 'T', 'E');
        inline constexpr chunk_type IDAT('I', 'D', 'A', 'T');
        inline constexpr chunk_type IEND('I', 'E', 'N', 'D');
    }
}

// Specialization for std::hash
namespace std {
    template<>
    struct hash<pngme::chunk_type> {
        std::size_t operator()(const pngme::chunk_type& t) const noexcept {
            return pngme::chunk_type_hash{}(t);
        }
    };
}
