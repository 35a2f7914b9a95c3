/**
 * @file chunk.hh
 * @brief A single PNG chunk: length, type, payload and CRC
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <pngme/export_pngme.h>
#include <pngme/chunk_type.hh>
#include <pngme/parse_options.hh>

namespace pngme {

    /**
     * @class chunk
     * @brief One length-prefixed, type-tagged, CRC-protected record
     *
     * The CRC is computed once, at construction, over the type bytes
     * followed by the payload, so crc() always matches the content.
     * Chunks are immutable; editing a file means removing and appending.
     *
     * Wire layout:
     * @code
     *   [u32 BE length][4 type bytes][length payload bytes][u32 BE CRC]
     * @endcode
     */
    class PNGME_EXPORT chunk {
    public:
        /// Size of the length, type and CRC fields together
        static constexpr std::size_t overhead = 12;

        chunk(const chunk_type& type, std::vector<std::byte> data);
        chunk(const chunk_type& type, std::string_view text);

        /**
         * @brief CRC-32 (ISO-HDLC) over the type bytes followed by the payload
         */
        static std::uint32_t checksum_of(const chunk_type& type, const std::byte* data, std::size_t size);
        static std::uint32_t checksum_of(const chunk_type& type, const std::vector<std::byte>& data);

        /**
         * @brief Rebuild a chunk from its wire bytes
         *
         * The CRC field is taken from the last 4 bytes of the slice, and the
         * payload is the `length` bytes following the type code. Callers
         * splitting a stream must therefore pass exactly `12 + length` bytes.
         *
         * @throws malformed_chunk when the slice is shorter than 12 bytes, the
         *         type code is invalid, the length exceeds the limit or the
         *         available bytes, or the CRC does not match
         */
        static chunk parse(const std::byte* data, std::size_t size, const parse_options& options);
        static chunk parse(const std::byte* data, std::size_t size);
        static chunk parse(const std::vector<std::byte>& bytes);

        [[nodiscard]] const chunk_type& type() const { return m_type; }
        [[nodiscard]] const std::vector<std::byte>& data() const { return m_data; }
        [[nodiscard]] std::size_t length() const { return m_data.size(); }
        [[nodiscard]] std::uint32_t crc() const { return m_crc; }

        /**
         * @brief Payload as UTF-8 text
         * @throws decode_error if the payload is not valid UTF-8
         */
        [[nodiscard]] std::string payload_as_text() const;

        /**
         * @brief Payload as UTF-8 text, or @p placeholder if it is not text
         */
        [[nodiscard]] std::string payload_as_text_or(std::string_view placeholder) const;

        /**
         * @brief Encode to wire bytes
         */
        [[nodiscard]] std::vector<std::byte> to_bytes() const;

        /**
         * @brief Append the wire bytes to @p out
         */
        void write_to(std::vector<std::byte>& out) const;

        bool operator==(const chunk& o) const {
            return m_type == o.m_type && m_crc == o.m_crc && m_data == o.m_data;
        }
        bool operator!=(const chunk& o) const { return !(*this == o); }

    private:
        chunk_type m_type;
        std::vector<std::byte> m_data;
        std::uint32_t m_crc;
    };

} // namespace pngme
