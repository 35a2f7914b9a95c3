/**
 * @file png.hh
 * @brief PNG signature plus an ordered list of chunks
 */

#pragma once

#include <array>
#include <cstdint>
#include <iosfwd>
#include <string_view>
#include <vector>

#include <pngme/export_pngme.h>
#include <pngme/chunk.hh>
#include <pngme/parse_options.hh>

namespace pngme {

    /**
     * @class png
     * @brief The chunk stream of a PNG file
     *
     * Holds the chunks in file order and owns them. Apart from the 8-byte
     * signature, no PNG structural rule (IHDR first, IEND last) is enforced;
     * violations are only reported through parse_options::on_warning.
     *
     * Pointers and references returned by lookups stay valid until the
     * next append_chunk() or remove_chunk().
     */
    class PNGME_EXPORT png {
    public:
        using const_iterator = std::vector<chunk>::const_iterator;

        /// 89 50 4E 47 0D 0A 1A 0A
        static const std::array<std::uint8_t, 8> signature;

        png() = default;
        explicit png(std::vector<chunk> chunks);

        /**
         * @brief Parse a complete PNG byte stream
         *
         * All-or-nothing: either every chunk parses or nothing is returned.
         *
         * @throws format_error with kind bad_signature if the stream does not
         *         start with the PNG signature, or kind chunk if a chunk is
         *         malformed
         */
        static png parse(const std::vector<std::byte>& bytes, const parse_options& options);
        static png parse(const std::vector<std::byte>& bytes);

        /**
         * @brief Read the stream to its end and parse it
         * @throws io_error if the stream cannot be read
         */
        static png load(std::istream& stream, const parse_options& options);
        static png load(std::istream& stream);

        /// Append at the end; duplicate types are allowed
        void append_chunk(chunk c);

        /**
         * @brief Remove the first chunk whose type text is @p type
         * @return The removed chunk
         * @throws not_found_error if there is none; the container is unchanged
         */
        chunk remove_chunk(std::string_view type);

        /// First chunk whose type text is @p type, or nullptr
        [[nodiscard]] const chunk* chunk_by_type(std::string_view type) const;

        [[nodiscard]] const std::vector<chunk>& chunks() const { return m_chunks; }
        [[nodiscard]] std::size_t size() const { return m_chunks.size(); }
        [[nodiscard]] bool empty() const { return m_chunks.empty(); }
        [[nodiscard]] const_iterator begin() const { return m_chunks.begin(); }
        [[nodiscard]] const_iterator end() const { return m_chunks.end(); }

        /// Signature followed by every chunk's wire bytes, in order
        [[nodiscard]] std::vector<std::byte> to_bytes() const;

    private:
        const_iterator find(std::string_view type) const;

        std::vector<chunk> m_chunks;
    };

} // namespace pngme
