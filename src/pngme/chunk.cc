//
// Chunk encoding, decoding and CRC.
//

#include <pngme/chunk.hh>
#include <pngme/exceptions.hh>

#include <zlib.h>

#include <algorithm>
#include <limits>

#include "input.hh"
#include "utf8.hh"

namespace pngme {
    namespace {
        std::vector<std::byte> text_bytes(std::string_view text) {
            const auto* p = reinterpret_cast<const std::byte*>(text.data());
            return {p, p + text.size()};
        }

        // zlib takes a uInt length; feed large payloads in pieces
        std::uint32_t crc_update(uLong crc, const std::byte* data, std::size_t size) {
            constexpr std::size_t max_step = std::numeric_limits<uInt>::max();
            while (size > 0) {
                auto step = std::min(size, max_step);
                crc = ::crc32(crc, reinterpret_cast<const Bytef*>(data), static_cast<uInt>(step));
                data += step;
                size -= step;
            }
            return static_cast<std::uint32_t>(crc);
        }

        void put_u32_be(std::vector<std::byte>& out, std::uint32_t value) {
            std::uint32_t be = swap32be(value);
            const auto* p = reinterpret_cast<const std::byte*>(&be);
            out.insert(out.end(), p, p + 4);
        }
    }

    chunk::chunk(const chunk_type& type, std::vector<std::byte> data)
        : m_type(type), m_data(std::move(data)), m_crc(checksum_of(m_type, m_data)) {
    }

    chunk::chunk(const chunk_type& type, std::string_view text)
        : chunk(type, text_bytes(text)) {
    }

    std::uint32_t chunk::checksum_of(const chunk_type& type, const std::byte* data, std::size_t size) {
        std::array<std::byte, 4> type_bytes;
        type.to_bytes(type_bytes.data());

        uLong crc = ::crc32(0L, Z_NULL, 0);
        crc = crc_update(crc, type_bytes.data(), type_bytes.size());
        return crc_update(crc, data, size);
    }

    std::uint32_t chunk::checksum_of(const chunk_type& type, const std::vector<std::byte>& data) {
        return checksum_of(type, data.data(), data.size());
    }

    chunk chunk::parse(const std::byte* data, std::size_t size, const parse_options& options) {
        PNGME_THROW_MALFORMED_IF(size < overhead, truncated,
                                 "Chunk needs at least ", overhead, " bytes, got ", size);

        buffer_reader in(data, size);
        auto length = in.read_u32_be();

        chunk_type type = [&in]() {
            try {
                return in.read_chunk_type();
            } catch (const invalid_chunk_type& e) {
                PNGME_THROW_MALFORMED(invalid_type, "Malformed chunk: ", e.what());
            }
        }();

        PNGME_THROW_MALFORMED_IF(length > options.max_chunk_size, too_large,
                                 "Chunk '", type, "' has length ", length,
                                 ", which exceeds maximum allowed size of ", options.max_chunk_size, " bytes");

        // The payload never overlaps the trailing CRC field
        std::size_t available = size - overhead;
        PNGME_THROW_MALFORMED_IF(length > available, length_mismatch,
                                 "Chunk '", type, "' declares ", length, " payload bytes, only ",
                                 available, " available");
        auto payload = in.read_exact(length);

        in.seek(4, buffer_reader::end);
        auto stored_crc = in.read_u32_be();
        auto computed_crc = checksum_of(type, payload);
        PNGME_THROW_MALFORMED_IF(stored_crc != computed_crc, checksum_mismatch,
                                 "Chunk '", type, "' checksum mismatch: stored ", stored_crc,
                                 ", computed ", computed_crc);

        return {type, std::move(payload)};
    }

    chunk chunk::parse(const std::byte* data, std::size_t size) {
        return parse(data, size, parse_options{});
    }

    chunk chunk::parse(const std::vector<std::byte>& bytes) {
        return parse(bytes.data(), bytes.size());
    }

    std::string chunk::payload_as_text() const {
        if (auto bad = find_invalid_utf8(m_data.data(), m_data.size())) {
            throw decode_error(*bad, build_error_msg("Chunk '", m_type, "' payload is not valid UTF-8 (offset ",
                                                     *bad, ")"));
        }
        return {reinterpret_cast<const char*>(m_data.data()), m_data.size()};
    }

    std::string chunk::payload_as_text_or(std::string_view placeholder) const {
        if (find_invalid_utf8(m_data.data(), m_data.size())) {
            return std::string(placeholder);
        }
        return {reinterpret_cast<const char*>(m_data.data()), m_data.size()};
    }

    std::vector<std::byte> chunk::to_bytes() const {
        std::vector<std::byte> out;
        out.reserve(overhead + m_data.size());
        write_to(out);
        return out;
    }

    void chunk::write_to(std::vector<std::byte>& out) const {
        PNGME_THROW_IO_IF(m_data.size() > std::numeric_limits<std::uint32_t>::max(),
                          "Chunk '", m_type, "' payload of ", m_data.size(), " bytes does not fit a 32-bit length");

        put_u32_be(out, static_cast<std::uint32_t>(m_data.size()));
        std::array<std::byte, 4> type_bytes;
        m_type.to_bytes(type_bytes.data());
        out.insert(out.end(), type_bytes.begin(), type_bytes.end());
        out.insert(out.end(), m_data.begin(), m_data.end());
        put_u32_be(out, m_crc);
    }
}
