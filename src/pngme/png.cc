//
// PNG chunk stream parsing and serialization.
//

#include <pngme/png.hh>
#include <pngme/exceptions.hh>

#include <algorithm>
#include <cstring>
#include <istream>
#include <iterator>

#include "input.hh"

namespace pngme {

    const std::array<std::uint8_t, 8> png::signature = {
        0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A
    };

    namespace {
        void warn(const parse_options& options, std::uint64_t offset,
                  std::string_view category, const std::string& message) {
            if (options.on_warning) {
                options.on_warning(offset, category, message);
            }
        }

        // Structural checks a PNG decoder would enforce; reported only
        void check_structure(const std::vector<chunk>& chunks, const std::vector<std::uint64_t>& offsets,
                             const parse_options& options) {
            if (chunks.empty()) {
                return;
            }

            if (chunks.front().type() != chunk_types::IHDR) {
                warn(options, offsets.front(), "structure",
                     build_error_msg("First chunk is '", chunks.front().type(), "', expected 'IHDR'"));
            }

            bool seen_end = false;
            for (std::size_t i = 0; i < chunks.size(); i++) {
                const auto& type = chunks[i].type();
                if (!type.is_valid()) {
                    warn(options, offsets[i], "reserved_bit",
                         build_error_msg("Chunk '", type, "' has the reserved bit set"));
                }
                if (type == chunk_types::IEND && i + 1 != chunks.size() && !seen_end) {
                    warn(options, offsets[i + 1], "structure",
                         build_error_msg(chunks.size() - i - 1, " chunk(s) after 'IEND'"));
                }
                seen_end = seen_end || type == chunk_types::IEND;
            }

            if (chunks.back().type() != chunk_types::IEND) {
                warn(options, offsets.back(), "structure",
                     build_error_msg("Last chunk is '", chunks.back().type(), "', expected 'IEND'"));
            }
        }
    }

    png::png(std::vector<chunk> chunks)
        : m_chunks(std::move(chunks)) {
    }

    png png::parse(const std::vector<std::byte>& bytes, const parse_options& options) {
        buffer_reader in(bytes);

        if (in.remaining() < signature.size() ||
            std::memcmp(in.cursor(), signature.data(), signature.size()) != 0) {
            throw format_error("Invalid PNG signature");
        }
        in.skip(signature.size());

        std::vector<chunk> chunks;
        std::vector<std::uint64_t> offsets;
        while (!in.at_end()) {
            std::uint64_t offset = in.tell();

            if (in.remaining() < chunk::overhead && !options.strict) {
                warn(options, offset, "trailing_data",
                     build_error_msg("Ignoring ", in.remaining(), " trailing byte(s) after the last chunk"));
                break;
            }

            // Slice exactly one chunk, or whatever is left when the
            // declared length runs past the end
            std::uint64_t extent = chunk::overhead;
            if (in.remaining() >= 4) {
                extent += in.peek_u32_be();
            }
            auto slice = static_cast<std::size_t>(std::min<std::uint64_t>(extent, in.remaining()));

            try {
                chunks.push_back(chunk::parse(in.cursor(), slice, options));
            } catch (const malformed_chunk& e) {
                throw format_error(e, offset, build_error_msg("Chunk at offset ", offset, ": ", e.what()));
            }
            offsets.push_back(offset);
            in.skip(slice);
        }

        check_structure(chunks, offsets, options);
        return png(std::move(chunks));
    }

    png png::parse(const std::vector<std::byte>& bytes) {
        return parse(bytes, parse_options{});
    }

    png png::load(std::istream& stream, const parse_options& options) {
        PNGME_THROW_IO_UNLESS(stream.good(), "Stream in bad state");

        std::vector<std::byte> bytes;
        char buffer[4096];
        while (stream.read(buffer, sizeof(buffer)) || stream.gcount() > 0) {
            const auto* p = reinterpret_cast<const std::byte*>(buffer);
            bytes.insert(bytes.end(), p, p + stream.gcount());
        }
        PNGME_THROW_IO_IF(stream.bad(), "Stream read failed after ", bytes.size(), " bytes");

        return parse(bytes, options);
    }

    png png::load(std::istream& stream) {
        return load(stream, parse_options{});
    }

    void png::append_chunk(chunk c) {
        m_chunks.push_back(std::move(c));
    }

    chunk png::remove_chunk(std::string_view type) {
        auto it = find(type);
        if (it == m_chunks.end()) {
            throw not_found_error(std::string(type), build_error_msg("Cannot find chunk type ", type));
        }
        chunk removed = *it;
        m_chunks.erase(it);
        return removed;
    }

    const chunk* png::chunk_by_type(std::string_view type) const {
        auto it = find(type);
        return it == m_chunks.end() ? nullptr : &*it;
    }

    png::const_iterator png::find(std::string_view type) const {
        return std::find_if(m_chunks.begin(), m_chunks.end(), [type](const chunk& c) {
            return c.type().to_string_view() == type;
        });
    }

    std::vector<std::byte> png::to_bytes() const {
        std::size_t total = signature.size();
        for (const auto& c : m_chunks) {
            total += chunk::overhead + c.length();
        }

        std::vector<std::byte> out;
        out.reserve(total);
        const auto* sig = reinterpret_cast<const std::byte*>(signature.data());
        out.insert(out.end(), sig, sig + signature.size());
        for (const auto& c : m_chunks) {
            c.write_to(out);
        }
        return out;
    }
}
