//
// Chunk type validation.
//

#include <pngme/chunk_type.hh>
#include <pngme/exceptions.hh>

#include <iomanip>
#include <sstream>

namespace pngme {
    namespace {
        // Printable form of four raw bytes, non-printable ones as \xNN
        std::string escape(const char* data, std::size_t size) {
            std::ostringstream os;
            for (std::size_t i = 0; i < size; i++) {
                auto c = static_cast<unsigned char>(data[i]);
                if (c >= 32 && c <= 126) {
                    os << static_cast<char>(c);
                } else {
                    os << "\\x" << std::hex << std::setfill('0') << std::setw(2)
                       << static_cast<unsigned>(c) << std::dec;
                }
            }
            return os.str();
        }
    }

    void chunk_type::reject(const std::array<char, 4>& bytes) {
        auto text = escape(bytes.data(), bytes.size());
        throw invalid_chunk_type(text, build_error_msg(text, " is not a valid chunk type"));
    }

    chunk_type chunk_type::from_bytes(const void* data) {
        const auto* p = static_cast<const char*>(data);
        return {p[0], p[1], p[2], p[3]};
    }

    chunk_type chunk_type::from_bytes(const std::array<std::uint8_t, 4>& bytes) {
        return from_bytes(bytes.data());
    }

    chunk_type chunk_type::parse(std::string_view text) {
        if (text.size() != 4) {
            auto escaped = escape(text.data(), text.size());
            throw invalid_chunk_type(escaped,
                build_error_msg(escaped, " is not a valid chunk type: expected 4 bytes, got ", text.size()));
        }
        return from_bytes(text.data());
    }
}
