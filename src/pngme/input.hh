//
// Bounds-checked cursor over an in-memory byte buffer.
//

#pragma once

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <cstring>

#include <pngme/exceptions.hh>
#include <pngme/endian.hh>
#include <pngme/chunk_type.hh>

namespace pngme {

    // Non-owning reader; the buffer must outlive it
    class PNGME_EXPORT buffer_reader {
        public:
            enum whence_t {
                set,
                cur,
                end
            };

        public:
            buffer_reader(const std::byte* data, std::size_t size);
            explicit buffer_reader(const std::vector<std::byte>& data);

            // Reads up to size bytes, returns the number actually read
            std::size_t read(void* dst, std::size_t size);
            void seek(std::uint64_t offset, whence_t whence);
            void skip(std::size_t size);

            [[nodiscard]] std::uint64_t tell() const { return m_position; }
            [[nodiscard]] std::uint64_t size() const { return m_size; }
            [[nodiscard]] std::size_t remaining() const { return m_size - m_position; }
            [[nodiscard]] bool at_end() const { return m_position == m_size; }

            // Pointer to the byte at the cursor
            [[nodiscard]] const std::byte* cursor() const { return m_data + m_position; }

            // Convenience methods, throw io_error on short reads
            std::vector<std::byte> read_exact(std::size_t size) {
                PNGME_THROW_IO_IF(size > remaining(), "Unexpected end of data: requested ", size,
                                  " bytes at offset ", m_position, ", only ", remaining(), " available");
                std::vector<std::byte> buffer(size);
                read(buffer.data(), size);
                return buffer;
            }

            // Big-endian u32 at the cursor
            std::uint32_t read_u32_be() {
                std::uint32_t value = peek_u32_be();
                m_position += sizeof(value);
                return value;
            }

            [[nodiscard]] std::uint32_t peek_u32_be() const {
                PNGME_THROW_IO_IF(sizeof(std::uint32_t) > remaining(), "Failed to read 4 bytes at offset ",
                                  m_position);
                std::uint32_t value;
                std::memcpy(&value, cursor(), sizeof(value));
                return swap32be(value);
            }

            chunk_type read_chunk_type();

        private:
            const std::byte* m_data;
            std::size_t m_size;
            std::size_t m_position;
    };
}
