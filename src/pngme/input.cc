//
// Bounds-checked cursor over an in-memory byte buffer.
//

#include <algorithm>

#include "input.hh"

namespace pngme {
    buffer_reader::buffer_reader(const std::byte* data, std::size_t size)
        : m_data(data), m_size(size), m_position(0) {
        PNGME_THROW_IO_IF(data == nullptr && size != 0, "Null buffer of size ", size);
    }

    buffer_reader::buffer_reader(const std::vector<std::byte>& data)
        : buffer_reader(data.data(), data.size()) {}

    std::size_t buffer_reader::read(void* dst, std::size_t size) {
        PNGME_THROW_IO_UNLESS(dst || size == 0, "Null buffer in read");

        size = std::min(size, remaining());
        if (size == 0) {
            return 0;
        }

        std::memcpy(dst, cursor(), size);
        m_position += size;
        return size;
    }

    void buffer_reader::seek(std::uint64_t offset, whence_t whence) {
        std::uint64_t new_pos;

        switch (whence) {
            case set:
                new_pos = offset;
                break;
            case cur:
                new_pos = m_position + offset;
                break;
            case end:
                PNGME_THROW_IO_IF(offset > m_size, "Cannot seek ", offset, " bytes before the start of a ",
                                  m_size, " byte buffer");
                new_pos = m_size - offset;
                break;
            default:
                PNGME_THROW_IO("Invalid whence value: ", static_cast<int>(whence));
        }

        PNGME_THROW_IO_IF(new_pos > m_size, "Cannot seek to offset ", new_pos,
                          " - buffer size is only ", m_size, " bytes");

        m_position = static_cast<std::size_t>(new_pos);
    }

    void buffer_reader::skip(std::size_t size) {
        seek(size, cur);
    }

    chunk_type buffer_reader::read_chunk_type() {
        std::array<char, 4> data;
        std::size_t actual = read(data.data(), 4);
        PNGME_THROW_IO_IF(actual != 4, "Failed to read chunk type at offset ", m_position - actual);
        return chunk_type::from_bytes(data.data());
    }
}
