//
// Whole-file reading and writing.
//

#include <pngme/file_io.hh>
#include <pngme/exceptions.hh>

#include <fstream>

namespace pngme {

    std::vector<std::byte> read_file(const std::filesystem::path& path) {
        std::ifstream file(path, std::ios::binary | std::ios::ate);
        PNGME_THROW_IO_UNLESS(file, "Failed to open file: ", path.string());

        auto size = file.tellg();
        PNGME_THROW_IO_IF(size == std::streampos(-1), "Failed to get size of file: ", path.string());
        file.seekg(0, std::ios::beg);

        std::vector<std::byte> data(static_cast<std::size_t>(size));
        file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()));
        PNGME_THROW_IO_IF(file.gcount() != static_cast<std::streamsize>(data.size()),
                          "Short read from ", path.string(), ": expected ", data.size(),
                          " bytes, got ", file.gcount());
        return data;
    }

    void write_file(const std::filesystem::path& path, const std::vector<std::byte>& bytes) {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        PNGME_THROW_IO_UNLESS(file, "Failed to open file for writing: ", path.string());

        file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        file.flush();
        PNGME_THROW_IO_UNLESS(file, "Failed to write ", bytes.size(), " bytes to ", path.string());
    }
}
