/**
 * @file simple_example.cpp
 * @brief Simple example demonstrating basic pngme usage
 *
 * This is a minimal example showing how to parse a PNG file
 * and print information about its chunks.
 */

#include <pngme/png.hh>
#include <iostream>
#include <fstream>

int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::cout << "Usage: " << argv[0] << " <file>\n";
        std::cout << "\n";
        std::cout << "Simple example that lists all chunks in a PNG file.\n";
        return 1;
    }

    // Open the file
    std::ifstream file(argv[1], std::ios::binary);
    if (!file) {
        std::cerr << "Error: Cannot open file '" << argv[1] << "'\n";
        return 1;
    }

    std::cout << "Parsing: " << argv[1] << "\n";
    std::cout << "====================\n\n";

    pngme::parse_options options;
    options.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view message) {
        std::cerr << "Warning (" << category << ") at " << offset << ": " << message << "\n";
    };

    try {
        auto image = pngme::png::load(file, options);

        for (const auto& chunk : image) {
            const auto& type = chunk.type();
            std::cout << "Chunk: " << type << " (" << chunk.length() << " bytes, crc "
                      << std::hex << chunk.crc() << std::dec << ")\n";
            std::cout << "  " << (type.is_critical() ? "critical" : "ancillary")
                      << ", " << (type.is_public() ? "public" : "private")
                      << ", " << (type.is_safe_to_copy() ? "safe to copy" : "unsafe to copy") << "\n";
        }

        std::cout << "\n" << image.size() << " chunk(s), parsing completed successfully!\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
