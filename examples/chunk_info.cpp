/**
 * @file chunk_info.cpp
 * @brief Print the fields of one serialized chunk
 *
 * Reads a single chunk from a file, optionally starting at a byte offset
 * (use 8 to skip the PNG signature), and prints its type properties,
 * length and checksum. The payload is printed when it is valid text.
 */

#include <pngchunk/chunk_stream.hh>
#include <iostream>
#include <fstream>
#include <string>

int main(int argc, char* argv[]) {
    if (argc < 2 || argc > 3) {
        std::cout << "Usage: " << argv[0] << " <file> [offset]\n";
        std::cout << "\n";
        std::cout << "Decodes the chunk found at offset (default 0).\n";
        return 1;
    }

    std::ifstream file(argv[1], std::ios::binary);
    if (!file) {
        std::cerr << "Error: Cannot open file '" << argv[1] << "'\n";
        return 1;
    }

    try {
        if (argc == 3) {
            file.seekg(std::stoll(argv[2]));
        }

        pngchunk::parse_options options;
        options.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view message) {
            std::cerr << "Warning [" << category << "] at offset " << offset << ": " << message << "\n";
        };

        auto c = pngchunk::read_chunk(file, options);
        if (!c) {
            std::cerr << "Error: " << c.error() << "\n";
            return 1;
        }

        const auto& type = c->type();
        std::cout << *c << "\n";
        std::cout << "  critical:     " << std::boolalpha << type.is_critical() << "\n";
        std::cout << "  public:       " << type.is_public() << "\n";
        std::cout << "  reserved ok:  " << type.is_reserved_bit_valid() << "\n";
        std::cout << "  safe to copy: " << type.is_safe_to_copy() << "\n";

        auto text = c->data_as_text();
        if (text) {
            std::cout << "  text: " << *text << "\n";
        } else {
            std::cout << "  binary payload (" << text.error() << ")\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
