/**
 * @file chunk_encode.cpp
 * @brief Encode a text message as a chunk
 *
 * Builds a chunk of the given type carrying the message and appends its
 * serialized form to the output file.
 */

#include <pngchunk/chunk_stream.hh>
#include <algorithm>
#include <iostream>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

int main(int argc, char* argv[]) {
    if (argc != 4) {
        std::cout << "Usage: " << argv[0] << " <output> <type> <message>\n";
        std::cout << "\n";
        std::cout << "Appends one chunk, e.g. " << argv[0] << " out.bin RuSt \"hello\"\n";
        return 1;
    }

    auto type = pngchunk::chunk_type::from_text(argv[2]);
    if (!type) {
        std::cerr << "Error: invalid chunk type '" << argv[2] << "': " << type.error() << "\n";
        return 1;
    }
    if (!type->is_valid()) {
        std::cerr << "Warning: chunk type " << *type << " has the reserved bit set\n";
    }

    std::string message(argv[3]);
    std::vector<std::byte> payload(message.size());
    std::transform(message.begin(), message.end(), payload.begin(),
                   [](char ch) { return static_cast<std::byte>(ch); });

    std::ofstream out(argv[1], std::ios::binary | std::ios::app);
    if (!out) {
        std::cerr << "Error: Cannot open file '" << argv[1] << "'\n";
        return 1;
    }

    try {
        pngchunk::chunk c(*type, std::move(payload));
        pngchunk::write_chunk(out, c);
        std::cout << "Wrote " << c << " (" << c.serialized_size() << " bytes)\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
