//
// Created by igor on 15/08/2025.
//

#include <pngchunk/chunk_error.hh>

#include <ostream>
#include <sstream>

namespace pngchunk {
    namespace {
        struct error_printer {
            std::ostream& os;

            void operator()(const not_alphabetic& e) const {
                os << "Chunk type byte " << static_cast<unsigned>(e.value) << " at position " << e.position
                   << " is not an ASCII letter (A-Z, a-z)";
            }

            void operator()(const too_short& e) const {
                os << "Input too short: need at least " << e.required << " bytes, got " << e.available;
            }

            void operator()(const truncated& e) const {
                os << "Chunk truncated: declared payload of " << e.declared
                   << " bytes plus 4 CRC bytes, but only " << e.available << " bytes follow the header";
            }

            void operator()(const checksum_mismatch& e) const {
                auto flags = os.flags();
                os << std::hex << "CRC mismatch: declared 0x" << e.declared << ", computed 0x" << e.computed;
                os.flags(flags);
            }

            void operator()(const decode_error& e) const {
                os << "Payload is not valid UTF-8 at offset " << e.offset;
            }

            void operator()(const size_limit& e) const {
                os << "Chunk declares " << e.declared << " bytes, exceeding max allowed " << e.limit;
            }
        };
    }

    std::string describe(const chunk_error& err) {
        std::ostringstream oss;
        oss << err;
        return oss.str();
    }

    std::ostream& operator<<(std::ostream& os, const chunk_error& err) {
        std::visit(error_printer{os}, err);
        return os;
    }

} // namespace pngchunk
