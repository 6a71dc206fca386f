//
// Created by igor on 15/08/2025.
//

#include <pngchunk/chunk_type.hh>

#include <algorithm>
#include <ostream>

namespace pngchunk {

    result<chunk_type> chunk_type::from_bytes(const code_type& code) {
        auto bad = std::find_if_not(code.begin(), code.end(), &chunk_type::is_alphabetic);
        if (bad != code.end()) {
            return chunk_error(not_alphabetic{*bad, static_cast<std::size_t>(bad - code.begin())});
        }
        return chunk_type(code);
    }

    result<chunk_type> chunk_type::from_text(std::string_view text) {
        code_type code{};
        if (text.size() < code.size()) {
            return chunk_error(too_short{code.size(), text.size()});
        }
        std::copy_n(text.begin(), code.size(), code.begin());
        return from_bytes(code);
    }

    std::ostream& operator<<(std::ostream& os, const chunk_type& t) {
        return os << '\'' << t.to_string() << '\'';
    }

} // namespace pngchunk
