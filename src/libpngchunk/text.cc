//
// Created by igor on 21/08/2025.
//

#include <ostream>
#include <iomanip>

#include "text.hh"

namespace pngchunk {
    std::ostream& operator<<(std::ostream& os, const quoted_bytes& q) {
        auto flags = os.flags();
        auto fill = os.fill();

        os << '\'';
        for (std::size_t i = 0; i < q.size; ++i) {
            std::uint8_t c = q.data[i];
            if (ascii::is_printable(c)) {
                os << static_cast<char>(c);
            } else {
                os << "\\x" << std::hex << std::nouppercase << std::setfill('0') << std::setw(2)
                   << static_cast<unsigned>(c);
            }
        }
        os << '\'';

        os.flags(flags);
        os.fill(fill);
        return os;
    }
}
