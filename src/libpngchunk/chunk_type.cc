//
// Created by igor on 21/08/2025.
//

#include <ostream>
#include <iomanip>

#include <pngchunk/chunk_type.hh>
#include <pngchunk/exceptions.hh>
#include "text.hh"

namespace pngchunk {
    namespace {
        // Longest input prefix quoted in an error message
        constexpr std::size_t max_shown_input = 16;

        std::size_t first_non_alpha(const chunk_type::bytes_type& bytes) {
            std::size_t i = 0;
            while (i < bytes.size() && ascii::is_alpha(bytes[i])) {
                ++i;
            }
            return i;
        }

        [[noreturn]] void throw_rejected(validation_error e, const chunk_type::bytes_type& bytes) {
            switch (e) {
                case validation_error::non_alphabetic: {
                    auto i = first_non_alpha(bytes);
                    THROW_CHUNK_TYPE(e, "Chunk type ", quoted_bytes(bytes), " is not alphabetic: byte ", i,
                                     " is 0x", std::hex, std::setfill('0'), std::setw(2),
                                     static_cast<unsigned>(bytes[i]));
                }
                case validation_error::reserved_bit:
                    THROW_CHUNK_TYPE(e, "Chunk type ", quoted_bytes(bytes),
                                     " has the reserved bit set: byte 2 '",
                                     static_cast<char>(bytes[2]), "' is lowercase");
                case validation_error::wrong_length:
                    break;
            }
            THROW_CHUNK_TYPE(e, "Chunk type ", quoted_bytes(bytes), " rejected: ", to_string(e));
        }

        // Accepted but not structurally valid codes are reported, never rejected
        void warn_if_not_valid(const chunk_type& ct, const validation_options& opts) {
            if (opts.on_warning && !ct.is_valid()) {
                auto msg = build_error_msg("Chunk type ", quoted_bytes(ct.bytes()),
                                           " has the reserved bit set: byte 2 '",
                                           static_cast<char>(ct.bytes()[2]), "' is lowercase");
                opts.on_warning(to_string(validation_error::reserved_bit), msg);
            }
        }
    }

    chunk_type chunk_type::from_bytes(const bytes_type& bytes, const validation_options& opts) {
        if (auto e = validate(bytes, opts)) {
            throw_rejected(*e, bytes);
        }
        chunk_type ct(bytes);
        warn_if_not_valid(ct, opts);
        return ct;
    }

    std::optional<chunk_type> chunk_type::try_from_bytes(const bytes_type& bytes, const validation_options& opts,
                                                         validation_error* reason) {
        if (auto e = validate(bytes, opts)) {
            if (reason) {
                *reason = *e;
            }
            return std::nullopt;
        }
        chunk_type ct(bytes);
        warn_if_not_valid(ct, opts);
        return ct;
    }

    chunk_type chunk_type::from_string(std::string_view text, const validation_options& opts) {
        if (text.size() != 4) {
            bool truncated = text.size() > max_shown_input;
            THROW_CHUNK_TYPE(validation_error::wrong_length,
                             "Chunk type must be 4 bytes long, got ", text.size(), " bytes: ",
                             quoted_bytes(text.substr(0, max_shown_input)), truncated ? "..." : "");
        }
        return from_bytes(bytes_of(text), opts);
    }

    std::optional<chunk_type> chunk_type::try_from_string(std::string_view text, const validation_options& opts,
                                                          validation_error* reason) {
        if (text.size() != 4) {
            if (reason) {
                *reason = validation_error::wrong_length;
            }
            return std::nullopt;
        }
        return try_from_bytes(bytes_of(text), opts, reason);
    }

    std::string chunk_type::to_string() const {
        return {reinterpret_cast<const char*>(m_bytes.data()), m_bytes.size()};
    }

    std::ostream& operator<<(std::ostream& os, const chunk_type& ct) {
        if (os.flags() & std::ios::hex) {
            auto flags = os.flags();
            auto fill = os.fill();
            os << "0x" << std::hex << std::setfill('0') << std::setw(8) << ct.to_uint32();
            os.flags(flags);
            os.fill(fill);
        } else {
            os << quoted_bytes(ct.bytes());
        }
        return os;
    }
}
