//
// Created by igor on 21/08/2025.
//

#include <pngchunk/validation.hh>
#include <pngchunk/chunk_type.hh>
#include "text.hh"

namespace pngchunk {
    std::string_view to_string(validation_error e) noexcept {
        switch (e) {
            case validation_error::wrong_length:
                return "wrong_length";
            case validation_error::non_alphabetic:
                return "non_alphabetic";
            case validation_error::reserved_bit:
                return "reserved_bit";
        }
        // make compiler happy
        return "unknown";
    }

    std::optional<validation_error> validate(const std::array<std::uint8_t, 4>& bytes,
                                             const validation_options& opts) {
        auto ct = chunk_type::from_raw_bytes(bytes);
        if (!ct.is_alphabetic()) {
            return validation_error::non_alphabetic;
        }
        if (opts.strict && !ct.is_reserved_bit_valid()) {
            return validation_error::reserved_bit;
        }
        return std::nullopt;
    }

    std::optional<validation_error> validate(std::string_view text, const validation_options& opts) {
        if (text.size() != 4) {
            return validation_error::wrong_length;
        }
        return validate(bytes_of(text), opts);
    }
}
