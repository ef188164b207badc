//
// Created by igor on 21/08/2025.
//

#pragma once

#include <cstdint>

namespace pngchunk::ascii {
    // Byte classification independent of the current C locale

    constexpr bool is_upper(std::uint8_t c) noexcept {
        return c >= 'A' && c <= 'Z';
    }

    constexpr bool is_lower(std::uint8_t c) noexcept {
        return c >= 'a' && c <= 'z';
    }

    constexpr bool is_alpha(std::uint8_t c) noexcept {
        return is_upper(c) || is_lower(c);
    }

    constexpr bool is_printable(std::uint8_t c) noexcept {
        return c >= 32 && c <= 126;
    }
}
