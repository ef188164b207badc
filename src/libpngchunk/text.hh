//
// Created by igor on 21/08/2025.
//

#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string_view>

#include <pngchunk/chunk_type.hh>

namespace pngchunk {
    // Copies the first 4 bytes of text; text must hold at least 4 bytes
    inline chunk_type::bytes_type bytes_of(std::string_view text) noexcept {
        chunk_type::bytes_type bytes;
        for (std::size_t i = 0; i < bytes.size(); ++i) {
            bytes[i] = static_cast<std::uint8_t>(text[i]);
        }
        return bytes;
    }

    // Stream adapter writing bytes in single quotes, with non-printable
    // bytes escaped as \xNN
    struct quoted_bytes {
        const std::uint8_t* data;
        std::size_t size;

        explicit quoted_bytes(std::string_view text)
            : data(reinterpret_cast<const std::uint8_t*>(text.data())), size(text.size()) {}

        explicit quoted_bytes(const chunk_type::bytes_type& bytes)
            : data(bytes.data()), size(bytes.size()) {}
    };

    std::ostream& operator<<(std::ostream& os, const quoted_bytes& q);
}
