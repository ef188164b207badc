/**
 * @file chunk_type.hh
 * @brief Four-byte chunk type code of a PNG-style container
 * @author Igor
 * @date 21/08/2025
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <pngchunk/export_pngchunk.h>
#include <pngchunk/ascii.hh>
#include <pngchunk/validation.hh>

namespace pngchunk {

    /**
     * @class chunk_type
     * @brief Immutable four-byte chunk type code
     *
     * The ASCII case of every byte carries one property bit:
     *
     * | byte | uppercase      | lowercase        |
     * |------|----------------|------------------|
     * | 0    | critical       | ancillary        |
     * | 1    | public         | private          |
     * | 2    | reserved (ok)  | reserved (bad)   |
     * | 3    | unsafe to copy | safe to copy     |
     *
     * The checked factories (from_bytes, from_string and their try_
     * variants) only require all four bytes to be ASCII letters. They do
     * NOT require the reserved bit to be valid unless
     * validation_options::strict is set; is_valid() is the separate,
     * stricter structural check.
     */
    class PNGCHUNK_EXPORT chunk_type {
    public:
        using bytes_type = std::array<std::uint8_t, 4>;

        /**
         * @brief Construct from bytes without any validation
         *
         * For input the caller has already verified, e.g. bytes copied
         * from a container that was checked as a whole.
         */
        static constexpr chunk_type from_raw_bytes(const bytes_type& bytes) noexcept {
            return chunk_type(bytes);
        }

        /**
         * @brief Construct from 4 bytes at @p data without any validation
         */
        static chunk_type from_raw_bytes(const void* data) noexcept {
            bytes_type bytes;
            std::memcpy(bytes.data(), data, 4);
            return chunk_type(bytes);
        }

        /**
         * @brief Construct from bytes, requiring all of them to be ASCII letters
         * @throws chunk_type_error with validation_error::non_alphabetic, or
         *         validation_error::reserved_bit in strict mode
         */
        static chunk_type from_bytes(const bytes_type& bytes, const validation_options& opts = {});

        /**
         * @brief Same as from_bytes() but reports failure as nullopt
         * @param reason If not null, receives the validation_error on failure
         *        and is left untouched on success
         */
        static std::optional<chunk_type> try_from_bytes(const bytes_type& bytes,
                                                        const validation_options& opts = {},
                                                        validation_error* reason = nullptr);

        /**
         * @brief Construct from text, case preserved
         * @throws chunk_type_error with validation_error::wrong_length if the
         *         text is not 4 bytes long, otherwise as from_bytes()
         */
        static chunk_type from_string(std::string_view text, const validation_options& opts = {});

        /**
         * @brief Same as from_string() but reports failure as nullopt
         * @param reason If not null, receives the validation_error on failure
         *        and is left untouched on success
         */
        static std::optional<chunk_type> try_from_string(std::string_view text,
                                                         const validation_options& opts = {},
                                                         validation_error* reason = nullptr);

        [[nodiscard]] constexpr const bytes_type& bytes() const noexcept { return m_bytes; }

        // Write the 4 bytes to dest
        void to_bytes(void* dest) const noexcept {
            std::memcpy(dest, m_bytes.data(), 4);
        }

        // Network byte order, as the code appears in a PNG stream
        [[nodiscard]] constexpr std::uint32_t to_uint32() const noexcept {
            return (std::uint32_t(m_bytes[0]) << 24) | (std::uint32_t(m_bytes[1]) << 16) |
                   (std::uint32_t(m_bytes[2]) << 8) | std::uint32_t(m_bytes[3]);
        }

        [[nodiscard]] constexpr bool is_critical() const noexcept { return ascii::is_upper(m_bytes[0]); }
        [[nodiscard]] constexpr bool is_ancillary() const noexcept { return !is_critical(); }
        [[nodiscard]] constexpr bool is_public() const noexcept { return ascii::is_upper(m_bytes[1]); }
        [[nodiscard]] constexpr bool is_private() const noexcept { return !is_public(); }
        [[nodiscard]] constexpr bool is_reserved_bit_valid() const noexcept { return ascii::is_upper(m_bytes[2]); }
        [[nodiscard]] constexpr bool is_safe_to_copy() const noexcept { return ascii::is_lower(m_bytes[3]); }

        [[nodiscard]] constexpr bool is_alphabetic() const noexcept {
            for (std::uint8_t c : m_bytes) {
                if (!ascii::is_alpha(c)) {
                    return false;
                }
            }
            return true;
        }

        [[nodiscard]] constexpr bool is_valid() const noexcept {
            return is_alphabetic() && is_reserved_bit_valid();
        }

        /**
         * @brief The 4 bytes as text, in original order and case
         *
         * Bytes are copied verbatim, so a code built with from_raw_bytes()
         * from non-ASCII data yields a string holding those same bytes.
         */
        [[nodiscard]] std::string to_string() const;

        // Byte-wise, case-sensitive
        bool operator==(const chunk_type& o) const noexcept { return m_bytes == o.m_bytes; }
        bool operator!=(const chunk_type& o) const noexcept { return !(*this == o); }

    private:
        constexpr explicit chunk_type(const bytes_type& bytes) noexcept
            : m_bytes(bytes) {}

        bytes_type m_bytes;
    };

    /**
     * @brief Diagnostic output: quoted, non-printable bytes escaped as \\xNN
     */
    PNGCHUNK_EXPORT std::ostream& operator<<(std::ostream& os, const chunk_type& ct);

    // Hash function
    struct chunk_type_hash {
        std::size_t operator()(const chunk_type& ct) const noexcept {
            return (static_cast<std::size_t>(ct.to_uint32()) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

    namespace literals {
        // Compile-time chunk type: "IHDR"_chunk. Anything but four ASCII
        // letters is rejected.
        constexpr chunk_type operator""_chunk(const char* str, std::size_t len) {
            if (len != 4) {
                throw std::invalid_argument("Chunk type literal must be exactly 4 characters");
            }
            for (std::size_t i = 0; i < len; ++i) {
                if (!ascii::is_alpha(static_cast<std::uint8_t>(str[i]))) {
                    throw std::invalid_argument("Chunk type literal must consist of ASCII letters");
                }
            }
            return chunk_type::from_raw_bytes(chunk_type::bytes_type{
                static_cast<std::uint8_t>(str[0]),
                static_cast<std::uint8_t>(str[1]),
                static_cast<std::uint8_t>(str[2]),
                static_cast<std::uint8_t>(str[3])
            });
        }
    }

} // namespace pngchunk

// Specialization for std::hash
namespace std {
    template<>
    struct hash<pngchunk::chunk_type> {
        std::size_t operator()(const pngchunk::chunk_type& ct) const noexcept {
            return pngchunk::chunk_type_hash{}(ct);
        }
    };
}
