/**
 * @file validation.hh
 * @brief Validation errors and options for chunk type codes
 * @author Igor
 * @date 21/08/2025
 */

#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>
#include <pngchunk/export_pngchunk.h>

namespace pngchunk {

    /**
     * @enum validation_error
     * @brief Reason a chunk type code was rejected
     */
    enum class validation_error {
        wrong_length,   ///< Text input is not exactly 4 bytes long
        non_alphabetic, ///< At least one byte is not an ASCII letter
        reserved_bit    ///< Third byte is lowercase (strict mode only)
    };

    /**
     * @brief Short stable name of a validation error
     * @param e Error code
     * @return "wrong_length", "non_alphabetic" or "reserved_bit"
     */
    PNGCHUNK_EXPORT std::string_view to_string(validation_error e) noexcept;

    /**
     * @struct validation_options
     * @brief Configuration for the checked chunk type factories
     */
    struct validation_options {
        /**
         * @brief Strict validation mode
         *
         * When false (default) a code is accepted as soon as all four
         * bytes are ASCII letters; the reserved bit is not checked.
         * When true the third byte must also be uppercase, otherwise
         * construction fails with validation_error::reserved_bit.
         */
        bool strict = false;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param category Warning category (e.g., "reserved_bit")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * Called by the checked factories in non-strict mode when a code is
         * accepted but is not structurally valid. If not set, warnings are
         * silently ignored.
         */
        warning_handler on_warning;
    };

    /**
     * @brief Check four raw bytes against the construction rules
     * @param bytes Candidate chunk type bytes
     * @param opts Validation options (on_warning is not called)
     * @return The reason of rejection, or nullopt if the bytes are acceptable
     */
    PNGCHUNK_EXPORT std::optional<validation_error> validate(const std::array<std::uint8_t, 4>& bytes,
                                                             const validation_options& opts = {});

    /**
     * @brief Check text against the construction rules
     * @param text Candidate chunk type text
     * @param opts Validation options (on_warning is not called)
     * @return The reason of rejection, or nullopt if the text is acceptable
     */
    PNGCHUNK_EXPORT std::optional<validation_error> validate(std::string_view text,
                                                             const validation_options& opts = {});

} // namespace pngchunk
