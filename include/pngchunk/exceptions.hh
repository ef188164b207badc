/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the pngchunk library
 * @author Igor
 * @date 21/08/2025
 *
 * This file defines the exception hierarchy and convenience macros for
 * error handling throughout the pngchunk library.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <sstream>

#include <pngchunk/validation.hh>

namespace pngchunk {

    /**
     * @class pngchunk_error
     * @brief Base exception class for all pngchunk errors
     *
     * All library exceptions derive from this class, making it easy
     * to catch all pngchunk-specific errors with a single catch block.
     */
    class pngchunk_error : public std::runtime_error {
    public:
        explicit pngchunk_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class chunk_type_error
     * @brief Thrown when a chunk type code fails validation
     *
     * The reason is available as a machine-readable code so callers
     * can tell a truncated identifier from a corrupted one.
     */
    class chunk_type_error : public pngchunk_error {
    public:
        chunk_type_error(validation_error code, const std::string& msg)
            : pngchunk_error(msg), m_code(code) {}

        [[nodiscard]] validation_error code() const noexcept { return m_code; }

    private:
        validation_error m_code;
    };

    /**
     * @brief Build error message from variadic arguments
     * @tparam Args Variadic template arguments
     * @param args Arguments to concatenate into error message
     * @return Concatenated error message string
     */
    template<typename... Args>
    std::string build_error_msg(Args&&... args) {
        std::ostringstream oss;
        ((oss << args), ...);
        return oss.str();
    }

    /**
     * @defgroup ExceptionMacros Exception Throwing Macros
     * @{
     */

    /**
     * @def THROW_CHUNK_TYPE
     * @brief Throw a chunk_type_error with the given code and formatted message
     * @param code validation_error value
     * @param ... Variable arguments to format into error message
     */
    #define THROW_CHUNK_TYPE(code, ...) \
        throw ::pngchunk::chunk_type_error((code), ::pngchunk::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_CHUNK_TYPE_IF
     * @brief Conditionally throw a chunk_type_error
     * @param condition Condition to check
     * @param code validation_error value
     * @param ... Variable arguments for error message if condition is true
     */
    #define THROW_CHUNK_TYPE_IF(condition, code, ...) \
        do { if (condition) THROW_CHUNK_TYPE(code, __VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngchunk
