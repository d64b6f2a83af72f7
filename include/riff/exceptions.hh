/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the RIFF library
 *
 * This file defines the exception hierarchy, the error codes carried by
 * every exception and the convenience macros used throughout the library.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <sstream>

#include <riff/export_riff.h>

namespace riff {

    /**
     * @enum errc
     * @brief Kind of failure carried by every riff_error
     */
    enum class errc {
        too_small,             ///< Fewer than 8 bytes where a chunk header is expected
        too_small_for_type,    ///< Container lacks the 4 bytes of its form type
        payload_len_mismatch,  ///< Declared length exceeds the available bytes
        invalid_header,        ///< Root id is not RIFF
        utf8_error,            ///< FourCC bytes are not valid UTF-8
        length_mismatch,       ///< FourCC text is not exactly 4 bytes
        io,                    ///< Backing store open/read/seek failure
        size_overflow,         ///< Encoded length does not fit the 32-bit field
        invalid_chunk_kind,    ///< Chunk id does not match the requested classification
        depth_limit            ///< Container nesting exceeds parse_options::max_depth
    };

    /**
     * @brief Stable name of an error code, e.g. "too_small"
     */
    RIFF_EXPORT std::string_view to_string(errc code) noexcept;

    /**
     * @class riff_error
     * @brief Base exception class for all RIFF-related errors
     *
     * All library exceptions derive from this class, making it easy
     * to catch every RIFF-specific error with a single catch block.
     */
    class riff_error : public std::runtime_error {
    public:
        riff_error(errc code, const std::string& msg)
            : std::runtime_error(msg), m_code(code) {}

        [[nodiscard]] errc code() const noexcept { return m_code; }

    private:
        errc m_code;
    };

    /**
     * @class io_error
     * @brief Exception for I/O related errors
     *
     * Thrown when opening, reading or seeking the backing store fails.
     */
    class io_error : public riff_error {
    public:
        explicit io_error(const std::string& msg)
            : riff_error(errc::io, msg) {}
    };

    /**
     * @class parse_error
     * @brief Exception for structural errors found while reading
     */
    class parse_error : public riff_error {
    public:
        parse_error(errc code, const std::string& msg)
            : riff_error(code, msg) {}
    };

    /**
     * @class encode_error
     * @brief Exception for chunk trees that cannot be built or serialized
     */
    class encode_error : public riff_error {
    public:
        encode_error(errc code, const std::string& msg)
            : riff_error(code, msg) {}
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
     * @def THROW_IO
     * @brief Throw an io_error with formatted message
     */
    #define THROW_IO(...) \
        throw ::riff::io_error(::riff::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_PARSE
     * @brief Throw a parse_error of the given code with formatted message
     */
    #define THROW_PARSE(code, ...) \
        throw ::riff::parse_error((code), ::riff::build_error_msg(__VA_ARGS__))

    /**
     * @def THROW_ENCODE
     * @brief Throw an encode_error of the given code with formatted message
     */
    #define THROW_ENCODE(code, ...) \
        throw ::riff::encode_error((code), ::riff::build_error_msg(__VA_ARGS__))

    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    #define THROW_PARSE_IF(condition, code, ...) \
        do { if (condition) THROW_PARSE(code, __VA_ARGS__); } while(0)

    #define THROW_ENCODE_IF(condition, code, ...) \
        do { if (condition) THROW_ENCODE(code, __VA_ARGS__); } while(0)

    #define THROW_IO_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_IO(__VA_ARGS__); } while(0)

    #define THROW_PARSE_UNLESS(condition, code, ...) \
        do { if (!(condition)) THROW_PARSE(code, __VA_ARGS__); } while(0)

    #define THROW_ENCODE_UNLESS(condition, code, ...) \
        do { if (!(condition)) THROW_ENCODE(code, __VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace riff
