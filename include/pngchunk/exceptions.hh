/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the PNG chunk library
 * @author Igor
 * @date 14/08/2025
 *
 * Malformed input is reported through chunk_error values (see chunk_error.hh).
 * Exceptions are kept for stream failures, precondition violations and for
 * unwrapping a failed result.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <sstream>

namespace pngchunk {

    /**
     * @class pngchunk_error
     * @brief Base exception class for all library errors
     *
     * All library exceptions derive from this class, making it easy
     * to catch them with a single catch block.
     */
    class pngchunk_error : public std::runtime_error {
    public:
        explicit pngchunk_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class io_error
     * @brief Exception for I/O related errors
     *
     * Thrown when the underlying stream fails while reading or writing.
     */
    class io_error : public pngchunk_error {
    public:
        explicit io_error(const std::string& msg)
            : pngchunk_error(msg) {}
    };

    /**
     * @class parse_error
     * @brief Exception for rejected input
     *
     * Thrown by result<T>::value() when the result holds a chunk_error.
     */
    class parse_error : public pngchunk_error {
    public:
        explicit parse_error(const std::string& msg)
            : pngchunk_error(msg) {}
    };

    /**
     * @class encode_error
     * @brief Exception for values that cannot be represented on the wire
     */
    class encode_error : public pngchunk_error {
    public:
        explicit encode_error(const std::string& msg)
            : pngchunk_error(msg) {}
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

    #define THROW_IO(...) \
        throw ::pngchunk::io_error(::pngchunk::build_error_msg(__VA_ARGS__))

    #define THROW_PARSE(...) \
        throw ::pngchunk::parse_error(::pngchunk::build_error_msg(__VA_ARGS__))

    #define THROW_ENCODE(...) \
        throw ::pngchunk::encode_error(::pngchunk::build_error_msg(__VA_ARGS__))

    #define THROW_IO_IF(condition, ...) \
        do { if (condition) THROW_IO(__VA_ARGS__); } while(0)

    #define THROW_PARSE_IF(condition, ...) \
        do { if (condition) THROW_PARSE(__VA_ARGS__); } while(0)

    #define THROW_ENCODE_IF(condition, ...) \
        do { if (condition) THROW_ENCODE(__VA_ARGS__); } while(0)

    #define THROW_IO_UNLESS(condition, ...) \
        do { if (!(condition)) THROW_IO(__VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngchunk
