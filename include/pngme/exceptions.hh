/**
 * @file exceptions.hh
 * @brief Exception classes and throwing macros for the pngme library
 *
 * Every error raised by the library derives from pngme_error, so a single
 * catch block is enough for callers that only need a diagnostic.
 */

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <sstream>

namespace pngme {

    /**
     * @class pngme_error
     * @brief Base exception class for all pngme errors
     */
    class pngme_error : public std::runtime_error {
    public:
        explicit pngme_error(const std::string& msg)
            : std::runtime_error(msg) {}
    };

    /**
     * @class io_error
     * @brief Exception for I/O related errors
     *
     * Thrown when opening, reading or writing a file fails, and when a
     * buffer read runs past the end of the data.
     */
    class io_error : public pngme_error {
    public:
        explicit io_error(const std::string& msg)
            : pngme_error(msg) {}
    };

    /**
     * @class invalid_chunk_type
     * @brief A chunk type code is not exactly four ASCII letters
     */
    class invalid_chunk_type : public pngme_error {
    public:
        invalid_chunk_type(const std::string& text, const std::string& msg)
            : pngme_error(msg), m_text(text) {}

        /// Offending type code, non-printable bytes escaped
        [[nodiscard]] const std::string& text() const noexcept { return m_text; }

    private:
        std::string m_text;
    };

    /**
     * @class malformed_chunk
     * @brief A byte slice does not hold a valid chunk
     */
    class malformed_chunk : public pngme_error {
    public:
        enum class kind {
            truncated,          ///< fewer than 12 bytes
            invalid_type,       ///< type code is not four ASCII letters
            length_mismatch,    ///< fewer payload bytes than declared
            checksum_mismatch,  ///< stored CRC differs from the computed one
            too_large           ///< declared length above parse_options::max_chunk_size
        };

        malformed_chunk(kind k, const std::string& msg)
            : pngme_error(msg), m_kind(k) {}

        [[nodiscard]] kind reason() const noexcept { return m_kind; }

    private:
        kind m_kind;
    };

    /**
     * @class format_error
     * @brief A byte stream is not a valid PNG container
     *
     * Either the signature is wrong, or one of the chunks failed to parse.
     * In the latter case the chunk's failure kind and its offset in the
     * stream are kept.
     */
    class format_error : public pngme_error {
    public:
        enum class kind {
            bad_signature,
            chunk
        };

        explicit format_error(const std::string& msg)
            : pngme_error(msg), m_kind(kind::bad_signature), m_chunk_reason(), m_offset(0) {}

        format_error(const malformed_chunk& cause, std::uint64_t offset, const std::string& msg)
            : pngme_error(msg), m_kind(kind::chunk), m_chunk_reason(cause.reason()), m_offset(offset) {}

        [[nodiscard]] kind reason() const noexcept { return m_kind; }

        /// Meaningful only when reason() == kind::chunk
        [[nodiscard]] malformed_chunk::kind chunk_reason() const noexcept { return m_chunk_reason; }

        /// Offset of the offending chunk header in the stream
        [[nodiscard]] std::uint64_t offset() const noexcept { return m_offset; }

    private:
        kind m_kind;
        malformed_chunk::kind m_chunk_reason;
        std::uint64_t m_offset;
    };

    /**
     * @class not_found_error
     * @brief No chunk of the requested type exists in the container
     */
    class not_found_error : public pngme_error {
    public:
        not_found_error(const std::string& type, const std::string& msg)
            : pngme_error(msg), m_type(type) {}

        [[nodiscard]] const std::string& type() const noexcept { return m_type; }

    private:
        std::string m_type;
    };

    /**
     * @class decode_error
     * @brief A chunk payload is not valid UTF-8 text
     */
    class decode_error : public pngme_error {
    public:
        decode_error(std::size_t offset, const std::string& msg)
            : pngme_error(msg), m_offset(offset) {}

        /// Offset in the payload of the first invalid byte sequence
        [[nodiscard]] std::size_t offset() const noexcept { return m_offset; }

    private:
        std::size_t m_offset;
    };

    /**
     * @brief Build error message from variadic arguments
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
     * @def PNGME_THROW_IO
     * @brief Throw an io_error with formatted message
     */
    #define PNGME_THROW_IO(...) \
        throw ::pngme::io_error(::pngme::build_error_msg(__VA_ARGS__))

    /**
     * @def PNGME_THROW_MALFORMED
     * @brief Throw a malformed_chunk of the given kind with formatted message
     */
    #define PNGME_THROW_MALFORMED(k, ...) \
        throw ::pngme::malformed_chunk(::pngme::malformed_chunk::kind::k, ::pngme::build_error_msg(__VA_ARGS__))

    /**
     * @def PNGME_THROW_IO_IF
     * @brief Conditionally throw an io_error
     */
    #define PNGME_THROW_IO_IF(condition, ...) \
        do { if (condition) PNGME_THROW_IO(__VA_ARGS__); } while(0)

    /**
     * @def PNGME_THROW_IO_UNLESS
     * @brief Throw an io_error unless condition is true
     */
    #define PNGME_THROW_IO_UNLESS(condition, ...) \
        do { if (!(condition)) PNGME_THROW_IO(__VA_ARGS__); } while(0)

    /**
     * @def PNGME_THROW_MALFORMED_IF
     * @brief Conditionally throw a malformed_chunk of the given kind
     */
    #define PNGME_THROW_MALFORMED_IF(condition, k, ...) \
        do { if (condition) PNGME_THROW_MALFORMED(k, __VA_ARGS__); } while(0)

    /** @} */ // end of ExceptionMacros group

} // namespace pngme
