/**
 * @file parse_options.hh
 * @brief Parsing options for PNG chunk streams
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>
#include <limits>

namespace pngme {

    // Largest chunk length the PNG format allows (2^31 - 1)
    inline constexpr std::uint32_t png_max_chunk_length = 0x7FFFFFFFu;

    /**
     * @struct parse_options
     * @brief Configuration options for parsing PNG chunk streams
     *
     * Controls strictness, the chunk size limit and warning reporting.
     */
    struct parse_options {
        /**
         * @brief Strict parsing mode
         *
         * When true, bytes after the last complete chunk are an error.
         * When false, trailing bytes too short to hold a chunk are reported
         * as a warning and dropped.
         */
        bool strict = true;

        /**
         * @brief Maximum allowed chunk payload length in bytes
         *
         * Defaults to no limit beyond the 32-bit length field. Set it to
         * png_max_chunk_length to enforce the PNG format's own limit.
         */
        std::uint32_t max_chunk_size = std::numeric_limits<std::uint32_t>::max();

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset Offset in the stream where the warning occurred
         * @param category Warning category ("structure", "reserved_bit", "trailing_data")
         * @param message Human-readable warning message
         */
        using warning_handler = std::function<void(
            std::uint64_t offset,
            std::string_view category,
            std::string_view message
        )>;

        /**
         * @brief Optional warning handler callback
         *
         * If set, will be called for non-fatal issues during parsing.
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;
    };

} // namespace pngme
