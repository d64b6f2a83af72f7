/**
 * @file parse_options.hh
 * @brief Parsing options and configuration for RIFF files
 */

#pragma once

#include <functional>
#include <string_view>
#include <cstdint>

namespace riff {

    /**
     * @struct parse_options
     * @brief Configuration options for reading RIFF files
     *
     * Controls strictness, size and depth limits, and warning handling.
     * A file handle copies its options and hands them to every chunk and
     * iterator derived from it.
     */
    struct parse_options {
        /**
         * @brief Strict parsing mode
         *
         * When true, a child that does not fit inside its parent, or that
         * is larger than max_chunk_size, stops iteration with an error.
         * When false, a warning is emitted and the child is still yielded.
         */
        bool strict = true;

        /**
         * @brief Maximum allowed payload length of a child chunk
         */
        std::uint64_t max_chunk_size = 0xFFFFFFFFu;

        /**
         * @brief Maximum nesting depth for containers
         *
         * Bounds the recursive utilities (for_each_chunk, read_contents).
         * The root chunk is depth 0.
         */
        int max_depth = 64;

        /**
         * @typedef warning_handler
         * @brief Callback function type for handling warnings
         * @param offset File offset where warning occurred
         * @param category Warning category (e.g., "containment", "depth_limit")
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
         * If not set, warnings are silently ignored.
         */
        warning_handler on_warning;

        void warn(std::uint64_t offset, std::string_view category, std::string_view message) const {
            if (on_warning) {
                on_warning(offset, category, message);
            }
        }
    };

} // namespace riff
