/**
 * @file chunk_header.hh
 * @brief Decoded chunk header
 */

#pragma once

#include <optional>
#include <cstddef>
#include <cstdint>
#include <riff/fourcc.hh>
#include <riff/endian.hh>
#include <riff/chunk_model.hh>

namespace riff {

    /**
     * @struct chunk_header
     * @brief Header information for a chunk
     *
     * Contains the id, the declared payload length, the position of the
     * header in the backing data and the classification. The form type is
     * only present for typed containers whose payload holds it.
     */
    struct chunk_header {
        fourcc id;                         ///< Chunk identifier (4 characters)
        std::uint32_t payload_len = 0;     ///< Payload size in bytes (excluding padding)
        std::uint64_t file_offset = 0;     ///< Absolute offset to chunk header
        chunk_kind kind = chunk_kind::leaf;
        std::optional<fourcc> type;        ///< Form type (e.g., "WAVE" for RIFF WAVE)

        chunk_header() = default;

        /**
         * @brief Decode the 8 header bytes at @p src
         * @param src At least header_size readable bytes
         * @param offset Absolute offset of @p src in the backing data
         */
        static chunk_header decode(const std::byte* src, std::uint64_t offset) {
            chunk_header h;
            h.id = fourcc::from_bytes(src);
            h.payload_len = read_u32le(src + 4);
            h.file_offset = offset;
            h.kind = classify(h.id);
            return h;
        }

        [[nodiscard]] iteration_range children_range() const {
            return iteration_bounds(file_offset, payload_len, kind);
        }

        /// Absolute offset of the first byte after this chunk (pad included)
        [[nodiscard]] std::uint64_t next_offset() const {
            return advance(file_offset, payload_len);
        }
    };

} // namespace riff
