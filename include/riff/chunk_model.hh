/**
 * @file chunk_model.hh
 * @brief Structural rules shared by every reader and the builder
 *
 * A chunk is an 8-byte header (FourCC id, 32-bit little-endian payload
 * length) followed by the payload and, when the payload length is odd,
 * one zero pad byte that is not counted in the length.
 *
 * The functions below are the whole parsing algorithm. The eager reader,
 * the lazy reader and the builder all go through them, so the container
 * payload (which includes the form type) and the children range (which
 * does not) are never computed twice in two different ways.
 */

#pragma once

#include <cstdint>
#include <iosfwd>
#include <riff/fourcc.hh>
#include <riff/export_riff.h>

namespace riff {

    namespace chunk_ids {
        inline constexpr fourcc RIFF('R', 'I', 'F', 'F');
        inline constexpr fourcc LIST('L', 'I', 'S', 'T');
        inline constexpr fourcc seqt('s', 'e', 'q', 't');
    }

    /// Size of the id + length header
    inline constexpr std::uint64_t header_size = 8;

    /// Size of the form type that opens a typed container payload
    inline constexpr std::uint64_t type_size = 4;

    /**
     * @enum chunk_kind
     * @brief Classification of a chunk, derived from its id only
     */
    enum class chunk_kind {
        typed_container,    ///< RIFF, LIST: payload = form type + children
        untyped_container,  ///< seqt: payload = children
        leaf                ///< anything else: payload is opaque
    };

    RIFF_EXPORT std::ostream& operator<<(std::ostream& os, chunk_kind kind);

    [[nodiscard]] constexpr chunk_kind classify(const fourcc& id) noexcept {
        if (id == chunk_ids::RIFF || id == chunk_ids::LIST) {
            return chunk_kind::typed_container;
        }
        if (id == chunk_ids::seqt) {
            return chunk_kind::untyped_container;
        }
        return chunk_kind::leaf;
    }

    [[nodiscard]] constexpr bool is_container(chunk_kind kind) noexcept {
        return kind != chunk_kind::leaf;
    }

    /// Distance from the chunk header to its content (children or leaf data)
    [[nodiscard]] constexpr std::uint64_t content_offset(chunk_kind kind) noexcept {
        return kind == chunk_kind::typed_container ? header_size + type_size : header_size;
    }

    /// Number of pad bytes following a payload of the given length
    [[nodiscard]] constexpr std::uint64_t padding(std::uint64_t payload_len) noexcept {
        return payload_len & 1;
    }

    /// Bytes a chunk occupies on the wire: header, payload and pad
    [[nodiscard]] constexpr std::uint64_t encoded_size(std::uint64_t payload_len) noexcept {
        return header_size + payload_len + padding(payload_len);
    }

    /**
     * @struct iteration_range
     * @brief Absolute [start, end) span holding the children of a chunk
     */
    struct iteration_range {
        std::uint64_t start = 0;
        std::uint64_t end = 0;

        constexpr bool operator==(const iteration_range& o) const {
            return start == o.start && end == o.end;
        }
    };

    /**
     * @brief Children span of the chunk whose header is at @p pos
     *
     * For a typed container the payload length counts the form type,
     * which is already consumed by content_offset(), so it is subtracted
     * again here. Callers must reject typed containers whose payload is
     * shorter than the type field before asking for the bounds.
     */
    [[nodiscard]] constexpr iteration_range iteration_bounds(std::uint64_t pos, std::uint32_t payload_len,
                                                            chunk_kind kind) noexcept {
        const std::uint64_t start = pos + content_offset(kind);
        const std::uint64_t consumed = kind == chunk_kind::typed_container ? type_size : 0;
        return {start, start + payload_len - consumed};
    }

    /// Position of the sibling following a child whose header is at @p cursor
    [[nodiscard]] constexpr std::uint64_t advance(std::uint64_t cursor, std::uint32_t child_payload_len) noexcept {
        return cursor + encoded_size(child_payload_len);
    }

} // namespace riff
