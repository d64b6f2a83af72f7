/**
 * @file builder.hh
 * @brief Building chunk trees and serializing them to RIFF bytes
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <span>
#include <vector>

#include <riff/chunk_model.hh>
#include <riff/fourcc.hh>
#include <riff/export_riff.h>

namespace riff {

    /**
     * @class chunk_node
     * @brief Owning, mutable node of a chunk tree under construction
     *
     * The payload length is stored on the node and recomputed from the
     * current children every time a child is added. Attached children are
     * only reachable through const references, so a nested node can not
     * change behind its parent's back and the stored length always equals
     * the encoded size of the contents.
     */
    class RIFF_EXPORT chunk_node {
    public:
        /**
         * @brief Leaf chunk holding @p data
         *
         * An odd payload is stored with its zero pad byte already appended;
         * payload_len() still reports the unpadded length.
         * @throws encode_error(invalid_chunk_kind) if @p id is a container id
         */
        static chunk_node leaf(fourcc id, std::vector<std::byte> data);
        static chunk_node leaf(fourcc id, std::span<const std::byte> data);

        /**
         * @throws encode_error(invalid_chunk_kind) unless @p id is RIFF or LIST
         */
        static chunk_node typed_container(fourcc id, fourcc type, std::vector<chunk_node> children = {});

        /**
         * @throws encode_error(invalid_chunk_kind) unless @p id is seqt
         */
        static chunk_node untyped_container(fourcc id, std::vector<chunk_node> children = {});

        /// Root node: a RIFF container of the given form type
        static chunk_node riff(fourcc type, std::vector<chunk_node> children = {});

        /**
         * @brief Append a child and recompute this node's payload length
         * @throws encode_error(invalid_chunk_kind) on a leaf
         */
        chunk_node& add_child(chunk_node child);

        [[nodiscard]] fourcc id() const { return m_id; }
        [[nodiscard]] chunk_kind kind() const { return m_kind; }
        [[nodiscard]] const std::optional<fourcc>& type() const { return m_type; }

        /// Declared payload length: form type + encoded children, or leaf bytes without pad
        [[nodiscard]] std::uint64_t payload_len() const { return m_payload_len; }

        /// Bytes this node occupies on the wire, header and pad included
        [[nodiscard]] std::uint64_t encoded_size() const { return riff::encoded_size(m_payload_len); }

        /// Logical leaf content, without the pad byte
        [[nodiscard]] std::span<const std::byte> content() const;

        /// Leaf content as stored, with the pad byte for odd lengths
        [[nodiscard]] std::span<const std::byte> padded_content() const { return m_data; }

        [[nodiscard]] const std::vector<chunk_node>& children() const { return m_children; }

    private:
        chunk_node(fourcc id, chunk_kind kind, std::optional<fourcc> type);

        void update_payload_len();

        fourcc m_id;
        chunk_kind m_kind;
        std::optional<fourcc> m_type;
        std::vector<std::byte> m_data;
        std::vector<chunk_node> m_children;
        std::uint64_t m_payload_len = 0;
    };

    /**
     * @brief Encode a RIFF tree
     *
     * Writes the root header, its form type, then every child depth-first.
     * @throws encode_error(invalid_header) if @p root is not a RIFF node
     * @throws encode_error(size_overflow) if a length does not fit 32 bits
     */
    RIFF_EXPORT std::vector<std::byte> serialize(const chunk_node& root);

    /**
     * @brief Same bytes as serialize(), streamed in one forward pass
     * @throws io_error if the stream fails
     */
    RIFF_EXPORT void write(const chunk_node& root, std::ostream& os);

} // namespace riff
