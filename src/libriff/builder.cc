//
// Chunk tree builder and encoder
//

#include <riff/builder.hh>
#include <riff/endian.hh>
#include <riff/exceptions.hh>

#include <array>
#include <limits>
#include <ostream>

namespace riff {

    namespace {
        constexpr std::uint64_t max_payload_len = std::numeric_limits<std::uint32_t>::max();

        std::uint32_t length_field(const chunk_node& node) {
            THROW_ENCODE_IF(node.payload_len() > max_payload_len, errc::size_overflow,
                            "Chunk ", node.id(), " has payload length ", node.payload_len(),
                            ", which does not fit the 32-bit length field");
            return static_cast<std::uint32_t>(node.payload_len());
        }

        void check_root(const chunk_node& root) {
            THROW_ENCODE_IF(root.id() != chunk_ids::RIFF, errc::invalid_header,
                            "Root chunk must be RIFF, got ", root.id());
            length_field(root);
        }

        // Appends to a byte vector
        struct vector_sink {
            std::vector<std::byte>& out;

            void put(const std::byte* data, std::size_t size) {
                out.insert(out.end(), data, data + size);
            }
        };

        struct stream_sink {
            std::ostream& os;

            void put(const std::byte* data, std::size_t size) {
                os.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
                THROW_IO_UNLESS(os.good(), "Failed to write ", size, " bytes");
            }
        };

        template<typename Sink>
        void write_node(const chunk_node& node, Sink& sink) {
            std::array<std::byte, header_size + type_size> head;
            node.id().to_bytes(head.data());
            write_u32le(head.data() + 4, length_field(node));

            std::size_t head_len = header_size;
            if (node.type()) {
                node.type()->to_bytes(head.data() + header_size);
                head_len += type_size;
            }
            sink.put(head.data(), head_len);

            if (node.kind() == chunk_kind::leaf) {
                auto data = node.padded_content();
                sink.put(data.data(), data.size());
                return;
            }
            for (const auto& child : node.children()) {
                write_node(child, sink);
            }
        }
    }

    chunk_node::chunk_node(fourcc id, chunk_kind kind, std::optional<fourcc> type)
        : m_id(id), m_kind(kind), m_type(type) {}

    chunk_node chunk_node::leaf(fourcc id, std::vector<std::byte> data) {
        THROW_ENCODE_IF(classify(id) != chunk_kind::leaf, errc::invalid_chunk_kind,
                        "Chunk id ", id, " is reserved for containers and can not hold raw data");

        chunk_node node(id, chunk_kind::leaf, std::nullopt);
        node.m_payload_len = data.size();
        if (padding(data.size())) {
            data.push_back(std::byte{0});
        }
        node.m_data = std::move(data);
        return node;
    }

    chunk_node chunk_node::leaf(fourcc id, std::span<const std::byte> data) {
        return leaf(id, std::vector<std::byte>(data.begin(), data.end()));
    }

    chunk_node chunk_node::typed_container(fourcc id, fourcc type, std::vector<chunk_node> children) {
        THROW_ENCODE_IF(classify(id) != chunk_kind::typed_container, errc::invalid_chunk_kind,
                        "Chunk id ", id, " is not a typed container id (RIFF or LIST)");

        chunk_node node(id, chunk_kind::typed_container, type);
        node.m_children = std::move(children);
        node.update_payload_len();
        return node;
    }

    chunk_node chunk_node::untyped_container(fourcc id, std::vector<chunk_node> children) {
        THROW_ENCODE_IF(classify(id) != chunk_kind::untyped_container, errc::invalid_chunk_kind,
                        "Chunk id ", id, " is not an untyped container id (seqt)");

        chunk_node node(id, chunk_kind::untyped_container, std::nullopt);
        node.m_children = std::move(children);
        node.update_payload_len();
        return node;
    }

    chunk_node chunk_node::riff(fourcc type, std::vector<chunk_node> children) {
        return typed_container(chunk_ids::RIFF, type, std::move(children));
    }

    chunk_node& chunk_node::add_child(chunk_node child) {
        THROW_ENCODE_IF(m_kind == chunk_kind::leaf, errc::invalid_chunk_kind,
                        "Leaf chunk ", m_id, " can not have children");
        m_children.push_back(std::move(child));
        update_payload_len();
        return *this;
    }

    std::span<const std::byte> chunk_node::content() const {
        return std::span<const std::byte>(m_data).first(static_cast<std::size_t>(
            m_kind == chunk_kind::leaf ? m_payload_len : 0));
    }

    void chunk_node::update_payload_len() {
        std::uint64_t total = m_kind == chunk_kind::typed_container ? type_size : 0;
        for (const auto& child : m_children) {
            total += child.encoded_size();
        }
        m_payload_len = total;
    }

    std::vector<std::byte> serialize(const chunk_node& root) {
        check_root(root);

        std::vector<std::byte> out;
        out.reserve(static_cast<std::size_t>(root.encoded_size()));
        vector_sink sink{out};
        write_node(root, sink);
        return out;
    }

    void write(const chunk_node& root, std::ostream& os) {
        check_root(root);

        stream_sink sink{os};
        write_node(root, sink);
    }

} // namespace riff
