//
// Owned snapshots of chunk subtrees
//

#include <riff/contents.hh>
#include <riff/exceptions.hh>

namespace riff {

    namespace {
        std::vector<std::byte> to_vector(std::span<const std::byte> bytes) {
            return {bytes.begin(), bytes.end()};
        }

        std::vector<std::byte> to_vector(std::vector<std::byte> bytes) {
            return bytes;
        }

        template<typename Chunk>
        chunk_contents decode(const Chunk& chunk, const parse_options& options, int depth) {
            const chunk_header header = chunk.header();

            chunk_contents result;
            result.id = header.id;
            result.kind = header.kind;

            if (header.kind == chunk_kind::leaf) {
                result.data = to_vector(chunk.raw_content());
                return result;
            }
            if (header.kind == chunk_kind::typed_container) {
                result.type = chunk.chunk_type();
            }

            if (depth >= options.max_depth) {
                auto msg = build_error_msg("Container ", header.id, " at offset ", header.file_offset,
                                           " exceeds maximum nesting depth of ", options.max_depth);
                THROW_PARSE_IF(options.strict, errc::depth_limit, msg);
                options.warn(header.file_offset, "depth_limit", msg + ", children skipped");
                return result;
            }

            auto it = chunk.children();
            for (; it.has_next(); it.next()) {
                result.children.push_back(decode(it.current(), options, depth + 1));
            }
            it.throw_if_failed();
            return result;
        }
    }

    chunk_contents read_contents(const eager_chunk& chunk, const parse_options& options) {
        return decode(chunk, options, 0);
    }

    chunk_contents read_contents(const lazy_chunk& chunk, const parse_options& options) {
        return decode(chunk, options, 0);
    }

    chunk_contents read_contents(const eager_chunk& chunk) {
        return decode(chunk, chunk.options(), 0);
    }

    chunk_contents read_contents(const lazy_chunk& chunk) {
        return decode(chunk, chunk.options(), 0);
    }

    chunk_node to_node(const chunk_contents& contents) {
        std::vector<chunk_node> children;
        children.reserve(contents.children.size());
        for (const auto& child : contents.children) {
            children.push_back(to_node(child));
        }

        switch (contents.kind) {
            case chunk_kind::typed_container:
                THROW_ENCODE_UNLESS(contents.type, errc::too_small_for_type,
                                    "Typed container ", contents.id, " has no form type");
                return chunk_node::typed_container(contents.id, *contents.type, std::move(children));
            case chunk_kind::untyped_container:
                return chunk_node::untyped_container(contents.id, std::move(children));
            case chunk_kind::leaf:
                break;
        }
        return chunk_node::leaf(contents.id, contents.data);
    }

} // namespace riff
