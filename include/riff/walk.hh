/**
 * @file walk.hh
 * @brief Depth-first traversal of a chunk tree
 */

#pragma once

#include <riff/chunk_model.hh>
#include <riff/exceptions.hh>
#include <riff/parse_options.hh>

namespace riff {

    namespace detail {
        template<typename Chunk, typename Func>
        void walk(const Chunk& chunk, Func& func, const parse_options& options, int depth) {
            func(chunk, depth);

            const auto kind = chunk.kind();
            if (!is_container(kind)) {
                return;
            }

            if (depth >= options.max_depth) {
                auto msg = build_error_msg("Container ", chunk.id(), " at offset ", chunk.offset(),
                                           " exceeds maximum nesting depth of ", options.max_depth);
                THROW_PARSE_IF(options.strict, errc::depth_limit, msg);
                options.warn(chunk.offset(), "depth_limit", msg + ", skipping");
                return;
            }

            auto it = chunk.children();
            while (it.has_next()) {
                walk(it.current(), func, options, depth + 1);
                it.next();
            }
            it.throw_if_failed();
        }
    }

    /**
     * @brief Visit @p root and every descendant in document order
     *
     * Calls func(chunk, depth) for containers and leaves alike; the root is
     * depth 0. Works with eager_chunk and lazy_chunk.
     *
     * @tparam Chunk eager_chunk or lazy_chunk
     * @tparam Func Callable accepting (const Chunk&, int)
     * @throws riff_error the first error that stopped a child iteration
     */
    template<typename Chunk, typename Func>
    void for_each_chunk(const Chunk& root, Func func, const parse_options& options) {
        detail::walk(root, func, options, 0);
    }

    /// Same, with the options of the file @p root belongs to
    template<typename Chunk, typename Func>
    void for_each_chunk(const Chunk& root, Func func) {
        for_each_chunk(root, func, root.options());
    }

} // namespace riff
