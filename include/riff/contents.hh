/**
 * @file contents.hh
 * @brief Owned snapshot of a chunk subtree
 */

#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include <riff/builder.hh>
#include <riff/chunk_model.hh>
#include <riff/eager.hh>
#include <riff/lazy.hh>
#include <riff/fourcc.hh>
#include <riff/export_riff.h>

namespace riff {

    /**
     * @struct chunk_contents
     * @brief Decoded chunk with its whole subtree
     *
     * Leaves carry their payload in data (pad byte excluded); containers
     * carry their children. type is set for typed containers only.
     */
    struct chunk_contents {
        fourcc id;
        chunk_kind kind = chunk_kind::leaf;
        std::optional<fourcc> type;
        std::vector<std::byte> data;
        std::vector<chunk_contents> children;

        bool operator==(const chunk_contents& o) const = default;
    };

    /**
     * @brief Decode @p chunk and all its descendants
     *
     * Unlike iteration, the conversion is all or nothing: the first error
     * anywhere in the subtree is thrown. The overloads without options use
     * the options of the file the chunk belongs to.
     * @throws parse_error(depth_limit) when nesting exceeds options.max_depth in strict mode
     */
    RIFF_EXPORT chunk_contents read_contents(const eager_chunk& chunk, const parse_options& options);
    RIFF_EXPORT chunk_contents read_contents(const lazy_chunk& chunk, const parse_options& options);

    RIFF_EXPORT chunk_contents read_contents(const eager_chunk& chunk);
    RIFF_EXPORT chunk_contents read_contents(const lazy_chunk& chunk);

    /// Rebuild a builder node from a snapshot
    RIFF_EXPORT chunk_node to_node(const chunk_contents& contents);

} // namespace riff
