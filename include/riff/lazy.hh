/**
 * @file lazy.hh
 * @brief Reader that re-reads chunk headers from a seekable source on demand
 *
 * A lazy_chunk is only a position in a shared byte_source. Every accessor
 * seeks and reads the bytes it needs; nothing is cached between calls.
 * All chunks derived from one lazy_file share its source, and therefore
 * its cursor: use them from one thread at a time, or build the file on a
 * locked_source.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <vector>

#include <riff/byte_source.hh>
#include <riff/chunk_header.hh>
#include <riff/chunk_iterator.hh>
#include <riff/parse_options.hh>
#include <riff/export_riff.h>

namespace riff {

    class lazy_chunk;

    using lazy_iterator = basic_chunk_iterator<lazy_chunk>;

    /**
     * @class lazy_chunk
     * @brief A chunk inside a lazy_file
     */
    class RIFF_EXPORT lazy_chunk {
    public:
        using source_type = std::shared_ptr<byte_source>;

        lazy_chunk(source_type source, std::uint64_t offset,
                   std::shared_ptr<const parse_options> options);

        // Only the position of the header is kept
        lazy_chunk(source_type source, const chunk_header& header,
                   std::shared_ptr<const parse_options> options);

        /**
         * @brief Read the header at @p pos
         * @throws parse_error(too_small) if fewer than 8 bytes can be read
         * @throws io_error if the source fails
         */
        static chunk_header read_header(const source_type& source, std::uint64_t pos);

        [[nodiscard]] fourcc id() const;
        [[nodiscard]] std::uint32_t payload_len() const;
        [[nodiscard]] chunk_kind kind() const;
        [[nodiscard]] std::uint64_t offset() const { return m_offset; }

        /// Header, with the form type filled in for typed containers whose type bytes are present
        [[nodiscard]] chunk_header header() const;

        [[nodiscard]] fourcc chunk_type() const;

        /**
         * @brief Content of the chunk, read from the source
         *
         * Same bytes as eager_chunk::raw_content(): the leaf payload, or the
         * children bytes of a container.
         * @throws parse_error(payload_len_mismatch) if the source is shorter than declared
         */
        [[nodiscard]] std::vector<std::byte> raw_content() const;

        [[nodiscard]] lazy_iterator children() const;

        [[nodiscard]] const source_type& source() const { return m_source; }

        /// Options of the file this chunk belongs to
        [[nodiscard]] const parse_options& options() const { return *m_options; }

    private:
        source_type m_source;
        std::uint64_t m_offset;
        std::shared_ptr<const parse_options> m_options;
    };

    /**
     * @class lazy_file
     * @brief Root handle over a seekable source holding a RIFF file
     */
    class RIFF_EXPORT lazy_file {
    public:
        /**
         * @brief Open @p path and check the root header
         * @throws io_error if the file cannot be opened or read
         * @throws parse_error(too_small) if fewer than 8 bytes
         * @throws parse_error(invalid_header) if the file does not start with RIFF
         */
        static lazy_file open(const std::filesystem::path& path, parse_options options = {});

        static lazy_file from_source(std::shared_ptr<byte_source> source, parse_options options = {});

        [[nodiscard]] lazy_chunk as_chunk() const;

        [[nodiscard]] const std::shared_ptr<byte_source>& source() const { return m_source; }
        [[nodiscard]] const parse_options& options() const { return *m_options; }

        [[nodiscard]] lazy_iterator children() const { return as_chunk().children(); }

    private:
        lazy_file(std::shared_ptr<byte_source> source, std::shared_ptr<const parse_options> options);

        std::shared_ptr<byte_source> m_source;
        std::shared_ptr<const parse_options> m_options;
    };

    /// Same as lazy_file::open
    inline lazy_file open_lazy(const std::filesystem::path& path, parse_options options = {}) {
        return lazy_file::open(path, std::move(options));
    }

} // namespace riff
