/**
 * @file eager.hh
 * @brief Reader over a RIFF file held entirely in memory
 *
 * eager_file owns the bytes of the whole file. Every chunk obtained from
 * it is a small view (position and cached header) into that buffer, and
 * raw_content() returns a sub-span of it, so nothing is copied after
 * load. Views must not outlive the eager_file they come from.
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <vector>

#include <riff/chunk_header.hh>
#include <riff/chunk_iterator.hh>
#include <riff/parse_options.hh>
#include <riff/export_riff.h>

namespace riff {

    class eager_chunk;

    using eager_iterator = basic_chunk_iterator<eager_chunk>;

    /**
     * @class eager_chunk
     * @brief A chunk inside an eager_file
     */
    class RIFF_EXPORT eager_chunk {
    public:
        using source_type = std::span<const std::byte>;

        eager_chunk(source_type data, const chunk_header& header,
                    std::shared_ptr<const parse_options> options);

        /**
         * @brief Read the header at @p pos
         * @throws parse_error(too_small) if fewer than 8 bytes remain
         */
        static chunk_header read_header(const source_type& data, std::uint64_t pos);

        [[nodiscard]] fourcc id() const { return m_header.id; }
        [[nodiscard]] std::uint32_t payload_len() const { return m_header.payload_len; }
        [[nodiscard]] chunk_kind kind() const { return m_header.kind; }
        [[nodiscard]] std::uint64_t offset() const { return m_header.file_offset; }

        /// Header, with the form type filled in for typed containers whose type bytes are present
        [[nodiscard]] const chunk_header& header() const { return m_header; }

        /// Options of the file this chunk belongs to
        [[nodiscard]] const parse_options& options() const { return *m_options; }

        /**
         * @brief Form type of a typed container
         * @throws parse_error(invalid_chunk_kind) if the chunk is not a typed container
         * @throws parse_error(too_small_for_type) if the 4 type bytes are missing
         */
        [[nodiscard]] fourcc chunk_type() const;

        /**
         * @brief Content of the chunk: the leaf payload, or the children bytes of a container
         *
         * For a typed container the form type is not part of the result.
         * @throws parse_error(payload_len_mismatch) if the buffer is shorter than declared
         */
        [[nodiscard]] std::span<const std::byte> raw_content() const;

        [[nodiscard]] eager_iterator children() const;

        bool operator==(const eager_chunk& o) const {
            return m_data.data() == o.m_data.data() && m_header.file_offset == o.m_header.file_offset;
        }

    private:
        source_type m_data;
        chunk_header m_header;
        std::shared_ptr<const parse_options> m_options;
    };

    /**
     * @class eager_file
     * @brief Root handle owning the bytes of a RIFF file
     */
    class RIFF_EXPORT eager_file {
    public:
        /**
         * @brief Take ownership of @p bytes and check the root header
         * @throws parse_error(too_small) if fewer than 8 bytes
         * @throws parse_error(invalid_header) if the file does not start with RIFF
         */
        static eager_file load(std::vector<std::byte> bytes, parse_options options = {});

        static eager_file load(std::span<const std::byte> bytes, parse_options options = {});

        /**
         * @brief Read the whole file at @p path, then load it
         * @throws io_error if the file cannot be read
         */
        static eager_file from_file(const std::filesystem::path& path, parse_options options = {});

        [[nodiscard]] eager_chunk as_chunk() const;

        [[nodiscard]] fourcc id() const;
        [[nodiscard]] std::uint32_t payload_len() const;
        [[nodiscard]] std::span<const std::byte> bytes() const { return m_data; }
        [[nodiscard]] const parse_options& options() const { return *m_options; }

        [[nodiscard]] eager_iterator children() const { return as_chunk().children(); }

    private:
        eager_file(std::vector<std::byte> data, std::shared_ptr<const parse_options> options);

        std::vector<std::byte> m_data;
        std::shared_ptr<const parse_options> m_options;
    };

    /// Same as eager_file::load
    inline eager_file open_eager(std::vector<std::byte> bytes, parse_options options = {}) {
        return eager_file::load(std::move(bytes), std::move(options));
    }

} // namespace riff
