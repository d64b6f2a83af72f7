/**
 * @file chunk_iterator.hh
 * @brief Iterator over the children of a chunk
 */

#pragma once

#include <exception>
#include <iosfwd>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <riff/chunk_header.hh>
#include <riff/exceptions.hh>
#include <riff/parse_options.hh>
#include <riff/export_riff.h>

namespace riff {

    /**
     * @enum iteration_status
     * @brief State of a child iterator
     *
     * An iterator starts active, and ends either exhausted (the children
     * range was consumed) or failed (a child could not be read). Both end
     * states are final.
     */
    enum class iteration_status {
        active,
        exhausted,
        failed
    };

    RIFF_EXPORT std::ostream& operator<<(std::ostream& os, iteration_status status);

    /**
     * @class basic_chunk_iterator
     * @brief Walks the direct children of one chunk
     *
     * The chunk type supplies how a header is read from its backing data:
     * @code
     *   using source_type = ...;
     *   static chunk_header read_header(const source_type&, std::uint64_t pos);
     *   Chunk(source_type, const chunk_header&, std::shared_ptr<const parse_options>);
     * @endcode
     *
     * Every step reads the header at the cursor and moves the cursor past
     * the child and its pad byte. The first structural error stops the
     * iteration for good: next() never throws, the error is kept and can
     * be inspected with error() or rethrown with throw_if_failed(). A new
     * iterator obtained from the parent starts over from the first child.
     */
    template<typename Chunk>
    class basic_chunk_iterator {
    public:
        using chunk_type = Chunk;
        using source_type = typename Chunk::source_type;

        basic_chunk_iterator(source_type source, const chunk_header& parent,
                             std::shared_ptr<const parse_options> options)
            : m_source(std::move(source)),
              m_options(std::move(options)) {
            if (parent.kind == chunk_kind::typed_container && parent.payload_len < type_size) {
                parse_error err(errc::too_small_for_type,
                                build_error_msg("Container ", parent.id, " at offset ", parent.file_offset,
                                                " has payload length ", parent.payload_len,
                                                ", too small for its form type"));
                fail(err, std::make_exception_ptr(err));
                return;
            }
            m_range = parent.children_range();
            m_cursor = m_range.start;
            read_current();
        }

        bool has_next() const { return m_status == iteration_status::active; }
        bool at_end() const { return m_status != iteration_status::active; }

        [[nodiscard]] iteration_status status() const { return m_status; }

        const Chunk& current() const {
            if (!m_current) {
                throw std::out_of_range("chunk iterator has no current chunk");
            }
            return *m_current;
        }

        /**
         * @brief Advance to the next child
         *
         * Does nothing once the iterator is exhausted or failed.
         */
        void next() {
            if (m_status != iteration_status::active) {
                return;
            }
            m_cursor = m_next;
            read_current();
        }

        /// Error that stopped the iteration, nullptr unless failed
        [[nodiscard]] const riff_error* error() const {
            return m_error ? &*m_error : nullptr;
        }

        /// Rethrow the stored error with its original type
        void throw_if_failed() const {
            if (m_exception) {
                std::rethrow_exception(m_exception);
            }
        }

    private:
        void read_current() {
            m_current.reset();
            if (m_cursor >= m_range.end) {
                m_status = iteration_status::exhausted;
                return;
            }
            try {
                const std::uint64_t remaining = m_range.end - m_cursor;
                THROW_PARSE_IF(remaining < header_size, errc::too_small,
                               "Chunk header at offset ", m_cursor, " needs ", header_size,
                               " bytes but only ", remaining, " remain in the parent");

                chunk_header header = Chunk::read_header(m_source, m_cursor);
                check_child(header);

                m_current.emplace(m_source, header, m_options);
                m_next = header.next_offset();
            } catch (const riff_error& e) {
                fail(e, std::current_exception());
            }
        }

        void check_child(const chunk_header& header) const {
            const parse_options& opts = *m_options;
            const std::uint64_t span_end = header.file_offset + header_size + header.payload_len;

            if (span_end > m_range.end) {
                auto msg = build_error_msg("Chunk ", header.id, " at offset ", header.file_offset,
                                           " declares ", header.payload_len, " bytes, overrunning its parent by ",
                                           span_end - m_range.end, " bytes");
                THROW_PARSE_IF(opts.strict, errc::payload_len_mismatch, msg);
                opts.warn(header.file_offset, "containment", msg);
            } else if (header.next_offset() > m_range.end) {
                opts.warn(header.file_offset, "missing_padding",
                          build_error_msg("Chunk ", header.id, " at offset ", header.file_offset,
                                          " has an odd payload but no pad byte before the end of its parent"));
            }

            if (header.payload_len > opts.max_chunk_size) {
                auto msg = build_error_msg("Chunk ", header.id, " at offset ", header.file_offset,
                                           " has size ", header.payload_len,
                                           " bytes, which exceeds maximum allowed size of ",
                                           opts.max_chunk_size, " bytes");
                THROW_PARSE_IF(opts.strict, errc::payload_len_mismatch, msg);
                opts.warn(header.file_offset, "size_limit", msg);
            }
        }

        void fail(const riff_error& e, std::exception_ptr exception) {
            m_status = iteration_status::failed;
            m_current.reset();
            m_error.emplace(e.code(), e.what());
            m_exception = std::move(exception);
        }

        source_type m_source;
        std::shared_ptr<const parse_options> m_options;
        iteration_range m_range;
        std::uint64_t m_cursor = 0;
        std::uint64_t m_next = 0;
        iteration_status m_status = iteration_status::active;
        std::optional<Chunk> m_current;
        std::optional<riff_error> m_error;
        std::exception_ptr m_exception;
    };

} // namespace riff
