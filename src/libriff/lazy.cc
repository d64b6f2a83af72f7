//
// Reader over a seekable byte source
//

#include <riff/lazy.hh>
#include <riff/endian.hh>
#include <riff/exceptions.hh>

#include <array>

namespace riff {

    namespace {
        std::array<std::byte, 4> read_field(const lazy_chunk::source_type& source, std::uint64_t pos,
                                            errc short_read, const char* what) {
            std::array<std::byte, 4> buff;
            std::size_t actual = source->read_at(pos, buff.data(), buff.size());
            THROW_PARSE_IF(actual != buff.size(), short_read,
                           "Failed to read ", what, " at offset ", pos, ": got ", actual, " of 4 bytes");
            return buff;
        }
    }

    // lazy_chunk implementation
    lazy_chunk::lazy_chunk(source_type source, std::uint64_t offset,
                           std::shared_ptr<const parse_options> options)
        : m_source(std::move(source)), m_offset(offset), m_options(std::move(options)) {
        THROW_IO_UNLESS(m_source, "Invalid source provided to lazy_chunk");
    }

    lazy_chunk::lazy_chunk(source_type source, const chunk_header& header,
                           std::shared_ptr<const parse_options> options)
        : lazy_chunk(std::move(source), header.file_offset, std::move(options)) {}

    chunk_header lazy_chunk::read_header(const source_type& source, std::uint64_t pos) {
        std::array<std::byte, header_size> buff;
        std::size_t actual = source->read_at(pos, buff.data(), buff.size());
        THROW_PARSE_IF(actual != buff.size(), errc::too_small,
                       "Chunk header at offset ", pos, " needs ", header_size,
                       " bytes but only ", actual, " could be read");
        return chunk_header::decode(buff.data(), pos);
    }

    fourcc lazy_chunk::id() const {
        return fourcc::from_bytes(read_field(m_source, m_offset, errc::too_small, "chunk id"));
    }

    std::uint32_t lazy_chunk::payload_len() const {
        auto buff = read_field(m_source, m_offset + 4, errc::too_small, "payload length");
        return read_u32le(buff.data());
    }

    chunk_kind lazy_chunk::kind() const {
        return classify(id());
    }

    chunk_header lazy_chunk::header() const {
        chunk_header h = read_header(m_source, m_offset);
        if (h.kind == chunk_kind::typed_container && h.payload_len >= type_size) {
            // A source ending inside the type field leaves the type unset, as in eager_chunk;
            // chunk_type() reports it as too_small_for_type
            std::array<std::byte, 4> buff;
            std::size_t actual = m_source->read_at(m_offset + header_size, buff.data(), buff.size());
            if (actual == buff.size()) {
                h.type = fourcc::from_bytes(buff);
            }
        }
        return h;
    }

    fourcc lazy_chunk::chunk_type() const {
        chunk_header h = read_header(m_source, m_offset);
        THROW_PARSE_IF(h.kind != chunk_kind::typed_container, errc::invalid_chunk_kind,
                       "Chunk ", h.id, " at offset ", m_offset, " has no form type (", h.kind, ")");
        THROW_PARSE_IF(h.payload_len < type_size, errc::too_small_for_type,
                       "Container ", h.id, " at offset ", m_offset, " is too small for its form type");
        return fourcc::from_bytes(read_field(m_source, m_offset + header_size, errc::too_small_for_type,
                                             "form type"));
    }

    std::vector<std::byte> lazy_chunk::raw_content() const {
        chunk_header h = read_header(m_source, m_offset);
        THROW_PARSE_IF(h.kind == chunk_kind::typed_container && h.payload_len < type_size,
                       errc::too_small_for_type,
                       "Container ", h.id, " at offset ", m_offset, " is too small for its form type");

        const auto range = h.children_range();
        const std::uint64_t available = m_source->size();
        THROW_PARSE_IF(range.end > available, errc::payload_len_mismatch,
                       "Chunk ", h.id, " at offset ", m_offset, " declares ", h.payload_len,
                       " bytes but the source ends ", range.end - available, " bytes early");

        const auto len = static_cast<std::size_t>(range.end - range.start);
        std::vector<std::byte> result(len);
        std::size_t actual = len > 0 ? m_source->read_at(range.start, result.data(), len) : 0;
        THROW_PARSE_IF(actual != len, errc::payload_len_mismatch,
                       "Chunk ", h.id, " at offset ", m_offset, " declares ", h.payload_len,
                       " bytes but only ", actual, " could be read");
        return result;
    }

    lazy_iterator lazy_chunk::children() const {
        return {m_source, read_header(m_source, m_offset), m_options};
    }

    // lazy_file implementation
    lazy_file::lazy_file(std::shared_ptr<byte_source> source, std::shared_ptr<const parse_options> options)
        : m_source(std::move(source)), m_options(std::move(options)) {}

    lazy_file lazy_file::open(const std::filesystem::path& path, parse_options options) {
        return from_source(stream_source::open(path), std::move(options));
    }

    lazy_file lazy_file::from_source(std::shared_ptr<byte_source> source, parse_options options) {
        THROW_IO_UNLESS(source, "Invalid source provided to lazy_file");

        std::array<std::byte, header_size> buff;
        std::size_t actual = source->read_at(0, buff.data(), buff.size());
        THROW_PARSE_IF(actual < header_size, errc::too_small,
                       "File is ", actual, " bytes, too small for a RIFF header");
        auto id = fourcc::from_bytes(buff.data());
        THROW_PARSE_IF(id != chunk_ids::RIFF, errc::invalid_header,
                       "Invalid RIFF file: root id is ", id);

        return {std::move(source), std::make_shared<const parse_options>(std::move(options))};
    }

    lazy_chunk lazy_file::as_chunk() const {
        return {m_source, std::uint64_t{0}, m_options};
    }

} // namespace riff
