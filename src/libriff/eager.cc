//
// Reader over an in-memory RIFF file
//

#include <riff/eager.hh>
#include <riff/exceptions.hh>

#include <cstring>
#include <fstream>
#include <iterator>

namespace riff {

    namespace {
        void check_root(std::span<const std::byte> data) {
            THROW_PARSE_IF(data.size() < header_size, errc::too_small,
                           "File is ", data.size(), " bytes, too small for a RIFF header");
            auto id = fourcc::from_bytes(data.data());
            THROW_PARSE_IF(id != chunk_ids::RIFF, errc::invalid_header,
                           "Invalid RIFF file: root id is ", id);
        }
    }

    // eager_chunk implementation
    eager_chunk::eager_chunk(source_type data, const chunk_header& header,
                             std::shared_ptr<const parse_options> options)
        : m_data(data), m_header(header), m_options(std::move(options)) {
        if (m_header.kind == chunk_kind::typed_container && m_header.payload_len >= type_size) {
            const std::uint64_t type_pos = m_header.file_offset + header_size;
            if (type_pos <= m_data.size() && m_data.size() - type_pos >= type_size) {
                m_header.type = fourcc::from_bytes(m_data.data() + type_pos);
            }
        }
    }

    chunk_header eager_chunk::read_header(const source_type& data, std::uint64_t pos) {
        THROW_PARSE_IF(pos > data.size() || data.size() - pos < header_size, errc::too_small,
                       "Chunk header at offset ", pos, " needs ", header_size,
                       " bytes but the buffer is ", data.size(), " bytes");
        return chunk_header::decode(data.data() + pos, pos);
    }

    fourcc eager_chunk::chunk_type() const {
        THROW_PARSE_IF(m_header.kind != chunk_kind::typed_container, errc::invalid_chunk_kind,
                       "Chunk ", m_header.id, " at offset ", m_header.file_offset, " has no form type (",
                       m_header.kind, ")");

        THROW_PARSE_UNLESS(m_header.type, errc::too_small_for_type,
                           "Container ", m_header.id, " at offset ", m_header.file_offset,
                           " is too small for its form type");
        return *m_header.type;
    }

    std::span<const std::byte> eager_chunk::raw_content() const {
        THROW_PARSE_IF(m_header.kind == chunk_kind::typed_container && m_header.payload_len < type_size,
                       errc::too_small_for_type,
                       "Container ", m_header.id, " at offset ", m_header.file_offset,
                       " is too small for its form type");

        const auto range = m_header.children_range();
        THROW_PARSE_IF(range.end > m_data.size(), errc::payload_len_mismatch,
                       "Chunk ", m_header.id, " at offset ", m_header.file_offset, " declares ",
                       m_header.payload_len, " bytes but the buffer ends ", range.end - m_data.size(),
                       " bytes early");
        return m_data.subspan(static_cast<std::size_t>(range.start),
                              static_cast<std::size_t>(range.end - range.start));
    }

    eager_iterator eager_chunk::children() const {
        return {m_data, m_header, m_options};
    }

    // eager_file implementation
    eager_file::eager_file(std::vector<std::byte> data, std::shared_ptr<const parse_options> options)
        : m_data(std::move(data)), m_options(std::move(options)) {}

    eager_file eager_file::load(std::vector<std::byte> bytes, parse_options options) {
        check_root(bytes);
        return {std::move(bytes), std::make_shared<const parse_options>(std::move(options))};
    }

    eager_file eager_file::load(std::span<const std::byte> bytes, parse_options options) {
        return load(std::vector<std::byte>(bytes.begin(), bytes.end()), std::move(options));
    }

    eager_file eager_file::from_file(const std::filesystem::path& path, parse_options options) {
        std::ifstream file(path, std::ios::binary);
        THROW_IO_UNLESS(file.is_open(), "Cannot open ", path.string());

        std::vector<char> raw((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        THROW_IO_IF(file.bad(), "Failed to read ", path.string());

        std::vector<std::byte> bytes(raw.size());
        if (!raw.empty()) {
            std::memcpy(bytes.data(), raw.data(), raw.size());
        }
        return load(std::move(bytes), std::move(options));
    }

    eager_chunk eager_file::as_chunk() const {
        return {m_data, chunk_header::decode(m_data.data(), 0), m_options};
    }

    fourcc eager_file::id() const {
        return fourcc::from_bytes(m_data.data());
    }

    std::uint32_t eager_file::payload_len() const {
        return read_u32le(m_data.data() + 4);
    }

} // namespace riff
