//
// Seekable byte sources
//

#include <riff/byte_source.hh>

#include <algorithm>
#include <cstring>
#include <fstream>
#include <istream>
#include <string>

namespace riff {
    // byte_source implementation
    std::size_t byte_source::read_at(std::uint64_t offset, void* dst, std::size_t size) {
        seek(offset, byte_source::set);
        return read(dst, size);
    }

    std::vector<std::byte> byte_source::read_exact_at(std::uint64_t offset, std::size_t size) {
        std::vector<std::byte> buffer(size);
        std::size_t actual = read_at(offset, buffer.data(), size);
        THROW_IO_IF(actual != size, "Unexpected EOF at offset ", offset, ": requested ", size, " got ", actual);
        return buffer;
    }

    // stream_source implementation
    stream_source::stream_source(std::istream& is) : m_stream(&is) {}

    stream_source::stream_source(std::unique_ptr<std::istream> owned)
        : m_owned(std::move(owned)), m_stream(m_owned.get()) {}

    stream_source::~stream_source() = default;

    std::shared_ptr<stream_source> stream_source::open(const std::filesystem::path& path) {
        auto file = std::make_unique<std::ifstream>(path, std::ios::binary);
        THROW_IO_UNLESS(file->is_open(), "Cannot open ", path.string());
        return std::shared_ptr<stream_source>(new stream_source(std::move(file)));
    }

    std::size_t stream_source::read(void* dst, std::size_t size) {
        THROW_IO_UNLESS(dst, "Null buffer in read");

        if (size == 0) {
            return 0;
        }

        THROW_IO_UNLESS(m_stream->good(), "Stream in bad state");

        m_stream->read(static_cast<char*>(dst), static_cast<std::streamsize>(size));
        std::size_t bytes_read = static_cast<std::size_t>(m_stream->gcount());

        THROW_IO_IF(m_stream->bad(), "Stream read failed");
        return bytes_read;
    }

    void stream_source::seek(std::uint64_t offset, whence_t whence) {
        m_stream->clear();

        std::ios_base::seekdir dir;
        switch (whence) {
            case set:
                dir = std::ios_base::beg;
                break;
            case cur:
                dir = std::ios_base::cur;
                break;
            case end:
                dir = std::ios_base::end;
                break;
            default:
                THROW_IO("Invalid whence value: ", static_cast<int>(whence));
        }

        m_stream->seekg(static_cast<std::streamoff>(offset), dir);
        if (m_stream->fail()) {
            m_stream->clear();
            std::string error = "Cannot seek to offset " + std::to_string(offset);
            if (whence == byte_source::set) {
                error += " (absolute)";
            } else if (whence == byte_source::cur) {
                error += " (relative)";
            }
            THROW_IO(error);
        }
    }

    std::uint64_t stream_source::tell() const {
        std::streampos pos = m_stream->tellg();
        THROW_IO_IF(pos == std::streampos(-1), "Tell failed");
        return static_cast<std::uint64_t>(pos);
    }

    std::uint64_t stream_source::size() const {
        // A short read leaves eof and fail set, which would make tellg fail
        m_stream->clear();

        // Save current position
        std::streampos current_pos = m_stream->tellg();
        THROW_IO_IF(current_pos == std::streampos(-1), "Tell failed in size()");

        m_stream->seekg(0, std::ios_base::end);
        std::streampos end_pos = m_stream->tellg();

        // Restore original position
        m_stream->seekg(current_pos);

        THROW_IO_IF(end_pos == std::streampos(-1), "Failed to get stream size");
        return static_cast<std::uint64_t>(end_pos);
    }

    // memory_source implementation
    memory_source::memory_source(std::vector<std::byte> data) : m_data(std::move(data)) {}

    std::size_t memory_source::read(void* dst, std::size_t size) {
        THROW_IO_UNLESS(dst, "Null buffer in memory_source::read");

        if (m_position >= m_data.size()) {
            return 0;
        }
        std::size_t available = static_cast<std::size_t>(m_data.size() - m_position);
        std::size_t n = std::min(size, available);
        std::memcpy(dst, m_data.data() + m_position, n);
        m_position += n;
        return n;
    }

    void memory_source::seek(std::uint64_t offset, whence_t whence) {
        std::uint64_t new_pos;

        switch (whence) {
            case set:
                new_pos = offset;
                break;
            case cur:
                new_pos = m_position + offset;
                break;
            case end:
                THROW_IO_IF(offset > m_data.size(), "Seek before start of memory_source: ", offset,
                            " bytes back from end of ", m_data.size());
                new_pos = m_data.size() - offset;
                break;
            default:
                THROW_IO("Invalid whence value in memory_source");
        }

        // Positions past the end are allowed, as with files; reads there return 0
        m_position = new_pos;
    }

    // locked_source implementation
    locked_source::locked_source(std::shared_ptr<byte_source> inner) : m_inner(std::move(inner)) {
        THROW_IO_UNLESS(m_inner, "locked_source needs a source");
    }

    std::size_t locked_source::read(void* dst, std::size_t size) {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_inner->read(dst, size);
    }

    void locked_source::seek(std::uint64_t offset, whence_t whence) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_inner->seek(offset, whence);
    }

    std::uint64_t locked_source::tell() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_inner->tell();
    }

    std::uint64_t locked_source::size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_inner->size();
    }

    std::size_t locked_source::read_at(std::uint64_t offset, void* dst, std::size_t size) {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_inner->read_at(offset, dst, size);
    }
}
