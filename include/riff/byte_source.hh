/**
 * @file byte_source.hh
 * @brief Seekable byte sources backing the lazy reader
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <mutex>
#include <vector>

#include <riff/exceptions.hh>
#include <riff/export_riff.h>

namespace riff {

    /**
     * @class byte_source
     * @brief Seek + read capability over some backing store
     *
     * A source has a single cursor, so handles sharing one source must not
     * be used from several threads at once. Wrap the source in a
     * locked_source when they are.
     */
    class RIFF_EXPORT byte_source {
        public:
            enum whence_t {
                set,
                cur,
                end
            };

        public:
            virtual ~byte_source() = default;

            // Simple interface - throws io_error on failure, short reads at EOF are not failures
            virtual std::size_t read(void* dst, std::size_t size) = 0;
            virtual void seek(std::uint64_t offset, whence_t whence) = 0;
            virtual std::uint64_t tell() const = 0;
            virtual std::uint64_t size() const = 0;

            /**
             * @brief Seek to @p offset and read up to @p size bytes
             * @return Number of bytes read, less than @p size only at end of data
             *
             * The seek and the read form one operation; decorators that
             * serialize access lock around this call.
             */
            virtual std::size_t read_at(std::uint64_t offset, void* dst, std::size_t size);

            // Convenience method - a short read is an io_error
            std::vector<std::byte> read_exact_at(std::uint64_t offset, std::size_t size);
    };

    /**
     * @class stream_source
     * @brief Source reading from a std::istream
     */
    class RIFF_EXPORT stream_source : public byte_source {
        public:
            explicit stream_source(std::istream& is);
            ~stream_source() override;

            stream_source(const stream_source&) = delete;
            stream_source& operator = (const stream_source&) = delete;

            /**
             * @brief Open @p path for binary reading
             * @throws io_error if the file cannot be opened
             */
            static std::shared_ptr<stream_source> open(const std::filesystem::path& path);

            std::size_t read(void* dst, std::size_t size) override;
            void seek(std::uint64_t offset, whence_t whence) override;
            std::uint64_t tell() const override;
            std::uint64_t size() const override;

        private:
            explicit stream_source(std::unique_ptr<std::istream> owned);

            std::unique_ptr<std::istream> m_owned;
            std::istream* m_stream;
    };

    /**
     * @class memory_source
     * @brief Source serving an owned byte buffer
     */
    class RIFF_EXPORT memory_source : public byte_source {
        public:
            explicit memory_source(std::vector<std::byte> data);

            std::size_t read(void* dst, std::size_t size) override;
            void seek(std::uint64_t offset, whence_t whence) override;
            std::uint64_t tell() const override { return m_position; }
            std::uint64_t size() const override { return m_data.size(); }

        private:
            std::vector<std::byte> m_data;
            std::uint64_t m_position = 0;
    };

    /**
     * @class locked_source
     * @brief Serializes every access to another source with a mutex
     */
    class RIFF_EXPORT locked_source : public byte_source {
        public:
            explicit locked_source(std::shared_ptr<byte_source> inner);

            std::size_t read(void* dst, std::size_t size) override;
            void seek(std::uint64_t offset, whence_t whence) override;
            std::uint64_t tell() const override;
            std::uint64_t size() const override;
            std::size_t read_at(std::uint64_t offset, void* dst, std::size_t size) override;

        private:
            std::shared_ptr<byte_source> m_inner;
            mutable std::mutex m_mutex;
    };
}
