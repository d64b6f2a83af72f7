//
// FourCC text conversions
//

#include <riff/fourcc.hh>
#include <riff/exceptions.hh>

namespace riff {

    namespace {
        // Length of the UTF-8 sequence starting at s[i], 0 if it is not well formed
        std::size_t utf8_sequence_length(const unsigned char* s, std::size_t i, std::size_t n) {
            const unsigned char c = s[i];
            std::size_t len;
            std::uint32_t cp;

            if (c < 0x80) {
                return 1;
            } else if ((c & 0xE0) == 0xC0) {
                len = 2;
                cp = c & 0x1F;
            } else if ((c & 0xF0) == 0xE0) {
                len = 3;
                cp = c & 0x0F;
            } else if ((c & 0xF8) == 0xF0) {
                len = 4;
                cp = c & 0x07;
            } else {
                return 0;
            }

            if (i + len > n) {
                return 0;
            }
            for (std::size_t k = 1; k < len; ++k) {
                if ((s[i + k] & 0xC0) != 0x80) {
                    return 0;
                }
                cp = (cp << 6) | (s[i + k] & 0x3F);
            }

            // Reject overlong forms, surrogates and values past U+10FFFF
            static constexpr std::uint32_t min_cp[] = {0, 0, 0x80, 0x800, 0x10000};
            if (cp < min_cp[len] || (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
                return 0;
            }
            return len;
        }
    }

    fourcc fourcc::from_text(std::string_view text) {
        THROW_PARSE_IF(text.size() != 4, errc::length_mismatch,
                       "FourCC text must be exactly 4 bytes, got ", text.size(), " (\"", text, "\")");
        return {text[0], text[1], text[2], text[3]};
    }

    std::string fourcc::as_text() const {
        const auto* s = reinterpret_cast<const unsigned char*>(b.data());
        for (std::size_t i = 0; i < b.size();) {
            std::size_t len = utf8_sequence_length(s, i, b.size());
            THROW_PARSE_IF(len == 0, errc::utf8_error,
                           "FourCC ", *this, " is not valid UTF-8 (byte ", i, ")");
            i += len;
        }
        return {b.data(), b.size()};
    }

} // namespace riff
