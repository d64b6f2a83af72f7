/**
 * @file fourcc.hh
 * @brief Four-character code used for chunk ids and form types
 */

#pragma once
#include <array>
#include <cstddef>
#include <cstring>
#include <cstdint>
#include <string>
#include <string_view>
#include <ostream>
#include <iomanip>
#include <stdexcept>

#include <riff/export_riff.h>

namespace riff {
    struct RIFF_EXPORT fourcc {
        std::array<char, 4> b{' ', ' ', ' ', ' '};

        // Default constructor - creates "    " (four spaces)
        constexpr fourcc() = default;

        // Constructor from 4 individual chars
        constexpr fourcc(char c0, char c1, char c2, char c3)
            : b{ c0, c1, c2, c3 } {}

        constexpr fourcc(std::byte c0, std::byte c1, std::byte c2, std::byte c3)
            : b{ static_cast<char>(c0), static_cast<char>(c1), static_cast<char>(c2), static_cast<char>(c3) } {}

        // Constructor from raw bytes, never fails
        static fourcc from_bytes(const void* data) {
            fourcc result;
            std::memcpy(result.b.data(), data, 4);
            return result;
        }

        static fourcc from_bytes(const std::array<std::byte, 4>& data) {
            return from_bytes(data.data());
        }

        // Constructor from text; throws parse_error(length_mismatch) unless exactly 4 bytes
        static fourcc from_text(std::string_view text);

        // Raw identifier bytes
        [[nodiscard]] std::array<std::byte, 4> as_bytes() const {
            std::array<std::byte, 4> result;
            std::memcpy(result.data(), b.data(), 4);
            return result;
        }

        // Identifier as text, copied out of the code; throws parse_error(utf8_error) on invalid UTF-8
        [[nodiscard]] std::string as_text() const;

        // Same as as_text(), without validation (for diagnostics)
        [[nodiscard]] std::string to_string() const {
            return {b.data(), 4};
        }

        // Write to bytes
        void to_bytes(void* dest) const {
            std::memcpy(dest, b.data(), 4);
        }

        // Access individual characters
        constexpr char operator[](std::size_t i) const { return b[i]; }

        [[nodiscard]] constexpr auto begin() const { return b.begin(); }
        [[nodiscard]] constexpr auto end() const { return b.end(); }

        // Byte-wise comparison
        constexpr bool operator==(const fourcc& o) const { return b == o.b; }
        constexpr bool operator!=(const fourcc& o) const { return !(*this == o); }
        bool operator<(const fourcc& o) const { return b < o.b; }

        // Stream output as quoted string, non-printable bytes escaped
        friend std::ostream& operator<<(std::ostream& os, const fourcc& f) {
            auto flags = os.flags();
            auto fill = os.fill();
            os << '\'';
            for (char c : f.b) {
                if (c >= 32 && c <= 126) {
                    os << c;
                } else {
                    os << "\\x" << std::hex << std::setfill('0') << std::setw(2)
                       << static_cast<unsigned>(static_cast<unsigned char>(c));
                }
            }
            os << '\'';
            os.flags(flags);
            os.fill(fill);
            return os;
        }
    };

    struct fourcc_hash {
        std::size_t operator()(const fourcc& f) const noexcept {
            std::uint32_t v;
            std::memcpy(&v, f.b.data(), 4);
            return (static_cast<std::size_t>(v) * 0x9E3779B1u) ^ 0x85EBCA6Bu;
        }
    };

    // Compile-time fourcc; the literal must be exactly 4 characters
    constexpr fourcc operator""_4cc(const char* str, std::size_t len) {
        if (len != 4) {
            throw std::invalid_argument("FourCC literal must be exactly 4 characters");
        }
        return {str[0], str[1], str[2], str[3]};
    }

}

namespace std {
    template<>
    struct hash<riff::fourcc> {
        std::size_t operator()(const riff::fourcc& f) const noexcept {
            return riff::fourcc_hash{}(f);
        }
    };
}
