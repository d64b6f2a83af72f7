#include <doctest/doctest.h>
#include <riff/fourcc.hh>
#include <riff/chunk_model.hh>
#include <riff/exceptions.hh>

#include <sstream>
#include <unordered_map>
#include <set>

using namespace riff;

TEST_SUITE("FOURCC") {
    TEST_CASE("fourcc construction") {
        SUBCASE("default construction") {
            fourcc f;
            CHECK(f.to_string() == "    ");
        }

        SUBCASE("from 4 chars") {
            fourcc f('R', 'I', 'F', 'F');
            CHECK(f.to_string() == "RIFF");
            CHECK(f == chunk_ids::RIFF);
        }

        SUBCASE("from raw bytes never fails") {
            const unsigned char data[] = {0xFF, 0x00, 0xC3, 0x28};
            auto f = fourcc::from_bytes(data);
            CHECK(static_cast<unsigned char>(f[0]) == 0xFF);
            CHECK(f[1] == '\0');
            CHECK(static_cast<unsigned char>(f[3]) == 0x28);
        }

        SUBCASE("user-defined literal") {
            constexpr auto f = "LIST"_4cc;
            static_assert(f == chunk_ids::LIST);
            CHECK(f.to_string() == "LIST");
        }
    }

    TEST_CASE("fourcc from text") {
        SUBCASE("exactly four bytes") {
            CHECK(fourcc::from_text("smpl") == fourcc('s', 'm', 'p', 'l'));
            CHECK(fourcc::from_text("fmt ") == fourcc('f', 'm', 't', ' '));
        }

        SUBCASE("wrong length is rejected") {
            for (std::string_view text : {"", "abc", "abcde", "RIFFRIFF"}) {
                try {
                    (void)fourcc::from_text(text);
                    FAIL("expected length_mismatch for '" << text << "'");
                } catch (const parse_error& e) {
                    CHECK(e.code() == errc::length_mismatch);
                }
            }
        }

        SUBCASE("length is counted in bytes") {
            // "é" is two bytes in UTF-8
            CHECK(fourcc::from_text("\xC3\xA9" "ab").as_text() == "\xC3\xA9" "ab");
            CHECK_THROWS_AS((void)fourcc::from_text("\xC3\xA9" "abc"), parse_error);
        }
    }

    TEST_CASE("fourcc as text") {
        SUBCASE("ASCII") {
            CHECK(fourcc::from_text("RIFF").as_text() == "RIFF");
        }

        SUBCASE("invalid UTF-8 fails instead of crashing") {
            const unsigned char bad_lead[] = {0xFF, 'a', 'b', 'c'};
            const unsigned char truncated[] = {'a', 'b', 'c', 0xE2};
            const unsigned char overlong[] = {0xC0, 0x80, 'a', 'b'};
            for (const unsigned char* data : {bad_lead, truncated, overlong}) {
                auto f = fourcc::from_bytes(data);
                try {
                    (void)f.as_text();
                    FAIL("expected utf8_error");
                } catch (const parse_error& e) {
                    CHECK(e.code() == errc::utf8_error);
                }
            }
        }

        SUBCASE("multi-byte sequences are accepted") {
            const unsigned char euro[] = {0xE2, 0x82, 0xAC, 'x'};
            CHECK(fourcc::from_bytes(euro).as_text() == "\xE2\x82\xAC" "x");
        }
    }

    TEST_CASE("fourcc as bytes") {
        auto f = fourcc::from_text("data");
        auto b = f.as_bytes();
        CHECK(b[0] == std::byte{'d'});
        CHECK(b[3] == std::byte{'a'});
        CHECK(fourcc::from_bytes(b) == f);
    }

    TEST_CASE("fourcc comparison and hashing") {
        CHECK(fourcc::from_text("tst1") != fourcc::from_text("tst2"));
        CHECK(fourcc::from_text("tst1") < fourcc::from_text("tst2"));

        std::unordered_map<fourcc, int> counts;
        counts[fourcc::from_text("test")]++;
        counts["test"_4cc]++;
        counts["LIST"_4cc]++;
        CHECK(counts.size() == 2);
        CHECK(counts["test"_4cc] == 2);

        std::set<fourcc> ordered{"tst2"_4cc, "tst1"_4cc};
        CHECK(ordered.begin()->to_string() == "tst1");
    }

    TEST_CASE("fourcc stream output") {
        std::ostringstream os;
        const unsigned char data[] = {'a', 0x01, 'b', 'c'};
        os << "RIFF"_4cc << ' ' << fourcc::from_bytes(data);
        CHECK(os.str() == "'RIFF' 'a\\x01bc'");
    }
}
