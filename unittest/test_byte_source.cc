#include <doctest/doctest.h>
#include <riff/byte_source.hh>
#include <riff/contents.hh>
#include <riff/lazy.hh>

#include <atomic>
#include <sstream>
#include <string>
#include <thread>
#include <vector>
#include "test_utils.hh"

using namespace riff;

namespace {
    std::string as_string(const std::vector<std::byte>& data) {
        return {reinterpret_cast<const char*>(data.data()), data.size()};
    }
}

TEST_SUITE("Byte sources") {
    TEST_CASE("memory_source") {
        memory_source src(bytes("0123456789"));
        CHECK(src.size() == 10);
        CHECK(src.tell() == 0);

        char buf[4] = {};
        CHECK(src.read(buf, 4) == 4);
        CHECK(std::string(buf, 4) == "0123");
        CHECK(src.tell() == 4);

        SUBCASE("relative and end seeks") {
            src.seek(2, byte_source::cur);
            CHECK(src.tell() == 6);
            src.seek(3, byte_source::end);
            CHECK(src.tell() == 7);
            CHECK(src.read(buf, 4) == 3);
            CHECK(std::string(buf, 3) == "789");
        }

        SUBCASE("positions past the end read nothing") {
            src.seek(100, byte_source::set);
            CHECK(src.read(buf, 4) == 0);
            CHECK(src.read_at(8, buf, 4) == 2);
        }

        SUBCASE("seeking before the start is an error") {
            CHECK_THROWS_AS(src.seek(11, byte_source::end), io_error);
        }

        SUBCASE("exact reads") {
            CHECK(as_string(src.read_exact_at(5, 3)) == "567");
            CHECK_THROWS_AS((void)src.read_exact_at(8, 3), io_error);
        }
    }

    TEST_CASE("stream_source") {
        std::istringstream is(std::string("RIFF\x04\x00\x00\x00" "abcd", 12));
        stream_source src(is);
        CHECK(src.size() == 12);

        char buf[8] = {};
        CHECK(src.read_at(8, buf, 8) == 4);
        CHECK(std::string(buf, 4) == "abcd");

        // The short read above left the stream at EOF
        CHECK(src.size() == 12);
        CHECK(as_string(src.read_exact_at(0, 4)) == "RIFF");
        CHECK(src.tell() == 4);
    }

    TEST_CASE("stream_source over a stream in a bad state") {
        std::istringstream is("RIFF");
        is.setstate(std::ios::badbit);
        stream_source src(is);
        char buf[4];
        CHECK_THROWS_AS((void)src.read(buf, 4), io_error);
    }

    TEST_CASE("opening a missing file") {
        CHECK_THROWS_AS((void)stream_source::open(test_path("no_such_file.riff")), io_error);
        CHECK_THROWS_AS((void)lazy_file::open(test_path("no_such_file.riff")), io_error);
    }

    TEST_CASE("locked_source forwards to the wrapped source") {
        auto inner = std::make_shared<memory_source>(load_test_data("set_2.riff"));
        locked_source src(inner);
        CHECK(src.size() == 32);
        CHECK(as_string(src.read_exact_at(8, 4)) == "smpl");
        CHECK(src.tell() == 12);
        CHECK(inner->tell() == 12);

        CHECK_THROWS_AS((void)locked_source(nullptr), io_error);
    }

    TEST_CASE("lazy chunks over a locked source from several threads") {
        auto source = std::make_shared<locked_source>(stream_source::open(test_path("set_4.riff")));
        auto file = lazy_file::from_source(source);
        const auto expected = read_contents(file.as_chunk());

        std::atomic<int> mismatches{0};
        std::atomic<int> failures{0};
        std::vector<std::thread> workers;
        for (int t = 0; t < 4; t++) {
            workers.emplace_back([&] {
                for (int i = 0; i < 50; i++) {
                    try {
                        if (read_contents(file.as_chunk()) != expected) {
                            ++mismatches;
                        }
                    } catch (const riff_error&) {
                        ++failures;
                    }
                }
            });
        }
        for (auto& w : workers) {
            w.join();
        }

        CHECK(mismatches.load() == 0);
        CHECK(failures.load() == 0);
    }
}
