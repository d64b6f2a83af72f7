#include <doctest/doctest.h>
#include <riff/contents.hh>
#include <riff/exceptions.hh>

#include <string>
#include <vector>
#include "test_utils.hh"

using namespace riff;

TEST_SUITE("Contents") {
    TEST_CASE("snapshot of nested containers") {
        auto file = eager_file::load(load_test_data("set_4.riff"));
        auto root = read_contents(file.as_chunk());

        CHECK(root.id == "RIFF"_4cc);
        CHECK(root.kind == chunk_kind::typed_container);
        REQUIRE(root.type.has_value());
        CHECK(*root.type == "smpl"_4cc);
        CHECK(root.data.empty());
        REQUIRE(root.children.size() == 2);

        const auto& list = root.children[0];
        CHECK(list.id == "LIST"_4cc);
        CHECK(list.type == std::optional<fourcc>("tst1"_4cc));
        REQUIRE(list.children.size() == 2);
        CHECK(list.children[0].data == bytes("hey this is a test"));
        CHECK(list.children[1].data == bytes("hey this is another test!"));
        CHECK(list.children[1].kind == chunk_kind::leaf);

        const auto& seqt = root.children[1];
        CHECK(seqt.kind == chunk_kind::untyped_container);
        CHECK_FALSE(seqt.type.has_value());
        REQUIRE(seqt.children.size() == 1);
        CHECK(seqt.children[0].data == bytes("final test"));
    }

    TEST_CASE("eager and lazy snapshots are equal") {
        auto eager = eager_file::load(load_test_data("set_3.riff"));
        auto lazy = lazy_file::open(test_path("set_3.riff"));
        CHECK(read_contents(eager.as_chunk()) == read_contents(lazy.as_chunk()));
    }

    TEST_CASE("snapshot of a single child") {
        auto file = eager_file::load(load_test_data("set_3.riff"));
        auto seqt = file.children();
        seqt.next();
        auto c = read_contents(seqt.current());
        CHECK(c.id == "seqt"_4cc);
        CHECK(c.children.size() == 1);
    }

    TEST_CASE("error anywhere in the subtree is thrown") {
        auto data = raw::typed("RIFF", "smpl", {
            raw::typed("LIST", "good", {raw::leaf("test", bytes("ok"))}),
            raw::typed("LIST", "bad ", {raw::header("test", 500)}),
        });
        auto file = eager_file::load(data);
        try {
            (void)read_contents(file.as_chunk());
            FAIL("expected parse_error");
        } catch (const parse_error& e) {
            CHECK(e.code() == errc::payload_len_mismatch);
        }
    }

    TEST_CASE("depth limit") {
        auto data = raw::typed("RIFF", "smpl", {
            raw::typed("LIST", "lvl1", {
                raw::typed("LIST", "lvl2", {raw::leaf("test", bytes("deep"))}),
            }),
        });
        auto file = eager_file::load(data);

        parse_options options;
        options.max_depth = 1;
        try {
            (void)read_contents(file.as_chunk(), options);
            FAIL("expected depth_limit");
        } catch (const parse_error& e) {
            CHECK(e.code() == errc::depth_limit);
        }

        std::vector<std::uint64_t> offsets;
        options.strict = false;
        options.on_warning = [&](std::uint64_t offset, std::string_view category, std::string_view) {
            CHECK(category == "depth_limit");
            offsets.push_back(offset);
        };
        auto c = read_contents(file.as_chunk(), options);
        REQUIRE(c.children.size() == 1);
        CHECK(*c.children[0].type == "lvl1"_4cc);
        CHECK(c.children[0].children.empty());
        CHECK(offsets == std::vector<std::uint64_t>{12});
    }

    TEST_CASE("to_node rebuilds every level") {
        auto file = eager_file::load(load_test_data("set_3.riff"));
        auto node = to_node(read_contents(file.as_chunk()));
        CHECK(node.id() == "RIFF"_4cc);
        CHECK(node.payload_len() == 100);
        REQUIRE(node.children().size() == 2);
        CHECK(node.children()[1].kind() == chunk_kind::untyped_container);
    }

    TEST_CASE("without explicit options the file's options apply") {
        auto data = raw::typed("RIFF", "smpl", {
            raw::typed("LIST", "lvl1", {
                raw::typed("LIST", "lvl2", {raw::leaf("test", bytes("deep"))}),
            }),
        });

        int depth_warnings = 0;
        parse_options options;
        options.strict = false;
        options.max_depth = 1;
        options.on_warning = [&depth_warnings](std::uint64_t, std::string_view category, std::string_view) {
            if (category == "depth_limit") {
                ++depth_warnings;
            }
        };

        auto eager = eager_file::load(data, options);
        auto from_eager = read_contents(eager.as_chunk());
        REQUIRE(from_eager.children.size() == 1);
        CHECK(from_eager.children[0].children.empty());

        temp_file file("contents_options.riff", data);
        auto lazy = lazy_file::open(file.path(), options);
        CHECK(read_contents(lazy.as_chunk()) == from_eager);

        CHECK(depth_warnings == 2);
    }
}
