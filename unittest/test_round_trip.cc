//
// Builder output read back through both readers
//

#include <doctest/doctest.h>
#include <riff/builder.hh>
#include <riff/contents.hh>
#include <riff/eager.hh>
#include <riff/lazy.hh>

#include <string>
#include <vector>
#include "test_utils.hh"

using namespace riff;

namespace {
    std::vector<chunk_node> sample_trees() {
        std::vector<chunk_node> trees;

        trees.push_back(chunk_node::riff("WAVE"_4cc));

        trees.push_back(chunk_node::riff("smpl"_4cc, {
            chunk_node::leaf("tst1"_4cc, bytes({0xFF})),
            chunk_node::leaf("tst2"_4cc, bytes({0xEE})),
        }));

        trees.push_back(chunk_node::riff("AVI "_4cc, {
            chunk_node::typed_container("LIST"_4cc, "hdrl"_4cc, {
                chunk_node::leaf("avih"_4cc, std::vector<std::byte>(56, std::byte{0x11})),
                chunk_node::typed_container("LIST"_4cc, "strl"_4cc, {
                    chunk_node::leaf("strh"_4cc, bytes("odd")),
                    chunk_node::leaf("strf"_4cc, std::vector<std::byte>{}),
                }),
            }),
            chunk_node::leaf("JUNK"_4cc, bytes("padding!!")),
            chunk_node::untyped_container("seqt"_4cc, {
                chunk_node::untyped_container("seqt"_4cc),
                chunk_node::leaf("test"_4cc, bytes("x")),
            }),
            chunk_node::typed_container("LIST"_4cc, "movi"_4cc),
        }));

        return trees;
    }

    // Expected snapshot of a builder tree
    chunk_contents expected_contents(const chunk_node& node) {
        chunk_contents c;
        c.id = node.id();
        c.kind = node.kind();
        c.type = node.type();
        if (node.kind() == chunk_kind::leaf) {
            c.data.assign(node.content().begin(), node.content().end());
        }
        for (const auto& child : node.children()) {
            c.children.push_back(expected_contents(child));
        }
        return c;
    }
}

TEST_SUITE("Round trip") {
    TEST_CASE("builder trees read back identically through the eager reader") {
        for (const auto& tree : sample_trees()) {
            auto encoded = serialize(tree);
            auto file = open_eager(encoded);
            CHECK(file.payload_len() == tree.payload_len());

            auto contents = read_contents(file.as_chunk());
            CHECK(contents == expected_contents(tree));
            CHECK(serialize(to_node(contents)) == encoded);
        }
    }

    TEST_CASE("builder trees read back identically through the lazy reader") {
        int n = 0;
        for (const auto& tree : sample_trees()) {
            auto encoded = serialize(tree);
            temp_file file("round_trip_" + std::to_string(n++) + ".riff", encoded);

            auto lazy = open_lazy(file.path());
            CHECK(lazy.as_chunk().payload_len() == tree.payload_len());
            CHECK(read_contents(lazy.as_chunk()) == expected_contents(tree));
        }
    }

    TEST_CASE("two leaves: builder, reference file and eager reader agree") {
        auto root = chunk_node::riff("smpl"_4cc, {
            chunk_node::leaf("tst1"_4cc, bytes({0xFF})),
            chunk_node::leaf("tst2"_4cc, bytes({0xEE})),
        });
        auto encoded = serialize(root);
        REQUIRE(encoded == load_test_data("set_2.riff"));

        auto file = eager_file::load(encoded);
        std::vector<std::pair<fourcc, std::vector<std::byte>>> seen;
        for (auto it = file.children(); it.has_next(); it.next()) {
            auto content = it.current().raw_content();
            seen.emplace_back(it.current().id(), std::vector<std::byte>(content.begin(), content.end()));
        }
        REQUIRE(seen.size() == 2);
        CHECK(seen[0].first == "tst1"_4cc);
        CHECK(seen[0].second == bytes({0xFF}));
        CHECK(seen[1].first == "tst2"_4cc);
        CHECK(seen[1].second == bytes({0xEE}));
    }

    TEST_CASE("reference files survive a read and rebuild") {
        for (const char* name : {"set_1.riff", "set_2.riff", "set_3.riff", "set_4.riff"}) {
            CAPTURE(name);
            auto original = load_test_data(name);
            auto file = eager_file::load(original);
            CHECK(serialize(to_node(read_contents(file.as_chunk()))) == original);
        }
    }
}
