#include <route/route>

#include <gtest/gtest.h>

using namespace std::literals;

namespace {
    auto collect(route::split_view view) -> std::vector<std::string_view> {
        return std::vector<std::string_view>(view.begin(), view.end());
    }

    using segments = std::vector<std::string_view>;
}

TEST(Split, Basic) {
    EXPECT_EQ((segments {"a", "b", "c"}), collect(route::split("/a/b/c")));
    EXPECT_EQ((segments {"a", "b", "c"}), collect(route::split("a/b/c")));
    EXPECT_EQ((segments {"component"}), collect(route::split("/component/")));
}

TEST(Split, Empty) {
    EXPECT_TRUE(collect(route::split("")).empty());
    EXPECT_TRUE(collect(route::split("/")).empty());
    EXPECT_TRUE(collect(route::split("///")).empty());
    EXPECT_TRUE(route::split("//").empty());
}

TEST(Split, RepeatedSeparators) {
    EXPECT_EQ((segments {"a", "b", "c"}), collect(route::split("/a//b///c")));
    EXPECT_EQ((segments {"a", "b"}), collect(route::split("///a/b///")));
    EXPECT_EQ(
        collect(route::split("/a//b/")),
        collect(route::split("a/b"))
    );
}

TEST(Split, CustomSeparator) {
    EXPECT_EQ(
        (segments {"path", "to", "resource"}),
        collect(route::split(":path:to:resource:", ':'))
    );
    EXPECT_EQ(
        (segments {"path/to", "file", "txt"}),
        collect(route::split("path/to.file.txt", '.'))
    );
}

TEST(Split, SegmentsReferenceSource) {
    constexpr auto path = "/users/profile"sv;

    const auto result = collect(route::split(path));

    ASSERT_EQ(2, result.size());
    EXPECT_EQ(path.data() + 1, result[0].data());
    EXPECT_EQ(path.data() + 7, result[1].data());
}

TEST(Split, IndependentIterators) {
    const auto view = route::split("/a/b/c");

    auto first = view.begin();
    auto second = view.begin();

    EXPECT_EQ("a"sv, *first++);
    EXPECT_EQ("b"sv, *first++);
    EXPECT_EQ("a"sv, *second++);
    EXPECT_EQ("c"sv, *first++);
    EXPECT_EQ("b"sv, *second);
    EXPECT_EQ(view.end(), first);
}

TEST(Split, Restartable) {
    const auto view = route::split("/x/y/z");

    EXPECT_EQ(collect(view), collect(view));
    EXPECT_EQ(3, std::distance(view.begin(), view.end()));
}

TEST(Split, LongPath) {
    auto expected = std::vector<std::string>();
    auto path = std::string();

    for (auto i = 1; i <= 100; ++i) {
        expected.push_back(fmt::format("segment{}", i));
        path += "/" + expected.back();
    }

    const auto result = collect(route::split(path));

    ASSERT_EQ(expected.size(), result.size());
    for (std::size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(expected[i], result[i]);
    }
}

TEST(SplitN, KeepsRemainder) {
    EXPECT_EQ(
        (segments {"test", "this", "string", "works/fine"}),
        collect(route::split_n("/test/this/string/works/fine", 3))
    );
    EXPECT_EQ(
        (segments {"test", "this", "string", "works/"}),
        collect(route::split_n("/test/this/string/works/", 3))
    );
}

TEST(SplitN, FewerSegmentsThanLimit) {
    EXPECT_EQ((segments {"test"}), collect(route::split_n("/test/", 3)));
    EXPECT_EQ((segments {"test"}), collect(route::split_n("test", 3)));
    EXPECT_EQ((segments {"test"}), collect(route::split_n("//test", 3)));
    EXPECT_EQ(
        (segments {"test", "this"}),
        collect(route::split_n("/test//this", 3))
    );
    EXPECT_EQ(
        (segments {"test", "this"}),
        collect(route::split_n("/test/this//", 3))
    );
    EXPECT_EQ(
        (segments {"test", "this", "string"}),
        collect(route::split_n("/test/this/string/", 3))
    );
    EXPECT_EQ(
        (segments {"test", "this", "string", "works"}),
        collect(route::split_n("/test/this/string/works", 3))
    );
}

TEST(SplitN, ZeroSplits) {
    EXPECT_EQ(
        (segments {"a//b/"}),
        collect(route::split_n("//a//b/", 0))
    );
    EXPECT_TRUE(collect(route::split_n("///", 0)).empty());
}
