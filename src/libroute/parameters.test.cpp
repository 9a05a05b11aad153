#include <route/route>

#include <gtest/gtest.h>

using namespace std::literals;

class ParametersTest : public testing::Test {
protected:
    route::parameters params;

    ParametersTest() {
        params.set("id", "42");
        params.set("name", "adam");
        params.set("flag", "yes");
        params.set("big", "70000");
        params.set("negative", " -5");
        params.set("padded", " 42");
        params.set("signed", "+42");
        params.set("ratio", "0.25");
        params.set("file", "docs/../readme.md");
        params.set("uuid", "8c2d1e6e-3a5b-4f7d-9c1e-2b6a4d8f0e13");
    }
};

TEST_F(ParametersTest, Get) {
    EXPECT_EQ("42"sv, params.get("id"));
    EXPECT_EQ("adam"sv, params.get("name"));
    EXPECT_FALSE(params.get("missing"));
    EXPECT_EQ(10, params.size());
}

TEST_F(ParametersTest, LastBindingWins) {
    params.set("id", "43");

    EXPECT_EQ("43"sv, params.get("id"));
    EXPECT_EQ(10, params.size());
}

TEST_F(ParametersTest, TypedGet) {
    EXPECT_EQ(42, params.get<int>("id"));
    EXPECT_EQ(true, params.get<bool>("flag"));
    EXPECT_EQ("adam"s, params.get<std::string>("name"));
    EXPECT_EQ(std::chrono::seconds(42), params.get<std::chrono::seconds>("id"));
}

TEST_F(ParametersTest, TypedGetFailure) {
    EXPECT_FALSE(params.get<int>("name"));
    EXPECT_FALSE(params.get<int>("missing"));
    EXPECT_FALSE(params.get<std::int16_t>("big"));
    EXPECT_EQ(70000, params.get<std::int32_t>("big"));
}

TEST_F(ParametersTest, StrictNumbers) {
    EXPECT_FALSE(params.get<int>("negative"));
    EXPECT_FALSE(params.get<int>("padded"));
    EXPECT_FALSE(params.get<int>("signed"));
    EXPECT_FALSE(params.get<std::uint64_t>("negative"));
    EXPECT_FALSE(params.get<unsigned long>("padded"));
    EXPECT_FALSE(params.get<int>("ratio"));
    EXPECT_EQ(0.25, params.get<double>("ratio"));
}

TEST_F(ParametersTest, Optional) {
    EXPECT_EQ(std::optional<int>(42), params.get<std::optional<int>>("id"));
    EXPECT_EQ(
        std::optional<int>(),
        params.require<std::optional<int>>("name")
    );
    EXPECT_FALSE(params.get<std::optional<int>>("missing"));
}

TEST_F(ParametersTest, Path) {
    EXPECT_EQ(
        std::filesystem::path("readme.md"),
        params.get<std::filesystem::path>("file")
    );
    EXPECT_EQ(
        std::filesystem::path("adam"),
        params.require<std::filesystem::path>("name")
    );
}

TEST_F(ParametersTest, Uuid) {
    const auto id = params.get<UUID::uuid>("uuid");

    ASSERT_TRUE(id);
    EXPECT_EQ(UUID::uuid("8c2d1e6e-3a5b-4f7d-9c1e-2b6a4d8f0e13"sv), *id);

    EXPECT_FALSE(params.get<UUID::uuid>("name"));
    EXPECT_THROW(params.require<UUID::uuid>("id"), route::parameter_error);
}

TEST_F(ParametersTest, Require) {
    EXPECT_EQ(42, params.require<int>("id"));
    EXPECT_EQ("adam"sv, params.require<std::string_view>("name"));
}

TEST_F(ParametersTest, RequireMissing) {
    try {
        params.require<int>("missing");
        FAIL() << "Expected parameter_error";
    }
    catch (const route::parameter_error& error) {
        EXPECT_STREQ("Missing required path parameter 'missing'", error.what());
    }
}

TEST_F(ParametersTest, RequireInvalid) {
    EXPECT_THROW(params.require<int>("name"), route::parameter_error);
    EXPECT_THROW(params.require<unsigned>("name"), route::parameter_error);
    EXPECT_THROW(params.require<std::uint8_t>("big"), route::parameter_error)
        << "Parsed value should not be truncated";
    EXPECT_THROW(
        params.require<std::uint64_t>("negative"),
        route::parameter_error
    ) << "Negative value should not wrap around";
    EXPECT_THROW(params.require<long>("padded"), route::parameter_error);
}

TEST_F(ParametersTest, RequireInvalidMessage) {
    try {
        params.require<unsigned>("negative");
        FAIL() << "Expected parameter_error";
    }
    catch (const route::parameter_error& error) {
        EXPECT_STREQ(
            "Failed to parse path parameter 'negative': "
            "' -5' is not an unsigned integer",
            error.what()
        );
    }
}

TEST_F(ParametersTest, NoCatchAll) {
    EXPECT_FALSE(params.has_catch_all());
    EXPECT_TRUE(params.catch_all().empty());
    EXPECT_TRUE(params.catch_all_path().empty());
}

TEST(Parameters, CatchAll) {
    constexpr auto path = "/one/two//three/"sv;
    const auto segments = std::vector<std::string_view> {
        "one",
        "two",
        "three"
    };

    auto params = route::parameters();
    params.set_catch_all(segments, path.substr(1));

    EXPECT_TRUE(params.has_catch_all());
    EXPECT_TRUE(params.empty());
    ASSERT_EQ(3, params.catch_all().size());
    EXPECT_EQ("two"sv, params.catch_all()[1]);
    EXPECT_EQ("one/two//three/"sv, params.catch_all_path());
}

TEST(Parameters, EmptyCatchAll) {
    auto params = route::parameters();
    params.set_catch_all({}, {});

    EXPECT_TRUE(params.has_catch_all());
    EXPECT_TRUE(params.catch_all().empty());
}
