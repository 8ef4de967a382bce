//src/test/types.test.cpp
#include "gtest/gtest.h"
#include "../../include/types.h"

using namespace schemata;
using registry::ErrorCode;

TEST(ScopeKeyTest, RendersSubjectAndType) {
    auto key = ScopeKey::make("orders", "value");
    ASSERT_TRUE(key.isOk());
    EXPECT_EQ(key->str(), "orders-value");
    EXPECT_EQ(key->subject(), "orders");
    EXPECT_EQ(key->type(), SchemaType::VALUE);

    auto k2 = ScopeKey::make("orders", SchemaType::KEY);
    ASSERT_TRUE(k2.isOk());
    EXPECT_EQ(k2->str(), "orders-key");
    EXPECT_FALSE(key.value() == k2.value());
}

TEST(ScopeKeyTest, RejectsBadInput) {
    EXPECT_EQ(ScopeKey::make("", "value").code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(ScopeKey::make("orders", "VALUE").code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(ScopeKey::make("orders", "both").code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(ScopeKey::make(std::string("a\nb"), "key").code(), ErrorCode::INVALID_ARGUMENT);

    auto err = ScopeKey::make("", "value");
    EXPECT_EQ(err.error().context.at("parameter"), "subject");
}

TEST(ScopeKeyTest, ParseInvertsRendering) {
    auto key = ScopeKey::make("topic-key", "value");
    ASSERT_TRUE(key.isOk());
    auto parsed = ScopeKey::parse(key->str());
    ASSERT_TRUE(parsed.isOk());
    EXPECT_EQ(parsed->subject(), "topic-key");
    EXPECT_EQ(parsed->type(), SchemaType::VALUE);

    EXPECT_FALSE(ScopeKey::parse("no-suffix").isOk());
    EXPECT_FALSE(ScopeKey::parse("-key").isOk());
}

TEST(VersionRefTest, ParsesLatestAndNumbers) {
    auto latest = VersionRef::parse("latest");
    ASSERT_TRUE(latest.isOk());
    EXPECT_TRUE(latest->isLatest());
    EXPECT_EQ(latest->toString(), "latest");

    auto three = VersionRef::parse("3");
    ASSERT_TRUE(three.isOk());
    EXPECT_FALSE(three->isLatest());
    EXPECT_EQ(three->number(), 3);
}

TEST(VersionRefTest, RejectsZeroSignsAndOverflow) {
    for (const char* text : {"0", "-1", "+2", "", "1.5", "abc", "2147483648", "LATEST"}) {
        auto parsed = VersionRef::parse(text);
        EXPECT_EQ(parsed.code(), ErrorCode::INVALID_ARGUMENT) << "input: " << text;
    }
    EXPECT_TRUE(VersionRef::parse("2147483647").isOk());
}

TEST(SchemaIdTest, ParsesPositiveIds) {
    auto id = parseSchemaId("42");
    ASSERT_TRUE(id.isOk());
    EXPECT_EQ(id.value(), 42);
    EXPECT_EQ(parseSchemaId("0").code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(parseSchemaId("-3").code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(parseSchemaId("99999999999999999999").code(), ErrorCode::INVALID_ARGUMENT);
}

TEST(CompatibilityModeTest, ParseIsCaseInsensitive) {
    auto mode = parseCompatibilityMode("full_transitive");
    ASSERT_TRUE(mode.isOk());
    EXPECT_EQ(mode.value(), CompatibilityMode::FULL_TRANSITIVE);
    EXPECT_EQ(toString(CompatibilityMode::BACKWARD), "BACKWARD");
    EXPECT_EQ(parseCompatibilityMode("SIDEWAYS").code(), ErrorCode::INVALID_MODE);
    EXPECT_EQ(parseCompatibilityMode("").code(), ErrorCode::INVALID_MODE);
}

TEST(CompatibilityModeTest, DirectionFlags) {
    EXPECT_TRUE(checksBackward(CompatibilityMode::FULL));
    EXPECT_TRUE(checksForward(CompatibilityMode::FULL));
    EXPECT_FALSE(checksForward(CompatibilityMode::BACKWARD_TRANSITIVE));
    EXPECT_FALSE(checksBackward(CompatibilityMode::FORWARD));
    EXPECT_FALSE(checksBackward(CompatibilityMode::NONE));
    EXPECT_TRUE(isTransitive(CompatibilityMode::FORWARD_TRANSITIVE));
    EXPECT_FALSE(isTransitive(CompatibilityMode::FULL));
}
