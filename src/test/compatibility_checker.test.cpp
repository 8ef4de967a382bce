//src/test/compatibility_checker.test.cpp
#include "gtest/gtest.h"
#include "../../include/compat/compatibility_checker.h"
#include "../../include/canonical/avro_canonicalizer.h"
#include "test_schemas.h"

using namespace schemata;
using namespace schemata::compat;
using schemata::canonical::AvroCanonicalizer;

namespace {

std::shared_ptr<const avro::AvroSchema> parse(const std::string& text) {
    auto parsed = AvroCanonicalizer::parse(text);
    EXPECT_TRUE(parsed.isOk()) << (parsed.isOk() ? "" : parsed.error().details);
    return parsed.isOk() ? parsed.value() : nullptr;
}

std::vector<Incompatibility> readWith(const std::string& reader, const std::string& writer) {
    auto r = parse(reader);
    auto w = parse(writer);
    return CompatibilityChecker::checkReaderWriter(r->root(), w->root());
}

std::string record(const std::string& fields) {
    return R"({"type":"record","name":"R","fields":[)" + fields + "]}";
}

} // namespace

class CompatibilityCheckerTest : public ::testing::Test {
protected:
    CompatibilityChecker checker;

    CompatibilityResult check(const std::string& candidate, const std::vector<std::string>& history,
                              CompatibilityMode mode) {
        auto cand = parse(candidate);
        std::vector<std::shared_ptr<const avro::AvroSchema>> refs;
        for (const auto& text : history) {
            refs.push_back(parse(text));
        }
        return checker.isCompatible(*cand, refs, mode);
    }
};

TEST_F(CompatibilityCheckerTest, EmptyHistoryAndNoneAreAlwaysCompatible) {
    EXPECT_TRUE(check(test_schemas::kUserRequiredAge, {}, CompatibilityMode::FULL_TRANSITIVE).compatible);
    EXPECT_TRUE(check(R"("string")", {test_schemas::kUserV1}, CompatibilityMode::NONE).compatible);
}

TEST_F(CompatibilityCheckerTest, BackwardRequiresDefaultsForNewFields) {
    EXPECT_TRUE(check(test_schemas::kUserV2, {test_schemas::kUserV1}, CompatibilityMode::BACKWARD).compatible);

    auto result = check(test_schemas::kUserRequiredAge, {test_schemas::kUserV1}, CompatibilityMode::BACKWARD);
    ASSERT_FALSE(result.compatible);
    ASSERT_EQ(result.violations.size(), 1u);
    EXPECT_EQ(result.violations[0].type, IncompatibilityType::READER_FIELD_MISSING_DEFAULT_VALUE);
    EXPECT_EQ(result.violations[0].rule(), "READER_FIELD_MISSING_DEFAULT_VALUE");
    EXPECT_EQ(result.violations[0].path, "/fields/2");
    EXPECT_EQ(result.violations[0].direction, CheckDirection::BACKWARD);
}

TEST_F(CompatibilityCheckerTest, DroppingRequiredFieldFailsBothDirections) {
    auto backward = check(test_schemas::kUserWithoutName, {test_schemas::kUserV1}, CompatibilityMode::BACKWARD);
    ASSERT_FALSE(backward.compatible);
    ASSERT_EQ(backward.violations.size(), 1u);
    EXPECT_EQ(backward.violations[0].type, IncompatibilityType::WRITER_FIELD_REMOVED_WITHOUT_DEFAULT);
    EXPECT_EQ(backward.violations[0].path, "/fields");
    EXPECT_NE(backward.violations[0].message.find("'name'"), std::string::npos);

    auto forward = check(test_schemas::kUserWithoutName, {test_schemas::kUserV1}, CompatibilityMode::FORWARD);
    ASSERT_FALSE(forward.compatible);
    EXPECT_EQ(forward.violations[0].direction, CheckDirection::FORWARD);
    EXPECT_EQ(forward.violations[0].type, IncompatibilityType::READER_FIELD_MISSING_DEFAULT_VALUE);
    EXPECT_FALSE(check(test_schemas::kUserWithoutName, {test_schemas::kUserV1}, CompatibilityMode::FULL).compatible);
}

TEST_F(CompatibilityCheckerTest, ForwardMirrorsBackward) {
    // A new required field is unknown to the old reader.
    auto forward = check(test_schemas::kUserRequiredAge, {test_schemas::kUserV1}, CompatibilityMode::FORWARD);
    ASSERT_FALSE(forward.compatible);
    ASSERT_EQ(forward.violations.size(), 1u);
    EXPECT_EQ(forward.violations[0].type, IncompatibilityType::WRITER_FIELD_REMOVED_WITHOUT_DEFAULT);
    EXPECT_EQ(forward.violations[0].direction, CheckDirection::FORWARD);

    EXPECT_TRUE(check(test_schemas::kUserV2, {test_schemas::kUserV1}, CompatibilityMode::FULL).compatible);
}

TEST_F(CompatibilityCheckerTest, DroppingFieldWithDefaultIsAllowed) {
    // v2's email carries a default, so going back to v1 is fine both ways.
    EXPECT_TRUE(check(test_schemas::kUserV1, {test_schemas::kUserV2}, CompatibilityMode::FULL).compatible);
}

TEST_F(CompatibilityCheckerTest, TransitiveChecksWholeHistory) {
    const std::string v1 = record(R"({"name":"a","type":"int"})");
    const std::string v2 = record(R"({"name":"a","type":"int"},{"name":"b","type":"int","default":0})");
    // v3 drops the default of b: reads v2 data but not v1 data.
    const std::string v3 = record(R"({"name":"a","type":"int"},{"name":"b","type":"int"})");

    EXPECT_TRUE(check(v3, {v1, v2}, CompatibilityMode::BACKWARD).compatible);

    auto transitive = check(v3, {v1, v2}, CompatibilityMode::BACKWARD_TRANSITIVE);
    ASSERT_FALSE(transitive.compatible);
    ASSERT_EQ(transitive.violations.size(), 1u);
    EXPECT_EQ(transitive.violations[0].reference_index, 0u);
}

TEST_F(CompatibilityCheckerTest, NumericPromotions) {
    EXPECT_TRUE(readWith(R"("long")", R"("int")").empty());
    EXPECT_TRUE(readWith(R"("double")", R"("float")").empty());
    EXPECT_TRUE(readWith(R"("float")", R"("long")").empty());
    EXPECT_TRUE(readWith(R"("bytes")", R"("string")").empty());
    EXPECT_TRUE(readWith(R"("string")", R"("bytes")").empty());

    auto narrowing = readWith(R"("int")", R"("long")");
    ASSERT_EQ(narrowing.size(), 1u);
    EXPECT_EQ(narrowing[0].type, IncompatibilityType::TYPE_MISMATCH);
    EXPECT_EQ(narrowing[0].path, "/");
}

TEST_F(CompatibilityCheckerTest, FieldTypeChangeReportsPath) {
    auto found = readWith(record(R"({"name":"a","type":"string"})"), record(R"({"name":"a","type":"int"})"));
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].type, IncompatibilityType::TYPE_MISMATCH);
    EXPECT_EQ(found[0].path, "/fields/0/type");
}

TEST_F(CompatibilityCheckerTest, EnumSymbols) {
    const std::string abc = R"({"type":"enum","name":"E","symbols":["A","B","C"]})";
    const std::string ab = R"({"type":"enum","name":"E","symbols":["A","B"]})";
    const std::string ab_default = R"({"type":"enum","name":"E","symbols":["A","B"],"default":"A"})";

    EXPECT_TRUE(readWith(abc, ab).empty());
    auto missing = readWith(ab, abc);
    ASSERT_EQ(missing.size(), 1u);
    EXPECT_EQ(missing[0].type, IncompatibilityType::MISSING_ENUM_SYMBOLS);
    EXPECT_NE(missing[0].message.find("C"), std::string::npos);
    EXPECT_TRUE(readWith(ab_default, abc).empty());
}

TEST_F(CompatibilityCheckerTest, NamedTypesMatchByNameOrAlias) {
    const std::string f4 = R"({"type":"fixed","name":"F","size":4})";
    const std::string f8 = R"({"type":"fixed","name":"F","size":8})";
    const std::string g4 = R"({"type":"fixed","name":"G","size":4})";
    const std::string g4_alias = R"({"type":"fixed","name":"G","size":4,"aliases":["F"]})";

    auto size = readWith(f8, f4);
    ASSERT_EQ(size.size(), 1u);
    EXPECT_EQ(size[0].type, IncompatibilityType::FIXED_SIZE_MISMATCH);

    auto name = readWith(g4, f4);
    ASSERT_EQ(name.size(), 1u);
    EXPECT_EQ(name[0].type, IncompatibilityType::NAME_MISMATCH);

    EXPECT_TRUE(readWith(g4_alias, f4).empty());
    // Namespaces are ignored when unqualified names agree.
    EXPECT_TRUE(readWith(R"({"type":"fixed","name":"a.F","size":4})", f4).empty());
}

TEST_F(CompatibilityCheckerTest, FieldAliasesResolveRenames) {
    const std::string writer = record(R"({"name":"old_name","type":"int"})");
    const std::string reader = record(R"({"name":"new_name","type":"int","aliases":["old_name"]})");
    EXPECT_TRUE(readWith(reader, writer).empty());
    EXPECT_FALSE(readWith(record(R"({"name":"new_name","type":"int"})"), writer).empty());
}

TEST_F(CompatibilityCheckerTest, Unions) {
    // Writer union: every branch must be readable.
    EXPECT_TRUE(readWith(R"(["null","string","int"])", R"(["null","string"])").empty());
    auto lost = readWith(R"(["null","string"])", R"(["null","string","int"])");
    ASSERT_EQ(lost.size(), 1u);
    EXPECT_EQ(lost[0].type, IncompatibilityType::MISSING_UNION_BRANCH);

    // Reader union accepts a plain writer if some branch matches, with promotion.
    EXPECT_TRUE(readWith(R"(["null","long"])", R"("int")").empty());
    EXPECT_FALSE(readWith(R"(["null","boolean"])", R"("int")").empty());

    // Plain reader accepts a writer union only if every branch resolves.
    EXPECT_TRUE(readWith(R"("long")", R"(["int","long"])").empty());
    EXPECT_FALSE(readWith(R"("long")", R"(["null","long"])").empty());
}

TEST_F(CompatibilityCheckerTest, ContainersRecurse) {
    auto arrays = readWith(R"({"type":"array","items":"int"})", R"({"type":"array","items":"string"})");
    ASSERT_EQ(arrays.size(), 1u);
    EXPECT_EQ(arrays[0].path, "/items");

    auto maps = readWith(R"({"type":"map","values":"long"})", R"({"type":"map","values":"int"})");
    EXPECT_TRUE(maps.empty());

    EXPECT_FALSE(readWith(R"({"type":"map","values":"int"})", R"({"type":"array","items":"int"})").empty());
}

TEST_F(CompatibilityCheckerTest, RecursiveSchemasTerminate) {
    EXPECT_TRUE(readWith(test_schemas::kLinkedList, test_schemas::kLinkedList).empty());

    const std::string extended = R"({
        "type": "record", "name": "Node",
        "fields": [
            {"name": "value", "type": "int"},
            {"name": "next", "type": ["null", "Node"], "default": null},
            {"name": "label", "type": "string", "default": ""}
        ]
    })";
    EXPECT_TRUE(check(extended, {test_schemas::kLinkedList}, CompatibilityMode::FULL).compatible);
}
