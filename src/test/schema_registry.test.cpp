//src/test/schema_registry.test.cpp
#include "gtest/gtest.h"
#include "../../include/registry/schema_registry.h"
#include "../../include/registry_error/error_handler.h"
#include "test_schemas.h"

#include <atomic>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace schemata;
using registry::ErrorCode;

class SchemaRegistryTest : public ::testing::Test {
protected:
    std::unique_ptr<SchemaRegistry> reg;

    void SetUp() override {
        config::RegistryConfig cfg;
        cfg.log_level = LogLevel::WARN;
        auto opened = SchemaRegistry::open(cfg);
        ASSERT_TRUE(opened.isOk());
        reg = std::move(opened).value();
    }

    RegisterResult mustRegister(const std::string& subject, const std::string& schema,
                                const std::string& type = "value") {
        auto result = reg->registerSchema(subject, type, schema);
        EXPECT_TRUE(result.isOk()) << (result.isOk() ? "" : result.error().toString());
        return result.isOk() ? result.value() : RegisterResult{};
    }
};

TEST_F(SchemaRegistryTest, FirstRegistrationCreatesIdAndVersion) {
    auto result = mustRegister("users", test_schemas::kUserV1);
    EXPECT_EQ(result.id, 1);
    EXPECT_EQ(result.version, 1);
    EXPECT_TRUE(result.created);

    auto fetched = reg->getSchema("users", "value");
    ASSERT_TRUE(fetched.isOk());
    EXPECT_EQ(fetched->subject, "users");
    EXPECT_EQ(fetched->type, SchemaType::VALUE);
    EXPECT_EQ(fetched->version, 1);
    EXPECT_EQ(fetched->schema->raw_body, test_schemas::kUserV1);

    nlohmann::json j = fetched.value();
    EXPECT_EQ(j["id"], 1);
    EXPECT_EQ(j["type"], "value");
}

TEST_F(SchemaRegistryTest, ReRegisteringIsIdempotent) {
    auto first = mustRegister("users", test_schemas::kUserV1);
    auto second = mustRegister("users", test_schemas::kUserV1Reformatted);
    EXPECT_EQ(second.id, first.id);
    EXPECT_EQ(second.version, first.version);
    EXPECT_FALSE(second.created);
    EXPECT_EQ(reg->listVersions("users", "value").value(), (std::vector<VersionNumber>{1}));
}

TEST_F(SchemaRegistryTest, SameSchemaSharesIdAcrossSubjects) {
    auto users = mustRegister("users", test_schemas::kUserV1);
    auto audit = mustRegister("audit", test_schemas::kUserV1);
    auto keyed = mustRegister("users", test_schemas::kUserV1, "key");
    EXPECT_EQ(audit.id, users.id);
    EXPECT_EQ(keyed.id, users.id);
    EXPECT_EQ(audit.version, 1);
    EXPECT_EQ(keyed.version, 1);
    EXPECT_TRUE(audit.created);

    auto versions = reg->getVersionsForSchemaId(users.id);
    ASSERT_TRUE(versions.isOk());
    ASSERT_EQ(versions->size(), 3u);
    EXPECT_EQ(reg->listSubjects(), (std::set<std::string>{"audit-value", "users-key", "users-value"}));
}

TEST_F(SchemaRegistryTest, CompatibleEvolutionGetsNextVersion) {
    mustRegister("users", test_schemas::kUserV1);
    auto v2 = mustRegister("users", test_schemas::kUserV2);
    EXPECT_EQ(v2.id, 2);
    EXPECT_EQ(v2.version, 2);
    EXPECT_EQ(reg->getSchema("users", "value", VersionRef::exact(1))->schema->id, 1);
    EXPECT_EQ(reg->getSchema("users", "value")->version, 2);
}

TEST_F(SchemaRegistryTest, IncompatibleSchemaIsRejectedWithoutSideEffects) {
    mustRegister("users", test_schemas::kUserV1);

    auto rejected = reg->registerSchema("users", "value", test_schemas::kUserRequiredAge);
    ASSERT_EQ(rejected.code(), ErrorCode::INCOMPATIBLE_SCHEMA);
    EXPECT_EQ(rejected.error().context.at("rule"), "READER_FIELD_MISSING_DEFAULT_VALUE");
    EXPECT_EQ(rejected.error().context.at("subject"), "users-value");
    EXPECT_EQ(rejected.error().context.at("mode"), "BACKWARD");
    EXPECT_NE(rejected.error().details.find("age"), std::string::npos);

    EXPECT_EQ(reg->listVersions("users", "value").value(), (std::vector<VersionNumber>{1}));
    EXPECT_EQ(reg->getSchemaById(2).code(), ErrorCode::SCHEMA_ID_NOT_FOUND);

    // The next accepted schema takes the next id and version.
    auto v2 = mustRegister("users", test_schemas::kUserV2);
    EXPECT_EQ(v2.id, 2);
    EXPECT_EQ(v2.version, 2);
}

TEST_F(SchemaRegistryTest, DroppingRequiredFieldIsRejectedUnderBackward) {
    mustRegister("users", test_schemas::kUserV1);

    auto rejected = reg->registerSchema("users", "value", test_schemas::kUserWithoutName);
    ASSERT_EQ(rejected.code(), ErrorCode::INCOMPATIBLE_SCHEMA);
    EXPECT_EQ(rejected.error().context.at("rule"), "WRITER_FIELD_REMOVED_WITHOUT_DEFAULT");
    EXPECT_NE(rejected.error().details.find("'name'"), std::string::npos);
    EXPECT_EQ(reg->listVersions("users", "value").value(), (std::vector<VersionNumber>{1}));

    // Adding an optional field with a default still goes through.
    EXPECT_EQ(mustRegister("users", test_schemas::kUserV2).version, 2);
}

TEST_F(SchemaRegistryTest, ModeNoneAndSubjectOverrides) {
    mustRegister("users", test_schemas::kUserV1);
    ASSERT_TRUE(reg->setSubjectConfig("users", "value", "none").isOk());

    auto cfg = reg->getSubjectConfig("users", "value");
    ASSERT_TRUE(cfg.isOk());
    EXPECT_EQ(cfg->mode, CompatibilityMode::NONE);
    EXPECT_TRUE(cfg->is_override);

    auto accepted = mustRegister("users", test_schemas::kUserRequiredAge);
    EXPECT_EQ(accepted.version, 2);

    auto cleared = reg->clearSubjectConfig("users", "value");
    ASSERT_TRUE(cleared.isOk());
    EXPECT_TRUE(cleared.value());
    EXPECT_FALSE(reg->clearSubjectConfig("users", "value").value());

    cfg = reg->getSubjectConfig("users", "value");
    EXPECT_EQ(cfg->mode, CompatibilityMode::BACKWARD);
    EXPECT_FALSE(cfg->is_override);
}

TEST_F(SchemaRegistryTest, GlobalConfig) {
    EXPECT_EQ(reg->getGlobalConfig(), CompatibilityMode::BACKWARD);
    ASSERT_TRUE(reg->setGlobalConfig("FORWARD_TRANSITIVE").isOk());
    EXPECT_EQ(reg->getGlobalConfig(), CompatibilityMode::FORWARD_TRANSITIVE);
    EXPECT_EQ(reg->getSubjectConfig("anything", "key")->mode, CompatibilityMode::FORWARD_TRANSITIVE);

    EXPECT_EQ(reg->setGlobalConfig("LOOSE").code(), ErrorCode::INVALID_MODE);
    EXPECT_EQ(reg->setSubjectConfig("users", "value", "").code(), ErrorCode::INVALID_MODE);
    EXPECT_EQ(reg->getGlobalConfig(), CompatibilityMode::FORWARD_TRANSITIVE);
}

TEST_F(SchemaRegistryTest, VersionsAreNeverReused) {
    mustRegister("nums", test_schemas::numberedRecord(1));
    mustRegister("nums", test_schemas::numberedRecord(2));
    ASSERT_EQ(reg->deleteVersion("nums", "value", VersionRef::latest()).value(), 2);

    auto third = mustRegister("nums", test_schemas::numberedRecord(3));
    EXPECT_EQ(third.version, 3);

    ASSERT_TRUE(reg->deleteSubject("nums", "value").isOk());
    auto after_delete = mustRegister("nums", test_schemas::numberedRecord(4));
    EXPECT_EQ(after_delete.version, 4);
    EXPECT_EQ(reg->listVersions("nums", "value", true).value(), (std::vector<VersionNumber>{1, 2, 3, 4}));
}

TEST_F(SchemaRegistryTest, DeletedVersionsDisappearFromReads) {
    mustRegister("users", test_schemas::kUserV1);
    mustRegister("users", test_schemas::kUserV2);

    ASSERT_EQ(reg->deleteVersion("users", "value", VersionRef::exact(2)).value(), 2);
    EXPECT_EQ(reg->deleteVersion("users", "value", VersionRef::exact(2)).code(), ErrorCode::VERSION_NOT_FOUND);
    EXPECT_EQ(reg->getSchema("users", "value", VersionRef::exact(2)).code(), ErrorCode::VERSION_NOT_FOUND);
    EXPECT_EQ(reg->getSchema("users", "value")->version, 1);

    // Schema ids stay resolvable after their versions are deleted.
    EXPECT_TRUE(reg->getSchemaById(2).isOk());
    EXPECT_TRUE(reg->getVersionsForSchemaId(2)->empty());

    auto deleted = reg->deleteSubject("users", "value");
    ASSERT_TRUE(deleted.isOk());
    EXPECT_EQ(deleted.value(), (std::vector<VersionNumber>{1}));
    EXPECT_EQ(reg->listVersions("users", "value").code(), ErrorCode::SUBJECT_NOT_FOUND);
    EXPECT_EQ(reg->getSchema("users", "value").code(), ErrorCode::VERSION_NOT_FOUND);
    EXPECT_TRUE(reg->listSubjects().empty());
    EXPECT_EQ(reg->listSubjects(true).size(), 1u);
    EXPECT_TRUE(reg->deleteSubject("users", "value")->empty());
}

TEST_F(SchemaRegistryTest, ReRegisteringDeletedSchemaCreatesNewVersion) {
    mustRegister("users", test_schemas::kUserV1);
    ASSERT_TRUE(reg->deleteVersion("users", "value", VersionRef::exact(1)).isOk());

    auto again = mustRegister("users", test_schemas::kUserV1);
    EXPECT_EQ(again.id, 1);
    EXPECT_EQ(again.version, 2);
    EXPECT_TRUE(again.created);
}

TEST_F(SchemaRegistryTest, CheckSchemaFindsRegisteredVersion) {
    mustRegister("users", test_schemas::kUserV1);
    mustRegister("users", test_schemas::kUserV2);

    auto found = reg->checkSchema("users", "value", test_schemas::kUserV1Reformatted);
    ASSERT_TRUE(found.isOk());
    EXPECT_EQ(found->version, 1);
    EXPECT_EQ(found->schema->id, 1);

    EXPECT_EQ(reg->checkSchema("users", "value", test_schemas::kColorEnum).code(), ErrorCode::SCHEMA_NOT_FOUND);
    EXPECT_EQ(reg->checkSchema("other", "value", test_schemas::kUserV1).code(), ErrorCode::SCHEMA_NOT_FOUND);
    EXPECT_EQ(reg->checkSchema("users", "value", "{").code(), ErrorCode::SCHEMA_PARSE_ERROR);
}

TEST_F(SchemaRegistryTest, TestCompatibilityDoesNotRegister) {
    EXPECT_EQ(reg->testCompatibility("users", "value", test_schemas::kUserV1).code(), ErrorCode::VERSION_NOT_FOUND);

    mustRegister("users", test_schemas::kUserV1);
    mustRegister("users", test_schemas::kUserV2);

    // Dropping v2's defaulted email field is allowed.
    auto ok = reg->testCompatibility("users", "value", test_schemas::kUserV1);
    ASSERT_TRUE(ok.isOk());
    EXPECT_TRUE(ok->is_compatible);

    auto dropped = reg->testCompatibility("users", "value", test_schemas::kUserWithoutName);
    ASSERT_TRUE(dropped.isOk());
    EXPECT_FALSE(dropped->is_compatible);

    auto bad = reg->testCompatibility("users", "value", test_schemas::kUserRequiredAge);
    ASSERT_TRUE(bad.isOk());
    EXPECT_FALSE(bad->is_compatible);
    ASSERT_FALSE(bad->messages().empty());
    EXPECT_NE(bad->messages()[0].find("READER_FIELD_MISSING_DEFAULT_VALUE"), std::string::npos);

    auto against_v1 = reg->testCompatibility("users", "value", test_schemas::kUserV2, VersionRef::exact(1));
    ASSERT_TRUE(against_v1.isOk());
    EXPECT_TRUE(against_v1->is_compatible);
    EXPECT_EQ(reg->testCompatibility("users", "value", test_schemas::kUserV2, VersionRef::exact(9)).code(),
              ErrorCode::VERSION_NOT_FOUND);

    EXPECT_EQ(reg->listVersions("users", "value")->size(), 2u);
    nlohmann::json j = bad.value();
    EXPECT_FALSE(j["is_compatible"].get<bool>());
}

TEST_F(SchemaRegistryTest, InvalidInputsAreRejected) {
    EXPECT_EQ(reg->registerSchema("", "value", test_schemas::kUserV1).code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(reg->registerSchema("users", "header", test_schemas::kUserV1).code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(reg->registerSchema("users", "value", "").code(), ErrorCode::SCHEMA_PARSE_ERROR);
    EXPECT_EQ(reg->registerSchema("users", "value", R"({"type":"record","name":"R","fields":[]})").code(),
              ErrorCode::SCHEMA_PARSE_ERROR);
    EXPECT_EQ(reg->getSchemaById(99).code(), ErrorCode::SCHEMA_ID_NOT_FOUND);
    EXPECT_EQ(reg->getVersionsForSchemaId(99).code(), ErrorCode::SCHEMA_ID_NOT_FOUND);
    EXPECT_TRUE(reg->listSubjects().empty());
}

TEST(SchemaRegistryLimitsTest, OversizedSchemaIsRejected) {
    config::RegistryConfig cfg;
    cfg.max_schema_bytes = 64;
    auto opened = SchemaRegistry::open(cfg);
    ASSERT_TRUE(opened.isOk());
    auto reg = std::move(opened).value();

    auto result = reg->registerSchema("users", "value", test_schemas::kUserV1);
    EXPECT_EQ(result.code(), ErrorCode::SCHEMA_TOO_LARGE);
    EXPECT_TRUE(reg->registerSchema("small", "value", R"("string")").isOk());

    cfg.max_schema_bytes = 0;
    EXPECT_EQ(SchemaRegistry::open(cfg).code(), ErrorCode::INVALID_CONFIGURATION);
}

TEST(SchemaRegistryLimitsTest, CanonicalExpansionCountsAgainstLimit) {
    config::RegistryConfig cfg;
    cfg.max_schema_bytes = 2048;
    auto opened = SchemaRegistry::open(cfg);
    ASSERT_TRUE(opened.isOk());
    auto reg = std::move(opened).value();

    // Every reference to E expands to the long namespace in canonical form.
    const std::string ns(100, 'a');
    std::string fields = R"({"name":"f0","type":{"type":"enum","name":"E","symbols":["A"]}})";
    for (int i = 1; i <= 20; ++i) {
        fields += R"(,{"name":"f)" + std::to_string(i) + R"(","type":"E"})";
    }
    const std::string schema = R"({"type":"record","name":"R","namespace":")" + ns + R"(","fields":[)" + fields + "]}";
    ASSERT_LT(schema.size(), cfg.max_schema_bytes);

    auto result = reg->registerSchema("wide", "value", schema);
    ASSERT_EQ(result.code(), ErrorCode::SCHEMA_TOO_LARGE);
    EXPECT_NE(result.error().details.find("canonical"), std::string::npos);
    EXPECT_TRUE(reg->listSubjects(true).empty());
}

namespace {

class CountingHandler : public registry::ErrorHandler {
public:
    std::atomic<int> handled{0};
    void handleError(const registry::RegistryError&) override { ++handled; }
    void handleCriticalError(const registry::RegistryError&) override { ++handled; }
};

} // namespace

TEST_F(SchemaRegistryTest, FailuresAreReportedToErrorContext) {
    auto handler = std::make_shared<CountingHandler>();
    reg->setErrorHandler(handler);

    mustRegister("users", test_schemas::kUserV1);
    EXPECT_FALSE(reg->registerSchema("users", "value", test_schemas::kUserRequiredAge).isOk());
    EXPECT_FALSE(reg->getSchemaById(42).isOk());
    EXPECT_FALSE(reg->getSchemaById(43).isOk());

    const auto& ctx = reg->errorContext();
    EXPECT_EQ(ctx.getErrorCount(ErrorCode::INCOMPATIBLE_SCHEMA), 1u);
    EXPECT_EQ(ctx.getErrorCount(ErrorCode::SCHEMA_ID_NOT_FOUND), 2u);
    EXPECT_EQ(ctx.getTotalErrorCount(), 3u);
    EXPECT_EQ(handler->handled.load(), 3);
}

TEST_F(SchemaRegistryTest, ConcurrentRegistrationsGetDistinctVersions) {
    ASSERT_TRUE(reg->setSubjectConfig("race", "value", "NONE").isOk());
    const int num_threads = 16;

    std::mutex versions_mutex;
    std::set<VersionNumber> versions;
    std::set<SchemaId> ids;

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&, t]() {
            auto result = reg->registerSchema("race", "value", test_schemas::numberedRecord(t));
            ASSERT_TRUE(result.isOk());
            std::lock_guard<std::mutex> lock(versions_mutex);
            versions.insert(result->version);
            ids.insert(result->id);
        });
    }
    for (auto& thread : threads) thread.join();

    std::set<VersionNumber> expected;
    for (int v = 1; v <= num_threads; ++v) expected.insert(v);
    EXPECT_EQ(versions, expected);
    EXPECT_EQ(ids.size(), static_cast<size_t>(num_threads));
    EXPECT_EQ(reg->listVersions("race", "value")->size(), static_cast<size_t>(num_threads));
}

TEST_F(SchemaRegistryTest, ConcurrentDuplicateRegistrationsConverge) {
    const int num_threads = 8;
    std::atomic<int> created{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&]() {
            auto result = reg->registerSchema("dup", "value", test_schemas::kUserV2);
            ASSERT_TRUE(result.isOk());
            EXPECT_EQ(result->version, 1);
            if (result->created) ++created;
        });
    }
    for (auto& thread : threads) thread.join();
    EXPECT_EQ(created.load(), 1);
}

TEST_F(SchemaRegistryTest, NonPositiveVersionsAreInvalidArguments) {
    mustRegister("users", test_schemas::kUserV1);

    auto negative = reg->getSchema("users", "value", VersionRef::exact(-3));
    ASSERT_EQ(negative.code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(negative.error().context.at("parameter"), "version");
    EXPECT_EQ(reg->deleteVersion("users", "value", VersionRef::exact(0)).code(), ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(reg->testCompatibility("users", "value", test_schemas::kUserV2, VersionRef::exact(0)).code(),
              ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(reg->listVersions("users", "value").value(), (std::vector<VersionNumber>{1}));
}

TEST_F(SchemaRegistryTest, WritesToUnknownScopesLeaveNoLockEntries) {
    EXPECT_EQ(reg->deleteVersion("ghost", "value", VersionRef::exact(1)).code(), ErrorCode::VERSION_NOT_FOUND);
    EXPECT_EQ(reg->deleteVersion("ghost", "value", VersionRef::latest()).code(), ErrorCode::VERSION_NOT_FOUND);
    EXPECT_TRUE(reg->deleteSubject("ghost", "key")->empty());
    EXPECT_FALSE(reg->clearSubjectConfig("ghost", "value").value());
    EXPECT_EQ(reg->lockedScopeCount(), 0u);

    mustRegister("users", test_schemas::kUserV1);
    EXPECT_EQ(reg->lockedScopeCount(), 1u);
    ASSERT_EQ(reg->deleteSubject("users", "value").value(), (std::vector<VersionNumber>{1}));
    EXPECT_EQ(reg->lockedScopeCount(), 1u);
}
