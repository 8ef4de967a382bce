// include/store/schema_store.h
#pragma once

#include "../types.h"
#include "../canonical/schema_canonicalizer.h"
#include "../registry_error/result.h"

#include <nlohmann/json.hpp>

#include <map>
#include <unordered_map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <functional>
#include <string>

namespace schemata {
namespace store {

/**
 * @brief An immutable registered schema. Identical canonical text always maps
 * to the same id and fingerprint.
 */
struct Schema {
    SchemaId id = INVALID_SCHEMA_ID;
    std::string fingerprint;
    std::string canonical_body;
    std::string raw_body;
    std::shared_ptr<const avro::AvroSchema> structure;
};

void to_json(nlohmann::json& j, const Schema& schema);

struct PutOutcome {
    SchemaId id = INVALID_SCHEMA_ID;
    bool created = false;
};

/**
 * @class SchemaStore
 * @brief Global id -> schema map with fingerprint deduplication.
 *
 * Ids come from a single counter advanced under the write lock; they are
 * never reused and never derived from the map size.
 */
class SchemaStore {
public:
    // Invoked under the write lock before a new schema becomes visible.
    // A failure aborts the put and leaves the store unchanged.
    using PersistFn = std::function<registry::Status(const Schema&)>;

    explicit SchemaStore(PersistFn persist = nullptr);

    registry::Result<PutOutcome> put(const canonical::CanonicalSchema& canonical, const std::string& raw_body);
    registry::Result<std::shared_ptr<const Schema>> getById(SchemaId id) const;
    std::optional<SchemaId> findByFingerprint(const std::string& fingerprint) const;

    // Recovery: reinstates a schema under its original id.
    registry::Status restore(Schema schema);

    size_t size() const;
    SchemaId peekNextId() const;

private:
    PersistFn persist_;
    mutable std::shared_mutex mutex_;
    std::map<SchemaId, std::shared_ptr<const Schema>> by_id_;
    std::unordered_map<std::string, SchemaId> by_fingerprint_;
    SchemaId next_id_ = 1;
};

} // namespace store
} // namespace schemata
