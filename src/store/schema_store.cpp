// src/store/schema_store.cpp

#include "../../include/store/schema_store.h"
#include "../../include/debug_utils.h"

#include <mutex>

namespace schemata {
namespace store {

void to_json(nlohmann::json& j, const Schema& schema) {
    j = nlohmann::json{
        {"id", schema.id},
        {"fingerprint", schema.fingerprint},
        {"schema", schema.canonical_body}
    };
}

SchemaStore::SchemaStore(PersistFn persist) : persist_(std::move(persist)) {}

registry::Result<PutOutcome> SchemaStore::put(const canonical::CanonicalSchema& canonical,
                                              const std::string& raw_body) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto existing = by_fingerprint_.find(canonical.fingerprint);
    if (existing != by_fingerprint_.end()) {
        return PutOutcome{existing->second, false};
    }

    auto schema = std::make_shared<Schema>();
    schema->id = next_id_;
    schema->fingerprint = canonical.fingerprint;
    schema->canonical_body = canonical.canonical_text;
    schema->raw_body = raw_body;
    schema->structure = canonical.structure;

    if (persist_) {
        auto persisted = persist_(*schema);
        if (!persisted.isOk()) {
            LOG_ERROR("[SchemaStore] Failed to persist schema ", short_fingerprint(schema->fingerprint),
                      ": ", persisted.error().toString());
            return std::move(persisted.error());
        }
    }

    ++next_id_;
    by_fingerprint_.emplace(schema->fingerprint, schema->id);
    by_id_.emplace(schema->id, schema);
    LOG_TRACE("[SchemaStore] Stored schema id ", schema->id, " fingerprint ", short_fingerprint(schema->fingerprint));
    return PutOutcome{schema->id, true};
}

registry::Result<std::shared_ptr<const Schema>> SchemaStore::getById(SchemaId id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = by_id_.find(id);
    if (it == by_id_.end()) {
        return registry::RegistryError::schemaIdNotFound(id);
    }
    return it->second;
}

std::optional<SchemaId> SchemaStore::findByFingerprint(const std::string& fingerprint) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = by_fingerprint_.find(fingerprint);
    if (it == by_fingerprint_.end()) {
        return std::nullopt;
    }
    return it->second;
}

registry::Status SchemaStore::restore(Schema schema) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (schema.id <= INVALID_SCHEMA_ID) {
        return registry::RegistryError::corruption("schemas.log", "non-positive schema id " + std::to_string(schema.id));
    }
    if (by_id_.count(schema.id) > 0) {
        return registry::RegistryError::corruption("schemas.log", "schema id " + std::to_string(schema.id) +
                                                   " appears twice");
    }
    if (by_fingerprint_.count(schema.fingerprint) > 0) {
        return registry::RegistryError::corruption("schemas.log", "fingerprint " + schema.fingerprint +
                                                   " is registered under two ids");
    }
    SchemaId id = schema.id;
    by_fingerprint_.emplace(schema.fingerprint, id);
    by_id_.emplace(id, std::make_shared<const Schema>(std::move(schema)));
    if (id >= next_id_) {
        next_id_ = id + 1;
    }
    return registry::Status();
}

size_t SchemaStore::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return by_id_.size();
}

SchemaId SchemaStore::peekNextId() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return next_id_;
}

} // namespace store
} // namespace schemata
