// include/canonical/schema_canonicalizer.h
#pragma once

#include "avro_schema.h"
#include "../registry_error/result.h"

#include <string>
#include <memory>

namespace schemata {
namespace canonical {

/**
 * @brief Normalized form of a schema text.
 *
 * Two texts that describe the same structure produce the same canonical_text
 * and therefore the same fingerprint.
 */
struct CanonicalSchema {
    std::string canonical_text;
    std::string fingerprint;   // lowercase hex SHA-256 of canonical_text
    std::shared_ptr<const avro::AvroSchema> structure;
};

/**
 * @brief Capability that turns raw schema text into its canonical form.
 *
 * Implementations fail with SCHEMA_PARSE_ERROR and a diagnostic that names
 * the offending element. They must be safe to call from many threads.
 */
class SchemaCanonicalizer {
public:
    virtual ~SchemaCanonicalizer() = default;

    virtual registry::Result<CanonicalSchema> canonicalize(const std::string& schema_text) const = 0;

    // Schema format handled, e.g. "AVRO".
    virtual std::string format() const = 0;
};

} // namespace canonical
} // namespace schemata
