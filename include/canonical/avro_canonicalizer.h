// include/canonical/avro_canonicalizer.h
#pragma once

#include "schema_canonicalizer.h"

namespace schemata {
namespace canonical {

/**
 * @class AvroCanonicalizer
 * @brief Parses Avro JSON schemas and renders their canonical text.
 *
 * Canonical text is compact JSON with fully-qualified names, a fixed key
 * order and sorted aliases. "doc" is dropped, and so is "namespace" except as
 * "" on a null-namespace type nested inside a namespaced one.
 * Defaults, aliases, field order and logical types are kept because they take
 * part in compatibility decisions.
 *
 * Degenerate inputs (empty text, {}, records or enums without members) are
 * rejected.
 */
class AvroCanonicalizer : public SchemaCanonicalizer {
public:
    registry::Result<CanonicalSchema> canonicalize(const std::string& schema_text) const override;
    std::string format() const override { return "AVRO"; }

    // Parses without rendering or hashing; used by tests and the checker tools.
    static registry::Result<std::shared_ptr<const avro::AvroSchema>> parse(const std::string& schema_text);
    static std::string render(const avro::AvroSchema& schema);
};

} // namespace canonical
} // namespace schemata
