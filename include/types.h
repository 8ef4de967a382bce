// @include/types.h

#pragma once

#include "registry_error/result.h"

#include <string>
#include <optional>
#include <cstdint>
#include <limits>

namespace schemata {

// --- Foundational Data Types ---
using SchemaId = int64_t;
static constexpr SchemaId INVALID_SCHEMA_ID = 0;

using VersionNumber = int32_t;
static constexpr VersionNumber INVALID_VERSION = 0;

// Which half of a Kafka record a subject describes.
enum class SchemaType : uint8_t {
    KEY,
    VALUE
};

enum class CompatibilityMode : uint8_t {
    NONE,
    BACKWARD,
    BACKWARD_TRANSITIVE,
    FORWARD,
    FORWARD_TRANSITIVE,
    FULL,
    FULL_TRANSITIVE
};

std::string toString(SchemaType type);                 // "key" / "value"
std::string toString(CompatibilityMode mode);          // "BACKWARD_TRANSITIVE" etc.

registry::Result<SchemaType> parseSchemaType(const std::string& text);
// Case-insensitive; fails with INVALID_MODE.
registry::Result<CompatibilityMode> parseCompatibilityMode(const std::string& text);

bool isTransitive(CompatibilityMode mode);
bool checksBackward(CompatibilityMode mode);
bool checksForward(CompatibilityMode mode);

// Parses a positive decimal schema id ("42"). Fails with INVALID_ARGUMENT.
registry::Result<SchemaId> parseSchemaId(const std::string& text);

/**
 * @brief (subject name, schema type) pair identifying one version history.
 *
 * Rendered as "{name}-{type}". The rendering is injective because the type
 * suffix is always "-key" or "-value".
 */
class ScopeKey {
public:
    // Validates name (non-empty, no control characters) and type text.
    static registry::Result<ScopeKey> make(const std::string& subject, const std::string& type);
    static registry::Result<ScopeKey> make(const std::string& subject, SchemaType type);
    // Inverse of str(); used when replaying logs.
    static registry::Result<ScopeKey> parse(const std::string& rendered);

    const std::string& subject() const { return subject_; }
    SchemaType type() const { return type_; }
    const std::string& str() const { return rendered_; }

    bool operator==(const ScopeKey& other) const { return rendered_ == other.rendered_; }
    bool operator<(const ScopeKey& other) const { return rendered_ < other.rendered_; }

private:
    ScopeKey(std::string subject, SchemaType type);

    std::string subject_;
    SchemaType type_;
    std::string rendered_;
};

/**
 * @brief A version selector: either "latest" or an explicit number.
 */
class VersionRef {
public:
    static VersionRef latest() { return VersionRef(); }
    static VersionRef exact(VersionNumber version) { return VersionRef(version); }
    // Accepts "latest" or decimal digits. Zero, signs and overflow are rejected.
    static registry::Result<VersionRef> parse(const std::string& text);

    bool isLatest() const { return !number_.has_value(); }
    // Explicit numbers must be positive.
    bool isValid() const { return isLatest() || *number_ > 0; }
    VersionNumber number() const { return number_.value_or(INVALID_VERSION); }
    std::string toString() const;

private:
    VersionRef() = default;
    explicit VersionRef(VersionNumber version) : number_(version) {}

    std::optional<VersionNumber> number_;
};

} // namespace schemata
