// include/compat/compatibility_checker.h
#pragma once

#include "../types.h"
#include "../canonical/avro_schema.h"

#include <string>
#include <vector>
#include <memory>
#include <cstdint>

namespace schemata {
namespace compat {

enum class IncompatibilityType : uint8_t {
    NAME_MISMATCH,
    FIXED_SIZE_MISMATCH,
    MISSING_ENUM_SYMBOLS,
    READER_FIELD_MISSING_DEFAULT_VALUE,
    WRITER_FIELD_REMOVED_WITHOUT_DEFAULT,
    TYPE_MISMATCH,
    MISSING_UNION_BRANCH
};

enum class CheckDirection : uint8_t {
    BACKWARD,   // candidate reads data written with the reference
    FORWARD     // reference reads data written with the candidate
};

struct Incompatibility {
    IncompatibilityType type;
    std::string path;              // JSON pointer into the reader schema, "/" for the root
    std::string message;
    CheckDirection direction = CheckDirection::BACKWARD;
    size_t reference_index = 0;    // position in the reference list (oldest first)

    // "READER_FIELD_MISSING_DEFAULT_VALUE" etc.
    std::string rule() const;
    std::string toString() const;
};

struct CompatibilityResult {
    bool compatible = true;
    std::vector<Incompatibility> violations;

    explicit operator bool() const { return compatible; }
};

/**
 * @class CompatibilityChecker
 * @brief Decides whether a candidate schema may follow a version history.
 *
 * Applies Avro schema resolution, and additionally refuses to drop a writer
 * field that has no default. References are ordered oldest to newest;
 * non-transitive modes look only at the newest one. Stateless and safe to
 * share between threads.
 */
class CompatibilityChecker {
public:
    CompatibilityResult isCompatible(const avro::AvroSchema& candidate,
                                     const std::vector<std::shared_ptr<const avro::AvroSchema>>& references,
                                     CompatibilityMode mode) const;

    // Violations found when data written with `writer` is read with `reader`.
    static std::vector<Incompatibility> checkReaderWriter(const avro::AvroNode& reader,
                                                          const avro::AvroNode& writer);
};

} // namespace compat
} // namespace schemata
