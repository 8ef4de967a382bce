// include/canonical/avro_schema.h
#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <vector>
#include <map>
#include <memory>
#include <optional>
#include <cstdint>

namespace schemata {
namespace avro {

enum class AvroType : uint8_t {
    NULL_TYPE,
    BOOLEAN,
    INT,
    LONG,
    FLOAT,
    DOUBLE,
    BYTES,
    STRING,
    RECORD,
    ENUM,
    ARRAY,
    MAP,
    UNION,
    FIXED
};

// Avro spelling of a type ("null", "record", ...).
const char* typeName(AvroType type);
std::optional<AvroType> primitiveFromName(const std::string& name);

struct AvroNode;

enum class FieldOrder : uint8_t { ASCENDING, DESCENDING, IGNORE };

struct AvroField {
    std::string name;
    const AvroNode* type = nullptr;
    std::optional<nlohmann::json> default_value;
    std::vector<std::string> aliases;
    FieldOrder order = FieldOrder::ASCENDING;
};

/**
 * @brief One node of a parsed schema graph.
 *
 * Nodes are owned by their AvroSchema. Child links are raw pointers into the
 * same schema, so a recursive record points back at itself.
 */
struct AvroNode {
    AvroType type = AvroType::NULL_TYPE;

    // RECORD / ENUM / FIXED
    std::string full_name;
    std::vector<std::string> aliases;      // fully qualified
    bool is_error = false;                 // record declared as "error"

    // RECORD
    std::vector<AvroField> fields;

    // ENUM
    std::vector<std::string> symbols;
    std::optional<std::string> enum_default;

    // ARRAY / MAP
    const AvroNode* items = nullptr;
    const AvroNode* values = nullptr;

    // UNION
    std::vector<const AvroNode*> branches;

    // FIXED
    int64_t fixed_size = 0;

    // Logical type annotation (primitives and fixed). Not used for resolution.
    std::string logical_type;
    std::optional<int64_t> precision;
    std::optional<int64_t> scale;

    bool isNamed() const {
        return type == AvroType::RECORD || type == AvroType::ENUM || type == AvroType::FIXED;
    }

    // Unqualified part of full_name.
    std::string shortName() const;
    // Full name for named types, the type name otherwise. Unique within a union.
    std::string branchKey() const;

    const AvroField* findField(const std::string& name) const;
    bool hasSymbol(const std::string& symbol) const;
};

/**
 * @brief A parsed, validated schema: the node arena plus the named-type table.
 */
class AvroSchema {
public:
    AvroSchema() = default;
    AvroSchema(const AvroSchema&) = delete;
    AvroSchema& operator=(const AvroSchema&) = delete;

    const AvroNode& root() const { return *root_; }
    const AvroNode* findNamed(const std::string& full_name) const;

    AvroNode* newNode(AvroType type);
    void setRoot(const AvroNode* root) { root_ = root; }
    bool defineNamed(const std::string& full_name, const AvroNode* node);

private:
    std::vector<std::unique_ptr<AvroNode>> nodes_;
    const AvroNode* root_ = nullptr;
    std::map<std::string, const AvroNode*> named_;
};

} // namespace avro
} // namespace schemata
