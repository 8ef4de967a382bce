// src/canonical/avro_schema.cpp

#include "../../include/canonical/avro_schema.h"

#include <algorithm>

namespace schemata {
namespace avro {

const char* typeName(AvroType type) {
    switch (type) {
        case AvroType::NULL_TYPE: return "null";
        case AvroType::BOOLEAN:   return "boolean";
        case AvroType::INT:       return "int";
        case AvroType::LONG:      return "long";
        case AvroType::FLOAT:     return "float";
        case AvroType::DOUBLE:    return "double";
        case AvroType::BYTES:     return "bytes";
        case AvroType::STRING:    return "string";
        case AvroType::RECORD:    return "record";
        case AvroType::ENUM:      return "enum";
        case AvroType::ARRAY:     return "array";
        case AvroType::MAP:       return "map";
        case AvroType::UNION:     return "union";
        case AvroType::FIXED:     return "fixed";
    }
    return "unknown";
}

std::optional<AvroType> primitiveFromName(const std::string& name) {
    static const std::map<std::string, AvroType> primitives = {
        {"null", AvroType::NULL_TYPE},
        {"boolean", AvroType::BOOLEAN},
        {"int", AvroType::INT},
        {"long", AvroType::LONG},
        {"float", AvroType::FLOAT},
        {"double", AvroType::DOUBLE},
        {"bytes", AvroType::BYTES},
        {"string", AvroType::STRING}
    };
    auto it = primitives.find(name);
    if (it == primitives.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string AvroNode::shortName() const {
    auto dot = full_name.rfind('.');
    return dot == std::string::npos ? full_name : full_name.substr(dot + 1);
}

std::string AvroNode::branchKey() const {
    return isNamed() ? full_name : std::string(typeName(type));
}

const AvroField* AvroNode::findField(const std::string& name) const {
    for (const auto& field : fields) {
        if (field.name == name) {
            return &field;
        }
    }
    return nullptr;
}

bool AvroNode::hasSymbol(const std::string& symbol) const {
    return std::find(symbols.begin(), symbols.end(), symbol) != symbols.end();
}

const AvroNode* AvroSchema::findNamed(const std::string& full_name) const {
    auto it = named_.find(full_name);
    return it == named_.end() ? nullptr : it->second;
}

AvroNode* AvroSchema::newNode(AvroType type) {
    nodes_.push_back(std::make_unique<AvroNode>());
    nodes_.back()->type = type;
    return nodes_.back().get();
}

bool AvroSchema::defineNamed(const std::string& full_name, const AvroNode* node) {
    return named_.emplace(full_name, node).second;
}

} // namespace avro
} // namespace schemata
