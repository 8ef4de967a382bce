// src/canonical/avro_canonicalizer.cpp

#include "../../include/canonical/avro_canonicalizer.h"
#include "../../include/canonical/fingerprint.h"
#include "../../include/debug_utils.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <set>
#include <stdexcept>
#include <limits>
#include <cctype>

namespace schemata {
namespace canonical {

using nlohmann::json;
using nlohmann::ordered_json;
using avro::AvroNode;
using avro::AvroSchema;
using avro::AvroType;

namespace {

constexpr int MAX_NESTING_DEPTH = 256;

// Thrown inside the parser; converted to SCHEMA_PARSE_ERROR at the boundary.
class ParseFailure : public std::runtime_error {
public:
    explicit ParseFailure(const std::string& msg) : std::runtime_error(msg) {}
};

bool isValidName(const std::string& name) {
    if (name.empty()) return false;
    unsigned char first = static_cast<unsigned char>(name[0]);
    if (!(std::isalpha(first) || first == '_')) return false;
    for (unsigned char c : name) {
        if (!(std::isalnum(c) || c == '_')) return false;
    }
    return true;
}

bool isValidFullName(const std::string& full_name) {
    size_t start = 0;
    while (true) {
        size_t dot = full_name.find('.', start);
        std::string part = full_name.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (!isValidName(part)) return false;
        if (dot == std::string::npos) return true;
        start = dot + 1;
    }
}

// Scalars print as themselves; containers only by kind, since their text may be arbitrarily deep.
std::string describeValue(const json& value) {
    if (value.is_primitive()) {
        return value.dump();
    }
    return std::string("a JSON ") + value.type_name();
}

bool nestsDeeperThan(const json& value, int limit) {
    if (!value.is_structured()) return false;
    if (limit <= 0) return true;
    for (const auto& element : value) {
        if (nestsDeeperThan(element, limit - 1)) return true;
    }
    return false;
}

std::string namespaceOf(const std::string& full_name) {
    auto dot = full_name.rfind('.');
    return dot == std::string::npos ? std::string() : full_name.substr(0, dot);
}

std::string qualify(const std::string& name, const std::string& ns) {
    if (name.find('.') != std::string::npos || ns.empty()) return name;
    return ns + "." + name;
}

class Parser {
public:
    explicit Parser(AvroSchema& schema) : schema_(schema) {}

    const AvroNode* parseType(const json& j, const std::string& ns, const std::string& path, int depth) {
        if (depth > MAX_NESTING_DEPTH) {
            throw ParseFailure(path + ": schema nesting exceeds " + std::to_string(MAX_NESTING_DEPTH) + " levels");
        }
        if (j.is_string()) {
            return resolveName(j.get<std::string>(), ns, path);
        }
        if (j.is_array()) {
            return parseUnion(j, ns, path, depth);
        }
        if (j.is_object()) {
            return parseObject(j, ns, path, depth);
        }
        throw ParseFailure(path + ": expected a type name, object or union but found " + std::string(j.type_name()));
    }

private:
    AvroSchema& schema_;

    const AvroNode* resolveName(const std::string& name, const std::string& ns, const std::string& path) {
        if (auto primitive = avro::primitiveFromName(name)) {
            return schema_.newNode(*primitive);
        }
        if (const AvroNode* named = schema_.findNamed(qualify(name, ns))) {
            return named;
        }
        if (const AvroNode* named = schema_.findNamed(name)) {
            return named;
        }
        throw ParseFailure(path + ": unknown type '" + name + "'");
    }

    const AvroNode* parseUnion(const json& j, const std::string& ns, const std::string& path, int depth) {
        if (j.empty()) {
            throw ParseFailure(path + ": union must have at least one branch");
        }
        AvroNode* node = schema_.newNode(AvroType::UNION);
        std::set<std::string> seen;
        for (size_t i = 0; i < j.size(); ++i) {
            std::string branch_path = path + "[" + std::to_string(i) + "]";
            const AvroNode* branch = parseType(j[i], ns, branch_path, depth + 1);
            if (branch->type == AvroType::UNION) {
                throw ParseFailure(branch_path + ": unions may not immediately contain other unions");
            }
            if (!seen.insert(branch->branchKey()).second) {
                throw ParseFailure(branch_path + ": duplicate union branch '" + branch->branchKey() + "'");
            }
            node->branches.push_back(branch);
        }
        return node;
    }

    static const std::string& requireString(const json& j, const char* key, const std::string& path) {
        auto it = j.find(key);
        if (it == j.end()) {
            throw ParseFailure(path + ": missing required attribute '" + key + "'");
        }
        if (!it->is_string()) {
            throw ParseFailure(path + ": attribute '" + key + "' must be a string");
        }
        return it->get_ref<const std::string&>();
    }

    void readLogicalType(const json& j, AvroNode* node) {
        auto it = j.find("logicalType");
        if (it != j.end() && it->is_string()) {
            node->logical_type = it->get<std::string>();
            auto precision = j.find("precision");
            if (precision != j.end() && precision->is_number_integer()) {
                node->precision = precision->get<int64_t>();
            }
            auto scale = j.find("scale");
            if (scale != j.end() && scale->is_number_integer()) {
                node->scale = scale->get<int64_t>();
            }
        }
    }

    const AvroNode* parseObject(const json& j, const std::string& ns, const std::string& path, int depth) {
        auto type_it = j.find("type");
        if (type_it == j.end()) {
            throw ParseFailure(path + ": missing required attribute 'type'");
        }
        if (!type_it->is_string()) {
            // {"type": {...}} or {"type": [...]} wraps another schema.
            return parseType(*type_it, ns, path, depth + 1);
        }

        const std::string& type_name = type_it->get_ref<const std::string&>();

        if (auto primitive = avro::primitiveFromName(type_name)) {
            AvroNode* node = schema_.newNode(*primitive);
            readLogicalType(j, node);
            return node;
        }
        if (type_name == "record" || type_name == "error") {
            return parseRecord(j, ns, path, depth, type_name == "error");
        }
        if (type_name == "enum") {
            return parseEnum(j, ns, path);
        }
        if (type_name == "fixed") {
            return parseFixed(j, ns, path);
        }
        if (type_name == "array") {
            auto items = j.find("items");
            if (items == j.end()) {
                throw ParseFailure(path + ": array is missing 'items'");
            }
            AvroNode* node = schema_.newNode(AvroType::ARRAY);
            node->items = parseType(*items, ns, path + ".items", depth + 1);
            return node;
        }
        if (type_name == "map") {
            auto values = j.find("values");
            if (values == j.end()) {
                throw ParseFailure(path + ": map is missing 'values'");
            }
            AvroNode* node = schema_.newNode(AvroType::MAP);
            node->values = parseType(*values, ns, path + ".values", depth + 1);
            return node;
        }
        // A named reference written in object form: {"type": "com.example.User"}
        return resolveName(type_name, ns, path);
    }

    // Resolves name + namespace attributes into a full name and registers the node.
    std::string defineNamed(const json& j, const std::string& ns, const std::string& path, AvroNode* node) {
        const std::string& name = requireString(j, "name", path);
        std::string full_name;
        if (name.find('.') != std::string::npos) {
            full_name = name;
        } else {
            std::string effective_ns = ns;
            auto ns_it = j.find("namespace");
            if (ns_it != j.end()) {
                if (!ns_it->is_string() && !ns_it->is_null()) {
                    throw ParseFailure(path + ": attribute 'namespace' must be a string");
                }
                effective_ns = ns_it->is_string() ? ns_it->get<std::string>() : std::string();
            }
            full_name = effective_ns.empty() ? name : effective_ns + "." + name;
        }
        if (!isValidFullName(full_name)) {
            throw ParseFailure(path + ": invalid name '" + full_name + "'");
        }
        if (avro::primitiveFromName(full_name)) {
            throw ParseFailure(path + ": '" + full_name + "' is a primitive type name and cannot be redefined");
        }
        node->full_name = full_name;
        if (!schema_.defineNamed(full_name, node)) {
            throw ParseFailure(path + ": type '" + full_name + "' is defined more than once");
        }

        std::string type_ns = namespaceOf(full_name);
        auto aliases = j.find("aliases");
        if (aliases != j.end()) {
            if (!aliases->is_array()) {
                throw ParseFailure(path + ": 'aliases' of '" + full_name + "' must be an array");
            }
            for (const auto& alias : *aliases) {
                if (!alias.is_string() || !isValidFullName(alias.get<std::string>())) {
                    throw ParseFailure(path + ": invalid alias on '" + full_name + "'");
                }
                node->aliases.push_back(qualify(alias.get<std::string>(), type_ns));
            }
            std::sort(node->aliases.begin(), node->aliases.end());
            node->aliases.erase(std::unique(node->aliases.begin(), node->aliases.end()), node->aliases.end());
        }
        return type_ns;
    }

    const AvroNode* parseRecord(const json& j, const std::string& ns, const std::string& path, int depth, bool is_error) {
        AvroNode* node = schema_.newNode(AvroType::RECORD);
        node->is_error = is_error;
        std::string record_ns = defineNamed(j, ns, path, node);
        std::string record_path = path + " record '" + node->full_name + "'";

        auto fields = j.find("fields");
        if (fields == j.end()) {
            throw ParseFailure(record_path + ": missing required attribute 'fields'");
        }
        if (!fields->is_array()) {
            throw ParseFailure(record_path + ": 'fields' must be an array");
        }
        if (fields->empty()) {
            throw ParseFailure(record_path + ": record must declare at least one field");
        }

        std::set<std::string> names;
        node->fields.reserve(fields->size());
        for (const auto& fj : *fields) {
            if (!fj.is_object()) {
                throw ParseFailure(record_path + ": every field must be an object");
            }
            avro::AvroField field;
            field.name = requireString(fj, "name", record_path);
            std::string field_path = record_path + " field '" + field.name + "'";
            if (!isValidName(field.name)) {
                throw ParseFailure(field_path + ": invalid field name");
            }
            if (!names.insert(field.name).second) {
                throw ParseFailure(field_path + ": duplicate field name");
            }
            auto ft = fj.find("type");
            if (ft == fj.end()) {
                throw ParseFailure(field_path + ": missing required attribute 'type'");
            }
            field.type = parseType(*ft, record_ns, field_path, depth + 1);

            auto def = fj.find("default");
            if (def != fj.end()) {
                if (nestsDeeperThan(*def, MAX_NESTING_DEPTH)) {
                    throw ParseFailure(field_path + ": default value nests deeper than " +
                                       std::to_string(MAX_NESTING_DEPTH) + " levels");
                }
                std::string why;
                if (!defaultMatches(*field.type, *def, why)) {
                    throw ParseFailure(field_path + ": default value " + describeValue(*def) +
                                       " does not match type " + field.type->branchKey() +
                                       (why.empty() ? "" : " (" + why + ")"));
                }
                field.default_value = *def;
            }

            auto aliases = fj.find("aliases");
            if (aliases != fj.end()) {
                if (!aliases->is_array()) {
                    throw ParseFailure(field_path + ": 'aliases' must be an array");
                }
                for (const auto& alias : *aliases) {
                    if (!alias.is_string() || !isValidName(alias.get<std::string>())) {
                        throw ParseFailure(field_path + ": invalid alias");
                    }
                    field.aliases.push_back(alias.get<std::string>());
                }
                std::sort(field.aliases.begin(), field.aliases.end());
                field.aliases.erase(std::unique(field.aliases.begin(), field.aliases.end()), field.aliases.end());
            }

            auto order = fj.find("order");
            if (order != fj.end()) {
                std::string order_text = order->is_string() ? order->get<std::string>() : std::string();
                if (order_text == "ascending") field.order = avro::FieldOrder::ASCENDING;
                else if (order_text == "descending") field.order = avro::FieldOrder::DESCENDING;
                else if (order_text == "ignore") field.order = avro::FieldOrder::IGNORE;
                else throw ParseFailure(field_path + ": 'order' must be ascending, descending or ignore");
            }

            node->fields.push_back(std::move(field));
        }
        return node;
    }

    const AvroNode* parseEnum(const json& j, const std::string& ns, const std::string& path) {
        AvroNode* node = schema_.newNode(AvroType::ENUM);
        defineNamed(j, ns, path, node);
        std::string enum_path = path + " enum '" + node->full_name + "'";

        auto symbols = j.find("symbols");
        if (symbols == j.end() || !symbols->is_array()) {
            throw ParseFailure(enum_path + ": 'symbols' must be an array");
        }
        if (symbols->empty()) {
            throw ParseFailure(enum_path + ": enum must declare at least one symbol");
        }
        std::set<std::string> seen;
        for (const auto& symbol : *symbols) {
            if (!symbol.is_string() || !isValidName(symbol.get<std::string>())) {
                throw ParseFailure(enum_path + ": invalid symbol " + describeValue(symbol));
            }
            if (!seen.insert(symbol.get<std::string>()).second) {
                throw ParseFailure(enum_path + ": duplicate symbol " + describeValue(symbol));
            }
            node->symbols.push_back(symbol.get<std::string>());
        }

        auto def = j.find("default");
        if (def != j.end()) {
            if (!def->is_string() || !node->hasSymbol(def->get<std::string>())) {
                throw ParseFailure(enum_path + ": default " + describeValue(*def) + " is not one of the symbols");
            }
            node->enum_default = def->get<std::string>();
        }
        return node;
    }

    const AvroNode* parseFixed(const json& j, const std::string& ns, const std::string& path) {
        AvroNode* node = schema_.newNode(AvroType::FIXED);
        defineNamed(j, ns, path, node);
        auto size = j.find("size");
        if (size == j.end() || !size->is_number_integer() || size->get<int64_t>() < 0) {
            throw ParseFailure(path + " fixed '" + node->full_name + "': 'size' must be a non-negative integer");
        }
        node->fixed_size = size->get<int64_t>();
        readLogicalType(j, node);
        return node;
    }

    // Default values are checked against the declared type; for unions, the
    // first branch.
    static bool defaultMatches(const AvroNode& type, const json& value, std::string& why) {
        switch (type.type) {
            case AvroType::NULL_TYPE: return value.is_null();
            case AvroType::BOOLEAN:   return value.is_boolean();
            case AvroType::INT:
                if (!value.is_number_integer()) return false;
                if (value.is_number_unsigned()) {
                    return value.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int32_t>::max());
                }
                return value.get<int64_t>() >= std::numeric_limits<int32_t>::min() &&
                       value.get<int64_t>() <= std::numeric_limits<int32_t>::max();
            case AvroType::LONG:
                if (value.is_number_unsigned()) {
                    return value.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
                }
                return value.is_number_integer();
            case AvroType::FLOAT:
            case AvroType::DOUBLE:    return value.is_number();
            case AvroType::BYTES:
            case AvroType::STRING:    return value.is_string();
            case AvroType::FIXED:     return value.is_string();
            case AvroType::ENUM:
                return value.is_string() && type.hasSymbol(value.get<std::string>());
            case AvroType::ARRAY:
                if (!value.is_array()) return false;
                for (const auto& element : value) {
                    if (!defaultMatches(*type.items, element, why)) return false;
                }
                return true;
            case AvroType::MAP:
                if (!value.is_object()) return false;
                for (const auto& element : value.items()) {
                    if (!defaultMatches(*type.values, element.value(), why)) return false;
                }
                return true;
            case AvroType::RECORD:
                if (!value.is_object()) return false;
                for (const auto& field : type.fields) {
                    auto it = value.find(field.name);
                    if (it == value.end()) {
                        if (!field.default_value) {
                            why = "missing field '" + field.name + "'";
                            return false;
                        }
                        continue;
                    }
                    if (!defaultMatches(*field.type, *it, why)) return false;
                }
                return true;
            case AvroType::UNION:
                if (!defaultMatches(*type.branches.front(), value, why)) {
                    why = "a union default must match its first branch";
                    return false;
                }
                return true;
        }
        return false;
    }
};

class Renderer {
public:
    ordered_json render(const AvroNode& node, const std::string& enclosing_ns) {
        switch (node.type) {
            case AvroType::RECORD:
            case AvroType::ENUM:
            case AvroType::FIXED:
                return renderNamed(node, enclosing_ns);
            case AvroType::ARRAY: {
                ordered_json out = ordered_json::object();
                out["type"] = "array";
                out["items"] = render(*node.items, enclosing_ns);
                return out;
            }
            case AvroType::MAP: {
                ordered_json out = ordered_json::object();
                out["type"] = "map";
                out["values"] = render(*node.values, enclosing_ns);
                return out;
            }
            case AvroType::UNION: {
                ordered_json out = ordered_json::array();
                for (const AvroNode* branch : node.branches) {
                    out.push_back(render(*branch, enclosing_ns));
                }
                return out;
            }
            default:
                break;
        }
        if (node.logical_type.empty()) {
            return ordered_json(avro::typeName(node.type));
        }
        ordered_json out = ordered_json::object();
        out["type"] = avro::typeName(node.type);
        addLogicalType(node, out);
        return out;
    }

private:
    std::set<std::string> emitted_;

    static void addLogicalType(const AvroNode& node, ordered_json& out) {
        if (node.logical_type.empty()) return;
        out["logicalType"] = node.logical_type;
        if (node.precision) out["precision"] = *node.precision;
        if (node.scale) out["scale"] = *node.scale;
    }

    static ordered_json toOrdered(const json& value) {
        return ordered_json::parse(value.dump());
    }

    ordered_json renderNamed(const AvroNode& node, const std::string& enclosing_ns) {
        if (!emitted_.insert(node.full_name).second) {
            return ordered_json(node.full_name);
        }
        std::string own_ns = namespaceOf(node.full_name);

        ordered_json out = ordered_json::object();
        if (node.type == AvroType::RECORD) {
            out["type"] = node.is_error ? "error" : "record";
        } else {
            out["type"] = avro::typeName(node.type);
        }
        out["name"] = node.full_name;
        // A null-namespace type nested in a namespaced one must say so, or a
        // re-parse would qualify it with the enclosing namespace.
        if (own_ns.empty() && !enclosing_ns.empty()) {
            out["namespace"] = "";
        }
        if (!node.aliases.empty()) {
            out["aliases"] = node.aliases;
        }

        if (node.type == AvroType::RECORD) {
            ordered_json fields = ordered_json::array();
            for (const auto& field : node.fields) {
                ordered_json f = ordered_json::object();
                f["name"] = field.name;
                f["type"] = render(*field.type, own_ns);
                if (field.default_value) {
                    f["default"] = toOrdered(*field.default_value);
                }
                if (!field.aliases.empty()) {
                    f["aliases"] = field.aliases;
                }
                if (field.order == avro::FieldOrder::DESCENDING) {
                    f["order"] = "descending";
                } else if (field.order == avro::FieldOrder::IGNORE) {
                    f["order"] = "ignore";
                }
                fields.push_back(std::move(f));
            }
            out["fields"] = std::move(fields);
        } else if (node.type == AvroType::ENUM) {
            out["symbols"] = node.symbols;
            if (node.enum_default) {
                out["default"] = *node.enum_default;
            }
        } else {
            out["size"] = node.fixed_size;
            addLogicalType(node, out);
        }
        return out;
    }
};

} // anonymous namespace

registry::Result<std::shared_ptr<const AvroSchema>> AvroCanonicalizer::parse(const std::string& schema_text) {
    if (schema_text.find_first_not_of(" \t\r\n") == std::string::npos) {
        return registry::RegistryError::schemaParse("schema text is empty");
    }

    json document;
    try {
        document = json::parse(schema_text);
    } catch (const json::parse_error& e) {
        return registry::RegistryError::schemaParse(std::string("malformed JSON: ") + e.what());
    }

    if (document.is_object() && document.empty()) {
        return registry::RegistryError::schemaParse("schema object is empty");
    }

    auto schema = std::make_shared<AvroSchema>();
    try {
        Parser parser(*schema);
        schema->setRoot(parser.parseType(document, "", "schema", 0));
    } catch (const ParseFailure& e) {
        return registry::RegistryError::schemaParse(e.what());
    } catch (const json::exception& e) {
        return registry::RegistryError::schemaParse(std::string("invalid schema attribute: ") + e.what());
    }
    return std::shared_ptr<const AvroSchema>(std::move(schema));
}

std::string AvroCanonicalizer::render(const AvroSchema& schema) {
    Renderer renderer;
    return renderer.render(schema.root(), "").dump();
}

registry::Result<CanonicalSchema> AvroCanonicalizer::canonicalize(const std::string& schema_text) const {
    auto parsed = parse(schema_text);
    if (!parsed.isOk()) {
        LOG_TRACE("[AvroCanonicalizer] Rejected schema: ", parsed.error().details);
        return std::move(parsed.error());
    }

    CanonicalSchema result;
    result.structure = std::move(parsed.value());
    result.canonical_text = render(*result.structure);

    auto digest = sha256Hex(result.canonical_text);
    if (!digest.isOk()) {
        return std::move(digest.error());
    }
    result.fingerprint = std::move(digest.value());
    return result;
}

} // namespace canonical
} // namespace schemata
