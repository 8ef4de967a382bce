// src/compat/compatibility_checker.cpp

#include "../../include/compat/compatibility_checker.h"
#include "../../include/debug_utils.h"

#include <magic_enum/magic_enum.hpp>

#include <algorithm>
#include <set>
#include <utility>

namespace schemata {
namespace compat {

using avro::AvroNode;
using avro::AvroType;

std::string Incompatibility::rule() const {
    return std::string(magic_enum::enum_name(type));
}

std::string Incompatibility::toString() const {
    return std::string(magic_enum::enum_name(direction)) + " " + rule() + " at " + path +
           " (reference " + std::to_string(reference_index) + "): " + message;
}

namespace {

std::string describe(const AvroNode& node) {
    return node.branchKey();
}

bool namesMatch(const AvroNode& reader, const AvroNode& writer) {
    if (reader.full_name == writer.full_name || reader.shortName() == writer.shortName()) {
        return true;
    }
    return std::find(reader.aliases.begin(), reader.aliases.end(), writer.full_name) != reader.aliases.end();
}

bool isPromotable(AvroType writer, AvroType reader) {
    switch (writer) {
        case AvroType::INT:
            return reader == AvroType::LONG || reader == AvroType::FLOAT || reader == AvroType::DOUBLE;
        case AvroType::LONG:
            return reader == AvroType::FLOAT || reader == AvroType::DOUBLE;
        case AvroType::FLOAT:
            return reader == AvroType::DOUBLE;
        case AvroType::STRING:
            return reader == AvroType::BYTES;
        case AvroType::BYTES:
            return reader == AvroType::STRING;
        default:
            return false;
    }
}

class ResolutionWalker {
public:
    void check(const AvroNode& reader, const AvroNode& writer, const std::string& path,
               std::vector<Incompatibility>& out) {
        auto key = std::make_pair(&reader, &writer);
        // A pair already on the stack is a recursive reference; assume it resolves.
        if (!in_progress_.insert(key).second) {
            return;
        }
        resolve(reader, writer, path, out);
        in_progress_.erase(key);
    }

private:
    std::set<std::pair<const AvroNode*, const AvroNode*>> in_progress_;

    static void add(std::vector<Incompatibility>& out, IncompatibilityType type,
                    const std::string& path, const std::string& message) {
        Incompatibility inc;
        inc.type = type;
        inc.path = path.empty() ? "/" : path;
        inc.message = message;
        out.push_back(std::move(inc));
    }

    void resolve(const AvroNode& reader, const AvroNode& writer, const std::string& path,
                 std::vector<Incompatibility>& out) {
        if (writer.type == AvroType::UNION) {
            // Every writer branch must be readable.
            for (size_t i = 0; i < writer.branches.size(); ++i) {
                check(reader, *writer.branches[i], path, out);
            }
            return;
        }

        if (reader.type == AvroType::UNION) {
            for (size_t i = 0; i < reader.branches.size(); ++i) {
                std::vector<Incompatibility> trial;
                check(*reader.branches[i], writer, path + "/" + std::to_string(i), trial);
                if (trial.empty()) {
                    return;
                }
            }
            add(out, IncompatibilityType::MISSING_UNION_BRANCH, path,
                "reader union lacks a branch for writer type " + describe(writer));
            return;
        }

        if (reader.type != writer.type) {
            if (!isPromotable(writer.type, reader.type)) {
                add(out, IncompatibilityType::TYPE_MISMATCH, path,
                    "reader type " + describe(reader) + " not compatible with writer type " + describe(writer));
            }
            return;
        }

        switch (reader.type) {
            case AvroType::RECORD:
                resolveRecord(reader, writer, path, out);
                return;
            case AvroType::ENUM:
                if (!namesMatch(reader, writer)) {
                    add(out, IncompatibilityType::NAME_MISMATCH, path + "/name",
                        "expected " + writer.full_name + " but found " + reader.full_name);
                    return;
                }
                if (!reader.enum_default) {
                    std::vector<std::string> missing;
                    for (const auto& symbol : writer.symbols) {
                        if (!reader.hasSymbol(symbol)) missing.push_back(symbol);
                    }
                    if (!missing.empty()) {
                        std::string list;
                        for (const auto& symbol : missing) {
                            if (!list.empty()) list += ", ";
                            list += symbol;
                        }
                        add(out, IncompatibilityType::MISSING_ENUM_SYMBOLS, path + "/symbols",
                            "reader enum " + reader.full_name + " is missing symbols [" + list + "]");
                    }
                }
                return;
            case AvroType::FIXED:
                if (!namesMatch(reader, writer)) {
                    add(out, IncompatibilityType::NAME_MISMATCH, path + "/name",
                        "expected " + writer.full_name + " but found " + reader.full_name);
                    return;
                }
                if (reader.fixed_size != writer.fixed_size) {
                    add(out, IncompatibilityType::FIXED_SIZE_MISMATCH, path + "/size",
                        "expected size " + std::to_string(writer.fixed_size) + " but found " +
                        std::to_string(reader.fixed_size));
                }
                return;
            case AvroType::ARRAY:
                check(*reader.items, *writer.items, path + "/items", out);
                return;
            case AvroType::MAP:
                check(*reader.values, *writer.values, path + "/values", out);
                return;
            default:
                return; // identical primitives
        }
    }

    void resolveRecord(const AvroNode& reader, const AvroNode& writer, const std::string& path,
                       std::vector<Incompatibility>& out) {
        if (!namesMatch(reader, writer)) {
            add(out, IncompatibilityType::NAME_MISMATCH, path + "/name",
                "expected " + writer.full_name + " but found " + reader.full_name);
            return;
        }
        std::set<const avro::AvroField*> matched;
        for (size_t i = 0; i < reader.fields.size(); ++i) {
            const avro::AvroField& reader_field = reader.fields[i];
            std::string field_path = path + "/fields/" + std::to_string(i);

            const avro::AvroField* writer_field = writer.findField(reader_field.name);
            for (size_t a = 0; !writer_field && a < reader_field.aliases.size(); ++a) {
                writer_field = writer.findField(reader_field.aliases[a]);
            }

            if (writer_field) {
                matched.insert(writer_field);
                check(*reader_field.type, *writer_field->type, field_path + "/type", out);
            } else if (!reader_field.default_value) {
                add(out, IncompatibilityType::READER_FIELD_MISSING_DEFAULT_VALUE, field_path,
                    "field '" + reader_field.name + "' of " + reader.full_name +
                    " has no default and is absent from the writer");
            }
        }

        // A required writer field may not disappear from the reader.
        for (const auto& writer_field : writer.fields) {
            if (matched.count(&writer_field) == 0 && !writer_field.default_value) {
                add(out, IncompatibilityType::WRITER_FIELD_REMOVED_WITHOUT_DEFAULT, path + "/fields",
                    "field '" + writer_field.name + "' of " + writer.full_name +
                    " has no default and is absent from the reader");
            }
        }
    }
};

void tag(std::vector<Incompatibility>& found, CheckDirection direction, size_t reference_index,
         std::vector<Incompatibility>& out) {
    for (auto& inc : found) {
        inc.direction = direction;
        inc.reference_index = reference_index;
        out.push_back(std::move(inc));
    }
}

} // anonymous namespace

std::vector<Incompatibility> CompatibilityChecker::checkReaderWriter(const AvroNode& reader,
                                                                     const AvroNode& writer) {
    std::vector<Incompatibility> out;
    ResolutionWalker walker;
    walker.check(reader, writer, "", out);
    return out;
}

CompatibilityResult CompatibilityChecker::isCompatible(
        const avro::AvroSchema& candidate,
        const std::vector<std::shared_ptr<const avro::AvroSchema>>& references,
        CompatibilityMode mode) const {
    CompatibilityResult result;
    if (mode == CompatibilityMode::NONE || references.empty()) {
        return result;
    }

    size_t first = isTransitive(mode) ? 0 : references.size() - 1;
    for (size_t idx = first; idx < references.size(); ++idx) {
        const avro::AvroSchema& reference = *references[idx];
        if (checksBackward(mode)) {
            auto found = checkReaderWriter(candidate.root(), reference.root());
            tag(found, CheckDirection::BACKWARD, idx, result.violations);
        }
        if (checksForward(mode)) {
            auto found = checkReaderWriter(reference.root(), candidate.root());
            tag(found, CheckDirection::FORWARD, idx, result.violations);
        }
    }

    result.compatible = result.violations.empty();
    if (!result.compatible) {
        LOG_TRACE("[CompatibilityChecker] ", toString(mode), " check found ",
                  result.violations.size(), " violation(s); first: ", result.violations.front().toString());
    }
    return result;
}

} // namespace compat
} // namespace schemata
