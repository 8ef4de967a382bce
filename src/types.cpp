// src/types.cpp
#include "../include/types.h"
#include "../include/registry_error/error_utils.h"
#include "../include/debug_utils.h"

#include <magic_enum/magic_enum.hpp>
#include <algorithm>
#include <cctype>

namespace schemata {

namespace {

// Digits only, no sign, no leading '+', value in [1, max].
std::optional<int64_t> parsePositiveDecimal(const std::string& text, int64_t max) {
    if (text.empty() || text.size() > 19) {
        return std::nullopt;
    }
    if (!std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    int64_t value = 0;
    for (char c : text) {
        int digit = c - '0';
        if (value > (max - digit) / 10) {
            return std::nullopt;
        }
        value = value * 10 + digit;
    }
    if (value <= 0) {
        return std::nullopt;
    }
    return value;
}

} // namespace

std::string toString(SchemaType type) {
    return type == SchemaType::KEY ? "key" : "value";
}

std::string toString(CompatibilityMode mode) {
    return std::string(magic_enum::enum_name(mode));
}

registry::Result<SchemaType> parseSchemaType(const std::string& text) {
    if (text == "key") return SchemaType::KEY;
    if (text == "value") return SchemaType::VALUE;
    return registry::RegistryError::invalidArgument("type", "Schema type must be 'key' or 'value', got '" +
                                                    format_subject_for_print(text) + "'");
}

registry::Result<CompatibilityMode> parseCompatibilityMode(const std::string& text) {
    std::string upper = text;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    auto mode = magic_enum::enum_cast<CompatibilityMode>(upper);
    if (!mode.has_value()) {
        return registry::RegistryError::invalidMode(text);
    }
    return *mode;
}

bool isTransitive(CompatibilityMode mode) {
    return mode == CompatibilityMode::BACKWARD_TRANSITIVE ||
           mode == CompatibilityMode::FORWARD_TRANSITIVE ||
           mode == CompatibilityMode::FULL_TRANSITIVE;
}

bool checksBackward(CompatibilityMode mode) {
    return mode == CompatibilityMode::BACKWARD || mode == CompatibilityMode::BACKWARD_TRANSITIVE ||
           mode == CompatibilityMode::FULL || mode == CompatibilityMode::FULL_TRANSITIVE;
}

bool checksForward(CompatibilityMode mode) {
    return mode == CompatibilityMode::FORWARD || mode == CompatibilityMode::FORWARD_TRANSITIVE ||
           mode == CompatibilityMode::FULL || mode == CompatibilityMode::FULL_TRANSITIVE;
}

registry::Result<SchemaId> parseSchemaId(const std::string& text) {
    auto value = parsePositiveDecimal(text, std::numeric_limits<SchemaId>::max());
    if (!value) {
        return registry::RegistryError::invalidArgument("schema_id", "Schema id must be a positive integer, got '" + text + "'");
    }
    return static_cast<SchemaId>(*value);
}

// --- ScopeKey ---

ScopeKey::ScopeKey(std::string subject, SchemaType type)
    : subject_(std::move(subject)), type_(type), rendered_(subject_ + "-" + schemata::toString(type)) {}

registry::Result<ScopeKey> ScopeKey::make(const std::string& subject, SchemaType type) {
    if (subject.empty()) {
        return registry::RegistryError::invalidArgument("subject", "Subject name must not be empty");
    }
    for (unsigned char c : subject) {
        if (std::iscntrl(c)) {
            return registry::RegistryError::invalidArgument("subject", "Subject name must not contain control characters");
        }
    }
    return ScopeKey(subject, type);
}

registry::Result<ScopeKey> ScopeKey::make(const std::string& subject, const std::string& type) {
    auto parsed_type = parseSchemaType(type);
    if (!parsed_type) {
        return std::move(parsed_type).error();
    }
    return make(subject, *parsed_type);
}

registry::Result<ScopeKey> ScopeKey::parse(const std::string& rendered) {
    static const std::string key_suffix = "-key";
    static const std::string value_suffix = "-value";
    auto ends_with = [&](const std::string& suffix) {
        return rendered.size() > suffix.size() &&
               rendered.compare(rendered.size() - suffix.size(), suffix.size(), suffix) == 0;
    };
    if (ends_with(key_suffix)) {
        return make(rendered.substr(0, rendered.size() - key_suffix.size()), SchemaType::KEY);
    }
    if (ends_with(value_suffix)) {
        return make(rendered.substr(0, rendered.size() - value_suffix.size()), SchemaType::VALUE);
    }
    return registry::RegistryError::invalidArgument("subject", "'" + rendered + "' is not a rendered scope key");
}

// --- VersionRef ---

registry::Result<VersionRef> VersionRef::parse(const std::string& text) {
    if (text == "latest") {
        return VersionRef::latest();
    }
    auto value = parsePositiveDecimal(text, std::numeric_limits<VersionNumber>::max());
    if (!value) {
        return registry::RegistryError::invalidArgument("version", "Version must be 'latest' or a positive integer, got '" + text + "'");
    }
    return VersionRef::exact(static_cast<VersionNumber>(*value));
}

std::string VersionRef::toString() const {
    return number_ ? std::to_string(*number_) : std::string("latest");
}

} // namespace schemata
