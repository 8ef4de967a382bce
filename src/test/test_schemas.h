// src/test/test_schemas.h
#pragma once

#include <string>

// Avro schemas shared by the test suites.
namespace test_schemas {

inline const std::string kUserV1 = R"({
    "type": "record", "name": "User", "namespace": "com.example",
    "fields": [
        {"name": "id", "type": "long"},
        {"name": "name", "type": "string"}
    ]
})";

// Same structure as kUserV1 with different whitespace, key order and a doc string.
inline const std::string kUserV1Reformatted =
    R"({"fields":[{"type":"long","name":"id"},{"name":"name","type":"string","doc":"display name"}],)"
    R"("namespace":"com.example","doc":"a user","name":"User","type":"record"})";

// Adds an optional field with a default: backward and forward compatible with v1.
inline const std::string kUserV2 = R"({
    "type": "record", "name": "User", "namespace": "com.example",
    "fields": [
        {"name": "id", "type": "long"},
        {"name": "name", "type": "string"},
        {"name": "email", "type": ["null", "string"], "default": null}
    ]
})";

// Adds a required field without a default: not backward compatible with v1.
inline const std::string kUserRequiredAge = R"({
    "type": "record", "name": "User", "namespace": "com.example",
    "fields": [
        {"name": "id", "type": "long"},
        {"name": "name", "type": "string"},
        {"name": "age", "type": "int"}
    ]
})";

// Drops "name" from v1: backward compatible, not forward compatible.
inline const std::string kUserWithoutName = R"({
    "type": "record", "name": "User", "namespace": "com.example",
    "fields": [
        {"name": "id", "type": "long"}
    ]
})";

inline const std::string kColorEnum = R"({
    "type": "enum", "name": "Color", "symbols": ["RED", "GREEN", "BLUE"]
})";

inline const std::string kLinkedList = R"({
    "type": "record", "name": "Node",
    "fields": [
        {"name": "value", "type": "int"},
        {"name": "next", "type": ["null", "Node"], "default": null}
    ]
})";

// Record with a field of type int whose value differs per index, so each
// index yields a distinct schema.
inline std::string numberedRecord(int index) {
    return R"({"type":"record","name":"Numbered","fields":[{"name":"f)" + std::to_string(index) +
           R"(","type":"int","default":0}]})";
}

} // namespace test_schemas
