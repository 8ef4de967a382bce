//src/serialization_utils.cpp
#include "../include/serialization_utils.h"
#include "../include/debug_utils.h"

void SerializeString(std::ostream& out, const std::string& str) {
    if (str.size() > MAX_SERIALIZED_STRING_BYTES) {
        throw std::length_error("SerializeString: " + std::to_string(str.size()) +
                                " bytes exceeds the record string limit.");
    }
    SerializeInt<uint32_t>(out, static_cast<uint32_t>(str.size()));
    if (str.empty()) return;
    out.write(str.data(), static_cast<std::streamsize>(str.size()));
    if (!out) {
        throw std::runtime_error("SerializeString: Failed to write " + std::to_string(str.size()) + " bytes.");
    }
}

std::string DeserializeString(std::istream& in) {
    const uint32_t len = DeserializeInt<uint32_t>(in);
    // A corrupt length must not turn into a huge allocation.
    if (len > MAX_SERIALIZED_STRING_BYTES) {
        LOG_WARN("DeserializeString: Stored length ", len, " exceeds the record string limit.");
        throw std::length_error("DeserializeString: Stored length " + std::to_string(len) + " exceeds the limit.");
    }
    std::string str(len, '\0');
    if (len > 0) {
        in.read(&str[0], len);
        if (static_cast<uint32_t>(in.gcount()) != len) {
            throw std::runtime_error("DeserializeString: Short read, expected " + std::to_string(len) + " bytes.");
        }
    }
    return str;
}
