// include/serialization_utils.h
#pragma once

#include <string>
#include <ostream>
#include <istream>
#include <stdexcept> // For std::runtime_error, std::overflow_error
#include <type_traits>
#include <cstdint>

// Upper bound for one length-prefixed string, shared by writers and readers of
// the registry logs.
constexpr uint32_t MAX_SERIALIZED_STRING_BYTES = 64 * 1024 * 1024;

/**
 * @brief Serializes a string to an output stream with a 32-bit length prefix.
 * @throws std::length_error if the string exceeds MAX_SERIALIZED_STRING_BYTES.
 * @throws std::runtime_error on stream write failure.
 */
void SerializeString(std::ostream& out, const std::string& str);

/**
 * @brief Deserializes a length-prefixed string from an input stream.
 * @throws std::runtime_error on a short read.
 * @throws std::length_error if the stored length exceeds MAX_SERIALIZED_STRING_BYTES.
 */
std::string DeserializeString(std::istream& in);

// Fixed-width integers are written in host byte order, like the strings' length prefix.
template<typename T>
void SerializeInt(std::ostream& out, T value) {
    static_assert(std::is_integral<T>::value, "SerializeInt requires an integral type");
    out.write(reinterpret_cast<const char*>(&value), sizeof(value));
    if (!out) {
        throw std::runtime_error("SerializeInt: Failed to write " + std::to_string(sizeof(value)) + " bytes.");
    }
}

template<typename T>
T DeserializeInt(std::istream& in) {
    static_assert(std::is_integral<T>::value, "DeserializeInt requires an integral type");
    T value{};
    in.read(reinterpret_cast<char*>(&value), sizeof(value));
    if (in.gcount() != static_cast<std::streamsize>(sizeof(value))) {
        throw std::runtime_error("DeserializeInt: Failed to read " + std::to_string(sizeof(value)) + " bytes.");
    }
    return value;
}
