#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace hapdb {

// Wire records keep key insertion order so a re-serialized document matches byte for byte
using Json = nlohmann::ordered_json;

// Checked field access for decoding wire records. Every helper throws
// MalformedRecordError naming `context` and the key when the field is missing
// or has the wrong JSON type.
struct RecordFields {
    static const Json& require(const Json& record, const char* key, const std::string& context);

    static uint64_t requireUnsigned(const Json& record, const char* key, const std::string& context);
    static std::string requireString(const Json& record, const char* key, const std::string& context);
    static const Json& requireArray(const Json& record, const char* key, const std::string& context);

    // Missing is fine (returns nullptr), present but not an array is not
    static const Json* optionalArray(const Json& record, const char* key, const std::string& context);

    static void expectObject(const Json& record, const std::string& context);

    // Non-negative integer element of an id list ("linked")
    static uint64_t toUnsigned(const Json& value, const std::string& context);
};

} // namespace hapdb
