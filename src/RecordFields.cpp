#include "RecordFields.h"
#include "HapError.h"

namespace hapdb {

void RecordFields::expectObject(const Json& record, const std::string& context) {
    if (!record.is_object()) {
        throw MalformedRecordError(context + ": expected an object, got " + record.type_name());
    }
}

const Json& RecordFields::require(const Json& record, const char* key, const std::string& context) {
    expectObject(record, context);

    auto it = record.find(key);
    if (it == record.end()) {
        throw MalformedRecordError(context + ": missing mandatory field '" + key + "'");
    }
    return *it;
}

uint64_t RecordFields::toUnsigned(const Json& value, const std::string& context) {
    if (value.is_number_unsigned()) {
        return value.get<uint64_t>();
    }
    if (value.is_number_integer() && value.get<int64_t>() >= 0) {
        return static_cast<uint64_t>(value.get<int64_t>());
    }
    throw MalformedRecordError(context + ": expected a non-negative integer, got " + value.dump());
}

uint64_t RecordFields::requireUnsigned(const Json& record, const char* key, const std::string& context) {
    const Json& value = require(record, key, context);
    return toUnsigned(value, context + "." + key);
}

std::string RecordFields::requireString(const Json& record, const char* key, const std::string& context) {
    const Json& value = require(record, key, context);
    if (!value.is_string()) {
        throw MalformedRecordError(context + ": field '" + key + "' must be a string");
    }
    return value.get<std::string>();
}

const Json& RecordFields::requireArray(const Json& record, const char* key, const std::string& context) {
    const Json& value = require(record, key, context);
    if (!value.is_array()) {
        throw MalformedRecordError(context + ": field '" + key + "' must be an array");
    }
    return value;
}

const Json* RecordFields::optionalArray(const Json& record, const char* key, const std::string& context) {
    expectObject(record, context);

    auto it = record.find(key);
    if (it == record.end()) {
        return nullptr;
    }
    if (!it->is_array()) {
        throw MalformedRecordError(context + ": field '" + key + "' must be an array");
    }
    return &*it;
}

} // namespace hapdb
