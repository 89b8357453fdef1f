#include "CharacteristicTypes.h"
#include "HapError.h"

#include <algorithm>
#include <sstream>

namespace hapdb {

namespace {

struct FormatName {
    CharacteristicFormat format;
    const char* name;
};

const FormatName kFormatNames[] = {
    { CharacteristicFormat::BOOL,   "bool" },
    { CharacteristicFormat::UINT8,  "uint8" },
    { CharacteristicFormat::UINT16, "uint16" },
    { CharacteristicFormat::UINT32, "uint32" },
    { CharacteristicFormat::UINT64, "uint64" },
    { CharacteristicFormat::INT,    "int" },
    { CharacteristicFormat::FLOAT,  "float" },
    { CharacteristicFormat::STRING, "string" },
    { CharacteristicFormat::TLV8,   "tlv8" },
    { CharacteristicFormat::DATA,   "data" },
};

struct PermissionName {
    CharacteristicPermission permission;
    const char* name;
};

const PermissionName kPermissionNames[] = {
    { CharacteristicPermission::PAIRED_READ,              "pr" },
    { CharacteristicPermission::PAIRED_WRITE,             "pw" },
    { CharacteristicPermission::EVENTS,                   "ev" },
    { CharacteristicPermission::ADDITIONAL_AUTHORIZATION, "aa" },
    { CharacteristicPermission::TIMED_WRITE,              "tw" },
    { CharacteristicPermission::HIDDEN,                   "hd" },
    { CharacteristicPermission::WRITE_RESPONSE,           "wr" },
};

// Integral view of a value: bool counts as 0 or 1
bool asInteger(const CharacteristicValue& value, bool& negative, uint64_t& magnitude) {
    negative = false;
    if (const bool* b = std::get_if<bool>(&value)) {
        magnitude = *b ? 1 : 0;
        return true;
    }
    if (const int64_t* i = std::get_if<int64_t>(&value)) {
        negative = *i < 0;
        magnitude = negative ? static_cast<uint64_t>(-(*i + 1)) + 1 : static_cast<uint64_t>(*i);
        return true;
    }
    if (const uint64_t* u = std::get_if<uint64_t>(&value)) {
        magnitude = *u;
        return true;
    }
    return false;
}

bool asNumber(const CharacteristicValue& value, double& out) {
    bool negative = false;
    uint64_t magnitude = 0;
    if (asInteger(value, negative, magnitude)) {
        out = negative ? -static_cast<double>(magnitude) : static_cast<double>(magnitude);
        return true;
    }
    if (const double* d = std::get_if<double>(&value)) {
        out = *d;
        return true;
    }
    return false;
}

} // namespace

const char* formatToString(CharacteristicFormat format) {
    for (const auto& entry : kFormatNames) {
        if (entry.format == format) {
            return entry.name;
        }
    }
    return "unknown";
}

const char* permissionToString(CharacteristicPermission permission) {
    for (const auto& entry : kPermissionNames) {
        if (entry.permission == permission) {
            return entry.name;
        }
    }
    return "unknown";
}

CharacteristicFormat formatFromString(const std::string& text) {
    for (const auto& entry : kFormatNames) {
        if (text == entry.name) {
            return entry.format;
        }
    }
    throw MalformedRecordError("Unknown characteristic format: " + text);
}

CharacteristicPermission permissionFromString(const std::string& text) {
    for (const auto& entry : kPermissionNames) {
        if (text == entry.name) {
            return entry.permission;
        }
    }
    throw MalformedRecordError("Unknown characteristic permission: " + text);
}

void addPermission(CharacteristicPermissions& perms, CharacteristicPermission permission) {
    if (std::find(perms.begin(), perms.end(), permission) == perms.end()) {
        perms.push_back(permission);
    }
}

bool valuesEqual(const CharacteristicValue& lhs, const CharacteristicValue& rhs) {
    bool leftNegative = false;
    bool rightNegative = false;
    uint64_t leftMagnitude = 0;
    uint64_t rightMagnitude = 0;
    if (asInteger(lhs, leftNegative, leftMagnitude) && asInteger(rhs, rightNegative, rightMagnitude)) {
        return leftNegative == rightNegative && leftMagnitude == rightMagnitude;
    }

    double left = 0.0;
    double right = 0.0;
    if (asNumber(lhs, left) && asNumber(rhs, right)) {
        return left == right;
    }
    return lhs == rhs;
}

std::string valueToString(const CharacteristicValue& value) {
    std::ostringstream out;
    if (const bool* b = std::get_if<bool>(&value)) {
        out << (*b ? "true" : "false");
    } else if (const int64_t* i = std::get_if<int64_t>(&value)) {
        out << *i;
    } else if (const uint64_t* u = std::get_if<uint64_t>(&value)) {
        out << *u;
    } else if (const double* d = std::get_if<double>(&value)) {
        out << *d;
    } else {
        out << '"' << std::get<std::string>(value) << '"';
    }
    return out.str();
}

} // namespace hapdb
