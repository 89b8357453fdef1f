#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace hapdb {

/**
 * @brief Characteristic value formats
 */
enum class CharacteristicFormat {
    BOOL,
    UINT8,
    UINT16,
    UINT32,
    UINT64,
    INT,
    FLOAT,
    STRING,
    TLV8,
    DATA
};

/**
 * @brief Characteristic permission flags
 */
enum class CharacteristicPermission {
    PAIRED_READ,            // "pr"
    PAIRED_WRITE,           // "pw"
    EVENTS,                 // "ev"
    ADDITIONAL_AUTHORIZATION, // "aa"
    TIMED_WRITE,            // "tw"
    HIDDEN,                 // "hd"
    WRITE_RESPONSE          // "wr"
};

using CharacteristicPermissions = std::vector<CharacteristicPermission>;

// Current value of a characteristic. tlv8 and data values travel as base64 strings.
// Integers are decoded as int64_t; uint64_t only holds values above INT64_MAX.
using CharacteristicValue = std::variant<bool, int64_t, uint64_t, double, std::string>;

// minValue, maxValue and minStep
using NumericValue = std::variant<int64_t, uint64_t, double>;

/**
 * @brief Options accepted by Service::addCharacteristic
 *
 * Every member is optional. Missing perms, format and unit fall back to the
 * type registry defaults for the characteristic type; the other members stay
 * unset and are left out of the wire record.
 */
struct CharacteristicOptions {
    std::optional<CharacteristicPermissions> perms;
    std::optional<CharacteristicFormat> format;
    std::optional<std::string> description;
    std::optional<CharacteristicValue> value;
    std::optional<std::string> unit;
    std::optional<NumericValue> minValue;
    std::optional<NumericValue> maxValue;
    std::optional<NumericValue> minStep;
    std::optional<int64_t> maxLen;
    std::optional<std::vector<int64_t>> validValues;
};

// Wire strings ("uint8", "pr", ...)
const char* formatToString(CharacteristicFormat format);
const char* permissionToString(CharacteristicPermission permission);

// Throw MalformedRecordError on unknown strings
CharacteristicFormat formatFromString(const std::string& text);
CharacteristicPermission permissionFromString(const std::string& text);

// Appends `permission` unless already present, keeping first-seen order
void addPermission(CharacteristicPermissions& perms, CharacteristicPermission permission);

// Equality used by queries: bool, integers and double compare by numeric value (true == 1), strings exactly
bool valuesEqual(const CharacteristicValue& lhs, const CharacteristicValue& rhs);

// Human readable rendering for logs and the command-line tool
std::string valueToString(const CharacteristicValue& value);

} // namespace hapdb
