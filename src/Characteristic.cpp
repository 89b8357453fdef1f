#include "Characteristic.h"
#include "HapError.h"
#include "Logger.h"
#include "Service.h"
#include "TypeRegistry.h"

#include <algorithm>
#include <limits>

namespace hapdb {

namespace {

Json valueToJson(const CharacteristicValue& value) {
    return std::visit([](const auto& v) { return Json(v); }, value);
}

Json numericToJson(const NumericValue& value) {
    return std::visit([](const auto& v) { return Json(v); }, value);
}

int64_t integerFromJson(const Json& value, const std::string& context) {
    if (value.is_number_unsigned()) {
        uint64_t u = value.get<uint64_t>();
        if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            throw MalformedRecordError(context + ": integer out of range: " + value.dump());
        }
        return static_cast<int64_t>(u);
    }
    if (value.is_number_integer()) {
        return value.get<int64_t>();
    }
    throw MalformedRecordError(context + ": expected an integer, got " + value.dump());
}

// Unsigned integers that do not fit int64_t stay uint64_t (uint64 format)
bool isLargeUnsigned(const Json& value) {
    return value.is_number_unsigned() &&
           value.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
}

// "value": null is read as "no value"
std::optional<CharacteristicValue> valueFromJson(const Json& value, const std::string& context) {
    switch (value.type()) {
        case Json::value_t::null:
            return std::nullopt;
        case Json::value_t::boolean:
            return CharacteristicValue(value.get<bool>());
        case Json::value_t::number_integer:
        case Json::value_t::number_unsigned:
            if (isLargeUnsigned(value)) {
                return CharacteristicValue(value.get<uint64_t>());
            }
            return CharacteristicValue(integerFromJson(value, context));
        case Json::value_t::number_float:
            return CharacteristicValue(value.get<double>());
        case Json::value_t::string:
            return CharacteristicValue(value.get<std::string>());
        default:
            throw MalformedRecordError(context + ": unsupported value " + value.dump());
    }
}

NumericValue numericFromJson(const Json& value, const std::string& context) {
    if (value.is_number_float()) {
        return NumericValue(value.get<double>());
    }
    if (isLargeUnsigned(value)) {
        return NumericValue(value.get<uint64_t>());
    }
    if (value.is_number()) {
        return NumericValue(integerFromJson(value, context));
    }
    throw MalformedRecordError(context + ": expected a number, got " + value.dump());
}

std::string stringFromJson(const Json& value, const std::string& context) {
    if (!value.is_string()) {
        throw MalformedRecordError(context + ": expected a string, got " + value.dump());
    }
    return value.get<std::string>();
}

} // namespace

Characteristic::Characteristic(Service& service,
                               const HapUuid& type,
                               uint64_t iid,
                               CharacteristicFormat format,
                               CharacteristicPermissions perms)
    : m_service(service),
      m_type(type),
      m_iid(iid),
      m_format(format),
      m_perms(std::move(perms)) {
}

std::string Characteristic::getTypeName() const {
    return TypeRegistry::instance()->characteristicName(m_type);
}

bool Characteristic::hasPermission(CharacteristicPermission permission) const {
    return std::find(m_perms.begin(), m_perms.end(), permission) != m_perms.end();
}

void Characteristic::setValue(const CharacteristicValue& value) {
    m_value = value;
}

void Characteristic::clearValue() {
    m_value.reset();
}

void Characteristic::applyOptions(const CharacteristicOptions& options) {
    if (options.value) m_value = options.value;
    if (options.description) m_description = options.description;
    if (options.unit) m_unit = options.unit;
    if (options.minValue) m_minValue = options.minValue;
    if (options.maxValue) m_maxValue = options.maxValue;
    if (options.minStep) m_minStep = options.minStep;
    if (options.maxLen) m_maxLen = options.maxLen;
    if (options.validValues) m_validValues = options.validValues;
}

Json Characteristic::toJson() const {
    Json perms = Json::array();
    for (CharacteristicPermission permission : m_perms) {
        perms.push_back(permissionToString(permission));
    }

    Json record = Json::object();
    record["iid"] = m_iid;
    record["type"] = m_type.toString();
    record["perms"] = perms;
    record["format"] = formatToString(m_format);

    if (m_value) record["value"] = valueToJson(*m_value);
    if (m_description) record["description"] = *m_description;
    if (m_minValue) record["minValue"] = numericToJson(*m_minValue);
    if (m_maxValue) record["maxValue"] = numericToJson(*m_maxValue);
    if (m_validValues) record["valid-values"] = *m_validValues;
    if (m_unit) record["unit"] = *m_unit;
    if (m_minStep) record["minStep"] = numericToJson(*m_minStep);
    if (m_maxLen) record["maxLen"] = *m_maxLen;

    return record;
}

CharacteristicOptions Characteristic::optionsFromJson(const Json& record, const std::string& context) {
    CharacteristicOptions options;

    const Json& perms = RecordFields::requireArray(record, "perms", context);
    CharacteristicPermissions permissions;
    for (const Json& perm : perms) {
        addPermission(permissions, permissionFromString(stringFromJson(perm, context + ".perms")));
    }
    options.perms = permissions;
    options.format = formatFromString(RecordFields::requireString(record, "format", context));

    auto it = record.find("value");
    if (it != record.end()) {
        options.value = valueFromJson(*it, context + ".value");
    }

    it = record.find("description");
    if (it != record.end()) {
        options.description = stringFromJson(*it, context + ".description");
    }

    it = record.find("minValue");
    if (it != record.end()) {
        options.minValue = numericFromJson(*it, context + ".minValue");
    }

    it = record.find("maxValue");
    if (it != record.end()) {
        options.maxValue = numericFromJson(*it, context + ".maxValue");
    }

    it = record.find("valid-values");
    if (it != record.end()) {
        if (!it->is_array()) {
            throw MalformedRecordError(context + ": field 'valid-values' must be an array");
        }
        std::vector<int64_t> validValues;
        for (const Json& entry : *it) {
            validValues.push_back(integerFromJson(entry, context + ".valid-values"));
        }
        options.validValues = validValues;
    }

    it = record.find("unit");
    if (it != record.end()) {
        options.unit = stringFromJson(*it, context + ".unit");
    }

    it = record.find("minStep");
    if (it != record.end()) {
        options.minStep = numericFromJson(*it, context + ".minStep");
    }

    it = record.find("maxLen");
    if (it != record.end()) {
        options.maxLen = integerFromJson(*it, context + ".maxLen");
    }

    return options;
}

} // namespace hapdb
