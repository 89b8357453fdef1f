#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "CharacteristicTypes.h"
#include "HapUuid.h"
#include "RecordFields.h"

namespace hapdb {

class Service;

/**
 * @brief A typed, permissioned data point owned by a Service
 *
 * Type and format are fixed at creation. The value and the descriptive
 * attributes may change; an unset optional attribute is left out of the
 * wire record.
 */
class Characteristic {
public:
    Characteristic(Service& service,
                   const HapUuid& type,
                   uint64_t iid,
                   CharacteristicFormat format,
                   CharacteristicPermissions perms);

    uint64_t getIid() const { return m_iid; }
    const HapUuid& getType() const { return m_type; }
    CharacteristicFormat getFormat() const { return m_format; }
    const CharacteristicPermissions& getPerms() const { return m_perms; }
    Service& getService() const { return m_service; }

    // Registry name, or the UUID for unregistered types
    std::string getTypeName() const;

    bool hasPermission(CharacteristicPermission permission) const;

    // Value
    const std::optional<CharacteristicValue>& getValue() const { return m_value; }
    void setValue(const CharacteristicValue& value);
    void clearValue();

    // Descriptive attributes
    const std::optional<std::string>& getDescription() const { return m_description; }
    const std::optional<std::string>& getUnit() const { return m_unit; }
    const std::optional<NumericValue>& getMinValue() const { return m_minValue; }
    const std::optional<NumericValue>& getMaxValue() const { return m_maxValue; }
    const std::optional<NumericValue>& getMinStep() const { return m_minStep; }
    const std::optional<int64_t>& getMaxLen() const { return m_maxLen; }
    const std::optional<std::vector<int64_t>>& getValidValues() const { return m_validValues; }

    void setDescription(const std::optional<std::string>& description) { m_description = description; }
    void setUnit(const std::optional<std::string>& unit) { m_unit = unit; }
    void setMinValue(const std::optional<NumericValue>& minValue) { m_minValue = minValue; }
    void setMaxValue(const std::optional<NumericValue>& maxValue) { m_maxValue = maxValue; }
    void setMinStep(const std::optional<NumericValue>& minStep) { m_minStep = minStep; }
    void setMaxLen(const std::optional<int64_t>& maxLen) { m_maxLen = maxLen; }
    void setValidValues(const std::optional<std::vector<int64_t>>& validValues) { m_validValues = validValues; }

    // Copies every descriptive attribute and the value that is set in `options`
    void applyOptions(const CharacteristicOptions& options);

    // {iid, type, perms, format, value?, description?, minValue?, maxValue?, valid-values?, unit?, minStep?, maxLen?}
    Json toJson() const;

    // Decodes perms, format and every optional field of a characteristic record
    static CharacteristicOptions optionsFromJson(const Json& record, const std::string& context);

private:
    Service& m_service;
    HapUuid m_type;
    uint64_t m_iid;
    CharacteristicFormat m_format;
    CharacteristicPermissions m_perms;

    std::optional<CharacteristicValue> m_value;
    std::optional<std::string> m_description;
    std::optional<std::string> m_unit;
    std::optional<NumericValue> m_minValue;
    std::optional<NumericValue> m_maxValue;
    std::optional<NumericValue> m_minStep;
    std::optional<int64_t> m_maxLen;
    std::optional<std::vector<int64_t>> m_validValues;

    Characteristic(const Characteristic&) = delete;
    Characteristic& operator=(const Characteristic&) = delete;
};

} // namespace hapdb
