#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "Characteristic.h"
#include "CharacteristicTypes.h"
#include "HapUuid.h"
#include "RecordFields.h"

namespace hapdb {

class Accessory;

/**
 * @brief A typed group of characteristics within one accessory
 *
 * A service owns its characteristics (at most one per type) and records
 * outgoing links to other services of the same accessory by iid. Links never
 * own the target; the reverse direction is found by scanning the accessory's
 * services.
 */
class Service {
public:
    Service(Accessory& accessory, const HapUuid& type, uint64_t iid, const std::optional<std::string>& name);

    uint64_t getIid() const { return m_iid; }
    const HapUuid& getType() const { return m_type; }
    const std::optional<std::string>& getName() const { return m_name; }
    Accessory& getAccessory() const { return m_accessory; }

    // Registry name, or the UUID for unregistered types
    std::string getTypeName() const;

    /**
     * @brief Create a characteristic of `type` with the next accessory-wide iid
     *
     * Perms, format and unit not given in `options` come from the registry
     * defaults for the type.
     *
     * @throws UnknownTypeError when `type` does not resolve, or when perms or
     *         format are missing and the registry has no defaults for the type
     * @throws DuplicateCharacteristicError when the service already owns that type
     */
    Characteristic& addCharacteristic(const std::string& type, const CharacteristicOptions& options = {});

    const std::vector<std::unique_ptr<Characteristic>>& getCharacteristics() const { return m_characteristics; }

    bool has(const std::string& type) const;

    // nullptr when absent
    Characteristic* findCharacteristic(const std::string& type) const;
    Characteristic* findCharacteristic(const HapUuid& type) const;

    // NotFoundError when absent
    Characteristic& getCharacteristic(const std::string& type) const;
    Characteristic& operator[](const std::string& type) const;

    Characteristic* characteristicByIid(uint64_t iid) const;

    // Current value of `type`, or `fallback` when the characteristic is absent or has no value
    CharacteristicValue value(const std::string& type, const CharacteristicValue& fallback) const;

    //
    // Links
    //

    // Directed link this -> other. Both services must belong to the same accessory; linking twice is a no-op.
    void addLinkedService(const Service& other);

    const std::vector<uint64_t>& getLinkedIids() const { return m_linked; }

    // True if `other` is in this service's linked set
    bool isLinkedTo(const Service& other) const;

    // {iid, type, characteristics, linked?}
    Json toJson() const;

private:
    friend class Accessory;

    Characteristic& insertCharacteristic(const HapUuid& type,
                                         const CharacteristicOptions& options,
                                         uint64_t iid,
                                         bool applyDefaults);

    void linkIid(uint64_t iid);

    // Name hint restored from the Name characteristic of a decoded record
    void restoreName();

    Accessory& m_accessory;
    HapUuid m_type;
    uint64_t m_iid;
    std::optional<std::string> m_name;
    std::vector<std::unique_ptr<Characteristic>> m_characteristics;
    std::vector<uint64_t> m_linked;

    Service(const Service&) = delete;
    Service& operator=(const Service&) = delete;
};

} // namespace hapdb
