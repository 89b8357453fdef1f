#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "CharacteristicTypes.h"
#include "HapUuid.h"

namespace hapdb {

/**
 * @brief Defaults applied to a characteristic created without explicit perms/format
 */
struct CharacteristicDefaults {
    CharacteristicFormat format;
    CharacteristicPermissions perms;
    std::optional<std::string> unit;
};

/**
 * @brief Lookup tables mapping type names to UUIDs and back
 *
 * Implementations are pure lookups. Resolution accepts a registered name or
 * anything UUID-shaped; only an unregistered, non-UUID name is an error
 * (UnknownTypeError).
 *
 * The process-wide registry is swapped with setInstance(). instance() hands
 * out shared ownership, so a registry replaced mid-call stays alive until
 * that caller drops its pointer.
 */
class TypeRegistry {
public:
    virtual ~TypeRegistry() = default;

    virtual HapUuid resolveService(const std::string& nameOrUuid) const = 0;
    virtual HapUuid resolveCharacteristic(const std::string& nameOrUuid) const = 0;

    // Registered name, or the UUID string for unregistered types
    virtual std::string serviceName(const HapUuid& uuid) const = 0;
    virtual std::string characteristicName(const HapUuid& uuid) const = 0;

    virtual std::optional<CharacteristicDefaults> characteristicDefaults(const HapUuid& uuid) const = 0;

    // Characteristics a service of this type must expose, in declaration order
    virtual std::vector<HapUuid> requiredCharacteristics(const HapUuid& serviceUuid) const = 0;

    static std::shared_ptr<TypeRegistry> instance();
    static void setInstance(std::shared_ptr<TypeRegistry> registry);
};

/**
 * @brief Built-in table of common HAP services and characteristics
 *
 * Names are registered both in full form ("public.hap.service.lightbulb") and
 * as a short alias ("lightbulb").
 */
class DefaultTypeRegistry : public TypeRegistry {
public:
    static constexpr const char* kServicePrefix = "public.hap.service.";
    static constexpr const char* kCharacteristicPrefix = "public.hap.characteristic.";

    DefaultTypeRegistry();

    HapUuid resolveService(const std::string& nameOrUuid) const override;
    HapUuid resolveCharacteristic(const std::string& nameOrUuid) const override;

    std::string serviceName(const HapUuid& uuid) const override;
    std::string characteristicName(const HapUuid& uuid) const override;

    std::optional<CharacteristicDefaults> characteristicDefaults(const HapUuid& uuid) const override;
    std::vector<HapUuid> requiredCharacteristics(const HapUuid& serviceUuid) const override;

private:
    static HapUuid resolve(const std::map<std::string, HapUuid>& names,
                           const std::string& nameOrUuid,
                           const char* kind);

    std::map<std::string, HapUuid> m_serviceNames;
    std::map<HapUuid, std::string> m_serviceUuids;
    std::map<std::string, HapUuid> m_characteristicNames;
    std::map<HapUuid, std::string> m_characteristicUuids;
    std::map<HapUuid, CharacteristicDefaults> m_defaults;
    std::map<HapUuid, std::vector<HapUuid>> m_required;
};

} // namespace hapdb
