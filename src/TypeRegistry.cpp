#include "TypeRegistry.h"
#include "HapError.h"
#include "Logger.h"

#include <mutex>

namespace hapdb {

namespace {

using Perm = CharacteristicPermission;
using Format = CharacteristicFormat;

struct ServiceEntry {
    const char* name;
    uint32_t shortUuid;
    std::vector<uint32_t> required;
};

struct CharacteristicEntry {
    const char* name;
    uint32_t shortUuid;
    Format format;
    CharacteristicPermissions perms;
    const char* unit;
};

const CharacteristicPermissions kRead = { Perm::PAIRED_READ };
const CharacteristicPermissions kWrite = { Perm::PAIRED_WRITE };
const CharacteristicPermissions kReadNotify = { Perm::PAIRED_READ, Perm::EVENTS };
const CharacteristicPermissions kReadWriteNotify = { Perm::PAIRED_READ, Perm::PAIRED_WRITE, Perm::EVENTS };

const std::vector<CharacteristicEntry>& characteristicTable() {
    static const std::vector<CharacteristicEntry> table = {
        { "identify",                  0x14,  Format::BOOL,   kWrite,           nullptr },
        { "manufacturer",              0x20,  Format::STRING, kRead,            nullptr },
        { "model",                     0x21,  Format::STRING, kRead,            nullptr },
        { "name",                      0x23,  Format::STRING, kRead,            nullptr },
        { "serial-number",             0x30,  Format::STRING, kRead,            nullptr },
        { "firmware.revision",         0x52,  Format::STRING, kRead,            nullptr },
        { "hardware.revision",         0x53,  Format::STRING, kRead,            nullptr },
        { "version",                   0x37,  Format::STRING, kRead,            nullptr },
        { "on",                        0x25,  Format::BOOL,   kReadWriteNotify, nullptr },
        { "outlet-in-use",             0x26,  Format::BOOL,   kReadNotify,      nullptr },
        { "brightness",                0x08,  Format::INT,    kReadWriteNotify, "percentage" },
        { "hue",                       0x13,  Format::FLOAT,  kReadWriteNotify, "arcdegrees" },
        { "saturation",                0x2F,  Format::FLOAT,  kReadWriteNotify, "percentage" },
        { "color-temperature",         0xCE,  Format::UINT32, kReadWriteNotify, nullptr },
        { "rotation.direction",        0x28,  Format::INT,    kReadWriteNotify, nullptr },
        { "rotation.speed",            0x29,  Format::FLOAT,  kReadWriteNotify, "percentage" },
        { "temperature.current",       0x11,  Format::FLOAT,  kReadNotify,      "celsius" },
        { "temperature.target",        0x35,  Format::FLOAT,  kReadWriteNotify, "celsius" },
        { "temperature.units",         0x36,  Format::UINT8,  kReadWriteNotify, nullptr },
        { "heating-cooling.current",   0x0F,  Format::UINT8,  kReadNotify,      nullptr },
        { "heating-cooling.target",    0x33,  Format::UINT8,  kReadWriteNotify, nullptr },
        { "relative-humidity.current", 0x10,  Format::FLOAT,  kReadNotify,      "percentage" },
        { "contact-state",             0x6A,  Format::UINT8,  kReadNotify,      nullptr },
        { "motion-detected",           0x22,  Format::BOOL,   kReadNotify,      nullptr },
        { "battery-level",             0x68,  Format::UINT8,  kReadNotify,      "percentage" },
        { "charging-state",            0x8F,  Format::UINT8,  kReadNotify,      nullptr },
        { "status-lo-batt",            0x79,  Format::UINT8,  kReadNotify,      nullptr },
        { "service-label-namespace",   0xCD,  Format::UINT8,  kRead,            nullptr },
        { "service-label-index",       0xCB,  Format::UINT8,  kRead,            nullptr },
        { "input-event",               0x73,  Format::UINT8,  kReadNotify,      nullptr },
        { "position.current",          0x6D,  Format::UINT8,  kReadNotify,      "percentage" },
        { "position.target",           0x7C,  Format::UINT8,  kReadWriteNotify, "percentage" },
        { "position.state",            0x72,  Format::UINT8,  kReadNotify,      nullptr },
        { "active",                    0xB0,  Format::UINT8,  kReadWriteNotify, nullptr },
        { "active-identifier",         0xE7,  Format::UINT32, kReadWriteNotify, nullptr },
        { "configured-name",           0xE3,  Format::STRING, kReadWriteNotify, nullptr },
        { "sleep-discovery-mode",      0xE8,  Format::UINT8,  kReadNotify,      nullptr },
        { "identifier",                0xE6,  Format::UINT32, kRead,            nullptr },
        { "input-source-type",         0xDB,  Format::UINT8,  kReadNotify,      nullptr },
        { "is-configured",             0xD6,  Format::UINT8,  kReadWriteNotify, nullptr },
        { "current-visibility-state",  0x135, Format::UINT8,  kReadNotify,      nullptr },
    };
    return table;
}

const std::vector<ServiceEntry>& serviceTable() {
    static const std::vector<ServiceEntry> table = {
        { "accessory-information",         0x3E, { 0x14, 0x20, 0x21, 0x23, 0x30, 0x52 } },
        { "protocol.information.service",  0xA2, { 0x37 } },
        { "fan",                           0x40, { 0x25 } },
        { "lightbulb",                     0x43, { 0x25 } },
        { "outlet",                        0x47, { 0x25, 0x26 } },
        { "switch",                        0x49, { 0x25 } },
        { "thermostat",                    0x4A, { 0x0F, 0x33, 0x11, 0x35, 0x36 } },
        { "sensor.contact",                0x80, { 0x6A } },
        { "sensor.humidity",               0x82, { 0x10 } },
        { "sensor.motion",                 0x85, { 0x22 } },
        { "sensor.temperature",            0x8A, { 0x11 } },
        { "stateless-programmable-switch", 0x89, { 0x73 } },
        { "window-covering",               0x8C, { 0x6D, 0x7C, 0x72 } },
        { "battery",                       0x96, { 0x68, 0x8F, 0x79 } },
        { "service-label",                 0xCC, { 0xCD } },
        { "television",                    0xD8, { 0xB0, 0xE7, 0xE3, 0xE8 } },
        { "input-source",                  0xD9, { 0xE3, 0xDB, 0xD6, 0x135 } },
    };
    return table;
}

std::mutex registryMutex;
std::shared_ptr<TypeRegistry> registryInstance;

} // namespace

//
// TypeRegistry
//

std::shared_ptr<TypeRegistry> TypeRegistry::instance() {
    std::lock_guard<std::mutex> lock(registryMutex);
    if (!registryInstance) {
        registryInstance = std::make_shared<DefaultTypeRegistry>();
    }
    return registryInstance;
}

void TypeRegistry::setInstance(std::shared_ptr<TypeRegistry> registry) {
    std::lock_guard<std::mutex> lock(registryMutex);
    registryInstance = std::move(registry);
}

//
// DefaultTypeRegistry
//

DefaultTypeRegistry::DefaultTypeRegistry() {
    for (const auto& entry : characteristicTable()) {
        HapUuid uuid = HapUuid::fromShortUuid(entry.shortUuid);
        std::string fullName = std::string(kCharacteristicPrefix) + entry.name;

        m_characteristicNames.emplace(fullName, uuid);
        m_characteristicNames.emplace(entry.name, uuid);
        m_characteristicUuids.emplace(uuid, fullName);

        CharacteristicDefaults defaults{ entry.format, entry.perms, std::nullopt };
        if (entry.unit) {
            defaults.unit = entry.unit;
        }
        m_defaults.emplace(uuid, defaults);
    }

    for (const auto& entry : serviceTable()) {
        HapUuid uuid = HapUuid::fromShortUuid(entry.shortUuid);
        std::string fullName = std::string(kServicePrefix) + entry.name;

        m_serviceNames.emplace(fullName, uuid);
        m_serviceNames.emplace(entry.name, uuid);
        m_serviceUuids.emplace(uuid, fullName);

        std::vector<HapUuid> required;
        for (uint32_t shortUuid : entry.required) {
            required.push_back(HapUuid::fromShortUuid(shortUuid));
        }
        m_required.emplace(uuid, std::move(required));
    }

    Logger::trace(SSTR << "DefaultTypeRegistry loaded " << m_serviceUuids.size() << " service types and "
                       << m_characteristicUuids.size() << " characteristic types");
}

HapUuid DefaultTypeRegistry::resolve(const std::map<std::string, HapUuid>& names,
                                     const std::string& nameOrUuid,
                                     const char* kind) {
    auto it = names.find(nameOrUuid);
    if (it != names.end()) {
        return it->second;
    }

    if (HapUuid::looksLikeUuid(nameOrUuid)) {
        return HapUuid(nameOrUuid);
    }

    throw UnknownTypeError(std::string("Unknown ") + kind + " type: " + nameOrUuid);
}

HapUuid DefaultTypeRegistry::resolveService(const std::string& nameOrUuid) const {
    return resolve(m_serviceNames, nameOrUuid, "service");
}

HapUuid DefaultTypeRegistry::resolveCharacteristic(const std::string& nameOrUuid) const {
    return resolve(m_characteristicNames, nameOrUuid, "characteristic");
}

std::string DefaultTypeRegistry::serviceName(const HapUuid& uuid) const {
    auto it = m_serviceUuids.find(uuid);
    return it != m_serviceUuids.end() ? it->second : uuid.toString();
}

std::string DefaultTypeRegistry::characteristicName(const HapUuid& uuid) const {
    auto it = m_characteristicUuids.find(uuid);
    return it != m_characteristicUuids.end() ? it->second : uuid.toString();
}

std::optional<CharacteristicDefaults> DefaultTypeRegistry::characteristicDefaults(const HapUuid& uuid) const {
    auto it = m_defaults.find(uuid);
    if (it == m_defaults.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<HapUuid> DefaultTypeRegistry::requiredCharacteristics(const HapUuid& serviceUuid) const {
    auto it = m_required.find(serviceUuid);
    if (it == m_required.end()) {
        return {};
    }
    return it->second;
}

} // namespace hapdb
