#include "Service.h"
#include "Accessory.h"
#include "HapError.h"
#include "Logger.h"
#include "TypeRegistry.h"

#include <algorithm>
#include <stdexcept>

namespace hapdb {

Service::Service(Accessory& accessory, const HapUuid& type, uint64_t iid, const std::optional<std::string>& name)
    : m_accessory(accessory),
      m_type(type),
      m_iid(iid),
      m_name(name) {
}

std::string Service::getTypeName() const {
    return TypeRegistry::instance()->serviceName(m_type);
}

Characteristic& Service::addCharacteristic(const std::string& type, const CharacteristicOptions& options) {
    HapUuid uuid = TypeRegistry::instance()->resolveCharacteristic(type);

    // Check before taking an iid so a rejected call leaves the counter untouched
    if (findCharacteristic(uuid)) {
        throw DuplicateCharacteristicError("Service iid " + std::to_string(m_iid) +
                                           " already has a characteristic of type " + uuid.toString());
    }

    return insertCharacteristic(uuid, options, m_accessory.getNextId(), true);
}

Characteristic& Service::insertCharacteristic(const HapUuid& type,
                                              const CharacteristicOptions& options,
                                              uint64_t iid,
                                              bool applyDefaults) {
    if (findCharacteristic(type)) {
        throw DuplicateCharacteristicError("Service iid " + std::to_string(m_iid) +
                                           " already has a characteristic of type " + type.toString());
    }

    std::optional<CharacteristicDefaults> defaults;
    if (applyDefaults) {
        defaults = TypeRegistry::instance()->characteristicDefaults(type);
    }

    std::optional<CharacteristicFormat> format = options.format;
    std::optional<CharacteristicPermissions> perms = options.perms;
    if (defaults) {
        if (!format) format = defaults->format;
        if (!perms) perms = defaults->perms;
    }

    if (!format || !perms) {
        throw UnknownTypeError("No registry defaults for characteristic type " + type.toString() +
                               "; perms and format must be given explicitly");
    }

    auto characteristic = std::make_unique<Characteristic>(*this, type, iid, *format, *perms);
    if (defaults && defaults->unit) {
        characteristic->setUnit(defaults->unit);
    }
    characteristic->applyOptions(options);

    Logger::debug(SSTR << "Added characteristic " << type.toShortString() << " iid " << iid
                       << " to service iid " << m_iid << " (aid " << m_accessory.getAid() << ")");

    m_characteristics.push_back(std::move(characteristic));
    return *m_characteristics.back();
}

bool Service::has(const std::string& type) const {
    return findCharacteristic(type) != nullptr;
}

Characteristic* Service::findCharacteristic(const std::string& type) const {
    return findCharacteristic(TypeRegistry::instance()->resolveCharacteristic(type));
}

Characteristic* Service::findCharacteristic(const HapUuid& type) const {
    for (const auto& characteristic : m_characteristics) {
        if (characteristic->getType() == type) {
            return characteristic.get();
        }
    }
    return nullptr;
}

Characteristic& Service::getCharacteristic(const std::string& type) const {
    HapUuid uuid = TypeRegistry::instance()->resolveCharacteristic(type);
    Characteristic* characteristic = findCharacteristic(uuid);
    if (!characteristic) {
        throw NotFoundError("Service iid " + std::to_string(m_iid) + " has no characteristic of type " +
                            uuid.toString());
    }
    return *characteristic;
}

Characteristic& Service::operator[](const std::string& type) const {
    return getCharacteristic(type);
}

Characteristic* Service::characteristicByIid(uint64_t iid) const {
    for (const auto& characteristic : m_characteristics) {
        if (characteristic->getIid() == iid) {
            return characteristic.get();
        }
    }
    return nullptr;
}

CharacteristicValue Service::value(const std::string& type, const CharacteristicValue& fallback) const {
    Characteristic* characteristic = findCharacteristic(type);
    if (!characteristic || !characteristic->getValue()) {
        return fallback;
    }
    return *characteristic->getValue();
}

void Service::addLinkedService(const Service& other) {
    if (&other.m_accessory != &m_accessory) {
        throw std::invalid_argument("Cannot link service iid " + std::to_string(m_iid) +
                                    " to a service of another accessory");
    }
    linkIid(other.m_iid);
}

void Service::linkIid(uint64_t iid) {
    if (std::find(m_linked.begin(), m_linked.end(), iid) == m_linked.end()) {
        m_linked.push_back(iid);
        Logger::trace(SSTR << "Linked service iid " << m_iid << " -> " << iid);
    }
}

bool Service::isLinkedTo(const Service& other) const {
    if (&other.m_accessory != &m_accessory) {
        return false;
    }
    return std::find(m_linked.begin(), m_linked.end(), other.m_iid) != m_linked.end();
}

void Service::restoreName() {
    static const HapUuid nameType = HapUuid::fromShortUuid(0x23);

    Characteristic* name = findCharacteristic(nameType);
    if (name && name->getValue()) {
        if (const std::string* text = std::get_if<std::string>(&*name->getValue())) {
            m_name = *text;
        }
    }
}

Json Service::toJson() const {
    Json characteristics = Json::array();
    for (const auto& characteristic : m_characteristics) {
        characteristics.push_back(characteristic->toJson());
    }

    Json record = Json::object();
    record["iid"] = m_iid;
    record["type"] = m_type.toString();
    record["characteristics"] = characteristics;

    if (!m_linked.empty()) {
        record["linked"] = m_linked;
    }

    return record;
}

} // namespace hapdb
