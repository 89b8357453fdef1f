#include "Accessory.h"
#include "HapError.h"
#include "Logger.h"
#include "TypeRegistry.h"

#include <set>

namespace hapdb {

namespace {

const HapUuid& nameCharacteristicType() {
    static const HapUuid type = HapUuid::fromShortUuid(0x23);
    return type;
}

// Tracks iids of one accessory record while it is decoded
class IidLedger {
public:
    explicit IidLedger(uint64_t aid) : m_aid(aid) {}

    void claim(uint64_t iid, const std::string& context) {
        if (!m_seen.insert(iid).second) {
            throw MalformedRecordError(context + ": iid " + std::to_string(iid) +
                                       " is used twice in accessory aid " + std::to_string(m_aid));
        }
        if (iid > m_max) {
            m_max = iid;
        }
    }

    uint64_t max() const { return m_max; }

private:
    uint64_t m_aid;
    uint64_t m_max = 0;
    std::set<uint64_t> m_seen;
};

} // namespace

Accessory::Accessory()
    : m_aid(IdGenerator::global()->nextId()),
      m_services(*this) {
    Logger::debug(SSTR << "Created accessory aid " << m_aid);
}

Accessory::Accessory(IdGenerator& generator)
    : m_aid(generator.nextId()),
      m_services(*this) {
    Logger::debug(SSTR << "Created accessory aid " << m_aid);
}

Accessory::Accessory(uint64_t aid, RestoreTag)
    : m_aid(aid),
      m_services(*this) {
}

Accessory::~Accessory() {
}

std::unique_ptr<Accessory> Accessory::createWithInfo(const std::string& name,
                                                     const std::string& manufacturer,
                                                     const std::string& model,
                                                     const std::string& serialNumber,
                                                     const std::string& firmwareRevision) {
    auto accessory = std::make_unique<Accessory>();

    Service& info = accessory->addService("accessory-information");

    CharacteristicOptions identify;
    identify.description = "Identify";
    info.addCharacteristic("identify", identify);

    auto withValue = [](const std::string& value) {
        CharacteristicOptions options;
        options.value = CharacteristicValue(value);
        return options;
    };

    info.addCharacteristic("name", withValue(name));
    info.addCharacteristic("manufacturer", withValue(manufacturer));
    info.addCharacteristic("model", withValue(model));
    info.addCharacteristic("serial-number", withValue(serialNumber));
    info.addCharacteristic("firmware.revision", withValue(firmwareRevision));
    info.restoreName();

    return accessory;
}

uint64_t Accessory::getNextId() {
    return ++m_nextId;
}

Service& Accessory::addService(const std::string& type, const std::optional<std::string>& name, bool addRequired) {
    std::shared_ptr<TypeRegistry> registry = TypeRegistry::instance();
    HapUuid uuid = registry->resolveService(type);

    auto service = std::make_unique<Service>(*this, uuid, getNextId(), name);

    if (addRequired) {
        for (const HapUuid& required : registry->requiredCharacteristics(uuid)) {
            service->insertCharacteristic(required, {}, getNextId(), true);
        }
    }

    if (name) {
        Characteristic* nameCharacteristic = service->findCharacteristic(nameCharacteristicType());
        if (nameCharacteristic) {
            nameCharacteristic->setValue(CharacteristicValue(*name));
        } else {
            CharacteristicOptions options;
            options.perms = CharacteristicPermissions{ CharacteristicPermission::PAIRED_READ };
            options.format = CharacteristicFormat::STRING;
            options.value = CharacteristicValue(*name);
            service->insertCharacteristic(nameCharacteristicType(), options, getNextId(), true);
        }
    }

    Logger::debug(SSTR << "Added service " << uuid.toShortString() << " iid " << service->getIid()
                       << " to accessory aid " << m_aid);

    return m_services.append(std::move(service));
}

Characteristic* Accessory::characteristicByIid(uint64_t iid) const {
    for (const auto& service : m_services) {
        if (Characteristic* characteristic = service->characteristicByIid(iid)) {
            return characteristic;
        }
    }
    return nullptr;
}

Json Accessory::toJson() const {
    Json services = Json::array();
    for (const auto& service : m_services) {
        services.push_back(service->toJson());
    }

    Json record = Json::object();
    record["aid"] = m_aid;
    record["services"] = services;
    return record;
}

std::unique_ptr<Accessory> Accessory::fromJson(const Json& record) {
    std::shared_ptr<TypeRegistry> registry = TypeRegistry::instance();

    uint64_t aid = RecordFields::requireUnsigned(record, "aid", "accessory");
    const std::string context = "accessory aid " + std::to_string(aid);

    std::unique_ptr<Accessory> accessory(new Accessory(aid, RestoreTag{}));
    IidLedger ledger(aid);

    const Json& serviceRecords = RecordFields::requireArray(record, "services", context);

    // First pass: services and characteristics, identifiers verbatim
    size_t serviceIndex = 0;
    for (const Json& serviceRecord : serviceRecords) {
        const std::string serviceContext = context + " service[" + std::to_string(serviceIndex++) + "]";

        uint64_t iid = RecordFields::requireUnsigned(serviceRecord, "iid", serviceContext);
        HapUuid type = registry->resolveService(RecordFields::requireString(serviceRecord, "type", serviceContext));
        ledger.claim(iid, serviceContext);

        auto service = std::make_unique<Service>(*accessory, type, iid, std::nullopt);

        const Json& characteristicRecords = RecordFields::requireArray(serviceRecord, "characteristics", serviceContext);
        size_t characteristicIndex = 0;
        for (const Json& characteristicRecord : characteristicRecords) {
            const std::string characteristicContext =
                serviceContext + " characteristic[" + std::to_string(characteristicIndex++) + "]";

            uint64_t characteristicIid = RecordFields::requireUnsigned(characteristicRecord, "iid", characteristicContext);
            HapUuid characteristicType = registry->resolveCharacteristic(
                RecordFields::requireString(characteristicRecord, "type", characteristicContext));
            CharacteristicOptions options = Characteristic::optionsFromJson(characteristicRecord, characteristicContext);

            ledger.claim(characteristicIid, characteristicContext);
            service->insertCharacteristic(characteristicType, options, characteristicIid, false);
        }

        service->restoreName();
        accessory->m_services.append(std::move(service));
    }

    // Second pass: links, which may point at services decoded after their source
    serviceIndex = 0;
    for (const Json& serviceRecord : serviceRecords) {
        const std::string serviceContext = context + " service[" + std::to_string(serviceIndex++) + "]";

        const Json* linked = RecordFields::optionalArray(serviceRecord, "linked", serviceContext);
        if (!linked) {
            continue;
        }

        Service& source = accessory->m_services.iid(RecordFields::requireUnsigned(serviceRecord, "iid", serviceContext));
        for (const Json& linkedIid : *linked) {
            Service& target = accessory->m_services.iid(RecordFields::toUnsigned(linkedIid, serviceContext + ".linked"));
            source.linkIid(target.getIid());
        }
    }

    // Continue numbering past every stored iid
    accessory->m_nextId = ledger.max();

    Logger::debug(SSTR << "Decoded accessory aid " << aid << " with " << accessory->m_services.size() << " services");
    return accessory;
}

} // namespace hapdb
