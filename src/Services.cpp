#include "Services.h"
#include "Accessory.h"
#include "HapError.h"
#include "Logger.h"
#include "TypeRegistry.h"

namespace hapdb {

namespace {

struct ResolvedCharacteristic {
    HapUuid type;
    CharacteristicValue value;
};

bool matchesCharacteristics(const Service& service, const std::vector<ResolvedCharacteristic>& wanted) {
    for (const auto& entry : wanted) {
        const Characteristic* characteristic = service.findCharacteristic(entry.type);
        if (!characteristic || !characteristic->getValue()) {
            return false;
        }
        if (!valuesEqual(*characteristic->getValue(), entry.value)) {
            return false;
        }
    }
    return true;
}

} // namespace

Services::Services(const Accessory& accessory)
    : m_accessory(accessory) {
}

Service& Services::iid(uint64_t iid) const {
    Service* service = findIid(iid);
    if (!service) {
        throw NotFoundError("No service with iid " + std::to_string(iid) + " in accessory aid " +
                            std::to_string(m_accessory.getAid()));
    }
    return *service;
}

Service* Services::findIid(uint64_t iid) const {
    for (const auto& service : m_services) {
        if (service->getIid() == iid) {
            return service.get();
        }
    }
    return nullptr;
}

std::vector<Service*> Services::filter(const ServiceFilter& criteria) const {
    std::shared_ptr<TypeRegistry> registry = TypeRegistry::instance();

    // Resolve names once; an unknown name is a caller error and propagates
    std::optional<HapUuid> serviceType;
    if (criteria.serviceType) {
        serviceType = registry->resolveService(*criteria.serviceType);
    }

    std::vector<ResolvedCharacteristic> wanted;
    for (const auto& entry : criteria.characteristics) {
        wanted.push_back({ registry->resolveCharacteristic(entry.first), entry.second });
    }

    std::vector<Service*> matches;
    for (const auto& service : m_services) {
        if (serviceType && service->getType() != *serviceType) {
            continue;
        }
        if (!matchesCharacteristics(*service, wanted)) {
            continue;
        }
        if (criteria.parentService && !criteria.parentService->isLinkedTo(*service)) {
            continue;
        }
        if (criteria.childService && !service->isLinkedTo(*criteria.childService)) {
            continue;
        }
        matches.push_back(service.get());
    }

    return matches;
}

Service* Services::first(const ServiceFilter& criteria) const {
    std::vector<Service*> matches = filter(criteria);
    return matches.empty() ? nullptr : matches.front();
}

Service& Services::append(std::unique_ptr<Service> service) {
    m_services.push_back(std::move(service));
    return *m_services.back();
}

} // namespace hapdb
