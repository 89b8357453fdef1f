#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "CharacteristicTypes.h"
#include "Service.h"

namespace hapdb {

class Accessory;

/**
 * @brief Predicates for Services::filter and Services::first
 *
 * Every member is optional and the set predicates are combined with AND.
 */
struct ServiceFilter {
    // Service type name or UUID, resolved through the type registry
    std::optional<std::string> serviceType;

    // Characteristic type name -> required current value. A service without
    // the characteristic, or without a value, does not match.
    std::vector<std::pair<std::string, CharacteristicValue>> characteristics;

    // Match services that `parentService` links to
    const Service* parentService = nullptr;

    // Match services that link to `childService`
    const Service* childService = nullptr;
};

/**
 * @brief Ordered services of one accessory
 */
class Services {
public:
    using Container = std::vector<std::unique_ptr<Service>>;
    using const_iterator = Container::const_iterator;

    explicit Services(const Accessory& accessory);

    // Service with this iid; NotFoundError when none
    Service& iid(uint64_t iid) const;

    // nullptr when none
    Service* findIid(uint64_t iid) const;

    // Matches in insertion order; an empty result is not an error
    std::vector<Service*> filter(const ServiceFilter& criteria = {}) const;

    // First match, or nullptr
    Service* first(const ServiceFilter& criteria = {}) const;

    const_iterator begin() const { return m_services.begin(); }
    const_iterator end() const { return m_services.end(); }
    size_t size() const { return m_services.size(); }
    bool empty() const { return m_services.empty(); }

    Service& append(std::unique_ptr<Service> service);

private:
    const Accessory& m_accessory;
    Container m_services;
};

} // namespace hapdb
