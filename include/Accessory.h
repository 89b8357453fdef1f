#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "IdGenerator.h"
#include "RecordFields.h"
#include "Service.h"
#include "Services.h"

namespace hapdb {

/**
 * @brief One device in the accessory database
 *
 * The aid comes from an IdGenerator at construction and never changes. Services
 * and characteristics get iids from a private counter, so iids are unique
 * accessory-wide (services and characteristics share the counter).
 *
 * An accessory is not copyable or movable: services and characteristics keep
 * a reference to their owner. Hold it through std::unique_ptr.
 */
class Accessory {
public:
    // Takes the aid from the process-wide generator
    Accessory();

    explicit Accessory(IdGenerator& generator);

    virtual ~Accessory();

    // Accessory with an accessory-information service (identify, name, manufacturer, model, serial number, firmware revision)
    static std::unique_ptr<Accessory> createWithInfo(const std::string& name,
                                                     const std::string& manufacturer,
                                                     const std::string& model,
                                                     const std::string& serialNumber,
                                                     const std::string& firmwareRevision);

    /**
     * @brief Rebuild an accessory from its wire record
     *
     * Identifiers are taken verbatim from the record. Links are resolved in a
     * second pass so a service may link to one that appears later. Afterwards
     * the iid counter continues past the largest stored iid.
     *
     * @throws MalformedRecordError on missing or mistyped mandatory fields, or duplicate iids
     * @throws NotFoundError when a linked iid is not a service of this accessory
     */
    static std::unique_ptr<Accessory> fromJson(const Json& record);

    uint64_t getAid() const { return m_aid; }

    // Next accessory-scoped iid
    uint64_t getNextId();

    // Last iid handed out (0 before the first)
    uint64_t getLastId() const { return m_nextId; }

    /**
     * @brief Create a service with the next iid
     *
     * A name is kept as the service's display hint and also written into its
     * Name characteristic. With addRequired the registry's required
     * characteristics for the type are created first.
     *
     * @throws UnknownTypeError when `type` does not resolve
     */
    Service& addService(const std::string& type,
                        const std::optional<std::string>& name = std::nullopt,
                        bool addRequired = false);

    Services& services() { return m_services; }
    const Services& services() const { return m_services; }

    // Searches every service; nullptr when absent
    Characteristic* characteristicByIid(uint64_t iid) const;

    // {aid, services: [...]}
    Json toJson() const;

private:
    struct RestoreTag {};
    Accessory(uint64_t aid, RestoreTag);

    uint64_t m_aid;
    uint64_t m_nextId = 0;
    Services m_services;

    Accessory(const Accessory&) = delete;
    Accessory& operator=(const Accessory&) = delete;
};

} // namespace hapdb
