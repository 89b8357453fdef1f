#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "Accessory.h"
#include "RecordFields.h"

namespace hapdb {

/**
 * @brief Root of the accessory database: an ordered set of accessories
 */
class Accessories {
public:
    using Container = std::vector<std::unique_ptr<Accessory>>;
    using const_iterator = Container::const_iterator;

    Accessories() = default;

    Accessory& addAccessory(std::unique_ptr<Accessory> accessory);

    // Accessory with this aid; NotFoundError when none
    Accessory& aid(uint64_t aid) const;

    // nullptr when none
    Accessory* findAid(uint64_t aid) const;

    // By position; std::out_of_range past the end
    Accessory& operator[](size_t index) const;

    const_iterator begin() const { return m_accessories.begin(); }
    const_iterator end() const { return m_accessories.end(); }
    size_t size() const { return m_accessories.size(); }
    bool empty() const { return m_accessories.empty(); }

    // [accessory, ...]
    Json serialize() const;

    // {"accessories": [...]}
    Json toJson() const;
    std::string toJsonString(int indent = -1) const;

    //
    // Loading. Any error aborts the whole load; nothing is returned partially.
    //

    // From a list of accessory records
    static Accessories fromList(const Json& accessories);

    // From {"accessories": [...]} or a bare list
    static Accessories fromJson(const Json& document);

    // From JSON text; MalformedRecordError on a parse error
    static Accessories fromString(const std::string& text);

    // From a file; MalformedRecordError when the file cannot be read or parsed
    static Accessories fromFile(const std::string& path);

private:
    Container m_accessories;
};

} // namespace hapdb
