#include "Accessories.h"
#include "HapError.h"
#include "Logger.h"
#include "Utils.h"

#include <stdexcept>

namespace hapdb {

Accessory& Accessories::addAccessory(std::unique_ptr<Accessory> accessory) {
    if (!accessory) {
        throw std::invalid_argument("Cannot add a null accessory");
    }
    m_accessories.push_back(std::move(accessory));
    return *m_accessories.back();
}

Accessory& Accessories::aid(uint64_t aid) const {
    Accessory* accessory = findAid(aid);
    if (!accessory) {
        throw NotFoundError("No accessory with aid " + std::to_string(aid));
    }
    return *accessory;
}

Accessory* Accessories::findAid(uint64_t aid) const {
    for (const auto& accessory : m_accessories) {
        if (accessory->getAid() == aid) {
            return accessory.get();
        }
    }
    return nullptr;
}

Accessory& Accessories::operator[](size_t index) const {
    return *m_accessories.at(index);
}

Json Accessories::serialize() const {
    Json list = Json::array();
    for (const auto& accessory : m_accessories) {
        list.push_back(accessory->toJson());
    }
    return list;
}

Json Accessories::toJson() const {
    Json document = Json::object();
    document["accessories"] = serialize();
    return document;
}

std::string Accessories::toJsonString(int indent) const {
    return toJson().dump(indent);
}

Accessories Accessories::fromList(const Json& accessories) {
    if (!accessories.is_array()) {
        throw MalformedRecordError(std::string("accessory list: expected an array, got ") + accessories.type_name());
    }

    Accessories result;
    for (const Json& record : accessories) {
        std::unique_ptr<Accessory> accessory = Accessory::fromJson(record);
        if (result.findAid(accessory->getAid())) {
            throw MalformedRecordError("accessory list: aid " + std::to_string(accessory->getAid()) +
                                       " appears more than once");
        }
        result.addAccessory(std::move(accessory));
    }

    Logger::info(SSTR << "Loaded " << result.size() << " accessories");
    return result;
}

Accessories Accessories::fromJson(const Json& document) {
    if (document.is_array()) {
        return fromList(document);
    }
    return fromList(RecordFields::requireArray(document, "accessories", "document"));
}

Accessories Accessories::fromString(const std::string& text) {
    Json document;
    try {
        document = Json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        Logger::error(SSTR << "Accessory document is not valid JSON: " << e.what());
        throw MalformedRecordError(std::string("Invalid JSON: ") + e.what());
    }
    return fromJson(document);
}

Accessories Accessories::fromFile(const std::string& path) {
    std::string content;
    std::string error;
    if (!Utils::readFile(path, content, error)) {
        throw MalformedRecordError("Cannot read " + path + ": " + error);
    }

    Logger::debug(SSTR << "Loading accessories from " << path);
    try {
        return fromString(content);
    } catch (const HapError& e) {
        Logger::error(SSTR << "Failed to load " << path << ": " << e.toString());
        throw;
    }
}

} // namespace hapdb
