#include "HapUuid.h"
#include "Utils.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace hapdb {

HapUuid::HapUuid(const std::string& uuid) {
    std::string cleaned = clean(uuid);

    if (!Utils::isHexString(cleaned)) {
        throw std::invalid_argument("Invalid UUID format: " + uuid);
    }

    if (cleaned.length() <= 8) {
        // Short form, left pad to 8 digits
        cleaned = std::string(8 - cleaned.length(), '0') + cleaned;
        this->uuid = cleaned + kHapBaseUuidSuffix;
    } else if (cleaned.length() == 32) {
        this->uuid = dashify(cleaned);
    } else {
        throw std::invalid_argument("Invalid UUID format: " + uuid);
    }
}

HapUuid HapUuid::fromShortUuid(uint32_t shortUuid) {
    char buffer[9];
    snprintf(buffer, sizeof(buffer), "%08X", shortUuid);
    return HapUuid(buffer);
}

bool HapUuid::looksLikeUuid(const std::string& text) {
    std::string cleaned = clean(text);
    if (!Utils::isHexString(cleaned)) {
        return false;
    }
    return cleaned.length() <= 8 || cleaned.length() == 32;
}

std::string HapUuid::toShortString() const {
    if (!isHapBase()) {
        return uuid;
    }

    std::string prefix = uuid.substr(0, 8);
    size_t firstNonZero = prefix.find_first_not_of('0');
    if (firstNonZero == std::string::npos) {
        return "0";
    }
    return prefix.substr(firstNonZero);
}

bool HapUuid::isHapBase() const {
    return uuid.size() == 36 && uuid.compare(8, std::string::npos, kHapBaseUuidSuffix) == 0;
}

std::string HapUuid::clean(const std::string& str) {
    std::string cleaned = Utils::toUpper(Utils::trim(str));
    cleaned.erase(std::remove(cleaned.begin(), cleaned.end(), '-'), cleaned.end());
    return cleaned;
}

std::string HapUuid::dashify(const std::string& str) {
    std::string dashed = str;
    dashed.insert(8, 1, '-');
    dashed.insert(13, 1, '-');
    dashed.insert(18, 1, '-');
    dashed.insert(23, 1, '-');
    return dashed;
}

bool HapUuid::operator<(const HapUuid& other) const {
    return uuid < other.uuid;
}

bool HapUuid::operator==(const HapUuid& other) const {
    return uuid == other.uuid;
}

bool HapUuid::operator!=(const HapUuid& other) const {
    return uuid != other.uuid;
}

} // namespace hapdb
