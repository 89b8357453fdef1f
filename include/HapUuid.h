#pragma once

#include <string>
#include <cstdint>

namespace hapdb {

// "00000043-0000-1000-8000-0026BB765291"
//
// Type identifier for services and characteristics. The canonical form is the full, dashed, upper-case 128-bit UUID. Apple
// defined types share the HAP base suffix and are usually written in short form ("43" for the lightbulb service).
class HapUuid {
public:
    static constexpr const char* kHapBaseUuidSuffix = "-0000-1000-8000-0026BB765291";

    // Construct from a full or short string UUID
    //
    // The input is cleaned first (dashes and surrounding whitespace removed, upper-cased), then:
    //
    //     1 to 8 hex digits are treated as a short UUID and expanded onto the HAP base UUID
    //     32 hex digits are treated as a full 128-bit UUID
    //
    // Anything else throws std::invalid_argument.
    explicit HapUuid(const std::string& uuid);

    // Expand a short (up to 32-bit) value onto the HAP base UUID: "????????-0000-1000-8000-0026BB765291"
    static HapUuid fromShortUuid(uint32_t shortUuid);

    // True if `text` would be accepted by the string constructor
    static bool looksLikeUuid(const std::string& text);

    // Full, dashed, upper-case form
    const std::string& toString() const { return uuid; }

    // For HAP base UUIDs, the leading hex digits without zero padding ("43"); otherwise the full form
    std::string toShortString() const;

    // True if the UUID ends with the HAP base suffix
    bool isHapBase() const;

    bool operator<(const HapUuid& other) const;
    bool operator==(const HapUuid& other) const;
    bool operator!=(const HapUuid& other) const;

private:
    // Upper-case `str` and remove dashes and whitespace
    static std::string clean(const std::string& str);

    // Insert dashes at 8, 13, 18 and 23 into a 32-digit string
    static std::string dashify(const std::string& str);

    std::string uuid;
};

} // namespace hapdb
