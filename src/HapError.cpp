#include "HapError.h"

namespace hapdb {

const char* HapError::ERROR_UNKNOWN_TYPE = "hapdb.Error.UnknownType";
const char* HapError::ERROR_DUPLICATE_CHARACTERISTIC = "hapdb.Error.DuplicateCharacteristic";
const char* HapError::ERROR_NOT_FOUND = "hapdb.Error.NotFound";
const char* HapError::ERROR_MALFORMED_RECORD = "hapdb.Error.MalformedRecord";

HapError::HapError(const std::string& name, const std::string& message)
    : std::runtime_error(name + ": " + message),
      m_name(name),
      m_message(message) {
}

HapError::HapError(const std::string& name, const GError* error)
    : HapError(name, error && error->message ? std::string(error->message) : std::string("Null error pointer")) {
}

std::string HapError::toString() const {
    return m_name + ": " + m_message;
}

bool HapError::isErrorType(const std::string& errorName) const {
    return m_name == errorName;
}

} // namespace hapdb
