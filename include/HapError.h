#pragma once

#include <stdexcept>
#include <string>
#include <glib.h>

namespace hapdb {

/**
 * @brief Base class for every failure raised by the accessory model
 *
 * Carries an error name (one of the ERROR_* constants) and a message. All
 * model failures are caller or input errors and are thrown synchronously.
 */
class HapError : public std::runtime_error {
public:
    // Error names
    static const char* ERROR_UNKNOWN_TYPE;
    static const char* ERROR_DUPLICATE_CHARACTERISTIC;
    static const char* ERROR_NOT_FOUND;
    static const char* ERROR_MALFORMED_RECORD;

    /**
     * @brief Create an error from a name and a message
     *
     * @param name Error name
     * @param message Error message
     */
    HapError(const std::string& name, const std::string& message);

    /**
     * @brief Create an error from a GLib error
     *
     * The GError domain is not kept; the caller supplies the name.
     *
     * @param name Error name
     * @param error GError pointer (ownership is not taken, may be null)
     */
    HapError(const std::string& name, const GError* error);

    const std::string& getName() const { return m_name; }
    const std::string& getMessage() const { return m_message; }

    /**
     * @brief "<name>: <message>"
     */
    std::string toString() const;

    bool isErrorType(const std::string& errorName) const;

private:
    std::string m_name;
    std::string m_message;
};

// Type name or UUID could not be resolved through the type registry
class UnknownTypeError : public HapError {
public:
    explicit UnknownTypeError(const std::string& message)
        : HapError(ERROR_UNKNOWN_TYPE, message) {}
};

// A service already owns a characteristic of the requested type
class DuplicateCharacteristicError : public HapError {
public:
    explicit DuplicateCharacteristicError(const std::string& message)
        : HapError(ERROR_DUPLICATE_CHARACTERISTIC, message) {}
};

// Identifier lookup miss, or a link target that does not resolve
class NotFoundError : public HapError {
public:
    explicit NotFoundError(const std::string& message)
        : HapError(ERROR_NOT_FOUND, message) {}
};

// Record or document that cannot be decoded
class MalformedRecordError : public HapError {
public:
    explicit MalformedRecordError(const std::string& message)
        : HapError(ERROR_MALFORMED_RECORD, message) {}

    explicit MalformedRecordError(const GError* error)
        : HapError(ERROR_MALFORMED_RECORD, error) {}
};

} // namespace hapdb
