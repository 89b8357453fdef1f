#pragma once

#include <string>

namespace hapdb {

struct Utils {
    // -----------------------------------------------------------------------------------------------------------------------------
    // String utility functions
    // -----------------------------------------------------------------------------------------------------------------------------

    // Trim from start (in place)
    static void trimBeginInPlace(std::string &str);

    // Trim from end (in place)
    static void trimEndInPlace(std::string &str);

    // Trim from both ends (in place)
    static void trimInPlace(std::string &str);

    // Trim from both ends (copying)
    static std::string trim(const std::string &str);

    // ASCII case conversion (copying)
    static std::string toUpper(const std::string &str);
    static std::string toLower(const std::string &str);

    // True if `str` is non-empty and contains only hex digits
    static bool isHexString(const std::string &str);

    // -----------------------------------------------------------------------------------------------------------------------------
    // File operations
    // -----------------------------------------------------------------------------------------------------------------------------

    // Reads the whole file into `content`. On failure returns false and fills `error` with the GLib error text.
    static bool readFile(const std::string &filename, std::string &content, std::string &error);
};

} // namespace hapdb
