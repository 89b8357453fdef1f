#include <algorithm>
#include <cctype>
#include "Utils.h"
#include "GLibTypes.h"
#include "Logger.h"

namespace hapdb {

// ---------------------------------------------------------------------------------------------------------------------------------
// String utility functions
// ---------------------------------------------------------------------------------------------------------------------------------

// Trim from start (in place)
void Utils::trimBeginInPlace(std::string &str) {
    str.erase(str.begin(), std::find_if(str.begin(), str.end(),
    [](unsigned char ch) {
        return !std::isspace(ch);
    }));
}

// Trim from end (in place)
void Utils::trimEndInPlace(std::string &str) {
    str.erase(std::find_if(str.rbegin(), str.rend(),
    [](unsigned char ch) {
        return !std::isspace(ch);
    }).base(), str.end());
}

// Trim from both ends (in place)
void Utils::trimInPlace(std::string &str) {
    trimBeginInPlace(str);
    trimEndInPlace(str);
}

// Trim from both ends (copying)
std::string Utils::trim(const std::string &str) {
    std::string out = str;
    trimInPlace(out);
    return out;
}

std::string Utils::toUpper(const std::string &str) {
    std::string out = str;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

std::string Utils::toLower(const std::string &str) {
    std::string out = str;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool Utils::isHexString(const std::string &str) {
    if (str.empty()) {
        return false;
    }
    return std::all_of(str.begin(), str.end(),
                       [](unsigned char c) { return std::isxdigit(c) != 0; });
}

// ---------------------------------------------------------------------------------------------------------------------------------
// File operations
// ---------------------------------------------------------------------------------------------------------------------------------

bool Utils::readFile(const std::string &filename, std::string &content, std::string &error) {
    gchar* rawContents = nullptr;
    gsize length = 0;
    GError* rawError = nullptr;

    if (!g_file_get_contents(filename.c_str(), &rawContents, &length, &rawError)) {
        GErrorPtr gerror = makeGErrorPtr(rawError);
        error = gerror && gerror->message ? gerror->message : "Unknown error reading " + filename;
        Logger::error(SSTR << "Failed to read file '" << filename << "': " << error);
        return false;
    }

    GCharPtr contents = makeGCharPtr(rawContents);
    content.assign(contents.get(), length);
    Logger::debug(SSTR << "Read " << length << " bytes from " << filename);
    return true;
}

} // namespace hapdb
