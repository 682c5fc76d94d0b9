#pragma once

#include <cctype>
#include <cmath>
#include <cstdint>
#include <string>

namespace matchbook::json {

// Simple JSON value extraction (no external dependencies)
// This is intentionally minimal - handles only flat key-value pairs

// Position of the first character of the value for key, or npos
inline size_t findValue(const std::string& json, const std::string& key)
{
    std::string searchKey = "\"" + key + "\"";
    auto keyPos = json.find(searchKey);
    if (keyPos == std::string::npos)
        return std::string::npos;

    auto colonPos = json.find(':', keyPos + searchKey.size());
    if (colonPos == std::string::npos)
        return std::string::npos;

    auto valueStart = colonPos + 1;
    while (valueStart < json.size() && std::isspace(static_cast<unsigned char>(json[valueStart])))
        ++valueStart;

    return valueStart < json.size() ? valueStart : std::string::npos;
}

inline bool hasKey(const std::string& json, const std::string& key)
{
    return findValue(json, key) != std::string::npos;
}

inline std::string extractString(const std::string& json, const std::string& key)
{
    auto valueStart = findValue(json, key);
    if (valueStart == std::string::npos || json[valueStart] != '"')
        return "";

    auto endQuote = json.find('"', valueStart + 1);
    if (endQuote == std::string::npos)
        return "";

    return json.substr(valueStart + 1, endQuote - valueStart - 1);
}

// Raw numeric token for key ("" if absent)
inline std::string extractNumber(const std::string& json, const std::string& key)
{
    auto valueStart = findValue(json, key);
    if (valueStart == std::string::npos)
        return "";

    std::string numStr;
    while (valueStart < json.size() &&
           (std::isdigit(static_cast<unsigned char>(json[valueStart])) || json[valueStart] == '.' ||
            json[valueStart] == '-')) {
        numStr += json[valueStart];
        ++valueStart;
    }
    return numStr;
}

inline int64_t extractInt(const std::string& json, const std::string& key, int64_t fallback = 0)
{
    std::string numStr = extractNumber(json, key);
    if (numStr.empty())
        return fallback;

    if (numStr.find('.') != std::string::npos)
        return static_cast<int64_t>(std::stod(numStr));

    return std::stoll(numStr);
}

// Extract a decimal value using a custom multiplier for fixed point conversion
inline int64_t extractFixedPoint(const std::string& json, const std::string& key, int64_t multiplier,
                                 int64_t fallback = 0)
{
    std::string numStr = extractNumber(json, key);
    if (numStr.empty())
        return fallback;

    return static_cast<int64_t>(std::llround(std::stod(numStr) * static_cast<double>(multiplier)));
}

inline bool extractBool(const std::string& json, const std::string& key, bool fallback = false)
{
    auto valueStart = findValue(json, key);
    if (valueStart == std::string::npos)
        return fallback;

    if (json.compare(valueStart, 4, "true") == 0)
        return true;
    if (json.compare(valueStart, 5, "false") == 0)
        return false;
    return fallback;
}

} // namespace matchbook::json
