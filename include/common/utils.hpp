#pragma once

#include <string>
#include <chrono>
#include <curl/curl.h>

namespace utils {

inline std::string urlEncode(const std::string& str) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return str;
    }

    char* encoded = curl_easy_escape(curl, str.c_str(), static_cast<int>(str.length()));
    if (!encoded) {
        curl_easy_cleanup(curl);
        return str;
    }
    std::string result(encoded);
    curl_free(encoded);
    curl_easy_cleanup(curl);
    return result;
}

// Strips leading and trailing whitespace
std::string trim(const std::string& str);

std::string toLower(const std::string& str);

// 8-4-4-4-12 hexadecimal groups, either case
bool isCanonicalUuid(const std::string& str);

// "YYYY-MM-DD HH:MM:SS" in local time
std::string formatTimestamp(std::chrono::system_clock::time_point time);

// "YYYYMMDD_HHMMSS" in local time, for file names
std::string formatFileTimestamp(std::chrono::system_clock::time_point time);

// Extracts the resource group segment from an ARM resource id, empty if absent
std::string resourceGroupFromId(const std::string& resourceId);

} // namespace utils
