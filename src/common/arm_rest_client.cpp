#include "common/arm_rest_client.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <curl/curl.h>
#include <stdexcept>

namespace {

std::string stripTrailingSlash(const std::string& url) {
    std::string result = url;
    while (!result.empty() && result.back() == '/') {
        result.pop_back();
    }
    return result;
}

} // namespace

ArmRestClient::ArmRestClient(const std::string& managementEndpoint, const std::string& authorityHost)
    : managementEndpoint_(stripTrailingSlash(managementEndpoint)),
      authorityHost_(stripTrailingSlash(authorityHost)),
      curl_(nullptr), isLoggedIn_(false), lastHttpCode_(0) {
    Logger::debug("Initializing ArmRestClient for endpoint: " + managementEndpoint_);

    curl_global_init(CURL_GLOBAL_ALL);
    curl_ = curl_easy_init();
    if (!curl_) {
        Logger::error("Failed to initialize CURL");
        throw std::runtime_error("Failed to initialize CURL");
    }

    curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl_, CURLOPT_CONNECTTIMEOUT, 30L);
    curl_easy_setopt(curl_, CURLOPT_TIMEOUT, 300L);
    curl_easy_setopt(curl_, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl_, CURLOPT_TCP_KEEPIDLE, 60L);
    curl_easy_setopt(curl_, CURLOPT_TCP_KEEPINTVL, 30L);

    Logger::debug("CURL options configured: connection timeout 30s, operation timeout 300s");
}

ArmRestClient::~ArmRestClient() {
    if (curl_) {
        curl_easy_cleanup(curl_);
    }
    curl_global_cleanup();
}

bool ArmRestClient::loginWithClientSecret(const std::string& tenantId, const std::string& clientId,
                                          const std::string& clientSecret) {
    Logger::debug("Requesting access token for tenant " + tenantId + ", client " + clientId +
                  ", secret [REDACTED]");

    std::string url = authorityHost_ + "/" + utils::urlEncode(tenantId) + "/oauth2/v2.0/token";
    std::string postData = "grant_type=client_credentials"
                           "&client_id=" + utils::urlEncode(clientId) +
                           "&client_secret=" + utils::urlEncode(clientSecret) +
                           "&scope=" + utils::urlEncode(managementEndpoint_ + "/.default");

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/x-www-form-urlencoded");
    headers = curl_slist_append(headers, "Accept: application/json");

    std::string responseData;
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, nullptr);
    curl_easy_setopt(curl_, CURLOPT_POST, 1L);
    curl_easy_setopt(curl_, CURLOPT_COPYPOSTFIELDS, postData.c_str());
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &responseData);

    CURLcode res = curl_easy_perform(curl_);
    lastHttpCode_ = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &lastHttpCode_);
    curl_slist_free_all(headers);

    if (res != CURLE_OK) {
        lastError_ = "Token request failed: " + std::string(curl_easy_strerror(res));
        Logger::error(lastError_);
        return false;
    }

    if (lastHttpCode_ != 200) {
        lastError_ = "Token request failed: " + extractErrorMessage(responseData, lastHttpCode_);
        Logger::error(lastError_);
        return false;
    }

    try {
        nlohmann::json response = nlohmann::json::parse(responseData);
        if (!response.contains("access_token") || !response["access_token"].is_string()) {
            lastError_ = "Token response does not contain access_token";
            Logger::error(lastError_);
            return false;
        }
        accessToken_ = response["access_token"].get<std::string>();
        isLoggedIn_ = true;
        Logger::debug("Obtained access token, length: " + std::to_string(accessToken_.length()));
        return true;
    } catch (const nlohmann::json::parse_error& e) {
        lastError_ = "Failed to parse token response: " + std::string(e.what());
        Logger::error(lastError_);
        return false;
    }
}

void ArmRestClient::setAccessToken(const std::string& accessToken) {
    accessToken_ = accessToken;
    isLoggedIn_ = !accessToken_.empty();
    Logger::debug("Using pre-acquired access token [REDACTED]");
}

bool ArmRestClient::isLoggedIn() const {
    return isLoggedIn_;
}

std::string ArmRestClient::getLastError() const {
    return lastError_;
}

long ArmRestClient::getLastHttpCode() const {
    return lastHttpCode_;
}

bool ArmRestClient::listSubscriptions(nlohmann::json& subscriptions) {
    return getPaged(buildUrl("/subscriptions", kSubscriptionsApiVersion), subscriptions);
}

bool ArmRestClient::getSubscription(const std::string& subscriptionId, nlohmann::json& subscription) {
    return makeRequest("GET", buildUrl("/subscriptions/" + utils::urlEncode(subscriptionId),
                                       kSubscriptionsApiVersion),
                       nlohmann::json(), subscription);
}

bool ArmRestClient::listVirtualMachines(const std::string& subscriptionId, nlohmann::json& vms) {
    return getPaged(buildUrl("/subscriptions/" + utils::urlEncode(subscriptionId) +
                             "/providers/Microsoft.Compute/virtualMachines",
                             kComputeApiVersion),
                    vms);
}

bool ArmRestClient::getDisk(const std::string& subscriptionId, const std::string& resourceGroup,
                            const std::string& diskName, nlohmann::json& disk) {
    std::string path = "/subscriptions/" + utils::urlEncode(subscriptionId) +
                       "/resourceGroups/" + utils::urlEncode(resourceGroup) +
                       "/providers/Microsoft.Compute/disks/" + utils::urlEncode(diskName);
    return makeRequest("GET", buildUrl(path, kDiskApiVersion), nlohmann::json(), disk);
}

bool ArmRestClient::putSnapshot(const std::string& subscriptionId, const std::string& resourceGroup,
                                const std::string& snapshotName, const nlohmann::json& body,
                                nlohmann::json& response) {
    return makeRequest("PUT", buildUrl(snapshotPath(subscriptionId, resourceGroup, snapshotName),
                                       kDiskApiVersion),
                       body, response);
}

bool ArmRestClient::getSnapshot(const std::string& subscriptionId, const std::string& resourceGroup,
                                const std::string& snapshotName, nlohmann::json& snapshot) {
    return makeRequest("GET", buildUrl(snapshotPath(subscriptionId, resourceGroup, snapshotName),
                                       kDiskApiVersion),
                       nlohmann::json(), snapshot);
}

std::string ArmRestClient::extractErrorMessage(const std::string& body, long httpCode) {
    try {
        nlohmann::json parsed = nlohmann::json::parse(body);
        if (parsed.contains("error")) {
            const auto& error = parsed["error"];
            if (error.is_object() && error.contains("message") && error["message"].is_string()) {
                return error["message"].get<std::string>();
            }
        }
        // Token endpoint errors
        if (parsed.contains("error_description") && parsed["error_description"].is_string()) {
            return parsed["error_description"].get<std::string>();
        }
    } catch (const nlohmann::json::parse_error&) {
        // Not JSON; fall through to the status code
    }
    return "HTTP " + std::to_string(httpCode);
}

bool ArmRestClient::makeRequest(const std::string& method, const std::string& url,
                                const nlohmann::json& data, nlohmann::json& response) {
    if (!curl_) {
        lastError_ = "CURL not initialized";
        Logger::error(lastError_);
        return false;
    }
    if (!isLoggedIn_) {
        lastError_ = "Not authenticated";
        Logger::error(lastError_);
        return false;
    }

    Logger::debug("Making " + method + " request to: " + url);

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    headers = curl_slist_append(headers, "Accept: application/json");
    std::string authHeader = "Authorization: Bearer " + accessToken_;
    headers = curl_slist_append(headers, authHeader.c_str());

    std::string responseData;
    curl_easy_setopt(curl_, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &responseData);

    if (method == "GET") {
        curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, nullptr);
        curl_easy_setopt(curl_, CURLOPT_HTTPGET, 1L);
    } else {
        std::string body = data.is_null() ? std::string() : data.dump();
        if (!body.empty()) {
            Logger::debug("Request body: " + body);
        }
        curl_easy_setopt(curl_, CURLOPT_COPYPOSTFIELDS, body.c_str());
        curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, method.c_str());
    }

    CURLcode res = curl_easy_perform(curl_);
    lastHttpCode_ = 0;
    curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &lastHttpCode_);
    curl_slist_free_all(headers);

    if (res != CURLE_OK) {
        lastError_ = std::string(curl_easy_strerror(res));
        Logger::error("Request failed: " + lastError_);
        return false;
    }

    Logger::debug("Response code: " + std::to_string(lastHttpCode_));

    if (lastHttpCode_ < 200 || lastHttpCode_ >= 300) {
        lastError_ = extractErrorMessage(responseData, lastHttpCode_);
        Logger::debug("Request failed with status code " + std::to_string(lastHttpCode_) +
                      ": " + responseData);
        return false;
    }

    if (responseData.empty()) {
        response = nlohmann::json::object();
        return true;
    }

    try {
        response = nlohmann::json::parse(responseData);
        return true;
    } catch (const nlohmann::json::parse_error& e) {
        lastError_ = "Failed to parse response: " + std::string(e.what());
        Logger::error(lastError_);
        return false;
    }
}

bool ArmRestClient::getPaged(const std::string& url, nlohmann::json& items) {
    items = nlohmann::json::array();
    std::string nextUrl = url;

    while (!nextUrl.empty()) {
        nlohmann::json page;
        if (!makeRequest("GET", nextUrl, nlohmann::json(), page)) {
            return false;
        }

        if (page.contains("value") && page["value"].is_array()) {
            for (const auto& item : page["value"]) {
                items.push_back(item);
            }
        }

        nextUrl.clear();
        if (page.contains("nextLink") && page["nextLink"].is_string()) {
            nextUrl = page["nextLink"].get<std::string>();
        }
    }
    return true;
}

std::string ArmRestClient::buildUrl(const std::string& path, const std::string& apiVersion) const {
    return managementEndpoint_ + path + "?api-version=" + apiVersion;
}

std::string ArmRestClient::snapshotPath(const std::string& subscriptionId, const std::string& resourceGroup,
                                        const std::string& snapshotName) const {
    return "/subscriptions/" + utils::urlEncode(subscriptionId) +
           "/resourceGroups/" + utils::urlEncode(resourceGroup) +
           "/providers/Microsoft.Compute/snapshots/" + utils::urlEncode(snapshotName);
}

size_t ArmRestClient::writeCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t realsize = size * nmemb;
    userp->append(static_cast<char*>(contents), realsize);
    return realsize;
}
