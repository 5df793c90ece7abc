#pragma once

#include <string>
#include <vector>
#include <memory>
#include <curl/curl.h>
#include <nlohmann/json.hpp>
#include "common/logger.hpp"

// API versions used against the Resource Manager
inline constexpr const char* kSubscriptionsApiVersion = "2022-12-01";
inline constexpr const char* kComputeApiVersion = "2024-03-01";
inline constexpr const char* kDiskApiVersion = "2023-10-02";

class ArmRestClient {
public:
    ArmRestClient(const std::string& managementEndpoint, const std::string& authorityHost);
    virtual ~ArmRestClient();

    ArmRestClient(const ArmRestClient&) = delete;
    ArmRestClient& operator=(const ArmRestClient&) = delete;

    // Authentication
    virtual bool loginWithClientSecret(const std::string& tenantId, const std::string& clientId,
                                       const std::string& clientSecret);
    virtual void setAccessToken(const std::string& accessToken);
    virtual bool isLoggedIn() const;
    virtual std::string getLastError() const;
    virtual long getLastHttpCode() const;

    // Subscription operations
    virtual bool listSubscriptions(nlohmann::json& subscriptions);
    virtual bool getSubscription(const std::string& subscriptionId, nlohmann::json& subscription);

    // Compute operations
    virtual bool listVirtualMachines(const std::string& subscriptionId, nlohmann::json& vms);
    virtual bool getDisk(const std::string& subscriptionId, const std::string& resourceGroup,
                 const std::string& diskName, nlohmann::json& disk);
    virtual bool putSnapshot(const std::string& subscriptionId, const std::string& resourceGroup,
                     const std::string& snapshotName, const nlohmann::json& body,
                     nlohmann::json& response);
    virtual bool getSnapshot(const std::string& subscriptionId, const std::string& resourceGroup,
                     const std::string& snapshotName, nlohmann::json& snapshot);

    // Pulls error.message out of an ARM error body, falling back to the HTTP code
    static std::string extractErrorMessage(const std::string& body, long httpCode);

private:
    bool makeRequest(const std::string& method, const std::string& url,
                     const nlohmann::json& data, nlohmann::json& response);
    // Follows nextLink and concatenates every page's value array
    bool getPaged(const std::string& url, nlohmann::json& items);
    std::string buildUrl(const std::string& path, const std::string& apiVersion) const;
    std::string snapshotPath(const std::string& subscriptionId, const std::string& resourceGroup,
                             const std::string& snapshotName) const;
    static size_t writeCallback(void* contents, size_t size, size_t nmemb, std::string* userp);

    std::string managementEndpoint_;
    std::string authorityHost_;
    std::string accessToken_;
    CURL* curl_;
    bool isLoggedIn_;
    std::string lastError_;
    long lastHttpCode_;
};
