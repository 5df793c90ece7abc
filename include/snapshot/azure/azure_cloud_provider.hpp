#ifndef AZURE_CLOUD_PROVIDER_HPP
#define AZURE_CLOUD_PROVIDER_HPP

#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "snapshot/cloud_provider.hpp"
#include "common/arm_rest_client.hpp"
#include "common/logger.hpp"

struct AzureCredentials {
    std::string tenantId;
    std::string clientId;
    std::string clientSecret;
    std::string accessToken;
    std::string authorityHost{"https://login.microsoftonline.com"};
    std::string managementEndpoint{"https://management.azure.com"};
};

class AzureCloudProvider : public CloudProvider {
public:
    explicit AzureCloudProvider(const AzureCredentials& credentials);
    AzureCloudProvider(const AzureCredentials& credentials, std::unique_ptr<ArmRestClient> restClient);
    ~AzureCloudProvider() override;

    // Session management
    bool authenticate() override;
    bool listAccountContexts(std::vector<AccountContext>& contexts) override;
    bool setActiveContext(const std::string& contextId) override;
    std::string getActiveContext() const override;

    // Compute operations
    VMQueryStatus getVM(const std::string& name, VirtualMachine& vm) override;
    bool getDisk(const std::string& resourceGroup, const std::string& name, ManagedDisk& disk) override;
    bool createSnapshot(const SnapshotRequest& request) override;

    // Error handling
    std::string getLastError() const override;
    void clearLastError() override;

    // Long-running snapshot creation
    void setPollInterval(std::chrono::seconds interval);
    void setOperationTimeout(std::chrono::seconds timeout);

    // Conversions between ARM payloads and our types
    static AccountContext parseSubscription(const nlohmann::json& subscription);
    static VirtualMachine parseVirtualMachine(const nlohmann::json& vm);
    static ManagedDisk parseDisk(const nlohmann::json& disk);
    static nlohmann::json buildSnapshotBody(const SnapshotRequest& request);

private:
    // Polls until provisioningState is Succeeded, Failed or Canceled. A missing
    // state (e.g. an empty 202 body) is not terminal.
    bool waitForSnapshot(const SnapshotRequest& request, nlohmann::json state);

    AzureCredentials credentials_;
    std::unique_ptr<ArmRestClient> restClient_;
    std::string activeContext_;
    std::string lastError_;
    std::chrono::seconds pollInterval_{5};
    std::chrono::seconds operationTimeout_{1800};
};

#endif // AZURE_CLOUD_PROVIDER_HPP
