#include "snapshot/azure/azure_cloud_provider.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <stdexcept>
#include <thread>

namespace {

std::string stringField(const nlohmann::json& object, const char* key) {
    if (object.is_object() && object.contains(key) && object[key].is_string()) {
        return object[key].get<std::string>();
    }
    return "";
}

DiskDescriptor parseDiskReference(const nlohmann::json& disk, DiskRole role) {
    DiskDescriptor descriptor;
    descriptor.name = stringField(disk, "name");
    descriptor.role = role;
    if (disk.contains("managedDisk")) {
        descriptor.sourceReference = stringField(disk["managedDisk"], "id");
    }
    return descriptor;
}

std::string provisioningState(const nlohmann::json& resource) {
    if (resource.contains("properties")) {
        return stringField(resource["properties"], "provisioningState");
    }
    return "";
}

} // namespace

AzureCloudProvider::AzureCloudProvider(const AzureCredentials& credentials)
    : credentials_(credentials),
      restClient_(std::make_unique<ArmRestClient>(credentials.managementEndpoint,
                                                  credentials.authorityHost)) {
}

AzureCloudProvider::AzureCloudProvider(const AzureCredentials& credentials,
                                       std::unique_ptr<ArmRestClient> restClient)
    : credentials_(credentials), restClient_(std::move(restClient)) {
    if (!restClient_) {
        throw std::invalid_argument("AzureCloudProvider requires a REST client");
    }
}

AzureCloudProvider::~AzureCloudProvider() = default;

bool AzureCloudProvider::authenticate() {
    if (!credentials_.accessToken.empty()) {
        Logger::info("Authenticating with pre-acquired access token");
        restClient_->setAccessToken(credentials_.accessToken);
        return true;
    }

    if (credentials_.tenantId.empty() || credentials_.clientId.empty() || credentials_.clientSecret.empty()) {
        lastError_ = "No credentials: set AZURE_ACCESS_TOKEN or AZURE_TENANT_ID, AZURE_CLIENT_ID and AZURE_CLIENT_SECRET";
        Logger::error(lastError_);
        return false;
    }

    Logger::info("Authenticating service principal " + credentials_.clientId +
                 " in tenant " + credentials_.tenantId);
    if (!restClient_->loginWithClientSecret(credentials_.tenantId, credentials_.clientId,
                                            credentials_.clientSecret)) {
        lastError_ = restClient_->getLastError();
        return false;
    }
    return true;
}

bool AzureCloudProvider::listAccountContexts(std::vector<AccountContext>& contexts) {
    nlohmann::json subscriptions;
    if (!restClient_->listSubscriptions(subscriptions)) {
        lastError_ = "Failed to list subscriptions: " + restClient_->getLastError();
        Logger::error(lastError_);
        return false;
    }

    contexts.clear();
    for (const auto& subscription : subscriptions) {
        contexts.push_back(parseSubscription(subscription));
    }
    Logger::debug("Provider returned " + std::to_string(contexts.size()) + " subscriptions");
    return true;
}

bool AzureCloudProvider::setActiveContext(const std::string& contextId) {
    nlohmann::json subscription;
    if (!restClient_->getSubscription(contextId, subscription)) {
        lastError_ = restClient_->getLastError();
        return false;
    }

    std::string state = stringField(subscription, "state");
    if (!state.empty() && state != "Enabled" && state != "PastDue" && state != "Warned") {
        lastError_ = "Subscription " + contextId + " is " + state;
        return false;
    }

    activeContext_ = contextId;
    return true;
}

std::string AzureCloudProvider::getActiveContext() const {
    return activeContext_;
}

VMQueryStatus AzureCloudProvider::getVM(const std::string& name, VirtualMachine& vm) {
    if (activeContext_.empty()) {
        lastError_ = "No active subscription";
        return VMQueryStatus::Error;
    }

    nlohmann::json vms;
    if (!restClient_->listVirtualMachines(activeContext_, vms)) {
        lastError_ = restClient_->getLastError();
        return VMQueryStatus::Error;
    }

    std::string wanted = utils::toLower(name);
    for (const auto& item : vms) {
        if (utils::toLower(stringField(item, "name")) == wanted) {
            vm = parseVirtualMachine(item);
            return VMQueryStatus::Found;
        }
    }
    return VMQueryStatus::NotFound;
}

bool AzureCloudProvider::getDisk(const std::string& resourceGroup, const std::string& name, ManagedDisk& disk) {
    nlohmann::json response;
    if (!restClient_->getDisk(activeContext_, resourceGroup, name, response)) {
        lastError_ = restClient_->getLastError();
        return false;
    }
    disk = parseDisk(response);
    return true;
}

bool AzureCloudProvider::createSnapshot(const SnapshotRequest& request) {
    nlohmann::json response;
    if (!restClient_->putSnapshot(activeContext_, request.targetResourceGroup, request.composedName,
                                  buildSnapshotBody(request), response)) {
        lastError_ = restClient_->getLastError();
        return false;
    }
    return waitForSnapshot(request, response);
}

std::string AzureCloudProvider::getLastError() const {
    return lastError_;
}

void AzureCloudProvider::clearLastError() {
    lastError_.clear();
}

void AzureCloudProvider::setPollInterval(std::chrono::seconds interval) {
    pollInterval_ = interval;
}

void AzureCloudProvider::setOperationTimeout(std::chrono::seconds timeout) {
    operationTimeout_ = timeout;
}

AccountContext AzureCloudProvider::parseSubscription(const nlohmann::json& subscription) {
    AccountContext context;
    context.id = stringField(subscription, "subscriptionId");
    context.displayName = stringField(subscription, "displayName");
    context.state = stringField(subscription, "state");
    return context;
}

VirtualMachine AzureCloudProvider::parseVirtualMachine(const nlohmann::json& vm) {
    VirtualMachine result;
    result.id = stringField(vm, "id");
    result.name = stringField(vm, "name");
    result.location = stringField(vm, "location");
    result.resourceGroup = utils::resourceGroupFromId(result.id);

    if (vm.contains("properties") && vm["properties"].contains("storageProfile")) {
        const auto& storage = vm["properties"]["storageProfile"];
        if (storage.contains("osDisk") && storage["osDisk"].is_object()) {
            result.osDisk = parseDiskReference(storage["osDisk"], DiskRole::OS);
        }
        if (storage.contains("dataDisks") && storage["dataDisks"].is_array()) {
            for (const auto& dataDisk : storage["dataDisks"]) {
                result.dataDisks.push_back(parseDiskReference(dataDisk, DiskRole::Data));
            }
        }
    }

    result.additionalInfo = vm;
    return result;
}

ManagedDisk AzureCloudProvider::parseDisk(const nlohmann::json& disk) {
    ManagedDisk result;
    result.id = stringField(disk, "id");
    result.name = stringField(disk, "name");
    result.location = stringField(disk, "location");
    result.provisioningState = provisioningState(disk);
    return result;
}

nlohmann::json AzureCloudProvider::buildSnapshotBody(const SnapshotRequest& request) {
    nlohmann::json body = {
        {"location", request.location},
        {"sku", {{"name", request.skuName}}},
        {"properties", {
            {"creationData", {
                {"createOption", "Copy"},
                {"sourceResourceId", request.sourceDiskReference}
            }},
            {"incremental", request.incremental}
        }}
    };
    if (!request.tags.empty()) {
        body["tags"] = request.tags;
    }
    return body;
}

bool AzureCloudProvider::waitForSnapshot(const SnapshotRequest& request, nlohmann::json state) {
    auto deadline = std::chrono::steady_clock::now() + operationTimeout_;

    while (true) {
        std::string current = provisioningState(state);
        if (current == "Succeeded") {
            return true;
        }
        if (current == "Failed" || current == "Canceled") {
            lastError_ = "Snapshot " + request.composedName + " provisioning " + current;
            if (state.contains("error")) {
                lastError_ += ": " + ArmRestClient::extractErrorMessage(state.dump(), 0);
            }
            return false;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            lastError_ = "Timed out waiting for snapshot " + request.composedName +
                         " (last state: " + (current.empty() ? std::string("unknown") : current) + ")";
            return false;
        }

        Logger::debug("Snapshot " + request.composedName + " is " +
                      (current.empty() ? std::string("accepted") : current) + ", waiting");
        std::this_thread::sleep_for(pollInterval_);

        if (!restClient_->getSnapshot(activeContext_, request.targetResourceGroup,
                                      request.composedName, state)) {
            lastError_ = restClient_->getLastError();
            return false;
        }
    }
}
