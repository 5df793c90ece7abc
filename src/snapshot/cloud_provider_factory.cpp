#include "snapshot/cloud_provider_factory.hpp"
#include "common/logger.hpp"
#include <chrono>
#include <cstdlib>
#include <stdexcept>

namespace {

std::string envOrDefault(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return fallback;
    }
    return value;
}

} // namespace

AzureCredentials loadAzureCredentials() {
    AzureCredentials credentials;
    credentials.tenantId = envOrDefault("AZURE_TENANT_ID", "");
    credentials.clientId = envOrDefault("AZURE_CLIENT_ID", "");
    credentials.clientSecret = envOrDefault("AZURE_CLIENT_SECRET", "");
    credentials.accessToken = envOrDefault("AZURE_ACCESS_TOKEN", "");
    credentials.authorityHost = envOrDefault("AZURE_AUTHORITY_HOST", credentials.authorityHost);
    credentials.managementEndpoint = envOrDefault("AZURE_RESOURCE_MANAGER", credentials.managementEndpoint);

    Logger::debug("Credentials: tenant=" + (credentials.tenantId.empty() ? std::string("unset") : credentials.tenantId) +
                  ", client=" + (credentials.clientId.empty() ? std::string("unset") : credentials.clientId) +
                  ", secret=" + (credentials.clientSecret.empty() ? "unset" : "[REDACTED]") +
                  ", token=" + (credentials.accessToken.empty() ? "unset" : "[REDACTED]"));
    return credentials;
}

std::unique_ptr<CloudProvider> createCloudProvider(const std::string& type, const SnapshotConfig& config) {
    Logger::info("Creating cloud provider of type: " + type);

    if (type == "azure") {
        auto provider = std::make_unique<AzureCloudProvider>(loadAzureCredentials());
        provider->setPollInterval(std::chrono::seconds(config.pollIntervalSeconds));
        provider->setOperationTimeout(std::chrono::seconds(config.timeoutSeconds));
        return provider;
    }

    Logger::error("Unsupported cloud provider type: " + type);
    throw std::runtime_error("Unsupported cloud provider type: " + type);
}
