#pragma once

#include "snapshot/cloud_provider.hpp"
#include "snapshot/azure/azure_cloud_provider.hpp"
#include "snapshot/snapshot_config.hpp"
#include <memory>
#include <string>
#include <stdexcept>

// Reads AZURE_TENANT_ID, AZURE_CLIENT_ID, AZURE_CLIENT_SECRET, AZURE_ACCESS_TOKEN,
// AZURE_AUTHORITY_HOST and AZURE_RESOURCE_MANAGER
AzureCredentials loadAzureCredentials();

// Factory function to create the provider for a run
std::unique_ptr<CloudProvider> createCloudProvider(const std::string& type, const SnapshotConfig& config);
