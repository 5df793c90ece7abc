#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// A subscription the session can switch into
struct AccountContext {
    std::string id;
    std::string displayName;
    std::string state;
};

enum class DiskRole {
    OS,
    Data
};

struct DiskDescriptor {
    std::string name;
    std::string sourceReference;  // managed disk resource id as reported by the VM
    DiskRole role{DiskRole::Data};
};

// VM metadata as returned by the provider
struct VirtualMachine {
    std::string id;
    std::string name;
    std::string resourceGroup;
    std::string location;
    std::optional<DiskDescriptor> osDisk;
    std::vector<DiskDescriptor> dataDisks;
    nlohmann::json additionalInfo;
};

// A VM bound to the context it was found in
struct ResolvedVM {
    std::string identifier;
    AccountContext context;
    std::string resourceGroup;
    std::string location;
    std::optional<DiskDescriptor> osDisk;
    std::vector<DiskDescriptor> dataDisks;
};

struct ManagedDisk {
    std::string id;
    std::string name;
    std::string location;
    std::string provisioningState;
};

struct SnapshotRequest {
    std::string composedName;
    std::string sourceDiskReference;
    std::string location;
    std::string targetResourceGroup;
    std::string skuName{"Standard_LRS"};
    bool incremental{false};
    std::map<std::string, std::string> tags;
};
