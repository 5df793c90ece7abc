#pragma once

#include "common/azure_types.hpp"
#include <string>
#include <vector>

enum class VMQueryStatus {
    Found,
    NotFound,
    Error
};

// Blocking, synchronous access to the cloud provider. All calls after
// setActiveContext() operate within that context.
class CloudProvider {
public:
    virtual ~CloudProvider() = default;

    // Session management
    virtual bool authenticate() = 0;
    virtual bool listAccountContexts(std::vector<AccountContext>& contexts) = 0;
    virtual bool setActiveContext(const std::string& contextId) = 0;
    virtual std::string getActiveContext() const = 0;

    // Compute operations
    virtual VMQueryStatus getVM(const std::string& name, VirtualMachine& vm) = 0;
    virtual bool getDisk(const std::string& resourceGroup, const std::string& name, ManagedDisk& disk) = 0;
    virtual bool createSnapshot(const SnapshotRequest& request) = 0;

    // Error handling
    virtual std::string getLastError() const = 0;
    virtual void clearLastError() = 0;
};
