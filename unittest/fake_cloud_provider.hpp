#pragma once

#include "snapshot/cloud_provider.hpp"
#include <map>
#include <set>
#include <string>
#include <utility>
#include <vector>

// In-memory provider for tests. VMs are registered per subscription; disk
// lookups succeed unless listed in diskErrors.
class FakeCloudProvider : public CloudProvider {
public:
    struct SnapshotCall {
        std::string contextId;
        SnapshotRequest request;
    };

    bool authenticateResult = true;
    std::string authenticateError = "invalid_client";
    bool listContextsResult = true;
    std::vector<AccountContext> contexts;
    std::map<std::string, std::string> unavailableContexts;  // id -> activation error
    std::map<std::string, std::string> vmQueryErrors;        // id -> getVM error
    std::map<std::pair<std::string, std::string>, VirtualMachine> vms;  // (context, name)
    std::map<std::string, std::string> diskErrors;           // disk name -> message
    std::map<std::string, std::string> snapshotErrors;       // snapshot name -> message

    std::vector<std::string> activations;
    std::vector<std::string> diskLookups;  // resource group of each getDisk call
    std::vector<SnapshotCall> snapshotCalls;

    void addContext(const std::string& id, const std::string& name = "") {
        contexts.push_back({id, name, "Enabled"});
    }

    VirtualMachine& addVM(const std::string& contextId, const std::string& name,
                          const std::string& resourceGroup, const std::string& location = "westeurope") {
        VirtualMachine vm;
        vm.name = name;
        vm.resourceGroup = resourceGroup;
        vm.location = location;
        vm.id = "/subscriptions/" + contextId + "/resourceGroups/" + resourceGroup +
                "/providers/Microsoft.Compute/virtualMachines/" + name;
        return vms[{contextId, name}] = vm;
    }

    static DiskDescriptor disk(const std::string& name, DiskRole role) {
        return {name, "/disks/" + name, role};
    }

    bool authenticate() override {
        if (!authenticateResult) {
            lastError_ = authenticateError;
        }
        return authenticateResult;
    }

    bool listAccountContexts(std::vector<AccountContext>& out) override {
        if (!listContextsResult) {
            lastError_ = "AuthorizationFailed";
            return false;
        }
        out = contexts;
        return true;
    }

    bool setActiveContext(const std::string& contextId) override {
        activations.push_back(contextId);
        auto it = unavailableContexts.find(contextId);
        if (it != unavailableContexts.end()) {
            lastError_ = it->second;
            return false;
        }
        active_ = contextId;
        return true;
    }

    std::string getActiveContext() const override { return active_; }

    VMQueryStatus getVM(const std::string& name, VirtualMachine& vm) override {
        auto error = vmQueryErrors.find(active_);
        if (error != vmQueryErrors.end()) {
            lastError_ = error->second;
            return VMQueryStatus::Error;
        }
        auto it = vms.find({active_, name});
        if (it == vms.end()) {
            return VMQueryStatus::NotFound;
        }
        vm = it->second;
        return VMQueryStatus::Found;
    }

    bool getDisk(const std::string& resourceGroup, const std::string& name, ManagedDisk& disk) override {
        diskLookups.push_back(resourceGroup);
        auto it = diskErrors.find(name);
        if (it != diskErrors.end()) {
            lastError_ = it->second;
            return false;
        }
        disk.name = name;
        disk.id = "/subscriptions/" + active_ + "/resourceGroups/" + resourceGroup +
                  "/providers/Microsoft.Compute/disks/" + name;
        disk.provisioningState = "Succeeded";
        return true;
    }

    bool createSnapshot(const SnapshotRequest& request) override {
        snapshotCalls.push_back({active_, request});
        auto it = snapshotErrors.find(request.composedName);
        if (it != snapshotErrors.end()) {
            lastError_ = it->second;
            return false;
        }
        return true;
    }

    std::string getLastError() const override { return lastError_; }
    void clearLastError() override { lastError_.clear(); }

private:
    std::string active_;
    std::string lastError_;
};

inline const char* const kContextA = "11111111-1111-1111-1111-111111111111";
inline const char* const kContextB = "22222222-2222-2222-2222-222222222222";
inline const char* const kContextC = "33333333-3333-3333-3333-333333333333";
