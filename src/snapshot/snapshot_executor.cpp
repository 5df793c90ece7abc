#include "snapshot/snapshot_executor.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"

SnapshotExecutor::SnapshotExecutor(CloudProvider& provider, const SnapshotConfig& config)
    : provider_(provider), config_(config) {
}

SnapshotRequest SnapshotExecutor::buildRequest(const ResolvedVM& vm, const DiskDescriptor& disk,
                                               const std::string& composedName) const {
    SnapshotRequest request;
    request.composedName = composedName;
    request.sourceDiskReference = disk.sourceReference;
    request.location = vm.location;
    request.targetResourceGroup = config_.targetResourceGroup.empty() ? vm.resourceGroup
                                                                       : config_.targetResourceGroup;
    request.skuName = config_.skuName;
    request.incremental = config_.incremental;
    request.tags = {
        {"ticket", utils::trim(config_.ticketReference)},
        {"sourceVm", vm.identifier},
        {"sourceDisk", disk.name},
        {"createdBy", "azsnap"}
    };
    return request;
}

SnapshotOutcome SnapshotExecutor::execute(const ResolvedVM& vm, const DiskDescriptor& disk,
                                          const std::string& composedName) {
    SnapshotOutcome outcome;
    outcome.request = buildRequest(vm, disk, composedName);

    // Attached disks may live in another resource group than the VM
    std::string diskResourceGroup = utils::resourceGroupFromId(disk.sourceReference);
    if (diskResourceGroup.empty()) {
        diskResourceGroup = vm.resourceGroup;
    }

    provider_.clearLastError();
    ManagedDisk source;
    if (!provider_.getDisk(diskResourceGroup, disk.name, source)) {
        outcome.kind = OutcomeKind::Failed;
        outcome.reason = provider_.getLastError();
        Logger::error("Failed to look up disk " + disk.name + " of " + vm.identifier + ": " + outcome.reason);
        return outcome;
    }
    if (!source.id.empty()) {
        outcome.request.sourceDiskReference = source.id;
    }

    Logger::info("Creating snapshot " + composedName + " from " + outcome.request.sourceDiskReference +
                 " in resource group " + outcome.request.targetResourceGroup);

    if (!provider_.createSnapshot(outcome.request)) {
        outcome.kind = OutcomeKind::Failed;
        outcome.reason = provider_.getLastError();
        Logger::error("Snapshot " + composedName + " failed: " + outcome.reason);
        return outcome;
    }

    outcome.kind = OutcomeKind::Created;
    Logger::info("Snapshot " + composedName + " created");
    return outcome;
}
