#include "snapshot/disk_collector.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"

bool DiskCollector::collect(const ResolvedVM& vm, std::vector<DiskDescriptor>& disks) {
    disks.clear();

    if (utils::trim(vm.resourceGroup).empty()) {
        lastError_ = "VM has no resource group reference; disk collection skipped";
        Logger::warning(vm.identifier + " in subscription " + vm.context.id + ": " + lastError_);
        return false;
    }

    if (vm.osDisk && !vm.osDisk->name.empty()) {
        disks.push_back(*vm.osDisk);
    }
    for (const auto& dataDisk : vm.dataDisks) {
        if (dataDisk.name.empty()) {
            Logger::debug("Dropping unnamed data disk on " + vm.identifier);
            continue;
        }
        disks.push_back(dataDisk);
    }

    Logger::debug("Collected " + std::to_string(disks.size()) + " disk(s) for " + vm.identifier);
    return true;
}

std::string DiskCollector::getLastError() const {
    return lastError_;
}
