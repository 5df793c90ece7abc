#pragma once

#include "common/azure_types.hpp"
#include <string>
#include <vector>

class DiskCollector {
public:
    // OS disk first, then data disks in provider order; unnamed disks are
    // dropped. Returns false when the VM has no resource group to work in.
    bool collect(const ResolvedVM& vm, std::vector<DiskDescriptor>& disks);
    std::string getLastError() const;

private:
    std::string lastError_;
};
