#pragma once

#include "snapshot/cloud_provider.hpp"
#include "snapshot/snapshot_config.hpp"
#include "common/azure_types.hpp"
#include <string>

enum class OutcomeKind {
    Created,
    Failed
};

struct SnapshotOutcome {
    OutcomeKind kind{OutcomeKind::Failed};
    std::string reason;  // provider message, verbatim
    SnapshotRequest request;

    bool created() const { return kind == OutcomeKind::Created; }
};

class SnapshotExecutor {
public:
    SnapshotExecutor(CloudProvider& provider, const SnapshotConfig& config);

    // Resolves the source disk and creates one snapshot from it. Never retries.
    SnapshotOutcome execute(const ResolvedVM& vm, const DiskDescriptor& disk,
                            const std::string& composedName);

    SnapshotRequest buildRequest(const ResolvedVM& vm, const DiskDescriptor& disk,
                                 const std::string& composedName) const;

private:
    CloudProvider& provider_;
    const SnapshotConfig& config_;
};
