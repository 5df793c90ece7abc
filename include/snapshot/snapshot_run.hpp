#pragma once

#include "snapshot/cloud_provider.hpp"
#include "snapshot/context_enumerator.hpp"
#include "snapshot/disk_collector.hpp"
#include "snapshot/name_composer.hpp"
#include "snapshot/outcome_aggregator.hpp"
#include "snapshot/snapshot_config.hpp"
#include "snapshot/snapshot_executor.hpp"
#include "snapshot/vm_locator.hpp"
#include "common/snapshot_status.hpp"
#include <string>
#include <vector>

// Drives one run: authenticate, enumerate subscriptions once, then process
// each VM sequentially. Fatal errors stop the run before any VM is touched.
class SnapshotRun {
public:
    SnapshotRun(CloudProvider& provider, const SnapshotConfig& config);

    ExitCode execute(const std::vector<std::string>& vmIdentifiers);

    const OutcomeAggregator& outcomes() const { return outcomes_; }
    const std::vector<AccountContext>& contexts() const { return contexts_; }
    std::string getLastError() const;

private:
    void processVM(const std::string& vmIdentifier);
    void processResolvedVM(const ResolvedVM& vm);

    CloudProvider& provider_;
    const SnapshotConfig& config_;
    NameComposer composer_;
    VMLocator locator_;
    DiskCollector collector_;
    SnapshotExecutor executor_;
    OutcomeAggregator outcomes_;
    std::vector<AccountContext> contexts_;
    std::string lastError_;
};
