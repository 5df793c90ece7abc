#pragma once

#include "common/azure_types.hpp"
#include "common/snapshot_status.hpp"
#include "snapshot/snapshot_executor.hpp"
#include <string>
#include <vector>

// Append-only record of every disk attempt and every unresolved VM, in
// processing order.
class OutcomeAggregator {
public:
    explicit OutcomeAggregator(const std::string& ticketReference);

    void recordDisk(const ResolvedVM& vm, const DiskDescriptor& disk, const SnapshotOutcome& outcome);
    void recordNotFound(const std::string& vmIdentifier);
    void recordSkipped(const ResolvedVM& vm, const std::string& reason);

    const std::vector<ReportEntry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    RunSummary summarize() const;

private:
    ReportEntry makeEntry(const std::string& contextId, const std::string& vmIdentifier,
                          SnapshotStatus status) const;

    std::string ticketReference_;
    std::vector<ReportEntry> entries_;
};
