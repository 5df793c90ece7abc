#include "snapshot/outcome_aggregator.hpp"
#include "common/utils.hpp"
#include <chrono>

OutcomeAggregator::OutcomeAggregator(const std::string& ticketReference)
    : ticketReference_(utils::trim(ticketReference)) {
}

void OutcomeAggregator::recordDisk(const ResolvedVM& vm, const DiskDescriptor& disk,
                                   const SnapshotOutcome& outcome) {
    ReportEntry entry = makeEntry(vm.context.id, vm.identifier,
                                  outcome.created() ? SnapshotStatus::Success : SnapshotStatus::Failed);
    entry.diskName = disk.name;
    entry.snapshotName = outcome.request.composedName;
    entry.errorMessage = outcome.created() ? "" : outcome.reason;
    entries_.push_back(entry);
}

void OutcomeAggregator::recordNotFound(const std::string& vmIdentifier) {
    ReportEntry entry = makeEntry(kNotApplicable, vmIdentifier, SnapshotStatus::NotFound);
    entry.errorMessage = "VM not found in any subscription";
    entries_.push_back(entry);
}

void OutcomeAggregator::recordSkipped(const ResolvedVM& vm, const std::string& reason) {
    ReportEntry entry = makeEntry(vm.context.id, vm.identifier, SnapshotStatus::Skipped);
    entry.errorMessage = reason;
    entries_.push_back(entry);
}

RunSummary OutcomeAggregator::summarize() const {
    RunSummary summary;
    for (const auto& entry : entries_) {
        switch (entry.status) {
            case SnapshotStatus::Success:  ++summary.success;  break;
            case SnapshotStatus::Failed:   ++summary.failed;   break;
            case SnapshotStatus::NotFound: ++summary.notFound; break;
            case SnapshotStatus::Skipped:  ++summary.skipped;  break;
        }
    }
    return summary;
}

ReportEntry OutcomeAggregator::makeEntry(const std::string& contextId, const std::string& vmIdentifier,
                                         SnapshotStatus status) const {
    ReportEntry entry;
    entry.timestamp = utils::formatTimestamp(std::chrono::system_clock::now());
    entry.accountContextId = contextId;
    entry.vmIdentifier = vmIdentifier;
    entry.diskName = kNotApplicable;
    entry.snapshotName = kNotApplicable;
    entry.status = status;
    entry.ticketReference = ticketReference_;
    return entry;
}
