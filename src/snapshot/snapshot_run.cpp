#include "snapshot/snapshot_run.hpp"
#include "common/logger.hpp"

SnapshotRun::SnapshotRun(CloudProvider& provider, const SnapshotConfig& config)
    : provider_(provider),
      config_(config),
      composer_(config.namingPolicy, config.maxNameLength),
      locator_(provider, config.locatePolicy),
      executor_(provider, config),
      outcomes_(config.ticketReference) {
}

ExitCode SnapshotRun::execute(const std::vector<std::string>& vmIdentifiers) {
    if (!provider_.authenticate()) {
        lastError_ = "Authentication failed: " + provider_.getLastError();
        Logger::fatal(lastError_);
        return ExitCode::AuthenticationFailed;
    }
    Logger::info("Authenticated");

    ContextEnumerator enumerator(provider_);
    if (!enumerator.enumerate(contexts_)) {
        lastError_ = enumerator.getLastError();
        Logger::fatal(lastError_);
        return ExitCode::NoValidContexts;
    }

    Logger::info("Processing " + std::to_string(vmIdentifiers.size()) + " VM(s) for ticket " +
                 config_.ticketReference);
    for (const auto& vmIdentifier : vmIdentifiers) {
        processVM(vmIdentifier);
    }

    RunSummary summary = outcomes_.summarize();
    Logger::info("Run complete: " + std::to_string(summary.success) + " succeeded, " +
                 std::to_string(summary.failed) + " failed, " +
                 std::to_string(summary.notFound) + " not found, " +
                 std::to_string(summary.skipped) + " skipped");
    return ExitCode::Ok;
}

std::string SnapshotRun::getLastError() const {
    return lastError_;
}

void SnapshotRun::processVM(const std::string& vmIdentifier) {
    Logger::info("Searching for VM: " + vmIdentifier);

    size_t found = locator_.locate(vmIdentifier, contexts_, [this](const ResolvedVM& vm) {
        processResolvedVM(vm);
    });

    if (found == 0) {
        Logger::warning("VM " + vmIdentifier + " not found in any subscription");
        outcomes_.recordNotFound(vmIdentifier);
    }
}

void SnapshotRun::processResolvedVM(const ResolvedVM& vm) {
    std::vector<DiskDescriptor> disks;
    if (!collector_.collect(vm, disks)) {
        outcomes_.recordSkipped(vm, collector_.getLastError());
        return;
    }
    if (disks.empty()) {
        Logger::warning("VM " + vm.identifier + " in subscription " + vm.context.id +
                        " has no named disks");
        outcomes_.recordSkipped(vm, kNoNamedDisksMessage);
        return;
    }

    for (const auto& disk : disks) {
        std::string name = composer_.compose(vm.identifier, disk.name, config_.ticketReference);
        if (composer_.exceedsLimit(name)) {
            Logger::warning("Snapshot name " + name + " is " + std::to_string(name.length()) +
                            " characters, over the configured maximum of " +
                            std::to_string(composer_.maxLength()) +
                            "; the ticket reference is too long for the vm-disk naming policy");
        }

        SnapshotOutcome outcome = executor_.execute(vm, disk, name);
        outcomes_.recordDisk(vm, disk, outcome);
    }
}
