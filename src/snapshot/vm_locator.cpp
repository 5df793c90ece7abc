#include "snapshot/vm_locator.hpp"
#include "common/logger.hpp"

VMLocator::VMLocator(CloudProvider& provider, LocatePolicy policy)
    : provider_(provider), policy_(policy) {
}

VMLookupResult VMLocator::lookup(const std::string& vmIdentifier, const AccountContext& context) {
    VMLookupResult result;

    provider_.clearLastError();
    if (!provider_.setActiveContext(context.id)) {
        result.outcome = LookupOutcome::ContextUnavailable;
        result.reason = provider_.getLastError();
        return result;
    }

    VirtualMachine vm;
    switch (provider_.getVM(vmIdentifier, vm)) {
        case VMQueryStatus::Found:
            result.outcome = LookupOutcome::Found;
            result.vm.identifier = vmIdentifier;
            result.vm.context = context;
            result.vm.resourceGroup = vm.resourceGroup;
            result.vm.location = vm.location;
            result.vm.osDisk = vm.osDisk;
            result.vm.dataDisks = vm.dataDisks;
            break;
        case VMQueryStatus::NotFound:
            result.outcome = LookupOutcome::NotFoundHere;
            break;
        case VMQueryStatus::Error:
            result.outcome = LookupOutcome::ContextUnavailable;
            result.reason = provider_.getLastError();
            break;
    }
    return result;
}

size_t VMLocator::locate(const std::string& vmIdentifier, const std::vector<AccountContext>& contexts,
                         const FoundCallback& onFound) {
    size_t found = 0;

    for (const auto& context : contexts) {
        VMLookupResult result = lookup(vmIdentifier, context);

        switch (result.outcome) {
            case LookupOutcome::ContextUnavailable:
                Logger::warning("Subscription " + context.id + " unavailable while searching for " +
                                vmIdentifier + ": " + result.reason);
                continue;
            case LookupOutcome::NotFoundHere:
                continue;
            case LookupOutcome::Found:
                break;
        }

        Logger::info("Found VM " + vmIdentifier + " in subscription " + context.id +
                     " (resource group '" + result.vm.resourceGroup + "')");
        ++found;
        if (onFound) {
            onFound(result.vm);
        }

        if (policy_ == LocatePolicy::FirstMatch) {
            break;
        }
    }
    return found;
}
