#pragma once

#include "snapshot/cloud_provider.hpp"
#include "common/azure_types.hpp"
#include <functional>
#include <string>
#include <vector>

enum class LocatePolicy {
    FirstMatch,  // stop at the earliest context holding the VM
    Exhaustive   // process the VM in every context holding it
};

enum class LookupOutcome {
    Found,
    NotFoundHere,
    ContextUnavailable
};

struct VMLookupResult {
    LookupOutcome outcome{LookupOutcome::NotFoundHere};
    ResolvedVM vm;
    std::string reason;
};

class VMLocator {
public:
    // Invoked while the owning context is still active
    using FoundCallback = std::function<void(const ResolvedVM&)>;

    VMLocator(CloudProvider& provider, LocatePolicy policy);

    VMLookupResult lookup(const std::string& vmIdentifier, const AccountContext& context);

    // Returns the number of contexts the VM was found in
    size_t locate(const std::string& vmIdentifier, const std::vector<AccountContext>& contexts,
                  const FoundCallback& onFound);

    LocatePolicy policy() const { return policy_; }

private:
    CloudProvider& provider_;
    LocatePolicy policy_;
};
