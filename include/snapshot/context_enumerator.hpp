#pragma once

#include "snapshot/cloud_provider.hpp"
#include "common/azure_types.hpp"
#include <string>
#include <vector>

// Lists the subscriptions visible to the session and keeps those with a
// canonical UUID id, in provider order.
class ContextEnumerator {
public:
    explicit ContextEnumerator(CloudProvider& provider);

    // False (NoValidContexts) when the provider call fails or nothing valid remains
    bool enumerate(std::vector<AccountContext>& contexts);
    std::string getLastError() const;

private:
    CloudProvider& provider_;
    std::string lastError_;
};
