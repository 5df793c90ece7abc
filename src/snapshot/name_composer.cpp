#include "snapshot/name_composer.hpp"
#include "common/utils.hpp"
#include <algorithm>

NameComposer::NameComposer(NamingPolicy policy, int maxLength)
    : policy_(policy), maxLength_(maxLength) {
}

std::string NameComposer::compose(const std::string& vmIdentifier, const std::string& diskName,
                                  const std::string& ticketReference) const {
    return compose(vmIdentifier, diskName, ticketReference, maxLength_, policy_);
}

std::string NameComposer::compose(const std::string& vmIdentifier, const std::string& diskName,
                                  const std::string& ticketReference, int maxLength,
                                  NamingPolicy policy) {
    std::string ticket = utils::trim(ticketReference);

    std::string base;
    if (policy == NamingPolicy::VmDiskCombined) {
        base = utils::trim(vmIdentifier + "_" + diskName);
    } else {
        base = utils::trim(diskName);
    }

    long available = std::max(0L, static_cast<long>(maxLength) - static_cast<long>(ticket.length() + 1));
    if (base.length() > static_cast<size_t>(available)) {
        base = base.substr(0, static_cast<size_t>(available));
    }

    std::string composed = base + "_" + ticket;

    if (policy == NamingPolicy::BaseOnly && maxLength >= 0 &&
        composed.length() > static_cast<size_t>(maxLength)) {
        composed = composed.substr(0, static_cast<size_t>(maxLength));
    }
    return composed;
}

bool NameComposer::exceedsLimit(const std::string& composedName) const {
    return composedName.length() > static_cast<size_t>(std::max(0, maxLength_));
}
