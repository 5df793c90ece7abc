#include "snapshot/context_enumerator.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"

ContextEnumerator::ContextEnumerator(CloudProvider& provider)
    : provider_(provider) {
}

bool ContextEnumerator::enumerate(std::vector<AccountContext>& contexts) {
    contexts.clear();

    std::vector<AccountContext> candidates;
    if (!provider_.listAccountContexts(candidates)) {
        lastError_ = "NoValidContexts: " + provider_.getLastError();
        Logger::error(lastError_);
        return false;
    }

    for (const auto& candidate : candidates) {
        if (!utils::isCanonicalUuid(candidate.id)) {
            Logger::warning("Ignoring subscription with malformed id: '" + candidate.id + "'");
            continue;
        }
        Logger::debug("Subscription " + candidate.id + " (" + candidate.displayName + ")");
        contexts.push_back(candidate);
    }

    if (contexts.empty()) {
        lastError_ = "NoValidContexts: no subscription with a valid id is available to this session";
        Logger::error(lastError_);
        return false;
    }

    Logger::info("Found " + std::to_string(contexts.size()) + " valid subscription(s)");
    return true;
}

std::string ContextEnumerator::getLastError() const {
    return lastError_;
}
