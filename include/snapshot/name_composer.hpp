#pragma once

#include <string>

enum class NamingPolicy {
    VmDiskCombined,  // "{vm}_{disk}_{ticket}", not re-clamped
    BaseOnly         // "{disk}_{ticket}", re-clamped to the maximum length
};

class NameComposer {
public:
    static constexpr int kDefaultMaxLength = 82;

    explicit NameComposer(NamingPolicy policy = NamingPolicy::VmDiskCombined,
                          int maxLength = kDefaultMaxLength);

    std::string compose(const std::string& vmIdentifier, const std::string& diskName,
                        const std::string& ticketReference) const;

    // The base is truncated so that "_{ticket}" fits within maxLength. Under
    // VmDiskCombined a ticket of maxLength characters or more still yields a
    // name longer than maxLength.
    static std::string compose(const std::string& vmIdentifier, const std::string& diskName,
                               const std::string& ticketReference, int maxLength,
                               NamingPolicy policy);

    bool exceedsLimit(const std::string& composedName) const;

    NamingPolicy policy() const { return policy_; }
    int maxLength() const { return maxLength_; }

private:
    NamingPolicy policy_;
    int maxLength_;
};
