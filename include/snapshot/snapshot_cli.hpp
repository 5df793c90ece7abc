#pragma once

#include "snapshot/cloud_provider.hpp"
#include "snapshot/snapshot_config.hpp"
#include "common/logger.hpp"
#include <functional>
#include <memory>
#include <string>

enum class ParseResult {
    Ok,
    Help,
    Error
};

class SnapshotCLI {
public:
    using ProviderFactory = std::function<std::unique_ptr<CloudProvider>(const SnapshotConfig&)>;

    SnapshotCLI();
    explicit SnapshotCLI(ProviderFactory factory);

    int run(int argc, char* argv[]);
    void printUsage() const;

    // argv[0] is skipped; precedence is defaults, then --config file, then flags
    ParseResult parseArguments(int argc, char* argv[], SnapshotConfig& config, std::string& error) const;

private:
    bool initializeLogging(const SnapshotConfig& config) const;

    ProviderFactory providerFactory_;
};
