#pragma once

#include "common/logger.hpp"
#include "snapshot/name_composer.hpp"
#include "snapshot/vm_locator.hpp"
#include <string>

enum class ReportFormat {
    Csv,
    Json
};

struct SnapshotConfig {
    std::string vmListPath;
    std::string ticketReference;
    std::string outputDir{"."};
    ReportFormat reportFormat{ReportFormat::Csv};

    LocatePolicy locatePolicy{LocatePolicy::FirstMatch};
    NamingPolicy namingPolicy{NamingPolicy::VmDiskCombined};
    int maxNameLength{NameComposer::kDefaultMaxLength};

    std::string targetResourceGroup;  // empty: use the VM's resource group
    std::string skuName{"Standard_LRS"};
    bool incremental{false};
    int pollIntervalSeconds{5};
    int timeoutSeconds{1800};

    std::string logFile{kDefaultLogPath};
    LogLevel logLevel{LogLevel::INFO};
    bool quiet{false};
};

bool parseLocatePolicy(const std::string& text, LocatePolicy& policy);
bool parseNamingPolicy(const std::string& text, NamingPolicy& policy);
bool parseReportFormat(const std::string& text, ReportFormat& format);

// Overlays the keys present in a JSON config file onto config
bool loadConfigFile(const std::string& path, SnapshotConfig& config, std::string& error);

// Checks required fields and ranges; does not touch the file system
bool validateConfig(const SnapshotConfig& config, std::string& error);
