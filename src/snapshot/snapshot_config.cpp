#include "snapshot/snapshot_config.hpp"
#include "common/utils.hpp"
#include <fstream>
#include <nlohmann/json.hpp>

bool parseLocatePolicy(const std::string& text, LocatePolicy& policy) {
    std::string value = utils::toLower(utils::trim(text));
    if (value == "first-match") {
        policy = LocatePolicy::FirstMatch;
    } else if (value == "exhaustive") {
        policy = LocatePolicy::Exhaustive;
    } else {
        return false;
    }
    return true;
}

bool parseNamingPolicy(const std::string& text, NamingPolicy& policy) {
    std::string value = utils::toLower(utils::trim(text));
    if (value == "vm-disk") {
        policy = NamingPolicy::VmDiskCombined;
    } else if (value == "disk-only") {
        policy = NamingPolicy::BaseOnly;
    } else {
        return false;
    }
    return true;
}

bool parseReportFormat(const std::string& text, ReportFormat& format) {
    std::string value = utils::toLower(utils::trim(text));
    if (value == "csv") {
        format = ReportFormat::Csv;
    } else if (value == "json") {
        format = ReportFormat::Json;
    } else {
        return false;
    }
    return true;
}

bool loadConfigFile(const std::string& path, SnapshotConfig& config, std::string& error) {
    std::ifstream file(path);
    if (!file.is_open()) {
        error = "Cannot open config file: " + path;
        return false;
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        if (!j.is_object()) {
            error = "Config file must contain a JSON object: " + path;
            return false;
        }

        if (j.contains("vmList")) config.vmListPath = j["vmList"].get<std::string>();
        if (j.contains("ticket")) config.ticketReference = j["ticket"].get<std::string>();
        if (j.contains("outputDir")) config.outputDir = j["outputDir"].get<std::string>();
        if (j.contains("targetResourceGroup")) config.targetResourceGroup = j["targetResourceGroup"].get<std::string>();
        if (j.contains("sku")) config.skuName = j["sku"].get<std::string>();
        if (j.contains("incremental")) config.incremental = j["incremental"].get<bool>();
        if (j.contains("maxLength")) config.maxNameLength = j["maxLength"].get<int>();
        if (j.contains("pollIntervalSeconds")) config.pollIntervalSeconds = j["pollIntervalSeconds"].get<int>();
        if (j.contains("timeoutSeconds")) config.timeoutSeconds = j["timeoutSeconds"].get<int>();
        if (j.contains("logFile")) config.logFile = j["logFile"].get<std::string>();

        if (j.contains("format") && !parseReportFormat(j["format"].get<std::string>(), config.reportFormat)) {
            error = "Invalid format in config file: " + j["format"].get<std::string>();
            return false;
        }
        if (j.contains("policy") && !parseLocatePolicy(j["policy"].get<std::string>(), config.locatePolicy)) {
            error = "Invalid policy in config file: " + j["policy"].get<std::string>();
            return false;
        }
        if (j.contains("naming") && !parseNamingPolicy(j["naming"].get<std::string>(), config.namingPolicy)) {
            error = "Invalid naming in config file: " + j["naming"].get<std::string>();
            return false;
        }
        if (j.contains("logLevel") && !Logger::parseLevel(j["logLevel"].get<std::string>(), config.logLevel)) {
            error = "Invalid logLevel in config file: " + j["logLevel"].get<std::string>();
            return false;
        }
        return true;
    } catch (const nlohmann::json::exception& e) {
        error = "Failed to parse config file " + path + ": " + e.what();
        return false;
    }
}

bool validateConfig(const SnapshotConfig& config, std::string& error) {
    if (utils::trim(config.ticketReference).empty()) {
        error = "A ticket reference is required (--ticket)";
        return false;
    }
    if (config.maxNameLength < 1) {
        error = "Maximum name length must be at least 1";
        return false;
    }
    if (config.pollIntervalSeconds < 1) {
        error = "Poll interval must be at least 1 second";
        return false;
    }
    if (config.timeoutSeconds < 1) {
        error = "Timeout must be at least 1 second";
        return false;
    }
    if (config.skuName.empty()) {
        error = "Snapshot SKU must not be empty";
        return false;
    }
    return true;
}
