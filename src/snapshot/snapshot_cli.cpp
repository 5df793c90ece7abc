#include "snapshot/snapshot_cli.hpp"
#include "snapshot/cloud_provider_factory.hpp"
#include "snapshot/report_writer.hpp"
#include "snapshot/snapshot_run.hpp"
#include "snapshot/vm_list_reader.hpp"
#include "common/logger.hpp"
#include "common/snapshot_status.hpp"
#include "common/utils.hpp"
#include "main/snapshot_main.hpp"
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <vector>

namespace {

bool parseInt(const std::string& flag, const std::string& value, int& out, std::string& error) {
    try {
        size_t pos = 0;
        int parsed = std::stoi(value, &pos);
        if (pos != value.length()) {
            error = "Invalid number for " + flag + ": " + value;
            return false;
        }
        out = parsed;
        return true;
    } catch (const std::logic_error&) {
        error = "Invalid number for " + flag + ": " + value;
        return false;
    }
}

} // namespace

SnapshotCLI::SnapshotCLI()
    : providerFactory_([](const SnapshotConfig& config) {
          return createCloudProvider("azure", config);
      }) {
}

SnapshotCLI::SnapshotCLI(ProviderFactory factory)
    : providerFactory_(std::move(factory)) {
}

void SnapshotCLI::printUsage() const {
    printSnapshotUsage();
}

ParseResult SnapshotCLI::parseArguments(int argc, char* argv[], SnapshotConfig& config, std::string& error) const {
    // The config file is applied first so that flags override it
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                error = "Missing value for " + arg;
                return ParseResult::Error;
            }
            if (!loadConfigFile(argv[i + 1], config, error)) {
                return ParseResult::Error;
            }
            break;
        }
    }

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            return ParseResult::Help;
        }
        if (arg == "--incremental") {
            config.incremental = true;
            continue;
        }
        if (arg == "-q" || arg == "--quiet") {
            config.quiet = true;
            continue;
        }

        if (i + 1 >= argc) {
            error = (arg.rfind("-", 0) == 0 ? "Missing value for " : "Unexpected argument: ") + arg;
            return ParseResult::Error;
        }
        std::string value = argv[i + 1];

        if (arg == "-c" || arg == "--config") {
            // already loaded
        } else if (arg == "-l" || arg == "--vm-list") {
            config.vmListPath = value;
        } else if (arg == "-t" || arg == "--ticket") {
            config.ticketReference = value;
        } else if (arg == "-o" || arg == "--output-dir") {
            config.outputDir = value;
        } else if (arg == "--format") {
            if (!parseReportFormat(value, config.reportFormat)) {
                error = "Invalid report format: " + value + " (expected csv or json)";
                return ParseResult::Error;
            }
        } else if (arg == "--policy") {
            if (!parseLocatePolicy(value, config.locatePolicy)) {
                error = "Invalid locate policy: " + value + " (expected first-match or exhaustive)";
                return ParseResult::Error;
            }
        } else if (arg == "--naming") {
            if (!parseNamingPolicy(value, config.namingPolicy)) {
                error = "Invalid naming policy: " + value + " (expected vm-disk or disk-only)";
                return ParseResult::Error;
            }
        } else if (arg == "--max-length") {
            if (!parseInt(arg, value, config.maxNameLength, error)) return ParseResult::Error;
        } else if (arg == "--target-resource-group") {
            config.targetResourceGroup = value;
        } else if (arg == "--sku") {
            config.skuName = value;
        } else if (arg == "--poll-interval") {
            if (!parseInt(arg, value, config.pollIntervalSeconds, error)) return ParseResult::Error;
        } else if (arg == "--timeout") {
            if (!parseInt(arg, value, config.timeoutSeconds, error)) return ParseResult::Error;
        } else if (arg == "--log-file") {
            config.logFile = value;
        } else if (arg == "--log-level") {
            if (!Logger::parseLevel(value, config.logLevel)) {
                error = "Invalid log level: " + value;
                return ParseResult::Error;
            }
        } else {
            error = "Unknown option: " + arg;
            return ParseResult::Error;
        }
        ++i;
    }
    return ParseResult::Ok;
}

bool SnapshotCLI::initializeLogging(const SnapshotConfig& config) const {
    Logger::setConsoleOutput(!config.quiet);
    if (Logger::isInitialized()) {
        Logger::setLogLevel(config.logLevel);
        return true;
    }
    return Logger::initialize(config.logFile, config.logLevel);
}

int SnapshotCLI::run(int argc, char* argv[]) {
    SnapshotConfig config;
    std::string error;

    switch (parseArguments(argc, argv, config, error)) {
        case ParseResult::Help:
            printUsage();
            return static_cast<int>(ExitCode::Ok);
        case ParseResult::Error:
            std::cerr << "Error: " << error << std::endl;
            printUsage();
            return static_cast<int>(ExitCode::UsageError);
        case ParseResult::Ok:
            break;
    }

    if (!initializeLogging(config)) {
        std::cerr << "Failed to initialize logger" << std::endl;
        return static_cast<int>(ExitCode::UsageError);
    }

    std::vector<std::string> vmIdentifiers;
    if (!VMListReader::read(config.vmListPath, vmIdentifiers, error)) {
        Logger::fatal(error);
        if (config.vmListPath.empty()) {
            printUsage();
        }
        return static_cast<int>(ExitCode::MissingVMList);
    }
    if (vmIdentifiers.empty()) {
        Logger::warning("VM list " + config.vmListPath + " contains no VM names");
    }

    if (!validateConfig(config, error)) {
        Logger::fatal(error);
        printUsage();
        return static_cast<int>(ExitCode::UsageError);
    }
    Logger::setRunTag(utils::trim(config.ticketReference));
    Logger::debug("Logging to " + Logger::getLogPath() + " at level " +
                  Logger::levelToString(Logger::getLogLevel()));

    auto runTime = std::chrono::system_clock::now();
    std::unique_ptr<CloudProvider> provider = providerFactory_(config);
    if (!provider) {
        Logger::fatal("Failed to create cloud provider");
        return static_cast<int>(ExitCode::UsageError);
    }

    SnapshotRun snapshotRun(*provider, config);
    ExitCode code = snapshotRun.execute(vmIdentifiers);
    if (code != ExitCode::Ok) {
        std::cerr << "Error: " << snapshotRun.getLastError() << std::endl;
        return static_cast<int>(code);
    }

    ReportWriter writer(config.outputDir, config.reportFormat);
    if (!writer.write(snapshotRun.outcomes().entries(), runTime)) {
        std::cerr << "Error: " << writer.getLastError() << std::endl;
        ReportWriter::printSummary(std::cout, snapshotRun.outcomes().summarize());
        return static_cast<int>(ExitCode::ReportWriteFailed);
    }

    ReportWriter::printSummary(std::cout, snapshotRun.outcomes().summarize());
    std::cout << "\nReport: " << writer.getReportPath() << std::endl;
    return static_cast<int>(ExitCode::Ok);
}
