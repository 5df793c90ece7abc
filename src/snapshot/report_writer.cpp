#include "snapshot/report_writer.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <nlohmann/json.hpp>

namespace {

const char* const kColumns[] = {
    "Timestamp", "SubscriptionId", "VMName", "DiskName",
    "SnapshotName", "Status", "ErrorMessage", "TicketReference"
};

} // namespace

ReportWriter::ReportWriter(const std::string& outputDir, ReportFormat format)
    : outputDir_(outputDir.empty() ? "." : outputDir), format_(format) {
}

bool ReportWriter::write(const std::vector<ReportEntry>& entries, std::chrono::system_clock::time_point runTime) {
    try {
        std::filesystem::path dir(outputDir_);
        if (!std::filesystem::exists(dir)) {
            std::filesystem::create_directories(dir);
        }

        std::filesystem::path path = dir / reportFileName(runTime, format_);
        std::ofstream file(path);
        if (!file.is_open()) {
            lastError_ = "Failed to open report file: " + path.string();
            Logger::error(lastError_);
            return false;
        }

        if (format_ == ReportFormat::Json) {
            writeJson(file, entries);
        } else {
            writeCsv(file, entries);
        }

        file.close();
        if (file.fail()) {
            lastError_ = "Failed to write report file: " + path.string();
            Logger::error(lastError_);
            return false;
        }

        reportPath_ = path.string();
        Logger::info("Report written to " + reportPath_ + " (" + std::to_string(entries.size()) + " rows)");
        return true;
    } catch (const std::filesystem::filesystem_error& e) {
        lastError_ = std::string("Failed to write report: ") + e.what();
        Logger::error(lastError_);
        return false;
    }
}

std::string ReportWriter::reportFileName(std::chrono::system_clock::time_point runTime, ReportFormat format) {
    return "SnapshotReport_" + utils::formatFileTimestamp(runTime) +
           (format == ReportFormat::Json ? ".json" : ".csv");
}

void ReportWriter::writeCsv(std::ostream& out, const std::vector<ReportEntry>& entries) {
    bool first = true;
    for (const char* column : kColumns) {
        out << (first ? "" : ",") << column;
        first = false;
    }
    out << "\n";

    for (const auto& entry : entries) {
        out << escapeCsv(entry.timestamp) << ","
            << escapeCsv(entry.accountContextId) << ","
            << escapeCsv(entry.vmIdentifier) << ","
            << escapeCsv(entry.diskName) << ","
            << escapeCsv(entry.snapshotName) << ","
            << escapeCsv(snapshotStatusToString(entry.status)) << ","
            << escapeCsv(entry.errorMessage) << ","
            << escapeCsv(entry.ticketReference) << "\n";
    }
}

void ReportWriter::writeJson(std::ostream& out, const std::vector<ReportEntry>& entries) {
    nlohmann::json rows = nlohmann::json::array();
    for (const auto& entry : entries) {
        rows.push_back({
            {"Timestamp", entry.timestamp},
            {"SubscriptionId", entry.accountContextId},
            {"VMName", entry.vmIdentifier},
            {"DiskName", entry.diskName},
            {"SnapshotName", entry.snapshotName},
            {"Status", snapshotStatusToString(entry.status)},
            {"ErrorMessage", entry.errorMessage.empty() ? nlohmann::json(nullptr)
                                                        : nlohmann::json(entry.errorMessage)},
            {"TicketReference", entry.ticketReference}
        });
    }
    out << rows.dump(4) << "\n";
}

std::string ReportWriter::escapeCsv(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }

    std::string escaped = "\"";
    for (char c : field) {
        if (c == '"') {
            escaped += "\"\"";
        } else {
            escaped += c;
        }
    }
    escaped += "\"";
    return escaped;
}

void ReportWriter::printSummary(std::ostream& out, const RunSummary& summary) {
    out << "\nSummary\n"
        << "-------\n"
        << std::left << std::setw(10) << "Success" << summary.success << "\n"
        << std::left << std::setw(10) << "Failed" << summary.failed << "\n"
        << std::left << std::setw(10) << "NotFound" << summary.notFound << "\n";
    if (summary.skipped > 0) {
        out << std::left << std::setw(10) << "Skipped" << summary.skipped << "\n";
    }
}
