#pragma once

#include "common/snapshot_status.hpp"
#include "snapshot/snapshot_config.hpp"
#include <chrono>
#include <ostream>
#include <string>
#include <vector>

class ReportWriter {
public:
    ReportWriter(const std::string& outputDir, ReportFormat format);

    // Writes SnapshotReport_<timestamp>.<ext> under the output directory,
    // creating the directory if needed
    bool write(const std::vector<ReportEntry>& entries, std::chrono::system_clock::time_point runTime);

    std::string getReportPath() const { return reportPath_; }
    std::string getLastError() const { return lastError_; }

    static std::string reportFileName(std::chrono::system_clock::time_point runTime, ReportFormat format);
    static void writeCsv(std::ostream& out, const std::vector<ReportEntry>& entries);
    static void writeJson(std::ostream& out, const std::vector<ReportEntry>& entries);
    static std::string escapeCsv(const std::string& field);
    static void printSummary(std::ostream& out, const RunSummary& summary);

private:
    std::string outputDir_;
    ReportFormat format_;
    std::string reportPath_;
    std::string lastError_;
};
