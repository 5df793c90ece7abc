#pragma once

#include <cstddef>
#include <string>

inline constexpr const char* kNotApplicable = "N/A";
inline constexpr const char* kNoNamedDisksMessage = "VM has no named disks; nothing to snapshot";

enum class SnapshotStatus {
    Success,
    Failed,
    NotFound,
    Skipped
};

inline std::string snapshotStatusToString(SnapshotStatus status) {
    switch (status) {
        case SnapshotStatus::Success:  return "Success";
        case SnapshotStatus::Failed:   return "Failed";
        case SnapshotStatus::NotFound: return "NotFound";
        case SnapshotStatus::Skipped:  return "Skipped";
    }
    return "Unknown";
}

struct ReportEntry {
    std::string timestamp;
    std::string accountContextId;
    std::string vmIdentifier;
    std::string diskName;
    std::string snapshotName;
    SnapshotStatus status{SnapshotStatus::Failed};
    std::string errorMessage;
    std::string ticketReference;
};

struct RunSummary {
    size_t success{0};
    size_t failed{0};
    size_t notFound{0};
    size_t skipped{0};

    size_t total() const { return success + failed + notFound + skipped; }
};

// Process exit codes
enum class ExitCode {
    Ok = 0,
    UsageError = 1,
    MissingVMList = 2,
    AuthenticationFailed = 3,
    NoValidContexts = 4,
    ReportWriteFailed = 5
};
