#include <gtest/gtest.h>
#include "snapshot/snapshot_cli.hpp"
#include "common/snapshot_status.hpp"
#include "fake_cloud_provider.hpp"
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

class SnapshotCLITest : public ::testing::Test {
protected:
    void SetUp() override {
        workDir_ = std::filesystem::temp_directory_path() / "azsnap_cli_test";
        std::filesystem::remove_all(workDir_);
        std::filesystem::create_directories(workDir_);
        vmList_ = (workDir_ / "vms.txt").string();
        std::ofstream(vmList_) << "web-vm-01\nghost-vm\n";

        authenticate_ = true;
        validContexts_ = true;
    }

    void TearDown() override {
        std::filesystem::remove_all(workDir_);
    }

    int runCli(std::vector<std::string> args) {
        args.insert(args.begin(), "azsnap");
        args.push_back("--log-file");
        args.push_back((std::filesystem::temp_directory_path() / "azsnap_cli_test.log").string());
        args.push_back("--quiet");

        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }

        SnapshotCLI cli([this](const SnapshotConfig&) {
            auto provider = std::make_unique<FakeCloudProvider>();
            provider->authenticateResult = authenticate_;
            provider->addContext(validContexts_ ? kContextA : "bogus");
            VirtualMachine& vm = provider->addVM(kContextA, "web-vm-01", "rg-web");
            vm.osDisk = FakeCloudProvider::disk("web-vm-01-osdisk", DiskRole::OS);
            return std::unique_ptr<CloudProvider>(std::move(provider));
        });
        return cli.run(static_cast<int>(argv.size()), argv.data());
    }

    std::vector<std::filesystem::path> reports() const {
        std::vector<std::filesystem::path> found;
        for (const auto& entry : std::filesystem::directory_iterator(workDir_ / "out")) {
            found.push_back(entry.path());
        }
        return found;
    }

    std::filesystem::path workDir_;
    std::string vmList_;
    bool authenticate_;
    bool validContexts_;
};

TEST_F(SnapshotCLITest, ParsesAllOptions) {
    std::vector<std::string> args = {
        "azsnap", "-l", "vms.txt", "-t", "CHG1", "-o", "/reports", "--format", "json",
        "--policy", "exhaustive", "--naming", "disk-only", "--max-length", "60",
        "--target-resource-group", "rg-snap", "--sku", "Premium_LRS", "--incremental",
        "--poll-interval", "2", "--timeout", "90", "--log-level", "debug"
    };
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }

    SnapshotCLI cli;
    SnapshotConfig config;
    std::string error;
    ASSERT_EQ(cli.parseArguments(static_cast<int>(argv.size()), argv.data(), config, error), ParseResult::Ok) << error;

    EXPECT_EQ(config.vmListPath, "vms.txt");
    EXPECT_EQ(config.ticketReference, "CHG1");
    EXPECT_EQ(config.outputDir, "/reports");
    EXPECT_EQ(config.reportFormat, ReportFormat::Json);
    EXPECT_EQ(config.locatePolicy, LocatePolicy::Exhaustive);
    EXPECT_EQ(config.namingPolicy, NamingPolicy::BaseOnly);
    EXPECT_EQ(config.maxNameLength, 60);
    EXPECT_EQ(config.targetResourceGroup, "rg-snap");
    EXPECT_EQ(config.skuName, "Premium_LRS");
    EXPECT_TRUE(config.incremental);
    EXPECT_EQ(config.pollIntervalSeconds, 2);
    EXPECT_EQ(config.timeoutSeconds, 90);
    EXPECT_EQ(config.logLevel, LogLevel::DEBUG);
}

TEST_F(SnapshotCLITest, FlagsOverrideConfigFile) {
    std::string configPath = (workDir_ / "config.json").string();
    std::ofstream(configPath) << R"({"ticket": "FROM-FILE", "maxLength": 50, "policy": "exhaustive"})";

    std::vector<std::string> args = {"azsnap", "-t", "FROM-FLAG", "--config", configPath};
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }

    SnapshotCLI cli;
    SnapshotConfig config;
    std::string error;
    ASSERT_EQ(cli.parseArguments(static_cast<int>(argv.size()), argv.data(), config, error), ParseResult::Ok) << error;
    EXPECT_EQ(config.ticketReference, "FROM-FLAG");
    EXPECT_EQ(config.maxNameLength, 50);
    EXPECT_EQ(config.locatePolicy, LocatePolicy::Exhaustive);
}

TEST_F(SnapshotCLITest, RejectsBadValues) {
    SnapshotCLI cli;
    SnapshotConfig config;
    std::string error;

    std::vector<std::vector<std::string>> cases = {
        {"azsnap", "--max-length", "abc"},
        {"azsnap", "--policy", "random"},
        {"azsnap", "--naming", "short"},
        {"azsnap", "--format", "xml"},
        {"azsnap", "--bogus", "1"},
        {"azsnap", "--ticket"},
    };
    for (auto& args : cases) {
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        EXPECT_EQ(cli.parseArguments(static_cast<int>(argv.size()), argv.data(), config, error), ParseResult::Error)
            << args[1];
    }
}

TEST_F(SnapshotCLITest, HelpExitsCleanly) {
    EXPECT_EQ(runCli({"--help"}), static_cast<int>(ExitCode::Ok));
}

TEST_F(SnapshotCLITest, CompletedRunWritesReport) {
    int code = runCli({"-l", vmList_, "-t", "INC123456", "-o", (workDir_ / "out").string()});
    ASSERT_EQ(code, static_cast<int>(ExitCode::Ok));

    auto files = reports();
    ASSERT_EQ(files.size(), 1u);
    std::ifstream report(files[0]);
    std::string header, first, second, extra;
    std::getline(report, header);
    std::getline(report, first);
    std::getline(report, second);
    EXPECT_FALSE(std::getline(report, extra));
    EXPECT_NE(first.find(",web-vm-01_web-vm-01-osdisk_INC123456,Success,"), std::string::npos);
    EXPECT_NE(second.find(",N/A,ghost-vm,N/A,N/A,NotFound,"), std::string::npos);
}

TEST_F(SnapshotCLITest, MissingVmListIsDistinguished) {
    EXPECT_EQ(runCli({"-t", "INC1"}), static_cast<int>(ExitCode::MissingVMList));
    EXPECT_EQ(runCli({"-l", (workDir_ / "nope.txt").string(), "-t", "INC1"}),
              static_cast<int>(ExitCode::MissingVMList));
}

TEST_F(SnapshotCLITest, NoArgumentsMeansMissingVmList) {
    EXPECT_EQ(runCli({}), static_cast<int>(ExitCode::MissingVMList));
}

TEST_F(SnapshotCLITest, MissingTicketIsUsageError) {
    EXPECT_EQ(runCli({"-l", vmList_}), static_cast<int>(ExitCode::UsageError));
}

TEST_F(SnapshotCLITest, AuthenticationFailureWritesNoReport) {
    authenticate_ = false;
    EXPECT_EQ(runCli({"-l", vmList_, "-t", "INC1", "-o", (workDir_ / "out").string()}),
              static_cast<int>(ExitCode::AuthenticationFailed));
    EXPECT_FALSE(std::filesystem::exists(workDir_ / "out"));
}

TEST_F(SnapshotCLITest, NoValidContextsWritesNoReport) {
    validContexts_ = false;
    EXPECT_EQ(runCli({"-l", vmList_, "-t", "INC1", "-o", (workDir_ / "out").string()}),
              static_cast<int>(ExitCode::NoValidContexts));
    EXPECT_FALSE(std::filesystem::exists(workDir_ / "out"));
}

TEST_F(SnapshotCLITest, UnwritableReportDirectory) {
    // A regular file where the output directory should be
    std::string blocker = (workDir_ / "blocker").string();
    std::ofstream(blocker) << "x";
    EXPECT_EQ(runCli({"-l", vmList_, "-t", "INC1", "-o", blocker}),
              static_cast<int>(ExitCode::ReportWriteFailed));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
