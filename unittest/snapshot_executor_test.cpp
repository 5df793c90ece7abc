#include <gtest/gtest.h>
#include "snapshot/snapshot_executor.hpp"
#include "fake_cloud_provider.hpp"

class SnapshotExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.ticketReference = " INC123456 ";
        provider_.addContext(kContextA);
        ASSERT_TRUE(provider_.setActiveContext(kContextA));

        vm_.identifier = "web-vm-01";
        vm_.context = provider_.contexts[0];
        vm_.resourceGroup = "rg-web";
        vm_.location = "westeurope";
        disk_ = FakeCloudProvider::disk("web-vm-01-osdisk", DiskRole::OS);
    }

    FakeCloudProvider provider_;
    SnapshotConfig config_;
    ResolvedVM vm_;
    DiskDescriptor disk_;
};

TEST_F(SnapshotExecutorTest, CreatesSnapshotFromResolvedDisk) {
    SnapshotExecutor executor(provider_, config_);
    SnapshotOutcome outcome = executor.execute(vm_, disk_, "web-vm-01_web-vm-01-osdisk_INC123456");

    EXPECT_TRUE(outcome.created());
    EXPECT_TRUE(outcome.reason.empty());
    ASSERT_EQ(provider_.snapshotCalls.size(), 1u);

    const SnapshotRequest& request = provider_.snapshotCalls[0].request;
    EXPECT_EQ(request.composedName, "web-vm-01_web-vm-01-osdisk_INC123456");
    EXPECT_EQ(request.location, "westeurope");
    EXPECT_EQ(request.targetResourceGroup, "rg-web");
    EXPECT_EQ(request.sourceDiskReference,
              std::string("/subscriptions/") + kContextA +
              "/resourceGroups/rg-web/providers/Microsoft.Compute/disks/web-vm-01-osdisk");
    EXPECT_EQ(request.tags.at("ticket"), "INC123456");
    EXPECT_EQ(request.tags.at("sourceVm"), "web-vm-01");
    EXPECT_EQ(request.tags.at("sourceDisk"), "web-vm-01-osdisk");
}

TEST_F(SnapshotExecutorTest, ProviderMessageIsKeptVerbatim) {
    provider_.snapshotErrors["snap"] =
        "The resource 'snap' already exists in location 'westeurope' in resource group 'rg-web'.";

    SnapshotExecutor executor(provider_, config_);
    SnapshotOutcome outcome = executor.execute(vm_, disk_, "snap");

    EXPECT_FALSE(outcome.created());
    EXPECT_EQ(outcome.reason,
              "The resource 'snap' already exists in location 'westeurope' in resource group 'rg-web'.");
    EXPECT_EQ(outcome.request.composedName, "snap");
    // One attempt only
    EXPECT_EQ(provider_.snapshotCalls.size(), 1u);
}

TEST_F(SnapshotExecutorTest, DiskLookupFailureSkipsCreation) {
    provider_.diskErrors["web-vm-01-osdisk"] = "ResourceNotFound";

    SnapshotExecutor executor(provider_, config_);
    SnapshotOutcome outcome = executor.execute(vm_, disk_, "snap");

    EXPECT_FALSE(outcome.created());
    EXPECT_EQ(outcome.reason, "ResourceNotFound");
    EXPECT_TRUE(provider_.snapshotCalls.empty());
}

TEST_F(SnapshotExecutorTest, DiskInAnotherResourceGroup) {
    disk_.sourceReference = std::string("/subscriptions/") + kContextA +
                            "/resourceGroups/rg-shared-disks/providers/Microsoft.Compute/disks/web-vm-01-osdisk";

    SnapshotExecutor executor(provider_, config_);
    SnapshotOutcome outcome = executor.execute(vm_, disk_, "snap");

    ASSERT_TRUE(outcome.created()) << outcome.reason;
    ASSERT_EQ(provider_.diskLookups.size(), 1u);
    EXPECT_EQ(provider_.diskLookups[0], "rg-shared-disks");
    EXPECT_NE(provider_.snapshotCalls[0].request.sourceDiskReference.find("/resourceGroups/rg-shared-disks/"),
              std::string::npos);
    // The snapshot itself still lands beside the VM
    EXPECT_EQ(provider_.snapshotCalls[0].request.targetResourceGroup, "rg-web");
}

TEST_F(SnapshotExecutorTest, DiskWithoutResourceGroupInIdUsesVmGroup) {
    SnapshotExecutor executor(provider_, config_);
    executor.execute(vm_, disk_, "snap");

    ASSERT_EQ(provider_.diskLookups.size(), 1u);
    EXPECT_EQ(provider_.diskLookups[0], "rg-web");
}

TEST_F(SnapshotExecutorTest, TargetResourceGroupOverride) {
    config_.targetResourceGroup = "rg-snapshots";
    config_.incremental = true;
    config_.skuName = "Standard_ZRS";

    SnapshotExecutor executor(provider_, config_);
    SnapshotRequest request = executor.buildRequest(vm_, disk_, "snap");
    EXPECT_EQ(request.targetResourceGroup, "rg-snapshots");
    EXPECT_TRUE(request.incremental);
    EXPECT_EQ(request.skuName, "Standard_ZRS");
    EXPECT_EQ(request.sourceDiskReference, disk_.sourceReference);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
