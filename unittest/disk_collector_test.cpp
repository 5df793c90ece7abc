#include <gtest/gtest.h>
#include "snapshot/disk_collector.hpp"
#include "fake_cloud_provider.hpp"

namespace {

ResolvedVM makeVM(const std::string& resourceGroup) {
    ResolvedVM vm;
    vm.identifier = "app-01";
    vm.context = {kContextA, "dev", "Enabled"};
    vm.resourceGroup = resourceGroup;
    vm.location = "westeurope";
    return vm;
}

} // namespace

TEST(DiskCollectorTest, OsDiskComesFirst) {
    ResolvedVM vm = makeVM("rg-app");
    vm.dataDisks.push_back(FakeCloudProvider::disk("data-0", DiskRole::Data));
    vm.dataDisks.push_back(FakeCloudProvider::disk("data-1", DiskRole::Data));
    vm.osDisk = FakeCloudProvider::disk("os", DiskRole::OS);

    DiskCollector collector;
    std::vector<DiskDescriptor> disks;
    ASSERT_TRUE(collector.collect(vm, disks));
    ASSERT_EQ(disks.size(), 3u);
    EXPECT_EQ(disks[0].name, "os");
    EXPECT_EQ(disks[0].role, DiskRole::OS);
    EXPECT_EQ(disks[1].name, "data-0");
    EXPECT_EQ(disks[2].name, "data-1");
}

TEST(DiskCollectorTest, DropsUnnamedDisks) {
    ResolvedVM vm = makeVM("rg-app");
    vm.osDisk = DiskDescriptor{"", "/disks/ephemeral", DiskRole::OS};
    vm.dataDisks.push_back(FakeCloudProvider::disk("data-0", DiskRole::Data));
    vm.dataDisks.push_back(DiskDescriptor{"", "", DiskRole::Data});

    DiskCollector collector;
    std::vector<DiskDescriptor> disks;
    ASSERT_TRUE(collector.collect(vm, disks));
    ASSERT_EQ(disks.size(), 1u);
    EXPECT_EQ(disks[0].name, "data-0");
}

TEST(DiskCollectorTest, NoOsDiskSlot) {
    ResolvedVM vm = makeVM("rg-app");
    vm.dataDisks.push_back(FakeCloudProvider::disk("data-0", DiskRole::Data));

    DiskCollector collector;
    std::vector<DiskDescriptor> disks;
    ASSERT_TRUE(collector.collect(vm, disks));
    ASSERT_EQ(disks.size(), 1u);
    EXPECT_EQ(disks[0].role, DiskRole::Data);
}

TEST(DiskCollectorTest, BlankResourceGroupIsSkipped) {
    ResolvedVM vm = makeVM("   ");
    vm.osDisk = FakeCloudProvider::disk("os", DiskRole::OS);

    DiskCollector collector;
    std::vector<DiskDescriptor> disks;
    EXPECT_FALSE(collector.collect(vm, disks));
    EXPECT_TRUE(disks.empty());
    EXPECT_FALSE(collector.getLastError().empty());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
