#include <gtest/gtest.h>
#include "snapshot/name_composer.hpp"
#include <string>

TEST(NameComposerTest, CombinesVmDiskAndTicket) {
    NameComposer composer;
    std::string name = composer.compose("web-vm-01", "web-vm-01-osdisk", "INC123456");
    EXPECT_EQ(name, "web-vm-01_web-vm-01-osdisk_INC123456");
    EXPECT_EQ(name.length(), 36u);
    EXPECT_FALSE(composer.exceedsLimit(name));
}

TEST(NameComposerTest, TrimsTicketReference) {
    EXPECT_EQ(NameComposer::compose("vm", "disk", "  CHG42 \t", 82, NamingPolicy::VmDiskCombined),
              "vm_disk_CHG42");
}

TEST(NameComposerTest, TruncatesBaseToFitTicket) {
    std::string vm(60, 'v');
    std::string disk(40, 'd');
    std::string name = NameComposer::compose(vm, disk, "INC1", 82, NamingPolicy::VmDiskCombined);

    EXPECT_EQ(name.length(), 82u);
    EXPECT_EQ(name.substr(name.length() - 5), "_INC1");
    // 77 characters of "{vm}_{disk}" survive
    EXPECT_EQ(name.substr(0, 60), vm);
    EXPECT_EQ(name[60], '_');
    EXPECT_EQ(name.substr(61, 16), std::string(16, 'd'));
}

TEST(NameComposerTest, CombinedPolicyOverflowsWithLongTicket) {
    std::string ticket(90, 'T');
    std::string name = NameComposer::compose("vm", "disk", ticket, 82, NamingPolicy::VmDiskCombined);

    // No room for the base at all, but the ticket is kept whole
    EXPECT_EQ(name, "_" + ticket);
    EXPECT_GT(name.length(), 82u);

    NameComposer composer(NamingPolicy::VmDiskCombined, 82);
    EXPECT_TRUE(composer.exceedsLimit(name));
}

TEST(NameComposerTest, CombinedPolicyOverflowsWhenTicketEqualsMaxLength) {
    std::string ticket(10, 'X');
    std::string name = NameComposer::compose("vm", "disk", ticket, 10, NamingPolicy::VmDiskCombined);
    EXPECT_EQ(name.length(), 11u);
}

TEST(NameComposerTest, BaseOnlyPolicyOmitsVmName) {
    EXPECT_EQ(NameComposer::compose("web-vm-01", "web-vm-01-osdisk", "INC123456", 82, NamingPolicy::BaseOnly),
              "web-vm-01-osdisk_INC123456");
}

TEST(NameComposerTest, BaseOnlyPolicyReclampsToMaxLength) {
    std::string ticket(90, 'T');
    std::string name = NameComposer::compose("vm", "disk", ticket, 82, NamingPolicy::BaseOnly);
    EXPECT_EQ(name.length(), 82u);
    EXPECT_EQ(name, ("_" + ticket).substr(0, 82));
}

TEST(NameComposerTest, BaseOnlyPolicyNeverExceedsLimit) {
    for (int maxLength = 1; maxLength <= 40; ++maxLength) {
        for (size_t ticketLength = 0; ticketLength <= 45; ticketLength += 5) {
            std::string name = NameComposer::compose("some-vm", "some-vm-datadisk-0",
                                                     std::string(ticketLength, 'k'),
                                                     maxLength, NamingPolicy::BaseOnly);
            EXPECT_LE(name.length(), static_cast<size_t>(maxLength))
                << "maxLength=" << maxLength << " ticketLength=" << ticketLength;
        }
    }
}

TEST(NameComposerTest, IsDeterministic) {
    NameComposer composer(NamingPolicy::VmDiskCombined, 40);
    std::string first = composer.compose("database-server-primary", "database-server-primary-data-01", "RFC-2024-0042");
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(composer.compose("database-server-primary", "database-server-primary-data-01", "RFC-2024-0042"), first);
    }
}

TEST(NameComposerTest, EmptyTicketStillAppendsSeparator) {
    EXPECT_EQ(NameComposer::compose("vm", "disk", "   ", 82, NamingPolicy::VmDiskCombined), "vm_disk_");
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
