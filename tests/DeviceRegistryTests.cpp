#include <cstdio>
#include <cstdlib>
#include <string>
#include <unistd.h>

#include <gtest/gtest.h>

#include "../core/DeviceRegistry.hpp"

using lan_watch::common::Device;
using lan_watch::common::MakeDevice;
using lan_watch::core::DeviceRegistry;

namespace {

Device DeviceWithMac(const std::string &ip, const std::string &mac)
{
    Device device = MakeDevice(ip);
    device.hardware_address = mac;
    return device;
}

class DeviceRegistryTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ASSERT_TRUE(registry.Initialize(":memory:"));
    }

    DeviceRegistry registry;
};

} // namespace

TEST_F(DeviceRegistryTest, EnsureRegisteredIsIdempotent)
{
    Device device = DeviceWithMac("192.168.1.5", "aa:bb:cc:dd:ee:01");

    ASSERT_TRUE(registry.EnsureRegistered(device));
    auto first = registry.Lookup("aa:bb:cc:dd:ee:01");
    ASSERT_TRUE(first.has_value());

    ASSERT_TRUE(registry.EnsureRegistered(device));
    auto second = registry.Lookup("aa:bb:cc:dd:ee:01");
    ASSERT_TRUE(second.has_value());

    EXPECT_EQ(first->id, second->id);
    EXPECT_EQ(registry.AllRecords().size(), 1u);
    EXPECT_EQ(second->name, "unknown");
}

TEST_F(DeviceRegistryTest, HyphenAndColonNotationShareOneRow)
{
    ASSERT_TRUE(registry.EnsureRegistered(DeviceWithMac("192.168.1.5", "AA-BB-CC-DD-EE-FF")));
    ASSERT_TRUE(registry.EnsureRegistered(DeviceWithMac("192.168.1.6", "aa:bb:cc:dd:ee:ff")));

    auto records = registry.AllRecords();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].hardware_address, "aa:bb:cc:dd:ee:ff");
}

TEST_F(DeviceRegistryTest, RegistrationKeepsStoredName)
{
    Device device = DeviceWithMac("192.168.1.5", "aa:bb:cc:dd:ee:01");
    ASSERT_TRUE(registry.EnsureRegistered(device));
    ASSERT_TRUE(registry.SetName("aa:bb:cc:dd:ee:01", "Printer"));

    device.display_name = "Something else";
    ASSERT_TRUE(registry.EnsureRegistered(device));

    EXPECT_EQ(registry.Lookup("aa:bb:cc:dd:ee:01")->name, "Printer");
}

TEST_F(DeviceRegistryTest, DeviceWithoutHardwareAddressIsNotRegistered)
{
    EXPECT_FALSE(registry.EnsureRegistered(MakeDevice("192.168.1.5")));
    EXPECT_TRUE(registry.AllRecords().empty());
}

TEST_F(DeviceRegistryTest, IdsAreDistinctAndStable)
{
    ASSERT_TRUE(registry.EnsureRegistered(DeviceWithMac("10.0.0.1", "02:00:00:00:00:01")));
    ASSERT_TRUE(registry.EnsureRegistered(DeviceWithMac("10.0.0.2", "02:00:00:00:00:02")));

    Device a = DeviceWithMac("10.0.0.1", "02:00:00:00:00:01");
    Device b = DeviceWithMac("10.0.0.99", "02:00:00:00:00:02");
    registry.AssignId(a);
    registry.AssignId(b);

    ASSERT_TRUE(a.id.has_value());
    ASSERT_TRUE(b.id.has_value());
    EXPECT_NE(*a.id, *b.id);
    EXPECT_EQ(registry.FindById(*b.id)->hardware_address, "02:00:00:00:00:02");
}

TEST_F(DeviceRegistryTest, AssignIdIsAssignOnce)
{
    Device device = DeviceWithMac("10.0.0.1", "02:00:00:00:00:01");
    ASSERT_TRUE(registry.EnsureRegistered(device));

    device.id = 99;
    registry.AssignId(device);
    EXPECT_EQ(device.id, 99);

    Device fresh = DeviceWithMac("10.0.0.1", "02:00:00:00:00:01");
    registry.AssignId(fresh);
    int assigned = *fresh.id;
    registry.AssignId(fresh);
    EXPECT_EQ(fresh.id, assigned);
}

TEST_F(DeviceRegistryTest, HydrateNameCopiesOnlyRealStoredNames)
{
    Device device = DeviceWithMac("10.0.0.1", "02:00:00:00:00:01");
    ASSERT_TRUE(registry.EnsureRegistered(device));

    registry.HydrateName(device);
    EXPECT_FALSE(device.display_name.has_value());

    ASSERT_TRUE(registry.SetName("02:00:00:00:00:01", "Laptop"));
    registry.HydrateName(device);
    EXPECT_EQ(device.display_name, "Laptop");
}

TEST_F(DeviceRegistryTest, HydrateNameLeavesResolvedNameAlone)
{
    Device device = DeviceWithMac("10.0.0.1", "02:00:00:00:00:01");
    ASSERT_TRUE(registry.EnsureRegistered(device));
    ASSERT_TRUE(registry.SetName("02:00:00:00:00:01", "Laptop"));

    device.display_name = "";
    registry.HydrateName(device);
    EXPECT_EQ(device.display_name, "");
}

TEST_F(DeviceRegistryTest, HydrateWithoutRowKeepsSentinel)
{
    Device device = DeviceWithMac("10.0.0.1", "02:00:00:00:00:01");
    registry.HydrateName(device);
    registry.AssignId(device);

    EXPECT_FALSE(device.display_name.has_value());
    EXPECT_FALSE(device.id.has_value());
}

TEST_F(DeviceRegistryTest, SetNameOverwritesAndRejectsUnknownDevices)
{
    ASSERT_TRUE(registry.EnsureRegistered(DeviceWithMac("10.0.0.1", "02:00:00:00:00:01")));

    EXPECT_TRUE(registry.SetName("02:00:00:00:00:01", "First"));
    EXPECT_TRUE(registry.SetName("02-00-00-00-00-01", "Second"));
    EXPECT_EQ(registry.Lookup("02:00:00:00:00:01")->name, "Second");

    EXPECT_FALSE(registry.SetName("02:00:00:00:00:77", "Ghost"));
    EXPECT_EQ(registry.AllRecords().size(), 1u);
}

TEST(DeviceRegistryFileTest, RowsSurviveReopen)
{
    char path[] = "/tmp/lanwatch-registry-XXXXXX";
    int fd = mkstemp(path);
    ASSERT_GE(fd, 0);
    close(fd);

    int id = -1;
    {
        DeviceRegistry registry;
        ASSERT_TRUE(registry.Initialize(path));
        ASSERT_TRUE(registry.EnsureRegistered(DeviceWithMac("10.0.0.1", "02:00:00:00:00:01")));
        ASSERT_TRUE(registry.SetName("02:00:00:00:00:01", "NAS"));
        id = registry.Lookup("02:00:00:00:00:01")->id;
    }
    {
        DeviceRegistry registry;
        ASSERT_TRUE(registry.Initialize(path));
        auto record = registry.Lookup("02:00:00:00:00:01");
        ASSERT_TRUE(record.has_value());
        EXPECT_EQ(record->id, id);
        EXPECT_EQ(record->name, "NAS");
    }

    std::remove(path);
    std::remove((std::string(path) + "-wal").c_str());
    std::remove((std::string(path) + "-shm").c_str());
}
