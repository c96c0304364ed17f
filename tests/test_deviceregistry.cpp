#include <gtest/gtest.h>
#include "deviceregistry.h"
#include "fakedevice.h"

TEST(DeviceRegistryTest, ListsDevicesFromEveryBackend) {
    FakeDevice android("ANDROID1", DevicePlatform::Android, "Pixel 8");
    FakeDevice iphone("00008110-AAAA", DevicePlatform::Ios, "iPhone15,2");

    DeviceRegistry registry;
    registry.registerBackend(&android);
    registry.registerBackend(&iphone);
    registry.registerBackend(&android);

    const QList<UnifiedDeviceInfo> devices = registry.listAllDevices();
    ASSERT_EQ(devices.size(), 2);
    EXPECT_EQ(devices[0].serial, "ANDROID1");
    EXPECT_EQ(devices[1].serial, "00008110-AAAA");
}

TEST(DeviceRegistryTest, ResolveEnumeratesOnCacheMiss) {
    FakeDevice android("ANDROID1", DevicePlatform::Android);
    DeviceRegistry registry;
    registry.registerBackend(&android);

    EXPECT_EQ(registry.resolve("ANDROID1"), &android);
    EXPECT_EQ(android.calls.count("listDevices"), 1);

    // Acierto de caché: no vuelve a enumerar
    EXPECT_EQ(registry.resolve("ANDROID1"), &android);
    EXPECT_EQ(android.calls.count("listDevices"), 1);
}

TEST(DeviceRegistryTest, UnknownDeviceResolvesToNull) {
    FakeDevice android("ANDROID1", DevicePlatform::Android);
    DeviceRegistry registry;
    registry.registerBackend(&android);

    EXPECT_EQ(registry.resolve("missing"), nullptr);
    EXPECT_EQ(registry.resolve(""), nullptr);
    EXPECT_EQ(registry.platformOf("missing"), DevicePlatform::Unknown);
}

TEST(DeviceRegistryTest, DisconnectedDeviceDisappearsAfterRefresh) {
    FakeDevice android("ANDROID1", DevicePlatform::Android);
    DeviceRegistry registry;
    registry.registerBackend(&android);
    ASSERT_EQ(registry.listAllDevices().size(), 1);

    android.connected = false;
    EXPECT_TRUE(registry.listAllDevices().isEmpty());
    EXPECT_TRUE(registry.deviceInfo("ANDROID1").serial.isEmpty());
}

TEST(DeviceRegistryTest, CrossPlatformNeedsBothResolved) {
    FakeDevice android("ANDROID1", DevicePlatform::Android);
    FakeDevice otherAndroid("ANDROID2", DevicePlatform::Android);
    FakeDevice iphone("IPHONE1", DevicePlatform::Ios);
    DeviceRegistry registry;
    registry.registerBackend(&android);
    registry.registerBackend(&otherAndroid);
    registry.registerBackend(&iphone);

    EXPECT_FALSE(registry.isCrossPlatform("ANDROID1", "IPHONE1"));

    registry.listAllDevices();
    EXPECT_TRUE(registry.isCrossPlatform("ANDROID1", "IPHONE1"));
    EXPECT_FALSE(registry.isCrossPlatform("ANDROID1", "ANDROID2"));
    EXPECT_EQ(registry.platformOf("IPHONE1"), DevicePlatform::Ios);
}

TEST(DeviceInfoTest, FriendlyNameFallsBackToSerial) {
    UnifiedDeviceInfo info;
    info.serial = "XYZ";
    EXPECT_EQ(info.friendlyName(), "XYZ");
    info.model = "Galaxy S23";
    EXPECT_EQ(info.friendlyName(), "Galaxy S23");
    info.manufacturer = "Samsung";
    EXPECT_EQ(info.friendlyName(), "Samsung Galaxy S23");
}

TEST(DeviceInfoTest, FormatsBytesWithOneDecimal) {
    EXPECT_EQ(formatBytes(512), "512.0 B");
    EXPECT_EQ(formatBytes(1536), "1.5 KB");
    EXPECT_EQ(formatBytes(1073741824LL), "1.0 GB");
}

TEST(DeviceInfoTest, DownloadsDirectoryPerPlatform) {
    EXPECT_EQ(downloadsDirectory(DevicePlatform::Android), "/sdcard/Download");
    EXPECT_EQ(downloadsDirectory(DevicePlatform::Ios), "/Downloads");
    EXPECT_TRUE(downloadsDirectory(DevicePlatform::Unknown).isEmpty());
}

TEST(DeviceInterfaceTest, ShellIsUnsupportedByDefault) {
    class NoShellDevice : public FakeDevice {
    public:
        NoShellDevice() : FakeDevice("X", DevicePlatform::Ios) {}
        CommandResult runShell(const QString &command, const QString &serial, int timeoutMs) override
        {
            return DeviceInterface::runShell(command, serial, timeoutMs);
        }
    };

    NoShellDevice device;
    CommandResult result = device.runShell("ls", "X", 1000);
    EXPECT_EQ(result.status, CommandStatus::Unsupported);
    EXPECT_FALSE(result.ok());
}
