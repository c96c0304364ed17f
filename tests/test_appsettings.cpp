#include <gtest/gtest.h>
#include "appsettings.h"
#include <QTemporaryDir>

TEST(AppSettingsTest, DefaultsWhenFileIsEmpty) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    AppSettings settings(dir.filePath("settings.ini"));

    EXPECT_EQ(settings.commandTimeoutMs(), AppSettings::DefaultCommandTimeoutMs);
    EXPECT_TRUE(settings.adbPath().isEmpty());
    EXPECT_TRUE(settings.workDir().endsWith("transfers"));
    EXPECT_TRUE(settings.logDir().endsWith("logs"));

    const CrossTransferConfig config = settings.transferConfig();
    EXPECT_TRUE(config.photos);
    EXPECT_TRUE(config.sms);
    EXPECT_TRUE(config.convertHeic);
    EXPECT_TRUE(config.ignoreThumbnails);
}

TEST(AppSettingsTest, PersistsValuesAcrossInstances) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString iniPath = dir.filePath("settings.ini");

    {
        AppSettings settings(iniPath);
        settings.setWorkDir("/tmp/migracao");
        settings.setAdbPath("/opt/platform-tools/adb");
        settings.setCommandTimeoutMs(30000);

        CrossTransferConfig config;
        config.music = false;
        config.convertHeic = false;
        settings.setTransferConfig(config);
        settings.sync();
    }

    AppSettings reloaded(iniPath);
    EXPECT_EQ(reloaded.workDir(), "/tmp/migracao");
    EXPECT_EQ(reloaded.adbPath(), "/opt/platform-tools/adb");
    EXPECT_EQ(reloaded.commandTimeoutMs(), 30000);

    const CrossTransferConfig config = reloaded.transferConfig();
    EXPECT_FALSE(config.music);
    EXPECT_FALSE(config.convertHeic);
    EXPECT_TRUE(config.photos);
}

TEST(AppSettingsTest, InvalidTimeoutFallsBackToDefault) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    AppSettings settings(dir.filePath("settings.ini"));
    settings.setCommandTimeoutMs(-5);
    EXPECT_EQ(settings.commandTimeoutMs(), AppSettings::DefaultCommandTimeoutMs);
}

TEST(AppSettingsTest, SettersEmitChangeOnlyOnDifference) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    AppSettings settings(dir.filePath("settings.ini"));

    int changes = 0;
    QObject::connect(&settings, &AppSettings::settingsChanged, [&changes]() { ++changes; });

    settings.setAdbPath("/usr/bin/adb");
    settings.setAdbPath("/usr/bin/adb");
    EXPECT_EQ(changes, 1);
}
