#include <gtest/gtest.h>
#include "adbdevice.h"
#include "iosdevice.h"
#include "toolrunner.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSqlDatabase>
#include <QSqlQuery>
#include <QTemporaryDir>

namespace {

void touch(const QString &path)
{
    QDir().mkpath(QFileInfo(path).absolutePath());
    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    file.write("x");
}

// Ejecuta sentencias sobre una base SQLite nueva
void createDatabase(const QString &path, const QStringList &statements)
{
    const QString connectionName = "test_fixture_db";
    {
        QSqlDatabase db = QSqlDatabase::addDatabase("QSQLITE", connectionName);
        db.setDatabaseName(path);
        ASSERT_TRUE(db.open());
        QSqlQuery query(db);
        for (const QString &statement : statements) {
            ASSERT_TRUE(query.exec(statement)) << qPrintable(statement);
        }
        db.close();
    }
    QSqlDatabase::removeDatabase(connectionName);
}

} // namespace

TEST(AdbParserTest, ParsesDeviceListWithStatesAndProperties) {
    const QString output =
        "List of devices attached\n"
        "R58M12345\tdevice usb:1-1 product:beyond1 model:SM_G973F device:beyond1\n"
        "emulator-5554\tunauthorized\n"
        "0123ABCD\toffline\n"
        "\n";

    const QList<UnifiedDeviceInfo> devices = AdbDevice::parseDeviceList(output);
    ASSERT_EQ(devices.size(), 3);

    EXPECT_EQ(devices[0].serial, "R58M12345");
    EXPECT_EQ(devices[0].platform, DevicePlatform::Android);
    EXPECT_EQ(devices[0].state, DeviceState::Connected);
    EXPECT_EQ(devices[0].model, "SM_G973F");
    EXPECT_EQ(devices[0].product, "beyond1");
    EXPECT_EQ(devices[0].androidCodename, "beyond1");

    EXPECT_EQ(devices[1].state, DeviceState::Unauthorized);
    EXPECT_EQ(devices[2].state, DeviceState::Offline);
}

TEST(AdbParserTest, DaemonMessagesAreIgnored) {
    const QString output =
        "* daemon not running; starting now at tcp:5037\n"
        "* daemon started successfully\n"
        "List of devices attached\n";
    EXPECT_TRUE(AdbDevice::parseDeviceList(output).isEmpty());
}

TEST(AdbParserTest, DiskUsageIsReportedInBytes) {
    const QString output =
        "Filesystem     1K-blocks     Used Available Use% Mounted on\n"
        "/dev/fuse      115000000 40000000  75000000  35% /storage/emulated\n";

    const QPair<qint64, qint64> usage = AdbDevice::parseDiskUsage(output);
    EXPECT_EQ(usage.first, 115000000LL * 1024);
    EXPECT_EQ(usage.second, 75000000LL * 1024);

    const QPair<qint64, qint64> unknown = AdbDevice::parseDiskUsage("df: /storage/emulated: No such file");
    EXPECT_EQ(unknown.first, -1);
    EXPECT_EQ(unknown.second, -1);
}

TEST(AdbParserTest, BatteryLevel) {
    EXPECT_EQ(AdbDevice::parseBatteryLevel("Current Battery Service state:\n  AC powered: false\n  level: 87\n"), 87);
    EXPECT_EQ(AdbDevice::parseBatteryLevel("nada"), -1);
}

TEST(AdbParserTest, SmsQueryRowsRequireAddressAndBody) {
    const QString output =
        "Row: 0 address=+5511999990000, body=Oi tudo bem?, date=1704103200000, type=2, read=1, thread_id=7\n"
        "Row: 1 address=+5511988880000, date=1704103200001, type=1\n"
        "Row: 2 address=123, body=, date=1, type=1, read=0, thread_id=3\n";

    const QList<SMSEntry> messages = AdbDevice::parseSmsQuery(output);
    ASSERT_EQ(messages.size(), 2);

    EXPECT_EQ(messages[0].address, "+5511999990000");
    EXPECT_EQ(messages[0].body, "Oi tudo bem?");
    EXPECT_EQ(messages[0].dateMs, 1704103200000LL);
    EXPECT_EQ(messages[0].direction, SMSEntry::Sent);
    EXPECT_TRUE(messages[0].read);
    EXPECT_EQ(messages[0].threadId, 7);

    EXPECT_EQ(messages[1].address, "123");
    EXPECT_TRUE(messages[1].body.isEmpty());
    EXPECT_FALSE(messages[1].read);
}

TEST(AdbParserTest, LookupKeys) {
    const QString output =
        "Row: 0 lookup=0r1-ABC\n"
        "Row: 1 lookup=2890i3f1c\n";
    EXPECT_EQ(AdbDevice::parseLookupKeys(output), QStringList({"0r1-ABC", "2890i3f1c"}));
}

TEST(AdbParserTest, ShellQuoteEscapesSingleQuotes) {
    EXPECT_EQ(AdbDevice::shellQuote("simples"), "'simples'");
    EXPECT_EQ(AdbDevice::shellQuote("it's"), "'it'\\''s'");
}

TEST(IosParserTest, KeyValuesSkipNestedLines) {
    const QString output =
        "DeviceName: iPhone de Ana\n"
        "ProductType: iPhone15,2\n"
        "ProductVersion: 17.5\n"
        "SupportedDeviceFamilies:\n"
        "  1: 1\n"
        "TimeZone: America/Sao_Paulo\n";

    const QMap<QString, QString> values = IosDevice::parseKeyValues(output);
    EXPECT_EQ(values.value("DeviceName"), "iPhone de Ana");
    EXPECT_EQ(values.value("ProductType"), "iPhone15,2");
    EXPECT_EQ(values.value("ProductVersion"), "17.5");
    EXPECT_EQ(values.value("TimeZone"), "America/Sao_Paulo");
    EXPECT_FALSE(values.contains("1"));
}

TEST(IosBackupTest, FindsFileByKnownHash) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString hash = IosDevice::SmsBackupHash;
    touch(dir.filePath(hash.left(2) + "/" + hash));

    EXPECT_EQ(IosDevice::findBackupFile(dir.path(), hash, "Library/SMS/sms.db"),
              dir.filePath(hash.left(2) + "/" + hash));
}

TEST(IosBackupTest, FallsBackToManifestLookup) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString fileId = "0123456789abcdef0123456789abcdef01234567";
    createDatabase(dir.filePath("Manifest.db"), {
        "CREATE TABLE Files (fileID TEXT PRIMARY KEY, domain TEXT, relativePath TEXT, flags INTEGER, file BLOB)",
        "INSERT INTO Files (fileID, domain, relativePath, flags) VALUES ('" + fileId
            + "', 'HomeDomain', 'Library/SMS/sms.db', 1)"
    });
    touch(dir.filePath(fileId));

    EXPECT_EQ(IosDevice::findBackupFile(dir.path(), IosDevice::SmsBackupHash, "Library/SMS/sms.db"),
              dir.filePath(fileId));
    EXPECT_TRUE(IosDevice::findBackupFile(dir.path(), IosDevice::SmsBackupHash, "Library/Other.db").isEmpty());
}

TEST(IosBackupTest, MissingBackupYieldsEmptyPath) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    EXPECT_TRUE(IosDevice::findBackupFile(dir.path(), IosDevice::AddressBookBackupHash,
                                          "Library/AddressBook/AddressBook.sqlitedb").isEmpty());
}

TEST(IosBackupTest, ReadsAddressBookPhonesAndEmails) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString dbPath = dir.filePath("AddressBook.sqlitedb");
    createDatabase(dbPath, {
        "CREATE TABLE ABPerson (ROWID INTEGER PRIMARY KEY, First TEXT, Last TEXT, Organization TEXT)",
        "CREATE TABLE ABMultiValue (UID INTEGER PRIMARY KEY, record_id INTEGER, property INTEGER, value TEXT)",
        "INSERT INTO ABPerson VALUES (1, 'Ana', 'Silva', NULL)",
        "INSERT INTO ABPerson VALUES (2, NULL, NULL, 'Padaria Central')",
        "INSERT INTO ABMultiValue (record_id, property, value) VALUES (1, 3, '+5511999990000')",
        "INSERT INTO ABMultiValue (record_id, property, value) VALUES (1, 4, 'ana@example.com')",
        "INSERT INTO ABMultiValue (record_id, property, value) VALUES (2, 3, '3333-4444')"
    });

    const QList<ContactEntry> contacts = IosDevice::readAddressBook(dbPath);
    ASSERT_EQ(contacts.size(), 2);
    EXPECT_EQ(contacts[0].displayName, "Ana Silva");
    EXPECT_EQ(contacts[0].phones, QStringList({"+5511999990000"}));
    EXPECT_EQ(contacts[0].emails, QStringList({"ana@example.com"}));
    EXPECT_EQ(contacts[1].displayName, "Padaria Central");
    EXPECT_EQ(contacts[1].phones, QStringList({"3333-4444"}));
}

TEST(ToolRunnerTest, MissingProgramDoesNotStart) {
    const ToolResult empty = ToolRunner::run("", {"devices"}, 1000);
    EXPECT_FALSE(empty.started);
    EXPECT_FALSE(empty.ok());

    const ToolResult missing = ToolRunner::run("/nonexistent/bin/adb", {"devices"}, 1000);
    EXPECT_FALSE(missing.started);
    EXPECT_FALSE(missing.ok());
}

TEST(ToolRunnerTest, UnknownToolIsNotFound) {
    EXPECT_TRUE(ToolRunner::findTool("migrationbridge-no-such-tool", "none").isEmpty());
}

TEST(AdbDeviceTest, UnavailableAdbReportsNoDevices) {
    AdbDevice adb("/nonexistent/bin/adb");
    EXPECT_TRUE(adb.listDevices().isEmpty());
    EXPECT_FALSE(adb.pull("/sdcard/a.jpg", "/tmp/a.jpg", "SERIAL"));
    EXPECT_EQ(adb.freeBytes("SERIAL"), -1);
}
