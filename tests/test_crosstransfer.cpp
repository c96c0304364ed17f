#include <gtest/gtest.h>
#include "crosstransfermanager.h"
#include "deviceregistry.h"
#include "fakedevice.h"
#include <QDir>
#include <QFileInfo>
#include <QTemporaryDir>
#include <memory>
#include <stdexcept>

namespace {

CrossTransferConfig nothingEnabled()
{
    CrossTransferConfig config;
    config.photos = false;
    config.videos = false;
    config.music = false;
    config.documents = false;
    config.contacts = false;
    config.sms = false;
    config.calendar = false;
    return config;
}

bool containsText(const QStringList &list, const QString &text)
{
    for (const QString &item : list) {
        if (item.contains(text)) {
            return true;
        }
    }
    return false;
}

class CrossTransferTest : public ::testing::Test {
protected:
    CrossTransferTest()
        : android("ANDROID1", DevicePlatform::Android, "Pixel 8")
        , iphone("IPHONE1", DevicePlatform::Ios, "iPhone15,2")
    {
        android.info.manufacturer = "Google";
        registry.registerBackend(&android);
        registry.registerBackend(&iphone);
    }

    bool run(const CrossTransferConfig &config, const QString &source = "ANDROID1",
             const QString &target = "IPHONE1")
    {
        manager.reset(new CrossTransferManager(&registry, workDir.path()));
        manager->setProgressCallback([this](CrossTransferProgress progress) {
            snapshots.append(progress);
            if (cancelAtPhase == progress.phase) {
                manager->cancel();
            }
        });
        return manager->transfer(source, target, config);
    }

    CrossTransferProgress last() const { return snapshots.last(); }

    QTemporaryDir workDir;
    FakeDevice android;
    FakeDevice iphone;
    DeviceRegistry registry;
    std::unique_ptr<CrossTransferManager> manager;
    QList<CrossTransferProgress> snapshots;
    QString cancelAtPhase;
};

} // namespace

TEST_F(CrossTransferTest, ZeroCategoriesCompletesVacuously) {
    EXPECT_TRUE(run(nothingEnabled()));

    ASSERT_FALSE(snapshots.isEmpty());
    EXPECT_EQ(last().phase, "complete");
    EXPECT_DOUBLE_EQ(last().percent, 100.0);
    EXPECT_TRUE(last().errors.isEmpty());
    EXPECT_EQ(last().sourceDevice, "Google Pixel 8");
    EXPECT_EQ(last().sourcePlatform, "android");
    EXPECT_EQ(last().targetPlatform, "ios");
    EXPECT_FALSE(manager->isRunning());
}

TEST_F(CrossTransferTest, SnapshotsAreSequencedAndStoredAsLast) {
    CrossTransferConfig config = nothingEnabled();
    config.contacts = true;
    run(config);

    ASSERT_GE(snapshots.size(), 2);
    for (int i = 1; i < snapshots.size(); ++i) {
        EXPECT_GT(snapshots[i].sequence, snapshots[i - 1].sequence);
    }
    EXPECT_EQ(manager->progress().sequence, last().sequence);
}

TEST_F(CrossTransferTest, UnknownDeviceFailsEarly) {
    EXPECT_FALSE(run(nothingEnabled(), "ANDROID1", "missing"));
    EXPECT_EQ(last().phase, "error");
    EXPECT_TRUE(containsText(last().errors, "não encontrado"));
}

TEST_F(CrossTransferTest, CancelBeforeFirstStepRunsNothing) {
    cancelAtPhase = "initializing";
    CrossTransferConfig config;
    android.contacts.append(ContactEntry());

    EXPECT_FALSE(run(config));
    EXPECT_EQ(last().phase, "cancelled");
    EXPECT_EQ(last().itemsDone, 0);
    EXPECT_TRUE(iphone.importedContactFiles.isEmpty());
    EXPECT_TRUE(containsText(last().warnings, "cancelada"));

    // Solo queda el directorio raíz de staging, vacío
    QDir staging(manager->stagingDirectory());
    EXPECT_TRUE(staging.exists());
    EXPECT_TRUE(staging.entryList(QDir::AllEntries | QDir::NoDotAndDotDot).isEmpty());
}

TEST_F(CrossTransferTest, NoContactsIsAWarningNotAnError) {
    CrossTransferConfig config = nothingEnabled();
    config.contacts = true;

    EXPECT_TRUE(run(config));
    EXPECT_EQ(last().phase, "complete");
    EXPECT_EQ(last().itemsDone, 1);
    EXPECT_TRUE(containsText(last().warnings, "Nenhum"));
    EXPECT_TRUE(last().errors.isEmpty());
}

TEST_F(CrossTransferTest, ContactsAreExportedAndImported) {
    ContactEntry contact;
    contact.displayName = "Ana Silva";
    contact.phones << "123";
    android.contacts.append(contact);

    CrossTransferConfig config = nothingEnabled();
    config.contacts = true;

    EXPECT_TRUE(run(config));
    ASSERT_EQ(iphone.importedContactFiles.size(), 1);
    EXPECT_TRUE(iphone.importedContactFiles[0].endsWith("contacts/contacts.vcf"));
}

TEST_F(CrossTransferTest, MessagesToIosWarnAndRespectImportResult) {
    SMSEntry sms;
    sms.address = "123";
    sms.body = "Oi";
    android.messages.append(sms);
    iphone.importMessagesResult = false;

    CrossTransferConfig config = nothingEnabled();
    config.sms = true;

    EXPECT_FALSE(run(config));
    EXPECT_EQ(last().phase, "complete_with_errors");
    EXPECT_TRUE(containsText(last().warnings, "iOS não permite"));
    EXPECT_TRUE(last().errors.contains("SMS: falha na transferência"));
    EXPECT_EQ(iphone.importedMessageFiles.size(), 1);
}

TEST_F(CrossTransferTest, CalendarFromAndroidIsPushedToDownloads) {
    android.shellResult.status = CommandStatus::Ok;
    android.shellResult.output =
        "Row: 0 title=Reunião, dtstart=1704103200000, dtend=1704106800000, eventLocation=Escritório, description=NULL\n";

    CrossTransferConfig config = nothingEnabled();
    config.calendar = true;

    EXPECT_TRUE(run(config));
    ASSERT_TRUE(iphone.files.contains("/Downloads/calendar.ics"));
    const QString ics = QString::fromUtf8(iphone.files.value("/Downloads/calendar.ics"));
    EXPECT_TRUE(ics.startsWith("BEGIN:VCALENDAR"));
    EXPECT_TRUE(ics.contains("SUMMARY:Reunião"));
    EXPECT_TRUE(ics.contains("DTSTART:20240101T100000Z"));
    EXPECT_TRUE(ics.contains("LOCATION:Escritório"));
}

TEST_F(CrossTransferTest, CalendarFromIosIsUnavailable) {
    CrossTransferConfig config = nothingEnabled();
    config.calendar = true;

    EXPECT_TRUE(run(config, "IPHONE1", "ANDROID1"));
    EXPECT_TRUE(containsText(last().warnings, "calendário não disponível"));
    EXPECT_FALSE(android.files.contains("/sdcard/Download/calendar.ics"));
}

TEST_F(CrossTransferTest, MediaPullFailureCountsOneError) {
    android.media.insert("photos", { "/sdcard/DCIM/Camera" });
    iphone.media.insert("photos", { "/DCIM" });
    android.files.insert("/sdcard/DCIM/Camera/a.jpg", "A");
    android.files.insert("/sdcard/DCIM/Camera/b.jpg", "B");
    android.files.insert("/sdcard/DCIM/Camera/c.jpg", "C");
    android.failingPulls.insert("/sdcard/DCIM/Camera/b.jpg");

    CrossTransferConfig config = nothingEnabled();
    config.photos = true;

    EXPECT_FALSE(run(config));
    EXPECT_EQ(last().phase, "complete_with_errors");
    EXPECT_EQ(last().filesPulled, 2);
    EXPECT_EQ(last().filesPushed, 2);
    EXPECT_EQ(last().fileErrors, 1);
    EXPECT_TRUE(last().errors.contains("photos: 1 erro(s)"));
    EXPECT_EQ(iphone.files.value("/DCIM/a.jpg"), QByteArray("A"));
    EXPECT_EQ(iphone.files.value("/DCIM/c.jpg"), QByteArray("C"));
}

TEST_F(CrossTransferTest, ThumbnailAndCacheEntriesAreSkipped) {
    android.media.insert("documents", { "/sdcard/Documents" });
    iphone.media.insert("documents", { "/Documents" });
    android.files.insert("/sdcard/Documents/relatorio.pdf", "PDF");
    android.files.insert("/sdcard/Documents/.thumbnails", "T");
    android.files.insert("/sdcard/Documents/.trashed-123-foto.jpg", "X");

    CrossTransferConfig config = nothingEnabled();
    config.documents = true;

    EXPECT_TRUE(run(config));
    EXPECT_EQ(last().filesPulled, 1);
    EXPECT_TRUE(iphone.files.contains("/Documents/relatorio.pdf"));
    EXPECT_FALSE(android.calls.contains("pull:/sdcard/Documents/.thumbnails"));
    EXPECT_FALSE(android.calls.contains("pull:/sdcard/Documents/.trashed-123-foto.jpg"));
}

TEST_F(CrossTransferTest, MissingTargetPathIsAWarning) {
    android.media.insert("music", { "/sdcard/Music" });
    android.files.insert("/sdcard/Music/song.mp3", "M");

    CrossTransferConfig config = nothingEnabled();
    config.music = true;

    EXPECT_TRUE(run(config));
    EXPECT_TRUE(last().warnings.contains("Sem caminho de destino para music"));
}

TEST_F(CrossTransferTest, FaultInsideStepIsRecordedAndTransferFinishes) {
    android.media.insert("videos", { "/sdcard/Movies" });
    iphone.media.insert("videos", { "/DCIM" });
    android.files.insert("/sdcard/Movies/clip.mp4", "V");
    android.onPull = [](const QString &) { throw std::runtime_error("conexão perdida"); };

    CrossTransferConfig config = nothingEnabled();
    config.videos = true;
    config.contacts = true;

    EXPECT_FALSE(run(config));
    EXPECT_EQ(last().phase, "complete_with_errors");
    EXPECT_EQ(last().itemsDone, 2);
    EXPECT_TRUE(last().errors.contains("Vídeos: conexão perdida"));
}

TEST_F(CrossTransferTest, CallbackExceptionDoesNotAbortTransfer) {
    manager.reset(new CrossTransferManager(&registry, workDir.path()));
    manager->setProgressCallback([](CrossTransferProgress) { throw std::runtime_error("ui"); });

    CrossTransferConfig config = nothingEnabled();
    config.contacts = true;
    EXPECT_TRUE(manager->transfer("ANDROID1", "IPHONE1", config));
    EXPECT_EQ(manager->progress().phase, "complete");
}

TEST_F(CrossTransferTest, CancelDuringLastStepThatFinishesIsStillComplete) {
    ContactEntry contact;
    contact.displayName = "Ana Silva";
    android.contacts.append(contact);
    cancelAtPhase = "contacts";

    CrossTransferConfig config = nothingEnabled();
    config.contacts = true;

    EXPECT_TRUE(run(config));
    EXPECT_EQ(last().phase, "complete");
    EXPECT_EQ(last().itemsDone, 1);
    EXPECT_EQ(iphone.importedContactFiles.size(), 1);
    EXPECT_FALSE(containsText(last().warnings, "cancelada"));
}

TEST_F(CrossTransferTest, CancelDuringMediaStopsAtNextFile) {
    android.media.insert("photos", { "/sdcard/DCIM/Camera" });
    iphone.media.insert("photos", { "/DCIM" });
    android.files.insert("/sdcard/DCIM/Camera/a.jpg", "A");
    android.files.insert("/sdcard/DCIM/Camera/b.jpg", "B");
    android.files.insert("/sdcard/DCIM/Camera/c.jpg", "C");
    android.onPull = [this](const QString &) { manager->cancel(); };

    CrossTransferConfig config = nothingEnabled();
    config.photos = true;

    EXPECT_FALSE(run(config));
    EXPECT_EQ(last().phase, "cancelled");
    EXPECT_EQ(last().filesPulled, 1);
    EXPECT_EQ(last().filesPushed, 0);
    EXPECT_EQ(android.calls.filter("pull:").size(), 1);
    EXPECT_TRUE(iphone.calls.filter("push:").isEmpty());
    EXPECT_TRUE(last().errors.isEmpty());
}

TEST_F(CrossTransferTest, MediaPercentStaysInsideItsStepBand) {
    android.media.insert("photos", { "/sdcard/DCIM/Camera" });
    android.media.insert("videos", { "/sdcard/Movies" });
    iphone.media.insert("photos", { "/DCIM" });
    iphone.media.insert("videos", { "/DCIM" });
    android.files.insert("/sdcard/DCIM/Camera/a.jpg", "A");
    android.files.insert("/sdcard/DCIM/Camera/b.jpg", "B");
    android.files.insert("/sdcard/Movies/clip.mp4", "V");

    CrossTransferConfig config = nothingEnabled();
    config.photos = true;
    config.videos = true;

    EXPECT_TRUE(run(config));

    int photoSnapshots = 0;
    int videoSnapshots = 0;
    for (const CrossTransferProgress &progress : snapshots) {
        if (progress.phase == "photos") {
            ++photoSnapshots;
            EXPECT_GE(progress.percent, 0.0);
            EXPECT_LT(progress.percent, 50.0);
        } else if (progress.phase == "videos") {
            ++videoSnapshots;
            EXPECT_GE(progress.percent, 50.0);
            EXPECT_LT(progress.percent, 100.0);
        }
    }
    EXPECT_GE(photoSnapshots, 3);
    EXPECT_GE(videoSnapshots, 2);
}

TEST_F(CrossTransferTest, RunsInTheSameSecondGetDistinctStagingDirectories) {
    const CrossTransferConfig config = nothingEnabled();

    ASSERT_TRUE(run(config));
    const QString first = manager->stagingDirectory();
    ASSERT_TRUE(run(config));
    const QString second = manager->stagingDirectory();

    EXPECT_NE(first, second);
    EXPECT_TRUE(QDir(first).exists());
    EXPECT_TRUE(QDir(second).exists());
    EXPECT_TRUE(QFileInfo(second).fileName().startsWith("cross_"));
}
