#include "appsettings.h"
#include <QDir>
#include <QStandardPaths>

AppSettings::AppSettings(QObject *parent)
    : QObject(parent)
    , m_settings("MobileMigrationBridge", "migrationbridge")
{
}

AppSettings::AppSettings(const QString &iniPath, QObject *parent)
    : QObject(parent)
    , m_settings(iniPath, QSettings::IniFormat)
{
}

QString AppSettings::workDir() const
{
    QString fallback = QDir(QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation)).filePath("transfers");
    return m_settings.value("paths/workDir", fallback).toString();
}

void AppSettings::setWorkDir(const QString &path)
{
    if (workDir() != path) {
        m_settings.setValue("paths/workDir", path);
        emit settingsChanged();
    }
}

QString AppSettings::logDir() const
{
    QString fallback = QDir(QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation)).filePath("logs");
    return m_settings.value("paths/logDir", fallback).toString();
}

void AppSettings::setLogDir(const QString &path)
{
    if (logDir() != path) {
        m_settings.setValue("paths/logDir", path);
        emit settingsChanged();
    }
}

QString AppSettings::adbPath() const
{
    return m_settings.value("tools/adbPath", "").toString();
}

void AppSettings::setAdbPath(const QString &path)
{
    if (adbPath() != path) {
        m_settings.setValue("tools/adbPath", path);
        emit settingsChanged();
    }
}

QString AppSettings::libimobiledevicePath() const
{
    return m_settings.value("tools/libimobiledevicePath", "").toString();
}

void AppSettings::setLibimobiledevicePath(const QString &path)
{
    if (libimobiledevicePath() != path) {
        m_settings.setValue("tools/libimobiledevicePath", path);
        emit settingsChanged();
    }
}

int AppSettings::commandTimeoutMs() const
{
    bool ok = false;
    int value = m_settings.value("tools/commandTimeoutMs", DefaultCommandTimeoutMs).toInt(&ok);
    return ok && value > 0 ? value : DefaultCommandTimeoutMs;
}

void AppSettings::setCommandTimeoutMs(int timeoutMs)
{
    if (commandTimeoutMs() != timeoutMs) {
        m_settings.setValue("tools/commandTimeoutMs", timeoutMs);
        emit settingsChanged();
    }
}

CrossTransferConfig AppSettings::transferConfig() const
{
    CrossTransferConfig defaults;
    CrossTransferConfig config;
    config.photos = transferFlag("photos", defaults.photos);
    config.videos = transferFlag("videos", defaults.videos);
    config.music = transferFlag("music", defaults.music);
    config.documents = transferFlag("documents", defaults.documents);
    config.contacts = transferFlag("contacts", defaults.contacts);
    config.sms = transferFlag("sms", defaults.sms);
    config.calendar = transferFlag("calendar", defaults.calendar);
    config.convertHeic = transferFlag("convertHeic", defaults.convertHeic);
    config.ignoreCache = transferFlag("ignoreCache", defaults.ignoreCache);
    config.ignoreThumbnails = transferFlag("ignoreThumbnails", defaults.ignoreThumbnails);
    return config;
}

void AppSettings::setTransferConfig(const CrossTransferConfig &config)
{
    m_settings.beginGroup("transfer");
    m_settings.setValue("photos", config.photos);
    m_settings.setValue("videos", config.videos);
    m_settings.setValue("music", config.music);
    m_settings.setValue("documents", config.documents);
    m_settings.setValue("contacts", config.contacts);
    m_settings.setValue("sms", config.sms);
    m_settings.setValue("calendar", config.calendar);
    m_settings.setValue("convertHeic", config.convertHeic);
    m_settings.setValue("ignoreCache", config.ignoreCache);
    m_settings.setValue("ignoreThumbnails", config.ignoreThumbnails);
    m_settings.endGroup();
    emit settingsChanged();
}

void AppSettings::sync()
{
    m_settings.sync();
}

bool AppSettings::transferFlag(const QString &name, bool defaultValue) const
{
    return m_settings.value("transfer/" + name, defaultValue).toBool();
}
