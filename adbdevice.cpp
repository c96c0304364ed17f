#include "adbdevice.h"
#include "smsconverter.h"
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QRegularExpression>

namespace {

const QString kContactsUri = QStringLiteral("content://com.android.contacts/contacts");
const QString kContactsImportPath = QStringLiteral("/sdcard/Download/_import_contacts.vcf");

DeviceState stateFromAdb(const QString &state)
{
    if (state == "device") return DeviceState::Connected;
    if (state == "unauthorized") return DeviceState::Unauthorized;
    if (state == "offline") return DeviceState::Offline;
    if (state == "recovery" || state == "sideload") return DeviceState::Recovery;
    return DeviceState::Connected;
}

// Convierte la salida de "getprop" ("[clave]: [valor]") en un mapa
QMap<QString, QString> parseProperties(const QString &output)
{
    static const QRegularExpression re("^\\[([^\\]]+)\\]:\\s*\\[(.*)\\]$");
    QMap<QString, QString> props;
    const QStringList lines = output.split('\n', Qt::SkipEmptyParts);
    for (const QString &line : lines) {
        QRegularExpressionMatch match = re.match(line.trimmed());
        if (match.hasMatch()) {
            props.insert(match.captured(1), match.captured(2));
        }
    }
    return props;
}

} // namespace

AdbDevice::AdbDevice(const QString &adbPath, int commandTimeoutMs, QObject *parent)
    : QObject(parent)
    , m_adbPath(adbPath)
    , m_commandTimeoutMs(commandTimeoutMs)
{
    if (m_adbPath.isEmpty()) {
        m_adbPath = ToolRunner::findTool("adb", "adb");
    }
}

AdbDevice::~AdbDevice()
{
}

bool AdbDevice::isAvailable() const
{
    return !m_adbPath.isEmpty();
}

QString AdbDevice::adbPath() const
{
    return m_adbPath;
}

DevicePlatform AdbDevice::platform() const
{
    return DevicePlatform::Android;
}

QList<UnifiedDeviceInfo> AdbDevice::listDevices()
{
    if (!isAvailable()) {
        return QList<UnifiedDeviceInfo>();
    }

    ToolResult result = adb(QString(), {"devices", "-l"}, 10000);
    if (!result.ok()) {
        qWarning() << "Error al ejecutar adb devices:" << result.errorOutput().trimmed();
        return QList<UnifiedDeviceInfo>();
    }
    return parseDeviceList(result.output());
}

/**
 * Obtiene modelo, versión, batería y almacenamiento de un dispositivo
 */
UnifiedDeviceInfo AdbDevice::deviceDetails(const QString &serial)
{
    UnifiedDeviceInfo info;
    info.serial = serial;
    info.platform = DevicePlatform::Android;

    const QMap<QString, QString> props = parseProperties(shell(serial, "getprop"));
    info.model = props.value("ro.product.model");
    info.manufacturer = props.value("ro.product.manufacturer");
    info.osVersion = props.value("ro.build.version.release");
    info.sdkVersion = props.value("ro.build.version.sdk");
    info.product = props.value("ro.product.name");
    info.androidCodename = props.value("ro.product.device");

    info.batteryLevel = parseBatteryLevel(shell(serial, "dumpsys battery"));

    QPair<qint64, qint64> usage = parseDiskUsage(shell(serial, "df /data"));
    info.storageTotal = qMax<qint64>(0, usage.first);
    info.storageFree = qMax<qint64>(0, usage.second);

    return info;
}

bool AdbDevice::pull(const QString &remotePath, const QString &localPath, const QString &serial)
{
    return adb(serial, {"pull", remotePath, localPath}, m_commandTimeoutMs).ok();
}

bool AdbDevice::push(const QString &localPath, const QString &remotePath, const QString &serial)
{
    return adb(serial, {"push", localPath, remotePath}, m_commandTimeoutMs).ok();
}

QStringList AdbDevice::listDir(const QString &remotePath, const QString &serial)
{
    ToolResult result = adb(serial, {"shell", "ls -1 " + shellQuote(remotePath)}, 30000);
    if (!result.ok()) {
        return QStringList();
    }

    QStringList entries;
    const QStringList lines = result.output().split('\n', Qt::SkipEmptyParts);
    for (const QString &line : lines) {
        QString entry = line.trimmed();
        if (!entry.isEmpty()) {
            entries << entry;
        }
    }
    return entries;
}

bool AdbDevice::fileExists(const QString &remotePath, const QString &serial)
{
    return shell(serial, "[ -e " + shellQuote(remotePath) + " ] && echo Y || echo N").trimmed().startsWith('Y');
}

bool AdbDevice::makeDirectory(const QString &remotePath, const QString &serial)
{
    return adb(serial, {"shell", "mkdir -p " + shellQuote(remotePath)}, 30000).ok();
}

bool AdbDevice::remove(const QString &remotePath, const QString &serial)
{
    return adb(serial, {"shell", "rm -rf " + shellQuote(remotePath)}, 60000).ok();
}

RemoteFileStat AdbDevice::statFile(const QString &remotePath, const QString &serial)
{
    RemoteFileStat stat;
    const QStringList parts = shell(serial, "stat -c '%s %Y' " + shellQuote(remotePath) + " 2>/dev/null")
                                  .split(QRegularExpression("\\s+"), Qt::SkipEmptyParts);
    if (parts.size() >= 2) {
        stat.size = parts[0].toLongLong();
        stat.modifiedTime = parts[1].toLongLong();
    }
    return stat;
}

/**
 * Exporta los contactos como tarjetas vCard leídas una a una del content provider
 */
QString AdbDevice::exportContacts(const QString &serial, const QString &outDir)
{
    if (!QDir().mkpath(outDir)) {
        qWarning() << "No se pudo crear el directorio de exportación:" << outDir;
        return QString();
    }

    QString names = shell(serial, "content query --uri " + kContactsUri + " --projection display_name");
    if (names.trimmed().isEmpty() || names.contains("Error")) {
        return QString();
    }

    QString lookup = shell(serial, "content query --uri " + kContactsUri +
                                   " --projection lookup --sort 'display_name ASC'");
    const QStringList keys = parseLookupKeys(lookup);

    QStringList cards;
    for (const QString &key : keys) {
        QString vcard = shell(serial, "content read --uri " + kContactsUri + "/as_vcard/" + key, 10000);
        if (vcard.contains("BEGIN:VCARD")) {
            cards << vcard.trimmed();
        }
    }

    if (cards.isEmpty()) {
        return QString();
    }

    const QString vcfPath = QDir(outDir).filePath("contacts.vcf");
    QFile file(vcfPath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        qWarning() << "No se pudo escribir" << vcfPath << ":" << file.errorString();
        return QString();
    }
    const QByteArray data = cards.join('\n').toUtf8();
    if (file.write(data) != data.size()) {
        qWarning() << "Escritura incompleta de" << vcfPath << ":" << file.errorString();
        return QString();
    }
    qDebug() << "Exportadas" << cards.size() << "tarjetas vCard de" << serial;
    return vcfPath;
}

/**
 * Envía el VCF al dispositivo y abre la aplicación de contactos para importarlo
 */
bool AdbDevice::importContacts(const QString &serial, const QString &vcfPath)
{
    if (!push(vcfPath, kContactsImportPath, serial)) {
        return false;
    }

    ToolResult result = adb(serial, {"shell", "am start -a android.intent.action.VIEW -d "
                                     + shellQuote("file://" + kContactsImportPath) + " -t text/x-vcard"}, 30000);
    if (!result.ok()) {
        qWarning() << "No se pudo abrir el importador de contactos en" << serial;
    }
    return true;
}

QString AdbDevice::exportMessages(const QString &serial, const QString &outDir)
{
    if (!QDir().mkpath(outDir)) {
        qWarning() << "No se pudo crear el directorio de exportación:" << outDir;
        return QString();
    }

    QString output = shell(serial, "content query --uri content://sms "
                                   "--projection address:body:date:type:read:thread_id", 60000);
    if (output.trimmed().isEmpty() || output.contains("Error")) {
        return QString();
    }

    const QList<SMSEntry> messages = parseSmsQuery(output);
    if (messages.isEmpty()) {
        return QString();
    }

    const QString jsonPath = QDir(outDir).filePath("sms.json");
    if (!SmsConverter::writeJsonFile(messages, jsonPath)) {
        return QString();
    }
    return jsonPath;
}

/**
 * Inserta cada mensaje con "content insert"; éxito si se insertó al menos uno
 */
bool AdbDevice::importMessages(const QString &serial, const QString &jsonPath)
{
    const QList<SMSEntry> messages = SmsConverter::parseJsonFile(jsonPath);
    int inserted = 0;

    for (const SMSEntry &sms : messages) {
        QStringList binds;
        binds << "--bind " + shellQuote("address:s:" + sms.address)
              << "--bind " + shellQuote("body:s:" + sms.body)
              << QString("--bind date:l:%1").arg(sms.dateMs)
              << QString("--bind type:i:%1").arg(static_cast<int>(sms.direction))
              << QString("--bind read:i:%1").arg(sms.read ? 1 : 0);

        ToolResult result = adb(serial, {"shell", "content insert --uri content://sms " + binds.join(' ')}, 10000);
        if (result.ok() && !result.output().contains("Error")) {
            ++inserted;
        }
    }

    qInfo() << "SMS insertados en" << serial << ":" << inserted << "de" << messages.size();
    return inserted > 0;
}

QMap<QString, QStringList> AdbDevice::mediaPaths(const QString &serial)
{
    Q_UNUSED(serial);
    QMap<QString, QStringList> paths;
    paths["photos"] = QStringList{"/sdcard/DCIM", "/sdcard/Pictures"};
    paths["videos"] = QStringList{"/sdcard/Movies", "/sdcard/DCIM"};
    paths["music"] = QStringList{"/sdcard/Music"};
    paths["documents"] = QStringList{"/sdcard/Documents", "/sdcard/Download"};
    return paths;
}

qint64 AdbDevice::freeBytes(const QString &serial)
{
    return parseDiskUsage(shell(serial, "df /data")).second;
}

qint64 AdbDevice::totalBytes(const QString &serial)
{
    return parseDiskUsage(shell(serial, "df /data")).first;
}

CommandResult AdbDevice::runShell(const QString &command, const QString &serial, int timeoutMs)
{
    CommandResult commandResult;
    ToolResult result = adb(serial, {"shell", command}, timeoutMs);
    commandResult.output = result.output();
    if (result.ok()) {
        commandResult.status = CommandStatus::Ok;
    } else {
        commandResult.status = CommandStatus::Failed;
        commandResult.errorMessage = result.timedOut ? QString("Tiempo de espera agotado")
                                                      : result.errorOutput().trimmed();
    }
    return commandResult;
}

QList<UnifiedDeviceInfo> AdbDevice::parseDeviceList(const QString &output)
{
    QList<UnifiedDeviceInfo> devices;
    const QStringList lines = output.split('\n', Qt::SkipEmptyParts);

    // Formato típico:
    // XXXXXXXX       device usb:1-1 product:modelo model:nombre_modelo device:nombre
    static const QRegularExpression re("^([^\\s]+)\\s+(\\w+)(.*)$");

    for (const QString &rawLine : lines) {
        QString line = rawLine.trimmed();
        if (line.isEmpty() || line.startsWith("List of devices") || line.startsWith('*')) {
            continue;
        }

        QRegularExpressionMatch match = re.match(line);
        if (!match.hasMatch()) {
            continue;
        }

        UnifiedDeviceInfo info;
        info.serial = match.captured(1);
        info.platform = DevicePlatform::Android;
        info.state = stateFromAdb(match.captured(2));

        const QStringList props = match.captured(3).split(' ', Qt::SkipEmptyParts);
        for (const QString &prop : props) {
            int colon = prop.indexOf(':');
            if (colon <= 0) {
                continue;
            }
            QString key = prop.left(colon);
            QString value = prop.mid(colon + 1);
            if (key == "model") {
                info.model = value;
            } else if (key == "product") {
                info.product = value;
            } else if (key == "device") {
                info.androidCodename = value;
            }
        }

        devices.append(info);
    }

    return devices;
}

QPair<qint64, qint64> AdbDevice::parseDiskUsage(const QString &output)
{
    const QStringList lines = output.split('\n', Qt::SkipEmptyParts);
    if (lines.size() >= 2) {
        const QStringList cols = lines[1].split(QRegularExpression("\\s+"), Qt::SkipEmptyParts);
        if (cols.size() >= 4) {
            bool totalOk = false;
            bool freeOk = false;
            qint64 total = cols[1].toLongLong(&totalOk);
            qint64 free = cols[3].toLongLong(&freeOk);
            // df informa en bloques de 1K
            return qMakePair(totalOk ? total * 1024 : -1, freeOk ? free * 1024 : -1);
        }
    }
    return qMakePair<qint64, qint64>(-1, -1);
}

int AdbDevice::parseBatteryLevel(const QString &output)
{
    static const QRegularExpression re("level:\\s*(\\d+)");
    QRegularExpressionMatch match = re.match(output);
    return match.hasMatch() ? match.captured(1).toInt() : -1;
}

QList<SMSEntry> AdbDevice::parseSmsQuery(const QString &output)
{
    static const QRegularExpression pairRe("(\\w+)=([^,}]*)");
    QList<SMSEntry> messages;

    const QStringList lines = output.split('\n', Qt::SkipEmptyParts);
    for (const QString &line : lines) {
        QMap<QString, QString> fields;
        QRegularExpressionMatchIterator it = pairRe.globalMatch(line);
        while (it.hasNext()) {
            QRegularExpressionMatch match = it.next();
            fields.insert(match.captured(1), match.captured(2).trimmed());
        }
        if (!fields.contains("address") || !fields.contains("body")) {
            continue;
        }

        SMSEntry sms;
        sms.address = fields.value("address");
        sms.body = fields.value("body");
        sms.dateMs = fields.value("date").toLongLong();
        sms.direction = fields.value("type") == "2" ? SMSEntry::Sent : SMSEntry::Inbox;
        sms.read = fields.value("read", "1") != "0";
        sms.threadId = fields.value("thread_id").toLongLong();
        messages.append(sms);
    }

    return messages;
}

QStringList AdbDevice::parseLookupKeys(const QString &output)
{
    static const QRegularExpression re("lookup=([^\\s,}]+)");
    QStringList keys;
    QRegularExpressionMatchIterator it = re.globalMatch(output);
    while (it.hasNext()) {
        keys << it.next().captured(1);
    }
    return keys;
}

QString AdbDevice::shellQuote(const QString &value)
{
    QString escaped = value;
    escaped.replace("'", "'\\''");
    return "'" + escaped + "'";
}

ToolResult AdbDevice::adb(const QString &serial, const QStringList &arguments, int timeoutMs) const
{
    QStringList args;
    if (!serial.isEmpty()) {
        args << "-s" << serial;
    }
    args << arguments;
    return ToolRunner::run(m_adbPath, args, timeoutMs);
}

QString AdbDevice::shell(const QString &serial, const QString &command, int timeoutMs) const
{
    ToolResult result = adb(serial, {"shell", command}, timeoutMs);
    if (!result.started || result.timedOut) {
        return QString();
    }
    return result.output();
}
