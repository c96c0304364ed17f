#include "iosdevice.h"
#include "smsconverter.h"
#include "vcardconverter.h"
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QSqlDatabase>
#include <QSqlError>
#include <QSqlQuery>
#include <QUuid>

const QString IosDevice::SmsBackupHash = QStringLiteral("3d0d7e5fb2ce288813306e4d4636395e047a3d28");
const QString IosDevice::AddressBookBackupHash = QStringLiteral("31bb7ba8914766d4ba40d6dfb6113c8b614be442");

namespace {

// Una copia de seguridad completa puede tardar mucho más que una transferencia
const int kBackupTimeoutMs = 60 * 60 * 1000;

const QString kContactsImportPath = QStringLiteral("/Downloads/imported_contacts.vcf");
const QString kSmsImportPath = QStringLiteral("/Downloads/sms_import.json");

// afcclient informa los errores por texto aunque el código de salida sea 0
bool afcSucceeded(const ToolResult &result)
{
    return result.ok()
           && !result.errorOutput().contains("Error", Qt::CaseInsensitive)
           && !result.output().startsWith("Error", Qt::CaseInsensitive);
}

QString remoteParent(const QString &remotePath)
{
    int slash = remotePath.lastIndexOf('/');
    return slash > 0 ? remotePath.left(slash) : QString();
}

} // namespace

IosDevice::IosDevice(const QString &toolsDir, const QString &workDir, int commandTimeoutMs, QObject *parent)
    : QObject(parent)
    , m_toolsDir(toolsDir)
    , m_workDir(workDir)
    , m_commandTimeoutMs(commandTimeoutMs)
{
}

IosDevice::~IosDevice()
{
}

bool IosDevice::isAvailable() const
{
    return !tool("idevice_id").isEmpty();
}

DevicePlatform IosDevice::platform() const
{
    return DevicePlatform::Ios;
}

QList<UnifiedDeviceInfo> IosDevice::listDevices()
{
    QList<UnifiedDeviceInfo> devices;
    if (!isAvailable()) {
        return devices;
    }

    ToolResult result = ToolRunner::run(tool("idevice_id"), {"-l"}, 10000);
    if (!result.ok()) {
        qWarning() << "Error al ejecutar idevice_id:" << result.errorOutput().trimmed();
        return devices;
    }

    const QStringList lines = result.output().split('\n', Qt::SkipEmptyParts);
    for (const QString &line : lines) {
        QString udid = line.trimmed();
        if (udid.isEmpty()) {
            continue;
        }
        devices.append(deviceDetails(udid));
    }
    return devices;
}

/**
 * Consulta lockdown con ideviceinfo; si falla el dispositivo está bloqueado o sin confiar
 */
UnifiedDeviceInfo IosDevice::deviceDetails(const QString &serial)
{
    UnifiedDeviceInfo info;
    info.serial = serial;
    info.udid = serial;
    info.platform = DevicePlatform::Ios;
    info.manufacturer = "Apple";

    ToolResult result = ToolRunner::run(tool("ideviceinfo"), {"-u", serial}, 15000);
    if (!result.ok()) {
        qWarning() << "No se pudo conectar con el dispositivo iOS" << serial << ":" << result.errorOutput().trimmed();
        info.state = DeviceState::Locked;
        return info;
    }

    const QMap<QString, QString> values = parseKeyValues(result.output());
    info.state = DeviceState::Connected;
    info.model = values.value("ProductType");
    info.product = values.value("DeviceName");
    info.osVersion = values.value("ProductVersion");
    info.iosBuild = values.value("BuildVersion");
    info.deviceClass = values.value("DeviceClass");

    ToolResult battery = ToolRunner::run(tool("ideviceinfo"),
                                         {"-u", serial, "-q", "com.apple.mobile.battery", "-k", "BatteryCurrentCapacity"},
                                         10000);
    if (battery.ok()) {
        bool ok = false;
        int level = battery.output().trimmed().toInt(&ok);
        if (ok && level >= 0) {
            info.batteryLevel = level;
        }
    }

    info.storageTotal = qMax<qint64>(0, totalBytes(serial));
    info.storageFree = qMax<qint64>(0, freeBytes(serial));
    return info;
}

bool IosDevice::pull(const QString &remotePath, const QString &localPath, const QString &serial)
{
    QDir().mkpath(QFileInfo(localPath).absolutePath());
    ToolResult result = afc(serial, {"get", remotePath, localPath}, m_commandTimeoutMs);
    if (!afcSucceeded(result) || !QFileInfo::exists(localPath)) {
        qDebug() << "Fallo al extraer de iOS" << remotePath;
        return false;
    }
    return true;
}

bool IosDevice::push(const QString &localPath, const QString &remotePath, const QString &serial)
{
    const QString parent = remoteParent(remotePath);
    if (!parent.isEmpty() && !fileExists(parent, serial) && !makeDirectory(parent, serial)) {
        qDebug() << "No se pudo crear el directorio remoto" << parent;
    }

    ToolResult result = afc(serial, {"put", localPath, remotePath}, m_commandTimeoutMs);
    if (!afcSucceeded(result)) {
        qDebug() << "Fallo al enviar a iOS" << remotePath;
        return false;
    }
    return true;
}

QStringList IosDevice::listDir(const QString &remotePath, const QString &serial)
{
    ToolResult result = afc(serial, {"ls", remotePath}, 30000);
    if (!afcSucceeded(result)) {
        return QStringList();
    }

    QStringList entries;
    const QStringList lines = result.output().split('\n', Qt::SkipEmptyParts);
    for (const QString &line : lines) {
        QString entry = line.trimmed();
        if (entry.isEmpty() || entry == "." || entry == "..") {
            continue;
        }
        entries << entry;
    }
    return entries;
}

bool IosDevice::fileExists(const QString &remotePath, const QString &serial)
{
    ToolResult result = afc(serial, {"info", remotePath}, 15000);
    return afcSucceeded(result) && parseKeyValues(result.output()).contains("st_ifmt");
}

bool IosDevice::makeDirectory(const QString &remotePath, const QString &serial)
{
    return afcSucceeded(afc(serial, {"mkdir", remotePath}, 15000));
}

bool IosDevice::remove(const QString &remotePath, const QString &serial)
{
    return afcSucceeded(afc(serial, {"rm", "-r", remotePath}, 60000));
}

RemoteFileStat IosDevice::statFile(const QString &remotePath, const QString &serial)
{
    RemoteFileStat stat;
    ToolResult result = afc(serial, {"info", remotePath}, 15000);
    if (!afcSucceeded(result)) {
        return stat;
    }

    const QMap<QString, QString> values = parseKeyValues(result.output());
    stat.size = values.value("st_size").toLongLong();
    // AFC informa st_mtime en nanosegundos
    stat.modifiedTime = values.value("st_mtime").toLongLong() / 1000000000LL;
    return stat;
}

QString IosDevice::exportContacts(const QString &serial, const QString &outDir)
{
    if (!QDir().mkpath(outDir)) {
        qWarning() << "No se pudo crear el directorio de exportación:" << outDir;
        return QString();
    }

    const QString backupDir = createBackup(serial);
    if (backupDir.isEmpty()) {
        return QString();
    }

    const QString dbPath = findBackupFile(backupDir, AddressBookBackupHash, "Library/AddressBook/AddressBook.sqlitedb");
    if (dbPath.isEmpty()) {
        qWarning() << "AddressBook.sqlitedb no encontrado en la copia de seguridad de" << serial;
        return QString();
    }

    const QList<ContactEntry> contacts = readAddressBook(dbPath);
    if (contacts.isEmpty()) {
        return QString();
    }

    const QString vcfPath = QDir(outDir).filePath("contacts.vcf");
    if (!VCardConverter::writeFile(contacts, vcfPath)) {
        return QString();
    }
    return vcfPath;
}

bool IosDevice::importContacts(const QString &serial, const QString &vcfPath)
{
    // El usuario completa la importación abriendo el archivo en el dispositivo
    return push(vcfPath, kContactsImportPath, serial);
}

QString IosDevice::exportMessages(const QString &serial, const QString &outDir)
{
    if (!QDir().mkpath(outDir)) {
        qWarning() << "No se pudo crear el directorio de exportación:" << outDir;
        return QString();
    }

    const QString backupDir = createBackup(serial);
    if (backupDir.isEmpty()) {
        return QString();
    }

    const QString dbPath = findBackupFile(backupDir, SmsBackupHash, "Library/SMS/sms.db");
    if (dbPath.isEmpty()) {
        qWarning() << "sms.db no encontrado en la copia de seguridad de" << serial;
        return QString();
    }

    return SmsConverter::nativeStoreToJson(dbPath, QDir(outDir).filePath("sms.json"));
}

/**
 * iOS no ofrece una API pública para insertar SMS: el JSON se deja como referencia
 */
bool IosDevice::importMessages(const QString &serial, const QString &jsonPath)
{
    qWarning() << "iOS no admite la importación programática de SMS; se guardan solo como referencia";
    return push(jsonPath, kSmsImportPath, serial);
}

QMap<QString, QStringList> IosDevice::mediaPaths(const QString &serial)
{
    Q_UNUSED(serial);
    QMap<QString, QStringList> paths;
    paths["photos"] = QStringList{"/DCIM"};
    paths["videos"] = QStringList{"/DCIM"};
    paths["music"] = QStringList{"/iTunes_Control/Music", "/Music"};
    paths["documents"] = QStringList{"/Downloads", "/Books"};
    return paths;
}

qint64 IosDevice::freeBytes(const QString &serial)
{
    ToolResult result = afc(serial, {"devinfo"}, 15000);
    if (!afcSucceeded(result)) {
        return -1;
    }
    bool ok = false;
    qint64 value = parseKeyValues(result.output()).value("FSFreeBytes").toLongLong(&ok);
    return ok ? value : -1;
}

qint64 IosDevice::totalBytes(const QString &serial)
{
    ToolResult result = afc(serial, {"devinfo"}, 15000);
    if (!afcSucceeded(result)) {
        return -1;
    }
    bool ok = false;
    qint64 value = parseKeyValues(result.output()).value("FSTotalBytes").toLongLong(&ok);
    return ok ? value : -1;
}

QMap<QString, QString> IosDevice::parseKeyValues(const QString &output)
{
    QMap<QString, QString> values;
    const QStringList lines = output.split('\n', Qt::SkipEmptyParts);
    for (const QString &line : lines) {
        if (line.startsWith(' ') || line.startsWith('\t')) {
            continue;
        }
        int colon = line.indexOf(':');
        if (colon <= 0) {
            continue;
        }
        values.insert(line.left(colon).trimmed(), line.mid(colon + 1).trimmed());
    }
    return values;
}

QString IosDevice::findBackupFile(const QString &backupDir, const QString &knownHash, const QString &relativePath)
{
    QDir dir(backupDir);
    const QStringList knownCandidates = {
        dir.filePath(knownHash.left(2) + "/" + knownHash),
        dir.filePath(knownHash)
    };
    for (const QString &candidate : knownCandidates) {
        if (QFileInfo::exists(candidate)) {
            return candidate;
        }
    }

    const QString manifest = dir.filePath("Manifest.db");
    if (!QFileInfo::exists(manifest)) {
        return QString();
    }

    QString fileId;
    const QString connectionName = "backup_manifest_" + QUuid::createUuid().toString(QUuid::WithoutBraces);
    {
        QSqlDatabase db = QSqlDatabase::addDatabase("QSQLITE", connectionName);
        db.setDatabaseName(manifest);
        db.setConnectOptions("QSQLITE_OPEN_READONLY");

        if (!db.open()) {
            qDebug() << "No se pudo abrir Manifest.db:" << db.lastError().text();
        } else {
            QSqlQuery query(db);
            query.prepare("SELECT fileID FROM Files WHERE relativePath = ? LIMIT 1");
            query.addBindValue(relativePath);
            if (query.exec() && query.next()) {
                fileId = query.value(0).toString();
            } else if (query.lastError().isValid()) {
                qDebug() << "Fallo la búsqueda en Manifest.db:" << query.lastError().text();
            }
            db.close();
        }
    }
    QSqlDatabase::removeDatabase(connectionName);

    if (fileId.isEmpty()) {
        return QString();
    }

    // Las copias guardan los archivos en subdirectorios de dos caracteres o en plano
    const QStringList candidates = {
        dir.filePath(fileId.left(2) + "/" + fileId),
        dir.filePath(fileId)
    };
    for (const QString &candidate : candidates) {
        if (QFileInfo::exists(candidate)) {
            return candidate;
        }
    }
    return QString();
}

QList<ContactEntry> IosDevice::readAddressBook(const QString &dbPath)
{
    QList<ContactEntry> contacts;
    const QString connectionName = "addressbook_" + QUuid::createUuid().toString(QUuid::WithoutBraces);
    {
        QSqlDatabase db = QSqlDatabase::addDatabase("QSQLITE", connectionName);
        db.setDatabaseName(dbPath);
        db.setConnectOptions("QSQLITE_OPEN_READONLY");

        if (!db.open()) {
            qWarning() << "No se pudo abrir AddressBook:" << dbPath << db.lastError().text();
        } else {
            QSqlQuery people(db);
            if (!people.exec("SELECT ROWID, First, Last, Organization FROM ABPerson")) {
                qWarning() << "Fallo al consultar ABPerson:" << people.lastError().text();
            }

            QSqlQuery values(db);
            values.prepare("SELECT property, value FROM ABMultiValue WHERE record_id = ?");

            while (people.next()) {
                const QString first = people.value(1).toString();
                const QString last = people.value(2).toString();

                ContactEntry contact;
                contact.organization = people.value(3).toString();
                contact.displayName = QString(first + " " + last).trimmed();
                if (contact.displayName.isEmpty()) {
                    contact.displayName = contact.organization;
                }

                values.bindValue(0, people.value(0));
                if (values.exec()) {
                    while (values.next()) {
                        const int property = values.value(0).toInt();
                        const QString value = values.value(1).toString();
                        if (property == 3) {
                            contact.phones << value;    // kABPersonPhoneProperty
                        } else if (property == 4) {
                            contact.emails << value;    // kABPersonEmailProperty
                        }
                    }
                } else {
                    qWarning() << "Fallo al consultar ABMultiValue:" << values.lastError().text();
                }

                contacts.append(contact);
            }
            db.close();
        }
    }
    QSqlDatabase::removeDatabase(connectionName);

    qDebug() << "Leídos" << contacts.size() << "contactos de" << QFileInfo(dbPath).fileName();
    return contacts;
}

QString IosDevice::tool(const QString &name) const
{
    if (!m_toolPaths.contains(name)) {
        m_toolPaths.insert(name, ToolRunner::toolInDirectory(m_toolsDir, name, "libimobiledevice"));
    }
    return m_toolPaths.value(name);
}

ToolResult IosDevice::afc(const QString &udid, const QStringList &arguments, int timeoutMs) const
{
    QStringList args;
    args << "-u" << udid << arguments;
    return ToolRunner::run(tool("afcclient"), args, timeoutMs);
}

/**
 * Crea (o reutiliza en esta sesión) una copia de seguridad local sin cifrar
 */
QString IosDevice::createBackup(const QString &udid)
{
    const QString backupRoot = QDir(m_workDir).filePath("backups");
    const QString backupDir = QDir(backupRoot).filePath(udid);

    if (m_backedUp.contains(udid) && QFileInfo::exists(backupDir)) {
        return backupDir;
    }

    if (!QDir().mkpath(backupRoot)) {
        qWarning() << "No se pudo crear el directorio de copias:" << backupRoot;
        return QString();
    }

    qInfo() << "Creando copia de seguridad de" << udid << "en" << backupRoot;
    ToolResult result = ToolRunner::run(tool("idevicebackup2"), {"-u", udid, "backup", backupRoot}, kBackupTimeoutMs);
    if (!result.ok()) {
        qWarning() << "Fallo la copia de seguridad de" << udid << ":" << result.errorOutput().trimmed();
        return QString();
    }

    // idevicebackup2 guarda la copia en <destino>/<udid>
    if (!QFileInfo::exists(backupDir)) {
        qWarning() << "La copia de seguridad no aparece en" << backupDir;
        return QString();
    }

    m_backedUp.insert(udid);
    return backupDir;
}
