#include "smsconverter.h"
#include <QFile>
#include <QFileInfo>
#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QSqlDatabase>
#include <QSqlError>
#include <QSqlQuery>
#include <QUuid>

namespace {

// Los exportadores escriben todo como cadenas, pero se aceptan números
QString jsonText(const QJsonValue &value, const QString &defaultValue = QString())
{
    if (value.isString()) {
        return value.toString();
    }
    if (value.isDouble()) {
        return QString::number(static_cast<qint64>(value.toDouble()));
    }
    if (value.isBool()) {
        return value.toBool() ? "1" : "0";
    }
    return defaultValue;
}

} // namespace

qint64 SmsConverter::nativeToUnixMs(qint64 raw)
{
    if (raw > NanosecondThreshold) {
        return raw / 1000000LL + NativeEpochOffsetSeconds * 1000LL;
    }
    return (raw + NativeEpochOffsetSeconds) * 1000LL;
}

qint64 SmsConverter::unixMsToNative(qint64 unixMs, bool nanoseconds)
{
    qint64 nativeMs = unixMs - NativeEpochOffsetSeconds * 1000LL;
    if (nanoseconds) {
        return nativeMs * 1000000LL;
    }
    return nativeMs / 1000LL;
}

QList<SMSEntry> SmsConverter::parseJson(const QByteArray &data)
{
    QList<SMSEntry> entries;

    QJsonParseError error;
    QJsonDocument doc = QJsonDocument::fromJson(data, &error);
    if (error.error != QJsonParseError::NoError || !doc.isArray()) {
        qWarning() << "JSON de SMS inválido:" << error.errorString();
        return entries;
    }

    const QJsonArray array = doc.array();
    for (const QJsonValue &value : array) {
        if (!value.isObject()) {
            continue;
        }
        const QJsonObject obj = value.toObject();

        SMSEntry entry;
        entry.address = jsonText(obj.value("address"));
        entry.body = jsonText(obj.value("body"));
        entry.dateMs = jsonText(obj.value("date"), "0").toLongLong();
        entry.direction = jsonText(obj.value("type"), "1").toInt() == SMSEntry::Sent ? SMSEntry::Sent : SMSEntry::Inbox;
        entry.read = jsonText(obj.value("read"), "1") == "1";
        entry.threadId = jsonText(obj.value("thread_id"), "0").toLongLong();
        entries.append(entry);
    }

    return entries;
}

QList<SMSEntry> SmsConverter::parseJsonFile(const QString &path)
{
    QFile file(path);
    if (!file.exists()) {
        return QList<SMSEntry>();
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "No se pudo abrir el JSON de SMS:" << path << file.errorString();
        return QList<SMSEntry>();
    }
    return parseJson(file.readAll());
}

QByteArray SmsConverter::toJson(const QList<SMSEntry> &entries)
{
    QJsonArray array;
    for (const SMSEntry &entry : entries) {
        QJsonObject obj;
        obj["address"] = entry.address;
        obj["body"] = entry.body;
        obj["date"] = QString::number(entry.dateMs);
        obj["type"] = QString::number(static_cast<int>(entry.direction));
        obj["read"] = entry.read ? "1" : "0";
        obj["thread_id"] = QString::number(entry.threadId);
        array.append(obj);
    }
    return QJsonDocument(array).toJson(QJsonDocument::Indented);
}

bool SmsConverter::writeJsonFile(const QList<SMSEntry> &entries, const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        qWarning() << "No se pudo escribir el JSON de SMS:" << path << file.errorString();
        return false;
    }

    QByteArray data = toJson(entries);
    if (file.write(data) != data.size()) {
        qWarning() << "Escritura incompleta del JSON de SMS:" << path << file.errorString();
        return false;
    }
    return true;
}

QList<SMSEntry> SmsConverter::parseNativeStore(const QString &dbPath)
{
    QList<SMSEntry> entries;
    if (!QFileInfo::exists(dbPath)) {
        return entries;
    }

    const QString connectionName = "sms_native_" + QUuid::createUuid().toString(QUuid::WithoutBraces);
    {
        QSqlDatabase db = QSqlDatabase::addDatabase("QSQLITE", connectionName);
        db.setDatabaseName(dbPath);
        db.setConnectOptions("QSQLITE_OPEN_READONLY");

        if (!db.open()) {
            qWarning() << "No se pudo abrir sms.db:" << dbPath << db.lastError().text();
        } else {
            QSqlQuery query(db);
            bool ok = query.exec(
                "SELECT h.id AS address, m.text AS body, m.date AS date, "
                "m.is_from_me AS is_from_me, m.is_read AS is_read, m.handle_id AS thread_id "
                "FROM message m "
                "LEFT JOIN handle h ON m.handle_id = h.ROWID "
                "WHERE m.text IS NOT NULL AND m.text != '' "
                "ORDER BY m.date ASC");

            if (!ok) {
                qWarning() << "Fallo al consultar sms.db:" << query.lastError().text();
            } else {
                while (query.next()) {
                    SMSEntry entry;
                    entry.address = query.value("address").toString();
                    entry.body = query.value("body").toString();
                    entry.dateMs = nativeToUnixMs(query.value("date").toLongLong());
                    entry.direction = query.value("is_from_me").toInt() != 0 ? SMSEntry::Sent : SMSEntry::Inbox;
                    entry.read = query.value("is_read").toInt() != 0;
                    entry.threadId = query.value("thread_id").toLongLong();
                    entries.append(entry);
                }
            }
            db.close();
        }
    }
    QSqlDatabase::removeDatabase(connectionName);

    qDebug() << "Leídos" << entries.size() << "mensajes de" << QFileInfo(dbPath).fileName();
    return entries;
}

QString SmsConverter::nativeStoreToJson(const QString &dbPath, const QString &outPath)
{
    const QList<SMSEntry> entries = parseNativeStore(dbPath);
    if (entries.isEmpty()) {
        return QString();
    }
    if (!writeJsonFile(entries, outPath)) {
        return QString();
    }
    return outPath;
}
