#include "calendarconverter.h"
#include <QDateTime>
#include <QDebug>
#include <QFile>
#include <QRegularExpression>

namespace {

const QString kBeginEvent = QStringLiteral("BEGIN:VEVENT");
const QString kEndEvent = QStringLiteral("END:VEVENT");

// Devuelve el valor de la primera línea del bloque cuya propiedad es `key`
// (admite parámetros: "DTSTART;TZID=...:valor")
QString firstField(const QStringList &lines, const QString &key)
{
    for (const QString &line : lines) {
        int colon = line.indexOf(':');
        if (colon < 0) {
            continue;
        }
        QString name = line.left(colon);
        int semicolon = name.indexOf(';');
        if (semicolon >= 0) {
            name = name.left(semicolon);
        }
        if (name.trimmed().compare(key, Qt::CaseInsensitive) == 0) {
            return line.mid(colon + 1).trimmed();
        }
    }
    return QString();
}

// "NULL" es como content query muestra las columnas vacías
QString queryField(const QString &line, const QRegularExpression &re)
{
    QRegularExpressionMatch match = re.match(line);
    if (!match.hasMatch()) {
        return QString();
    }
    QString value = match.captured(1).trimmed();
    return value == "NULL" ? QString() : value;
}

} // namespace

QList<CalendarEvent> CalendarConverter::parse(const QString &text)
{
    QList<CalendarEvent> events;

    int begin = text.indexOf(kBeginEvent);
    while (begin >= 0) {
        int end = text.indexOf(kEndEvent, begin + kBeginEvent.size());
        if (end < 0) {
            break; // Bloque sin cerrar
        }

        const QString block = text.mid(begin + kBeginEvent.size(), end - begin - kBeginEvent.size());
        QStringList lines = block.split('\n');
        for (QString &line : lines) {
            if (line.endsWith('\r')) {
                line.chop(1);
            }
        }

        CalendarEvent event;
        event.uid = firstField(lines, "UID");
        event.summary = firstField(lines, "SUMMARY");
        event.description = firstField(lines, "DESCRIPTION");
        event.dtStart = firstField(lines, "DTSTART");
        event.dtEnd = firstField(lines, "DTEND");
        event.location = firstField(lines, "LOCATION");
        event.rawIcs = kBeginEvent + block + kEndEvent;
        events.append(event);

        begin = text.indexOf(kBeginEvent, end + kEndEvent.size());
    }

    return events;
}

QList<CalendarEvent> CalendarConverter::parseFile(const QString &path)
{
    QFile file(path);
    if (!file.exists()) {
        return QList<CalendarEvent>();
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "No se pudo abrir el ICS:" << path << file.errorString();
        return QList<CalendarEvent>();
    }
    return parse(QString::fromUtf8(file.readAll()));
}

QString CalendarConverter::formatEvent(const CalendarEvent &event)
{
    if (!event.rawIcs.isEmpty()) {
        return event.rawIcs;
    }

    QStringList lines;
    lines << kBeginEvent;
    if (!event.uid.isEmpty()) lines << "UID:" + event.uid;
    if (!event.summary.isEmpty()) lines << "SUMMARY:" + event.summary;
    if (!event.description.isEmpty()) lines << "DESCRIPTION:" + event.description;
    if (!event.dtStart.isEmpty()) lines << "DTSTART:" + event.dtStart;
    if (!event.dtEnd.isEmpty()) lines << "DTEND:" + event.dtEnd;
    if (!event.location.isEmpty()) lines << "LOCATION:" + event.location;
    lines << kEndEvent;

    return lines.join('\n');
}

QString CalendarConverter::format(const QList<CalendarEvent> &events)
{
    QStringList lines;
    lines << "BEGIN:VCALENDAR"
          << "VERSION:2.0"
          << "PRODID:-//MobileMigrationBridge//Cross-Platform Transfer//PT";
    for (const CalendarEvent &event : events) {
        lines << formatEvent(event);
    }
    lines << "END:VCALENDAR";
    return lines.join('\n');
}

bool CalendarConverter::writeFile(const QList<CalendarEvent> &events, const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        qWarning() << "No se pudo escribir el ICS:" << path << file.errorString();
        return false;
    }

    QByteArray data = format(events).toUtf8();
    if (file.write(data) != data.size()) {
        qWarning() << "Escritura incompleta del ICS:" << path << file.errorString();
        return false;
    }
    return true;
}

QList<CalendarEvent> CalendarConverter::parseContentQuery(const QString &output)
{
    static const QRegularExpression titleRe("title=([^,}]+)");
    static const QRegularExpression startRe("dtstart=(\\d+)");
    static const QRegularExpression endRe("dtend=(\\d+)");
    static const QRegularExpression locationRe("eventLocation=([^,}]+)");

    QList<CalendarEvent> events;

    const QStringList lines = output.split('\n', Qt::SkipEmptyParts);
    for (const QString &line : lines) {
        CalendarEvent event;
        event.summary = queryField(line, titleRe);
        if (event.summary.isEmpty()) {
            continue;
        }

        QString start = queryField(line, startRe);
        if (!start.isEmpty()) {
            event.dtStart = formatUtc(start.toLongLong());
        }
        QString end = queryField(line, endRe);
        if (!end.isEmpty()) {
            event.dtEnd = formatUtc(end.toLongLong());
        }
        event.location = queryField(line, locationRe);

        events.append(event);
    }

    return events;
}

QString CalendarConverter::formatUtc(qint64 msecsSinceEpoch)
{
    return QDateTime::fromMSecsSinceEpoch(msecsSinceEpoch, Qt::UTC).toString("yyyyMMdd'T'HHmmss'Z'");
}
