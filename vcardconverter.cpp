#include "vcardconverter.h"
#include <QFile>
#include <QDebug>
#include <QFileInfo>
#include <QRegularExpression>

namespace {

const QString kBeginCard = QStringLiteral("BEGIN:VCARD");

// Nombre de propiedad de una línea: texto antes del primer ';' o ':',
// sin el prefijo de grupo ("item1.TEL" -> "TEL")
QString propertyName(const QString &line)
{
    int end = line.size();
    int colon = line.indexOf(':');
    int semicolon = line.indexOf(';');
    if (colon >= 0) end = colon;
    if (semicolon >= 0 && semicolon < end) end = semicolon;

    QString name = line.left(end).trimmed();
    int dot = name.lastIndexOf('.');
    if (dot >= 0) {
        name = name.mid(dot + 1);
    }
    return name.toUpper();
}

QString propertyValue(const QString &line)
{
    int colon = line.indexOf(':');
    if (colon < 0) {
        return QString();
    }
    return line.mid(colon + 1).trimmed();
}

} // namespace

/**
 * Divide el texto en tarjetas por cada "BEGIN:VCARD"
 */
QList<ContactEntry> VCardConverter::parse(const QString &text)
{
    QList<ContactEntry> contacts;

    int start = text.indexOf(kBeginCard);
    while (start >= 0) {
        int next = text.indexOf(kBeginCard, start + kBeginCard.size());
        QString card = (next >= 0 ? text.mid(start, next - start) : text.mid(start)).trimmed();
        contacts.append(parseCard(card));
        start = next;
    }

    return contacts;
}

QList<ContactEntry> VCardConverter::parseFile(const QString &path)
{
    QFile file(path);
    if (!file.exists()) {
        return QList<ContactEntry>();
    }
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "No se pudo abrir el VCF:" << path << file.errorString();
        return QList<ContactEntry>();
    }

    QList<ContactEntry> contacts = parse(QString::fromUtf8(file.readAll()));
    qDebug() << "Analizados" << contacts.size() << "contactos de" << QFileInfo(path).fileName();
    return contacts;
}

ContactEntry VCardConverter::parseCard(const QString &card)
{
    ContactEntry entry;
    entry.rawVCard = card;

    QString structuredName;
    bool haveStructuredName = false;

    const QStringList lines = card.split('\n');
    for (QString line : lines) {
        if (line.endsWith('\r')) {
            line.chop(1);
        }
        if (line.trimmed().isEmpty()) {
            continue;
        }

        const QString name = propertyName(line);
        const QString value = propertyValue(line);

        if (name == "FN") {
            if (entry.displayName.isEmpty()) {
                entry.displayName = value;
            }
        } else if (name == "N") {
            if (!haveStructuredName) {
                // N:Apellido;Nombre;...
                QStringList parts = value.split(';');
                QString family = parts.value(0).trimmed();
                QString given = parts.value(1).trimmed();
                structuredName = QString("%1 %2").arg(given, family).trimmed();
                haveStructuredName = true;
            }
        } else if (name == "TEL") {
            if (!value.isEmpty()) {
                entry.phones.append(value);
            }
        } else if (name == "EMAIL") {
            if (!value.isEmpty()) {
                entry.emails.append(value);
            }
        } else if (name == "ORG") {
            if (entry.organization.isEmpty()) {
                entry.organization = value;
            }
        } else if (name == "NOTE") {
            if (entry.note.isEmpty()) {
                entry.note = value;
            }
        }
    }

    if (entry.displayName.isEmpty()) {
        entry.displayName = structuredName;
    }

    return entry;
}

QString VCardConverter::formatContact(const ContactEntry &contact)
{
    if (!contact.rawVCard.isEmpty()) {
        return contact.rawVCard;
    }

    QString name = contact.displayName.trimmed();
    int space = name.indexOf(QRegularExpression("\\s"));
    QString first = space >= 0 ? name.left(space) : name;
    QString last = space >= 0 ? name.mid(space + 1).trimmed() : QString();

    QStringList lines;
    lines << "BEGIN:VCARD"
          << "VERSION:3.0"
          << QString("N:%1;%2;;;").arg(last, first)
          << QString("FN:%1").arg(contact.displayName);
    if (!contact.organization.isEmpty()) {
        lines << QString("ORG:%1").arg(contact.organization);
    }
    for (const QString &phone : contact.phones) {
        lines << QString("TEL;TYPE=CELL:%1").arg(phone);
    }
    for (const QString &email : contact.emails) {
        lines << QString("EMAIL;TYPE=INTERNET:%1").arg(email);
    }
    if (!contact.note.isEmpty()) {
        lines << QString("NOTE:%1").arg(contact.note);
    }
    lines << "END:VCARD";

    return lines.join('\n');
}

QString VCardConverter::format(const QList<ContactEntry> &contacts)
{
    QStringList cards;
    for (const ContactEntry &contact : contacts) {
        cards << formatContact(contact);
    }
    return cards.join('\n');
}

bool VCardConverter::writeFile(const QList<ContactEntry> &contacts, const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        qWarning() << "No se pudo escribir el VCF:" << path << file.errorString();
        return false;
    }

    QByteArray data = format(contacts).toUtf8();
    if (file.write(data) != data.size()) {
        qWarning() << "Escritura incompleta del VCF:" << path << file.errorString();
        return false;
    }

    qDebug() << "Escritos" << contacts.size() << "contactos en" << QFileInfo(path).fileName();
    return true;
}
