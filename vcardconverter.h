#ifndef VCARDCONVERTER_H
#define VCARDCONVERTER_H

#include <QList>
#include <QString>
#include "deviceinterface.h"

/**
 * @class VCardConverter
 * @brief Lectura y escritura de contactos en vCard 3.0
 *
 * Cada tarjeta conserva su texto original; al escribir, el original tiene
 * prioridad sobre la reconstrucción para no perder campos.
 */
class VCardConverter
{
public:
    /**
     * @brief Analiza un texto VCF con una o varias tarjetas
     * @param text Contenido del archivo
     * @return Contactos en el orden en que aparecen
     */
    static QList<ContactEntry> parse(const QString &text);

    /**
     * @brief Lee y analiza un archivo VCF
     * @return Lista vacía si el archivo no existe o no se puede leer
     */
    static QList<ContactEntry> parseFile(const QString &path);

    /**
     * @brief Genera el texto de una tarjeta (sin salto de línea final)
     */
    static QString formatContact(const ContactEntry &contact);

    static QString format(const QList<ContactEntry> &contacts);

    /**
     * @brief Escribe los contactos en un archivo VCF (UTF-8)
     * @return true si se escribió correctamente
     */
    static bool writeFile(const QList<ContactEntry> &contacts, const QString &path);

private:
    static ContactEntry parseCard(const QString &card);
};

#endif // VCARDCONVERTER_H
