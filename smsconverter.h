#ifndef SMSCONVERTER_H
#define SMSCONVERTER_H

#include <QByteArray>
#include <QList>
#include <QString>
#include "deviceinterface.h"

/**
 * @class SmsConverter
 * @brief Conversión de mensajes entre el JSON común y la base nativa de iOS (sms.db)
 *
 * La fecha canónica es milisegundos desde la época Unix. La base nativa usa
 * como época 2001-01-01 (978307200 s después de la época Unix) y guarda la
 * fecha en segundos o en nanosegundos según la versión del sistema.
 */
class SmsConverter
{
public:
    static constexpr qint64 NativeEpochOffsetSeconds = 978307200LL;

    /// Valores nativos por encima de este umbral están en nanosegundos
    static constexpr qint64 NanosecondThreshold = 1000000000000LL;

    /**
     * @brief Convierte una fecha nativa a milisegundos Unix
     * @param raw Segundos o nanosegundos desde 2001-01-01, según magnitud
     */
    static qint64 nativeToUnixMs(qint64 raw);

    /**
     * @brief Convierte milisegundos Unix a fecha nativa
     * @param nanoseconds true para el formato de nanosegundos, false para segundos
     */
    static qint64 unixMsToNative(qint64 unixMs, bool nanoseconds);

    /**
     * @brief Analiza el JSON común (array de objetos address/body/date/type/read/thread_id)
     * @return Lista vacía si el documento no es un array válido
     */
    static QList<SMSEntry> parseJson(const QByteArray &data);

    static QList<SMSEntry> parseJsonFile(const QString &path);

    /**
     * @brief Genera el JSON común; todos los valores se escriben como cadenas
     */
    static QByteArray toJson(const QList<SMSEntry> &entries);

    static bool writeJsonFile(const QList<SMSEntry> &entries, const QString &path);

    /**
     * @brief Lee una base sms.db en modo solo lectura, ordenada por fecha ascendente
     * @return Mensajes con fecha en milisegundos Unix; lista vacía ante cualquier error
     */
    static QList<SMSEntry> parseNativeStore(const QString &dbPath);

    /**
     * @brief Convierte directamente sms.db al JSON común
     * @return Ruta del JSON escrito, o cadena vacía si no hay mensajes o falló
     */
    static QString nativeStoreToJson(const QString &dbPath, const QString &outPath);
};

#endif // SMSCONVERTER_H
