#ifndef CALENDARCONVERTER_H
#define CALENDARCONVERTER_H

#include <QList>
#include <QString>
#include "deviceinterface.h"

/**
 * @class CalendarConverter
 * @brief Lectura y escritura de eventos en iCalendar (ICS)
 */
class CalendarConverter
{
public:
    /**
     * @brief Analiza los bloques BEGIN:VEVENT ... END:VEVENT de un texto ICS
     *
     * Cada campo toma la primera línea que coincide. El bloque completo se
     * conserva para re-emitirlo tal cual.
     */
    static QList<CalendarEvent> parse(const QString &text);

    static QList<CalendarEvent> parseFile(const QString &path);

    /**
     * @brief Genera el bloque VEVENT de un evento
     *
     * Usa el bloque original si existe; si no, solo incluye los campos no vacíos.
     */
    static QString formatEvent(const CalendarEvent &event);

    /**
     * @brief Genera un VCALENDAR completo con todos los eventos
     */
    static QString format(const QList<CalendarEvent> &events);

    static bool writeFile(const QList<CalendarEvent> &events, const QString &path);

    /**
     * @brief Analiza la salida de una consulta de eventos tipo content provider
     *
     * Cada línea aporta title, dtstart, dtend y eventLocation. Las líneas sin
     * título se descartan. Las fechas vienen en milisegundos Unix.
     */
    static QList<CalendarEvent> parseContentQuery(const QString &output);

    /**
     * @brief Formatea milisegundos Unix como YYYYMMDDTHHMMSSZ (UTC)
     */
    static QString formatUtc(qint64 msecsSinceEpoch);
};

#endif // CALENDARCONVERTER_H
