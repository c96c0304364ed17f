// Pasos por categoría de CrossTransferManager

#include "crosstransfermanager.h"
#include "calendarconverter.h"
#include "photoconverter.h"
#include "smsconverter.h"
#include "vcardconverter.h"
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>

namespace {

const char *kCalendarQuery =
    "content query --uri content://com.android.calendar/events "
    "--projection title:dtstart:dtend:eventLocation:description";

QString categoryDirectory(const QString &staging, const QString &category)
{
    QString dir = QDir(staging).filePath(category);
    if (!QDir().mkpath(dir)) {
        qWarning() << "No se pudo crear el directorio de staging de" << category << ":" << dir;
    }
    return dir;
}

QString joinRemote(const QString &base, const QString &name)
{
    return base.endsWith('/') ? base + name : base + "/" + name;
}

} // namespace

/**
 * Contactos: exportar VCF en el origen e importarlo en el destino
 */
bool CrossTransferManager::transferContacts(const StepContext &context)
{
    const QString dir = categoryDirectory(context.staging, "contacts");

    m_progress.currentItem = "Exportando contatos...";
    emitProgress();

    QString vcfPath = context.source->exportContacts(context.sourceSerial, dir);
    if (vcfPath.isEmpty() || !QFileInfo::exists(vcfPath)) {
        m_progress.warnings.append("Nenhum contato encontrado na origem");
        return true;
    }

    const int count = VCardConverter::parseFile(vcfPath).size();
    qInfo() << "Contactos exportados:" << count;

    m_progress.currentItem = QString("Importando %1 contatos...").arg(count);
    emitProgress();

    return context.target->importContacts(context.targetSerial, vcfPath);
}

/**
 * SMS: exportar al JSON común e intentar la importación en el destino
 */
bool CrossTransferManager::transferMessages(const StepContext &context)
{
    const QString dir = categoryDirectory(context.staging, "sms");

    m_progress.currentItem = "Exportando SMS...";
    emitProgress();

    QString jsonPath = context.source->exportMessages(context.sourceSerial, dir);
    if (jsonPath.isEmpty() || !QFileInfo::exists(jsonPath)) {
        m_progress.warnings.append("Nenhuma SMS encontrada na origem");
        return true;
    }

    qInfo() << "Mensajes exportados:" << SmsConverter::parseJsonFile(jsonPath).size();

    if (context.targetPlatform == DevicePlatform::Ios) {
        m_progress.warnings.append("iOS não permite importação programática de SMS. "
                                   "As mensagens foram salvas para referência.");
    }

    m_progress.currentItem = "Importando SMS...";
    emitProgress();

    return context.target->importMessages(context.targetSerial, jsonPath);
}

/**
 * Calendario: solo si el origen ofrece una consulta estructurada de eventos
 */
bool CrossTransferManager::transferCalendar(const StepContext &context)
{
    const QString dir = categoryDirectory(context.staging, "calendar");

    m_progress.currentItem = "Exportando calendário...";
    emitProgress();

    QList<CalendarEvent> events;
    if (context.sourcePlatform == DevicePlatform::Android) {
        CommandResult result = context.source->runShell(kCalendarQuery, context.sourceSerial, 30000);
        if (result.ok() && !result.output.contains("Error")) {
            events = CalendarConverter::parseContentQuery(result.output);
        } else {
            qDebug() << "Consulta de calendario no disponible:" << result.errorMessage;
        }
    }

    if (events.isEmpty()) {
        m_progress.warnings.append("Exportação de calendário não disponível");
        return true;
    }

    const QString icsPath = QDir(dir).filePath("calendar.ics");
    if (!CalendarConverter::writeFile(events, icsPath)) {
        m_progress.errors.append("Calendário: não foi possível gravar calendar.ics");
        return false;
    }
    qInfo() << "Eventos de calendario exportados:" << events.size();

    m_progress.currentItem = "Importando calendário...";
    emitProgress();

    const QString remote = joinRemote(downloadsDirectory(context.targetPlatform), "calendar.ics");
    return context.target->push(icsPath, remote, context.targetSerial);
}

/**
 * Medios: recorrer las rutas del origen, copiar archivo a archivo pasando por staging
 */
bool CrossTransferManager::transferMedia(const StepContext &context, const QString &category)
{
    const QStringList sourcePaths = context.source->mediaPaths(context.sourceSerial).value(category);
    const QStringList targetPaths = context.target->mediaPaths(context.targetSerial).value(category);

    if (sourcePaths.isEmpty()) {
        return true;
    }
    if (targetPaths.isEmpty()) {
        m_progress.warnings.append("Sem caminho de destino para " + category);
        return true;
    }

    const QString targetBase = targetPaths.first();
    const QString mediaDir = categoryDirectory(context.staging, category);
    const double stepSpan = 100.0 / m_totalSteps;
    const double stepStart = m_stepIndex * stepSpan;

    int pulled = 0;
    int pushed = 0;
    int errors = 0;

    for (int rootIdx = 0; rootIdx < sourcePaths.size(); ++rootIdx) {
        if (m_cancelRequested) {
            m_stepInterrupted = true;
            break;
        }

        const QString &root = sourcePaths[rootIdx];
        const QStringList entries = context.source->listDir(root, context.sourceSerial);
        qDebug() << category << ":" << entries.size() << "entradas en" << root;

        for (int i = 0; i < entries.size(); ++i) {
            if (m_cancelRequested) {
                m_stepInterrupted = true;
                break;
            }

            const QString &entry = entries[i];
            if (entry.isEmpty() || isSkippedEntry(entry, context.config)) {
                continue;
            }

            // Fracción dentro del paso: cada raíz ocupa una parte igual
            double fraction = (rootIdx + static_cast<double>(i) / entries.size()) / sourcePaths.size();
            m_progress.currentItem = entry;
            m_progress.percent = stepStart + fraction * stepSpan;
            emitProgress();

            const QString localPath = QDir(mediaDir).filePath(entry);
            if (!context.source->pull(joinRemote(root, entry), localPath, context.sourceSerial)) {
                qWarning() << "Fallo al extraer" << entry << "de" << root;
                ++errors;
                ++m_progress.fileErrors;
                continue;
            }
            ++pulled;
            ++m_progress.filesPulled;

            QString pushPath = localPath;
            if (context.config.convertHeic) {
                pushPath = PhotoConverter::convertIfNeeded(localPath, context.targetPlatform, mediaDir);
            }

            if (m_cancelRequested) {
                m_stepInterrupted = true;
            } else {
                const QString remote = joinRemote(targetBase, QFileInfo(pushPath).fileName());
                if (context.target->push(pushPath, remote, context.targetSerial)) {
                    ++pushed;
                    ++m_progress.filesPushed;
                } else {
                    qWarning() << "Fallo al enviar" << pushPath << "a" << remote;
                    ++errors;
                    ++m_progress.fileErrors;
                }
            }

            QFile::remove(localPath);
            if (pushPath != localPath) {
                QFile::remove(pushPath);
            }
        }
    }

    qInfo() << category << ": extraídos" << pulled << "enviados" << pushed << "errores" << errors;

    if (errors > 0) {
        m_progress.errors.append(QString("%1: %2 erro(s)").arg(category).arg(errors));
        return false;
    }
    return true;
}
