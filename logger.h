#ifndef LOGGER_H
#define LOGGER_H

#include <QString>
#include <QFile>
#include <QMutex>
#include <QScopedPointer>

/**
 * @class Logger
 * @brief Manejador de mensajes de Qt que escribe en stderr y en un archivo diario
 *
 * Todo el código usa qDebug()/qInfo()/qWarning(); solo main() configura el destino.
 */
class Logger
{
public:
    /**
     * @brief Instala el manejador
     * @param logDir Directorio del archivo migrationbridge_<AAAAMMDD>.log; vacío para solo stderr
     * @param verbose Si es false se descartan los mensajes de depuración
     */
    static void init(const QString &logDir, bool verbose);

    /**
     * @brief Restaura el manejador anterior y cierra el archivo
     */
    static void shutdown();

    static QString logFilePath();

private:
    static void messageHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg);

    static QScopedPointer<QFile> s_file;
    static QMutex s_mutex;
    static QString s_filePath;
    static bool s_verbose;
    static bool s_installed;
    static QtMessageHandler s_previousHandler;
};

#endif // LOGGER_H
