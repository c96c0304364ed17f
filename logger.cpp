#include "logger.h"
#include <QDate>
#include <QDateTime>
#include <QDir>
#include <QTextStream>
#include <cstdio>
#include <cstdlib>

QScopedPointer<QFile> Logger::s_file;
QMutex Logger::s_mutex;
QString Logger::s_filePath;
bool Logger::s_verbose = false;
bool Logger::s_installed = false;
QtMessageHandler Logger::s_previousHandler = nullptr;

void Logger::init(const QString &logDir, bool verbose)
{
    QMutexLocker lock(&s_mutex);

    if (s_installed) {
        return; // Ya inicializado
    }
    s_verbose = verbose;

    if (!logDir.isEmpty() && QDir().mkpath(logDir)) {
        s_filePath = QDir(logDir).filePath("migrationbridge_" + QDate::currentDate().toString("yyyyMMdd") + ".log");
        s_file.reset(new QFile(s_filePath));
        if (!s_file->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            fprintf(stderr, "Warning: no se pudo abrir el archivo de log %s\n", qPrintable(s_filePath));
            s_file.reset();
            s_filePath.clear();
        }
    }

    s_previousHandler = qInstallMessageHandler(messageHandler);
    s_installed = true;
}

void Logger::shutdown()
{
    QMutexLocker lock(&s_mutex);

    if (s_installed) {
        qInstallMessageHandler(s_previousHandler);
        s_previousHandler = nullptr;
        s_installed = false;
    }

    s_file.reset();
    s_filePath.clear();
}

QString Logger::logFilePath()
{
    return s_filePath;
}

void Logger::messageHandler(QtMsgType type, const QMessageLogContext &context, const QString &msg)
{
    if (type == QtDebugMsg && !s_verbose) {
        return;
    }

    const char *label = "Debug";
    QString level;
    switch (type) {
    case QtDebugMsg:    label = "Debug";    level = "DEBUG"; break;
    case QtInfoMsg:     label = "Info";     level = "INFO"; break;
    case QtWarningMsg:  label = "Warning";  level = "WARN"; break;
    case QtCriticalMsg: label = "Critical"; level = "ERROR"; break;
    case QtFatalMsg:    label = "Fatal";    level = "FATAL"; break;
    }

    QByteArray localMsg = msg.toLocal8Bit();
    fprintf(stderr, "%s: %s (%s:%u, %s)\n", label, localMsg.constData(),
            context.file ? context.file : "", context.line, context.function ? context.function : "");
    fflush(stderr);

    {
        QMutexLocker lock(&s_mutex);
        if (s_file && s_file->isOpen()) {
            QTextStream stream(s_file.data());
            stream << "[" << QDateTime::currentDateTime().toString("yyyy-MM-dd hh:mm:ss") << "] "
                   << level << ": " << msg << "\n";
            stream.flush();
            s_file->flush();
        }
    }

    if (type == QtFatalMsg) {
        abort();
    }
}
