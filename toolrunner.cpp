#include "toolrunner.h"
#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QProcess>
#include <QStandardPaths>

namespace {

QString executableName(const QString &name)
{
    if (QSysInfo::productType() == "windows") {
        return name + ".exe";
    }
    return name;
}

} // namespace

ToolResult ToolRunner::run(const QString &program, const QStringList &arguments, int timeoutMs)
{
    ToolResult result;
    if (program.isEmpty()) {
        qWarning() << "Herramienta no configurada para" << arguments.value(0);
        return result;
    }

    QProcess process;
    process.start(program, arguments);
    if (!process.waitForStarted(5000)) {
        qWarning() << "No se pudo iniciar" << program << ":" << process.errorString();
        return result;
    }
    result.started = true;

    if (!process.waitForFinished(timeoutMs)) {
        qWarning() << "Tiempo de espera agotado (" << timeoutMs << "ms ):" << program << arguments;
        process.kill();
        process.waitForFinished(1000);
        result.timedOut = true;
    }

    result.standardOutput = process.readAllStandardOutput();
    result.standardError = process.readAllStandardError();
    result.exitCode = process.exitStatus() == QProcess::NormalExit ? process.exitCode() : -1;

    if (!result.ok()) {
        qDebug() << "Comando fallido:" << QFileInfo(program).fileName() << arguments
                 << "código:" << result.exitCode << result.errorOutput().trimmed();
    }
    return result;
}

/**
 * Busca una herramienta en el directorio de la aplicación, el del proyecto y el PATH
 */
QString ToolRunner::findTool(const QString &name, const QString &subdir)
{
    const QString exe = executableName(name);

    // Buscar en el directorio de la aplicación
    QString appDir = QCoreApplication::applicationDirPath();
    QString internalPath = QDir::cleanPath(appDir + "/tools/" + subdir + "/" + exe);
    if (QFileInfo::exists(internalPath)) {
        qDebug() << name << "encontrado en el directorio de la aplicación:" << internalPath;
        return internalPath;
    }

    // Probar con la ruta relativa al directorio del proyecto
    internalPath = QDir::cleanPath(QDir::currentPath() + "/tools/" + subdir + "/" + exe);
    if (QFileInfo::exists(internalPath)) {
        qDebug() << name << "encontrado en el directorio del proyecto:" << internalPath;
        return internalPath;
    }

    QString systemPath = QStandardPaths::findExecutable(name);
    if (!systemPath.isEmpty()) {
        qDebug() << name << "encontrado en el PATH:" << systemPath;
        return systemPath;
    }

    qWarning() << name << "no encontrado (esperado en tools/" + subdir + "/ o en el PATH)";
    return QString();
}

QString ToolRunner::toolInDirectory(const QString &directory, const QString &name, const QString &subdir)
{
    if (!directory.isEmpty()) {
        QString candidate = QDir::cleanPath(directory + "/" + executableName(name));
        if (QFileInfo(candidate).isExecutable()) {
            return candidate;
        }
    }
    return findTool(name, subdir);
}
