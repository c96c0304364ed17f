#ifndef TOOLRUNNER_H
#define TOOLRUNNER_H

#include <QByteArray>
#include <QString>
#include <QStringList>

// Resultado de ejecutar una herramienta externa hasta su finalización
struct ToolResult {
    bool started = false;
    bool timedOut = false;
    int exitCode = -1;
    QByteArray standardOutput;
    QByteArray standardError;

    bool ok() const { return started && !timedOut && exitCode == 0; }
    QString output() const { return QString::fromUtf8(standardOutput); }
    QString errorOutput() const { return QString::fromUtf8(standardError); }
};

/**
 * @class ToolRunner
 * @brief Ejecuta herramientas de línea de comandos (adb, libimobiledevice) de forma bloqueante
 */
class ToolRunner
{
public:
    /**
     * @brief Ejecuta el programa y espera a que termine
     * @param timeoutMs Tiempo máximo; al expirar se mata el proceso
     */
    static ToolResult run(const QString &program, const QStringList &arguments, int timeoutMs);

    /**
     * @brief Localiza un ejecutable
     *
     * Busca en <dir. aplicación>/tools/<subdir>, luego en <dir. actual>/tools/<subdir>
     * y por último en el PATH del sistema.
     * @return Ruta absoluta, o cadena vacía si no se encuentra
     */
    static QString findTool(const QString &name, const QString &subdir);

    /**
     * @brief Resuelve el ejecutable de una herramienta dentro de un directorio configurado
     *
     * Si el directorio está vacío o no contiene la herramienta, recurre a findTool().
     */
    static QString toolInDirectory(const QString &directory, const QString &name, const QString &subdir);
};

#endif // TOOLRUNNER_H
