#ifndef APPSETTINGS_H
#define APPSETTINGS_H

#include <QObject>
#include <QSettings>
#include <QString>
#include "crosstransfermanager.h"

/**
 * @class AppSettings
 * @brief Configuración persistente de la aplicación sobre QSettings
 *
 * Rutas de trabajo, rutas de las herramientas externas, tiempo máximo de
 * los comandos y las categorías de transferencia por defecto.
 */
class AppSettings : public QObject
{
    Q_OBJECT
public:
    explicit AppSettings(QObject *parent = nullptr);

    /**
     * @brief Usa un archivo INI concreto en lugar del almacén del sistema
     */
    explicit AppSettings(const QString &iniPath, QObject *parent = nullptr);

    static constexpr int DefaultCommandTimeoutMs = 120000;

    QString workDir() const;
    void setWorkDir(const QString &path);

    QString logDir() const;
    void setLogDir(const QString &path);

    QString adbPath() const;
    void setAdbPath(const QString &path);

    QString libimobiledevicePath() const;
    void setLibimobiledevicePath(const QString &path);

    int commandTimeoutMs() const;
    void setCommandTimeoutMs(int timeoutMs);

    /**
     * @brief Configuración de transferencia construida con los valores guardados
     */
    CrossTransferConfig transferConfig() const;
    void setTransferConfig(const CrossTransferConfig &config);

    void sync();

signals:
    void settingsChanged();

private:
    bool transferFlag(const QString &name, bool defaultValue) const;

    QSettings m_settings;
};

#endif // APPSETTINGS_H
