#ifndef ADBDEVICE_H
#define ADBDEVICE_H

#include <QObject>
#include <QMap>
#include <QPair>
#include "deviceinterface.h"
#include "toolrunner.h"

/**
 * @class AdbDevice
 * @brief Transporte Android basado en la herramienta adb
 *
 * Cada operación lanza un proceso adb y espera su finalización. Los
 * contactos y los SMS se leen y escriben a través de los content providers
 * del sistema con "adb shell content".
 */
class AdbDevice : public QObject, public DeviceInterface
{
    Q_OBJECT
public:
    /**
     * @brief Constructor
     * @param adbPath Ruta del ejecutable adb; si está vacía se busca automáticamente
     * @param commandTimeoutMs Tiempo máximo de las transferencias de archivos
     * @param parent Objeto padre (opcional)
     */
    explicit AdbDevice(const QString &adbPath = QString(), int commandTimeoutMs = 120000, QObject *parent = nullptr);
    ~AdbDevice();

    bool isAvailable() const;
    QString adbPath() const;

    DevicePlatform platform() const override;
    QList<UnifiedDeviceInfo> listDevices() override;
    UnifiedDeviceInfo deviceDetails(const QString &serial) override;

    bool pull(const QString &remotePath, const QString &localPath, const QString &serial) override;
    bool push(const QString &localPath, const QString &remotePath, const QString &serial) override;
    QStringList listDir(const QString &remotePath, const QString &serial) override;
    bool fileExists(const QString &remotePath, const QString &serial) override;
    bool makeDirectory(const QString &remotePath, const QString &serial) override;
    bool remove(const QString &remotePath, const QString &serial) override;
    RemoteFileStat statFile(const QString &remotePath, const QString &serial) override;

    QString exportContacts(const QString &serial, const QString &outDir) override;
    bool importContacts(const QString &serial, const QString &vcfPath) override;
    QString exportMessages(const QString &serial, const QString &outDir) override;
    bool importMessages(const QString &serial, const QString &jsonPath) override;

    QMap<QString, QStringList> mediaPaths(const QString &serial) override;
    qint64 freeBytes(const QString &serial) override;
    qint64 totalBytes(const QString &serial) override;

    CommandResult runShell(const QString &command, const QString &serial, int timeoutMs = 60000) override;

    // Analizadores de la salida de adb

    /**
     * @brief Analiza la salida de "adb devices -l"
     */
    static QList<UnifiedDeviceInfo> parseDeviceList(const QString &output);

    /**
     * @brief Analiza "df" y devuelve (total, libre) en bytes; (-1, -1) si no se reconoce
     */
    static QPair<qint64, qint64> parseDiskUsage(const QString &output);

    /**
     * @brief Nivel de batería de "dumpsys battery", -1 si no aparece
     */
    static int parseBatteryLevel(const QString &output);

    /**
     * @brief Analiza "content query --uri content://sms"
     *
     * Solo se conservan las filas con address y body.
     */
    static QList<SMSEntry> parseSmsQuery(const QString &output);

    /**
     * @brief Extrae las claves "lookup" de una consulta de contactos
     */
    static QStringList parseLookupKeys(const QString &output);

    /**
     * @brief Entrecomilla un valor para el shell del dispositivo
     */
    static QString shellQuote(const QString &value);

private:
    ToolResult adb(const QString &serial, const QStringList &arguments, int timeoutMs) const;
    QString shell(const QString &serial, const QString &command, int timeoutMs = 30000) const;

    QString m_adbPath;
    int m_commandTimeoutMs;
};

#endif // ADBDEVICE_H
