#ifndef IOSDEVICE_H
#define IOSDEVICE_H

#include <QObject>
#include <QMap>
#include <QSet>
#include "deviceinterface.h"
#include "toolrunner.h"

/**
 * @class IosDevice
 * @brief Transporte iOS basado en las herramientas de libimobiledevice
 *
 * Los archivos se manejan con afcclient (Apple File Conduit, limitado al
 * área de medios del dispositivo). Contactos y mensajes no son accesibles
 * por AFC: se extraen de una copia de seguridad local sin cifrar creada con
 * idevicebackup2.
 */
class IosDevice : public QObject, public DeviceInterface
{
    Q_OBJECT
public:
    /// Nombre en la copia de seguridad de HomeDomain-Library/SMS/sms.db
    static const QString SmsBackupHash;

    /// Nombre en la copia de seguridad de HomeDomain-Library/AddressBook/AddressBook.sqlitedb
    static const QString AddressBookBackupHash;

    /**
     * @brief Constructor
     * @param toolsDir Directorio de las herramientas; vacío para buscarlas automáticamente
     * @param workDir Directorio donde se guardan las copias de seguridad
     * @param commandTimeoutMs Tiempo máximo de las transferencias de archivos
     * @param parent Objeto padre (opcional)
     */
    IosDevice(const QString &toolsDir, const QString &workDir, int commandTimeoutMs = 120000,
              QObject *parent = nullptr);
    ~IosDevice();

    bool isAvailable() const;

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

    /**
     * @brief Analiza salidas "Clave: Valor" (ideviceinfo, afcclient info/devinfo)
     *
     * Las líneas indentadas (diccionarios anidados) se ignoran.
     */
    static QMap<QString, QString> parseKeyValues(const QString &output);

    /**
     * @brief Localiza un archivo dentro de una copia de seguridad
     *
     * Prueba primero el nombre conocido (plano y en el subdirectorio de dos
     * caracteres) y después consulta Manifest.db por su ruta relativa.
     * @return Ruta local del archivo, o cadena vacía si no está
     */
    static QString findBackupFile(const QString &backupDir, const QString &knownHash, const QString &relativePath);

    /**
     * @brief Lee los contactos de AddressBook.sqlitedb
     */
    static QList<ContactEntry> readAddressBook(const QString &dbPath);

private:
    QString tool(const QString &name) const;
    ToolResult afc(const QString &udid, const QStringList &arguments, int timeoutMs) const;
    QString createBackup(const QString &udid);

    QString m_toolsDir;
    QString m_workDir;
    int m_commandTimeoutMs;
    mutable QMap<QString, QString> m_toolPaths;
    QSet<QString> m_backedUp;   // UDIDs con copia de seguridad hecha en esta sesión
};

#endif // IOSDEVICE_H
