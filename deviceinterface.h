#ifndef DEVICEINTERFACE_H
#define DEVICEINTERFACE_H

#include <QString>
#include <QStringList>
#include <QList>
#include <QMap>

/**
 * @brief Plataforma de un dispositivo conectado
 */
enum class DevicePlatform {
    Android,
    Ios,
    Unknown
};

/**
 * @brief Estado del ciclo de vida de un dispositivo
 */
enum class DeviceState {
    Connected,      ///< Listo para usar ("device" en adb)
    Unauthorized,   ///< Falta aceptar la depuración USB / confiar en el equipo
    Offline,
    Recovery,
    Locked,
    Dfu             ///< Solo iOS
};

/**
 * @brief Nombre textual de la plataforma ("android", "ios", "unknown")
 */
QString platformName(DevicePlatform platform);

/**
 * @brief Formatea un tamaño en bytes con una cifra decimal (B, KB, MB, GB, TB, PB)
 */
QString formatBytes(qint64 size);

/**
 * @brief Directorio de descargas accesible en la plataforma indicada
 * @return "/sdcard/Download" en Android, "/Downloads" en iOS, cadena vacía si es desconocida
 */
QString downloadsDirectory(DevicePlatform platform);

// Información de un dispositivo independiente de la plataforma.
// Es una instantánea: se vuelve a consultar, nunca se modifica.
struct UnifiedDeviceInfo {
    QString serial;                 // Serial (Android) o UDID (iOS)
    DevicePlatform platform = DevicePlatform::Unknown;
    DeviceState state = DeviceState::Connected;
    QString model;
    QString manufacturer;
    QString osVersion;              // "14" (Android) o "17.5" (iOS)
    QString product;
    qint64 storageTotal = 0;        // bytes
    qint64 storageFree = 0;         // bytes
    int batteryLevel = -1;

    // Solo iOS
    QString udid;
    QString deviceClass;            // iPhone, iPad, iPod
    QString iosBuild;

    // Solo Android
    QString sdkVersion;
    QString androidCodename;

    QString friendlyName() const;
    QString platformLabel() const;
    QString storageSummary() const;
    QString shortLabel() const;
};

// Contacto en formato común
struct ContactEntry {
    QString displayName;
    QStringList phones;             // Orden de inserción del origen, se permiten duplicados
    QStringList emails;
    QString organization;
    QString note;
    QString rawVCard;               // Texto original de la tarjeta, se re-emite tal cual
};

// Mensaje SMS con fecha normalizada a milisegundos desde la época Unix
struct SMSEntry {
    enum Direction {
        Inbox = 1,
        Sent = 2
    };

    QString address;
    QString body;
    qint64 dateMs = 0;
    Direction direction = Inbox;
    bool read = true;
    qint64 threadId = 0;
};

// Evento de calendario en formato iCalendar
struct CalendarEvent {
    QString uid;
    QString summary;
    QString description;
    QString dtStart;                // YYYYMMDDTHHMMSSZ
    QString dtEnd;
    QString location;
    QString rawIcs;                 // Bloque VEVENT original, se re-emite tal cual
};

// Resultado de stat sobre un archivo remoto
struct RemoteFileStat {
    qint64 size = 0;
    qint64 modifiedTime = 0;        // segundos desde la época Unix
};

/**
 * @brief Estado de un comando crudo ejecutado en el dispositivo
 */
enum class CommandStatus {
    Ok,
    Failed,         ///< El comando se ejecutó pero falló
    Unsupported     ///< El transporte no ofrece esta capacidad
};

struct CommandResult {
    CommandStatus status = CommandStatus::Unsupported;
    QString output;
    QString errorMessage;

    bool ok() const { return status == CommandStatus::Ok; }
};

/**
 * @class DeviceInterface
 * @brief Interfaz de capacidades que debe implementar cada transporte de dispositivo
 *
 * El orquestador de transferencias y las estrategias por categoría dependen
 * solo de esta interfaz. Cada plataforma (adb, libimobiledevice) aporta su
 * implementación concreta. Las operaciones de archivo devuelven false o un
 * valor vacío ante condiciones esperadas (archivo inexistente, fallo de
 * transporte) en lugar de abortar.
 */
class DeviceInterface
{
public:
    virtual ~DeviceInterface() = default;

    /**
     * @brief Plataforma que maneja este transporte
     */
    virtual DevicePlatform platform() const = 0;

    /**
     * @brief Lista los dispositivos conectados en este transporte
     */
    virtual QList<UnifiedDeviceInfo> listDevices() = 0;

    /**
     * @brief Obtiene la información completa de un dispositivo
     * @param serial Identificador del dispositivo
     */
    virtual UnifiedDeviceInfo deviceDetails(const QString &serial) = 0;

    /**
     * @brief Copia un archivo del dispositivo al sistema de archivos local
     * @return true si la copia fue exitosa
     */
    virtual bool pull(const QString &remotePath, const QString &localPath, const QString &serial) = 0;

    /**
     * @brief Copia un archivo local al dispositivo
     * @return true si la copia fue exitosa
     */
    virtual bool push(const QString &localPath, const QString &remotePath, const QString &serial) = 0;

    /**
     * @brief Lista las entradas de un directorio remoto
     * @return Nombres de las entradas (sin ruta), lista vacía si no existe
     */
    virtual QStringList listDir(const QString &remotePath, const QString &serial) = 0;

    virtual bool fileExists(const QString &remotePath, const QString &serial) = 0;

    /**
     * @brief Crea un directorio remoto, incluidos los padres
     */
    virtual bool makeDirectory(const QString &remotePath, const QString &serial) = 0;

    virtual bool remove(const QString &remotePath, const QString &serial) = 0;

    virtual RemoteFileStat statFile(const QString &remotePath, const QString &serial) = 0;

    /**
     * @brief Exporta los contactos del dispositivo a un archivo VCF local
     * @param outDir Directorio local donde se escribe el archivo
     * @return Ruta del VCF generado, o cadena vacía si no hay contactos o falló
     */
    virtual QString exportContacts(const QString &serial, const QString &outDir) = 0;

    /**
     * @brief Importa contactos desde un archivo VCF local
     */
    virtual bool importContacts(const QString &serial, const QString &vcfPath) = 0;

    /**
     * @brief Exporta los mensajes SMS a un archivo JSON local
     * @return Ruta del JSON generado, o cadena vacía si no hay mensajes o falló
     */
    virtual QString exportMessages(const QString &serial, const QString &outDir) = 0;

    /**
     * @brief Importa mensajes SMS desde un archivo JSON local
     */
    virtual bool importMessages(const QString &serial, const QString &jsonPath) = 0;

    /**
     * @brief Rutas remotas candidatas por categoría
     *
     * Claves esperadas: "photos", "videos", "music", "documents".
     */
    virtual QMap<QString, QStringList> mediaPaths(const QString &serial) = 0;

    /**
     * @brief Espacio libre en bytes, o -1 si se desconoce
     */
    virtual qint64 freeBytes(const QString &serial) = 0;

    /**
     * @brief Espacio total en bytes, o -1 si se desconoce
     */
    virtual qint64 totalBytes(const QString &serial) = 0;

    /**
     * @brief Ejecuta un comando crudo de la plataforma
     *
     * Por defecto no está soportado y devuelve CommandStatus::Unsupported.
     */
    virtual CommandResult runShell(const QString &command, const QString &serial, int timeoutMs = 60000);
};

#endif // DEVICEINTERFACE_H
