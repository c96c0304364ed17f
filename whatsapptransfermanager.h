#ifndef WHATSAPPTRANSFERMANAGER_H
#define WHATSAPPTRANSFERMANAGER_H

#include <QObject>
#include <QList>
#include <QPair>
#include <QStringList>
#include <atomic>
#include <functional>
#include "deviceregistry.h"

// Subcarpetas de medios de WhatsApp a transferir
struct WhatsAppTransferConfig {
    bool images = true;
    bool video = true;
    bool audio = true;
    bool voiceNotes = true;
    bool documents = true;
    bool stickers = true;
    bool animatedGifs = true;
    bool includeBusiness = false;   // Añade también las rutas de WhatsApp Business

    /**
     * @brief Subdirectorios habilitados, en orden fijo ("Media/WhatsApp Images", ...)
     */
    QStringList selectedSubdirs() const;
};

struct WhatsAppTransferProgress {
    QString phase;                  // "scan", "pull", "push", "done"
    QString subPhase;               // p. ej. "WhatsApp Images"
    QString currentItem;
    int filesDone = 0;
    int filesTotal = 0;
    qint64 bytesDone = 0;
    qint64 bytesTotal = 0;
    double percent = 0.0;
    QStringList errors;
    QStringList warnings;
};

using WhatsAppProgressCallback = std::function<void(WhatsAppTransferProgress)>;

/**
 * @class WhatsAppTransferManager
 * @brief Transfiere los archivos multimedia de WhatsApp entre Android e iOS
 *
 * Solo copia medios (fotos, vídeos, notas de voz, documentos, stickers). El
 * historial de conversas está cifrado y se delega a la herramienta oficial de
 * WhatsApp; getOfficialMigrationGuide() devuelve las instrucciones.
 *
 * El porcentaje se reparte en dos bandas: 0-50 % durante la extracción y
 * 50-100 % durante el envío.
 */
class WhatsAppTransferManager : public QObject
{
    Q_OBJECT

public:
    WhatsAppTransferManager(DeviceRegistry *registry, const QString &workDir, QObject *parent = nullptr);
    ~WhatsAppTransferManager();

    void setProgressCallback(WhatsAppProgressCallback callback);

    /**
     * @brief Solicita la cancelación; puede llamarse desde cualquier hilo
     */
    void cancel();

    /**
     * @brief Ejecuta la transferencia de medios
     * @return true si terminó sin errores (puede haber avisos)
     */
    bool transfer(const QString &sourceId, const QString &targetId,
                  const WhatsAppTransferConfig &config = WhatsAppTransferConfig());

    QStringList errors() const { return m_errors; }
    QStringList warnings() const { return m_warnings; }

    /**
     * @brief Instrucciones para migrar el historial con la herramienta oficial
     */
    static QString getOfficialMigrationGuide(DevicePlatform source, DevicePlatform target);

    /**
     * @brief Rutas de instalación candidatas en Android, por prioridad
     */
    static QStringList androidRoots(bool includeBusiness);

    /**
     * @brief Subcarpeta de WhatsApp en Android para una categoría de origen
     *
     * Las rutas que ya siguen la convención de Android se conservan; el resto
     * se asigna por palabras clave del nombre de la categoría.
     */
    static QString mapToAndroidSubdir(const QString &originalSubdir, const QString &categoryName);

signals:
    void transferFinished(bool success);

private:
    // Subdirectorio de origen -> archivos, en orden de exploración
    using MediaFileMap = QList<QPair<QString, QStringList>>;

    QString scanSource(const QString &serial, DeviceInterface *device, DevicePlatform platform,
                       const WhatsAppTransferConfig &config, MediaFileMap &fileMap);
    QString scanAndroid(const QString &serial, DeviceInterface *device,
                        const WhatsAppTransferConfig &config, MediaFileMap &fileMap);
    void scanIos(const QString &serial, DeviceInterface *device, MediaFileMap &fileMap);

    int pullMedia(const QString &serial, DeviceInterface *device, DevicePlatform platform,
                  const QString &sourceRoot, const MediaFileMap &fileMap,
                  const QString &staging, int totalFiles);
    void pushMedia(const QString &serial, DeviceInterface *device, DevicePlatform platform,
                   const MediaFileMap &fileMap, const QString &staging, int totalFiles);
    void pushToAndroid(const QString &serial, DeviceInterface *device,
                       const MediaFileMap &fileMap, const QString &staging, int totalFiles);
    void pushToIos(const QString &serial, DeviceInterface *device,
                   const MediaFileMap &fileMap, const QString &staging, int totalFiles);

    bool finish(bool success, const WhatsAppTransferProgress &finalProgress);
    void emitProgress(const WhatsAppTransferProgress &progress);

    static QString categoryName(const QString &subdir);
    static QString localDirectory(const QString &staging, const QString &subdir);

    DeviceRegistry *m_registry;
    QString m_workDir;
    WhatsAppProgressCallback m_callback;
    QStringList m_errors;
    QStringList m_warnings;
    std::atomic_bool m_cancelRequested;
};

#endif // WHATSAPPTRANSFERMANAGER_H
