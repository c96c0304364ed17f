#ifndef CROSSTRANSFERMANAGER_H
#define CROSSTRANSFERMANAGER_H

#include <QObject>
#include <QElapsedTimer>
#include <QMetaType>
#include <QMutex>
#include <QStringList>
#include <atomic>
#include <functional>
#include "deviceregistry.h"

// Qué transferir. Cada opción se evalúa de forma independiente.
struct CrossTransferConfig {
    bool photos = true;
    bool videos = true;
    bool music = true;
    bool documents = true;
    bool contacts = true;
    bool sms = true;
    bool calendar = true;
    bool convertHeic = true;        // HEIC -> JPEG cuando el destino es Android
    bool ignoreCache = true;
    bool ignoreThumbnails = true;
};

// Instantánea del progreso de una transferencia entre plataformas.
// La modifica solo el orquestador; el callback recibe una copia.
struct CrossTransferProgress {
    QString phase;                  // "initializing", clave de categoría, "complete", ...
    QString subPhase;               // Etiqueta legible de la categoría
    QString currentItem;
    int itemsDone = 0;
    int itemsTotal = 0;
    double percent = 0.0;
    QString sourceDevice;
    QString targetDevice;
    QString sourcePlatform;
    QString targetPlatform;
    double elapsedSeconds = 0.0;
    int filesPulled = 0;
    int filesPushed = 0;
    int fileErrors = 0;
    QStringList errors;
    QStringList warnings;
    quint64 sequence = 0;           // Crece con cada emisión
};

Q_DECLARE_METATYPE(CrossTransferProgress)

using CrossTransferCallback = std::function<void(CrossTransferProgress)>;

/**
 * @class CrossTransferManager
 * @brief Orquesta la transferencia de datos entre dos dispositivos, incluso de plataformas distintas
 *
 * Construye una lista ordenada de pasos por categoría (contactos, SMS,
 * calendario, fotos, vídeos, música, documentos), los ejecuta en secuencia
 * en el hilo que llama a transfer(), acumula errores y avisos, y reporta el
 * progreso de forma síncrona. Un fallo en una categoría no detiene las
 * siguientes. La cancelación es cooperativa: se comprueba entre pasos y
 * entre archivos.
 */
class CrossTransferManager : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Constructor
     * @param registry Registro de dispositivos usado para resolver los transportes
     * @param workDir Directorio donde se crean los directorios de staging
     * @param parent Objeto padre (opcional)
     */
    explicit CrossTransferManager(DeviceRegistry *registry, const QString &workDir, QObject *parent = nullptr);
    ~CrossTransferManager();

    /**
     * @brief Registra el callback de progreso
     *
     * Se invoca de forma síncrona; no debe bloquear. Una excepción lanzada
     * desde el callback se registra y se ignora.
     */
    void setProgressCallback(CrossTransferCallback callback);

    /**
     * @brief Ejecuta una transferencia completa
     * @param sourceId Serial/UDID del dispositivo origen
     * @param targetId Serial/UDID del dispositivo destino
     * @param config Categorías y opciones
     * @return true solo si todas las categorías habilitadas terminaron sin error
     */
    bool transfer(const QString &sourceId, const QString &targetId,
                  const CrossTransferConfig &config = CrossTransferConfig());

    /**
     * @brief Solicita la cancelación; puede llamarse desde cualquier hilo
     */
    void cancel();

    bool isCancelRequested() const;
    bool isRunning() const;

    /**
     * @brief Última instantánea de progreso emitida
     */
    CrossTransferProgress progress() const;

    /**
     * @brief Directorio de staging de la última transferencia
     */
    QString stagingDirectory() const;

    QString workDirectory() const { return m_workDir; }

signals:
    void transferStarted(const QString &sourceDevice, const QString &targetDevice);
    void transferFinished(bool success, const QString &phase);

private:
    // Datos compartidos por los pasos de una misma transferencia
    struct StepContext {
        DeviceInterface *source = nullptr;
        DeviceInterface *target = nullptr;
        QString sourceSerial;
        QString targetSerial;
        DevicePlatform sourcePlatform = DevicePlatform::Unknown;
        DevicePlatform targetPlatform = DevicePlatform::Unknown;
        QString staging;
        CrossTransferConfig config;
    };

    struct Step {
        QString key;
        QString label;
        std::function<bool()> run;
    };

    QList<Step> buildSteps(const StepContext &context);
    QString prepareStagingDirectory();
    void emitProgress();
    bool failEarly(const QString &message);

    // Pasos por categoría (crosstransfermanager_steps.cpp)
    bool transferContacts(const StepContext &context);
    bool transferMessages(const StepContext &context);
    bool transferCalendar(const StepContext &context);
    bool transferMedia(const StepContext &context, const QString &category);

    static bool isSkippedEntry(const QString &entry, const CrossTransferConfig &config);

    DeviceRegistry *m_registry;
    QString m_workDir;
    QString m_stagingDir;
    CrossTransferCallback m_callback;

    CrossTransferProgress m_progress;
    CrossTransferProgress m_lastSnapshot;
    mutable QMutex m_snapshotMutex;
    quint64 m_sequence;

    int m_stepIndex;
    int m_totalSteps;

    std::atomic_bool m_cancelRequested;
    std::atomic_bool m_running;
    bool m_stepInterrupted;         // Un paso dejó archivos sin procesar por la cancelación
    QElapsedTimer m_transferTimer;
};

#endif // CROSSTRANSFERMANAGER_H
