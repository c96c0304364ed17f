#include "crosstransfermanager.h"
#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QMutexLocker>
#include <exception>

/**
 * Constructor de la clase CrossTransferManager
 */
CrossTransferManager::CrossTransferManager(DeviceRegistry *registry, const QString &workDir, QObject *parent)
    : QObject(parent)
    , m_registry(registry)
    , m_workDir(workDir)
    , m_sequence(0)
    , m_stepIndex(0)
    , m_totalSteps(0)
    , m_cancelRequested(false)
    , m_running(false)
    , m_stepInterrupted(false)
{
    qRegisterMetaType<CrossTransferProgress>("CrossTransferProgress");
}

/**
 * Destructor
 */
CrossTransferManager::~CrossTransferManager()
{
    if (m_running) {
        cancel();
    }
}

void CrossTransferManager::setProgressCallback(CrossTransferCallback callback)
{
    m_callback = std::move(callback);
}

/**
 * Ejecuta la transferencia completa de forma síncrona
 */
bool CrossTransferManager::transfer(const QString &sourceId, const QString &targetId,
                                    const CrossTransferConfig &config)
{
    if (m_running.exchange(true)) {
        qWarning() << "Transferencia ya en progreso.";
        return false;
    }

    m_cancelRequested = false;
    m_stepInterrupted = false;
    m_transferTimer.start();
    m_progress = CrossTransferProgress();
    m_progress.sourceDevice = sourceId;
    m_progress.targetDevice = targetId;
    m_stepIndex = 0;
    m_totalSteps = 0;

    DeviceInterface *source = m_registry ? m_registry->resolve(sourceId) : nullptr;
    DeviceInterface *target = m_registry ? m_registry->resolve(targetId) : nullptr;
    if (!source || !target) {
        qWarning() << "No se pudo resolver origen" << sourceId << "o destino" << targetId;
        return failEarly("Dispositivo(s) não encontrado(s)");
    }

    StepContext context;
    context.source = source;
    context.target = target;
    context.sourceSerial = sourceId;
    context.targetSerial = targetId;
    context.sourcePlatform = source->platform();
    context.targetPlatform = target->platform();
    context.config = config;

    const UnifiedDeviceInfo sourceInfo = source->deviceDetails(sourceId);
    const UnifiedDeviceInfo targetInfo = target->deviceDetails(targetId);

    m_progress.phase = "initializing";
    m_progress.sourceDevice = sourceInfo.friendlyName();
    m_progress.targetDevice = targetInfo.friendlyName();
    m_progress.sourcePlatform = platformName(context.sourcePlatform);
    m_progress.targetPlatform = platformName(context.targetPlatform);
    emitProgress();
    emit transferStarted(sourceId, targetId);

    qInfo() << "Transferencia" << m_progress.sourcePlatform << "->" << m_progress.targetPlatform
            << ":" << sourceId << "->" << targetId;

    context.staging = prepareStagingDirectory();
    if (context.staging.isEmpty()) {
        return failEarly("Não foi possível criar o diretório de trabalho");
    }

    const QList<Step> steps = buildSteps(context);
    m_totalSteps = steps.size();

    bool overallSuccess = true;
    int completed = 0;

    for (int idx = 0; idx < steps.size(); ++idx) {
        if (m_cancelRequested) {
            qInfo() << "Transferencia cancelada antes de" << steps[idx].key;
            break;
        }

        const Step &step = steps[idx];
        m_stepIndex = idx;
        m_progress.phase = step.key;
        m_progress.subPhase = step.label;
        m_progress.currentItem.clear();
        m_progress.itemsDone = idx;
        m_progress.itemsTotal = steps.size();
        m_progress.percent = static_cast<double>(idx) / steps.size() * 100.0;
        emitProgress();

        const int errorsBefore = m_progress.errors.size();
        try {
            bool ok = step.run();
            if (!ok) {
                overallSuccess = false;
                if (m_progress.errors.size() == errorsBefore) {
                    m_progress.errors.append(step.label + ": falha na transferência");
                }
            }
        } catch (const std::exception &e) {
            qWarning() << "Error en el paso" << step.key << ":" << e.what();
            m_progress.errors.append(step.label + ": " + QString::fromUtf8(e.what()));
            overallSuccess = false;
        }
        ++completed;
    }

    // Cancelada solo si quedó algún paso o archivo sin procesar
    if (completed < steps.size() || m_stepInterrupted) {
        m_progress.phase = "cancelled";
        m_progress.warnings.append("Transferência cancelada pelo usuário");
        overallSuccess = false;
    } else {
        m_progress.phase = overallSuccess ? "complete" : "complete_with_errors";
    }
    m_progress.subPhase.clear();
    m_progress.currentItem.clear();
    m_progress.itemsDone = completed;
    m_progress.itemsTotal = steps.size();
    m_progress.percent = 100.0;
    emitProgress();

    qInfo() << "Transferencia finalizada:" << m_progress.phase
            << "errores:" << m_progress.errors.size()
            << "avisos:" << m_progress.warnings.size()
            << "tiempo:" << m_progress.elapsedSeconds << "s";

    m_running = false;
    emit transferFinished(overallSuccess, m_progress.phase);
    return overallSuccess;
}

void CrossTransferManager::cancel()
{
    m_cancelRequested = true;
}

bool CrossTransferManager::isCancelRequested() const
{
    return m_cancelRequested;
}

bool CrossTransferManager::isRunning() const
{
    return m_running;
}

CrossTransferProgress CrossTransferManager::progress() const
{
    QMutexLocker locker(&m_snapshotMutex);
    return m_lastSnapshot;
}

QString CrossTransferManager::stagingDirectory() const
{
    return m_stagingDir;
}

/**
 * Construye la lista ordenada de pasos habilitados
 */
QList<CrossTransferManager::Step> CrossTransferManager::buildSteps(const StepContext &context)
{
    QList<Step> steps;
    const CrossTransferConfig &config = context.config;

    if (config.contacts) {
        steps.append(Step{"contacts", "Contatos", [this, context]() { return transferContacts(context); }});
    }
    if (config.sms) {
        steps.append(Step{"sms", "SMS", [this, context]() { return transferMessages(context); }});
    }
    if (config.calendar) {
        steps.append(Step{"calendar", "Calendário", [this, context]() { return transferCalendar(context); }});
    }
    if (config.photos) {
        steps.append(Step{"photos", "Fotos", [this, context]() { return transferMedia(context, "photos"); }});
    }
    if (config.videos) {
        steps.append(Step{"videos", "Vídeos", [this, context]() { return transferMedia(context, "videos"); }});
    }
    if (config.music) {
        steps.append(Step{"music", "Músicas", [this, context]() { return transferMedia(context, "music"); }});
    }
    if (config.documents) {
        steps.append(Step{"documents", "Documentos", [this, context]() { return transferMedia(context, "documents"); }});
    }

    return steps;
}

/**
 * Crea el directorio de staging con marca de tiempo dentro del directorio de trabajo
 */
QString CrossTransferManager::prepareStagingDirectory()
{
    const QString baseName = "cross_" + QDateTime::currentDateTime().toString("yyyyMMdd_HHmmss");
    m_stagingDir = QDir(m_workDir).filePath(baseName);

    // Dos transferencias en el mismo segundo no comparten directorio
    for (int suffix = 2; QFileInfo::exists(m_stagingDir); ++suffix) {
        m_stagingDir = QDir(m_workDir).filePath(QString("%1_%2").arg(baseName).arg(suffix));
    }

    QDir dir;
    if (!dir.mkpath(m_stagingDir)) {
        qWarning() << "No se pudo crear el directorio de staging:" << m_stagingDir;
        m_stagingDir.clear();
        return QString();
    }

    qDebug() << "Directorio de staging:" << m_stagingDir;
    return m_stagingDir;
}

/**
 * Termina la transferencia antes de ejecutar ningún paso
 */
bool CrossTransferManager::failEarly(const QString &message)
{
    m_progress.phase = "error";
    m_progress.errors.append(message);
    emitProgress();

    m_running = false;
    emit transferFinished(false, m_progress.phase);
    return false;
}

/**
 * Publica una copia del progreso actual al callback
 */
void CrossTransferManager::emitProgress()
{
    m_progress.elapsedSeconds = m_transferTimer.isValid() ? m_transferTimer.elapsed() / 1000.0 : 0.0;
    m_progress.sequence = ++m_sequence;

    CrossTransferProgress snapshot = m_progress;
    {
        QMutexLocker locker(&m_snapshotMutex);
        m_lastSnapshot = snapshot;
    }

    if (!m_callback) {
        return;
    }

    try {
        m_callback(snapshot);
    } catch (const std::exception &e) {
        qWarning() << "El callback de progreso lanzó una excepción:" << e.what();
    }
}

bool CrossTransferManager::isSkippedEntry(const QString &entry, const CrossTransferConfig &config)
{
    const QString lower = entry.toLower();
    if (config.ignoreThumbnails && (lower == ".thumbnails" || lower == "thumbs.db")) {
        return true;
    }
    if (config.ignoreCache && (lower == ".cache" || lower == "cache" || lower.startsWith(".trashed-"))) {
        return true;
    }
    return false;
}
