#include "whatsapptransfermanager.h"
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QSet>
#include <exception>

namespace {

// Android 11+ guarda los medios en Android/media/com.whatsapp; las versiones antiguas en /sdcard/WhatsApp
const QStringList kAndroidRoots = {
    "/storage/emulated/0/Android/media/com.whatsapp/WhatsApp",
    "/storage/emulated/0/WhatsApp",
    "/sdcard/Android/media/com.whatsapp/WhatsApp",
    "/sdcard/WhatsApp"
};

const QStringList kAndroidBusinessRoots = {
    "/storage/emulated/0/Android/media/com.whatsapp.w4b/WhatsApp Business",
    "/storage/emulated/0/WhatsApp Business",
    "/sdcard/Android/media/com.whatsapp.w4b/WhatsApp Business",
    "/sdcard/WhatsApp Business"
};

const QString kImagesSubdir = QStringLiteral("Media/WhatsApp Images");
const QString kVideoSubdir = QStringLiteral("Media/WhatsApp Video");
const QString kAudioSubdir = QStringLiteral("Media/WhatsApp Audio");
const QString kVoiceNotesSubdir = QStringLiteral("Media/WhatsApp Voice Notes");
const QString kDocumentsSubdir = QStringLiteral("Media/WhatsApp Documents");
const QString kStickersSubdir = QStringLiteral("Media/WhatsApp Stickers");
const QString kAnimatedGifsSubdir = QStringLiteral("Media/WhatsApp Animated Gifs");

// En iOS el contenedor de WhatsApp no es accesible por AFC: solo el carrete y Downloads
const QString kIosCameraRoll = QStringLiteral("/DCIM");
const QString kIosDownloads = QStringLiteral("/Downloads");

const QSet<QString> kIosMediaExtensions = {
    "jpg", "jpeg", "png", "heic", "gif",
    "mp4", "mov", "3gp",
    "opus", "m4a", "mp3", "aac",
    "pdf", "docx", "xlsx"
};

const QSet<QString> kPhotoExtensions = { "jpg", "jpeg", "png", "heic", "gif", "webp" };
const QSet<QString> kVideoExtensions = { "mp4", "mov", "3gp", "avi" };

} // namespace

QStringList WhatsAppTransferConfig::selectedSubdirs() const
{
    QStringList subdirs;
    if (images) subdirs << kImagesSubdir;
    if (video) subdirs << kVideoSubdir;
    if (audio) subdirs << kAudioSubdir;
    if (voiceNotes) subdirs << kVoiceNotesSubdir;
    if (documents) subdirs << kDocumentsSubdir;
    if (stickers) subdirs << kStickersSubdir;
    if (animatedGifs) subdirs << kAnimatedGifsSubdir;
    return subdirs;
}

WhatsAppTransferManager::WhatsAppTransferManager(DeviceRegistry *registry, const QString &workDir, QObject *parent)
    : QObject(parent)
    , m_registry(registry)
    , m_workDir(workDir)
    , m_cancelRequested(false)
{
}

WhatsAppTransferManager::~WhatsAppTransferManager()
{
}

void WhatsAppTransferManager::setProgressCallback(WhatsAppProgressCallback callback)
{
    m_callback = std::move(callback);
}

void WhatsAppTransferManager::cancel()
{
    m_cancelRequested = true;
}

/**
 * Explora el origen, extrae los medios a staging y los envía al destino
 */
bool WhatsAppTransferManager::transfer(const QString &sourceId, const QString &targetId,
                                       const WhatsAppTransferConfig &config)
{
    m_cancelRequested = false;
    m_errors.clear();
    m_warnings.clear();

    DeviceInterface *source = m_registry ? m_registry->resolve(sourceId) : nullptr;
    DeviceInterface *target = m_registry ? m_registry->resolve(targetId) : nullptr;
    if (!source || !target) {
        m_errors.append("Dispositivo de origem ou destino não encontrado.");
        WhatsAppTransferProgress done;
        done.phase = "done";
        done.errors = m_errors;
        return finish(false, done);
    }

    const DevicePlatform sourcePlatform = m_registry->platformOf(sourceId);
    const DevicePlatform targetPlatform = m_registry->platformOf(targetId);

    qInfo() << "Transferencia de WhatsApp" << sourceId << "(" << platformName(sourcePlatform) << ") ->"
            << targetId << "(" << platformName(targetPlatform) << ")";

    // El historial nunca se transfiere
    m_warnings.append("💬 Histórico de conversas NÃO é transferido automaticamente. "
                      "Use a ferramenta oficial do WhatsApp: no dispositivo de destino, "
                      "durante a configuração do WhatsApp, selecione 'Transferir conversas'.");

    WhatsAppTransferProgress scan;
    scan.phase = "scan";
    scan.subPhase = "Detectando mídia...";
    emitProgress(scan);

    MediaFileMap fileMap;
    const QString sourceRoot = scanSource(sourceId, source, sourcePlatform, config, fileMap);

    if (fileMap.isEmpty()) {
        if (m_cancelRequested) {
            WhatsAppTransferProgress cancelled;
            cancelled.phase = "done";
            cancelled.percent = 100.0;
            cancelled.errors << "Cancelado pelo usuário.";
            return finish(false, cancelled);
        }

        m_warnings.append("Nenhuma mídia do WhatsApp encontrada no dispositivo de origem.");
        WhatsAppTransferProgress done;
        done.phase = "done";
        done.percent = 100.0;
        done.errors = m_errors;
        done.warnings = m_warnings;
        return finish(m_errors.isEmpty(), done);
    }

    int totalFiles = 0;
    for (const auto &entry : fileMap) {
        totalFiles += entry.second.size();
    }
    qInfo() << "Encontrados" << totalFiles << "archivos de WhatsApp en" << fileMap.size() << "categorías";

    const QString staging = QDir(m_workDir).filePath("wa_staging");
    QDir(staging).removeRecursively();
    if (!QDir().mkpath(staging)) {
        m_errors.append("Não foi possível criar o diretório de trabalho.");
        WhatsAppTransferProgress done;
        done.phase = "done";
        done.percent = 100.0;
        done.errors = m_errors;
        done.warnings = m_warnings;
        return finish(false, done);
    }

    const int pulled = pullMedia(sourceId, source, sourcePlatform, sourceRoot, fileMap, staging, totalFiles);

    if (!m_cancelRequested) {
        pushMedia(targetId, target, targetPlatform, fileMap, staging, pulled);
    }

    if (!QDir(staging).removeRecursively()) {
        qWarning() << "No se pudo limpiar el staging de WhatsApp:" << staging;
    }

    if (m_cancelRequested) {
        WhatsAppTransferProgress cancelled;
        cancelled.phase = "done";
        cancelled.percent = 100.0;
        cancelled.errors << "Cancelado pelo usuário.";
        return finish(false, cancelled);
    }

    WhatsAppTransferProgress done;
    done.phase = "done";
    done.percent = 100.0;
    done.filesDone = pulled;
    done.filesTotal = totalFiles;
    done.errors = m_errors;
    done.warnings = m_warnings;
    return finish(m_errors.isEmpty(), done);
}

QString WhatsAppTransferManager::getOfficialMigrationGuide(DevicePlatform source, DevicePlatform target)
{
    if (source == DevicePlatform::Android && target == DevicePlatform::Ios) {
        return QStringLiteral(
            "📱 Transferir conversas do Android para iPhone:\n"
            "1. Instale o app 'Move to iOS' no Android\n"
            "2. No iPhone, durante a configuração inicial, escolha 'Migrar do Android'\n"
            "3. No WhatsApp do iPhone, durante o setup, toque em 'Transferir conversas'\n"
            "4. Siga as instruções na tela — ambos dispositivos precisam estar na mesma rede Wi-Fi\n\n"
            "⚠️ O iPhone precisa estar em configuração inicial (novo ou resetado).\n"
            "📖 https://faq.whatsapp.com/530788685226498");
    }
    if (source == DevicePlatform::Ios && target == DevicePlatform::Android) {
        return QStringLiteral(
            "📱 Transferir conversas do iPhone para Android:\n"
            "1. Atualize o WhatsApp para a versão mais recente em ambos\n"
            "2. No Android, instale o WhatsApp e abra\n"
            "3. No iPhone, vá em WhatsApp > Configurações > Conversas > Transferir conversas\n"
            "4. Escaneie o QR Code exibido no Android\n"
            "5. Aguarde — o cabo USB-C/Lightning pode acelerar a transferência\n\n"
            "⚠️ O Android precisa estar com conta Google logada.\n"
            "📖 https://faq.whatsapp.com/590889592348498");
    }
    return QStringLiteral(
        "📱 Transferir conversas entre dispositivos da mesma plataforma:\n"
        "Use o backup do Google Drive (Android→Android) ou iCloud (iOS→iOS).");
}

QStringList WhatsAppTransferManager::androidRoots(bool includeBusiness)
{
    QStringList roots = kAndroidRoots;
    if (includeBusiness) {
        roots << kAndroidBusinessRoots;
    }
    return roots;
}

QString WhatsAppTransferManager::mapToAndroidSubdir(const QString &originalSubdir, const QString &categoryName)
{
    if (originalSubdir.startsWith("Media/WhatsApp")) {
        return originalSubdir;
    }

    const QString lower = categoryName.toLower();
    if (lower.contains("dcim") || lower.contains("photo") || lower.contains("image")) {
        return kImagesSubdir;
    }
    if (lower.contains("gif")) {
        return kAnimatedGifsSubdir;
    }
    if (lower.contains("video") || lower.contains("mov")) {
        return kVideoSubdir;
    }
    if (lower.contains("voice")) {
        return kVoiceNotesSubdir;
    }
    if (lower.contains("audio")) {
        return kAudioSubdir;
    }
    if (lower.contains("document") || lower.contains("download")) {
        return kDocumentsSubdir;
    }
    if (lower.contains("sticker")) {
        return kStickersSubdir;
    }
    return kDocumentsSubdir;
}

QString WhatsAppTransferManager::scanSource(const QString &serial, DeviceInterface *device, DevicePlatform platform,
                                            const WhatsAppTransferConfig &config, MediaFileMap &fileMap)
{
    if (platform == DevicePlatform::Android) {
        return scanAndroid(serial, device, config, fileMap);
    }
    if (platform == DevicePlatform::Ios) {
        scanIos(serial, device, fileMap);
        return QString();
    }

    m_errors.append("Plataforma de origem desconhecida.");
    return QString();
}

/**
 * Busca la primera raíz de WhatsApp existente y lista sus subcarpetas de medios
 */
QString WhatsAppTransferManager::scanAndroid(const QString &serial, DeviceInterface *device,
                                             const WhatsAppTransferConfig &config, MediaFileMap &fileMap)
{
    QString foundRoot;
    const QStringList roots = androidRoots(config.includeBusiness);
    for (const QString &root : roots) {
        if (device->fileExists(root, serial)) {
            foundRoot = root;
            qInfo() << "Raíz de WhatsApp encontrada:" << root;
            break;
        }
    }

    if (foundRoot.isEmpty()) {
        return QString();
    }

    const QStringList subdirs = config.selectedSubdirs();
    for (const QString &subdir : subdirs) {
        if (m_cancelRequested) {
            break;
        }

        const QString fullPath = foundRoot + "/" + subdir;
        if (!device->fileExists(fullPath, serial)) {
            continue;
        }

        WhatsAppTransferProgress progress;
        progress.phase = "scan";
        progress.subPhase = categoryName(subdir);
        emitProgress(progress);

        QStringList files;
        const QStringList entries = device->listDir(fullPath, serial);
        for (const QString &entry : entries) {
            if (!entry.endsWith('/')) {
                files << entry;
            }
        }
        if (!files.isEmpty()) {
            fileMap.append(qMakePair(subdir, files));
            qInfo() << " " << subdir << ":" << files.size() << "archivos";
        }
    }

    return foundRoot;
}

void WhatsAppTransferManager::scanIos(const QString &serial, DeviceInterface *device, MediaFileMap &fileMap)
{
    const QStringList locations = { kIosCameraRoll, kIosDownloads };
    for (const QString &location : locations) {
        if (m_cancelRequested) {
            break;
        }
        if (!device->fileExists(location, serial)) {
            continue;
        }

        QStringList mediaFiles;
        const QStringList entries = device->listDir(location, serial);
        for (const QString &entry : entries) {
            if (entry.endsWith('/')) {
                continue;
            }
            if (kIosMediaExtensions.contains(QFileInfo(entry).suffix().toLower())) {
                mediaFiles << entry;
            }
        }
        if (!mediaFiles.isEmpty()) {
            fileMap.append(qMakePair(location, mediaFiles));
        }
    }

    if (fileMap.isEmpty()) {
        m_warnings.append("Mídia do WhatsApp no iOS não é diretamente acessível sem backup. "
                          "Apenas fotos/vídeos salvos no Rolo da Câmera serão transferidos.");
    }
}

/**
 * Extrae los medios al directorio local de staging (banda 0-50 %)
 */
int WhatsAppTransferManager::pullMedia(const QString &serial, DeviceInterface *device, DevicePlatform platform,
                                       const QString &sourceRoot, const MediaFileMap &fileMap,
                                       const QString &staging, int totalFiles)
{
    int done = 0;
    for (const auto &entry : fileMap) {
        if (m_cancelRequested) {
            break;
        }

        const QString &subdir = entry.first;
        const QString category = categoryName(subdir);
        const QString localDir = localDirectory(staging, subdir);
        QDir().mkpath(localDir);

        for (const QString &fileName : entry.second) {
            if (m_cancelRequested) {
                break;
            }

            QString remotePath;
            if (platform == DevicePlatform::Android) {
                remotePath = sourceRoot + "/" + subdir + "/" + fileName;
            } else {
                remotePath = subdir.startsWith('/') ? subdir + "/" + fileName : "/" + subdir + "/" + fileName;
            }

            WhatsAppTransferProgress progress;
            progress.phase = "pull";
            progress.subPhase = category;
            progress.currentItem = fileName;
            progress.filesDone = done;
            progress.filesTotal = totalFiles;
            progress.percent = totalFiles > 0 ? static_cast<double>(done) / totalFiles * 50.0 : 0.0;
            emitProgress(progress);

            if (device->pull(remotePath, QDir(localDir).filePath(fileName), serial)) {
                ++done;
            } else {
                qWarning() << "Fallo al extraer:" << remotePath;
                m_errors.append("Pull falhou: " + fileName);
            }
        }
    }
    return done;
}

void WhatsAppTransferManager::pushMedia(const QString &serial, DeviceInterface *device, DevicePlatform platform,
                                        const MediaFileMap &fileMap, const QString &staging, int totalFiles)
{
    if (platform == DevicePlatform::Android) {
        pushToAndroid(serial, device, fileMap, staging, totalFiles);
    } else if (platform == DevicePlatform::Ios) {
        pushToIos(serial, device, fileMap, staging, totalFiles);
    } else {
        m_errors.append("Plataforma de destino desconhecida.");
    }
}

/**
 * Envía los medios a las carpetas de WhatsApp del destino Android (banda 50-100 %)
 */
void WhatsAppTransferManager::pushToAndroid(const QString &serial, DeviceInterface *device,
                                            const MediaFileMap &fileMap, const QString &staging, int totalFiles)
{
    QString targetRoot;
    for (const QString &root : kAndroidRoots) {
        if (device->fileExists(root, serial)) {
            targetRoot = root;
            break;
        }
    }

    if (targetRoot.isEmpty()) {
        // Sin WhatsApp instalado: se crea la ruta moderna, o la variante de /sdcard
        targetRoot = kAndroidRoots.at(0);
        if (!device->makeDirectory(targetRoot, serial)) {
            targetRoot = kAndroidRoots.at(2);
            if (!device->makeDirectory(targetRoot, serial)) {
                qWarning() << "No se pudo crear la raíz de WhatsApp en" << serial;
            }
        }
    }

    int done = 0;
    for (const auto &entry : fileMap) {
        if (m_cancelRequested) {
            break;
        }

        const QString &subdir = entry.first;
        const QString category = categoryName(subdir);
        const QString localDir = localDirectory(staging, subdir);
        const QString remoteDir = targetRoot + "/" + mapToAndroidSubdir(subdir, category);

        if (!device->makeDirectory(remoteDir, serial)) {
            qDebug() << "No se pudo crear" << remoteDir;
        }

        for (const QString &fileName : entry.second) {
            if (m_cancelRequested) {
                break;
            }

            const QString localPath = QDir(localDir).filePath(fileName);
            if (!QFileInfo::exists(localPath)) {
                continue;
            }

            WhatsAppTransferProgress progress;
            progress.phase = "push";
            progress.subPhase = category;
            progress.currentItem = fileName;
            progress.filesDone = done;
            progress.filesTotal = totalFiles;
            progress.percent = totalFiles > 0 ? 50.0 + static_cast<double>(done) / totalFiles * 50.0 : 50.0;
            emitProgress(progress);

            const QString remotePath = remoteDir + "/" + fileName;
            if (device->push(localPath, remotePath, serial)) {
                ++done;
            } else {
                qWarning() << "Fallo al enviar:" << remotePath;
                m_errors.append("Push falhou: " + fileName);
            }
        }
    }
}

/**
 * Envía fotos y vídeos al carrete y el resto a Downloads (banda 50-100 %)
 */
void WhatsAppTransferManager::pushToIos(const QString &serial, DeviceInterface *device,
                                        const MediaFileMap &fileMap, const QString &staging, int totalFiles)
{
    m_warnings.append("No iOS, as mídias do WhatsApp são salvas no Rolo da Câmera "
                      "e em Arquivos/Downloads (documentos). Abra o WhatsApp no "
                      "iPhone e re-envie ou salve conforme necessário.");

    int done = 0;
    for (const auto &entry : fileMap) {
        if (m_cancelRequested) {
            break;
        }

        const QString &subdir = entry.first;
        const QString category = categoryName(subdir);
        const QString localDir = localDirectory(staging, subdir);

        for (const QString &fileName : entry.second) {
            if (m_cancelRequested) {
                break;
            }

            const QString localPath = QDir(localDir).filePath(fileName);
            if (!QFileInfo::exists(localPath)) {
                continue;
            }

            const QString ext = QFileInfo(fileName).suffix().toLower();
            const bool cameraRoll = kPhotoExtensions.contains(ext) || kVideoExtensions.contains(ext);
            const QString remotePath = (cameraRoll ? kIosCameraRoll : kIosDownloads) + "/" + fileName;

            WhatsAppTransferProgress progress;
            progress.phase = "push";
            progress.subPhase = category;
            progress.currentItem = fileName;
            progress.filesDone = done;
            progress.filesTotal = totalFiles;
            progress.percent = totalFiles > 0 ? 50.0 + static_cast<double>(done) / totalFiles * 50.0 : 50.0;
            emitProgress(progress);

            if (device->push(localPath, remotePath, serial)) {
                ++done;
            } else {
                qWarning() << "Fallo al enviar a iOS:" << remotePath;
                m_errors.append("Push falhou: " + fileName);
            }
        }
    }
}

bool WhatsAppTransferManager::finish(bool success, const WhatsAppTransferProgress &finalProgress)
{
    emitProgress(finalProgress);
    qInfo() << "Transferencia de WhatsApp finalizada. Éxito:" << success
            << "errores:" << finalProgress.errors.size();
    emit transferFinished(success);
    return success;
}

void WhatsAppTransferManager::emitProgress(const WhatsAppTransferProgress &progress)
{
    if (!m_callback) {
        return;
    }

    try {
        m_callback(progress);
    } catch (const std::exception &e) {
        qWarning() << "El callback de progreso de WhatsApp lanzó una excepción:" << e.what();
    }
}

QString WhatsAppTransferManager::categoryName(const QString &subdir)
{
    return subdir.contains('/') ? subdir.section('/', -1) : subdir;
}

QString WhatsAppTransferManager::localDirectory(const QString &staging, const QString &subdir)
{
    return QDir(staging).filePath(categoryName(subdir).replace(' ', '_'));
}
