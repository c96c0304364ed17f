#include "photoconverter.h"
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QImage>
#include <QImageReader>
#include <QImageWriter>

namespace {

bool isHeifExtension(const QString &suffix)
{
    const QString lower = suffix.toLower();
    return lower == "heic" || lower == "heif";
}

bool detectHeifSupport()
{
    const QList<QByteArray> formats = QImageReader::supportedImageFormats();
    bool supported = formats.contains("heic") || formats.contains("heif");
    qDebug() << "Soporte de HEIF en los plugins de imagen:" << supported;
    return supported;
}

} // namespace

bool PhotoConverter::needsConversion(const QString &fileName, DevicePlatform targetPlatform)
{
    // Android -> iOS: los JPEG funcionan en iOS, no hace falta convertir
    return targetPlatform == DevicePlatform::Android && isHeifExtension(QFileInfo(fileName).suffix());
}

bool PhotoConverter::isHeifSupported()
{
    static const bool supported = detectHeifSupport();
    return supported;
}

QString PhotoConverter::heicToJpeg(const QString &heicPath, const QString &jpegPath)
{
    if (!isHeifSupported()) {
        qWarning() << "No hay plugin HEIF disponible; no se puede convertir" << QFileInfo(heicPath).fileName();
        return QString();
    }

    QImageReader reader(heicPath);
    reader.setAutoTransform(true);
    QImage image = reader.read();
    if (image.isNull()) {
        qWarning() << "Fallo al decodificar" << QFileInfo(heicPath).fileName() << ":" << reader.errorString();
        return QString();
    }

    QImageWriter writer(jpegPath, "jpeg");
    writer.setQuality(JpegQuality);
    if (!writer.write(image)) {
        qWarning() << "Fallo al codificar JPEG" << jpegPath << ":" << writer.errorString();
        QFile::remove(jpegPath);
        return QString();
    }

    return jpegPath;
}

QString PhotoConverter::convertIfNeeded(const QString &filePath, DevicePlatform targetPlatform, const QString &outDir)
{
    if (!needsConversion(filePath, targetPlatform)) {
        return filePath;
    }

    QFileInfo info(filePath);
    QString targetDir = outDir.isEmpty() ? info.absolutePath() : outDir;
    if (!QDir().mkpath(targetDir)) {
        qWarning() << "No se pudo crear el directorio de conversión:" << targetDir;
        return filePath;
    }

    QString converted = heicToJpeg(filePath, QDir(targetDir).filePath(info.completeBaseName() + ".jpg"));
    if (converted.isEmpty()) {
        return filePath;
    }
    return converted;
}
