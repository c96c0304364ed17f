#ifndef PHOTOCONVERTER_H
#define PHOTOCONVERTER_H

#include <QString>
#include "deviceinterface.h"

/**
 * @class PhotoConverter
 * @brief Normaliza formatos de foto que la plataforma destino no soporta (HEIC/HEIF -> JPEG)
 *
 * La decodificación de HEIF depende de que Qt tenga cargado un plugin de
 * imagen que la soporte. La disponibilidad se consulta una sola vez.
 */
class PhotoConverter
{
public:
    /// Calidad de la salida JPEG
    static const int JpegQuality = 95;

    /**
     * @brief Indica si el archivo debe convertirse para la plataforma destino
     *
     * Solo según la extensión: .heic/.heif hacia Android.
     */
    static bool needsConversion(const QString &fileName, DevicePlatform targetPlatform);

    /**
     * @brief Indica si Qt puede decodificar HEIF en este sistema (resultado en caché)
     */
    static bool isHeifSupported();

    /**
     * @brief Convierte una imagen HEIC a JPEG
     * @return Ruta del JPEG, o cadena vacía si la conversión no fue posible
     */
    static QString heicToJpeg(const QString &heicPath, const QString &jpegPath);

    /**
     * @brief Convierte el archivo si la plataforma destino lo necesita
     * @param outDir Directorio del archivo convertido (por defecto, el del original)
     * @return Ruta del archivo convertido, o la original si no hizo falta o falló
     */
    static QString convertIfNeeded(const QString &filePath, DevicePlatform targetPlatform,
                                   const QString &outDir = QString());
};

#endif // PHOTOCONVERTER_H
