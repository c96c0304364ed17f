#ifndef DEVICEREGISTRY_H
#define DEVICEREGISTRY_H

#include <QObject>
#include <QMap>
#include <QPair>
#include <QList>
#include "deviceinterface.h"

/**
 * @class DeviceRegistry
 * @brief Agrega varios transportes y resuelve a qué transporte pertenece cada dispositivo
 *
 * Mantiene una caché identificador -> (transporte, última información conocida).
 * Ante un fallo de caché vuelve a enumerar todos los transportes registrados.
 * Los transportes no pasan a ser propiedad del registro.
 */
class DeviceRegistry : public QObject
{
    Q_OBJECT
public:
    explicit DeviceRegistry(QObject *parent = nullptr);
    ~DeviceRegistry();

    /**
     * @brief Registra un transporte (adb, libimobiledevice, ...)
     * @param backend Transporte; debe sobrevivir al registro
     */
    void registerBackend(DeviceInterface *backend);

    /**
     * @brief Enumera todos los dispositivos de todos los transportes
     *
     * Vacía y reconstruye la caché.
     */
    QList<UnifiedDeviceInfo> listAllDevices();

    /**
     * @brief Devuelve el transporte que posee el dispositivo
     * @param deviceId Serial o UDID
     * @return Transporte, o nullptr si no se encuentra tras volver a enumerar
     */
    DeviceInterface *resolve(const QString &deviceId);

    /**
     * @brief Última información conocida del dispositivo
     * @return Información en caché; serial vacío si no se conoce
     */
    UnifiedDeviceInfo deviceInfo(const QString &deviceId) const;

    /**
     * @brief Plataforma del dispositivo, resolviéndolo si hace falta
     */
    DevicePlatform platformOf(const QString &deviceId);

    /**
     * @brief Indica si dos dispositivos son de plataformas distintas
     *
     * Devuelve false si alguno no está resuelto; quien llama debe tratar
     * un dispositivo no resuelto como error antes de consultar esto.
     */
    bool isCrossPlatform(const QString &deviceIdA, const QString &deviceIdB) const;

signals:
    void deviceListUpdated();

private:
    QList<DeviceInterface*> m_backends;
    QMap<QString, QPair<DeviceInterface*, UnifiedDeviceInfo>> m_cache;
};

#endif // DEVICEREGISTRY_H
