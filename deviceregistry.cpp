#include "deviceregistry.h"
#include <QDebug>

DeviceRegistry::DeviceRegistry(QObject *parent) : QObject(parent)
{
}

DeviceRegistry::~DeviceRegistry()
{
    m_cache.clear();
    m_backends.clear();
}

void DeviceRegistry::registerBackend(DeviceInterface *backend)
{
    if (!backend || m_backends.contains(backend)) {
        return;
    }
    m_backends.append(backend);
}

QList<UnifiedDeviceInfo> DeviceRegistry::listAllDevices()
{
    QList<UnifiedDeviceInfo> allDevices;
    m_cache.clear();

    for (DeviceInterface *backend : m_backends) {
        const QList<UnifiedDeviceInfo> devices = backend->listDevices();
        for (const UnifiedDeviceInfo &device : devices) {
            if (device.serial.isEmpty()) {
                continue;
            }
            m_cache.insert(device.serial, qMakePair(backend, device));
            allDevices.append(device);
        }
        qDebug() << "Transporte" << platformName(backend->platform()) << "reportó" << devices.size() << "dispositivo(s)";
    }

    emit deviceListUpdated();
    return allDevices;
}

DeviceInterface *DeviceRegistry::resolve(const QString &deviceId)
{
    if (deviceId.isEmpty()) {
        return nullptr;
    }

    auto it = m_cache.constFind(deviceId);
    if (it != m_cache.constEnd()) {
        return it->first;
    }

    // Fallo de caché: volver a enumerar
    listAllDevices();

    it = m_cache.constFind(deviceId);
    if (it != m_cache.constEnd()) {
        return it->first;
    }

    qWarning() << "Dispositivo no encontrado en ningún transporte:" << deviceId;
    return nullptr;
}

UnifiedDeviceInfo DeviceRegistry::deviceInfo(const QString &deviceId) const
{
    auto it = m_cache.constFind(deviceId);
    if (it != m_cache.constEnd()) {
        return it->second;
    }
    return UnifiedDeviceInfo();
}

DevicePlatform DeviceRegistry::platformOf(const QString &deviceId)
{
    if (!resolve(deviceId)) {
        return DevicePlatform::Unknown;
    }
    return deviceInfo(deviceId).platform;
}

bool DeviceRegistry::isCrossPlatform(const QString &deviceIdA, const QString &deviceIdB) const
{
    auto a = m_cache.constFind(deviceIdA);
    auto b = m_cache.constFind(deviceIdB);
    if (a == m_cache.constEnd() || b == m_cache.constEnd()) {
        return false;
    }
    return a->second.platform != b->second.platform;
}
