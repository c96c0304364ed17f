#include "deviceinterface.h"

QString platformName(DevicePlatform platform)
{
    switch (platform) {
    case DevicePlatform::Android:
        return "android";
    case DevicePlatform::Ios:
        return "ios";
    case DevicePlatform::Unknown:
        break;
    }
    return "unknown";
}

QString formatBytes(qint64 size)
{
    static const char *units[] = { "B", "KB", "MB", "GB", "TB" };

    double value = static_cast<double>(size);
    for (const char *unit : units) {
        if (qAbs(value) < 1024.0) {
            return QString("%1 %2").arg(value, 0, 'f', 1).arg(unit);
        }
        value /= 1024.0;
    }
    return QString("%1 PB").arg(value, 0, 'f', 1);
}

QString downloadsDirectory(DevicePlatform platform)
{
    switch (platform) {
    case DevicePlatform::Android:
        return "/sdcard/Download";
    case DevicePlatform::Ios:
        return "/Downloads";
    case DevicePlatform::Unknown:
        break;
    }
    return QString();
}

QString UnifiedDeviceInfo::friendlyName() const
{
    if (!manufacturer.isEmpty() && !model.isEmpty()) {
        return manufacturer + " " + model;
    }
    if (!model.isEmpty()) {
        return model;
    }
    return serial;
}

QString UnifiedDeviceInfo::platformLabel() const
{
    if (platform == DevicePlatform::Android) {
        return "Android " + osVersion;
    } else if (platform == DevicePlatform::Ios) {
        return "iOS " + osVersion;
    }
    return "Desconhecido";
}

QString UnifiedDeviceInfo::storageSummary() const
{
    if (storageTotal <= 0) {
        return QString();
    }
    return QString("%1 livre / %2 total").arg(formatBytes(storageFree), formatBytes(storageTotal));
}

/**
 * Etiqueta corta para listados: icono + nombre + almacenamiento
 */
QString UnifiedDeviceInfo::shortLabel() const
{
    QString icon;
    if (platform == DevicePlatform::Android) {
        icon = QString::fromUtf8("🤖");
    } else if (platform == DevicePlatform::Ios) {
        icon = QString::fromUtf8("🍎");
    } else {
        icon = QString::fromUtf8("❓");
    }

    QString storage = storageSummary();
    if (!storage.isEmpty()) {
        return QString("%1 %2  [%3]").arg(icon, friendlyName(), storage);
    }
    return QString("%1 %2").arg(icon, friendlyName());
}

CommandResult DeviceInterface::runShell(const QString &command, const QString &serial, int timeoutMs)
{
    Q_UNUSED(command)
    Q_UNUSED(serial)
    Q_UNUSED(timeoutMs)

    CommandResult result;
    result.status = CommandStatus::Unsupported;
    result.errorMessage = QString("El transporte %1 no soporta comandos de shell").arg(platformName(platform()));
    return result;
}
