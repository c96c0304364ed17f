#include "adbdevice.h"
#include "appsettings.h"
#include "crosstransfermanager.h"
#include "deviceregistry.h"
#include "iosdevice.h"
#include "logger.h"
#include "whatsapptransfermanager.h"
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QTextStream>
#include <atomic>
#include <csignal>

namespace {

enum ExitCode {
    ExitSuccess = 0,
    ExitFailure = 1,
    ExitUsage = 2
};

std::atomic<CrossTransferManager*> g_crossManager(nullptr);
std::atomic<WhatsAppTransferManager*> g_whatsAppManager(nullptr);

// Solo activa las banderas atómicas de cancelación
void handleInterrupt(int)
{
    if (CrossTransferManager *manager = g_crossManager.load()) {
        manager->cancel();
    }
    if (WhatsAppTransferManager *manager = g_whatsAppManager.load()) {
        manager->cancel();
    }
}

QTextStream &out()
{
    static QTextStream stream(stdout);
    return stream;
}

void printMessages(const QStringList &errors, const QStringList &warnings)
{
    for (const QString &warning : warnings) {
        out() << "  aviso: " << warning << "\n";
    }
    for (const QString &error : errors) {
        out() << "  erro: " << error << "\n";
    }
    out().flush();
}

int listDevices(DeviceRegistry &registry)
{
    const QList<UnifiedDeviceInfo> devices = registry.listAllDevices();
    if (devices.isEmpty()) {
        out() << "Nenhum dispositivo conectado.\n";
        return ExitSuccess;
    }

    for (const UnifiedDeviceInfo &device : devices) {
        UnifiedDeviceInfo info = device;
        DeviceInterface *backend = registry.resolve(device.serial);
        if (backend && device.state == DeviceState::Connected && device.platform == DevicePlatform::Android) {
            info = backend->deviceDetails(device.serial);
        }
        out() << info.shortLabel() << "  (" << info.serial << ")\n";
    }
    out().flush();
    return ExitSuccess;
}

int runTransfer(DeviceRegistry &registry, const QString &workDir, const QString &source, const QString &target,
                const CrossTransferConfig &config)
{
    CrossTransferManager manager(&registry, workDir);
    manager.setProgressCallback([](CrossTransferProgress progress) {
        out() << QString("[%1%] ").arg(progress.percent, 5, 'f', 1) << progress.phase;
        if (!progress.subPhase.isEmpty()) {
            out() << " - " << progress.subPhase;
        }
        if (!progress.currentItem.isEmpty()) {
            out() << ": " << progress.currentItem;
        }
        out() << "\n";
        out().flush();
    });

    g_crossManager = &manager;
    bool success = manager.transfer(source, target, config);
    g_crossManager = nullptr;

    const CrossTransferProgress finalProgress = manager.progress();
    out() << "Resultado: " << finalProgress.phase
          << QString(" (%1 s)").arg(finalProgress.elapsedSeconds, 0, 'f', 1) << "\n";
    printMessages(finalProgress.errors, finalProgress.warnings);

    return success ? ExitSuccess : ExitFailure;
}

int runWhatsApp(DeviceRegistry &registry, const QString &workDir, const QString &source, const QString &target,
                bool includeBusiness)
{
    WhatsAppTransferManager manager(&registry, workDir);
    manager.setProgressCallback([](WhatsAppTransferProgress progress) {
        out() << QString("[%1%] ").arg(progress.percent, 5, 'f', 1) << progress.phase;
        if (!progress.subPhase.isEmpty()) {
            out() << " - " << progress.subPhase;
        }
        if (!progress.currentItem.isEmpty()) {
            out() << ": " << progress.currentItem;
        }
        out() << "\n";
        out().flush();
    });

    WhatsAppTransferConfig config;
    config.includeBusiness = includeBusiness;

    g_whatsAppManager = &manager;
    bool success = manager.transfer(source, target, config);
    g_whatsAppManager = nullptr;

    printMessages(manager.errors(), manager.warnings());
    out() << "\n"
          << WhatsAppTransferManager::getOfficialMigrationGuide(registry.platformOf(source), registry.platformOf(target))
          << "\n";
    out().flush();

    return success ? ExitSuccess : ExitFailure;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("MobileMigrationBridge");
    QCoreApplication::setApplicationName("migrationbridge");
    QCoreApplication::setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Transferência de dados entre dispositivos Android e iOS");
    QCommandLineOption helpOption = parser.addHelpOption();
    QCommandLineOption versionOption = parser.addVersionOption();
    parser.addPositionalArgument("command", "devices | transfer <origem> <destino> | whatsapp <origem> <destino>");

    QCommandLineOption verboseOption(QStringList() << "v" << "verbose", "Mostra mensagens de depuração.");
    QCommandLineOption workDirOption("work-dir", "Diretório de trabalho para o staging.", "dir");
    QCommandLineOption noHeicOption("no-heic", "Não converter HEIC para JPEG.");
    QCommandLineOption businessOption("business", "Inclui também o WhatsApp Business.");
    parser.addOption(verboseOption);
    parser.addOption(workDirOption);
    parser.addOption(noHeicOption);
    parser.addOption(businessOption);

    const QStringList categories = { "contacts", "sms", "calendar", "photos", "videos", "music", "documents" };
    QList<QCommandLineOption> categoryOptions;
    for (const QString &category : categories) {
        categoryOptions.append(QCommandLineOption("no-" + category, "Não transferir " + category + "."));
        parser.addOption(categoryOptions.last());
    }

    if (!parser.parse(app.arguments())) {
        fprintf(stderr, "%s\n\n%s", qPrintable(parser.errorText()), qPrintable(parser.helpText()));
        return ExitUsage;
    }
    if (parser.isSet(helpOption)) {
        parser.showHelp(ExitSuccess);
    }
    if (parser.isSet(versionOption)) {
        parser.showVersion();
    }

    AppSettings settings;
    Logger::init(settings.logDir(), parser.isSet(verboseOption));
    qDebug() << "Iniciando migrationbridge con argumentos:" << app.arguments();

    const QStringList args = parser.positionalArguments();
    const QString command = args.value(0);
    const QString workDir = parser.isSet(workDirOption) ? parser.value(workDirOption) : settings.workDir();

    if (command.isEmpty() || (command != "devices" && args.size() != 3)
        || (command != "devices" && command != "transfer" && command != "whatsapp")) {
        fprintf(stderr, "%s", qPrintable(parser.helpText()));
        Logger::shutdown();
        return ExitUsage;
    }

    AdbDevice adb(settings.adbPath(), settings.commandTimeoutMs());
    IosDevice ios(settings.libimobiledevicePath(), workDir, settings.commandTimeoutMs());
    if (!adb.isAvailable()) {
        qWarning() << "ADB no encontrado. Los dispositivos Android no estarán disponibles.";
    }
    if (!ios.isAvailable()) {
        qWarning() << "libimobiledevice no encontrado. Los dispositivos iOS no estarán disponibles.";
    }

    DeviceRegistry registry;
    registry.registerBackend(&adb);
    registry.registerBackend(&ios);

    std::signal(SIGINT, handleInterrupt);

    int result = ExitFailure;
    if (command == "devices") {
        result = listDevices(registry);
    } else if (command == "transfer") {
        CrossTransferConfig config = settings.transferConfig();
        bool *toggles[] = { &config.contacts, &config.sms, &config.calendar, &config.photos,
                            &config.videos, &config.music, &config.documents };
        for (int i = 0; i < categoryOptions.size(); ++i) {
            if (parser.isSet(categoryOptions[i])) {
                *toggles[i] = false;
            }
        }
        if (parser.isSet(noHeicOption)) {
            config.convertHeic = false;
        }
        result = runTransfer(registry, workDir, args[1], args[2], config);
    } else {
        result = runWhatsApp(registry, workDir, args[1], args[2], parser.isSet(businessOption));
    }

    qDebug() << "migrationbridge finalizado con código de salida:" << result;
    Logger::shutdown();
    return result;
}
