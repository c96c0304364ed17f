#include <gtest/gtest.h>
#include "logger.h"
#include <QDebug>
#include <QFile>
#include <QTemporaryDir>

namespace {

QString readAll(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return QString();
    }
    return QString::fromUtf8(file.readAll());
}

} // namespace

TEST(LoggerTest, WritesMessagesToDailyFile) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    Logger::init(dir.path(), false);
    const QString path = Logger::logFilePath();
    ASSERT_FALSE(path.isEmpty());
    EXPECT_TRUE(path.contains("migrationbridge_"));

    qInfo() << "mensagem de teste";
    qDebug() << "depuracao oculta";
    Logger::shutdown();

    const QString content = readAll(path);
    EXPECT_TRUE(content.contains("INFO: mensagem de teste"));
    EXPECT_FALSE(content.contains("depuracao oculta"));
    EXPECT_TRUE(Logger::logFilePath().isEmpty());
}

TEST(LoggerTest, RepeatedInitAndShutdownAreSafe) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());

    Logger::init(dir.path(), true);
    const QString path = Logger::logFilePath();
    Logger::init(dir.path(), true);
    EXPECT_EQ(Logger::logFilePath(), path);
    Logger::shutdown();
    Logger::shutdown();

    Logger::init(dir.path(), true);
    qWarning() << "segunda sessao";
    Logger::shutdown();
    EXPECT_TRUE(readAll(path).contains("WARN: segunda sessao"));
}

TEST(LoggerTest, UnusableDirectoryFallsBackToStderrOnly) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString blocker = dir.filePath("arquivo");
    {
        QFile file(blocker);
        ASSERT_TRUE(file.open(QIODevice::WriteOnly));
        file.write("x");
    }

    Logger::init(blocker + "/logs", false);
    EXPECT_TRUE(Logger::logFilePath().isEmpty());
    Logger::shutdown();
}
