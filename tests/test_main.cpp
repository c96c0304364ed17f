#include <gtest/gtest.h>
#include <QCoreApplication>

// QSQLITE, QImageReader y QStandardPaths necesitan una instancia de aplicación
int main(int argc, char **argv)
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("MobileMigrationBridgeTests");
    QCoreApplication::setApplicationName("migrationbridge_tests");

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
