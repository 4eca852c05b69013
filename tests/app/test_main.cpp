#include <QCoreApplication>
#include <QDir>
#include <QStandardPaths>
#include <catch2/catch_session.hpp>

#include "crypto/keys.hpp"

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("uuidv47");
    QCoreApplication::setOrganizationDomain("uuidv47.local");
    QCoreApplication::setApplicationName("uuidv47_app_tests");
    const auto testHome = QDir::tempPath() + QStringLiteral("/uuidv47_app_tests_home");
    QDir().mkpath(testHome);
    qputenv("HOME", testHome.toUtf8());
    QStandardPaths::setTestModeEnabled(true);

    if (uuidv47::crypto::init().is_err()) {
        return 1;
    }

    Catch::Session session;
    return session.run(argc, argv);
}
