#include <QCoreApplication>
#include <QDir>
#include <QStandardPaths>
#include <catch2/catch_session.hpp>

#include "crypto/fingerprint.hpp"

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("pairlink");
    QCoreApplication::setApplicationName("pairlink_tests");
    const auto testHome = QDir::tempPath() + QStringLiteral("/pairlink_tests_home");
    QDir().mkpath(testHome);
    qputenv("HOME", testHome.toUtf8());
    QStandardPaths::setTestModeEnabled(true);

    if (pairlink::crypto::init().is_err()) {
        return 1;
    }

    Catch::Session session;
    return session.run(argc, argv);
}
