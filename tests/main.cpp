#include <gtest/gtest.h>

#include <QCoreApplication>
#include <QStandardPaths>

#include "Logger.h"

// Qt needs an application object for QStandardPaths, QTimer and queued signals.
int main(int argc, char** argv)
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("tabssh-tests");
    QCoreApplication::setApplicationName("tabssh_tests");

    // Keeps settings, logs and audit files out of the real user profile.
    QStandardPaths::setTestModeEnabled(true);
    Logger::setLogLevel(0);

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
