#pragma once
#include <QString>

// Diagnostic text log (Qt message handler).
//
// Everything in tabssh logs through qDebug/qInfo/qWarning/qCritical with a
// bracketed tag ("[VAULT]", "[SESSION]", "[XFER]", "[SSH]"). The handler
// installed here writes one line per record:
//
//   2026-01-02 10:11:12.345 [INFO] SessionManager.cpp:88 connect - [SESSION] ...
//
// Never pass passwords, passphrases, keys or decrypted vault bytes to qDebug().
namespace Logger {
    // Opens <AppLocalDataLocation>/logs/<appName>.log (or the override) and
    // installs the handler. Safe to call again after changing the override.
    void install(const QString& appName);

    // Restores the default Qt handler and closes the file.
    void uninstall();

    // 0=Errors only, 1=Normal, 2=Debug
    void setLogLevel(int level);
    int  logLevel();

    // CLI --verbose: also echo accepted records to stderr.
    void setMirrorToStderr(bool on);

    QString logFilePath();
    QString logDirPath();

    void setLogFilePathOverride(const QString& absoluteFilePath);  // empty => default
}
