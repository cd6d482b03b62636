#pragma once

#include <QString>

class QSettings;

// Typed view over the QSettings keys tabssh reads.
// Missing keys take the defaults below; out-of-range values are clamped.
struct AppSettings
{
    // log/*
    int     logLevel          = 1;        // 0..2
    QString auditDir;                     // empty => <AppConfigLocation>/audit
    int     auditRetentionDays = 7;       // 1..3650

    // vault/*
    QString vaultPath;                    // empty => <AppConfigLocation>/vault.bin
    QString kdfProfile        = "moderate";
    int     idleLockMinutes   = 15;       // 0 disables

    // ssh/*
    int     connectTimeoutSec = 15;       // 1..300
    QString knownHostsPolicy  = "accept-new"; // "strict" | "accept-new"
    QString termType          = "xterm-256color";

    // transfer/*
    int     chunkSize         = 64 * 1024;    // 4 KiB .. 1 MiB
    int     progressIntervalMs = 100;         // 10 .. 5000

    // browser/*
    bool    showHidden        = false;

    static AppSettings load();                 // QSettings() with app identity
    static AppSettings load(QSettings& s);
    void save() const;
    void save(QSettings& s) const;

    QString effectiveVaultPath() const;
    bool    strictHostKeys() const { return knownHostsPolicy == "strict"; }
};
