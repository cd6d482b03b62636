// AppSettings.cpp
#include "AppSettings.h"

#include <QDir>
#include <QSettings>
#include <QStandardPaths>
#include <QtGlobal>

static QString normalizedProfile(const QString& v)
{
    const QString p = v.trimmed().toLower();
    if (p == "interactive" || p == "moderate" || p == "sensitive")
        return p;
    return "moderate";
}

static QString normalizedPolicy(const QString& v)
{
    const QString p = v.trimmed().toLower();
    return (p == "strict") ? p : QString("accept-new");
}

AppSettings AppSettings::load()
{
    QSettings s;
    return load(s);
}

AppSettings AppSettings::load(QSettings& s)
{
    AppSettings a;

    a.logLevel           = qBound(0, s.value("log/level", a.logLevel).toInt(), 2);
    a.auditDir           = s.value("log/audit_dir", QString()).toString().trimmed();
    a.auditRetentionDays = qBound(1, s.value("log/retention_days", a.auditRetentionDays).toInt(), 3650);

    a.vaultPath          = s.value("vault/path", QString()).toString().trimmed();
    a.kdfProfile         = normalizedProfile(s.value("vault/kdf_profile", a.kdfProfile).toString());
    a.idleLockMinutes    = qBound(0, s.value("vault/idle_lock_minutes", a.idleLockMinutes).toInt(), 24 * 60);

    a.connectTimeoutSec  = qBound(1, s.value("ssh/connect_timeout_sec", a.connectTimeoutSec).toInt(), 300);
    a.knownHostsPolicy   = normalizedPolicy(s.value("ssh/known_hosts_policy", a.knownHostsPolicy).toString());

    const QString term   = s.value("ssh/term_type", a.termType).toString().trimmed();
    if (!term.isEmpty())
        a.termType = term;

    a.chunkSize          = qBound(4 * 1024, s.value("transfer/chunk_size", a.chunkSize).toInt(), 1024 * 1024);
    a.progressIntervalMs = qBound(10, s.value("transfer/progress_interval_ms", a.progressIntervalMs).toInt(), 5000);

    a.showHidden         = s.value("browser/show_hidden", a.showHidden).toBool();
    return a;
}

void AppSettings::save() const
{
    QSettings s;
    save(s);
}

void AppSettings::save(QSettings& s) const
{
    s.setValue("log/level", logLevel);
    s.setValue("log/audit_dir", auditDir);
    s.setValue("log/retention_days", auditRetentionDays);
    s.setValue("vault/path", vaultPath);
    s.setValue("vault/kdf_profile", kdfProfile);
    s.setValue("vault/idle_lock_minutes", idleLockMinutes);
    s.setValue("ssh/connect_timeout_sec", connectTimeoutSec);
    s.setValue("ssh/known_hosts_policy", knownHostsPolicy);
    s.setValue("ssh/term_type", termType);
    s.setValue("transfer/chunk_size", chunkSize);
    s.setValue("transfer/progress_interval_ms", progressIntervalMs);
    s.setValue("browser/show_hidden", showHidden);
    s.sync();
}

QString AppSettings::effectiveVaultPath() const
{
    if (!vaultPath.isEmpty())
        return QDir::cleanPath(vaultPath);
    return QDir::cleanPath(
        QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation) + "/vault.bin");
}
