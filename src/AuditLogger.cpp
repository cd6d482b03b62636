// AuditLogger.cpp
#include "AuditLogger.h"

#include <QDir>
#include <QDate>
#include <QDateTime>
#include <QFile>
#include <QFileInfo>
#include <QStandardPaths>
#include <QJsonDocument>
#include <QMutex>
#include <QMutexLocker>
#include <QRegularExpression>
#include <QCoreApplication>

#include <memory>

// =====================================================
// Global audit logger state (process-wide)
// =====================================================
//
// One mutex guards everything below. One file handle is kept open for the
// current day ("audit-YYYY-MM-DD.jsonl") and reopened when the day or the
// directory changes.

static QMutex   g_auditMutex;
static QString  g_appName;
static QString  g_runId;
static QString  g_auditDirOverride;

static std::unique_ptr<QFile> g_auditFile;
static QString  g_openDate;   // "yyyy-MM-dd"
static QString  g_openPath;

// =====================================================
// Helpers (all *Locked helpers need g_auditMutex held)
// =====================================================

static QString dayKey()
{
    return QDate::currentDate().toString("yyyy-MM-dd");
}

static QString baseAuditDirLocked()
{
    const QString ov = g_auditDirOverride.trimmed();
    if (!ov.isEmpty())
        return QDir::cleanPath(ov);

    // ~/.config/tabssh/audit on Linux
    return QDir::cleanPath(
        QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation) + "/audit");
}

static QString filePathForDayLocked(const QString& day)
{
    return QDir(baseAuditDirLocked()).filePath(QString("audit-%1.jsonl").arg(day));
}

static void closeAuditFileLocked()
{
    if (g_auditFile) {
        g_auditFile->close();
        g_auditFile.reset();
    }
    g_openDate.clear();
    g_openPath.clear();
}

static bool ensureOpenLocked()
{
    const QString today = dayKey();
    const QString wantPath = filePathForDayLocked(today);

    if (g_auditFile && g_auditFile->isOpen() && g_openDate == today && g_openPath == wantPath)
        return true;

    closeAuditFileLocked();
    QDir().mkpath(baseAuditDirLocked());

    auto f = std::make_unique<QFile>(wantPath);
    if (!f->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text))
        return false;

    g_auditFile = std::move(f);
    g_openDate = today;
    g_openPath = wantPath;
    return true;
}

// =====================================================
// Public API
// =====================================================

namespace AuditLogger {

void install(const QString& appName)
{
    // No qInfo() here: Logger may not be installed yet and must not depend on us.
    QMutexLocker lock(&g_auditMutex);
    g_appName = appName;
    ensureOpenLocked();
}

void setRunId(const QString& runId)
{
    QMutexLocker lock(&g_auditMutex);
    g_runId = runId;
}

QString runId()
{
    QMutexLocker lock(&g_auditMutex);
    return g_runId;
}

void setAuditDirOverride(const QString& absoluteDirPath)
{
    QMutexLocker lock(&g_auditMutex);

    const QString trimmed = absoluteDirPath.trimmed();
    const QString newVal = trimmed.isEmpty() ? QString() : QDir::cleanPath(trimmed);
    if (newVal == g_auditDirOverride)
        return;

    g_auditDirOverride = newVal;
    closeAuditFileLocked();
}

QString auditDir()
{
    QMutexLocker lock(&g_auditMutex);
    return baseAuditDirLocked();
}

QString currentLogFilePath()
{
    QMutexLocker lock(&g_auditMutex);
    if (!g_openPath.isEmpty())
        return g_openPath;
    return filePathForDayLocked(dayKey());
}

void writeEvent(const QString& eventName, const QJsonObject& fields)
{
    QMutexLocker lock(&g_auditMutex);

    if (!ensureOpenLocked())
        return;

    QJsonObject o;
    o.insert("ts", QDateTime::currentDateTime().toString(Qt::ISODateWithMs));
    o.insert("event", eventName);
    o.insert("app", g_appName.isEmpty() ? QCoreApplication::applicationName() : g_appName);
    o.insert("pid", (qint64)QCoreApplication::applicationPid());
    if (!g_runId.isEmpty())
        o.insert("run_id", g_runId);

    // Caller fields win over the common ones.
    for (auto it = fields.begin(); it != fields.end(); ++it)
        o.insert(it.key(), it.value());

    const QByteArray line = QJsonDocument(o).toJson(QJsonDocument::Compact) + "\n";
    if (g_auditFile->write(line) != line.size()) {
        // Disk full or file vanished: reopen on the next event.
        closeAuditFileLocked();
        return;
    }
    g_auditFile->flush();
}

int pruneOlderThan(int days)
{
    if (days < 0) return 0;

    QMutexLocker lock(&g_auditMutex);

    static const QRegularExpression rx("^audit-(\\d{4}-\\d{2}-\\d{2})\\.jsonl$");
    const QDate cutoff = QDate::currentDate().addDays(-days);

    QDir dir(baseAuditDirLocked());
    if (!dir.exists())
        return 0;

    int removed = 0;
    const QStringList names = dir.entryList(QStringList() << "audit-*.jsonl", QDir::Files);
    for (const QString& name : names) {
        const QRegularExpressionMatch m = rx.match(name);
        if (!m.hasMatch())
            continue;

        const QDate day = QDate::fromString(m.captured(1), "yyyy-MM-dd");
        if (!day.isValid() || day >= cutoff)
            continue;

        const QString path = dir.filePath(name);
        if (path == g_openPath)
            closeAuditFileLocked();

        if (QFile::remove(path))
            ++removed;
    }
    return removed;
}

void shutdown()
{
    QMutexLocker lock(&g_auditMutex);
    closeAuditFileLocked();
}

} // namespace AuditLogger
