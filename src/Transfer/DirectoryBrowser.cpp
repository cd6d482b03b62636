// DirectoryBrowser.cpp
#include "DirectoryBrowser.h"

#include "TransferTypes.h"
#include "../Session/SessionManager.h"
#include "../Vault/ConnectionStore.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QStringList>

#include <algorithm>

void applyBrowserFilter(QVector<BrowserEntry>* entries, const BrowserFilter& filter)
{
    if (!entries) return;

    QVector<BrowserEntry> kept;
    kept.reserve(entries->size());
    for (const BrowserEntry& e : *entries) {
        if (filter.dirsOnly && !e.isDir) continue;
        if (!filter.showHidden && e.name.startsWith('.')) continue;
        kept.push_back(e);
    }

    std::sort(kept.begin(), kept.end(), [](const BrowserEntry& a, const BrowserEntry& b) {
        const int c = a.name.compare(b.name, Qt::CaseInsensitive);
        if (c != 0) return c < 0;
        return a.name < b.name;
    });

    *entries = kept;
}

bool DirectoryBrowser::hasSubdirectories(const QString& dir, bool showHidden)
{
    BrowserFilter f;
    f.dirsOnly   = true;
    f.showHidden = showHidden;

    QVector<BrowserEntry> entries;
    if (!list(dir, f, &entries))
        return false;
    return !entries.isEmpty();
}

// ===========================================================================
// Local
// ===========================================================================
LocalDirectoryBrowser::LocalDirectoryBrowser(ConnectionStore* store)
    : m_store(store)
{
}

bool LocalDirectoryBrowser::list(const QString& dir, const BrowserFilter& filter, QVector<BrowserEntry>* out,
                                 TransferError* code, QString* err)
{
    const QFileInfo di(dir);
    if (!di.exists() || !di.isDir()) {
        setError(code, err, TransferError::InvalidRequest, QString("Not a directory: %1").arg(dir));
        return false;
    }
    if (!di.isReadable()) {
        setError(code, err, TransferError::PermissionDenied, QString("Cannot read %1").arg(dir));
        return false;
    }

    const QFileInfoList infos = QDir(dir).entryInfoList(
        QDir::AllEntries | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System, QDir::NoSort);

    QVector<BrowserEntry> entries;
    entries.reserve(infos.size());
    for (const QFileInfo& fi : infos) {
        BrowserEntry e;
        e.name  = fi.fileName();
        e.path  = fi.absoluteFilePath();
        e.isDir = fi.isDir();
        e.size  = e.isDir ? 0 : (quint64)fi.size();
        entries.push_back(e);
    }

    applyBrowserFilter(&entries, filter);
    if (out) *out = entries;
    if (code) *code = TransferError::None;
    return true;
}

bool LocalDirectoryBrowser::isDirectory(const QString& path)
{
    return QFileInfo(path).isDir();
}

QString LocalDirectoryBrowser::parent(const QString& path) const
{
    QDir d(QFileInfo(path).absoluteFilePath());
    d.cdUp();   // stays put at the root
    return d.absolutePath();
}

QString LocalDirectoryBrowser::join(const QString& dir, const QString& name) const
{
    return TransferPaths::joinLocal(dir, name);
}

QString LocalDirectoryBrowser::startDirectory()
{
    if (m_store) {
        const QString last = m_store->lastLocalDir();
        if (!last.isEmpty() && QFileInfo(last).isDir())
            return last;
    }
    return QDir::homePath();
}

// ===========================================================================
// Remote
// ===========================================================================
RemoteDirectoryBrowser::RemoteDirectoryBrowser(SessionManager* sessions, int sessionId, ConnectionStore* store)
    : m_sessions(sessions)
    , m_sessionId(sessionId)
    , m_store(store)
{
}

bool RemoteDirectoryBrowser::list(const QString& dir, const BrowserFilter& filter, QVector<BrowserEntry>* out,
                                  TransferError* code, QString* err)
{
    if (!m_sessions) {
        setError(code, err, TransferError::InvalidRequest);
        return false;
    }

    SftpLeasePtr lease = m_sessions->acquireSftp(m_sessionId, nullptr, LeasePurpose::Browse, code, err);
    if (!lease)
        return false;

    QVector<SftpEntry> raw;
    if (!lease->sftp()->listDir(dir, &raw, code, err))
        return false;

    QVector<BrowserEntry> entries;
    entries.reserve(raw.size());
    for (const SftpEntry& r : raw) {
        BrowserEntry e;
        e.name  = r.name;
        e.path  = TransferPaths::joinRemote(dir, r.name);
        e.isDir = r.isDir;
        e.size  = r.size;
        entries.push_back(e);
    }

    applyBrowserFilter(&entries, filter);
    if (out) *out = entries;
    if (code) *code = TransferError::None;
    return true;
}

bool RemoteDirectoryBrowser::isDirectory(const QString& path)
{
    if (!m_sessions || path.isEmpty())
        return false;

    SftpLeasePtr lease = m_sessions->acquireSftp(m_sessionId, nullptr, LeasePurpose::Browse);
    if (!lease)
        return false;

    SftpEntry e;
    return lease->sftp()->stat(path, &e) && e.isDir;
}

QString RemoteDirectoryBrowser::parent(const QString& path) const
{
    return TransferPaths::remoteParent(path);
}

QString RemoteDirectoryBrowser::join(const QString& dir, const QString& name) const
{
    return TransferPaths::joinRemote(dir, name);
}

QString RemoteDirectoryBrowser::startDirectory()
{
    if (!m_sessions)
        return QStringLiteral("/");

    SessionInfo info;
    if (!m_sessions->sessionInfo(m_sessionId, &info))
        return QStringLiteral("/");

    QStringList candidates;
    if (m_store && info.recordId > 0) {
        ConnectionRecord rec;
        if (m_store->get(info.recordId, &rec)) {
            if (!rec.lastRemoteDir.isEmpty())
                candidates << rec.lastRemoteDir;
            if (!rec.user.isEmpty())
                candidates << QString("/home/%1").arg(rec.user);
        }
    }

    for (const QString& candidate : candidates) {
        if (isDirectory(candidate))
            return candidate;
    }

    SftpLeasePtr lease = m_sessions->acquireSftp(m_sessionId, nullptr, LeasePurpose::Browse);
    if (!lease) {
        qDebug().noquote() << QString("[XFER] session %1: no SFTP for start directory").arg(m_sessionId);
        return QStringLiteral("/");
    }

    const QString home = lease->sftp()->homeDir().trimmed();
    return home.isEmpty() ? QStringLiteral("/") : home;
}
