#pragma once

#include <QString>
#include <QVector>
#include <QtGlobal>

#include "../ErrorTypes.h"

class ConnectionStore;
class SessionManager;

struct BrowserEntry
{
    QString name;
    QString path;       // full path on the browsed side
    bool    isDir = false;
    quint64 size  = 0;
};

struct BrowserFilter
{
    bool dirsOnly   = false;
    bool showHidden = false;
};

// Drops filtered entries, then sorts by name, case-insensitively.
void applyBrowserFilter(QVector<BrowserEntry>* entries, const BrowserFilter& filter);

/*
    DirectoryBrowser
    ----------------
    One side of the transfer wizard's pickers. The same calls work on the
    local filesystem and on a session's SFTP channel, so the wizard never
    cares which side it is looking at.
*/
class DirectoryBrowser
{
public:
    virtual ~DirectoryBrowser() = default;

    virtual bool isRemote() const = 0;

    // Sorted, filtered entries of `dir`.
    virtual bool list(const QString& dir,
                      const BrowserFilter& filter,
                      QVector<BrowserEntry>* out,
                      TransferError* code = nullptr,
                      QString* err = nullptr) = 0;

    virtual bool isDirectory(const QString& path) = 0;

    virtual QString parent(const QString& path) const = 0;
    virtual QString join(const QString& dir, const QString& name) const = 0;

    // Last directory used on this side if it still exists, else home.
    virtual QString startDirectory() = 0;

    // False on any listing error.
    bool hasSubdirectories(const QString& dir, bool showHidden = false);
};

// ---------------------------------------------------------------------------

class LocalDirectoryBrowser : public DirectoryBrowser
{
public:
    // `store` (optional) supplies the last local directory.
    explicit LocalDirectoryBrowser(ConnectionStore* store = nullptr);

    bool isRemote() const override { return false; }

    bool list(const QString& dir, const BrowserFilter& filter, QVector<BrowserEntry>* out,
              TransferError* code = nullptr, QString* err = nullptr) override;
    bool isDirectory(const QString& path) override;

    QString parent(const QString& path) const override;
    QString join(const QString& dir, const QString& name) const override;
    QString startDirectory() override;

private:
    ConnectionStore* m_store = nullptr;
};

// ---------------------------------------------------------------------------

// Borrows the session's SFTP channel for each call (LeasePurpose::Browse),
// so it fails with SessionBusy while a transfer runs on the same session.
class RemoteDirectoryBrowser : public DirectoryBrowser
{
public:
    RemoteDirectoryBrowser(SessionManager* sessions, int sessionId, ConnectionStore* store = nullptr);

    bool isRemote() const override { return true; }

    bool list(const QString& dir, const BrowserFilter& filter, QVector<BrowserEntry>* out,
              TransferError* code = nullptr, QString* err = nullptr) override;
    bool isDirectory(const QString& path) override;

    QString parent(const QString& path) const override;
    QString join(const QString& dir, const QString& name) const override;

    // lastRemoteDir of the session's record, else /home/<user>, else the
    // login directory reported by the server, else "/".
    QString startDirectory() override;

private:
    SessionManager*  m_sessions = nullptr;
    int              m_sessionId = -1;
    ConnectionStore* m_store = nullptr;
};
