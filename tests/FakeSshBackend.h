#pragma once

#include <QByteArray>
#include <QMap>
#include <QMutex>
#include <QSet>
#include <QString>

#include <memory>

#include "Session/SshBackend.h"

// Scripted behaviour of one simulated host.
struct FakeHostConfig
{
    QString      password = "secret";     // accepted password
    QString      keyPath;                 // accepted private key file
    ConnectError failWith = ConnectError::None;
    int          connectDelayMs = 0;

    QString      home = "/home/alice";
    bool         sftpFails = false;
    int          writeDelayMs = 0;        // per SftpFile::write call
    int          readDelayMs = 0;         // per SftpFile::read call
    QSet<QString> readOnlyDirs;           // writes below these fail PermissionDenied
};

// Shared, mutex-guarded state of one simulated host.
struct FakeHostState
{
    QMutex         mutex;
    FakeHostConfig cfg;

    QByteArray     ptyReceived;           // everything written to PTYs on this host
    int            ptyOpen = 0;
    int            ptyOpened = 0;
    int            ptyCols = 0;               // last size requested on a PTY
    int            ptyRows = 0;
    int            ptyResizes = 0;
    int            connections = 0;
    bool           remoteClosed = false;  // PTY reads report RemoteClosed
    bool           linkDown = false;      // PTY and SFTP I/O fail
    bool           ptyWriteRefused = false;  // PTY writes fail without an error code

    QSet<QString>              dirs;
    QMap<QString, QByteArray>  files;
    QMap<QString, quint64>     virtualSizes;   // large files without content
};

/*
    In-memory SshBackend for tests.

    - Hosts are keyed by name; an unknown host is NetworkUnreachable.
    - PTY channels echo what is written to them.
    - SFTP works on a flat map of absolute paths.
    - Virtual files report a size and read back as zero bytes, so large
      transfers need no real memory on the source side.
*/
class FakeSshBackend : public SshBackend
{
public:
    FakeSshBackend() = default;

    std::shared_ptr<FakeHostState> addHost(const QString& host, const FakeHostConfig& cfg = FakeHostConfig());
    std::shared_ptr<FakeHostState> host(const QString& host) const;

    // loadPrivateKey() accepts `path` with exactly this passphrase.
    void addKey(const QString& path, const QString& passphrase = QString());

    // Remote filesystem helpers (paths are absolute, no trailing '/').
    static void addDir(FakeHostState& s, const QString& path);
    static void addFile(FakeHostState& s, const QString& path, const QByteArray& content);
    static void addVirtualFile(FakeHostState& s, const QString& path, quint64 size);
    static QByteArray fileContent(FakeHostState& s, const QString& path);
    static bool hasDir(FakeHostState& s, const QString& path);
    static bool hasFile(FakeHostState& s, const QString& path);

    std::shared_ptr<const SshPrivateKey> loadPrivateKey(const QString& path,
                                                        const QString& passphrase,
                                                        ConnectError* code = nullptr,
                                                        QString* err = nullptr) override;

    std::unique_ptr<SshConnection> open(const SshConnectOptions& options,
                                        const SshAuth& auth,
                                        const std::function<void()>& onAuthenticating,
                                        ConnectError* code = nullptr,
                                        QString* err = nullptr) override;

private:
    mutable QMutex m_mutex;
    QMap<QString, std::shared_ptr<FakeHostState>> m_hosts;
    QMap<QString, QString> m_keys;
};
