#pragma once

#include <QByteArray>
#include <QString>
#include <QVector>
#include <QtGlobal>

#include <functional>
#include <memory>

#include "../ErrorTypes.h"
#include "../Vault/ConnectionRecord.h"

/*
 * SshBackend
 * ----------
 * Narrow capability interface between the session/transfer core and the SSH
 * protocol stack. LibsshBackend implements it over libssh; the test suite
 * implements it with scripted in-memory hosts.
 *
 * Ownership:
 *  - open() hands out an SshConnection; channels opened on it are separate
 *    objects owned by the caller.
 *  - Close channels before closing their connection. Implementations keep
 *    the underlying protocol state alive until the last object is gone, so
 *    a wrong order is a logic error, never a dangling pointer.
 *
 * Threading:
 *  - One connection and its channels may be used from several threads
 *    (terminal pump + transfer worker); implementations serialize internally.
 */

// Opaque, already-decrypted private key (see SshBackend::loadPrivateKey).
class SshPrivateKey
{
public:
    virtual ~SshPrivateKey() = default;
};

struct SshAuth
{
    CredentialKind kind = CredentialKind::Password;
    QString password;                                 // kind == Password
    std::shared_ptr<const SshPrivateKey> key;         // kind == PrivateKey
};

struct SshConnectOptions
{
    QString host;
    int     port = 22;
    QString user;

    int     timeoutSec     = 15;
    bool    strictHostKeys = false;   // false => unknown hosts are added (TOFU)
    QString knownHostsPath;           // empty => ~/.ssh/known_hosts
    QString termType       = "xterm-256color";
};

struct SftpEntry
{
    QString name;         // leaf name (listDir) or full path (stat)
    bool    isDir   = false;
    quint64 size    = 0;
};

// -----------------------------
// Byte streams
// -----------------------------

class SftpFile
{
public:
    virtual ~SftpFile() = default;

    // >0 bytes read, 0 at EOF, -1 on error.
    virtual qint64 read(char* buf, qint64 maxLen, TransferError* code = nullptr, QString* err = nullptr) = 0;

    // Writes all of `len` or fails.
    virtual bool write(const char* data, qint64 len, TransferError* code = nullptr, QString* err = nullptr) = 0;

    virtual bool close(QString* err = nullptr) = 0;
};

class SftpChannel
{
public:
    virtual ~SftpChannel() = default;

    // Entries of `path` without "." and "..", unsorted.
    virtual bool listDir(const QString& path, QVector<SftpEntry>* out,
                         TransferError* code = nullptr, QString* err = nullptr) = 0;

    virtual bool stat(const QString& path, SftpEntry* out,
                      TransferError* code = nullptr, QString* err = nullptr) = 0;

    virtual std::unique_ptr<SftpFile> openRead(const QString& path,
                                               TransferError* code = nullptr, QString* err = nullptr) = 0;

    // Create or truncate.
    virtual std::unique_ptr<SftpFile> openWrite(const QString& path,
                                                TransferError* code = nullptr, QString* err = nullptr) = 0;

    // Succeeds when the directory already exists.
    virtual bool mkdir(const QString& path, TransferError* code = nullptr, QString* err = nullptr) = 0;

    // Absolute path of the login directory.
    virtual QString homeDir() = 0;

    virtual void close() = 0;
};

class SshChannel
{
public:
    virtual ~SshChannel() = default;

    // Non-blocking. >0 bytes read, 0 when nothing is pending,
    // -1 with RemoteClosed (clean EOF) or IoError.
    virtual int read(char* buf, int maxLen, ChannelError* code = nullptr, QString* err = nullptr) = 0;

    virtual bool write(const QByteArray& data, ChannelError* code = nullptr, QString* err = nullptr) = 0;

    virtual bool resize(int cols, int rows, QString* err = nullptr) = 0;

    virtual void close() = 0;
};

class SshConnection
{
public:
    virtual ~SshConnection() = default;

    virtual std::unique_ptr<SshChannel> openPty(int cols, int rows,
                                                ChannelError* code = nullptr, QString* err = nullptr) = 0;

    virtual std::unique_ptr<SftpChannel> openSftp(TransferError* code = nullptr, QString* err = nullptr) = 0;

    virtual void close() = 0;
};

class SshBackend
{
public:
    virtual ~SshBackend() = default;

    // Decrypts the key locally. Missing file, bad format or wrong
    // passphrase all fail with KeyUnreadable.
    virtual std::shared_ptr<const SshPrivateKey> loadPrivateKey(const QString& path,
                                                                const QString& passphrase,
                                                                ConnectError* code = nullptr,
                                                                QString* err = nullptr) = 0;

    // TCP connect, host key check, then authentication. `onAuthenticating`
    // (optional) is called once the transport is up and the host key accepted.
    virtual std::unique_ptr<SshConnection> open(const SshConnectOptions& options,
                                                const SshAuth& auth,
                                                const std::function<void()>& onAuthenticating,
                                                ConnectError* code = nullptr,
                                                QString* err = nullptr) = 0;
};
