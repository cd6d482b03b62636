// LibsshBackend.cpp
//
// libssh plumbing behind the SshBackend interface.
//   - connect + known_hosts check (strict, or trust-on-first-use)
//   - password / private-key auth (key decrypted locally via ssh_pki)
//   - PTY shell channels (non-blocking reads for the terminal pump)
//   - SFTP subsystem: list/stat/open/mkdir + streaming file handles
//
// Lifetime: channels and sftp handles keep a shared reference to the
// connection core, so ssh_free() only runs after the last of them is gone.
// Never log passwords, passphrases or key material.

#include "LibsshBackend.h"

#include <QDebug>
#include <QFile>
#include <QMutex>
#include <QMutexLocker>

#include <libssh/libssh.h>
#include <libssh/sftp.h>

#include <fcntl.h>
#include <sys/stat.h>

// ------------------------------------------------------------
// Helpers
// ------------------------------------------------------------
static QString libsshError(ssh_session s)
{
    if (!s) return QStringLiteral("libssh: null session");
    return QString::fromLocal8Bit(ssh_get_error(s));
}

static void initLibsshOnce()
{
    // ssh_init() is required before threads use libssh concurrently.
    static const int rc = ssh_init();
    if (rc != SSH_OK)
        qCritical().noquote() << "[SSH] ssh_init failed";
}

// ------------------------------------------------------------
// Shared state
// ------------------------------------------------------------
namespace {

struct SessionCore
{
    ssh_session session = nullptr;
    QMutex      mutex;
    bool        disconnected = false;

    ~SessionCore()
    {
        if (session) {
            if (!disconnected)
                ssh_disconnect(session);
            ssh_free(session);
            session = nullptr;
        }
    }
};
using SessionCorePtr = std::shared_ptr<SessionCore>;

struct SftpCore
{
    SessionCorePtr core;
    sftp_session   sftp = nullptr;

    ~SftpCore()
    {
        if (sftp) {
            QMutexLocker lock(&core->mutex);
            sftp_free(sftp);
            sftp = nullptr;
        }
    }
};
using SftpCorePtr = std::shared_ptr<SftpCore>;

// Must be called with the session mutex held.
static TransferError sftpErrorCode(sftp_session sftp)
{
    if (!sftp) return TransferError::IoError;
    switch (sftp_get_error(sftp)) {
        case SSH_FX_PERMISSION_DENIED: return TransferError::PermissionDenied;
        default:                       return TransferError::IoError;
    }
}

static QString joinRemote(const QString& dir, const QString& name)
{
    if (dir.endsWith('/')) return dir + name;
    return dir + "/" + name;
}

// ------------------------------------------------------------
// Private key
// ------------------------------------------------------------
class LibsshPrivateKey : public SshPrivateKey
{
public:
    explicit LibsshPrivateKey(ssh_key k) : key(k) {}
    ~LibsshPrivateKey() override { if (key) ssh_key_free(key); }

    ssh_key key = nullptr;
};

// ------------------------------------------------------------
// SFTP file handle
// ------------------------------------------------------------
class LibsshSftpFile : public SftpFile
{
public:
    LibsshSftpFile(SftpCorePtr sftp, sftp_file f, const QString& path)
        : m_sftp(std::move(sftp)), m_file(f), m_path(path) {}

    ~LibsshSftpFile() override { close(nullptr); }

    qint64 read(char* buf, qint64 maxLen, TransferError* code, QString* err) override
    {
        QMutexLocker lock(&m_sftp->core->mutex);
        if (!m_file) {
            setError(code, err, TransferError::IoError, QStringLiteral("File is closed"));
            return -1;
        }
        const ssize_t n = sftp_read(m_file, buf, (size_t)maxLen);
        if (n < 0) {
            setError(code, err, sftpErrorCode(m_sftp->sftp),
                     QString("sftp_read failed for '%1': %2").arg(m_path, libsshError(m_sftp->core->session)));
            return -1;
        }
        return (qint64)n;
    }

    bool write(const char* data, qint64 len, TransferError* code, QString* err) override
    {
        QMutexLocker lock(&m_sftp->core->mutex);
        if (!m_file) {
            setError(code, err, TransferError::IoError, QStringLiteral("File is closed"));
            return false;
        }

        qint64 off = 0;
        while (off < len) {
            const ssize_t w = sftp_write(m_file, data + off, (size_t)(len - off));
            if (w <= 0) {
                setError(code, err, sftpErrorCode(m_sftp->sftp),
                         QString("sftp_write failed for '%1': %2").arg(m_path, libsshError(m_sftp->core->session)));
                return false;
            }
            off += w;
        }
        return true;
    }

    bool close(QString* err) override
    {
        if (!m_file) return true;
        QMutexLocker lock(&m_sftp->core->mutex);
        const int rc = sftp_close(m_file);
        m_file = nullptr;
        if (rc != SSH_OK) {
            if (err) *err = QString("sftp_close failed for '%1'").arg(m_path);
            return false;
        }
        return true;
    }

private:
    SftpCorePtr m_sftp;
    sftp_file   m_file = nullptr;
    QString     m_path;
};

// ------------------------------------------------------------
// SFTP channel
// ------------------------------------------------------------
class LibsshSftpChannel : public SftpChannel
{
public:
    explicit LibsshSftpChannel(SftpCorePtr sftp) : m_sftp(std::move(sftp)) {}
    ~LibsshSftpChannel() override { close(); }

    bool listDir(const QString& path, QVector<SftpEntry>* out, TransferError* code, QString* err) override
    {
        if (!out) return false;
        out->clear();
        if (!m_sftp) {
            setError(code, err, TransferError::IoError, QStringLiteral("SFTP channel closed"));
            return false;
        }

        QMutexLocker lock(&m_sftp->core->mutex);
        sftp_session sftp = m_sftp->sftp;

        sftp_dir dir = sftp_opendir(sftp, path.toUtf8().constData());
        if (!dir) {
            setError(code, err, sftpErrorCode(sftp),
                     QString("sftp_opendir failed for '%1': %2").arg(path, libsshError(m_sftp->core->session)));
            return false;
        }

        while (sftp_attributes a = sftp_readdir(sftp, dir)) {
            const QString name = QString::fromUtf8(a->name ? a->name : "");
            if (name.isEmpty() || name == "." || name == "..") {
                sftp_attributes_free(a);
                continue;
            }

            SftpEntry e;
            e.name  = name;
            e.isDir = (a->type == SSH_FILEXFER_TYPE_DIRECTORY);
            e.size  = a->size;

            // Follow symlinks so a link to a directory can be browsed.
            if (a->type == SSH_FILEXFER_TYPE_SYMLINK) {
                const QByteArray full = joinRemote(path, name).toUtf8();
                if (sftp_attributes t = sftp_stat(sftp, full.constData())) {
                    e.isDir = (t->type == SSH_FILEXFER_TYPE_DIRECTORY);
                    e.size  = t->size;
                    sftp_attributes_free(t);
                }
            }

            out->push_back(e);
            sftp_attributes_free(a);
        }

        const bool eof = sftp_dir_eof(dir);
        sftp_closedir(dir);

        if (!eof) {
            setError(code, err, TransferError::IoError,
                     QString("sftp_readdir failed for '%1': %2").arg(path, libsshError(m_sftp->core->session)));
            return false;
        }
        return true;
    }

    bool stat(const QString& path, SftpEntry* out, TransferError* code, QString* err) override
    {
        if (!m_sftp) {
            setError(code, err, TransferError::IoError, QStringLiteral("SFTP channel closed"));
            return false;
        }

        QMutexLocker lock(&m_sftp->core->mutex);
        sftp_attributes a = sftp_stat(m_sftp->sftp, path.toUtf8().constData());
        if (!a) {
            setError(code, err, sftpErrorCode(m_sftp->sftp),
                     QString("sftp_stat failed for '%1': %2").arg(path, libsshError(m_sftp->core->session)));
            return false;
        }

        if (out) {
            out->name  = path;
            out->isDir = (a->type == SSH_FILEXFER_TYPE_DIRECTORY);
            out->size  = a->size;
        }
        sftp_attributes_free(a);
        return true;
    }

    std::unique_ptr<SftpFile> openRead(const QString& path, TransferError* code, QString* err) override
    {
        return openFile(path, O_RDONLY, 0, code, err);
    }

    std::unique_ptr<SftpFile> openWrite(const QString& path, TransferError* code, QString* err) override
    {
        return openFile(path, O_WRONLY | O_CREAT | O_TRUNC, S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH, code, err);
    }

    bool mkdir(const QString& path, TransferError* code, QString* err) override
    {
        if (!m_sftp) {
            setError(code, err, TransferError::IoError, QStringLiteral("SFTP channel closed"));
            return false;
        }

        QMutexLocker lock(&m_sftp->core->mutex);
        const QByteArray p = path.toUtf8();
        if (sftp_mkdir(m_sftp->sftp, p.constData(), S_IRWXU | S_IRGRP | S_IXGRP | S_IROTH | S_IXOTH) == SSH_OK)
            return true;

        const TransferError mkdirCode = sftpErrorCode(m_sftp->sftp);

        // Already there is fine.
        if (sftp_attributes a = sftp_stat(m_sftp->sftp, p.constData())) {
            const bool isDir = (a->type == SSH_FILEXFER_TYPE_DIRECTORY);
            sftp_attributes_free(a);
            if (isDir) return true;
        }

        setError(code, err, mkdirCode,
                 QString("sftp_mkdir failed for '%1': %2").arg(path, libsshError(m_sftp->core->session)));
        return false;
    }

    QString homeDir() override
    {
        if (!m_sftp) return QStringLiteral("/");

        QMutexLocker lock(&m_sftp->core->mutex);
        char* p = sftp_canonicalize_path(m_sftp->sftp, ".");
        if (!p) return QStringLiteral("/");

        const QString out = QString::fromUtf8(p);
        ssh_string_free_char(p);
        return out.isEmpty() ? QStringLiteral("/") : out;
    }

    void close() override
    {
        // Open files keep their own reference; sftp_free runs after the last one.
        m_sftp.reset();
    }

private:
    std::unique_ptr<SftpFile> openFile(const QString& path, int flags, mode_t mode,
                                       TransferError* code, QString* err)
    {
        if (!m_sftp) {
            setError(code, err, TransferError::IoError, QStringLiteral("SFTP channel closed"));
            return nullptr;
        }

        QMutexLocker lock(&m_sftp->core->mutex);
        sftp_file f = sftp_open(m_sftp->sftp, path.toUtf8().constData(), flags, mode);
        if (!f) {
            setError(code, err, sftpErrorCode(m_sftp->sftp),
                     QString("sftp_open failed for '%1': %2").arg(path, libsshError(m_sftp->core->session)));
            return nullptr;
        }
        return std::unique_ptr<SftpFile>(new LibsshSftpFile(m_sftp, f, path));
    }

    SftpCorePtr m_sftp;
};

// ------------------------------------------------------------
// PTY channel
// ------------------------------------------------------------
class LibsshPtyChannel : public SshChannel
{
public:
    LibsshPtyChannel(SessionCorePtr core, ssh_channel ch)
        : m_core(std::move(core)), m_channel(ch) {}

    ~LibsshPtyChannel() override { close(); }

    int read(char* buf, int maxLen, ChannelError* code, QString* err) override
    {
        QMutexLocker lock(&m_core->mutex);
        if (!m_channel) {
            setError(code, err, ChannelError::RemoteClosed);
            return -1;
        }

        // stdout first, then stderr: a PTY usually merges them anyway.
        for (int isStderr = 0; isStderr <= 1; ++isStderr) {
            const int n = ssh_channel_read_nonblocking(m_channel, buf, (uint32_t)maxLen, isStderr);
            if (n > 0)
                return n;
            if (n == SSH_EOF)
                break;
            if (n == SSH_ERROR) {
                setError(code, err, ChannelError::IoError,
                         QString("channel read failed: %1").arg(libsshError(m_core->session)));
                return -1;
            }
        }

        if (ssh_channel_is_eof(m_channel) || ssh_channel_is_closed(m_channel)) {
            setError(code, err, ChannelError::RemoteClosed);
            return -1;
        }
        return 0;
    }

    bool write(const QByteArray& data, ChannelError* code, QString* err) override
    {
        QMutexLocker lock(&m_core->mutex);
        if (!m_channel) {
            setError(code, err, ChannelError::RemoteClosed);
            return false;
        }

        int off = 0;
        while (off < data.size()) {
            const int w = ssh_channel_write(m_channel, data.constData() + off, (uint32_t)(data.size() - off));
            if (w == SSH_ERROR) {
                setError(code, err, ChannelError::IoError,
                         QString("channel write failed: %1").arg(libsshError(m_core->session)));
                return false;
            }
            off += w;
        }
        return true;
    }

    bool resize(int cols, int rows, QString* err) override
    {
        QMutexLocker lock(&m_core->mutex);
        if (!m_channel) return true;
        if (ssh_channel_change_pty_size(m_channel, cols, rows) != SSH_OK) {
            if (err) *err = QString("pty resize failed: %1").arg(libsshError(m_core->session));
            return false;
        }
        return true;
    }

    void close() override
    {
        QMutexLocker lock(&m_core->mutex);
        if (!m_channel) return;

        if (ssh_channel_is_open(m_channel)) {
            ssh_channel_send_eof(m_channel);
            ssh_channel_close(m_channel);
        }
        ssh_channel_free(m_channel);
        m_channel = nullptr;
    }

private:
    SessionCorePtr m_core;
    ssh_channel    m_channel = nullptr;
};

// ------------------------------------------------------------
// Connection
// ------------------------------------------------------------
class LibsshConnection : public SshConnection
{
public:
    LibsshConnection(SessionCorePtr core, const QString& termType)
        : m_core(std::move(core)), m_termType(termType.toUtf8()) {}

    ~LibsshConnection() override { close(); }

    std::unique_ptr<SshChannel> openPty(int cols, int rows, ChannelError* code, QString* err) override
    {
        QMutexLocker lock(&m_core->mutex);
        if (m_core->disconnected) {
            setError(code, err, ChannelError::NotReady);
            return nullptr;
        }

        ssh_session s = m_core->session;
        ssh_channel ch = ssh_channel_new(s);
        if (!ch) {
            setError(code, err, ChannelError::IoError, QStringLiteral("ssh_channel_new failed"));
            return nullptr;
        }

        auto fail = [&](const char* what) -> std::unique_ptr<SshChannel> {
            setError(code, err, ChannelError::IoError,
                     QString("%1 failed: %2").arg(QString::fromLatin1(what), libsshError(s)));
            if (ssh_channel_is_open(ch))
                ssh_channel_close(ch);
            ssh_channel_free(ch);
            return nullptr;
        };

        if (ssh_channel_open_session(ch) != SSH_OK)
            return fail("ssh_channel_open_session");
        if (ssh_channel_request_pty_size(ch, m_termType.constData(), cols, rows) != SSH_OK)
            return fail("ssh_channel_request_pty_size");
        if (ssh_channel_request_shell(ch) != SSH_OK)
            return fail("ssh_channel_request_shell");

        return std::unique_ptr<SshChannel>(new LibsshPtyChannel(m_core, ch));
    }

    std::unique_ptr<SftpChannel> openSftp(TransferError* code, QString* err) override
    {
        QMutexLocker lock(&m_core->mutex);
        if (m_core->disconnected) {
            setError(code, err, TransferError::IoError, QStringLiteral("Not connected"));
            return nullptr;
        }

        sftp_session sftp = sftp_new(m_core->session);
        if (!sftp) {
            setError(code, err, TransferError::IoError, QStringLiteral("sftp_new failed"));
            return nullptr;
        }
        if (sftp_init(sftp) != SSH_OK) {
            setError(code, err, TransferError::IoError,
                     QString("sftp_init failed: %1").arg(libsshError(m_core->session)));
            sftp_free(sftp);
            return nullptr;
        }

        auto sc = std::make_shared<SftpCore>();
        sc->core = m_core;
        sc->sftp = sftp;
        return std::unique_ptr<SftpChannel>(new LibsshSftpChannel(sc));
    }

    void close() override
    {
        if (!m_core) return;
        QMutexLocker lock(&m_core->mutex);
        if (!m_core->disconnected) {
            qInfo().noquote() << "[SSH] disconnect";
            ssh_disconnect(m_core->session);
            m_core->disconnected = true;
        }
    }

private:
    SessionCorePtr m_core;
    QByteArray     m_termType;
};

} // namespace

// ------------------------------------------------------------
// Host key verification (known_hosts)
// ------------------------------------------------------------
static bool verifyHostKey(ssh_session s, bool strict, const QString& host,
                          ConnectError* code, QString* err)
{
    QString fingerprint;
    ssh_key srvKey = nullptr;
    if (ssh_get_server_publickey(s, &srvKey) == SSH_OK) {
        unsigned char* hash = nullptr;
        size_t hlen = 0;
        if (ssh_get_publickey_hash(srvKey, SSH_PUBLICKEY_HASH_SHA256, &hash, &hlen) == SSH_OK) {
            char* fp = ssh_get_fingerprint_hash(SSH_PUBLICKEY_HASH_SHA256, hash, hlen);
            if (fp) {
                fingerprint = QString::fromLatin1(fp);
                ssh_string_free_char(fp);
            }
            ssh_clean_pubkey_hash(&hash);
        }
        ssh_key_free(srvKey);
    }

    const enum ssh_known_hosts_e state = ssh_session_is_known_server(s);
    switch (state) {
        case SSH_KNOWN_HOSTS_OK:
            return true;

        case SSH_KNOWN_HOSTS_CHANGED:
        case SSH_KNOWN_HOSTS_OTHER:
            qWarning().noquote() << QString("[SSH] host key for '%1' changed (now %2)").arg(host, fingerprint);
            setError(code, err, ConnectError::HostKeyMismatch);
            return false;

        case SSH_KNOWN_HOSTS_NOT_FOUND:
        case SSH_KNOWN_HOSTS_UNKNOWN:
            if (strict) {
                qWarning().noquote() << QString("[SSH] unknown host '%1' (%2), strict policy").arg(host, fingerprint);
                setError(code, err, ConnectError::HostKeyMismatch,
                         QStringLiteral("Unknown host key (strict known_hosts policy)"));
                return false;
            }
            if (ssh_session_update_known_hosts(s) != SSH_OK) {
                qWarning().noquote() << QString("[SSH] could not record host key for '%1': %2")
                                        .arg(host, libsshError(s));
            } else {
                qInfo().noquote() << QString("[SSH] trusted new host '%1' %2").arg(host, fingerprint);
            }
            return true;

        case SSH_KNOWN_HOSTS_ERROR:
        default:
            setError(code, err, ConnectError::HostKeyMismatch,
                     QString("Host key check failed: %1").arg(libsshError(s)));
            return false;
    }
}

// ------------------------------------------------------------
// LibsshBackend
// ------------------------------------------------------------
LibsshBackend::LibsshBackend()
{
    initLibsshOnce();
}

std::shared_ptr<const SshPrivateKey> LibsshBackend::loadPrivateKey(const QString& path,
                                                                   const QString& passphrase,
                                                                   ConnectError* code,
                                                                   QString* err)
{
    const QByteArray p = QFile::encodeName(expandTilde(path.trimmed()));
    QByteArray pass = passphrase.toUtf8();

    ssh_key key = nullptr;
    const int rc = ssh_pki_import_privkey_file(p.constData(),
                                               pass.isEmpty() ? nullptr : pass.constData(),
                                               nullptr, nullptr, &key);
    pass.fill('\0');

    if (rc != SSH_OK || !key) {
        // SSH_EOF: missing/unreadable file. SSH_ERROR: bad format or passphrase.
        setError(code, err, ConnectError::KeyUnreadable,
                 rc == SSH_EOF ? QStringLiteral("Key file not found or unreadable")
                               : QStringLiteral("Key could not be decrypted"));
        return nullptr;
    }
    return std::make_shared<LibsshPrivateKey>(key);
}

std::unique_ptr<SshConnection> LibsshBackend::open(const SshConnectOptions& o,
                                                   const SshAuth& auth,
                                                   const std::function<void()>& onAuthenticating,
                                                   ConnectError* code,
                                                   QString* err)
{
    if (code) *code = ConnectError::None;

    const QString host = o.host.trimmed();
    const QString user = o.user.trimmed();

    auto core = std::make_shared<SessionCore>();
    core->session = ssh_new();
    if (!core->session) {
        setError(code, err, ConnectError::NetworkUnreachable, QStringLiteral("ssh_new() failed"));
        return nullptr;
    }
    ssh_session s = core->session;
    core->disconnected = true; // nothing to disconnect until ssh_connect succeeds

    auto optSet = [&](enum ssh_options_e opt, const void* val, const char* what) {
        if (ssh_options_set(s, opt, val) != SSH_OK) {
            qWarning().noquote() << QString("[SSH] ssh_options_set(%1) failed: %2")
                                    .arg(QString::fromLatin1(what), libsshError(s));
        }
    };

    const QByteArray hostUtf8 = host.toUtf8();
    const QByteArray userUtf8 = user.toUtf8();
    const int port = o.port;
    const long timeoutSec = o.timeoutSec;

    optSet(SSH_OPTIONS_HOST, hostUtf8.constData(), "HOST");
    optSet(SSH_OPTIONS_USER, userUtf8.constData(), "USER");
    optSet(SSH_OPTIONS_PORT, &port, "PORT");
    optSet(SSH_OPTIONS_TIMEOUT, &timeoutSec, "TIMEOUT");

    if (!o.knownHostsPath.trimmed().isEmpty()) {
        const QByteArray kh = QFile::encodeName(expandTilde(o.knownHostsPath.trimmed()));
        optSet(SSH_OPTIONS_KNOWNHOSTS, kh.constData(), "KNOWNHOSTS");
    }

    qInfo().noquote() << QString("[SSH] connect user='%1' host='%2' port=%3").arg(user, host).arg(port);

    QMutexLocker lock(&core->mutex);

    if (ssh_connect(s) != SSH_OK) {
        const QString e = libsshError(s);
        const bool timedOut = e.contains("timeout", Qt::CaseInsensitive)
                           || e.contains("timed out", Qt::CaseInsensitive);
        setError(code, err, timedOut ? ConnectError::Timeout : ConnectError::NetworkUnreachable, e);
        qWarning().noquote() << QString("[SSH] ssh_connect failed host='%1': %2").arg(host, e);
        return nullptr;
    }
    core->disconnected = false;

    if (!verifyHostKey(s, o.strictHostKeys, host, code, err))
        return nullptr;

    if (onAuthenticating) {
        lock.unlock();
        onAuthenticating();
        lock.relock();
    }

    int rc = SSH_AUTH_DENIED;
    if (auth.kind == CredentialKind::Password) {
        QByteArray pw = auth.password.toUtf8();
        rc = ssh_userauth_password(s, nullptr, pw.constData());
        pw.fill('\0');
    } else {
        auto* k = dynamic_cast<const LibsshPrivateKey*>(auth.key.get());
        if (!k || !k->key) {
            setError(code, err, ConnectError::KeyUnreadable);
            return nullptr;
        }
        rc = ssh_userauth_publickey(s, nullptr, k->key);
    }

    if (rc != SSH_AUTH_SUCCESS) {
        const QString e = libsshError(s);
        setError(code, err, rc == SSH_AUTH_ERROR ? ConnectError::NetworkUnreachable
                                                 : ConnectError::AuthRejected, e);
        qWarning().noquote() << QString("[SSH] auth FAILED user='%1' host='%2' err='%3'").arg(user, host, e);
        return nullptr;
    }

    qInfo().noquote() << QString("[SSH] auth OK user='%1' host='%2'").arg(user, host);
    lock.unlock();
    return std::unique_ptr<SshConnection>(new LibsshConnection(core, o.termType));
}
