#pragma once

#include <QByteArray>
#include <QFuture>
#include <QMap>
#include <QMutex>
#include <QObject>
#include <QString>
#include <QVector>
#include <QWaitCondition>

#include <functional>
#include <memory>

#include "SessionTypes.h"
#include "SshBackend.h"
#include "../CancellationToken.h"
#include "../ErrorTypes.h"
#include "../Vault/ConnectionRecord.h"

class ConnectionStore;
class SessionManager;
struct SessionSlot;

struct SessionOptions
{
    int     connectTimeoutSec = 15;
    bool    strictHostKeys    = false;
    QString knownHostsPath;              // empty => ~/.ssh/known_hosts
    QString termType          = "xterm-256color";
};

enum class LeasePurpose {
    Transfer,   // session shows Transferring while held
    Browse
};

// Exclusive loan of a session's SFTP channel. Returned on destruction.
// The token is cancelled when the owning session is closed.
class SftpLease
{
public:
    ~SftpLease();

    SftpLease(const SftpLease&) = delete;
    SftpLease& operator=(const SftpLease&) = delete;

    SftpChannel* sftp() const;
    int sessionId() const { return m_sessionId; }
    const CancellationTokenPtr& token() const { return m_token; }

private:
    friend class SessionManager;
    SftpLease(SessionManager* mgr, std::shared_ptr<SessionSlot> slot, CancellationTokenPtr token);

    SessionManager*              m_mgr = nullptr;
    std::shared_ptr<SessionSlot> m_slot;
    CancellationTokenPtr         m_token;
    int                          m_sessionId = -1;
};

using SftpLeasePtr = std::unique_ptr<SftpLease>;

/*
    SessionManager
    --------------
    Owns every live session (tab): its authenticated connection, at most one
    PTY channel with its TerminalPump, and the lazily opened SFTP channel.

    - Sessions live in an arena keyed by a stable int id, in open order.
    - connectTo() / closeSession() return immediately; the network work runs
      on the global QThreadPool (QtConcurrent::run).
    - Keystrokes go only to the foreground session.
    - Signals are emitted from whichever thread made the change (pool
      threads, pump threads); connect with Qt::AutoConnection from GUI code.

    Backend and store are borrowed and must outlive the manager.
*/
class SessionManager : public QObject
{
    Q_OBJECT
public:
    explicit SessionManager(SshBackend* backend,
                            ConnectionStore* store = nullptr,
                            QObject* parent = nullptr);
    ~SessionManager() override;

    void setOptions(const SessionOptions& options);
    SessionOptions options() const;

    // ---- lifecycle ----
    // New session id; progress is reported via sessionStateChanged.
    int connectTo(const ConnectionRecord& record);
    int connectTo(const ConnectionRecord& record, const Credential& credential);

    // Authenticate and disconnect right away. Blocking; no session, no store update.
    bool tryConnect(const ConnectionRecord& record, ConnectError* code = nullptr, QString* err = nullptr);

    // Closes `sessionId` and connects a new session for the same record.
    int reconnect(int sessionId, ChannelError* code = nullptr, QString* err = nullptr);

    // Async: cancel transfer, wait for the lease, close channels, disconnect.
    // Always ends in Closed and sessionRemoved.
    void closeSession(int sessionId);

    // Closes every session and waits for all background work.
    void shutdown();

    // ---- terminal ----
    bool openTerminal(int sessionId, int cols, int rows, ChannelError* code = nullptr, QString* err = nullptr);
    bool closeTerminal(int sessionId, ChannelError* code = nullptr, QString* err = nullptr);
    // Window-change for the session's PTY. False when no terminal is open.
    bool resize(int sessionId, int cols, int rows);

    // Queues bytes for the foreground session's terminal.
    bool sendKeys(const QByteArray& bytes, ChannelError* code = nullptr, QString* err = nullptr);

    // ---- tabs ----
    bool setForeground(int sessionId);
    int  foreground() const;
    int  cycleForeground(int delta);

    QVector<int> sessionIds() const;
    bool hasSession(int sessionId) const;
    bool sessionInfo(int sessionId, SessionInfo* out) const;
    SessionState state(int sessionId) const;   // Closed for unknown ids

    // ---- sftp ----
    SftpLeasePtr acquireSftp(int sessionId,
                             CancellationTokenPtr token,
                             LeasePurpose purpose,
                             TransferError* code = nullptr,
                             QString* err = nullptr);

signals:
    void sessionAdded(int sessionId);
    void sessionStateChanged(int sessionId, SessionState state);
    void terminalOutput(int sessionId, const QByteArray& bytes);
    void sessionFailed(int sessionId, const QString& errorKey, const QString& message);
    void foregroundChanged(int sessionId);
    void sessionRemoved(int sessionId);

private:
    friend class SftpLease;
    using Emits = QVector<std::function<void()>>;

    void runConnect(std::shared_ptr<SessionSlot> slot);
    void teardown(std::shared_ptr<SessionSlot> slot);
    void releaseSftp(SessionSlot* slot);
    void onPumpFinished(const void* pump, int sessionId, ChannelError reason, const QString& message);

    std::shared_ptr<SessionSlot> findLocked(int sessionId) const;
    bool transitionLocked(SessionSlot& s, SessionState to, Emits* emits);
    void refreshSteadyStateLocked(SessionSlot& s, Emits* emits);
    void failLocked(SessionSlot& s, const QString& key, const QString& message, Emits* emits);
    void setForegroundLocked(int sessionId, Emits* emits);
    void trackTaskLocked(const QFuture<void>& f);

    static void flush(const Emits& emits);

    SshBackend*      m_backend = nullptr;
    ConnectionStore* m_store = nullptr;

    mutable QMutex   m_mutex;
    QWaitCondition   m_cond;        // lease returned / pty open finished

    SessionOptions   m_options;
    QMap<int, std::shared_ptr<SessionSlot>> m_sessions;
    QVector<int>     m_order;
    int              m_nextId = 1;
    int              m_foreground = -1;
    QVector<QFuture<void>> m_tasks; // close tasks (connect tasks live in their slot)
};
