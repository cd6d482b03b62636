// SessionManager.cpp
//
// Locking rules
// -------------
// - m_mutex guards the arena and every SessionSlot field.
// - No network I/O and no signal emission while holding m_mutex. State
//   changes collect their signals in an Emits list that is flushed after
//   unlocking, so a slot may call straight back into the manager.
// - Pumps are joined only outside m_mutex (their finished handler locks it).
//
// Teardown order for one session:
//   cancel lease token -> wait for lease + in-flight PTY open -> stop pump
//   (closes PTY) -> close SFTP -> disconnect -> Closed -> remove from arena

#include "SessionManager.h"
#include "TerminalPump.h"

#include "../AuditLogger.h"
#include "../Vault/ConnectionStore.h"

#include <QDebug>
#include <QJsonObject>
#include <QMutexLocker>
#include <QtConcurrent/QtConcurrent>

// -----------------------------
// Per-session state (arena slot)
// -----------------------------
struct SessionSlot
{
    int              id = -1;
    ConnectionRecord record;
    Credential       credential;
    QDateTime        openedAt;

    SessionState     state = SessionState::Idle;
    QString          lastError;
    bool             closing = false;

    std::unique_ptr<SshConnection> conn;

    std::unique_ptr<TerminalPump>  pump;
    bool             terminalOpen = false;
    bool             ptyOpening = false;

    std::unique_ptr<SftpChannel>   sftp;
    bool             sftpLeased = false;
    LeasePurpose     leasePurpose = LeasePurpose::Browse;
    CancellationTokenPtr leaseToken;

    QFuture<void>    connectTask;
};

// ===========================================================================
// SftpLease
// ===========================================================================

SftpLease::SftpLease(SessionManager* mgr, std::shared_ptr<SessionSlot> slot, CancellationTokenPtr token)
    : m_mgr(mgr)
    , m_slot(std::move(slot))
    , m_token(std::move(token))
    , m_sessionId(m_slot ? m_slot->id : -1)
{
}

SftpLease::~SftpLease()
{
    if (m_mgr && m_slot)
        m_mgr->releaseSftp(m_slot.get());
}

SftpChannel* SftpLease::sftp() const
{
    // The channel is only replaced/closed after the lease is returned.
    return m_slot ? m_slot->sftp.get() : nullptr;
}

// ===========================================================================
// Construction
// ===========================================================================

SessionManager::SessionManager(SshBackend* backend, ConnectionStore* store, QObject* parent)
    : QObject(parent)
    , m_backend(backend)
    , m_store(store)
{
    qRegisterMetaType<SessionState>("SessionState");
    qRegisterMetaType<ChannelError>("ChannelError");
}

SessionManager::~SessionManager()
{
    shutdown();
}

void SessionManager::setOptions(const SessionOptions& options)
{
    QMutexLocker lock(&m_mutex);
    m_options = options;
}

SessionOptions SessionManager::options() const
{
    QMutexLocker lock(&m_mutex);
    return m_options;
}

// ===========================================================================
// Helpers (m_mutex held unless noted)
// ===========================================================================

void SessionManager::flush(const Emits& emits)
{
    for (const auto& e : emits)
        e();
}

std::shared_ptr<SessionSlot> SessionManager::findLocked(int sessionId) const
{
    auto it = m_sessions.constFind(sessionId);
    return (it == m_sessions.constEnd()) ? nullptr : it.value();
}

bool SessionManager::transitionLocked(SessionSlot& s, SessionState to, Emits* emits)
{
    if (!SessionStateMachine::canTransition(s.state, to)) {
        if (s.state != to) {
            qWarning().noquote() << QString("[SESSION] %1: refused transition %2 -> %3")
                                    .arg(s.id).arg(sessionStateName(s.state), sessionStateName(to));
        }
        return false;
    }

    const SessionState from = s.state;
    s.state = to;

    qInfo().noquote() << QString("[SESSION] %1 %2 -> %3")
                         .arg(s.id).arg(sessionStateName(from), sessionStateName(to));

    QJsonObject f;
    f["session_id"] = s.id;
    f["record_id"]  = s.record.id;
    f["from"]       = sessionStateName(from);
    f["to"]         = sessionStateName(to);
    AuditLogger::writeEvent("session_state", f);

    const int id = s.id;
    emits->push_back([this, id, to] { emit sessionStateChanged(id, to); });
    return true;
}

void SessionManager::refreshSteadyStateLocked(SessionSlot& s, Emits* emits)
{
    if (s.closing || !SessionStateMachine::acceptsChannels(s.state))
        return;

    SessionState want = SessionState::Ready;
    if (s.sftpLeased && s.leasePurpose == LeasePurpose::Transfer)
        want = SessionState::Transferring;
    else if (s.terminalOpen)
        want = SessionState::Terminal;

    if (want != s.state)
        transitionLocked(s, want, emits);
}

void SessionManager::failLocked(SessionSlot& s, const QString& key, const QString& message, Emits* emits)
{
    s.lastError = message;
    if (!transitionLocked(s, SessionState::Failed, emits))
        return;

    const int id = s.id;
    emits->push_back([this, id, key, message] { emit sessionFailed(id, key, message); });
}

void SessionManager::setForegroundLocked(int sessionId, Emits* emits)
{
    if (m_foreground == sessionId)
        return;
    m_foreground = sessionId;
    emits->push_back([this, sessionId] { emit foregroundChanged(sessionId); });
}

void SessionManager::trackTaskLocked(const QFuture<void>& f)
{
    for (int i = m_tasks.size() - 1; i >= 0; --i) {
        if (m_tasks[i].isFinished())
            m_tasks.removeAt(i);
    }
    m_tasks.push_back(f);
}

static SshConnectOptions makeConnectOptions(const SessionOptions& o, const ConnectionRecord& r)
{
    SshConnectOptions c;
    c.host           = r.host;
    c.port           = r.port;
    c.user           = r.user;
    c.timeoutSec     = o.connectTimeoutSec;
    c.strictHostKeys = o.strictHostKeys;
    c.knownHostsPath = o.knownHostsPath;
    c.termType       = o.termType;
    return c;
}

static void auditConnectAttempt(const char* event, const ConnectionRecord& r, bool ok, ConnectError code)
{
    QJsonObject f;
    f["record_id"] = r.id;
    f["host"]      = r.host;
    f["port"]      = r.port;
    f["user"]      = r.user;
    f["auth"]      = credentialKindToString(r.credential.kind);
    f["ok"]        = ok;
    if (!ok) f["error"] = errorKey(code);
    AuditLogger::writeEvent(event, f);
}

// ===========================================================================
// Connect
// ===========================================================================

int SessionManager::connectTo(const ConnectionRecord& record)
{
    return connectTo(record, record.credential);
}

int SessionManager::connectTo(const ConnectionRecord& record, const Credential& credential)
{
    Emits emits;
    int id = -1;
    {
        QMutexLocker lock(&m_mutex);

        auto slot = std::make_shared<SessionSlot>();
        slot->id = id = m_nextId++;
        slot->record = record;
        slot->credential = credential;
        slot->openedAt = QDateTime::currentDateTimeUtc();

        m_sessions.insert(id, slot);
        m_order.push_back(id);

        emits.push_back([this, id] { emit sessionAdded(id); });
        if (m_foreground < 0)
            setForegroundLocked(id, &emits);

        transitionLocked(*slot, SessionState::Connecting, &emits);

        slot->connectTask = QtConcurrent::run([this, slot] { runConnect(slot); });
    }
    flush(emits);
    return id;
}

void SessionManager::runConnect(std::shared_ptr<SessionSlot> slot)
{
    ConnectError code = ConnectError::None;
    QString msg;

    SessionOptions opts;
    {
        QMutexLocker lock(&m_mutex);
        opts = m_options;
    }

    SshAuth auth;
    auth.kind = slot->credential.kind;
    bool ok = true;

    if (auth.kind == CredentialKind::PrivateKey) {
        auth.key = m_backend->loadPrivateKey(slot->credential.keyPath, slot->credential.passphrase, &code, &msg);
        ok = (auth.key != nullptr);
    } else {
        auth.password = slot->credential.password;
    }

    std::unique_ptr<SshConnection> conn;
    if (ok) {
        auto onAuth = [this, slot] {
            Emits emits;
            {
                QMutexLocker lock(&m_mutex);
                if (!slot->closing)
                    transitionLocked(*slot, SessionState::Authenticating, &emits);
            }
            flush(emits);
        };
        conn = m_backend->open(makeConnectOptions(opts, slot->record), auth, onAuth, &code, &msg);
        ok = (conn != nullptr);
    }

    Emits emits;
    {
        QMutexLocker lock(&m_mutex);
        slot->conn = std::move(conn);

        if (!slot->closing) {
            if (ok) {
                if (slot->state == SessionState::Connecting)
                    transitionLocked(*slot, SessionState::Authenticating, &emits);
                transitionLocked(*slot, SessionState::Ready, &emits);
            } else {
                qWarning().noquote() << QString("[SESSION] %1 connect to %2 failed: %3")
                                        .arg(slot->id).arg(slot->record.target(), msg);
                failLocked(*slot, errorKey(code), errorMessage(code), &emits);
            }
        }
        m_cond.wakeAll();
    }
    flush(emits);

    auditConnectAttempt("connect_attempt", slot->record, ok, code);

    if (m_store && slot->record.id > 0 && m_store->isUnlocked()) {
        StoreError serr = StoreError::None;
        QString smsg;
        const bool stored = ok ? m_store->recordUsed(slot->record.id, &serr, &smsg)
                               : m_store->recordFailure(slot->record.id, &serr, &smsg);
        if (!stored && serr != StoreError::NotFound)
            qWarning().noquote() << QString("[SESSION] could not update history: %1").arg(smsg);
    }
}

bool SessionManager::tryConnect(const ConnectionRecord& record, ConnectError* code, QString* err)
{
    if (code) *code = ConnectError::None;

    SshAuth auth;
    auth.kind = record.credential.kind;
    if (auth.kind == CredentialKind::PrivateKey) {
        auth.key = m_backend->loadPrivateKey(record.credential.keyPath, record.credential.passphrase, code, err);
        if (!auth.key) {
            auditConnectAttempt("connect_test", record, false, ConnectError::KeyUnreadable);
            return false;
        }
    } else {
        auth.password = record.credential.password;
    }

    ConnectError c = ConnectError::None;
    QString detail;
    std::unique_ptr<SshConnection> conn =
        m_backend->open(makeConnectOptions(options(), record), auth, nullptr, &c, &detail);

    auditConnectAttempt("connect_test", record, conn != nullptr, c);

    if (!conn) {
        qInfo().noquote() << QString("[SESSION] test connection to %1 failed: %2").arg(record.target(), detail);
        setError(code, err, c);
        return false;
    }

    conn->close();
    qInfo().noquote() << QString("[SESSION] test connection to %1 OK").arg(record.target());
    return true;
}

int SessionManager::reconnect(int sessionId, ChannelError* code, QString* err)
{
    ConnectionRecord record;
    Credential credential;
    {
        QMutexLocker lock(&m_mutex);
        auto slot = findLocked(sessionId);
        if (!slot) {
            setError(code, err, ChannelError::NoSuchSession);
            return -1;
        }
        record = slot->record;
        credential = slot->credential;
    }

    closeSession(sessionId);
    if (code) *code = ChannelError::None;
    return connectTo(record, credential);
}

// ===========================================================================
// Close
// ===========================================================================

void SessionManager::closeSession(int sessionId)
{
    QMutexLocker lock(&m_mutex);
    auto slot = findLocked(sessionId);
    if (!slot || slot->closing)
        return;

    slot->closing = true;
    if (slot->leaseToken)
        slot->leaseToken->cancel();

    qInfo().noquote() << QString("[SESSION] %1 close requested").arg(sessionId);
    trackTaskLocked(QtConcurrent::run([this, slot] { teardown(slot); }));
}

void SessionManager::teardown(std::shared_ptr<SessionSlot> slot)
{
    // A connect still in flight finishes first; its result lands in slot->conn.
    QFuture<void> connectTask;
    {
        QMutexLocker lock(&m_mutex);
        connectTask = slot->connectTask;
    }
    connectTask.waitForFinished();

    Emits emits;
    std::unique_ptr<TerminalPump>  pump;
    std::unique_ptr<SftpChannel>   sftp;
    std::unique_ptr<SshConnection> conn;
    {
        QMutexLocker lock(&m_mutex);

        if (slot->state != SessionState::Failed)
            transitionLocked(*slot, SessionState::Closing, &emits);

        if (slot->leaseToken)
            slot->leaseToken->cancel();

        while (slot->sftpLeased || slot->ptyOpening)
            m_cond.wait(&m_mutex);

        pump = std::move(slot->pump);
        slot->terminalOpen = false;
        sftp = std::move(slot->sftp);
        conn = std::move(slot->conn);
    }
    flush(emits);
    emits.clear();

    // Teardown I/O failures are logged by the backend and never block Closed.
    pump.reset();
    if (sftp) {
        sftp->close();
        sftp.reset();
    }
    if (conn) {
        conn->close();
        conn.reset();
    }

    {
        QMutexLocker lock(&m_mutex);
        transitionLocked(*slot, SessionState::Closed, &emits);

        m_sessions.remove(slot->id);
        m_order.removeAll(slot->id);
        if (m_foreground == slot->id)
            setForegroundLocked(m_order.isEmpty() ? -1 : m_order.first(), &emits);

        const int id = slot->id;
        emits.push_back([this, id] { emit sessionRemoved(id); });
    }
    flush(emits);
}

void SessionManager::shutdown()
{
    for (int id : sessionIds())
        closeSession(id);

    // Close tasks may still be queued; wait until none are left.
    for (;;) {
        QVector<QFuture<void>> tasks;
        {
            QMutexLocker lock(&m_mutex);
            tasks.swap(m_tasks);
        }
        if (tasks.isEmpty())
            break;
        for (QFuture<void>& f : tasks)
            f.waitForFinished();
    }
}

// ===========================================================================
// Terminal
// ===========================================================================

bool SessionManager::openTerminal(int sessionId, int cols, int rows, ChannelError* code, QString* err)
{
    SshConnection* conn = nullptr;
    std::unique_ptr<TerminalPump> stalePump;
    {
        QMutexLocker lock(&m_mutex);
        auto slot = findLocked(sessionId);
        if (!slot) {
            setError(code, err, ChannelError::NoSuchSession);
            return false;
        }
        if (slot->closing || !SessionStateMachine::acceptsChannels(slot->state) || !slot->conn) {
            setError(code, err, ChannelError::NotReady);
            return false;
        }
        if (slot->terminalOpen || slot->ptyOpening) {
            setError(code, err, ChannelError::ChannelBusy);
            return false;
        }

        slot->ptyOpening = true;
        stalePump = std::move(slot->pump);   // finished earlier (remote EOF)
        conn = slot->conn.get();
    }
    stalePump.reset();

    ChannelError c = ChannelError::None;
    QString detail;
    std::unique_ptr<SshChannel> channel = conn->openPty(cols, rows, &c, &detail);

    Emits emits;
    TerminalPump* started = nullptr;
    {
        QMutexLocker lock(&m_mutex);
        auto slot = findLocked(sessionId);
        // The slot cannot disappear while ptyOpening is set (teardown waits on it).
        slot->ptyOpening = false;
        m_cond.wakeAll();

        if (!channel) {
            qWarning().noquote() << QString("[SESSION] %1 PTY open failed: %2").arg(sessionId).arg(detail);
            setError(code, err, c == ChannelError::None ? ChannelError::IoError : c, detail);
            return false;
        }
        if (slot->closing) {
            channel->close();
            setError(code, err, ChannelError::NotReady);
            return false;
        }

        auto pump = std::make_unique<TerminalPump>(sessionId, std::move(channel));
        TerminalPump* p = pump.get();
        QObject::connect(p, &TerminalPump::output, this, &SessionManager::terminalOutput, Qt::DirectConnection);
        QObject::connect(p, &TerminalPump::finished, this,
                         [this, p](int id, ChannelError reason, const QString& message) {
                             onPumpFinished(p, id, reason, message);
                         },
                         Qt::DirectConnection);

        slot->pump = std::move(pump);
        slot->terminalOpen = true;
        refreshSteadyStateLocked(*slot, &emits);
        started = p;
        started->start();
    }
    flush(emits);

    qInfo().noquote() << QString("[SESSION] %1 terminal open %2x%3").arg(sessionId).arg(cols).arg(rows);
    if (code) *code = ChannelError::None;
    return true;
}

void SessionManager::onPumpFinished(const void* pump, int sessionId, ChannelError reason, const QString& message)
{
    // Runs on the pump thread.
    Emits emits;
    {
        QMutexLocker lock(&m_mutex);
        auto slot = findLocked(sessionId);
        if (!slot || slot->pump.get() != pump || !slot->terminalOpen)
            return;  // stopped locally (closeTerminal / teardown)

        slot->terminalOpen = false;

        if (reason == ChannelError::IoError) {
            qWarning().noquote() << QString("[SESSION] %1 terminal I/O error: %2").arg(sessionId).arg(message);
            if (!slot->closing)
                failLocked(*slot, errorKey(ChannelError::IoError),
                           message.isEmpty() ? errorMessage(ChannelError::IoError) : message, &emits);
        } else {
            qInfo().noquote() << QString("[SESSION] %1 remote closed the terminal").arg(sessionId);
            refreshSteadyStateLocked(*slot, &emits);
        }
    }
    flush(emits);
}

bool SessionManager::closeTerminal(int sessionId, ChannelError* code, QString* err)
{
    Emits emits;
    std::unique_ptr<TerminalPump> pump;
    {
        QMutexLocker lock(&m_mutex);
        auto slot = findLocked(sessionId);
        if (!slot) {
            setError(code, err, ChannelError::NoSuchSession);
            return false;
        }
        if (!slot->terminalOpen) {
            setError(code, err, ChannelError::NotReady);
            return false;
        }

        pump = std::move(slot->pump);
        slot->terminalOpen = false;
        refreshSteadyStateLocked(*slot, &emits);
    }
    pump.reset();
    flush(emits);

    if (code) *code = ChannelError::None;
    return true;
}

bool SessionManager::resize(int sessionId, int cols, int rows)
{
    QMutexLocker lock(&m_mutex);
    auto slot = findLocked(sessionId);
    if (!slot || !slot->terminalOpen || !slot->pump)
        return false;  // no terminal, nothing to resize

    // Only records the size; the pump thread talks to the channel.
    return slot->pump->resize(cols, rows);
}

bool SessionManager::sendKeys(const QByteArray& bytes, ChannelError* code, QString* err)
{
    QMutexLocker lock(&m_mutex);
    auto slot = findLocked(m_foreground);
    if (!slot) {
        setError(code, err, ChannelError::NoSuchSession);
        return false;
    }
    if (!slot->terminalOpen || !slot->pump) {
        setError(code, err, ChannelError::NotReady);
        return false;
    }

    slot->pump->enqueue(bytes);
    if (code) *code = ChannelError::None;
    return true;
}

// ===========================================================================
// Tabs
// ===========================================================================

bool SessionManager::setForeground(int sessionId)
{
    Emits emits;
    {
        QMutexLocker lock(&m_mutex);
        if (!findLocked(sessionId))
            return false;
        setForegroundLocked(sessionId, &emits);
    }
    flush(emits);
    return true;
}

int SessionManager::foreground() const
{
    QMutexLocker lock(&m_mutex);
    return m_foreground;
}

int SessionManager::cycleForeground(int delta)
{
    Emits emits;
    int next = -1;
    {
        QMutexLocker lock(&m_mutex);
        if (m_order.isEmpty())
            return -1;

        const int n = m_order.size();
        int idx = m_order.indexOf(m_foreground);
        if (idx < 0) idx = 0;
        idx = ((idx + delta) % n + n) % n;

        next = m_order[idx];
        setForegroundLocked(next, &emits);
    }
    flush(emits);
    return next;
}

QVector<int> SessionManager::sessionIds() const
{
    QMutexLocker lock(&m_mutex);
    return m_order;
}

bool SessionManager::hasSession(int sessionId) const
{
    QMutexLocker lock(&m_mutex);
    return findLocked(sessionId) != nullptr;
}

bool SessionManager::sessionInfo(int sessionId, SessionInfo* out) const
{
    QMutexLocker lock(&m_mutex);
    auto slot = findLocked(sessionId);
    if (!slot)
        return false;

    if (out) {
        out->id           = slot->id;
        out->recordId     = slot->record.id;
        out->label        = slot->record.label();
        out->target       = slot->record.target();
        out->state        = slot->state;
        out->terminalOpen = slot->terminalOpen;
        out->sftpLeased   = slot->sftpLeased;
        out->lastError    = slot->lastError;
        out->openedAt     = slot->openedAt;
    }
    return true;
}

SessionState SessionManager::state(int sessionId) const
{
    QMutexLocker lock(&m_mutex);
    auto slot = findLocked(sessionId);
    return slot ? slot->state : SessionState::Closed;
}

// ===========================================================================
// SFTP lending
// ===========================================================================

SftpLeasePtr SessionManager::acquireSftp(int sessionId,
                                         CancellationTokenPtr token,
                                         LeasePurpose purpose,
                                         TransferError* code,
                                         QString* err)
{
    if (!token)
        token = std::make_shared<CancellationToken>();

    std::shared_ptr<SessionSlot> slot;
    SshConnection* conn = nullptr;
    bool needOpen = false;
    {
        QMutexLocker lock(&m_mutex);
        slot = findLocked(sessionId);
        if (!slot) {
            setError(code, err, TransferError::InvalidRequest, errorMessage(ChannelError::NoSuchSession));
            return nullptr;
        }
        if (slot->closing || !SessionStateMachine::acceptsChannels(slot->state) || !slot->conn) {
            setError(code, err, TransferError::InvalidRequest, errorMessage(ChannelError::NotReady));
            return nullptr;
        }
        if (slot->sftpLeased) {
            setError(code, err, TransferError::SessionBusy);
            return nullptr;
        }

        slot->sftpLeased   = true;
        slot->leasePurpose = purpose;
        slot->leaseToken   = token;
        needOpen = !slot->sftp;
        conn = slot->conn.get();
    }

    if (needOpen) {
        TransferError c = TransferError::None;
        QString detail;
        std::unique_ptr<SftpChannel> ch = conn->openSftp(&c, &detail);

        QMutexLocker lock(&m_mutex);
        if (!ch) {
            slot->sftpLeased = false;
            slot->leaseToken.reset();
            m_cond.wakeAll();
            qWarning().noquote() << QString("[SESSION] %1 SFTP open failed: %2").arg(sessionId).arg(detail);
            setError(code, err, c == TransferError::None ? TransferError::IoError : c, detail);
            return nullptr;
        }
        slot->sftp = std::move(ch);
    }

    Emits emits;
    {
        QMutexLocker lock(&m_mutex);
        refreshSteadyStateLocked(*slot, &emits);
    }
    flush(emits);

    if (code) *code = TransferError::None;
    return SftpLeasePtr(new SftpLease(this, slot, token));
}

void SessionManager::releaseSftp(SessionSlot* slot)
{
    Emits emits;
    {
        QMutexLocker lock(&m_mutex);
        slot->sftpLeased = false;
        slot->leaseToken.reset();
        refreshSteadyStateLocked(*slot, &emits);
        m_cond.wakeAll();
    }
    flush(emits);
}
