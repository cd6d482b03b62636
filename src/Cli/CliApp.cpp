// CliApp.cpp
#include "CliApp.h"
#include "PasswordPrompt.h"

#include "../Session/LibsshBackend.h"
#include "../Session/SessionManager.h"
#include "../Transfer/DirectoryBrowser.h"
#include "../Transfer/TransferEngine.h"
#include "../Transfer/TransferWizard.h"
#include "../Vault/ConnectionStore.h"
#include "../Vault/CryptoVault.h"
#include "../Vault/IdleLock.h"
#include "../Vault/VaultCrypto.h"

#include <QDebug>
#include <QEventLoop>
#include <QFileInfo>
#include <QSocketNotifier>
#include <QTextStream>
#include <QTimer>

#include <atomic>
#include <csignal>
#include <cstdio>

#include <sys/ioctl.h>
#include <unistd.h>

namespace {

std::atomic<bool> g_interrupted { false };

void onSigInt(int)
{
    g_interrupted.store(true);
}

// Installs the Ctrl-C flag handler for one command, restores the old one after.
class InterruptScope
{
public:
    InterruptScope()
    {
        g_interrupted.store(false);
        m_prev = std::signal(SIGINT, onSigInt);
    }
    ~InterruptScope() { std::signal(SIGINT, m_prev); }

    InterruptScope(const InterruptScope&) = delete;
    InterruptScope& operator=(const InterruptScope&) = delete;

private:
    void (*m_prev)(int) = SIG_DFL;
};

QTextStream& out()
{
    static QTextStream s(stdout);
    return s;
}

QTextStream& errOut()
{
    static QTextStream s(stderr);
    return s;
}

// One line from stdin; null on EOF.
QString readLine(const QString& prompt)
{
    static QTextStream in(stdin);
    out() << prompt << Qt::flush;
    return in.readLine();
}

bool parseId(const QString& s, int* id)
{
    bool ok = false;
    const int v = s.toInt(&ok);
    if (!ok || v <= 0) {
        errOut() << "Invalid connection id: " << s << Qt::endl;
        return false;
    }
    *id = v;
    return true;
}

void terminalSize(int* cols, int* rows)
{
    *cols = 80;
    *rows = 24;

    winsize ws {};
    if (isatty(STDOUT_FILENO) && ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0 && ws.ws_row > 0) {
        *cols = ws.ws_col;
        *rows = ws.ws_row;
    }
}

QString lastResult(const ConnectionRecord& r)
{
    if (r.history.isEmpty())
        return QStringLiteral("-");
    return r.history.last().success ? QStringLiteral("ok") : QStringLiteral("failed");
}

} // namespace

// ===========================================================================
// Setup
// ===========================================================================
CliApp::CliApp(const AppSettings& settings, QObject* parent)
    : QObject(parent)
    , m_settings(settings)
{
    m_vault.reset(new CryptoVault(settings.effectiveVaultPath(),
                                  VaultKdfParams::fromProfileName(settings.kdfProfile)));
    m_store.reset(new ConnectionStore(m_vault.get()));
    m_backend.reset(new LibsshBackend());
    m_sessions.reset(new SessionManager(m_backend.get(), m_store.get()));
    m_transfers.reset(new TransferEngine(m_sessions.get(), m_store.get()));

    SessionOptions so;
    so.connectTimeoutSec = settings.connectTimeoutSec;
    so.strictHostKeys    = settings.strictHostKeys();
    so.termType          = settings.termType;
    m_sessions->setOptions(so);

    m_transfers->setChunkSize(settings.chunkSize);
    m_transfers->setProgressIntervalMs(settings.progressIntervalMs);

    m_idle = new IdleLock(m_store.get(), settings.idleLockMinutes, this);
    connect(m_idle, &IdleLock::idleLocked, this, [] {
        errOut() << "\n[vault locked after inactivity]" << Qt::endl;
    });
}

CliApp::~CliApp()
{
    closeAll();
    m_store->lock();
}

QStringList CliApp::commands()
{
    return { "init", "list", "add", "edit", "remove", "passwd",
             "test", "shell", "ls", "upload", "download" };
}

void CliApp::closeAll()
{
    if (m_transfers) {
        m_transfers->cancelAll();
        m_transfers->waitForAll();
    }
    if (m_sessions)
        m_sessions->shutdown();
}

int CliApp::run(const QString& command, const QStringList& args, const CliRecordOptions& options)
{
    qInfo().noquote() << QString("[CLI] command '%1'").arg(command);

    auto need = [&](int n) {
        if (args.size() == n)
            return true;
        errOut() << "Wrong number of arguments for '" << command << "'" << Qt::endl;
        return false;
    };

    int id = -1;

    if (command == "init")
        return need(0) ? cmdInit() : ExitUsage;

    if (command == "passwd")
        return need(0) ? cmdPasswd() : ExitUsage;

    if (!m_store->vaultExists()) {
        errOut() << "No vault at " << m_vault->filePath() << " (run 'tabssh init' first)" << Qt::endl;
        return ExitFailure;
    }

    if (command == "list")
        return need(0) ? cmdList() : ExitUsage;

    if (command == "add")
        return need(0) ? cmdAdd(options) : ExitUsage;

    if (command == "edit")
        return (need(1) && parseId(args.at(0), &id)) ? cmdEdit(id, options) : ExitUsage;

    if (command == "remove")
        return (need(1) && parseId(args.at(0), &id)) ? cmdRemove(id) : ExitUsage;

    if (command == "test")
        return (need(1) && parseId(args.at(0), &id)) ? cmdTest(id) : ExitUsage;

    if (command == "shell")
        return (need(1) && parseId(args.at(0), &id)) ? cmdShell(id) : ExitUsage;

    if (command == "ls") {
        if (args.isEmpty() || args.size() > 2) {
            errOut() << "Usage: tabssh ls <id> [remoteDir]" << Qt::endl;
            return ExitUsage;
        }
        if (!parseId(args.at(0), &id))
            return ExitUsage;
        return cmdLs(id, args.value(1));
    }

    if (command == "upload" || command == "download") {
        if (!need(3) || !parseId(args.at(0), &id))
            return ExitUsage;
        const TransferDirection d = command == "upload" ? TransferDirection::Upload : TransferDirection::Download;
        return cmdTransfer(d, id, args.at(1), args.at(2));
    }

    errOut() << "Unknown command '" << command << "'. Commands: " << commands().join(", ") << Qt::endl;
    return ExitUsage;
}

// ===========================================================================
// Vault commands
// ===========================================================================
bool CliApp::unlockStore()
{
    if (m_store->isUnlocked())
        return true;

    const int attempts = PasswordPrompt::stdinIsTerminal() ? 3 : 1;
    for (int i = 0; i < attempts; ++i) {
        QString pw;
        if (!PasswordPrompt::read("Master password: ", &pw))
            return false;

        VaultError code = VaultError::None;
        QString err;
        if (m_store->unlock(pw, &code, &err)) {
            m_idle->touch();
            return true;
        }

        errOut() << err << Qt::endl;
        if (code != VaultError::WrongPassword)
            return false;
    }
    return false;
}

int CliApp::cmdInit()
{
    QString pw;
    QString err;
    if (!PasswordPrompt::readNew("New master password: ", &pw, &err)) {
        errOut() << err << Qt::endl;
        return ExitFailure;
    }

    VaultError code = VaultError::None;
    if (!m_store->initialize(pw, &code, &err)) {
        errOut() << err << Qt::endl;
        return ExitFailure;
    }

    out() << "Vault created at " << m_vault->filePath() << Qt::endl;
    return ExitOk;
}

int CliApp::cmdPasswd()
{
    if (!m_store->vaultExists()) {
        errOut() << "No vault at " << m_vault->filePath() << Qt::endl;
        return ExitFailure;
    }

    QString oldPw;
    QString newPw;
    QString err;
    if (!PasswordPrompt::read("Current master password: ", &oldPw))
        return ExitFailure;
    if (!PasswordPrompt::readNew("New master password: ", &newPw, &err)) {
        errOut() << err << Qt::endl;
        return ExitFailure;
    }

    if (!m_store->changePassword(oldPw, newPw, nullptr, &err)) {
        errOut() << err << Qt::endl;
        return ExitFailure;
    }

    out() << "Master password changed" << Qt::endl;
    return ExitOk;
}

int CliApp::cmdList()
{
    if (!unlockStore())
        return ExitFailure;

    const QVector<ConnectionRecord> records = m_store->list();
    if (records.isEmpty()) {
        out() << "No connections" << Qt::endl;
        return ExitOk;
    }

    for (const ConnectionRecord& r : records) {
        const QString used = r.lastUsedAt.isValid()
            ? r.lastUsedAt.toLocalTime().toString("yyyy-MM-dd HH:mm")
            : QStringLiteral("never");

        out() << QString("%1  %2  %3  [%4]  last used: %5  last: %6")
                     .arg(r.id, 3)
                     .arg(r.label(), -20)
                     .arg(r.target(), -32)
                     .arg(credentialKindToString(r.credential.kind))
                     .arg(used)
                     .arg(lastResult(r))
              << Qt::endl;
    }
    return ExitOk;
}

bool CliApp::promptCredential(ConnectionRecord* r, const CliRecordOptions& o, bool editing)
{
    QString keyPath = o.keyPath;

    // Offer key files other records already use.
    if (keyPath.isEmpty() && !editing && !o.passwordAuth && PasswordPrompt::stdinIsTerminal()) {
        const QStringList known = m_store->knownKeyPaths();
        if (!known.isEmpty()) {
            out() << "Known key files:" << Qt::endl;
            for (int i = 0; i < known.size(); ++i)
                out() << "  " << (i + 1) << ") " << known.at(i) << Qt::endl;

            const QString choice = readLine(QString("Key [1-%1], a path, or Enter for password: ").arg(known.size())).trimmed();
            bool isNumber = false;
            const int n = choice.toInt(&isNumber);
            if (isNumber) {
                if (n < 1 || n > known.size()) {
                    errOut() << "No key number " << choice << Qt::endl;
                    return false;
                }
                keyPath = known.at(n - 1);
            } else {
                keyPath = choice;
            }
        }
    }

    if (!keyPath.isEmpty()) {
        QString pass;
        if (!PasswordPrompt::read("Key passphrase (empty for none): ", &pass))
            return false;
        r->credential = Credential::withKey(keyPath, pass);
        return true;
    }

    if (o.passwordAuth || !editing) {
        QString pw;
        if (!PasswordPrompt::read(QString("Password for %1: ").arg(r->target()), &pw))
            return false;
        r->credential = Credential::withPassword(pw);
    }
    return true;
}

int CliApp::cmdAdd(const CliRecordOptions& o)
{
    if (o.host.isEmpty() || o.user.isEmpty()) {
        errOut() << "add needs --host and --user" << Qt::endl;
        return ExitUsage;
    }
    if (!unlockStore())
        return ExitFailure;

    ConnectionRecord r;
    r.host         = o.host;
    r.user         = o.user;
    r.port         = o.port > 0 ? o.port : 22;
    r.friendlyName = o.name;

    if (!promptCredential(&r, o, false))
        return ExitFailure;

    StoreError code = StoreError::None;
    QString err;
    const int id = m_store->add(r, &code, &err);
    if (id < 0) {
        errOut() << err << Qt::endl;
        return ExitFailure;
    }

    out() << "Added connection " << id << " (" << r.target() << ")" << Qt::endl;
    return ExitOk;
}

int CliApp::cmdEdit(int id, const CliRecordOptions& o)
{
    if (!unlockStore())
        return ExitFailure;

    ConnectionRecord r;
    if (!loadRecord(id, &r))
        return ExitFailure;

    if (!o.host.isEmpty()) r.host = o.host;
    if (!o.user.isEmpty()) r.user = o.user;
    if (o.port > 0)        r.port = o.port;
    if (!o.name.isNull())  r.friendlyName = o.name;

    if (!promptCredential(&r, o, true))
        return ExitFailure;

    QString err;
    if (!m_store->update(r, nullptr, &err)) {
        errOut() << err << Qt::endl;
        return ExitFailure;
    }

    out() << "Updated connection " << id << Qt::endl;
    return ExitOk;
}

int CliApp::cmdRemove(int id)
{
    if (!unlockStore())
        return ExitFailure;

    QString err;
    if (!m_store->remove(id, nullptr, &err)) {
        errOut() << err << Qt::endl;
        return ExitFailure;
    }

    out() << "Removed connection " << id << Qt::endl;
    return ExitOk;
}

bool CliApp::loadRecord(int id, ConnectionRecord* out)
{
    QString err;
    if (!m_store->get(id, out, nullptr, &err)) {
        errOut() << QString("Connection %1: %2").arg(id).arg(err) << Qt::endl;
        return false;
    }
    return true;
}

// ===========================================================================
// Session commands
// ===========================================================================
int CliApp::cmdTest(int id)
{
    if (!unlockStore())
        return ExitFailure;

    ConnectionRecord r;
    if (!loadRecord(id, &r))
        return ExitFailure;

    errOut() << "Testing " << r.target() << " ..." << Qt::endl;

    ConnectError code = ConnectError::None;
    QString err;
    if (!m_sessions->tryConnect(r, &code, &err)) {
        errOut() << "FAILED: " << err << Qt::endl;
        return ExitFailure;
    }

    out() << "OK" << Qt::endl;
    return ExitOk;
}

int CliApp::openSession(const ConnectionRecord& record)
{
    errOut() << "Connecting to " << record.target() << " ..." << Qt::endl;

    QEventLoop loop;
    QString failure;
    int sid = -1;

    connect(m_sessions.get(), &SessionManager::sessionFailed, &loop,
            [&](int id, const QString&, const QString& message) {
                if (id == sid) failure = message;
            });
    connect(m_sessions.get(), &SessionManager::sessionStateChanged, &loop,
            [&](int id, SessionState s) {
                if (id == sid && (s == SessionState::Ready || SessionStateMachine::isFinal(s)))
                    loop.quit();
            });

    sid = m_sessions->connectTo(record);

    const SessionState now = m_sessions->state(sid);
    if (now != SessionState::Ready && !SessionStateMachine::isFinal(now))
        loop.exec();

    if (m_sessions->state(sid) != SessionState::Ready) {
        if (failure.isEmpty()) {
            SessionInfo info;
            if (m_sessions->sessionInfo(sid, &info))
                failure = info.lastError;
        }
        errOut() << "Connection failed: " << (failure.isEmpty() ? QStringLiteral("unknown error") : failure) << Qt::endl;
        m_sessions->closeSession(sid);
        return -1;
    }
    return sid;
}

int CliApp::cmdShell(int id)
{
    if (!unlockStore())
        return ExitFailure;

    ConnectionRecord r;
    if (!loadRecord(id, &r))
        return ExitFailure;

    const int sid = openSession(r);
    if (sid < 0)
        return ExitFailure;

    int cols = 0;
    int rows = 0;
    terminalSize(&cols, &rows);

    QString err;
    if (!m_sessions->openTerminal(sid, cols, rows, nullptr, &err)) {
        errOut() << "Cannot open terminal: " << err << Qt::endl;
        return ExitFailure;
    }
    m_sessions->setForeground(sid);

    QEventLoop loop;
    int rc = ExitOk;

    connect(m_sessions.get(), &SessionManager::terminalOutput, &loop,
            [sid](int id, const QByteArray& bytes) {
                if (id != sid) return;
                std::fwrite(bytes.constData(), 1, (size_t)bytes.size(), stdout);
                std::fflush(stdout);
            });
    connect(m_sessions.get(), &SessionManager::sessionStateChanged, &loop,
            [&, sid](int id, SessionState s) {
                if (id != sid) return;
                if (s == SessionState::Failed) rc = ExitFailure;
                // Remote shell exited (back to Ready) or the connection went away.
                if (s == SessionState::Ready || SessionStateMachine::isFinal(s))
                    loop.quit();
            });

    QSocketNotifier stdinNotifier(STDIN_FILENO, QSocketNotifier::Read);
    connect(&stdinNotifier, &QSocketNotifier::activated, &loop, [&] {
        char buf[4096];
        const ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
        if (n <= 0) {
            stdinNotifier.setEnabled(false);
            loop.quit();
            return;
        }
        m_idle->touch();
        ChannelError code = ChannelError::None;
        QString sendErr;
        if (!m_sessions->sendKeys(QByteArray(buf, (int)n), &code, &sendErr))
            qWarning().noquote() << QString("[CLI] keystrokes dropped: %1").arg(sendErr);
    });

    InterruptScope interrupt;
    QTimer interruptPoll;
    connect(&interruptPoll, &QTimer::timeout, &loop, [&] {
        if (g_interrupted.exchange(false))
            m_sessions->sendKeys(QByteArray(1, '\x03'));
    });
    interruptPoll.start(100);

    loop.exec();

    m_sessions->closeTerminal(sid);
    m_sessions->closeSession(sid);
    m_sessions->shutdown();
    return rc;
}

int CliApp::cmdLs(int id, const QString& dir)
{
    if (!unlockStore())
        return ExitFailure;

    ConnectionRecord r;
    if (!loadRecord(id, &r))
        return ExitFailure;

    const int sid = openSession(r);
    if (sid < 0)
        return ExitFailure;

    RemoteDirectoryBrowser browser(m_sessions.get(), sid, m_store.get());
    const QString path = dir.isEmpty() ? browser.startDirectory() : dir;

    BrowserFilter filter;
    filter.showHidden = m_settings.showHidden;

    QVector<BrowserEntry> entries;
    QString err;
    const bool ok = browser.list(path, filter, &entries, nullptr, &err);

    if (ok) {
        out() << path << ":" << Qt::endl;
        for (const BrowserEntry& e : entries) {
            if (e.isDir)
                out() << QString("  %1  %2/").arg(QString(), 10).arg(e.name) << Qt::endl;
            else
                out() << QString("  %1  %2").arg(TransferPaths::prettySize(e.size), 10).arg(e.name) << Qt::endl;
        }
    } else {
        errOut() << "Cannot list " << path << ": " << err << Qt::endl;
    }

    m_sessions->closeSession(sid);
    m_sessions->shutdown();
    return ok ? ExitOk : ExitFailure;
}

// ===========================================================================
// Transfers
// ===========================================================================
int CliApp::cmdTransfer(TransferDirection direction, int id, const QString& source, const QString& targetDir)
{
    if (!unlockStore())
        return ExitFailure;

    ConnectionRecord r;
    if (!loadRecord(id, &r))
        return ExitFailure;

    const bool upload = direction == TransferDirection::Upload;
    if (upload && !QFileInfo::exists(source)) {
        errOut() << "No such file or directory: " << source << Qt::endl;
        return ExitFailure;
    }
    if (!upload && !QFileInfo(targetDir).isDir()) {
        errOut() << "Not a directory: " << targetDir << Qt::endl;
        return ExitFailure;
    }

    const int sid = openSession(r);
    if (sid < 0)
        return ExitFailure;

    LocalDirectoryBrowser local(m_store.get());
    RemoteDirectoryBrowser remote(m_sessions.get(), sid, m_store.get());
    DirectoryBrowser& sourceSide = upload ? static_cast<DirectoryBrowser&>(local) : remote;
    DirectoryBrowser& targetSide = upload ? static_cast<DirectoryBrowser&>(remote) : local;

    TransferWizard wizard;
    TransferError code = TransferError::None;
    QString err;

    bool ok = wizard.selectSession(sid, &code, &err)
           && wizard.selectDirection(direction, &code, &err)
           && wizard.selectSource(source, sourceSide.isDirectory(source), &code, &err);

    if (ok && !targetSide.isDirectory(targetDir)) {
        err = QString("Not a directory: %1").arg(targetDir);
        ok = false;
    }
    ok = ok && wizard.selectTarget(targetDir, &code, &err)
            && wizard.confirm(&code, &err);

    if (!ok) {
        errOut() << err << Qt::endl;
        m_sessions->closeSession(sid);
        m_sessions->shutdown();
        return ExitFailure;
    }

    errOut() << transferDirectionName(direction) << " " << source << " -> " << wizard.targetPath() << Qt::endl;

    QEventLoop loop;
    TransferState outcome = TransferState::Failed;
    int jobId = -1;

    connect(m_transfers.get(), &TransferEngine::transferProgress, &loop,
            [&](int job, quint64 done, quint64 total, const QString& file) {
                if (job != jobId) return;
                const int pct = total ? int(done * 100 / total) : 100;
                errOut() << QString("\r%1%  %2 / %3  %4")
                                .arg(pct, 3)
                                .arg(TransferPaths::prettySize(done))
                                .arg(TransferPaths::prettySize(total))
                                .arg(QFileInfo(file).fileName())
                         << "\x1b[K" << Qt::flush;
            });
    connect(m_transfers.get(), &TransferEngine::transferFinished, &loop,
            [&](int job, TransferState state) {
                if (job != jobId) return;
                outcome = state;
                loop.quit();
            });

    InterruptScope interrupt;
    QTimer interruptPoll;
    connect(&interruptPoll, &QTimer::timeout, &loop, [&] {
        if (g_interrupted.exchange(false) && jobId > 0)
            m_transfers->cancel(jobId);
    });
    interruptPoll.start(100);

    jobId = m_transfers->start(wizard.request(), &code, &err);
    if (jobId < 0) {
        errOut() << "Cannot start transfer: " << err << Qt::endl;
        m_sessions->closeSession(sid);
        m_sessions->shutdown();
        return ExitFailure;
    }

    TransferJob snapshot;
    if (!(m_transfers->job(jobId, &snapshot) && isTransferFinal(snapshot.state)))
        loop.exec();
    else
        outcome = snapshot.state;

    m_transfers->job(jobId, &snapshot);
    errOut() << Qt::endl;

    switch (outcome) {
        case TransferState::Completed:
            out() << "Done: " << TransferPaths::prettySize(snapshot.bytesDone) << Qt::endl;
            break;
        case TransferState::Cancelled:
            errOut() << "Cancelled after " << TransferPaths::prettySize(snapshot.bytesDone) << Qt::endl;
            break;
        default:
            errOut() << "Failed: " << snapshot.message << Qt::endl;
            break;
    }

    m_sessions->closeSession(sid);
    m_sessions->shutdown();
    return outcome == TransferState::Completed ? ExitOk : ExitFailure;
}
