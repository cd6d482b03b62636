#include <gtest/gtest.h>

#include <QDir>
#include <QMutex>
#include <QMutexLocker>
#include <QTemporaryDir>

#include "FakeSshBackend.h"
#include "TestUtils.h"
#include "Session/SessionManager.h"
#include "Vault/ConnectionStore.h"
#include "Vault/CryptoVault.h"

class SessionManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(dir.isValid());
        vault.reset(new CryptoVault(dir.filePath("vault.bin"), testutil::fastKdf()));
        store.reset(new ConnectionStore(vault.get()));
        ASSERT_TRUE(store->initialize("master"));

        alpha = backend.addHost("alpha");
        beta  = backend.addHost("beta");

        manager.reset(new SessionManager(&backend, store.get()));

        QObject::connect(manager.get(), &SessionManager::sessionStateChanged,
                         [this](int id, SessionState s) {
                             QMutexLocker lock(&eventsMutex);
                             transitions[id].push_back(s);
                         });
        QObject::connect(manager.get(), &SessionManager::sessionFailed,
                         [this](int id, const QString& key, const QString&) {
                             QMutexLocker lock(&eventsMutex);
                             failures[id] = key;
                         });
        QObject::connect(manager.get(), &SessionManager::terminalOutput,
                         [this](int id, const QByteArray& bytes) {
                             QMutexLocker lock(&eventsMutex);
                             output[id] += bytes;
                         });
    }

    void TearDown() override {
        manager.reset();
    }

    ConnectionRecord storedRecord(const QString& host, const QString& password = "secret") {
        ConnectionRecord r;
        r.host = host;
        r.user = "alice";
        r.credential = Credential::withPassword(password);
        r.id = store->add(r);
        EXPECT_GT(r.id, 0);
        return r;
    }

    bool waitState(int id, SessionState s, int timeoutMs = 5000) {
        return testutil::waitFor([&] { return manager->state(id) == s; }, timeoutMs);
    }

    bool waitRemoved(int id) {
        return testutil::waitFor([&] { return !manager->hasSession(id); });
    }

    QVector<SessionState> transitionsOf(int id) {
        QMutexLocker lock(&eventsMutex);
        return transitions.value(id);
    }

    QString failureOf(int id) {
        QMutexLocker lock(&eventsMutex);
        return failures.value(id);
    }

    QByteArray outputOf(int id) {
        QMutexLocker lock(&eventsMutex);
        return output.value(id);
    }

    QByteArray received(FakeHostState& s) {
        QMutexLocker lock(&s.mutex);
        return s.ptyReceived;
    }

    QTemporaryDir dir;
    std::unique_ptr<CryptoVault> vault;
    std::unique_ptr<ConnectionStore> store;
    FakeSshBackend backend;
    std::shared_ptr<FakeHostState> alpha;
    std::shared_ptr<FakeHostState> beta;
    std::unique_ptr<SessionManager> manager;

    QMutex eventsMutex;
    QMap<int, QVector<SessionState>> transitions;
    QMap<int, QString> failures;
    QMap<int, QByteArray> output;
};

// A good password walks Connecting -> Authenticating -> Ready and stamps the record.
TEST_F(SessionManagerTest, ConnectReachesReadyAndRecordsUse) {
    const ConnectionRecord r = storedRecord("alpha");

    const int id = manager->connectTo(r);
    ASSERT_GT(id, 0);
    ASSERT_TRUE(waitState(id, SessionState::Ready));

    const QVector<SessionState> expected{ SessionState::Connecting,
                                          SessionState::Authenticating,
                                          SessionState::Ready };
    EXPECT_EQ(transitionsOf(id), expected);

    ConnectionRecord after;
    ASSERT_TRUE(testutil::waitFor([&] {
        return store->get(r.id, &after) && after.lastUsedAt.isValid();
    }));
    ASSERT_EQ(after.history.size(), 1);
    EXPECT_TRUE(after.history.last().success);
    EXPECT_EQ(manager->foreground(), id);
}

TEST_F(SessionManagerTest, RejectedPasswordFailsAndRecordsFailure) {
    const ConnectionRecord r = storedRecord("alpha", "wrong");

    const int id = manager->connectTo(r);
    ASSERT_TRUE(waitState(id, SessionState::Failed));
    EXPECT_EQ(failureOf(id), errorKey(ConnectError::AuthRejected));

    ConnectionRecord after;
    ASSERT_TRUE(testutil::waitFor([&] {
        return store->get(r.id, &after) && !after.history.isEmpty();
    }));
    EXPECT_FALSE(after.history.last().success);
    EXPECT_FALSE(after.lastUsedAt.isValid());

    ChannelError code = ChannelError::None;
    EXPECT_FALSE(manager->openTerminal(id, 80, 24, &code));
    EXPECT_EQ(code, ChannelError::NotReady);
}

TEST_F(SessionManagerTest, UnknownHostIsUnreachable) {
    ConnectionRecord r;
    r.host = "nowhere";
    r.user = "alice";
    r.credential = Credential::withPassword("secret");

    const int id = manager->connectTo(r);
    ASSERT_TRUE(waitState(id, SessionState::Failed));
    EXPECT_EQ(failureOf(id), errorKey(ConnectError::NetworkUnreachable));
}

TEST_F(SessionManagerTest, PrivateKeyWithPassphrase) {
    FakeHostConfig cfg;
    cfg.keyPath = "/keys/id_ed25519";
    backend.addHost("keyed", cfg);
    backend.addKey("/keys/id_ed25519", "open sesame");

    ConnectionRecord r;
    r.host = "keyed";
    r.user = "alice";
    r.credential = Credential::withKey("/keys/id_ed25519", "open sesame");
    const int ok = manager->connectTo(r);
    EXPECT_TRUE(waitState(ok, SessionState::Ready));

    r.credential = Credential::withKey("/keys/id_ed25519", "wrong");
    const int bad = manager->connectTo(r);
    ASSERT_TRUE(waitState(bad, SessionState::Failed));
    EXPECT_EQ(failureOf(bad), errorKey(ConnectError::KeyUnreadable));
}

// Second terminal on the same session is refused; the first keeps echoing.
TEST_F(SessionManagerTest, SecondTerminalIsBusy) {
    const int id = manager->connectTo(storedRecord("alpha"));
    ASSERT_TRUE(waitState(id, SessionState::Ready));

    ASSERT_TRUE(manager->openTerminal(id, 80, 24));
    EXPECT_EQ(manager->state(id), SessionState::Terminal);

    ChannelError code = ChannelError::None;
    EXPECT_FALSE(manager->openTerminal(id, 80, 24, &code));
    EXPECT_EQ(code, ChannelError::ChannelBusy);

    ASSERT_TRUE(manager->sendKeys("whoami\n"));
    EXPECT_TRUE(testutil::waitFor([&] { return outputOf(id).contains("whoami"); }));

    QMutexLocker lock(&alpha->mutex);
    EXPECT_EQ(alpha->ptyOpen, 1);
    EXPECT_EQ(alpha->ptyOpened, 1);
}

TEST_F(SessionManagerTest, KeystrokesReachOnlyForeground) {
    const int a = manager->connectTo(storedRecord("alpha"));
    const int b = manager->connectTo(storedRecord("beta"));
    ASSERT_TRUE(waitState(a, SessionState::Ready));
    ASSERT_TRUE(waitState(b, SessionState::Ready));
    ASSERT_TRUE(manager->openTerminal(a, 80, 24));
    ASSERT_TRUE(manager->openTerminal(b, 80, 24));

    ASSERT_EQ(manager->foreground(), a);
    ASSERT_TRUE(manager->sendKeys("ls\n"));
    ASSERT_TRUE(testutil::waitFor([&] { return received(*alpha) == "ls\n"; }));

    ASSERT_TRUE(manager->setForeground(b));
    ASSERT_TRUE(manager->sendKeys("pwd\n"));
    ASSERT_TRUE(testutil::waitFor([&] { return received(*beta) == "pwd\n"; }));

    EXPECT_EQ(received(*alpha), QByteArray("ls\n"));
}

TEST_F(SessionManagerTest, SendKeysWithoutTerminal) {
    ChannelError code = ChannelError::None;
    EXPECT_FALSE(manager->sendKeys("x", &code));
    EXPECT_EQ(code, ChannelError::NoSuchSession);

    const int id = manager->connectTo(storedRecord("alpha"));
    ASSERT_TRUE(waitState(id, SessionState::Ready));
    EXPECT_FALSE(manager->sendKeys("x", &code));
    EXPECT_EQ(code, ChannelError::NotReady);
}

TEST_F(SessionManagerTest, TerminalOpensAtRequestedSize) {
    const int id = manager->connectTo(storedRecord("alpha"));
    ASSERT_TRUE(waitState(id, SessionState::Ready));
    ASSERT_TRUE(manager->openTerminal(id, 120, 40));

    QMutexLocker lock(&alpha->mutex);
    EXPECT_EQ(alpha->ptyCols, 120);
    EXPECT_EQ(alpha->ptyRows, 40);
    EXPECT_EQ(alpha->ptyResizes, 0);
}

TEST_F(SessionManagerTest, ResizeReachesChannel) {
    const int id = manager->connectTo(storedRecord("alpha"));
    ASSERT_TRUE(waitState(id, SessionState::Ready));
    ASSERT_TRUE(manager->openTerminal(id, 80, 24));

    ASSERT_TRUE(manager->resize(id, 132, 50));
    ASSERT_TRUE(testutil::waitFor([&] {
        QMutexLocker lock(&alpha->mutex);
        return alpha->ptyResizes > 0;
    }));

    QMutexLocker lock(&alpha->mutex);
    EXPECT_EQ(alpha->ptyCols, 132);
    EXPECT_EQ(alpha->ptyRows, 50);
}

TEST_F(SessionManagerTest, ResizeWithoutTerminalDoesNothing) {
    EXPECT_FALSE(manager->resize(999, 100, 30));

    const int id = manager->connectTo(storedRecord("alpha"));
    ASSERT_TRUE(waitState(id, SessionState::Ready));
    EXPECT_FALSE(manager->resize(id, 100, 30));
    EXPECT_EQ(manager->state(id), SessionState::Ready);

    ASSERT_TRUE(manager->openTerminal(id, 80, 24));
    ASSERT_TRUE(manager->closeTerminal(id));
    EXPECT_FALSE(manager->resize(id, 100, 30));

    QMutexLocker lock(&alpha->mutex);
    EXPECT_EQ(alpha->ptyResizes, 0);
}

// A write refused without a reason still ends the terminal as an I/O error.
TEST_F(SessionManagerTest, SilentWriteFailureIsIoError) {
    const int id = manager->connectTo(storedRecord("alpha"));
    ASSERT_TRUE(waitState(id, SessionState::Ready));
    ASSERT_TRUE(manager->openTerminal(id, 80, 24));

    {
        QMutexLocker lock(&alpha->mutex);
        alpha->ptyWriteRefused = true;
    }
    ASSERT_TRUE(manager->sendKeys("ls\n"));
    ASSERT_TRUE(waitState(id, SessionState::Failed));
    EXPECT_EQ(failureOf(id), errorKey(ChannelError::IoError));
}

// Remote EOF ends the terminal but keeps the session usable.
TEST_F(SessionManagerTest, RemoteCloseReturnsToReady) {
    const int id = manager->connectTo(storedRecord("alpha"));
    ASSERT_TRUE(waitState(id, SessionState::Ready));
    ASSERT_TRUE(manager->openTerminal(id, 80, 24));

    {
        QMutexLocker lock(&alpha->mutex);
        alpha->remoteClosed = true;
    }
    ASSERT_TRUE(waitState(id, SessionState::Ready));

    SessionInfo info;
    ASSERT_TRUE(manager->sessionInfo(id, &info));
    EXPECT_FALSE(info.terminalOpen);

    {
        QMutexLocker lock(&alpha->mutex);
        alpha->remoteClosed = false;
    }
    EXPECT_TRUE(manager->openTerminal(id, 80, 24));
}

TEST_F(SessionManagerTest, LinkLossFailsSession) {
    const int id = manager->connectTo(storedRecord("alpha"));
    ASSERT_TRUE(waitState(id, SessionState::Ready));
    ASSERT_TRUE(manager->openTerminal(id, 80, 24));

    {
        QMutexLocker lock(&alpha->mutex);
        alpha->linkDown = true;
    }
    ASSERT_TRUE(waitState(id, SessionState::Failed));
    EXPECT_EQ(failureOf(id), errorKey(ChannelError::IoError));

    manager->closeSession(id);
    ASSERT_TRUE(waitRemoved(id));
    EXPECT_TRUE(testutil::waitFor([&] { return transitionsOf(id).last() == SessionState::Closed; }));
}

TEST_F(SessionManagerTest, CloseTerminalKeepsSession) {
    const int id = manager->connectTo(storedRecord("alpha"));
    ASSERT_TRUE(waitState(id, SessionState::Ready));
    ASSERT_TRUE(manager->openTerminal(id, 80, 24));

    ASSERT_TRUE(manager->closeTerminal(id));
    EXPECT_EQ(manager->state(id), SessionState::Ready);

    ChannelError code = ChannelError::None;
    EXPECT_FALSE(manager->closeTerminal(id, &code));
    EXPECT_EQ(code, ChannelError::NotReady);
}

// Closing a session with a transfer lease out cancels the lease token and
// waits for the lease before tearing down.
TEST_F(SessionManagerTest, CloseCancelsLeaseHolder) {
    const int id = manager->connectTo(storedRecord("alpha"));
    ASSERT_TRUE(waitState(id, SessionState::Ready));

    auto token = std::make_shared<CancellationToken>();
    SftpLeasePtr lease = manager->acquireSftp(id, token, LeasePurpose::Transfer);
    ASSERT_NE(lease, nullptr);
    EXPECT_EQ(manager->state(id), SessionState::Transferring);

    manager->closeSession(id);
    ASSERT_TRUE(testutil::waitFor([&] { return token->isCancelled(); }));
    ASSERT_TRUE(waitState(id, SessionState::Closing));
    EXPECT_TRUE(manager->hasSession(id));

    lease.reset();
    ASSERT_TRUE(waitRemoved(id));

    QMutexLocker lock(&alpha->mutex);
    EXPECT_EQ(alpha->connections, 0);
}

TEST_F(SessionManagerTest, SftpLeaseIsExclusive) {
    TransferError code = TransferError::None;
    EXPECT_EQ(manager->acquireSftp(42, nullptr, LeasePurpose::Browse, &code), nullptr);
    EXPECT_EQ(code, TransferError::InvalidRequest);

    const int id = manager->connectTo(storedRecord("alpha"));
    ASSERT_TRUE(waitState(id, SessionState::Ready));

    SftpLeasePtr first = manager->acquireSftp(id, nullptr, LeasePurpose::Browse);
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(manager->state(id), SessionState::Ready);
    EXPECT_EQ(first->sftp()->homeDir(), QString("/home/alice"));

    EXPECT_EQ(manager->acquireSftp(id, nullptr, LeasePurpose::Transfer, &code), nullptr);
    EXPECT_EQ(code, TransferError::SessionBusy);

    first.reset();
    EXPECT_NE(manager->acquireSftp(id, nullptr, LeasePurpose::Transfer, &code), nullptr);
    EXPECT_EQ(code, TransferError::None);
}

TEST_F(SessionManagerTest, TryConnectLeavesNoSession) {
    ConnectionRecord r = storedRecord("alpha");
    EXPECT_TRUE(manager->tryConnect(r));

    r.credential = Credential::withPassword("nope");
    ConnectError code = ConnectError::None;
    EXPECT_FALSE(manager->tryConnect(r, &code));
    EXPECT_EQ(code, ConnectError::AuthRejected);

    EXPECT_TRUE(manager->sessionIds().isEmpty());

    ConnectionRecord after;
    ASSERT_TRUE(store->get(r.id, &after));
    EXPECT_TRUE(after.history.isEmpty());

    QMutexLocker lock(&alpha->mutex);
    EXPECT_EQ(alpha->connections, 0);
}

TEST_F(SessionManagerTest, ReconnectReplacesSession) {
    const int first = manager->connectTo(storedRecord("alpha"));
    ASSERT_TRUE(waitState(first, SessionState::Ready));

    const int second = manager->reconnect(first);
    ASSERT_GT(second, first);
    ASSERT_TRUE(waitState(second, SessionState::Ready));
    ASSERT_TRUE(waitRemoved(first));

    ChannelError code = ChannelError::None;
    EXPECT_EQ(manager->reconnect(first, &code), -1);
    EXPECT_EQ(code, ChannelError::NoSuchSession);
}

TEST_F(SessionManagerTest, CycleForegroundWraps) {
    const int a = manager->connectTo(storedRecord("alpha"));
    const int b = manager->connectTo(storedRecord("beta"));
    backend.addHost("gamma");
    const int c = manager->connectTo(storedRecord("gamma"));

    EXPECT_EQ(manager->foreground(), a);
    EXPECT_EQ(manager->cycleForeground(1), b);
    EXPECT_EQ(manager->cycleForeground(1), c);
    EXPECT_EQ(manager->cycleForeground(1), a);
    EXPECT_EQ(manager->cycleForeground(-1), c);

    manager->closeSession(c);
    ASSERT_TRUE(waitRemoved(c));
    EXPECT_EQ(manager->foreground(), a);
    EXPECT_EQ(manager->sessionIds(), (QVector<int>{ a, b }));
}

TEST_F(SessionManagerTest, UnknownSessionReadsAsClosed) {
    EXPECT_EQ(manager->state(999), SessionState::Closed);
    EXPECT_FALSE(manager->setForeground(999));
    EXPECT_FALSE(manager->sessionInfo(999, nullptr));
}

TEST_F(SessionManagerTest, ShutdownClosesEverything) {
    const int a = manager->connectTo(storedRecord("alpha"));
    const int b = manager->connectTo(storedRecord("beta"));
    ASSERT_TRUE(waitState(a, SessionState::Ready));
    ASSERT_TRUE(waitState(b, SessionState::Ready));
    ASSERT_TRUE(manager->openTerminal(a, 80, 24));

    manager->shutdown();
    EXPECT_TRUE(manager->sessionIds().isEmpty());
    EXPECT_EQ(manager->foreground(), -1);

    QMutexLocker lock(&alpha->mutex);
    EXPECT_EQ(alpha->connections, 0);
    EXPECT_EQ(alpha->ptyOpen, 0);
}
