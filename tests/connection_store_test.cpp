#include <gtest/gtest.h>

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

#include "TestUtils.h"
#include "Vault/ConnectionStore.h"
#include "Vault/CryptoVault.h"

namespace {

ConnectionRecord passwordRecord(const QString& host, const QString& user = "alice")
{
    ConnectionRecord r;
    r.host = host;
    r.user = user;
    r.credential = Credential::withPassword("pw-" + host);
    return r;
}

} // namespace

class ConnectionStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(dir.isValid());
        vaultDir = dir.filePath("vault");
        ASSERT_TRUE(QDir().mkpath(vaultDir));
        vault.reset(new CryptoVault(QDir(vaultDir).filePath("vault.bin"), testutil::fastKdf()));
        store.reset(new ConnectionStore(vault.get()));
        ASSERT_TRUE(store->initialize("master"));
    }

    QVector<int> ids() const {
        QVector<int> out;
        for (const ConnectionRecord& r : store->list())
            out.push_back(r.id);
        return out;
    }

    QTemporaryDir dir;
    QString vaultDir;
    std::unique_ptr<CryptoVault> vault;
    std::unique_ptr<ConnectionStore> store;
};

TEST_F(ConnectionStoreTest, InitializeRefusesExistingVault) {
    VaultError code = VaultError::None;
    EXPECT_FALSE(store->initialize("again", &code));
    EXPECT_EQ(code, VaultError::IoError);
}

TEST_F(ConnectionStoreTest, RejectsInvalidRecords) {
    StoreError code = StoreError::None;

    ConnectionRecord noHost = passwordRecord("");
    EXPECT_EQ(store->add(noHost, &code), -1);
    EXPECT_EQ(code, StoreError::InvalidRecord);

    ConnectionRecord noUser = passwordRecord("h", "  ");
    EXPECT_EQ(store->add(noUser, &code), -1);
    EXPECT_EQ(code, StoreError::InvalidRecord);

    ConnectionRecord badPort = passwordRecord("h");
    badPort.port = 70000;
    EXPECT_EQ(store->add(badPort, &code), -1);
    EXPECT_EQ(code, StoreError::InvalidRecord);

    ConnectionRecord noPassword = passwordRecord("h");
    noPassword.credential = Credential::withPassword("");
    EXPECT_EQ(store->add(noPassword, &code), -1);
    EXPECT_EQ(code, StoreError::InvalidRecord);

    ConnectionRecord noKey = passwordRecord("h");
    noKey.credential = Credential::withKey("   ");
    EXPECT_EQ(store->add(noKey, &code), -1);
    EXPECT_EQ(code, StoreError::InvalidRecord);

    EXPECT_TRUE(store->list().isEmpty());
}

TEST_F(ConnectionStoreTest, AddAssignsFreshIdsEvenAfterRemove) {
    const int a = store->add(passwordRecord("a"));
    const int b = store->add(passwordRecord("b"));
    ASSERT_GT(a, 0);
    ASSERT_GT(b, 0);
    EXPECT_NE(a, b);

    ASSERT_TRUE(store->remove(b));
    const int c = store->add(passwordRecord("c"));
    EXPECT_NE(c, a);
    EXPECT_NE(c, b);

    StoreError code = StoreError::None;
    EXPECT_FALSE(store->get(b, nullptr, &code));
    EXPECT_EQ(code, StoreError::NotFound);
}

TEST_F(ConnectionStoreTest, DuplicateIdentityRejected) {
    ASSERT_GT(store->add(passwordRecord("host")), 0);

    ConnectionRecord same = passwordRecord("host");
    same.credential = Credential::withPassword("different password");
    StoreError code = StoreError::None;
    EXPECT_EQ(store->add(same, &code), -1);
    EXPECT_EQ(code, StoreError::DuplicateRecord);

    EXPECT_GT(store->add(passwordRecord("host", "bob")), 0);

    ConnectionRecord byKey = passwordRecord("host");
    byKey.credential = Credential::withKey("/keys/id");
    EXPECT_GT(store->add(byKey, &code), 0);
    EXPECT_EQ(store->findByIdentity(byKey), store->list().last().id);
}

TEST_F(ConnectionStoreTest, EmptyPassphraseMeansNone) {
    ConnectionRecord r = passwordRecord("k");
    r.credential = Credential::withKey("/keys/id", "");
    const int id = store->add(r);
    ASSERT_GT(id, 0);

    ConnectionRecord got;
    ASSERT_TRUE(store->get(id, &got));
    EXPECT_FALSE(got.credential.hasPassphrase());
    EXPECT_TRUE(got.credential.password.isEmpty());
}

TEST_F(ConnectionStoreTest, UpdateKeepsIdHistoryAndLastUsed) {
    const int id = store->add(passwordRecord("a"));
    ASSERT_TRUE(store->recordUsed(id));
    ASSERT_TRUE(store->setLastRemoteDir(id, "/srv"));

    ConnectionRecord before;
    ASSERT_TRUE(store->get(id, &before));

    ConnectionRecord edit = before;
    edit.host = "a2";
    edit.friendlyName = "Renamed";
    edit.history.clear();
    edit.lastUsedAt = QDateTime();
    edit.lastRemoteDir.clear();
    ASSERT_TRUE(store->update(edit));

    ConnectionRecord after;
    ASSERT_TRUE(store->get(id, &after));
    EXPECT_EQ(after.host, "a2");
    EXPECT_EQ(after.label(), "Renamed");
    EXPECT_EQ(after.history, before.history);
    EXPECT_EQ(after.lastUsedAt, before.lastUsedAt);
    EXPECT_EQ(after.lastRemoteDir, "/srv");
}

TEST_F(ConnectionStoreTest, ListIsMostRecentlyUsedFirst) {
    const int a = store->add(passwordRecord("a"));
    const int b = store->add(passwordRecord("b"));
    const int c = store->add(passwordRecord("c"));
    const int never = store->add(passwordRecord("never"));

    ASSERT_TRUE(store->recordUsed(a));
    ASSERT_TRUE(store->recordUsed(b));
    ASSERT_TRUE(store->recordUsed(c));
    EXPECT_EQ(ids(), (QVector<int>{ c, b, a, never }));

    ASSERT_TRUE(store->recordUsed(a));
    EXPECT_EQ(ids(), (QVector<int>{ a, c, b, never }));
}

TEST_F(ConnectionStoreTest, UnusedRecordsKeepInsertionOrder) {
    const int a = store->add(passwordRecord("a"));
    const int b = store->add(passwordRecord("b"));
    const int c = store->add(passwordRecord("c"));
    EXPECT_EQ(ids(), (QVector<int>{ a, b, c }));
}

TEST_F(ConnectionStoreTest, KnownKeyPathsFollowRecency) {
    ConnectionRecord one = passwordRecord("a");
    one.credential = Credential::withKey("/keys/one");
    ConnectionRecord two = passwordRecord("b");
    two.credential = Credential::withKey("/keys/two", "phrase");
    ConnectionRecord again = passwordRecord("c");
    again.credential = Credential::withKey("/keys/one");

    const int a = store->add(one);
    const int b = store->add(two);
    ASSERT_GT(store->add(again), 0);
    ASSERT_GT(store->add(passwordRecord("d")), 0);
    EXPECT_EQ(store->knownKeyPaths(), (QStringList{ "/keys/one", "/keys/two" }));

    ASSERT_TRUE(store->recordUsed(a));
    ASSERT_TRUE(store->recordUsed(b));
    EXPECT_EQ(store->knownKeyPaths(), (QStringList{ "/keys/two", "/keys/one" }));

    store->lock();
    EXPECT_TRUE(store->knownKeyPaths().isEmpty());
}

TEST_F(ConnectionStoreTest, FailureIsHistoryOnly) {
    const int id = store->add(passwordRecord("a"));
    ASSERT_TRUE(store->recordFailure(id));

    ConnectionRecord r;
    ASSERT_TRUE(store->get(id, &r));
    EXPECT_FALSE(r.lastUsedAt.isValid());
    ASSERT_EQ(r.history.size(), 1);
    EXPECT_FALSE(r.history[0].success);
}

TEST_F(ConnectionStoreTest, HistoryIsCapped) {
    const int id = store->add(passwordRecord("a"));
    for (int i = 0; i < kMaxHistoryEntries + 5; ++i)
        ASSERT_TRUE(store->recordFailure(id));
    ASSERT_TRUE(store->recordUsed(id));

    ConnectionRecord r;
    ASSERT_TRUE(store->get(id, &r));
    EXPECT_EQ(r.history.size(), kMaxHistoryEntries);
    EXPECT_TRUE(r.history.last().success);
}

TEST_F(ConnectionStoreTest, StateSurvivesLockUnlock) {
    const int id = store->add(passwordRecord("a"));
    ASSERT_TRUE(store->recordUsed(id));
    ASSERT_TRUE(store->setLastRemoteDir(id, "/var/www"));
    ASSERT_TRUE(store->setLastLocalDir("/tmp/downloads"));
    const QVector<ConnectionRecord> before = store->list();

    store->lock();
    EXPECT_FALSE(store->isUnlocked());
    EXPECT_TRUE(store->list().isEmpty());
    EXPECT_TRUE(store->lastLocalDir().isEmpty());

    ASSERT_TRUE(store->unlock("master"));
    EXPECT_EQ(store->list(), before);
    EXPECT_EQ(store->lastLocalDir(), "/tmp/downloads");

    // Ids keep counting from where they were.
    EXPECT_GT(store->add(passwordRecord("b")), id);
}

TEST_F(ConnectionStoreTest, LockedStoreRefusesMutations) {
    const int id = store->add(passwordRecord("a"));
    store->lock();

    StoreError code = StoreError::None;
    EXPECT_EQ(store->add(passwordRecord("b"), &code), -1);
    EXPECT_EQ(code, StoreError::Locked);
    EXPECT_FALSE(store->recordUsed(id, &code));
    EXPECT_EQ(code, StoreError::Locked);
    EXPECT_FALSE(store->get(id, nullptr, &code));
    EXPECT_EQ(code, StoreError::Locked);
}

TEST_F(ConnectionStoreTest, FailedPersistRollsBack) {
    const int id = store->add(passwordRecord("a"));
    const QVector<ConnectionRecord> before = store->list();

    // A regular file where the vault directory was: nothing can be written there.
    ASSERT_TRUE(QDir(vaultDir).removeRecursively());
    {
        QFile blocker(vaultDir);
        ASSERT_TRUE(blocker.open(QIODevice::WriteOnly));
    }

    StoreError code = StoreError::None;
    EXPECT_EQ(store->add(passwordRecord("b"), &code), -1);
    EXPECT_EQ(code, StoreError::PersistFailed);
    EXPECT_EQ(store->list(), before);

    ConnectionRecord renamed = before.first();
    renamed.friendlyName = "renamed";
    EXPECT_FALSE(store->update(renamed, &code));
    EXPECT_EQ(code, StoreError::PersistFailed);
    EXPECT_EQ(store->list(), before);

    EXPECT_FALSE(store->remove(id, &code));
    EXPECT_EQ(code, StoreError::PersistFailed);
    EXPECT_FALSE(store->recordUsed(id, &code));
    EXPECT_EQ(store->list(), before);
    EXPECT_TRUE(QFileInfo(vaultDir).isFile());
}

// Changing the password of a locked store leaves it locked.
TEST_F(ConnectionStoreTest, ChangePasswordWhileLockedKeepsNoKey) {
    store->add(passwordRecord("a"));
    store->lock();

    ASSERT_TRUE(store->changePassword("master", "fresh"));
    EXPECT_FALSE(store->isUnlocked());
    EXPECT_FALSE(vault->isUnlocked());

    VaultError code = VaultError::None;
    EXPECT_FALSE(store->unlock("master", &code));
    EXPECT_EQ(code, VaultError::WrongPassword);
    ASSERT_TRUE(store->unlock("fresh"));
    EXPECT_EQ(store->list().size(), 1);
}

TEST_F(ConnectionStoreTest, SignalsOnChangeAndLock) {
    int changes = 0;
    QVector<bool> lockStates;
    QObject::connect(store.get(), &ConnectionStore::changed, [&] { ++changes; });
    QObject::connect(store.get(), &ConnectionStore::lockedChanged, [&](bool locked) { lockStates.push_back(locked); });

    store->add(passwordRecord("a"));
    EXPECT_EQ(changes, 1);

    store->lock();
    ASSERT_TRUE(store->unlock("master"));
    EXPECT_EQ(lockStates, (QVector<bool>{ true, false }));
}
