#include <gtest/gtest.h>

#include <QFile>
#include <QTemporaryDir>

#include "TestUtils.h"
#include "Vault/ConnectionStore.h"
#include "Vault/CryptoVault.h"

namespace {

QByteArray readAll(const QString& path)
{
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly))
        return QByteArray();
    return f.readAll();
}

bool writeAll(const QString& path, const QByteArray& bytes)
{
    QFile f(path);
    if (!f.open(QIODevice::WriteOnly | QIODevice::Truncate))
        return false;
    return f.write(bytes) == bytes.size();
}

} // namespace

class CryptoVaultTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(dir.isValid());
        path = dir.filePath("vault.bin");
    }

    QTemporaryDir dir;
    QString path;
};

TEST_F(CryptoVaultTest, CreateThenUnlockRoundTrips) {
    const QByteArray plain = R"({"records":[{"host":"a"}]})";
    {
        CryptoVault v(path, testutil::fastKdf());
        ASSERT_TRUE(v.create("pw", plain));
        EXPECT_TRUE(v.isUnlocked());
        EXPECT_FALSE(readAll(path).contains(plain));
    }

    CryptoVault v(path, testutil::fastKdf());
    EXPECT_FALSE(v.isUnlocked());

    QByteArray out;
    ASSERT_TRUE(v.unlock("pw", &out));
    EXPECT_EQ(out, plain);
    EXPECT_TRUE(v.isUnlocked());
}

TEST_F(CryptoVaultTest, EmptyPasswordRefused) {
    CryptoVault v(path, testutil::fastKdf());
    EXPECT_FALSE(v.create("", "x"));
    EXPECT_FALSE(v.exists());
}

TEST_F(CryptoVaultTest, WrongPasswordReported) {
    CryptoVault v(path, testutil::fastKdf());
    ASSERT_TRUE(v.create("right", "x"));
    v.lock();

    QByteArray out;
    VaultError code = VaultError::None;
    QString err;
    EXPECT_FALSE(v.unlock("wrong", &out, &code, &err));
    EXPECT_EQ(code, VaultError::WrongPassword);
    EXPECT_EQ(err, errorMessage(VaultError::WrongPassword));
    EXPECT_FALSE(v.isUnlocked());
}

TEST_F(CryptoVaultTest, FlippingAnyByteIsCorrupt) {
    {
        CryptoVault v(path, testutil::fastKdf());
        ASSERT_TRUE(v.create("pw", "some records"));
    }
    const QByteArray original = readAll(path);
    ASSERT_FALSE(original.isEmpty());

    for (int i = 0; i < original.size(); ++i) {
        QByteArray damaged = original;
        damaged[i] = char(damaged[i] ^ 0x01);
        ASSERT_TRUE(writeAll(path, damaged));

        CryptoVault v(path, testutil::fastKdf());
        QByteArray out;
        VaultError code = VaultError::None;
        EXPECT_FALSE(v.unlock("pw", &out, &code)) << "byte " << i;
        EXPECT_EQ(code, VaultError::VaultCorrupt) << "byte " << i;
        EXPECT_TRUE(out.isEmpty());
    }
}

TEST_F(CryptoVaultTest, PersistReencryptsWithFreshNonce) {
    CryptoVault v(path, testutil::fastKdf());
    ASSERT_TRUE(v.create("pw", "one"));
    const QByteArray first = readAll(path);

    ASSERT_TRUE(v.persist("one"));
    EXPECT_NE(readAll(path), first);

    v.lock();
    VaultError code = VaultError::None;
    EXPECT_FALSE(v.persist("two", &code));
    EXPECT_EQ(code, VaultError::IoError);
}

TEST_F(CryptoVaultTest, ChangePasswordSwapsKeys) {
    CryptoVault v(path, testutil::fastKdf());
    ASSERT_TRUE(v.create("old", "payload"));
    ASSERT_TRUE(v.changePassword("old", "new"));
    v.lock();

    QByteArray out;
    VaultError code = VaultError::None;
    EXPECT_FALSE(v.unlock("old", &out, &code));
    EXPECT_EQ(code, VaultError::WrongPassword);

    ASSERT_TRUE(v.unlock("new", &out));
    EXPECT_EQ(out, QByteArray("payload"));
}

TEST_F(CryptoVaultTest, ChangePasswordWithWrongOldLeavesFileUntouched) {
    CryptoVault v(path, testutil::fastKdf());
    ASSERT_TRUE(v.create("old", "payload"));
    const QByteArray before = readAll(path);

    VaultError code = VaultError::None;
    EXPECT_FALSE(v.changePassword("nope", "new", &code));
    EXPECT_EQ(code, VaultError::WrongPassword);
    EXPECT_EQ(readAll(path), before);
}

// Re-sealing a locked vault must not leave the new key behind.
TEST_F(CryptoVaultTest, ChangePasswordWhileLockedStaysLocked) {
    {
        CryptoVault v(path, testutil::fastKdf());
        ASSERT_TRUE(v.create("old", "payload"));
    }

    CryptoVault v(path, testutil::fastKdf());
    ASSERT_FALSE(v.isUnlocked());
    ASSERT_TRUE(v.changePassword("old", "new"));
    EXPECT_FALSE(v.isUnlocked());

    VaultError code = VaultError::None;
    EXPECT_FALSE(v.persist("other", &code));
    EXPECT_EQ(code, VaultError::IoError);

    QByteArray out;
    ASSERT_TRUE(v.unlock("new", &out));
    EXPECT_EQ(out, QByteArray("payload"));
}

TEST_F(CryptoVaultTest, UsesFileKdfNotConstructorDefault) {
    {
        CryptoVault v(path, testutil::fastKdf());
        ASSERT_TRUE(v.create("pw", "payload"));
    }
    // A vault configured for a costlier profile still opens the cheap file.
    CryptoVault v(path, VaultKdfParams::moderate());
    QByteArray out;
    EXPECT_TRUE(v.unlock("pw", &out));
}

// Scenario: create, persist one key-auth record, "restart", unlock again.
TEST_F(CryptoVaultTest, RecordSurvivesRestart) {
    ConnectionRecord rec;
    rec.host = "example.com";
    rec.port = 22;
    rec.user = "alice";
    rec.credential = Credential::withKey("/home/alice/.ssh/id_ed25519");

    int id = -1;
    {
        CryptoVault vault(path, testutil::fastKdf());
        ConnectionStore store(&vault);
        ASSERT_TRUE(store.initialize("Tr0ub4dor"));
        id = store.add(rec);
        ASSERT_GT(id, 0);
        store.lock();
    }

    CryptoVault vault(path, testutil::fastKdf());
    ConnectionStore store(&vault);

    VaultError code = VaultError::None;
    EXPECT_FALSE(store.unlock("wrong", &code));
    EXPECT_EQ(code, VaultError::WrongPassword);

    ASSERT_TRUE(store.unlock("Tr0ub4dor", &code));
    const QVector<ConnectionRecord> list = store.list();
    ASSERT_EQ(list.size(), 1);
    EXPECT_EQ(list[0].id, id);
    EXPECT_EQ(list[0].host, "example.com");
    EXPECT_EQ(list[0].port, 22);
    EXPECT_EQ(list[0].user, "alice");
    EXPECT_EQ(list[0].credential.kind, CredentialKind::PrivateKey);
    EXPECT_EQ(list[0].credential.keyPath, "/home/alice/.ssh/id_ed25519");
}
