#include <gtest/gtest.h>

#include <QTemporaryDir>

#include "TestUtils.h"
#include "Vault/ConnectionStore.h"
#include "Vault/CryptoVault.h"
#include "Vault/IdleLock.h"

class IdleLockTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(dir.isValid());
        vault.reset(new CryptoVault(dir.filePath("vault.bin"), testutil::fastKdf()));
        store.reset(new ConnectionStore(vault.get()));
        ASSERT_TRUE(store->initialize("master"));
        ASSERT_TRUE(store->isUnlocked());
    }

    QTemporaryDir dir;
    std::unique_ptr<CryptoVault> vault;
    std::unique_ptr<ConnectionStore> store;
};

TEST_F(IdleLockTest, LocksAfterInactivity) {
    IdleLock idle(store.get(), 0);
    int fired = 0;
    QObject::connect(&idle, &IdleLock::idleLocked, [&] { ++fired; });

    idle.setTimeoutMs(50);
    EXPECT_TRUE(idle.isActive());
    ASSERT_TRUE(testutil::waitFor([&] { return !store->isUnlocked(); }, 2000));
    EXPECT_EQ(fired, 1);
    EXPECT_FALSE(idle.isActive());
}

TEST_F(IdleLockTest, TouchPostponesLock) {
    IdleLock idle(store.get(), 0);
    idle.setTimeoutMs(300);

    for (int i = 0; i < 5; ++i) {
        testutil::waitFor([] { return false; }, 100);
        idle.touch();
        EXPECT_TRUE(store->isUnlocked());
    }
    EXPECT_TRUE(testutil::waitFor([&] { return !store->isUnlocked(); }, 2000));
}

// Zero minutes never locks; unlocking re-arms a configured timer.
TEST_F(IdleLockTest, DisabledAndRearmed) {
    IdleLock idle(store.get(), 0);
    EXPECT_FALSE(idle.isActive());
    EXPECT_EQ(idle.timeoutMs(), 0);

    idle.setTimeoutMinutes(2);
    EXPECT_EQ(idle.timeoutMs(), 2 * 60 * 1000);
    EXPECT_TRUE(idle.isActive());

    store->lock();
    EXPECT_FALSE(idle.isActive());
    ASSERT_TRUE(store->unlock("master"));
    EXPECT_TRUE(idle.isActive());
}
