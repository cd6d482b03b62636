#include <gtest/gtest.h>

#include <QDir>
#include <QSettings>
#include <QTemporaryDir>

#include "AppSettings.h"

class AppSettingsTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(dir.isValid());
        path = QDir(dir.path()).filePath("tabssh.ini");
    }

    QTemporaryDir dir;
    QString path;
};

TEST_F(AppSettingsTest, DefaultsWhenEmpty) {
    QSettings s(path, QSettings::IniFormat);
    const AppSettings a = AppSettings::load(s);

    EXPECT_EQ(a.logLevel, 1);
    EXPECT_EQ(a.auditRetentionDays, 7);
    EXPECT_EQ(a.kdfProfile, QString("moderate"));
    EXPECT_EQ(a.idleLockMinutes, 15);
    EXPECT_EQ(a.connectTimeoutSec, 15);
    EXPECT_FALSE(a.strictHostKeys());
    EXPECT_EQ(a.termType, QString("xterm-256color"));
    EXPECT_EQ(a.chunkSize, 64 * 1024);
    EXPECT_EQ(a.progressIntervalMs, 100);
    EXPECT_FALSE(a.showHidden);
    EXPECT_TRUE(a.effectiveVaultPath().endsWith("/vault.bin"));
}

TEST_F(AppSettingsTest, OutOfRangeValuesAreClamped) {
    QSettings s(path, QSettings::IniFormat);
    s.setValue("log/level", 9);
    s.setValue("log/retention_days", 0);
    s.setValue("vault/kdf_profile", "paranoid");
    s.setValue("vault/idle_lock_minutes", -3);
    s.setValue("ssh/connect_timeout_sec", 100000);
    s.setValue("ssh/known_hosts_policy", "STRICT");
    s.setValue("ssh/term_type", "   ");
    s.setValue("transfer/chunk_size", 10);
    s.setValue("transfer/progress_interval_ms", 999999);

    const AppSettings a = AppSettings::load(s);
    EXPECT_EQ(a.logLevel, 2);
    EXPECT_EQ(a.auditRetentionDays, 1);
    EXPECT_EQ(a.kdfProfile, QString("moderate"));
    EXPECT_EQ(a.idleLockMinutes, 0);
    EXPECT_EQ(a.connectTimeoutSec, 300);
    EXPECT_TRUE(a.strictHostKeys());
    EXPECT_EQ(a.termType, QString("xterm-256color"));
    EXPECT_EQ(a.chunkSize, 4 * 1024);
    EXPECT_EQ(a.progressIntervalMs, 5000);
}

TEST_F(AppSettingsTest, SaveThenLoad) {
    AppSettings a;
    a.logLevel = 0;
    a.vaultPath = "/tmp/x/../vault.bin";
    a.kdfProfile = "sensitive";
    a.showHidden = true;
    {
        QSettings s(path, QSettings::IniFormat);
        a.save(s);
    }

    QSettings s(path, QSettings::IniFormat);
    const AppSettings b = AppSettings::load(s);
    EXPECT_EQ(b.logLevel, 0);
    EXPECT_EQ(b.kdfProfile, QString("sensitive"));
    EXPECT_TRUE(b.showHidden);
    EXPECT_EQ(b.effectiveVaultPath(), QString("/tmp/vault.bin"));
}
