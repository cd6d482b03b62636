#include <gtest/gtest.h>

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include "Logger.h"

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(dir.isValid());
        path = QDir(dir.path()).filePath("logs/test.log");
        Logger::setLogFilePathOverride(path);
        Logger::setLogLevel(1);
        Logger::install("tabssh-tests");
    }

    void TearDown() override {
        Logger::uninstall();
        Logger::setLogFilePathOverride(QString());
        Logger::setLogLevel(0);
    }

    QString contents() const {
        QFile f(path);
        if (!f.open(QIODevice::ReadOnly))
            return QString();
        return QString::fromUtf8(f.readAll());
    }

    QTemporaryDir dir;
    QString path;
};

TEST_F(LoggerTest, WritesOneLinePerRecord) {
    qInfo().noquote() << "[TEST] first\nsecond";
    qWarning().noquote() << "[TEST] careful";

    EXPECT_EQ(Logger::logFilePath(), QDir::cleanPath(path));
    EXPECT_EQ(Logger::logDirPath(), QDir(dir.path()).filePath("logs"));

    const QString text = contents();
    EXPECT_TRUE(text.contains("[INFO]"));
    EXPECT_TRUE(text.contains("[TEST] first second"));
    EXPECT_TRUE(text.contains("[WARN]"));
    EXPECT_TRUE(text.contains("[TEST] careful"));
}

// Level 1 drops debug records; level 0 keeps only warnings and errors.
TEST_F(LoggerTest, LevelFiltersRecords) {
    qDebug().noquote() << "[TEST] noisy";
    Logger::setLogLevel(0);
    qInfo().noquote() << "[TEST] chatty";
    qCritical().noquote() << "[TEST] broken";

    const QString text = contents();
    EXPECT_FALSE(text.contains("noisy"));
    EXPECT_FALSE(text.contains("chatty"));
    EXPECT_TRUE(text.contains("[ERROR]"));

    Logger::setLogLevel(7);
    EXPECT_EQ(Logger::logLevel(), 2);
}
