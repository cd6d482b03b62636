// Logger.cpp
#include "Logger.h"

#include <QDir>
#include <QDateTime>
#include <QFile>
#include <QFileInfo>
#include <QStandardPaths>
#include <QMutex>
#include <QMutexLocker>
#include <QAtomicInt>
#include <QDebug>

#include <cstdio>
#include <cstdlib>
#include <memory>

// =====================================================
// Global logger state (process-wide)
// =====================================================

static constexpr qint64 kMaxLogBytes = 2 * 1024 * 1024;
static constexpr int    kKeepRotated = 3;

static std::unique_ptr<QFile> g_file;    // Open log file
static QMutex     g_mutex;               // Guards g_file / g_path / g_written
static QString    g_path;
static QString    g_pathOverride;
static qint64     g_written = 0;         // bytes in current file, for in-run rotation
static QAtomicInt g_level(1);            // 0=Errors only, 1=Normal, 2=Debug
static QAtomicInt g_mirror(0);
static bool       g_installed = false;

// Something inside the handler (QFile warnings) may log again.
static thread_local bool g_inHandler = false;

static const char* levelTag(QtMsgType t)
{
    switch (t) {
        case QtDebugMsg:    return "DEBUG";
        case QtInfoMsg:     return "INFO";
        case QtWarningMsg:  return "WARN";
        case QtCriticalMsg: return "ERROR";
        case QtFatalMsg:    return "FATAL";
    }
    return "LOG";
}

// 0 = WARN/ERROR/FATAL, 1 = +INFO, 2 = +DEBUG
static bool allowMessage(QtMsgType type)
{
    const int lvl = g_level.loadAcquire();
    switch (type) {
        case QtDebugMsg:  return lvl >= 2;
        case QtInfoMsg:   return lvl >= 1;
        default:          return true;
    }
}

// One record = one physical line.
static QString normalizeMessage(QString s)
{
    s.replace("\r\n", "\n");
    s.replace('\r', '\n');
    s.replace('\n', ' ');
    s.replace('\t', ' ');
    return s.simplified();
}

// =====================================================
// Rotation (size-based): log -> .1 -> .2 -> .3, oldest dropped
// =====================================================

static void rotateFiles(const QString& path)
{
    for (int i = kKeepRotated; i >= 1; --i) {
        const QString older = path + "." + QString::number(i);
        const QString newer = path + "." + QString::number(i + 1);

        if (i == kKeepRotated) {
            QFile::remove(older);
            continue;
        }
        if (QFileInfo::exists(newer))
            QFile::remove(newer);
        if (QFileInfo::exists(older))
            QFile::rename(older, newer);
    }
    QFile::rename(path, path + ".1");
}

// Must be called with g_mutex held.
static bool openLocked(const QString& path)
{
    if (g_file) {
        g_file->close();
        g_file.reset();
    }

    QDir().mkpath(QFileInfo(path).absolutePath());

    if (QFileInfo(path).size() >= kMaxLogBytes)
        rotateFiles(path);

    auto f = std::make_unique<QFile>(path);
    if (!f->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::fprintf(stderr, "Logger: failed to open log file: %s\n", path.toUtf8().constData());
        std::fflush(stderr);
        return false;
    }

    g_written = f->size();
    g_file = std::move(f);
    g_path = path;
    return true;
}

// =====================================================
// Qt message handler
// =====================================================

static void handler(QtMsgType type, const QMessageLogContext& ctx, const QString& msg)
{
    if (!allowMessage(type) || g_inHandler) {
        if (type == QtFatalMsg) std::abort();
        return;
    }
    g_inHandler = true;

    const QString ts = QDateTime::currentDateTime().toString("yyyy-MM-dd HH:mm:ss.zzz");

    QString line = ts + " [" + levelTag(type) + "] ";
    if (ctx.file && ctx.function) {
        line += QString("%1:%2 %3 - ")
                    .arg(QFileInfo(QString::fromUtf8(ctx.file)).fileName())
                    .arg(ctx.line)
                    .arg(QString::fromUtf8(ctx.function));
    }
    line += normalizeMessage(msg);

    const QByteArray utf8 = line.toUtf8() + '\n';

    {
        QMutexLocker lock(&g_mutex);

        const bool haveFile = g_file && g_file->isOpen();
        if (haveFile) {
            if (g_written + utf8.size() > kMaxLogBytes) {
                const QString p = g_path;
                openLocked(p.isEmpty() ? g_file->fileName() : p);
            }
            if (g_file && g_file->isOpen()) {
                const qint64 n = g_file->write(utf8);
                if (n > 0) g_written += n;
                g_file->flush();
            }
        }

        if (!haveFile || g_mirror.loadAcquire()) {
            std::fwrite(utf8.constData(), 1, (size_t)utf8.size(), stderr);
            std::fflush(stderr);
        }
    }

    g_inHandler = false;
    if (type == QtFatalMsg) std::abort();
}

// =====================================================
// Public Logger API
// =====================================================

namespace Logger {

void install(const QString& appName)
{
    const QString defaultPath =
        QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation)
        + "/logs/" + appName + ".log";

    {
        QMutexLocker lock(&g_mutex);
        const QString ov = g_pathOverride.trimmed();
        openLocked(ov.isEmpty() ? defaultPath : QDir::cleanPath(ov));
    }

    qInstallMessageHandler(handler);
    g_installed = true;
    qInfo().noquote() << QString("[LOG] Logger initialized: %1").arg(logFilePath());
}

void uninstall()
{
    if (g_installed) {
        qInstallMessageHandler(nullptr);
        g_installed = false;
    }
    QMutexLocker lock(&g_mutex);
    if (g_file) {
        g_file->close();
        g_file.reset();
    }
}

void setLogLevel(int level)
{
    g_level.storeRelease(qBound(0, level, 2));
}

int logLevel()
{
    return g_level.loadAcquire();
}

void setMirrorToStderr(bool on)
{
    g_mirror.storeRelease(on ? 1 : 0);
}

QString logFilePath()
{
    QMutexLocker lock(&g_mutex);
    return g_path;
}

QString logDirPath()
{
    const QString p = logFilePath().trimmed();
    if (p.isEmpty()) return QString();
    return QFileInfo(p).absolutePath();
}

void setLogFilePathOverride(const QString& absoluteFilePath)
{
    QMutexLocker lock(&g_mutex);
    g_pathOverride = absoluteFilePath.trimmed().isEmpty()
                         ? QString()
                         : QDir::cleanPath(absoluteFilePath.trimmed());

    // Cleared: keep the current file; next install() picks the default.
    if (g_pathOverride.isEmpty() || !g_installed)
        return;

    openLocked(g_pathOverride);
}

} // namespace Logger
