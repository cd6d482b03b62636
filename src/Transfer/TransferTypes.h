#pragma once

#include <QDateTime>
#include <QMetaType>
#include <QString>
#include <QtGlobal>

#include "../ErrorTypes.h"

enum class TransferDirection {
    Upload,     // local -> remote
    Download    // remote -> local
};

enum class TransferState {
    Pending,
    Running,
    Completed,
    Failed,
    Cancelled
};

Q_DECLARE_METATYPE(TransferDirection)
Q_DECLARE_METATYPE(TransferState)

QString transferDirectionName(TransferDirection d);
QString transferStateName(TransferState s);
bool    isTransferFinal(TransferState s);

// What the wizard produces. The source is copied to targetDir/basename(source).
struct TransferRequest
{
    int               sessionId   = -1;
    TransferDirection direction   = TransferDirection::Upload;
    QString           sourcePath;
    bool              sourceIsDir = false;
    QString           targetDir;
};

// Snapshot of one job, as exposed by TransferEngine::jobs().
struct TransferJob
{
    int               id          = -1;
    int               sessionId   = -1;
    TransferDirection direction   = TransferDirection::Upload;
    QString           source;
    QString           target;       // full destination path of the source root

    quint64           totalBytes  = 0;
    quint64           bytesDone   = 0;
    QString           currentFile;

    TransferState     state       = TransferState::Pending;
    TransferError     error       = TransferError::None;
    QString           message;

    QDateTime         startedAt;
    QDateTime         finishedAt;
};

// Path helpers shared by the browsers and the engine.
// Remote paths are always POSIX-like, whatever the client platform.
namespace TransferPaths {
    QString joinRemote(const QString& base, const QString& rel);
    QString joinLocal(const QString& base, const QString& rel);
    QString remoteParent(const QString& path);     // "/" stays "/"
    QString baseName(const QString& path);          // trailing separators ignored

    // False for "/", "." and "..": targetDir/basename would not be a new entry.
    bool hasCopyableName(const QString& path);
    QString prettySize(quint64 bytes);
}
