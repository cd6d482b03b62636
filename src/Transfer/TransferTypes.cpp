// TransferTypes.cpp
#include "TransferTypes.h"

#include <QDir>

QString transferDirectionName(TransferDirection d)
{
    return d == TransferDirection::Upload ? QStringLiteral("upload") : QStringLiteral("download");
}

QString transferStateName(TransferState s)
{
    switch (s) {
        case TransferState::Pending:   return "pending";
        case TransferState::Running:   return "running";
        case TransferState::Completed: return "completed";
        case TransferState::Failed:    return "failed";
        case TransferState::Cancelled: return "cancelled";
    }
    return "unknown";
}

bool isTransferFinal(TransferState s)
{
    return s == TransferState::Completed
        || s == TransferState::Failed
        || s == TransferState::Cancelled;
}

namespace TransferPaths {

QString joinRemote(const QString& base, const QString& rel)
{
    if (base.isEmpty()) return rel;
    if (base.endsWith('/')) return base + rel;
    return base + "/" + rel;
}

QString joinLocal(const QString& base, const QString& rel)
{
    return QDir(base).filePath(rel);
}

QString remoteParent(const QString& path)
{
    QString p = path;
    while (p.size() > 1 && p.endsWith('/'))
        p.chop(1);

    const int slash = p.lastIndexOf('/');
    if (slash < 0) return QStringLiteral(".");
    if (slash == 0) return QStringLiteral("/");
    return p.left(slash);
}

QString baseName(const QString& path)
{
    QString p = QDir::fromNativeSeparators(path);
    while (p.size() > 1 && p.endsWith('/'))
        p.chop(1);

    const int slash = p.lastIndexOf('/');
    return slash < 0 ? p : p.mid(slash + 1);
}

bool hasCopyableName(const QString& path)
{
    const QString name = baseName(path.trimmed());
    return !name.isEmpty() && name != "/" && name != "." && name != "..";
}

// Display only (B / KB / MB / GB).
QString prettySize(quint64 bytes)
{
    const double b = (double)bytes;
    if (b < 1024.0) return QString("%1 B").arg(bytes);
    if (b < 1024.0 * 1024.0) return QString::number(b / 1024.0, 'f', 1) + " KB";
    if (b < 1024.0 * 1024.0 * 1024.0) return QString::number(b / (1024.0 * 1024.0), 'f', 1) + " MB";
    return QString::number(b / (1024.0 * 1024.0 * 1024.0), 'f', 1) + " GB";
}

} // namespace TransferPaths
