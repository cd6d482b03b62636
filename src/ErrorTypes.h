// ErrorTypes.h
//
// Error codes shared by the vault, session and transfer layers.
//
// Reporting convention (same everywhere in tabssh):
//   - operations return bool (or an id, -1 on failure)
//   - optional out-params receive the code and a short human-readable message
//   - full detail goes to the diagnostic log, never to the user message
//
// Codes are registered metatypes so they travel through queued Qt signals.

#pragma once

#include <QMetaType>
#include <QString>

enum class VaultError {
    None,
    WrongPassword,
    VaultCorrupt,
    VaultUnsupportedVersion,
    IoError
};

enum class StoreError {
    None,
    InvalidRecord,
    DuplicateRecord,
    NotFound,
    Locked,
    PersistFailed
};

enum class ConnectError {
    None,
    NetworkUnreachable,
    AuthRejected,
    HostKeyMismatch,
    Timeout,
    KeyUnreadable
};

enum class ChannelError {
    None,
    ChannelBusy,
    RemoteClosed,
    NoSuchSession,
    NotReady,
    IoError
};

enum class TransferError {
    None,
    IoError,
    PermissionDenied,
    Cancelled,
    SessionBusy,
    InvalidRequest,
    InvalidPath
};

Q_DECLARE_METATYPE(VaultError)
Q_DECLARE_METATYPE(StoreError)
Q_DECLARE_METATYPE(ConnectError)
Q_DECLARE_METATYPE(ChannelError)
Q_DECLARE_METATYPE(TransferError)

// Short user-facing messages (one line, no trailing period).
QString errorMessage(VaultError e);
QString errorMessage(StoreError e);
QString errorMessage(ConnectError e);
QString errorMessage(ChannelError e);
QString errorMessage(TransferError e);

// Stable identifiers for structured logs ("wrong_password", ...).
QString errorKey(VaultError e);
QString errorKey(ConnectError e);
QString errorKey(ChannelError e);
QString errorKey(TransferError e);

// Helper used by every "fill the out-params" site.
template <typename Code>
inline void setError(Code* codeOut, QString* errOut, Code code, const QString& detail = QString())
{
    if (codeOut) *codeOut = code;
    if (errOut) *errOut = detail.isEmpty() ? errorMessage(code) : detail;
}
