// ErrorTypes.cpp
#include "ErrorTypes.h"

#include <QCoreApplication>

// Messages go through translate() like the rest of the user-facing strings.
static QString tr(const char* s)
{
    return QCoreApplication::translate("Errors", s);
}

QString errorMessage(VaultError e)
{
    switch (e) {
        case VaultError::None:                    return QString();
        case VaultError::WrongPassword:           return tr("Wrong master password");
        case VaultError::VaultCorrupt:            return tr("Vault file is corrupt");
        case VaultError::VaultUnsupportedVersion: return tr("Vault file was written by a newer version");
        case VaultError::IoError:                 return tr("Could not read or write the vault file");
    }
    return tr("Unknown vault error");
}

QString errorMessage(StoreError e)
{
    switch (e) {
        case StoreError::None:            return QString();
        case StoreError::InvalidRecord:   return tr("Connection is incomplete");
        case StoreError::DuplicateRecord: return tr("Connection already exists");
        case StoreError::NotFound:        return tr("No such connection");
        case StoreError::Locked:          return tr("Vault is locked");
        case StoreError::PersistFailed:   return tr("Could not save connections");
    }
    return tr("Unknown store error");
}

QString errorMessage(ConnectError e)
{
    switch (e) {
        case ConnectError::None:               return QString();
        case ConnectError::NetworkUnreachable: return tr("Host unreachable");
        case ConnectError::AuthRejected:       return tr("Authentication rejected");
        case ConnectError::HostKeyMismatch:    return tr("Host key does not match known_hosts");
        case ConnectError::Timeout:            return tr("Connection timed out");
        case ConnectError::KeyUnreadable:      return tr("Private key could not be loaded");
    }
    return tr("Unknown connection error");
}

QString errorMessage(ChannelError e)
{
    switch (e) {
        case ChannelError::None:          return QString();
        case ChannelError::ChannelBusy:   return tr("A terminal is already open on this session");
        case ChannelError::RemoteClosed:  return tr("Remote side closed the channel");
        case ChannelError::NoSuchSession: return tr("No such session");
        case ChannelError::NotReady:      return tr("Session is not connected");
        case ChannelError::IoError:       return tr("Channel I/O error");
    }
    return tr("Unknown channel error");
}

QString errorMessage(TransferError e)
{
    switch (e) {
        case TransferError::None:             return QString();
        case TransferError::IoError:          return tr("Transfer I/O error");
        case TransferError::PermissionDenied: return tr("Permission denied");
        case TransferError::Cancelled:        return tr("Transfer cancelled");
        case TransferError::SessionBusy:      return tr("Another transfer is running on this session");
        case TransferError::InvalidRequest:   return tr("Transfer request is incomplete");
        case TransferError::InvalidPath:      return tr("Source must name a file or directory");
    }
    return tr("Unknown transfer error");
}

QString errorKey(VaultError e)
{
    switch (e) {
        case VaultError::None:                    return "none";
        case VaultError::WrongPassword:           return "wrong_password";
        case VaultError::VaultCorrupt:            return "vault_corrupt";
        case VaultError::VaultUnsupportedVersion: return "vault_unsupported_version";
        case VaultError::IoError:                 return "io_error";
    }
    return "unknown";
}

QString errorKey(ConnectError e)
{
    switch (e) {
        case ConnectError::None:               return "none";
        case ConnectError::NetworkUnreachable: return "network_unreachable";
        case ConnectError::AuthRejected:       return "auth_rejected";
        case ConnectError::HostKeyMismatch:    return "host_key_mismatch";
        case ConnectError::Timeout:            return "timeout";
        case ConnectError::KeyUnreadable:      return "key_unreadable";
    }
    return "unknown";
}

QString errorKey(ChannelError e)
{
    switch (e) {
        case ChannelError::None:          return "none";
        case ChannelError::ChannelBusy:   return "channel_busy";
        case ChannelError::RemoteClosed:  return "remote_closed";
        case ChannelError::NoSuchSession: return "no_such_session";
        case ChannelError::NotReady:      return "not_ready";
        case ChannelError::IoError:       return "io_error";
    }
    return "unknown";
}

QString errorKey(TransferError e)
{
    switch (e) {
        case TransferError::None:             return "none";
        case TransferError::IoError:          return "io_error";
        case TransferError::PermissionDenied: return "permission_denied";
        case TransferError::Cancelled:        return "cancelled";
        case TransferError::SessionBusy:      return "session_busy";
        case TransferError::InvalidRequest:   return "invalid_request";
        case TransferError::InvalidPath:      return "invalid_path";
    }
    return "unknown";
}
