#pragma once

#include "SshBackend.h"

// SshBackend over libssh (session, pki, channel, sftp APIs).
//
// Every connection owns one ssh_session plus a mutex; all libssh calls on
// that session and on its channels / sftp handles take that mutex, so the
// terminal pump and a transfer can share a connection safely.
class LibsshBackend : public SshBackend
{
public:
    LibsshBackend();

    std::shared_ptr<const SshPrivateKey> loadPrivateKey(const QString& path,
                                                        const QString& passphrase,
                                                        ConnectError* code = nullptr,
                                                        QString* err = nullptr) override;

    std::unique_ptr<SshConnection> open(const SshConnectOptions& options,
                                        const SshAuth& auth,
                                        const std::function<void()>& onAuthenticating,
                                        ConnectError* code = nullptr,
                                        QString* err = nullptr) override;
};
