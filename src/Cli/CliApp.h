#pragma once

#include <QObject>
#include <QString>
#include <QStringList>

#include <memory>

#include "../AppSettings.h"
#include "../Transfer/TransferTypes.h"
#include "../Vault/ConnectionRecord.h"

class ConnectionStore;
class CryptoVault;
class IdleLock;
class SessionManager;
class SshBackend;
class TransferEngine;

// Connection fields given on the command line (add / edit).
struct CliRecordOptions
{
    QString host;
    int     port = -1;          // -1 => unchanged / default
    QString user;
    QString name;
    QString keyPath;            // switch to key auth
    bool    passwordAuth = false;   // switch to (or re-enter) password auth
};

/*
    CliApp
    ------
    Command-line driver over the core: vault, sessions and transfers.
    Each run() executes one command and returns the process exit code
    (0 ok, 1 failure, 2 usage).

    Long-running commands (shell, upload, download) spin a local QEventLoop;
    the object must live on the thread that runs QCoreApplication.
*/
class CliApp : public QObject
{
    Q_OBJECT
public:
    enum ExitCode { ExitOk = 0, ExitFailure = 1, ExitUsage = 2 };

    explicit CliApp(const AppSettings& settings, QObject* parent = nullptr);
    ~CliApp() override;

    int run(const QString& command, const QStringList& args, const CliRecordOptions& options);

    static QStringList commands();

private:
    int cmdInit();
    int cmdList();
    int cmdAdd(const CliRecordOptions& o);
    int cmdEdit(int id, const CliRecordOptions& o);
    int cmdRemove(int id);
    int cmdPasswd();
    int cmdTest(int id);
    int cmdShell(int id);
    int cmdLs(int id, const QString& dir);
    int cmdTransfer(TransferDirection direction, int id, const QString& source, const QString& targetDir);

    bool unlockStore();
    bool loadRecord(int id, ConnectionRecord* out);
    bool promptCredential(ConnectionRecord* r, const CliRecordOptions& o, bool editing);

    // Connects and waits for Ready. Session id, or -1.
    int  openSession(const ConnectionRecord& record);
    void closeAll();

    AppSettings                      m_settings;
    std::unique_ptr<CryptoVault>     m_vault;
    std::unique_ptr<ConnectionStore> m_store;
    std::unique_ptr<SshBackend>      m_backend;
    std::unique_ptr<SessionManager>  m_sessions;
    std::unique_ptr<TransferEngine>  m_transfers;
    IdleLock*                        m_idle = nullptr;
};
