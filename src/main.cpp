#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QFileInfo>
#include <QJsonObject>
#include <QUuid>

#include "AppSettings.h"
#include "AuditLogger.h"
#include "Logger.h"
#include "Cli/CliApp.h"

// main.cpp
// --------
// Entry point of the tabssh command-line front end.
//
// - Set QCoreApplication metadata (org/app name/version) for QSettings and paths
// - Install logging + audit logging (run id, app_start / app_exit)
// - Load AppSettings, apply command-line overrides
// - Dispatch one command to CliApp
int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);

    // Stable names: QStandardPaths resolves to ~/.config/tabssh/tabssh/ etc.
    QCoreApplication::setOrganizationName("tabssh");
    QCoreApplication::setApplicationName("tabssh");
    QCoreApplication::setApplicationVersion("1.0.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Multi-session SSH client with an encrypted connection vault.");
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption vaultOpt("vault", "Vault file to use.", "path");
    const QCommandLineOption verboseOpt("verbose", "Debug logging, mirrored to stderr.");
    const QCommandLineOption hostOpt("host", "Host name (add/edit).", "host");
    const QCommandLineOption portOpt("port", "Port (add/edit).", "port");
    const QCommandLineOption userOpt("user", "User name (add/edit).", "user");
    const QCommandLineOption nameOpt("name", "Friendly name (add/edit).", "name");
    const QCommandLineOption keyOpt("key", "Private key file; prompts for its passphrase (add/edit).", "path");
    const QCommandLineOption passwordOpt("password", "Use password authentication; prompts for it (edit).");

    parser.addOptions({ vaultOpt, verboseOpt, hostOpt, portOpt, userOpt, nameOpt, keyOpt, passwordOpt });
    parser.addPositionalArgument("command", CliApp::commands().join(" | "));
    parser.addPositionalArgument("args", "Command arguments.", "[args...]");

    parser.process(app);

    QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        parser.showHelp(CliApp::ExitUsage);
    }
    const QString command = positional.takeFirst();

    AppSettings settings = AppSettings::load();
    if (parser.isSet(vaultOpt))
        settings.vaultPath = QFileInfo(parser.value(vaultOpt)).absoluteFilePath();
    if (parser.isSet(verboseOpt))
        settings.logLevel = 2;

    // Logging + audit
    Logger::setLogLevel(settings.logLevel);
    Logger::setMirrorToStderr(parser.isSet(verboseOpt));
    Logger::install("tabssh");

    if (!settings.auditDir.isEmpty())
        AuditLogger::setAuditDirOverride(settings.auditDir);
    AuditLogger::install("tabssh");
    AuditLogger::setRunId(QUuid::createUuid().toString(QUuid::WithoutBraces));

    const int pruned = AuditLogger::pruneOlderThan(settings.auditRetentionDays);
    if (pruned > 0)
        qInfo().noquote() << QString("[AUDIT] pruned %1 old audit file(s)").arg(pruned);

    AuditLogger::writeEvent("app_start", QJsonObject{ { "command", command } });

    CliRecordOptions rec;
    rec.host         = parser.value(hostOpt);
    rec.user         = parser.value(userOpt);
    rec.keyPath      = parser.value(keyOpt);
    rec.passwordAuth = parser.isSet(passwordOpt);
    if (parser.isSet(nameOpt))
        rec.name = parser.value(nameOpt);
    if (parser.isSet(portOpt)) {
        bool ok = false;
        rec.port = parser.value(portOpt).toInt(&ok);
        if (!ok || rec.port < 1 || rec.port > 65535) {
            qCritical().noquote() << "Invalid --port:" << parser.value(portOpt);
            return CliApp::ExitUsage;
        }
    }

    int rc = CliApp::ExitFailure;
    {
        CliApp cli(settings);
        rc = cli.run(command, positional, rec);
    }

    AuditLogger::writeEvent("app_exit", QJsonObject{ { "command", command }, { "exit_code", rc } });
    AuditLogger::shutdown();
    Logger::uninstall();
    return rc;
}
