#pragma once

#include <QString>
#include <QJsonObject>

// Structured audit trail (JSONL, one file per day).
//
// Events written by tabssh:
//   app_start / app_exit
//   vault_created / vault_unlocked / vault_unlock_failed / vault_locked / vault_password_changed
//   session_state        {session_id, record_id, from, to}
//   connect_attempt      {record_id, host, port, user, ok, error}
//   transfer_finished    {job_id, session_id, direction, outcome, bytes_done, total_bytes, error}
//
// Writing is best-effort: a failed open/write drops the event and never
// reaches the caller.
namespace AuditLogger {
    void install(const QString& appName);

    // Correlates all events of one process run.
    void setRunId(const QString& runId);
    QString runId();

    QString auditDir();
    QString currentLogFilePath();

    void setAuditDirOverride(const QString& absoluteDirPath); // empty => default

    void writeEvent(const QString& eventName, const QJsonObject& fields = QJsonObject());

    // Deletes audit-YYYY-MM-DD.jsonl files whose day is older than `days`
    // days before today. Returns the number of files removed.
    int pruneOlderThan(int days);

    // Closes the open file (tests, shutdown).
    void shutdown();
}
