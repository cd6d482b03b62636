#pragma once

#include <QFuture>
#include <QMap>
#include <QMutex>
#include <QObject>
#include <QString>
#include <QVector>

#include <memory>

#include "TransferTypes.h"
#include "../CancellationToken.h"

class ConnectionStore;
class SessionManager;
struct TransferSlot;

/*
    TransferEngine
    --------------
    Runs upload/download jobs built by TransferWizard.

    - start() borrows the session's SFTP channel (LeasePurpose::Transfer) and
      fails with SessionBusy if another job or a browser holds it.
      Jobs on different sessions run in parallel on the global QThreadPool.
    - The source tree is enumerated first; transferProgress() then reports
      bytesDone/totalBytes at most once per progress interval, plus a first
      event once the plan is known and a final one at the end.
    - cancel() is cooperative (checked between chunks and between files).
      Partially written data is left in place.
    - The lease is returned before transferFinished() is emitted.

    Signals come from worker threads.
*/
class TransferEngine : public QObject
{
    Q_OBJECT
public:
    static constexpr int kMaxHistory = 50;

    explicit TransferEngine(SessionManager* sessions,
                            ConnectionStore* store = nullptr,
                            QObject* parent = nullptr);
    ~TransferEngine() override;

    void setChunkSize(int bytes);
    void setProgressIntervalMs(int ms);
    int  chunkSize() const;
    int  progressIntervalMs() const;

    // Job id, or -1.
    int start(const TransferRequest& request, TransferError* code = nullptr, QString* err = nullptr);

    bool cancel(int jobId);
    void cancelAll();

    // Oldest first; finished jobs beyond kMaxHistory are dropped.
    QVector<TransferJob> jobs() const;
    bool job(int jobId, TransferJob* out) const;

    bool hasActiveJob(int sessionId) const;

    // Blocks until every started job has finished.
    void waitForAll();

signals:
    void transferStarted(int jobId);
    void transferProgress(int jobId, quint64 bytesDone, quint64 totalBytes, const QString& currentFile);
    void transferFinished(int jobId, TransferState state);

private:
    struct PlanItem {
        bool    isDir = false;
        QString source;
        QString target;
        quint64 size = 0;
    };

    void run(std::shared_ptr<TransferSlot> slot);

    bool planUpload(TransferSlot& slot, QVector<PlanItem>* plan, quint64* total,
                    TransferError* code, QString* err);
    bool planDownload(TransferSlot& slot, QVector<PlanItem>* plan, quint64* total,
                      TransferError* code, QString* err);
    bool collectRemoteRecursive(TransferSlot& slot, const QString& remoteDir, const QString& localDir,
                                QVector<PlanItem>* plan, quint64* total,
                                TransferError* code, QString* err);

    bool copyUpload(TransferSlot& slot, const PlanItem& item, TransferError* code, QString* err);
    bool copyDownload(TransferSlot& slot, const PlanItem& item, TransferError* code, QString* err);

    void addProgress(TransferSlot& slot, quint64 delta, bool force);
    void finishJob(TransferSlot& slot, TransferState state, TransferError error, const QString& message);
    void rememberDirectory(const TransferSlot& slot);
    void pruneHistoryLocked();

    SessionManager*  m_sessions = nullptr;
    ConnectionStore* m_store = nullptr;

    mutable QMutex   m_mutex;
    int              m_chunkSize = 64 * 1024;
    int              m_progressIntervalMs = 100;
    int              m_nextId = 1;
    QMap<int, std::shared_ptr<TransferSlot>> m_jobs;
    QVector<int>     m_order;
};
