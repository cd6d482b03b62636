// TransferEngine.cpp
#include "TransferEngine.h"

#include "../AuditLogger.h"
#include "../Session/SessionManager.h"
#include "../Vault/ConnectionStore.h"

#include <QDebug>
#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QJsonObject>
#include <QMutexLocker>
#include <QtConcurrent>

#include <algorithm>

struct TransferSlot
{
    TransferJob          job;             // guarded by TransferEngine::m_mutex
    TransferRequest      request;
    int                  recordId = 0;
    CancellationTokenPtr token;
    SftpLeasePtr         lease;           // worker thread only
    QFuture<void>        future;

    // Worker-local progress pacing.
    QElapsedTimer        sinceEmit;
    int                  chunkSize = 64 * 1024;
    int                  intervalMs = 100;
    quint64              bytesDone = 0;
    quint64              totalBytes = 0;
    QString              currentFile;
};

static TransferError fileErrorCode(const QFile& f)
{
    return f.error() == QFileDevice::PermissionsError ? TransferError::PermissionDenied
                                                      : TransferError::IoError;
}

TransferEngine::TransferEngine(SessionManager* sessions, ConnectionStore* store, QObject* parent)
    : QObject(parent)
    , m_sessions(sessions)
    , m_store(store)
{
    qRegisterMetaType<TransferState>("TransferState");
    qRegisterMetaType<TransferDirection>("TransferDirection");
}

TransferEngine::~TransferEngine()
{
    cancelAll();
    waitForAll();
}

void TransferEngine::setChunkSize(int bytes)
{
    QMutexLocker lock(&m_mutex);
    m_chunkSize = qBound(4 * 1024, bytes, 1024 * 1024);
}

void TransferEngine::setProgressIntervalMs(int ms)
{
    QMutexLocker lock(&m_mutex);
    m_progressIntervalMs = qMax(0, ms);
}

int TransferEngine::chunkSize() const
{
    QMutexLocker lock(&m_mutex);
    return m_chunkSize;
}

int TransferEngine::progressIntervalMs() const
{
    QMutexLocker lock(&m_mutex);
    return m_progressIntervalMs;
}

// ===========================================================================
// Job control
// ===========================================================================
int TransferEngine::start(const TransferRequest& request, TransferError* code, QString* err)
{
    if (!m_sessions || request.sessionId <= 0
        || request.sourcePath.trimmed().isEmpty()
        || request.targetDir.trimmed().isEmpty()) {
        setError(code, err, TransferError::InvalidRequest);
        return -1;
    }

    if (!TransferPaths::hasCopyableName(request.sourcePath)) {
        setError(code, err, TransferError::InvalidPath);
        return -1;
    }
    const QString name = TransferPaths::baseName(request.sourcePath);

    auto slot = std::make_shared<TransferSlot>();
    slot->token   = std::make_shared<CancellationToken>();
    slot->request = request;

    slot->lease = m_sessions->acquireSftp(request.sessionId, slot->token, LeasePurpose::Transfer, code, err);
    if (!slot->lease)
        return -1;

    SessionInfo info;
    if (m_sessions->sessionInfo(request.sessionId, &info))
        slot->recordId = info.recordId;

    int id = -1;
    {
        QMutexLocker lock(&m_mutex);
        id = m_nextId++;

        TransferJob& j = slot->job;
        j.id        = id;
        j.sessionId = request.sessionId;
        j.direction = request.direction;
        j.source    = request.sourcePath;
        j.target    = request.direction == TransferDirection::Upload
                        ? TransferPaths::joinRemote(request.targetDir, name)
                        : TransferPaths::joinLocal(request.targetDir, name);
        j.state     = TransferState::Pending;
        j.startedAt = QDateTime::currentDateTimeUtc();

        slot->chunkSize  = m_chunkSize;
        slot->intervalMs = m_progressIntervalMs;

        m_jobs.insert(id, slot);
        m_order.push_back(id);
    }

    qInfo().noquote() << QString("[XFER] job %1 %2 session=%3 '%4' -> '%5'")
                             .arg(id)
                             .arg(transferDirectionName(request.direction))
                             .arg(request.sessionId)
                             .arg(request.sourcePath, slot->job.target);

    emit transferStarted(id);

    // The worker owns the lease from here on.
    QFuture<void> f = QtConcurrent::run([this, slot] { run(slot); });
    {
        QMutexLocker lock(&m_mutex);
        slot->future = f;
    }

    if (code) *code = TransferError::None;
    return id;
}

bool TransferEngine::cancel(int jobId)
{
    QMutexLocker lock(&m_mutex);
    auto it = m_jobs.find(jobId);
    if (it == m_jobs.end() || isTransferFinal(it.value()->job.state))
        return false;

    it.value()->token->cancel();
    qInfo().noquote() << QString("[XFER] job %1 cancel requested").arg(jobId);
    return true;
}

void TransferEngine::cancelAll()
{
    QMutexLocker lock(&m_mutex);
    for (const auto& slot : m_jobs) {
        if (!isTransferFinal(slot->job.state))
            slot->token->cancel();
    }
}

QVector<TransferJob> TransferEngine::jobs() const
{
    QMutexLocker lock(&m_mutex);
    QVector<TransferJob> out;
    out.reserve(m_order.size());
    for (int id : m_order)
        out.push_back(m_jobs.value(id)->job);
    return out;
}

bool TransferEngine::job(int jobId, TransferJob* out) const
{
    QMutexLocker lock(&m_mutex);
    auto it = m_jobs.find(jobId);
    if (it == m_jobs.end())
        return false;
    if (out) *out = it.value()->job;
    return true;
}

bool TransferEngine::hasActiveJob(int sessionId) const
{
    QMutexLocker lock(&m_mutex);
    for (const auto& slot : m_jobs) {
        if (slot->job.sessionId == sessionId && !isTransferFinal(slot->job.state))
            return true;
    }
    return false;
}

void TransferEngine::waitForAll()
{
    for (;;) {
        QVector<QFuture<void>> pending;
        {
            QMutexLocker lock(&m_mutex);
            for (const auto& slot : m_jobs) {
                if (slot->future.isStarted() && !slot->future.isFinished())
                    pending.push_back(slot->future);
            }
        }
        if (pending.isEmpty())
            return;
        for (QFuture<void>& f : pending)
            f.waitForFinished();
    }
}

// ===========================================================================
// Worker
// ===========================================================================
void TransferEngine::run(std::shared_ptr<TransferSlot> slot)
{
    {
        QMutexLocker lock(&m_mutex);
        slot->job.state = TransferState::Running;
    }

    QVector<PlanItem> plan;
    quint64 total = 0;
    TransferError code = TransferError::None;
    QString err;

    const bool upload = slot->request.direction == TransferDirection::Upload;
    const bool planned = upload ? planUpload(*slot, &plan, &total, &code, &err)
                                : planDownload(*slot, &plan, &total, &code, &err);
    if (!planned) {
        finishJob(*slot, code == TransferError::Cancelled ? TransferState::Cancelled : TransferState::Failed,
                  code, err);
        return;
    }

    slot->totalBytes = total;
    {
        QMutexLocker lock(&m_mutex);
        slot->job.totalBytes = total;
    }

    qDebug().noquote() << QString("[XFER] job %1 plan: %2 item(s), %3")
                              .arg(slot->job.id).arg(plan.size()).arg(TransferPaths::prettySize(total));

    addProgress(*slot, 0, true);

    for (const PlanItem& item : plan) {
        if (slot->token->isCancelled()) {
            finishJob(*slot, TransferState::Cancelled, TransferError::Cancelled, errorMessage(TransferError::Cancelled));
            return;
        }

        bool ok = true;
        if (item.isDir) {
            ok = upload ? slot->lease->sftp()->mkdir(item.target, &code, &err)
                        : QDir().mkpath(item.target);
            if (!ok && !upload) {
                code = TransferError::IoError;
                err  = QString("Cannot create directory %1").arg(item.target);
            }
        } else {
            ok = upload ? copyUpload(*slot, item, &code, &err)
                        : copyDownload(*slot, item, &code, &err);
        }

        if (!ok) {
            if (code == TransferError::Cancelled)
                finishJob(*slot, TransferState::Cancelled, code, errorMessage(code));
            else
                finishJob(*slot, TransferState::Failed, code, err);
            return;
        }
    }

    finishJob(*slot, TransferState::Completed, TransferError::None, QString());
}

// ---------------------------------------------------------------------------
// Planning: pre-order, so every directory precedes its contents.
// ---------------------------------------------------------------------------
bool TransferEngine::planUpload(TransferSlot& slot, QVector<PlanItem>* plan, quint64* total,
                                TransferError* code, QString* err)
{
    const QFileInfo root(slot.request.sourcePath);
    if (!root.exists()) {
        setError(code, err, TransferError::InvalidRequest,
                 QString("No such file or directory: %1").arg(slot.request.sourcePath));
        return false;
    }

    const QString targetRoot = slot.job.target;

    if (!root.isDir()) {
        plan->push_back({ false, root.absoluteFilePath(), targetRoot, (quint64)root.size() });
        *total += (quint64)root.size();
        return true;
    }

    // Explicit stack instead of QDirIterator so directories come out
    // before their children and empty ones are kept.
    struct Pending { QString local; QString remote; };
    QVector<Pending> stack;
    stack.push_back({ root.absoluteFilePath(), targetRoot });

    while (!stack.isEmpty()) {
        if (slot.token->isCancelled()) {
            setError(code, err, TransferError::Cancelled);
            return false;
        }

        const Pending cur = stack.takeLast();
        plan->push_back({ true, cur.local, cur.remote, 0 });

        QDir dir(cur.local);
        if (!dir.isReadable()) {
            setError(code, err, TransferError::PermissionDenied, QString("Cannot read %1").arg(cur.local));
            return false;
        }

        const QFileInfoList infos = dir.entryInfoList(
            QDir::Files | QDir::Dirs | QDir::NoDotAndDotDot | QDir::Hidden | QDir::System,
            QDir::Name | QDir::DirsLast);

        QVector<Pending> subdirs;
        for (const QFileInfo& fi : infos) {
            // Symlinks are skipped to avoid loops.
            if (fi.isSymLink())
                continue;

            const QString remote = TransferPaths::joinRemote(cur.remote, fi.fileName());
            if (fi.isDir()) {
                subdirs.push_back({ fi.absoluteFilePath(), remote });
            } else if (fi.isFile()) {
                plan->push_back({ false, fi.absoluteFilePath(), remote, (quint64)fi.size() });
                *total += (quint64)fi.size();
            }
        }

        for (int i = subdirs.size() - 1; i >= 0; --i)
            stack.push_back(subdirs.at(i));
    }

    return true;
}

bool TransferEngine::planDownload(TransferSlot& slot, QVector<PlanItem>* plan, quint64* total,
                                  TransferError* code, QString* err)
{
    SftpChannel* sftp = slot.lease->sftp();

    SftpEntry root;
    if (!sftp->stat(slot.request.sourcePath, &root, code, err))
        return false;

    const QString targetRoot = slot.job.target;

    if (!root.isDir) {
        plan->push_back({ false, slot.request.sourcePath, targetRoot, root.size });
        *total += root.size;
        return true;
    }

    plan->push_back({ true, slot.request.sourcePath, targetRoot, 0 });
    return collectRemoteRecursive(slot, slot.request.sourcePath, targetRoot, plan, total, code, err);
}

bool TransferEngine::collectRemoteRecursive(TransferSlot& slot, const QString& remoteDir, const QString& localDir,
                                            QVector<PlanItem>* plan, quint64* total,
                                            TransferError* code, QString* err)
{
    if (slot.token->isCancelled()) {
        setError(code, err, TransferError::Cancelled);
        return false;
    }

    QVector<SftpEntry> items;
    if (!slot.lease->sftp()->listDir(remoteDir, &items, code, err))
        return false;

    std::sort(items.begin(), items.end(), [](const SftpEntry& a, const SftpEntry& b) {
        if (a.isDir != b.isDir) return !a.isDir;
        return a.name < b.name;
    });

    for (const SftpEntry& it : items) {
        const QString remoteFull = TransferPaths::joinRemote(remoteDir, it.name);
        const QString localFull  = TransferPaths::joinLocal(localDir, it.name);

        if (it.isDir) {
            plan->push_back({ true, remoteFull, localFull, 0 });
            if (!collectRemoteRecursive(slot, remoteFull, localFull, plan, total, code, err))
                return false;
        } else {
            plan->push_back({ false, remoteFull, localFull, it.size });
            *total += it.size;
        }
    }

    return true;
}

// ---------------------------------------------------------------------------
// Chunked copy
// ---------------------------------------------------------------------------
bool TransferEngine::copyUpload(TransferSlot& slot, const PlanItem& item, TransferError* code, QString* err)
{
    slot.currentFile = item.source;

    QFile in(item.source);
    if (!in.open(QIODevice::ReadOnly)) {
        setError(code, err, fileErrorCode(in), QString("Cannot open %1: %2").arg(item.source, in.errorString()));
        return false;
    }

    std::unique_ptr<SftpFile> out = slot.lease->sftp()->openWrite(item.target, code, err);
    if (!out)
        return false;

    QByteArray buf(slot.chunkSize, Qt::Uninitialized);

    for (;;) {
        if (slot.token->isCancelled()) {
            out->close();
            setError(code, err, TransferError::Cancelled);
            return false;
        }

        const qint64 n = in.read(buf.data(), buf.size());
        if (n < 0) {
            out->close();
            setError(code, err, TransferError::IoError, QString("Read failed on %1: %2").arg(item.source, in.errorString()));
            return false;
        }
        if (n == 0)
            break;

        if (!out->write(buf.constData(), n, code, err)) {
            out->close();
            return false;
        }

        addProgress(slot, (quint64)n, false);
    }

    QString closeErr;
    if (!out->close(&closeErr)) {
        setError(code, err, TransferError::IoError, closeErr);
        return false;
    }
    return true;
}

bool TransferEngine::copyDownload(TransferSlot& slot, const PlanItem& item, TransferError* code, QString* err)
{
    slot.currentFile = item.source;

    std::unique_ptr<SftpFile> in = slot.lease->sftp()->openRead(item.source, code, err);
    if (!in)
        return false;

    QDir().mkpath(QFileInfo(item.target).absolutePath());

    QFile out(item.target);
    if (!out.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        in->close();
        setError(code, err, fileErrorCode(out), QString("Cannot open %1: %2").arg(item.target, out.errorString()));
        return false;
    }

    QByteArray buf(slot.chunkSize, Qt::Uninitialized);

    for (;;) {
        if (slot.token->isCancelled()) {
            in->close();
            setError(code, err, TransferError::Cancelled);
            return false;
        }

        const qint64 n = in->read(buf.data(), buf.size(), code, err);
        if (n < 0) {
            in->close();
            return false;
        }
        if (n == 0)
            break;

        if (out.write(buf.constData(), n) != n) {
            in->close();
            setError(code, err, fileErrorCode(out), QString("Write failed on %1: %2").arg(item.target, out.errorString()));
            return false;
        }

        addProgress(slot, (quint64)n, false);
    }

    in->close();
    if (!out.flush()) {
        setError(code, err, TransferError::IoError, QString("Write failed on %1: %2").arg(item.target, out.errorString()));
        return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// Progress and completion
// ---------------------------------------------------------------------------
void TransferEngine::addProgress(TransferSlot& slot, quint64 delta, bool force)
{
    // Never report more than the plan; a file can grow while it is read.
    slot.bytesDone = qMin(slot.totalBytes, slot.bytesDone + delta);

    {
        QMutexLocker lock(&m_mutex);
        slot.job.bytesDone   = slot.bytesDone;
        slot.job.currentFile = slot.currentFile;
    }

    if (!force && slot.sinceEmit.isValid() && slot.sinceEmit.elapsed() < slot.intervalMs)
        return;

    slot.sinceEmit.restart();
    emit transferProgress(slot.job.id, slot.bytesDone, slot.totalBytes, slot.currentFile);
}

void TransferEngine::finishJob(TransferSlot& slot, TransferState state, TransferError error, const QString& message)
{
    // A file that shrank while it was read still completes.
    if (state == TransferState::Completed)
        slot.bytesDone = slot.totalBytes;

    if (state == TransferState::Completed || slot.sinceEmit.isValid())
        addProgress(slot, 0, true);

    TransferJob snapshot;
    {
        QMutexLocker lock(&m_mutex);
        slot.job.state      = state;
        slot.job.error      = error;
        slot.job.message    = message;
        slot.job.bytesDone  = slot.bytesDone;
        slot.job.finishedAt = QDateTime::currentDateTimeUtc();
        snapshot = slot.job;
    }

    if (state == TransferState::Completed)
        rememberDirectory(slot);

    // Session is no longer busy once the lease is back.
    slot.lease.reset();

    if (state == TransferState::Failed) {
        qWarning().noquote() << QString("[XFER] job %1 failed (%2): %3")
                                    .arg(snapshot.id).arg(errorKey(error), message);
    } else {
        qInfo().noquote() << QString("[XFER] job %1 %2, %3 of %4")
                                 .arg(snapshot.id)
                                 .arg(transferStateName(state))
                                 .arg(TransferPaths::prettySize(snapshot.bytesDone))
                                 .arg(TransferPaths::prettySize(snapshot.totalBytes));
    }

    QJsonObject f;
    f["job_id"]      = snapshot.id;
    f["session_id"]  = snapshot.sessionId;
    f["direction"]   = transferDirectionName(snapshot.direction);
    f["outcome"]     = transferStateName(state);
    f["bytes_done"]  = QString::number(snapshot.bytesDone);
    f["total_bytes"] = QString::number(snapshot.totalBytes);
    if (error != TransferError::None)
        f["error"] = errorKey(error);
    AuditLogger::writeEvent("transfer_finished", f);

    {
        QMutexLocker lock(&m_mutex);
        pruneHistoryLocked();
    }

    emit transferFinished(snapshot.id, state);
}

void TransferEngine::rememberDirectory(const TransferSlot& slot)
{
    if (!m_store || !m_store->isUnlocked())
        return;

    QString err;
    bool ok = true;
    if (slot.request.direction == TransferDirection::Upload) {
        if (slot.recordId > 0)
            ok = m_store->setLastRemoteDir(slot.recordId, slot.request.targetDir, nullptr, &err);
    } else {
        ok = m_store->setLastLocalDir(slot.request.targetDir, nullptr, &err);
    }

    if (!ok)
        qWarning().noquote() << QString("[XFER] could not remember directory: %1").arg(err);
}

void TransferEngine::pruneHistoryLocked()
{
    int finished = 0;
    for (int id : m_order) {
        if (isTransferFinal(m_jobs.value(id)->job.state))
            ++finished;
    }

    for (int i = 0; i < m_order.size() && finished > kMaxHistory; ) {
        const int id = m_order.at(i);
        const auto slot = m_jobs.value(id);
        if (isTransferFinal(slot->job.state) && slot->future.isFinished()) {
            m_jobs.remove(id);
            m_order.removeAt(i);
            --finished;
        } else {
            ++i;
        }
    }
}
