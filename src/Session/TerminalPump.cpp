#include "TerminalPump.h"
#include "SshBackend.h"

#include <QDebug>
#include <QMutexLocker>
#include <QThread>

#include <utility>

static constexpr int kReadBufSize = 16 * 1024;
static constexpr int kIdleSleepMs = 5;

TerminalPump::TerminalPump(int sessionId, std::unique_ptr<SshChannel> channel, QObject* parent)
    : QObject(parent)
    , m_sessionId(sessionId)
    , m_channel(std::move(channel))
{
}

TerminalPump::~TerminalPump()
{
    stop();
}

void TerminalPump::start()
{
    if (m_thread || !m_channel)
        return;

    m_running.storeRelease(true);
    m_thread = QThread::create([this] { run(); });
    m_thread->setObjectName(QString("pty-pump-%1").arg(m_sessionId));
    m_thread->start();
}

void TerminalPump::stop()
{
    m_stopRequested.storeRelease(true);

    if (m_thread) {
        m_thread->wait();
        delete m_thread;
        m_thread = nullptr;
    }

    if (m_channel)
        m_channel->close();

    m_running.storeRelease(false);
}

void TerminalPump::enqueue(const QByteArray& bytes)
{
    if (bytes.isEmpty() || !m_running.loadAcquire())
        return;

    QMutexLocker lock(&m_inMutex);
    m_input.enqueue(bytes);
}

bool TerminalPump::resize(int cols, int rows)
{
    if (cols <= 0 || rows <= 0 || !m_running.loadAcquire())
        return false;

    QMutexLocker lock(&m_inMutex);
    m_pendingCols = cols;
    m_pendingRows = rows;
    return true;
}

// ===========================================================================
// Pump loop (pump thread)
// ===========================================================================
void TerminalPump::run()
{
    qDebug().noquote() << QString("[SESSION] pump %1 started").arg(m_sessionId);

    ChannelError reason = ChannelError::None;
    QString message;
    char buf[kReadBufSize];

    while (!m_stopRequested.loadAcquire()) {
        bool didWork = false;

        // Drain pending keystrokes in arrival order.
        QQueue<QByteArray> pending;
        int cols = 0;
        int rows = 0;
        {
            QMutexLocker lock(&m_inMutex);
            pending.swap(m_input);
            std::swap(cols, m_pendingCols);
            std::swap(rows, m_pendingRows);
        }

        if (cols > 0) {
            QString detail;
            if (!m_channel->resize(cols, rows, &detail))
                qWarning().noquote() << QString("[SESSION] %1 resize failed: %2").arg(m_sessionId).arg(detail);
            didWork = true;
        }

        bool writeFailed = false;
        while (!pending.isEmpty()) {
            ChannelError code = ChannelError::None;
            if (!m_channel->write(pending.dequeue(), &code, &message)) {
                // A failed write always ends the pump, even when the channel gave no code.
                reason = code != ChannelError::None ? code : ChannelError::IoError;
                writeFailed = true;
                break;
            }
            didWork = true;
        }
        if (writeFailed)
            break;

        ChannelError code = ChannelError::None;
        const int n = m_channel->read(buf, sizeof(buf), &code, &message);
        if (n > 0) {
            emit output(m_sessionId, QByteArray(buf, n));
            didWork = true;
        } else if (n < 0) {
            reason = code != ChannelError::None ? code : ChannelError::IoError;
            break;
        }

        if (!didWork)
            QThread::msleep(kIdleSleepMs);
    }

    m_running.storeRelease(false);

    qDebug().noquote() << QString("[SESSION] pump %1 finished (%2)").arg(m_sessionId).arg(errorKey(reason));
    emit finished(m_sessionId, reason, message);
}
