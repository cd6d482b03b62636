#pragma once

#include <QAtomicInteger>
#include <QByteArray>
#include <QMutex>
#include <QObject>
#include <QQueue>

#include <memory>

#include "../ErrorTypes.h"

class QThread;
class SshChannel;

/**
 * TerminalPump
 *
 * Duplex byte pump for one session's PTY channel, on its own QThread:
 *  - remote bytes  -> output(sessionId, bytes)
 *  - enqueue()d keystrokes -> remote, strictly FIFO
 *  - resize() requests -> window-change on the channel, latest size wins
 *
 * The loop polls the channel without blocking and sleeps a few ms when
 * idle, so a stop() request is honoured promptly.
 *
 * finished() is emitted exactly once, from the pump thread:
 *  - ChannelError::None          stop() was requested
 *  - ChannelError::RemoteClosed  remote EOF / channel closed
 *  - ChannelError::IoError       read or write failed
 */
class TerminalPump : public QObject
{
    Q_OBJECT
public:
    TerminalPump(int sessionId, std::unique_ptr<SshChannel> channel, QObject* parent = nullptr);
    ~TerminalPump() override;

    void start();

    // Requests the loop to exit, joins the thread, closes the channel.
    // Safe to call more than once; must not be called from the pump thread.
    void stop();

    // Thread-safe. Ignored once the pump has stopped.
    void enqueue(const QByteArray& bytes);

    // Thread-safe. Records the size; the pump thread sends it on its next pass.
    bool resize(int cols, int rows);

    bool isRunning() const { return m_running.loadAcquire(); }
    int  sessionId() const { return m_sessionId; }

signals:
    void output(int sessionId, const QByteArray& bytes);
    void finished(int sessionId, ChannelError reason, const QString& message);

private:
    void run();

    int                          m_sessionId;
    std::unique_ptr<SshChannel>  m_channel;
    QThread*                     m_thread = nullptr;

    QMutex                       m_inMutex;
    QQueue<QByteArray>           m_input;
    int                          m_pendingCols = 0;
    int                          m_pendingRows = 0;

    QAtomicInteger<bool>         m_running { false };
    QAtomicInteger<bool>         m_stopRequested { false };
};
