#pragma once

#include <QObject>
#include <QTimer>

class ConnectionStore;

// Locks the store after `minutes` without touch(). 0 minutes disables it.
// Lives on the event loop thread.
class IdleLock : public QObject
{
    Q_OBJECT
public:
    IdleLock(ConnectionStore* store, int minutes, QObject* parent = nullptr);

    void setTimeoutMinutes(int minutes);
    void setTimeoutMs(int ms);      // tests
    int  timeoutMs() const { return m_timeoutMs; }
    bool isActive() const { return m_timer.isActive(); }

public slots:
    // Call on any user activity (keystroke, command).
    void touch();

signals:
    void idleLocked();

private slots:
    void onTimeout();

private:
    ConnectionStore* m_store = nullptr;
    QTimer m_timer;
    int    m_timeoutMs = 0;
};
