// IdleLock.cpp
#include "IdleLock.h"
#include "ConnectionStore.h"

#include <QDebug>

IdleLock::IdleLock(ConnectionStore* store, int minutes, QObject* parent)
    : QObject(parent)
    , m_store(store)
{
    m_timer.setSingleShot(true);
    connect(&m_timer, &QTimer::timeout, this, &IdleLock::onTimeout);

    // Unlocking (re)arms the timer, locking disarms it.
    connect(m_store, &ConnectionStore::lockedChanged, this, [this](bool locked) {
        if (locked) m_timer.stop();
        else touch();
    });

    setTimeoutMinutes(minutes);
}

void IdleLock::setTimeoutMinutes(int minutes)
{
    setTimeoutMs(minutes > 0 ? minutes * 60 * 1000 : 0);
}

void IdleLock::setTimeoutMs(int ms)
{
    m_timeoutMs = qMax(0, ms);
    if (m_timeoutMs == 0) {
        m_timer.stop();
        return;
    }
    m_timer.setInterval(m_timeoutMs);
    if (m_store->isUnlocked())
        m_timer.start();
}

void IdleLock::touch()
{
    if (m_timeoutMs > 0 && m_store->isUnlocked())
        m_timer.start();
}

void IdleLock::onTimeout()
{
    if (!m_store->isUnlocked())
        return;

    qInfo().noquote() << QString("[VAULT] idle for %1 ms, locking").arg(m_timeoutMs);
    m_store->lock();
    emit idleLocked();
}
