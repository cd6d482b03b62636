#pragma once

#include <atomic>
#include <memory>

// Cooperative cancel flag shared between the party that requests the cancel
// (user, closeSession) and the worker that polls it between chunks/files.
class CancellationToken
{
public:
    void cancel() { m_cancelled.store(true); }
    bool isCancelled() const { return m_cancelled.load(); }

private:
    std::atomic_bool m_cancelled { false };
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;
