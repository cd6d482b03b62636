#pragma once

#include <QMutex>
#include <QObject>
#include <QString>
#include <QStringList>
#include <QVector>

#include "ConnectionRecord.h"

class CryptoVault;

/*
    ConnectionStore
    ---------------
    In-memory, ordered collection of ConnectionRecords backed by CryptoVault.

    - Records are kept sorted by recency: lastUsedAt descending, never-used
      records last, ties broken by insertion order (ascending id).
    - Every mutation re-serializes the whole collection and persists it
      through the vault. If the persist fails, the in-memory change is rolled
      back and PersistFailed is reported.
    - Thread-safe: connect workers call recordUsed()/recordFailure() from the
      thread pool.

    The vault is borrowed; it must outlive the store.
*/
class ConnectionStore : public QObject
{
    Q_OBJECT
public:
    explicit ConnectionStore(CryptoVault* vault, QObject* parent = nullptr);

    bool vaultExists() const;

    // Creates a new empty vault (fails if one exists at the path).
    bool initialize(const QString& password, VaultError* code = nullptr, QString* err = nullptr);

    bool unlock(const QString& password, VaultError* code = nullptr, QString* err = nullptr);
    void lock();
    bool isUnlocked() const;

    bool changePassword(const QString& oldPassword, const QString& newPassword,
                        VaultError* code = nullptr, QString* err = nullptr);

    // Snapshot in recency order. Empty while locked.
    QVector<ConnectionRecord> list() const;

    bool get(int id, ConnectionRecord* out, StoreError* code = nullptr, QString* err = nullptr) const;

    // Returns the new id, or -1.
    int add(const ConnectionRecord& record, StoreError* code = nullptr, QString* err = nullptr);

    // Replaces connection fields; id, history, lastUsedAt and lastRemoteDir are preserved.
    bool update(const ConnectionRecord& record, StoreError* code = nullptr, QString* err = nullptr);

    bool remove(int id, StoreError* code = nullptr, QString* err = nullptr);

    bool recordUsed(int id, StoreError* code = nullptr, QString* err = nullptr);
    bool recordFailure(int id, StoreError* code = nullptr, QString* err = nullptr);

    bool setLastRemoteDir(int id, const QString& dir, StoreError* code = nullptr, QString* err = nullptr);
    bool setLastLocalDir(const QString& dir, StoreError* code = nullptr, QString* err = nullptr);
    QString lastLocalDir() const;

    // Key files used by stored records, most recently used first, no duplicates.
    QStringList knownKeyPaths() const;

    // Id of a record with the same user/host/auth kind/key path, or -1.
    int findByIdentity(const ConnectionRecord& probe, int ignoreId = -1) const;

signals:
    void changed();
    void lockedChanged(bool locked);

private:
    struct State {
        QVector<ConnectionRecord> records;
        int     nextId = 1;
        QString lastLocalDir;
    };

    QByteArray serializeLocked() const;
    bool deserialize(const QByteArray& plain, State* out) const;
    void sortLocked();
    int  indexOfLocked(int id) const;

    // Persists m_state; on failure restores `before`.
    bool commitLocked(const State& before, StoreError* code, QString* err);

    CryptoVault*   m_vault = nullptr;
    mutable QMutex m_mutex;
    bool           m_unlocked = false;
    State          m_state;
};
