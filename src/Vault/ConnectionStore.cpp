// ConnectionStore.cpp
//
// Decrypted payload:
//   { "format": 1, "next_id": 4, "last_local_dir": "...", "records": [ ... ] }
// Record shape: see ConnectionRecord.cpp.

#include "ConnectionStore.h"
#include "CryptoVault.h"
#include "VaultCrypto.h"
#include "../AuditLogger.h"

#include <QCoreApplication>
#include <QDebug>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QMutexLocker>

#include <algorithm>

static constexpr int kPayloadFormat = 1;

static QString trStore(const char* s)
{
    return QCoreApplication::translate("ConnectionStore", s);
}

ConnectionStore::ConnectionStore(CryptoVault* vault, QObject* parent)
    : QObject(parent)
    , m_vault(vault)
{
}

bool ConnectionStore::vaultExists() const
{
    return m_vault && m_vault->exists();
}

// -----------------------------
// Serialization
// -----------------------------

QByteArray ConnectionStore::serializeLocked() const
{
    QJsonArray arr;
    for (const ConnectionRecord& r : m_state.records)
        arr.append(recordToJson(r));

    QJsonObject root;
    root["format"]  = kPayloadFormat;
    root["next_id"] = m_state.nextId;
    if (!m_state.lastLocalDir.isEmpty())
        root["last_local_dir"] = m_state.lastLocalDir;
    root["records"] = arr;

    return QJsonDocument(root).toJson(QJsonDocument::Compact);
}

bool ConnectionStore::deserialize(const QByteArray& plain, State* out) const
{
    QJsonParseError perr;
    const QJsonDocument doc = QJsonDocument::fromJson(plain, &perr);
    if (perr.error != QJsonParseError::NoError || !doc.isObject())
        return false;

    const QJsonObject root = doc.object();
    if (root.value("format").toInt(0) != kPayloadFormat)
        return false;

    State s;
    s.lastLocalDir = root.value("last_local_dir").toString();

    int maxId = 0;
    const QJsonArray arr = root.value("records").toArray();
    for (const QJsonValue& v : arr) {
        if (!v.isObject()) continue;
        ConnectionRecord r = recordFromJson(v.toObject());
        if (r.id <= 0) continue;
        maxId = std::max(maxId, r.id);
        s.records.push_back(r);
    }
    s.nextId = std::max(root.value("next_id").toInt(1), maxId + 1);

    *out = s;
    return true;
}

void ConnectionStore::sortLocked()
{
    std::stable_sort(m_state.records.begin(), m_state.records.end(),
                     [](const ConnectionRecord& a, const ConnectionRecord& b) {
                         const bool au = a.lastUsedAt.isValid();
                         const bool bu = b.lastUsedAt.isValid();
                         if (au != bu) return au;                 // used before never-used
                         if (au && a.lastUsedAt != b.lastUsedAt)
                             return a.lastUsedAt > b.lastUsedAt;  // most recent first
                         return a.id < b.id;                      // insertion order
                     });
}

int ConnectionStore::indexOfLocked(int id) const
{
    for (int i = 0; i < m_state.records.size(); ++i) {
        if (m_state.records[i].id == id) return i;
    }
    return -1;
}

bool ConnectionStore::commitLocked(const State& before, StoreError* code, QString* err)
{
    sortLocked();

    QByteArray plain = serializeLocked();
    VaultError verr = VaultError::None;
    QString detail;
    const bool ok = m_vault->persist(plain, &verr, &detail);
    VaultCrypto::wipe(plain);

    if (!ok) {
        qWarning().noquote() << "[VAULT] persist failed, rolling back:" << detail;
        m_state = before;
        setError(code, err, StoreError::PersistFailed);
        return false;
    }

    if (code) *code = StoreError::None;
    return true;
}

// -----------------------------
// Lock / unlock
// -----------------------------

bool ConnectionStore::initialize(const QString& password, VaultError* code, QString* err)
{
    if (vaultExists()) {
        setError(code, err, VaultError::IoError,
                 trStore("A vault already exists at %1").arg(m_vault->filePath()));
        return false;
    }

    QMutexLocker lock(&m_mutex);
    State fresh;
    const State before = m_state;
    m_state = fresh;

    QByteArray plain = serializeLocked();
    const bool ok = m_vault->create(password, plain, code, err);
    VaultCrypto::wipe(plain);

    if (!ok) {
        m_state = before;
        return false;
    }

    m_unlocked = true;
    lock.unlock();

    AuditLogger::writeEvent("vault_created");
    emit lockedChanged(false);
    emit changed();
    return true;
}

bool ConnectionStore::unlock(const QString& password, VaultError* code, QString* err)
{
    QByteArray plain;
    VaultError c = VaultError::None;
    if (!m_vault->unlock(password, &plain, &c, err)) {
        if (code) *code = c;
        AuditLogger::writeEvent("vault_unlock_failed", QJsonObject{ { "error", errorKey(c) } });
        return false;
    }

    State s;
    const bool parsed = deserialize(plain, &s);
    VaultCrypto::wipe(plain);

    if (!parsed) {
        // Authenticated but unreadable payload.
        m_vault->lock();
        qWarning().noquote() << "[VAULT] decrypted payload is not a valid record list";
        setError(code, err, VaultError::VaultCorrupt);
        AuditLogger::writeEvent("vault_unlock_failed", QJsonObject{ { "error", errorKey(VaultError::VaultCorrupt) } });
        return false;
    }

    {
        QMutexLocker lock(&m_mutex);
        m_state = s;
        sortLocked();
        m_unlocked = true;
    }

    qInfo().noquote() << QString("[VAULT] %1 connection(s) loaded").arg(s.records.size());
    AuditLogger::writeEvent("vault_unlocked");
    if (code) *code = VaultError::None;
    emit lockedChanged(false);
    emit changed();
    return true;
}

void ConnectionStore::lock()
{
    bool was = false;
    {
        QMutexLocker lock(&m_mutex);
        was = m_unlocked;
        m_state = State();
        m_unlocked = false;
    }
    m_vault->lock();

    if (was) {
        AuditLogger::writeEvent("vault_locked");
        emit lockedChanged(true);
        emit changed();
    }
}

bool ConnectionStore::isUnlocked() const
{
    QMutexLocker lock(&m_mutex);
    return m_unlocked;
}

bool ConnectionStore::changePassword(const QString& oldPassword, const QString& newPassword,
                                     VaultError* code, QString* err)
{
    if (!m_vault->changePassword(oldPassword, newPassword, code, err))
        return false;

    AuditLogger::writeEvent("vault_password_changed");
    return true;
}

// -----------------------------
// Queries
// -----------------------------

QVector<ConnectionRecord> ConnectionStore::list() const
{
    QMutexLocker lock(&m_mutex);
    return m_state.records;
}

bool ConnectionStore::get(int id, ConnectionRecord* out, StoreError* code, QString* err) const
{
    QMutexLocker lock(&m_mutex);
    if (!m_unlocked) {
        setError(code, err, StoreError::Locked);
        return false;
    }

    const int idx = indexOfLocked(id);
    if (idx < 0) {
        setError(code, err, StoreError::NotFound);
        return false;
    }

    if (out) *out = m_state.records[idx];
    if (code) *code = StoreError::None;
    return true;
}

QString ConnectionStore::lastLocalDir() const
{
    QMutexLocker lock(&m_mutex);
    return m_state.lastLocalDir;
}

QStringList ConnectionStore::knownKeyPaths() const
{
    QMutexLocker lock(&m_mutex);
    QStringList paths;
    for (const ConnectionRecord& r : m_state.records) {
        if (r.credential.kind != CredentialKind::PrivateKey || r.credential.keyPath.isEmpty())
            continue;
        if (!paths.contains(r.credential.keyPath))
            paths << r.credential.keyPath;
    }
    return paths;
}

int ConnectionStore::findByIdentity(const ConnectionRecord& probe, int ignoreId) const
{
    const ConnectionRecord p = normalizedRecord(probe);

    QMutexLocker lock(&m_mutex);
    for (const ConnectionRecord& r : m_state.records) {
        if (r.id != ignoreId && r.sameIdentity(p))
            return r.id;
    }
    return -1;
}

// -----------------------------
// Mutations
// -----------------------------

int ConnectionStore::add(const ConnectionRecord& record, StoreError* code, QString* err)
{
    ConnectionRecord r = normalizedRecord(record);
    if (!validateRecord(r, code, err))
        return -1;

    const int dup = findByIdentity(r);

    QMutexLocker lock(&m_mutex);
    if (!m_unlocked) {
        setError(code, err, StoreError::Locked);
        return -1;
    }
    if (dup >= 0) {
        setError(code, err, StoreError::DuplicateRecord,
                 trStore("Same connection already stored (id %1)").arg(dup));
        return -1;
    }

    const State before = m_state;

    r.id = m_state.nextId++;
    r.lastUsedAt = QDateTime();
    r.history.clear();
    r.lastRemoteDir.clear();
    m_state.records.push_back(r);

    if (!commitLocked(before, code, err))
        return -1;

    lock.unlock();
    qInfo().noquote() << QString("[VAULT] added connection %1 (%2)").arg(r.id).arg(r.target());
    emit changed();
    return r.id;
}

bool ConnectionStore::update(const ConnectionRecord& record, StoreError* code, QString* err)
{
    ConnectionRecord r = normalizedRecord(record);
    if (!validateRecord(r, code, err))
        return false;

    const int dup = findByIdentity(r, r.id);

    QMutexLocker lock(&m_mutex);
    if (!m_unlocked) {
        setError(code, err, StoreError::Locked);
        return false;
    }

    const int idx = indexOfLocked(r.id);
    if (idx < 0) {
        setError(code, err, StoreError::NotFound);
        return false;
    }
    if (dup >= 0) {
        setError(code, err, StoreError::DuplicateRecord,
                 trStore("Same connection already stored (id %1)").arg(dup));
        return false;
    }

    const State before = m_state;

    ConnectionRecord& cur = m_state.records[idx];
    cur.host         = r.host;
    cur.port         = r.port;
    cur.user         = r.user;
    cur.friendlyName = r.friendlyName;
    cur.credential   = r.credential;

    if (!commitLocked(before, code, err))
        return false;

    lock.unlock();
    emit changed();
    return true;
}

bool ConnectionStore::remove(int id, StoreError* code, QString* err)
{
    QMutexLocker lock(&m_mutex);
    if (!m_unlocked) {
        setError(code, err, StoreError::Locked);
        return false;
    }

    const int idx = indexOfLocked(id);
    if (idx < 0) {
        setError(code, err, StoreError::NotFound);
        return false;
    }

    const State before = m_state;
    m_state.records.removeAt(idx);

    if (!commitLocked(before, code, err))
        return false;

    lock.unlock();
    qInfo().noquote() << QString("[VAULT] removed connection %1").arg(id);
    emit changed();
    return true;
}

bool ConnectionStore::recordUsed(int id, StoreError* code, QString* err)
{
    QMutexLocker lock(&m_mutex);
    if (!m_unlocked) {
        setError(code, err, StoreError::Locked);
        return false;
    }

    const int idx = indexOfLocked(id);
    if (idx < 0) {
        setError(code, err, StoreError::NotFound);
        return false;
    }

    // Strictly increasing stamps keep "most recent first" well defined even
    // when two connects finish within the same millisecond.
    QDateTime now = QDateTime::currentDateTimeUtc();
    for (const ConnectionRecord& r : m_state.records) {
        if (r.lastUsedAt.isValid() && r.lastUsedAt >= now)
            now = r.lastUsedAt.addMSecs(1);
    }

    const State before = m_state;
    ConnectionRecord& cur = m_state.records[idx];
    cur.lastUsedAt = now;
    cur.appendHistory(true, now);

    if (!commitLocked(before, code, err))
        return false;

    lock.unlock();
    emit changed();
    return true;
}

bool ConnectionStore::recordFailure(int id, StoreError* code, QString* err)
{
    QMutexLocker lock(&m_mutex);
    if (!m_unlocked) {
        setError(code, err, StoreError::Locked);
        return false;
    }

    const int idx = indexOfLocked(id);
    if (idx < 0) {
        setError(code, err, StoreError::NotFound);
        return false;
    }

    const State before = m_state;
    m_state.records[idx].appendHistory(false);

    if (!commitLocked(before, code, err))
        return false;

    lock.unlock();
    emit changed();
    return true;
}

bool ConnectionStore::setLastRemoteDir(int id, const QString& dir, StoreError* code, QString* err)
{
    QMutexLocker lock(&m_mutex);
    if (!m_unlocked) {
        setError(code, err, StoreError::Locked);
        return false;
    }

    const int idx = indexOfLocked(id);
    if (idx < 0) {
        setError(code, err, StoreError::NotFound);
        return false;
    }
    if (m_state.records[idx].lastRemoteDir == dir) {
        if (code) *code = StoreError::None;
        return true;
    }

    const State before = m_state;
    m_state.records[idx].lastRemoteDir = dir;

    if (!commitLocked(before, code, err))
        return false;

    lock.unlock();
    emit changed();
    return true;
}

bool ConnectionStore::setLastLocalDir(const QString& dir, StoreError* code, QString* err)
{
    QMutexLocker lock(&m_mutex);
    if (!m_unlocked) {
        setError(code, err, StoreError::Locked);
        return false;
    }
    if (m_state.lastLocalDir == dir) {
        if (code) *code = StoreError::None;
        return true;
    }

    const State before = m_state;
    m_state.lastLocalDir = dir;

    if (!commitLocked(before, code, err))
        return false;

    lock.unlock();
    emit changed();
    return true;
}
