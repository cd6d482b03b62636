// CryptoVault.cpp
#include "CryptoVault.h"

#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutexLocker>
#include <QSaveFile>

#include <utility>

CryptoVault::CryptoVault(const QString& filePath, const VaultKdfParams& kdfForNewFiles)
    : m_path(QDir::cleanPath(filePath))
    , m_newKdf(kdfForNewFiles)
{
}

CryptoVault::~CryptoVault()
{
    lock();
}

bool CryptoVault::exists() const
{
    return QFileInfo::exists(m_path);
}

bool CryptoVault::isUnlocked() const
{
    QMutexLocker lock(&m_mutex);
    return m_key.isValid();
}

void CryptoVault::setKdfForNewFiles(const VaultKdfParams& kdf)
{
    QMutexLocker lock(&m_mutex);
    m_newKdf = kdf;
}

// -----------------------------
// File helpers (mutex held)
// -----------------------------

bool CryptoVault::readFileLocked(QByteArray* out, VaultError* code, QString* err) const
{
    QFile f(m_path);
    if (!f.open(QIODevice::ReadOnly)) {
        setError(code, err, VaultError::IoError,
                 QCoreApplication::translate("CryptoVault", "Cannot open vault %1: %2")
                     .arg(m_path, f.errorString()));
        return false;
    }
    *out = f.readAll();
    return true;
}

bool CryptoVault::commitLocked(const QByteArray& bytes, VaultError* code, QString* err) const
{
    QDir().mkpath(QFileInfo(m_path).absolutePath());

    QSaveFile f(m_path);
    if (!f.open(QIODevice::WriteOnly)) {
        setError(code, err, VaultError::IoError,
                 QCoreApplication::translate("CryptoVault", "Could not write vault: %1")
                     .arg(f.errorString()));
        return false;
    }

    f.setPermissions(QFileDevice::ReadOwner | QFileDevice::WriteOwner);

    if (f.write(bytes) != bytes.size() || !f.commit()) {
        setError(code, err, VaultError::IoError,
                 QCoreApplication::translate("CryptoVault", "Could not write vault: %1")
                     .arg(f.errorString()));
        f.cancelWriting();
        return false;
    }
    return true;
}

// -----------------------------
// Public API
// -----------------------------

bool CryptoVault::create(const QString& password, const QByteArray& plain,
                         VaultError* code, QString* err)
{
    QMutexLocker lock(&m_mutex);
    if (code) *code = VaultError::None;

    if (password.isEmpty()) {
        setError(code, err, VaultError::WrongPassword,
                 QCoreApplication::translate("CryptoVault", "Master password must not be empty"));
        return false;
    }

    QString cerr;
    if (!VaultCrypto::ensureInit(&cerr)) {
        setError(code, err, VaultError::IoError, cerr);
        return false;
    }

    const QByteArray salt = VaultCrypto::randomBytes(VaultCrypto::kSaltLen);

    SecretKey key;
    if (!VaultCrypto::deriveKey(password, salt, m_newKdf, &key, &cerr)) {
        qWarning().noquote() << "[VAULT] key derivation failed:" << cerr;
        setError(code, err, VaultError::IoError, cerr);
        return false;
    }

    QByteArray file;
    if (!VaultCrypto::seal(plain, key, salt, m_newKdf, &file, &cerr)) {
        qWarning().noquote() << "[VAULT] seal failed:" << cerr;
        setError(code, err, VaultError::IoError, cerr);
        return false;
    }

    if (!commitLocked(file, code, err))
        return false;

    m_key  = std::move(key);
    m_salt = salt;
    m_kdf  = m_newKdf;

    qInfo().noquote() << QString("[VAULT] created %1 (%2 bytes)").arg(m_path).arg(file.size());
    return true;
}

bool CryptoVault::unlock(const QString& password, QByteArray* outPlain,
                         VaultError* code, QString* err)
{
    QMutexLocker lock(&m_mutex);
    if (code) *code = VaultError::None;
    if (!outPlain) return false;

    QByteArray file;
    if (!readFileLocked(&file, code, err))
        return false;

    VaultHeader header;
    QString detail;
    if (!VaultCrypto::parseHeader(file, &header, code, &detail)) {
        qWarning().noquote() << QString("[VAULT] %1: %2").arg(m_path, detail);
        if (err) *err = code ? errorMessage(*code) : detail;
        return false;
    }

    SecretKey key;
    if (password.isEmpty() || !VaultCrypto::deriveKey(password, header.salt, header.kdf, &key, &detail)) {
        // Empty password or KDF failure: never reveal more than a wrong password would.
        if (!detail.isEmpty())
            qWarning().noquote() << "[VAULT] key derivation failed:" << detail;
        setError(code, err, VaultError::WrongPassword);
        return false;
    }

    QByteArray plain;
    if (!VaultCrypto::open(file, header, key, &plain, code, err)) {
        qInfo().noquote() << "[VAULT] unlock rejected";
        return false;
    }

    m_key  = std::move(key);
    m_salt = header.salt;
    m_kdf  = header.kdf;

    *outPlain = plain;
    VaultCrypto::wipe(plain);

    qInfo().noquote() << QString("[VAULT] unlocked %1").arg(m_path);
    return true;
}

bool CryptoVault::persist(const QByteArray& plain, VaultError* code, QString* err)
{
    QMutexLocker lock(&m_mutex);
    if (code) *code = VaultError::None;

    if (!m_key.isValid()) {
        setError(code, err, VaultError::IoError,
                 QCoreApplication::translate("CryptoVault", "Vault is locked"));
        return false;
    }

    QByteArray file;
    QString cerr;
    if (!VaultCrypto::seal(plain, m_key, m_salt, m_kdf, &file, &cerr)) {
        qWarning().noquote() << "[VAULT] seal failed:" << cerr;
        setError(code, err, VaultError::IoError, cerr);
        return false;
    }

    if (!commitLocked(file, code, err)) {
        qWarning().noquote() << "[VAULT] commit failed:" << (err ? *err : QString());
        return false;
    }

    qDebug().noquote() << QString("[VAULT] persisted %1 bytes").arg(file.size());
    return true;
}

bool CryptoVault::changePassword(const QString& oldPassword, const QString& newPassword,
                                 VaultError* code, QString* err)
{
    QMutexLocker lock(&m_mutex);
    if (code) *code = VaultError::None;

    if (newPassword.isEmpty()) {
        setError(code, err, VaultError::WrongPassword,
                 QCoreApplication::translate("CryptoVault", "Master password must not be empty"));
        return false;
    }

    // Verify `old` against what is on disk, not against the held key.
    QByteArray file;
    if (!readFileLocked(&file, code, err))
        return false;

    VaultHeader header;
    QString detail;
    if (!VaultCrypto::parseHeader(file, &header, code, &detail)) {
        qWarning().noquote() << QString("[VAULT] %1: %2").arg(m_path, detail);
        if (err) *err = code ? errorMessage(*code) : detail;
        return false;
    }

    SecretKey oldKey;
    if (oldPassword.isEmpty() || !VaultCrypto::deriveKey(oldPassword, header.salt, header.kdf, &oldKey, &detail)) {
        setError(code, err, VaultError::WrongPassword);
        return false;
    }

    QByteArray plain;
    if (!VaultCrypto::open(file, header, oldKey, &plain, code, err))
        return false;

    const QByteArray newSalt = VaultCrypto::randomBytes(VaultCrypto::kSaltLen);
    SecretKey newKey;
    if (!VaultCrypto::deriveKey(newPassword, newSalt, m_newKdf, &newKey, &detail)) {
        VaultCrypto::wipe(plain);
        setError(code, err, VaultError::IoError, detail);
        return false;
    }

    QByteArray sealed;
    const bool ok = VaultCrypto::seal(plain, newKey, newSalt, m_newKdf, &sealed, &detail);
    VaultCrypto::wipe(plain);
    if (!ok) {
        setError(code, err, VaultError::IoError, detail);
        return false;
    }

    if (!commitLocked(sealed, code, err))
        return false;

    // A locked vault stays locked; the new key is only kept over a held one.
    if (m_key.isValid()) {
        m_key  = std::move(newKey);
        m_salt = newSalt;
        m_kdf  = m_newKdf;
    }

    qInfo().noquote() << "[VAULT] master password changed";
    return true;
}

void CryptoVault::lock()
{
    QMutexLocker lock(&m_mutex);
    if (!m_key.isValid())
        return;

    m_key.clear();
    m_salt.clear();
    m_kdf = VaultKdfParams();
    qInfo().noquote() << "[VAULT] locked";
}
