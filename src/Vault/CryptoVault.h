#pragma once

#include <QByteArray>
#include <QMutex>
#include <QString>

#include "VaultCrypto.h"

/*
    CryptoVault
    -----------
    Owns the vault file on disk and the single derived key while unlocked.

    - create():          new file, fresh salt + nonce, key retained (unlocked)
    - unlock():          parse + derive + decrypt; key retained on success
    - persist():         re-seal with the held key and a fresh nonce
    - changePassword():  verify old, fresh salt, re-seal, atomic replace
    - lock():            wipe key

    Every commit goes through QSaveFile (write temp, fsync, rename), so the
    previous vault stays intact until the new one is complete.

    All public calls serialize on one mutex. Key derivation runs under it,
    so callers must keep unlock()/changePassword() off the event loop thread.
*/
class CryptoVault
{
public:
    explicit CryptoVault(const QString& filePath,
                         const VaultKdfParams& kdfForNewFiles = VaultKdfParams::moderate());
    ~CryptoVault();

    CryptoVault(const CryptoVault&) = delete;
    CryptoVault& operator=(const CryptoVault&) = delete;

    QString filePath() const { return m_path; }
    bool exists() const;
    bool isUnlocked() const;

    // Used for files written from now on (create / changePassword).
    void setKdfForNewFiles(const VaultKdfParams& kdf);

    bool create(const QString& password,
                const QByteArray& plain,
                VaultError* code = nullptr,
                QString* err = nullptr);

    bool unlock(const QString& password,
                QByteArray* outPlain,
                VaultError* code = nullptr,
                QString* err = nullptr);

    // Requires unlocked. Fails with IoError when locked or the commit fails.
    bool persist(const QByteArray& plain,
                 VaultError* code = nullptr,
                 QString* err = nullptr);

    bool changePassword(const QString& oldPassword,
                        const QString& newPassword,
                        VaultError* code = nullptr,
                        QString* err = nullptr);

    void lock();

private:
    bool readFileLocked(QByteArray* out, VaultError* code, QString* err) const;
    bool commitLocked(const QByteArray& bytes, VaultError* code, QString* err) const;

    QString        m_path;
    VaultKdfParams m_newKdf;

    mutable QMutex m_mutex;
    SecretKey      m_key;       // valid only while unlocked
    QByteArray     m_salt;      // salt of the file the key belongs to
    VaultKdfParams m_kdf;       // KDF params of that file
};
