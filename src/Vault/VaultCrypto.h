#pragma once

#include <QByteArray>
#include <QString>
#include <QtGlobal>

#include "../ErrorTypes.h"

// =====================================================
// VaultCrypto
// =====================================================
//
// Purpose
// -------
// Low-level crypto for the connection vault container:
//   - Argon2id key derivation (libsodium crypto_pwhash)
//   - XChaCha20-Poly1305 sealing of the serialized store (AEAD)
//   - container framing: header, ciphertext, integrity digest
//
// What it does NOT do
// -------------------
// - No file I/O and no key lifetime policy (CryptoVault owns both).
// - No knowledge of connection records (ConnectionStore serializes them).
//
// Container layout (version 1, integers big-endian)
// -------------------------------------------------
// [ MAGIC "TSSHVLT" (7) | VERSION u16 | ALG u32 | OPSLIMIT u64 | MEMLIMIT u64
//   | SALT (16) | NONCE (24) | CIPHERTEXT+TAG (N) | DIGEST (32) ]
//
// - Header bytes (MAGIC..NONCE) are the AEAD associated data.
// - DIGEST is unkeyed BLAKE2b-256 over everything before it. It only detects
//   accidental damage; authenticity comes from the AEAD tag.
//
// Never log passwords, derived keys or plaintext. Sizes and paths are fine.

struct VaultKdfParams
{
    quint32 alg      = 0;   // crypto_pwhash_ALG_ARGON2ID13 once resolved
    quint64 opsLimit = 0;
    quint64 memLimit = 0;

    static VaultKdfParams interactive();
    static VaultKdfParams moderate();
    static VaultKdfParams sensitive();

    // "interactive" | "moderate" | "sensitive"; anything else => moderate
    static VaultKdfParams fromProfileName(const QString& name);

    bool operator==(const VaultKdfParams& o) const
    {
        return alg == o.alg && opsLimit == o.opsLimit && memLimit == o.memLimit;
    }
};

struct VaultHeader
{
    quint16        version = 0;
    VaultKdfParams kdf;
    QByteArray     salt;
    QByteArray     nonce;
};

// Derived key in libsodium guarded memory (sodium_malloc).
// Move-only; wiped and freed on clear()/destruction.
class SecretKey
{
public:
    SecretKey() = default;
    ~SecretKey();

    SecretKey(SecretKey&& other) noexcept;
    SecretKey& operator=(SecretKey&& other) noexcept;

    SecretKey(const SecretKey&) = delete;
    SecretKey& operator=(const SecretKey&) = delete;

    bool allocate();
    void clear();

    bool isValid() const { return m_data != nullptr; }
    unsigned char* data() { return m_data; }
    const unsigned char* data() const { return m_data; }
    static constexpr size_t size() { return 32; }

private:
    unsigned char* m_data = nullptr;
};

namespace VaultCrypto {

constexpr quint16 kFormatVersion = 1;
constexpr int     kMagicLen      = 7;
constexpr int     kSaltLen       = 16;
constexpr int     kNonceLen      = 24;
constexpr int     kDigestLen     = 32;
constexpr int     kHeaderLen     = kMagicLen + 2 + 4 + 8 + 8 + kSaltLen + kNonceLen;

// libsodium requires sodium_init() once per process.
bool ensureInit(QString* err = nullptr);

QByteArray randomBytes(int n);

// Argon2id(password, salt) -> key. The password is taken as UTF-8.
bool deriveKey(const QString& password,
               const QByteArray& salt,
               const VaultKdfParams& kdf,
               SecretKey* outKey,
               QString* err = nullptr);

// Encrypts `plain` into a complete container with a fresh random nonce.
bool seal(const QByteArray& plain,
          const SecretKey& key,
          const QByteArray& salt,
          const VaultKdfParams& kdf,
          QByteArray* outFile,
          QString* err = nullptr);

// Validates framing (size, magic, digest, version, KDF bounds) without a key.
// The order is fixed: the digest is checked before the version, so a changed
// byte anywhere, version field included, reads as VaultCorrupt. Only an intact
// file written by a newer format reports VaultUnsupportedVersion.
bool parseHeader(const QByteArray& file,
                 VaultHeader* outHeader,
                 VaultError* code = nullptr,
                 QString* err = nullptr);

// Verifies the AEAD tag and decrypts. Any tag failure is WrongPassword:
// with the digest already verified, a bad tag means a bad key.
bool open(const QByteArray& file,
          const VaultHeader& header,
          const SecretKey& key,
          QByteArray* outPlain,
          VaultError* code = nullptr,
          QString* err = nullptr);

// Best-effort wipe of a plaintext buffer that is about to be dropped.
void wipe(QByteArray& bytes);

} // namespace VaultCrypto
