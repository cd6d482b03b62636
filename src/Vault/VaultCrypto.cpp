// VaultCrypto.cpp
//
// SECURITY MODEL (high level)
// ---------------------------
// - User supplies the master password.
// - Key = Argon2id(password, salt) with the cost stored in the header, so a
//   file written with one KDF profile stays readable after the default changes.
// - XChaCha20-Poly1305 with a random 24-byte nonce (safe to pick randomly).
// - AD = full header, so swapping salt/params/version breaks the tag.
// - Trailing BLAKE2b digest separates "file damaged" from "wrong password":
//     digest bad            -> VaultCorrupt
//     digest ok, tag bad    -> WrongPassword (also covers a deliberately
//                              re-digested tampered file; never a silent decode)
//
// IMPORTANT: Do not log plaintext, passwords, or derived keys.

#include "VaultCrypto.h"

#include <QDataStream>
#include <QDebug>

#include <sodium.h>

#include <utility>

static constexpr char MAGIC[] = "TSSHVLT"; // 7 bytes, no NUL stored

// Upper bounds for header-supplied KDF cost. A damaged (or hostile) header
// must not make unlock allocate gigabytes or spin for minutes.
static constexpr quint64 MAX_OPSLIMIT = 32;
static constexpr quint64 MAX_MEMLIMIT = 2ULL * 1024 * 1024 * 1024;

// =====================================================
// VaultKdfParams
// =====================================================

VaultKdfParams VaultKdfParams::interactive()
{
    VaultKdfParams p;
    p.alg      = crypto_pwhash_ALG_ARGON2ID13;
    p.opsLimit = crypto_pwhash_OPSLIMIT_INTERACTIVE;
    p.memLimit = crypto_pwhash_MEMLIMIT_INTERACTIVE;
    return p;
}

VaultKdfParams VaultKdfParams::moderate()
{
    VaultKdfParams p;
    p.alg      = crypto_pwhash_ALG_ARGON2ID13;
    p.opsLimit = crypto_pwhash_OPSLIMIT_MODERATE;
    p.memLimit = crypto_pwhash_MEMLIMIT_MODERATE;
    return p;
}

VaultKdfParams VaultKdfParams::sensitive()
{
    VaultKdfParams p;
    p.alg      = crypto_pwhash_ALG_ARGON2ID13;
    p.opsLimit = crypto_pwhash_OPSLIMIT_SENSITIVE;
    p.memLimit = crypto_pwhash_MEMLIMIT_SENSITIVE;
    return p;
}

VaultKdfParams VaultKdfParams::fromProfileName(const QString& name)
{
    const QString n = name.trimmed().toLower();
    if (n == "interactive") return interactive();
    if (n == "sensitive")   return sensitive();
    return moderate();
}

// =====================================================
// SecretKey
// =====================================================

SecretKey::~SecretKey()
{
    clear();
}

SecretKey::SecretKey(SecretKey&& other) noexcept
    : m_data(std::exchange(other.m_data, nullptr))
{
}

SecretKey& SecretKey::operator=(SecretKey&& other) noexcept
{
    if (this != &other) {
        clear();
        m_data = std::exchange(other.m_data, nullptr);
    }
    return *this;
}

bool SecretKey::allocate()
{
    clear();
    m_data = static_cast<unsigned char*>(sodium_malloc(size()));
    return m_data != nullptr;
}

void SecretKey::clear()
{
    if (m_data) {
        // sodium_free() zeroes the region before unmapping it.
        sodium_free(m_data);
        m_data = nullptr;
    }
}

// =====================================================
// Helpers
// =====================================================

static QByteArray digestOf(const char* data, int len)
{
    QByteArray out(VaultCrypto::kDigestLen, Qt::Uninitialized);
    crypto_generichash(reinterpret_cast<unsigned char*>(out.data()), (size_t)out.size(),
                       reinterpret_cast<const unsigned char*>(data), (unsigned long long)len,
                       nullptr, 0);
    return out;
}

static QByteArray buildHeader(const VaultKdfParams& kdf,
                              const QByteArray& salt,
                              const QByteArray& nonce)
{
    QByteArray header;
    header.reserve(VaultCrypto::kHeaderLen);

    QDataStream ds(&header, QIODevice::WriteOnly);
    ds.setByteOrder(QDataStream::BigEndian);
    ds.writeRawData(MAGIC, VaultCrypto::kMagicLen);
    ds << (quint16)VaultCrypto::kFormatVersion
       << (quint32)kdf.alg
       << (quint64)kdf.opsLimit
       << (quint64)kdf.memLimit;
    ds.writeRawData(salt.constData(), salt.size());
    ds.writeRawData(nonce.constData(), nonce.size());
    return header;
}

static bool kdfWithinBounds(const VaultKdfParams& kdf)
{
    if (kdf.alg != (quint32)crypto_pwhash_ALG_ARGON2ID13) return false;
    if (kdf.opsLimit < crypto_pwhash_OPSLIMIT_MIN || kdf.opsLimit > MAX_OPSLIMIT) return false;
    if (kdf.memLimit < crypto_pwhash_MEMLIMIT_MIN || kdf.memLimit > MAX_MEMLIMIT) return false;
    return true;
}

// =====================================================
// Public API
// =====================================================

namespace VaultCrypto {

bool ensureInit(QString* err)
{
    // sodium_init() is itself thread-safe and idempotent (returns 1 when
    // already initialised), so no local flag is needed.
    if (sodium_init() < 0) {
        if (err) *err = "libsodium init failed";
        return false;
    }
    return true;
}

QByteArray randomBytes(int n)
{
    QByteArray out(n, Qt::Uninitialized);
    randombytes_buf(out.data(), (size_t)n);
    return out;
}

bool deriveKey(const QString& password,
               const QByteArray& salt,
               const VaultKdfParams& kdf,
               SecretKey* outKey,
               QString* err)
{
    if (err) err->clear();
    if (!outKey) return false;
    if (!ensureInit(err)) return false;

    // No silent "empty password" mode.
    if (password.isEmpty()) {
        if (err) *err = "Empty password";
        return false;
    }
    if (salt.size() != kSaltLen) {
        if (err) *err = "Bad salt length";
        return false;
    }

    QByteArray passUtf8 = password.toUtf8();

    SecretKey key;
    if (!key.allocate()) {
        wipe(passUtf8);
        if (err) *err = "sodium_malloc failed";
        return false;
    }

    const int rc = crypto_pwhash(
        key.data(), SecretKey::size(),
        passUtf8.constData(),
        (unsigned long long)passUtf8.size(),
        reinterpret_cast<const unsigned char*>(salt.constData()),
        (unsigned long long)kdf.opsLimit,
        (size_t)kdf.memLimit,
        (int)kdf.alg);

    wipe(passUtf8);

    if (rc != 0) {
        // Out of memory for the requested memlimit is the usual cause.
        if (err) *err = "Argon2id failed (crypto_pwhash)";
        return false;
    }

    *outKey = std::move(key);
    return true;
}

bool seal(const QByteArray& plain,
          const SecretKey& key,
          const QByteArray& salt,
          const VaultKdfParams& kdf,
          QByteArray* outFile,
          QString* err)
{
    if (err) err->clear();
    if (!outFile) return false;
    if (!ensureInit(err)) return false;

    if (!key.isValid()) {
        if (err) *err = "No key";
        return false;
    }

    const QByteArray nonce  = randomBytes(kNonceLen);
    const QByteArray header = buildHeader(kdf, salt, nonce);

    QByteArray cipher;
    cipher.resize(plain.size() + (int)crypto_aead_xchacha20poly1305_ietf_ABYTES);

    unsigned long long clen = 0;
    const int rc = crypto_aead_xchacha20poly1305_ietf_encrypt(
        reinterpret_cast<unsigned char*>(cipher.data()), &clen,
        reinterpret_cast<const unsigned char*>(plain.constData()),
        (unsigned long long)plain.size(),
        reinterpret_cast<const unsigned char*>(header.constData()),
        (unsigned long long)header.size(),
        nullptr,
        reinterpret_cast<const unsigned char*>(nonce.constData()),
        key.data());

    if (rc != 0) {
        if (err) *err = "XChaCha20-Poly1305 encrypt failed";
        return false;
    }
    cipher.resize((int)clen);

    QByteArray file;
    file.reserve(header.size() + cipher.size() + kDigestLen);
    file.append(header);
    file.append(cipher);
    file.append(digestOf(file.constData(), file.size()));

    *outFile = file;
    return true;
}

bool parseHeader(const QByteArray& file,
                 VaultHeader* outHeader,
                 VaultError* code,
                 QString* err)
{
    if (code) *code = VaultError::None;
    if (err) err->clear();
    if (!outHeader) return false;
    if (!ensureInit(err)) {
        if (code) *code = VaultError::IoError;
        return false;
    }

    const int minLen = kHeaderLen + (int)crypto_aead_xchacha20poly1305_ietf_ABYTES + kDigestLen;
    if (file.size() < minLen) {
        setError(code, err, VaultError::VaultCorrupt, QStringLiteral("Vault file too small"));
        return false;
    }

    if (file.left(kMagicLen) != QByteArray(MAGIC, kMagicLen)) {
        setError(code, err, VaultError::VaultCorrupt, QStringLiteral("Bad magic"));
        return false;
    }

    // Digest before version: see the header comment.
    const int bodyLen = file.size() - kDigestLen;
    const QByteArray expected = digestOf(file.constData(), bodyLen);
    if (sodium_memcmp(expected.constData(), file.constData() + bodyLen, kDigestLen) != 0) {
        setError(code, err, VaultError::VaultCorrupt, QStringLiteral("Digest mismatch"));
        return false;
    }

    QDataStream ds(file.left(kHeaderLen));
    ds.setByteOrder(QDataStream::BigEndian);
    ds.skipRawData(kMagicLen);

    VaultHeader h;
    quint32 alg = 0;
    quint64 ops = 0;
    quint64 mem = 0;
    ds >> h.version >> alg >> ops >> mem;

    if (h.version != kFormatVersion) {
        setError(code, err, VaultError::VaultUnsupportedVersion,
                 QString("Unsupported vault format version %1").arg(h.version));
        return false;
    }

    h.kdf.alg = alg;
    h.kdf.opsLimit = ops;
    h.kdf.memLimit = mem;
    if (!kdfWithinBounds(h.kdf)) {
        setError(code, err, VaultError::VaultCorrupt, QStringLiteral("KDF parameters out of range"));
        return false;
    }

    h.salt  = file.mid(kHeaderLen - kNonceLen - kSaltLen, kSaltLen);
    h.nonce = file.mid(kHeaderLen - kNonceLen, kNonceLen);

    *outHeader = h;
    return true;
}

bool open(const QByteArray& file,
          const VaultHeader& header,
          const SecretKey& key,
          QByteArray* outPlain,
          VaultError* code,
          QString* err)
{
    if (code) *code = VaultError::None;
    if (err) err->clear();
    if (!outPlain) return false;

    if (!key.isValid()) {
        setError(code, err, VaultError::WrongPassword);
        return false;
    }

    const QByteArray ad = file.left(kHeaderLen);
    const int cipherLen = file.size() - kHeaderLen - kDigestLen;
    const unsigned char* cipher =
        reinterpret_cast<const unsigned char*>(file.constData() + kHeaderLen);

    QByteArray plain;
    plain.resize(cipherLen - (int)crypto_aead_xchacha20poly1305_ietf_ABYTES);

    unsigned long long plen = 0;
    const int rc = crypto_aead_xchacha20poly1305_ietf_decrypt(
        reinterpret_cast<unsigned char*>(plain.data()), &plen,
        nullptr,
        cipher, (unsigned long long)cipherLen,
        reinterpret_cast<const unsigned char*>(ad.constData()),
        (unsigned long long)ad.size(),
        reinterpret_cast<const unsigned char*>(header.nonce.constData()),
        key.data());

    if (rc != 0) {
        wipe(plain);
        setError(code, err, VaultError::WrongPassword);
        return false;
    }

    plain.resize((int)plen);
    *outPlain = plain;
    return true;
}

void wipe(QByteArray& bytes)
{
    if (bytes.isEmpty()) return;
    // data() detaches, so we only ever zero our own copy.
    sodium_memzero(bytes.data(), (size_t)bytes.size());
    bytes.clear();
}

} // namespace VaultCrypto
