#pragma once

#include <QDateTime>
#include <QJsonObject>
#include <QString>
#include <QVector>

#include "../ErrorTypes.h"

// -----------------------------
// Credential
// -----------------------------
enum class CredentialKind {
    Password,
    PrivateKey
};

struct Credential {
    CredentialKind kind = CredentialKind::Password;

    QString password;     // Password
    QString keyPath;      // PrivateKey
    QString passphrase;   // PrivateKey, empty => none

    bool hasPassphrase() const { return kind == CredentialKind::PrivateKey && !passphrase.isEmpty(); }

    static Credential withPassword(const QString& pw);
    static Credential withKey(const QString& path, const QString& passphrase = QString());

    bool operator==(const Credential& o) const
    {
        return kind == o.kind && password == o.password
            && keyPath == o.keyPath && passphrase == o.passphrase;
    }
    bool operator!=(const Credential& o) const { return !(*this == o); }
};

QString credentialKindToString(CredentialKind k);
CredentialKind credentialKindFromString(const QString& s);

// -----------------------------
// Connection history
// -----------------------------
struct HistoryEntry {
    QDateTime at;
    bool      success = false;

    bool operator==(const HistoryEntry& o) const { return at == o.at && success == o.success; }
};

constexpr int kMaxHistoryEntries = 50;

// -----------------------------
// ConnectionRecord
// -----------------------------
struct ConnectionRecord {
    int       id = 0;            // assigned by ConnectionStore::add, unique per store
    QString   host;
    int       port = 22;
    QString   user;
    QString   friendlyName;      // optional
    Credential credential;
    QDateTime lastUsedAt;        // invalid => never used

    QVector<HistoryEntry> history;   // oldest first, capped at kMaxHistoryEntries
    QString   lastRemoteDir;         // start dir for the remote browser

    QString label() const { return friendlyName.trimmed().isEmpty() ? host : friendlyName.trimmed(); }

    // "alice@example.com:22"
    QString target() const;

    // Same user, host, auth kind and key path (password / passphrase ignored).
    bool sameIdentity(const ConnectionRecord& o) const;

    void appendHistory(bool success, const QDateTime& at = QDateTime::currentDateTimeUtc());

    bool operator==(const ConnectionRecord& o) const;
    bool operator!=(const ConnectionRecord& o) const { return !(*this == o); }
};

// Trims fields, normalizes an empty passphrase, expands "~/" in key paths.
ConnectionRecord normalizedRecord(ConnectionRecord r);

// Non-empty host/user, port 1..65535, complete credential.
bool validateRecord(const ConnectionRecord& r, StoreError* code = nullptr, QString* err = nullptr);

// "~" and "~/x" => home-relative; anything else unchanged.
QString expandTilde(const QString& path);

QJsonObject recordToJson(const ConnectionRecord& r);
ConnectionRecord recordFromJson(const QJsonObject& o);
