// ConnectionRecord.cpp
//
// JSON shape of one record inside the decrypted vault payload:
//
//   {
//     "id": 3,
//     "host": "example.com", "port": 22, "user": "alice",
//     "name": "prod",                          // optional
//     "auth": "password" | "key",
//     "password": "...",                       // auth == password
//     "key_file": "...", "passphrase": "...",  // auth == key, passphrase optional
//     "last_used": "2026-01-02T10:11:12.345Z", // optional
//     "last_remote_dir": "/var/www",           // optional
//     "history": [ { "ts": "...", "ok": true } ]
//   }
//
// Unknown fields are ignored on load.

#include "ConnectionRecord.h"

#include <QCoreApplication>
#include <QDir>
#include <QJsonArray>

Credential Credential::withPassword(const QString& pw)
{
    Credential c;
    c.kind = CredentialKind::Password;
    c.password = pw;
    return c;
}

Credential Credential::withKey(const QString& path, const QString& passphrase)
{
    Credential c;
    c.kind = CredentialKind::PrivateKey;
    c.keyPath = path;
    c.passphrase = passphrase;
    return c;
}

QString credentialKindToString(CredentialKind k)
{
    return (k == CredentialKind::PrivateKey) ? QStringLiteral("key") : QStringLiteral("password");
}

CredentialKind credentialKindFromString(const QString& s)
{
    const QString v = s.trimmed().toLower();
    if (v == "key" || v == "private_key" || v == "publickey")
        return CredentialKind::PrivateKey;
    return CredentialKind::Password;
}

QString ConnectionRecord::target() const
{
    return QString("%1@%2:%3").arg(user, host).arg(port);
}

bool ConnectionRecord::sameIdentity(const ConnectionRecord& o) const
{
    if (user != o.user) return false;
    if (host.compare(o.host, Qt::CaseInsensitive) != 0) return false;
    if (credential.kind != o.credential.kind) return false;
    if (credential.kind == CredentialKind::PrivateKey
        && QDir::cleanPath(credential.keyPath) != QDir::cleanPath(o.credential.keyPath))
        return false;
    return true;
}

void ConnectionRecord::appendHistory(bool success, const QDateTime& at)
{
    HistoryEntry e;
    e.at = at;
    e.success = success;
    history.push_back(e);

    while (history.size() > kMaxHistoryEntries)
        history.removeFirst();
}

bool ConnectionRecord::operator==(const ConnectionRecord& o) const
{
    return id == o.id
        && host == o.host
        && port == o.port
        && user == o.user
        && friendlyName == o.friendlyName
        && credential == o.credential
        && lastUsedAt == o.lastUsedAt
        && history == o.history
        && lastRemoteDir == o.lastRemoteDir;
}

QString expandTilde(const QString& path)
{
    if (path == "~")
        return QDir::homePath();
    if (path.startsWith("~/"))
        return QDir::homePath() + path.mid(1);
    return path;
}

ConnectionRecord normalizedRecord(ConnectionRecord r)
{
    r.host = r.host.trimmed();
    r.user = r.user.trimmed();
    r.friendlyName = r.friendlyName.trimmed();

    if (r.credential.kind == CredentialKind::PrivateKey) {
        r.credential.password.clear();
        r.credential.keyPath = expandTilde(r.credential.keyPath.trimmed());
        // passphrase kept verbatim; empty means "no passphrase"
    } else {
        r.credential.keyPath.clear();
        r.credential.passphrase.clear();
    }
    return r;
}

bool validateRecord(const ConnectionRecord& r, StoreError* code, QString* err)
{
    auto fail = [&](const char* what) {
        setError(code, err, StoreError::InvalidRecord,
                 QCoreApplication::translate("ConnectionStore", what));
        return false;
    };

    if (r.host.trimmed().isEmpty()) return fail("Host is required");
    if (r.user.trimmed().isEmpty()) return fail("User is required");
    if (r.port < 1 || r.port > 65535) return fail("Port must be between 1 and 65535");

    if (r.credential.kind == CredentialKind::Password) {
        if (r.credential.password.isEmpty()) return fail("Password is required");
    } else {
        if (r.credential.keyPath.trimmed().isEmpty()) return fail("Key file is required");
    }

    if (code) *code = StoreError::None;
    return true;
}

// -----------------------------
// JSON
// -----------------------------

QJsonObject recordToJson(const ConnectionRecord& r)
{
    QJsonObject o;
    o["id"]   = r.id;
    o["host"] = r.host;
    o["port"] = r.port;
    o["user"] = r.user;

    if (!r.friendlyName.isEmpty())
        o["name"] = r.friendlyName;

    o["auth"] = credentialKindToString(r.credential.kind);
    if (r.credential.kind == CredentialKind::Password) {
        o["password"] = r.credential.password;
    } else {
        o["key_file"] = r.credential.keyPath;
        if (!r.credential.passphrase.isEmpty())
            o["passphrase"] = r.credential.passphrase;
    }

    if (r.lastUsedAt.isValid())
        o["last_used"] = r.lastUsedAt.toUTC().toString(Qt::ISODateWithMs);

    if (!r.lastRemoteDir.isEmpty())
        o["last_remote_dir"] = r.lastRemoteDir;

    QJsonArray hist;
    for (const HistoryEntry& e : r.history) {
        QJsonObject h;
        h["ts"] = e.at.toUTC().toString(Qt::ISODateWithMs);
        h["ok"] = e.success;
        hist.append(h);
    }
    if (!hist.isEmpty())
        o["history"] = hist;

    return o;
}

static QDateTime parseUtc(const QString& s)
{
    if (s.isEmpty()) return QDateTime();
    QDateTime t = QDateTime::fromString(s, Qt::ISODateWithMs);
    if (!t.isValid())
        t = QDateTime::fromString(s, Qt::ISODate);
    return t.isValid() ? t.toUTC() : QDateTime();
}

ConnectionRecord recordFromJson(const QJsonObject& o)
{
    ConnectionRecord r;
    r.id   = o.value("id").toInt(0);
    r.host = o.value("host").toString();
    r.port = o.value("port").toInt(22);
    r.user = o.value("user").toString();
    r.friendlyName = o.value("name").toString();

    r.credential.kind = credentialKindFromString(o.value("auth").toString());
    if (r.credential.kind == CredentialKind::Password) {
        r.credential.password = o.value("password").toString();
    } else {
        r.credential.keyPath    = o.value("key_file").toString();
        r.credential.passphrase = o.value("passphrase").toString();
    }

    r.lastUsedAt    = parseUtc(o.value("last_used").toString());
    r.lastRemoteDir = o.value("last_remote_dir").toString();

    const QJsonArray hist = o.value("history").toArray();
    for (const QJsonValue& v : hist) {
        if (!v.isObject()) continue;
        const QJsonObject h = v.toObject();
        HistoryEntry e;
        e.at = parseUtc(h.value("ts").toString());
        e.success = h.value("ok").toBool(false);
        if (e.at.isValid())
            r.history.push_back(e);
    }
    while (r.history.size() > kMaxHistoryEntries)
        r.history.removeFirst();

    return r;
}
