// Encrypted local vault: one Fernet token holding a JSON {key: secret} map.
//
// The key is derived from the machine's hostname and the OS user name. That
// keeps the file readable across reinstalls for the same machine and user,
// and it also means anyone who can run code as that user can decrypt it. It
// hides passwords from casual inspection and backups; it is not a security
// boundary.
#pragma once
#include "SecretStore.hpp"
#include <QByteArray>
#include <QMap>
#include <mutex>
#include <optional>

class VaultSecretStore : public SecretStore {
public:
    // `fernetKey` is the URL-safe base64 form of 32 key bytes. The vault is
    // read once here; an unreadable or corrupt file starts empty.
    VaultSecretStore(QString path, QByteArray fernetKey);

    PersistResult setSecret(const QString &key, const QString &value) override;
    std::optional<QString> getSecret(const QString &key) const override;
    PersistResult removeSecret(const QString &key) override;
    QString backendName() const override;

    QString path() const { return path_; }
    int count() const;

    // base64url(SHA-256("portkeydrop:<host>:<user>")).
    static QByteArray deriveKey(const QString &host, const QString &user);
    // deriveKey() for the current machine and user.
    static QByteArray machineKey();

    // Fernet token (version 0x80, timestamp, IV, AES-128-CBC, HMAC-SHA256).
    static std::optional<QByteArray> encrypt(const QByteArray &fernetKey,
                                             const QByteArray &plaintext);
    // nullopt on a malformed token, bad signature or wrong key.
    static std::optional<QByteArray> decrypt(const QByteArray &fernetKey,
                                             const QByteArray &token);

private:
    void load();
    PersistResult save(); // mtx_ held

    mutable std::mutex mtx_;
    QString path_;
    QByteArray key_;
    QMap<QString, QString> entries_;
};
