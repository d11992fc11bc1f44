// Fernet vault on OpenSSL: EVP for AES-128-CBC and SHA-256, HMAC for the
// token signature, RAND_bytes for the IV.
#include "VaultSecretStore.hpp"
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLoggingCategory>
#include <QSaveFile>
#include <QSysInfo>
#include <QtEndian>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
Q_DECLARE_LOGGING_CATEGORY(pkdSecrets)

namespace {

constexpr unsigned char kFernetVersion = 0x80;
constexpr int kHeaderLen = 1 + 8 + 16; // version, timestamp, IV
constexpr int kMacLen = 32;

const QByteArray::Base64Options kB64Url = QByteArray::Base64UrlEncoding;

// Splits the 32-byte key into signing (first half) and encryption halves.
bool splitKey(const QByteArray &fernetKey, QByteArray &signKey,
              QByteArray &encKey) {
    const QByteArray raw = QByteArray::fromBase64(fernetKey, kB64Url);
    if (raw.size() != 32)
        return false;
    signKey = raw.left(16);
    encKey = raw.mid(16);
    return true;
}

QByteArray hmacSha256(const QByteArray &key, const QByteArray &data) {
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int outLen = 0;
    if (!HMAC(EVP_sha256(), key.constData(), key.size(),
              reinterpret_cast<const unsigned char *>(data.constData()),
              static_cast<size_t>(data.size()), out, &outLen))
        return {};
    return QByteArray(reinterpret_cast<const char *>(out), (int)outLen);
}

// encrypt=true: AES-128-CBC with PKCS#7 padding; false: the inverse.
std::optional<QByteArray> aes128cbc(bool encrypt, const QByteArray &key,
                                    const QByteArray &iv,
                                    const QByteArray &in) {
    EVP_CIPHER_CTX *ctx = EVP_CIPHER_CTX_new();
    if (!ctx)
        return std::nullopt;
    QByteArray out(in.size() + 16, '\0');
    int len1 = 0, len2 = 0;
    const auto *k = reinterpret_cast<const unsigned char *>(key.constData());
    const auto *v = reinterpret_cast<const unsigned char *>(iv.constData());
    auto *o = reinterpret_cast<unsigned char *>(out.data());
    const auto *i = reinterpret_cast<const unsigned char *>(in.constData());
    bool ok = EVP_CipherInit_ex(ctx, EVP_aes_128_cbc(), nullptr, k, v,
                                encrypt ? 1 : 0) == 1 &&
              EVP_CipherUpdate(ctx, o, &len1, i, in.size()) == 1 &&
              EVP_CipherFinal_ex(ctx, o + len1, &len2) == 1;
    EVP_CIPHER_CTX_free(ctx);
    if (!ok)
        return std::nullopt;
    out.resize(len1 + len2);
    return out;
}

QString currentUserName() {
    QString user = qEnvironmentVariable("USER");
    if (user.isEmpty())
        user = qEnvironmentVariable("USERNAME");
    if (user.isEmpty())
        user = qEnvironmentVariable("LOGNAME");
    return user;
}

} // namespace

std::optional<QByteArray> VaultSecretStore::encrypt(const QByteArray &fernetKey,
                                                    const QByteArray &plaintext) {
    QByteArray signKey, encKey;
    if (!splitKey(fernetKey, signKey, encKey))
        return std::nullopt;

    QByteArray iv(16, '\0');
    if (RAND_bytes(reinterpret_cast<unsigned char *>(iv.data()), iv.size()) != 1)
        return std::nullopt;
    auto cipher = aes128cbc(true, encKey, iv, plaintext);
    if (!cipher)
        return std::nullopt;

    QByteArray token;
    token.append(static_cast<char>(kFernetVersion));
    char ts[8];
    qToBigEndian<quint64>(
        static_cast<quint64>(QDateTime::currentSecsSinceEpoch()), ts);
    token.append(ts, 8);
    token.append(iv);
    token.append(*cipher);
    const QByteArray mac = hmacSha256(signKey, token);
    if (mac.size() != kMacLen)
        return std::nullopt;
    token.append(mac);
    return token.toBase64(kB64Url);
}

std::optional<QByteArray> VaultSecretStore::decrypt(const QByteArray &fernetKey,
                                                    const QByteArray &token) {
    QByteArray signKey, encKey;
    if (!splitKey(fernetKey, signKey, encKey))
        return std::nullopt;
    const QByteArray raw = QByteArray::fromBase64(token.trimmed(), kB64Url);
    // Header, at least one cipher block, signature.
    if (raw.size() < kHeaderLen + 16 + kMacLen ||
        static_cast<unsigned char>(raw[0]) != kFernetVersion)
        return std::nullopt;
    const int cipherLen = raw.size() - kHeaderLen - kMacLen;
    if (cipherLen % 16 != 0)
        return std::nullopt;

    const QByteArray signedPart = raw.left(raw.size() - kMacLen);
    const QByteArray mac = raw.right(kMacLen);
    const QByteArray expected = hmacSha256(signKey, signedPart);
    if (expected.size() != kMacLen ||
        CRYPTO_memcmp(expected.constData(), mac.constData(), kMacLen) != 0)
        return std::nullopt;

    const QByteArray iv = raw.mid(9, 16);
    return aes128cbc(false, encKey, iv, raw.mid(kHeaderLen, cipherLen));
}

QByteArray VaultSecretStore::deriveKey(const QString &host,
                                       const QString &user) {
    const QByteArray material =
        QString("portkeydrop:%1:%2").arg(host, user).toUtf8();
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_Digest(material.constData(), static_cast<size_t>(material.size()),
                   digest, &len, EVP_sha256(), nullptr) != 1)
        return {};
    return QByteArray(reinterpret_cast<const char *>(digest), (int)len)
        .toBase64(kB64Url);
}

QByteArray VaultSecretStore::machineKey() {
    return deriveKey(QSysInfo::machineHostName(), currentUserName());
}

VaultSecretStore::VaultSecretStore(QString path, QByteArray fernetKey)
    : path_(std::move(path)), key_(std::move(fernetKey)) {
    load();
}

void VaultSecretStore::load() {
    QFile f(path_);
    if (!f.exists())
        return;
    if (!f.open(QIODevice::ReadOnly)) {
        qCWarning(pkdSecrets) << "Vault unreadable, starting empty:"
                              << f.errorString();
        return;
    }
    const QByteArray token = f.readAll();
    auto plain = decrypt(key_, token);
    if (!plain) {
        qCWarning(pkdSecrets)
            << "Vault could not be decrypted (corrupt or other machine), "
               "starting empty";
        return;
    }
    QJsonParseError perr{};
    const QJsonDocument doc = QJsonDocument::fromJson(*plain, &perr);
    if (perr.error != QJsonParseError::NoError || !doc.isObject()) {
        qCWarning(pkdSecrets) << "Vault content is not a JSON object, starting empty";
        return;
    }
    const QJsonObject obj = doc.object();
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        if (it.value().isString())
            entries_.insert(it.key(), it.value().toString());
    }
    qCDebug(pkdSecrets) << "Vault loaded with" << entries_.size() << "entries";
}

SecretStore::PersistResult VaultSecretStore::save() {
    QJsonObject obj;
    for (auto it = entries_.cbegin(); it != entries_.cend(); ++it)
        obj.insert(it.key(), it.value());
    auto token =
        encrypt(key_, QJsonDocument(obj).toJson(QJsonDocument::Compact));
    if (!token)
        return {PersistStatus::BackendError,
                QStringLiteral("Vault encryption failed")};

    const QFileInfo fi(path_);
    if (!QDir().mkpath(fi.absolutePath()))
        return {PersistStatus::BackendError,
                QString("Could not create %1").arg(fi.absolutePath())};
    QSaveFile f(path_);
    if (!f.open(QIODevice::WriteOnly))
        return {PersistStatus::BackendError, f.errorString()};
    if (f.write(*token) != token->size()) {
        f.cancelWriting();
        return {PersistStatus::BackendError, f.errorString()};
    }
    if (!f.commit())
        return {PersistStatus::BackendError, f.errorString()};
    if (!QFile::setPermissions(path_,
                               QFileDevice::ReadOwner | QFileDevice::WriteOwner))
        qCWarning(pkdSecrets) << "Could not restrict vault permissions";
    return {};
}

SecretStore::PersistResult VaultSecretStore::setSecret(const QString &key,
                                                       const QString &value) {
    if (key.isEmpty())
        return {PersistStatus::BackendError, QStringLiteral("Empty secret key")};
    std::lock_guard<std::mutex> lk(mtx_);
    if (value.isEmpty()) {
        // Empty passwords are not kept.
        if (entries_.remove(key) == 0)
            return {};
    } else {
        entries_.insert(key, value);
    }
    return save();
}

std::optional<QString> VaultSecretStore::getSecret(const QString &key) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = entries_.constFind(key);
    if (it == entries_.constEnd() || it->isEmpty())
        return std::nullopt;
    return *it;
}

SecretStore::PersistResult VaultSecretStore::removeSecret(const QString &key) {
    std::lock_guard<std::mutex> lk(mtx_);
    if (entries_.remove(key) == 0)
        return {};
    return save();
}

QString VaultSecretStore::backendName() const {
    return QStringLiteral("encrypted vault");
}

int VaultSecretStore::count() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return entries_.size();
}
