#include "CredentialBackend.hpp"
#include "VaultSecretStore.hpp"
#include <QDir>
#include <QLoggingCategory>
Q_DECLARE_LOGGING_CATEGORY(pkdSecrets)

const char *credentialTierName(CredentialBackend::Tier tier) {
    switch (tier) {
    case CredentialBackend::Tier::SystemStore:
        return "keyring";
    case CredentialBackend::Tier::Vault:
        return "vault";
    case CredentialBackend::Tier::None:
        return "none";
    }
    return "unknown";
}

CredentialBackend::CredentialBackend(Capabilities caps) {
    if (caps.systemStore) {
        store_ = std::move(caps.systemStore);
        tier_ = Tier::SystemStore;
    } else if (caps.vault) {
        store_ = std::move(caps.vault);
        tier_ = Tier::Vault;
    }
    qCInfo(pkdSecrets) << "Credential tier:" << credentialTierName(tier_)
                       << (store_ ? store_->backendName() : QString());
}

std::shared_ptr<CredentialBackend>
CredentialBackend::detect(const QString &configDir) {
    const QString forced =
        qEnvironmentVariable("PORTKEYDROP_SECRET_BACKEND").trimmed().toLower();
    const bool wantKeyring = forced.isEmpty() || forced == "keyring";
    const bool wantVault = forced.isEmpty() || forced == "vault";
    if (!forced.isEmpty() && forced != "keyring" && forced != "vault" &&
        forced != "none")
        qCWarning(pkdSecrets) << "Ignoring unknown PORTKEYDROP_SECRET_BACKEND"
                              << forced;

    Capabilities caps;
    if (wantKeyring && SystemSecretStore::isAvailable())
        caps.systemStore = std::make_unique<SystemSecretStore>();
    if (!caps.systemStore && wantVault) {
        const QByteArray key = VaultSecretStore::machineKey();
        if (!key.isEmpty())
            caps.vault = std::make_unique<VaultSecretStore>(
                QDir(configDir).filePath("vault.enc"), key);
    }
    return std::make_shared<CredentialBackend>(std::move(caps));
}

QString CredentialBackend::tierName() const {
    return QString::fromLatin1(credentialTierName(tier_));
}

void CredentialBackend::store(const QString &siteId, const QString &password) {
    if (!store_ || siteId.isEmpty() || password.isEmpty())
        return;
    std::lock_guard<std::mutex> lk(mtx_);
    const auto r = store_->setSecret(siteId, password);
    if (!r.ok())
        qCWarning(pkdSecrets) << "Could not store password for site" << siteId
                              << persistStatusName(r.status) << r.detail;
}

QString CredentialBackend::retrieve(const QString &siteId) const {
    if (!store_ || siteId.isEmpty())
        return {};
    std::lock_guard<std::mutex> lk(mtx_);
    return store_->getSecret(siteId).value_or(QString());
}

void CredentialBackend::remove(const QString &siteId) {
    if (!store_ || siteId.isEmpty())
        return;
    std::lock_guard<std::mutex> lk(mtx_);
    const auto r = store_->removeSecret(siteId);
    if (!r.ok())
        qCWarning(pkdSecrets) << "Could not remove password for site" << siteId
                              << persistStatusName(r.status) << r.detail;
}
