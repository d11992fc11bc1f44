// Three-tier password persistence keyed by site id: system secret store,
// encrypted vault, or nothing. The tier is fixed at construction. Failures
// are logged and absorbed; callers only ever see an empty password.
#pragma once
#include "SecretStore.hpp"
#include <QString>
#include <memory>
#include <mutex>

class CredentialBackend {
public:
    enum class Tier { SystemStore, Vault, None };

    // What the runtime offers. Either may be null.
    struct Capabilities {
        std::unique_ptr<SecretStore> systemStore;
        std::unique_ptr<SecretStore> vault;
    };

    // Picks the first available tier: systemStore, then vault, then None.
    explicit CredentialBackend(Capabilities caps);

    // Probes the platform. PORTKEYDROP_SECRET_BACKEND=keyring|vault|none
    // forces a tier when that tier is available.
    static std::shared_ptr<CredentialBackend> detect(const QString &configDir);

    Tier tier() const { return tier_; }
    QString tierName() const;
    bool canStore() const { return tier_ != Tier::None; }

    // No-op when nothing can persist or the password is empty.
    void store(const QString &siteId, const QString &password);
    // "" when missing or on any failure.
    QString retrieve(const QString &siteId) const;
    void remove(const QString &siteId);

private:
    mutable std::mutex mtx_;
    std::unique_ptr<SecretStore> store_;
    Tier tier_ = Tier::None;
};

const char *credentialTierName(CredentialBackend::Tier tier);
