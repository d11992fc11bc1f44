#pragma once
#include <QString>
#include <optional>

// Secret storage keyed by a logical key (the site id). Implementations
// report persistence failures through PersistResult and never throw.
class SecretStore {
public:
    enum class PersistStatus {
        Stored,
        Unavailable,
        PermissionDenied,
        BackendError
    };

    struct PersistResult {
        PersistStatus status = PersistStatus::Stored;
        QString detail;
        bool ok() const { return status == PersistStatus::Stored; }
    };

    virtual ~SecretStore() = default;

    virtual PersistResult setSecret(const QString &key,
                                    const QString &value) = 0;
    // nullopt when missing or empty.
    virtual std::optional<QString> getSecret(const QString &key) const = 0;
    virtual PersistResult removeSecret(const QString &key) = 0;

    virtual QString backendName() const = 0;
};

const char *persistStatusName(SecretStore::PersistStatus st);

// OS secret store: Keychain on macOS, Secret Service (libsecret) on Linux.
// Builds without either report Unavailable for every call.
class SystemSecretStore : public SecretStore {
public:
    explicit SystemSecretStore(QString service = QStringLiteral("portkeydrop"));

    PersistResult setSecret(const QString &key, const QString &value) override;
    std::optional<QString> getSecret(const QString &key) const override;
    PersistResult removeSecret(const QString &key) override;
    QString backendName() const override;

    // Probes the platform store (on Linux: a reachable Secret Service).
    static bool isAvailable();

private:
    QString service_;
};
