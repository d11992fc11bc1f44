// Saved connection profiles in <configDir>/sites.json. Passwords live in the
// CredentialBackend and are never written to the profile file.
#pragma once
#include "CredentialBackend.hpp"
#include "portkeydrop/TransferTypes.hpp"
#include <QString>
#include <QVector>
#include <memory>
#include <optional>

struct Site {
    QString id; // UUID, assigned by SiteManager::add() when empty
    QString name;
    QString protocol = QStringLiteral("sftp");
    QString host;
    int port = 0;
    QString username;
    QString password; // in memory only
    QString keyPath;
    QString initialDir = QStringLiteral("/");
    QString notes;

    // nullopt when `protocol` is not a known protocol name.
    std::optional<portkeydrop::ConnectionInfo> toConnectionInfo() const;
};

class SiteManager {
public:
    SiteManager(QString configDir, std::shared_ptr<CredentialBackend> creds);

    // Re-reads sites.json. Missing or corrupt file -> no sites. Passwords
    // are filled from the credential backend; legacy plaintext passwords are
    // migrated into it and dropped from the file on the next save.
    void load();
    bool save();

    // Copy of all sites in insertion order.
    QVector<Site> sites() const { return sites_; }

    // Returns the stored site (with its id).
    Site add(Site site);
    // false when no site has `site.id` or the file could not be written.
    bool update(const Site &site);
    // Also deletes the stored password.
    void remove(const QString &id);
    std::optional<Site> get(const QString &id) const;
    // Case-insensitive.
    std::optional<Site> findByName(const QString &name) const;

    QString sitesPath() const;

private:
    QString configDir_;
    std::shared_ptr<CredentialBackend> creds_;
    QVector<Site> sites_;
};
