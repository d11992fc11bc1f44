#include "SiteManager.hpp"
#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLoggingCategory>
#include <QSaveFile>
#include <QUuid>
Q_LOGGING_CATEGORY(pkdSites, "portkeydrop.sites")

std::optional<portkeydrop::ConnectionInfo> Site::toConnectionInfo() const {
    auto proto = portkeydrop::protocolFromString(protocol.toStdString());
    if (!proto)
        return std::nullopt;
    portkeydrop::ConnectionInfo info;
    info.protocol = *proto;
    info.host = host.toStdString();
    info.port = static_cast<std::uint16_t>(
        (port < 0 || port > 65535) ? 0 : port);
    info.username = username.toStdString();
    info.password = password.toStdString();
    info.keyPath = keyPath.toStdString();
    return info;
}

static Site siteFromJson(const QJsonObject &o) {
    Site s;
    s.id = o.value("id").toString();
    s.name = o.value("name").toString();
    s.protocol = o.value("protocol").toString(s.protocol);
    s.host = o.value("host").toString();
    s.port = o.value("port").toInt(0);
    s.username = o.value("username").toString();
    s.password = o.value("password").toString(); // legacy files only
    s.keyPath = o.value("key_path").toString();
    s.initialDir = o.value("initial_dir").toString(s.initialDir);
    s.notes = o.value("notes").toString();
    return s;
}

static QJsonObject siteToJson(const Site &s) {
    QJsonObject o;
    o["id"] = s.id;
    o["name"] = s.name;
    o["protocol"] = s.protocol;
    o["host"] = s.host;
    o["port"] = s.port;
    o["username"] = s.username;
    o["key_path"] = s.keyPath;
    o["initial_dir"] = s.initialDir;
    o["notes"] = s.notes;
    return o;
}

SiteManager::SiteManager(QString configDir,
                         std::shared_ptr<CredentialBackend> creds)
    : configDir_(std::move(configDir)), creds_(std::move(creds)) {
    load();
}

QString SiteManager::sitesPath() const {
    return QDir(configDir_).filePath("sites.json");
}

void SiteManager::load() {
    sites_.clear();
    QFile f(sitesPath());
    if (!f.exists())
        return;
    if (!f.open(QIODevice::ReadOnly)) {
        qCWarning(pkdSites) << "Failed to load sites:" << f.errorString();
        return;
    }
    QJsonParseError perr{};
    const QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &perr);
    if (perr.error != QJsonParseError::NoError || !doc.isArray()) {
        qCWarning(pkdSites) << "Failed to load sites: malformed" << sitesPath()
                            << perr.errorString();
        return;
    }
    int migrated = 0;
    for (const auto &v : doc.array()) {
        if (!v.isObject())
            continue;
        Site s = siteFromJson(v.toObject());
        if (s.id.isEmpty())
            s.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
        const QString stored = creds_ ? creds_->retrieve(s.id) : QString();
        if (!stored.isEmpty()) {
            s.password = stored;
        } else if (!s.password.isEmpty() && creds_ && creds_->canStore()) {
            creds_->store(s.id, s.password);
            ++migrated;
        }
        sites_.push_back(s);
    }
    if (migrated > 0)
        qCInfo(pkdSites) << "Migrated" << migrated
                         << "plaintext password(s) to" << creds_->tierName();
}

bool SiteManager::save() {
    if (!QDir().mkpath(configDir_)) {
        qCWarning(pkdSites) << "Could not create" << configDir_;
        return false;
    }
    QJsonArray arr;
    for (const auto &s : sites_) {
        if (creds_ && !s.password.isEmpty())
            creds_->store(s.id, s.password);
        arr.append(siteToJson(s));
    }
    QSaveFile f(sitesPath());
    if (!f.open(QIODevice::WriteOnly)) {
        qCWarning(pkdSites) << "Could not write sites:" << f.errorString();
        return false;
    }
    const QByteArray data = QJsonDocument(arr).toJson(QJsonDocument::Indented);
    if (f.write(data) != data.size() || !f.commit()) {
        qCWarning(pkdSites) << "Could not write sites:" << f.errorString();
        return false;
    }
    return true;
}

Site SiteManager::add(Site site) {
    if (site.id.isEmpty())
        site.id = QUuid::createUuid().toString(QUuid::WithoutBraces);
    sites_.push_back(site);
    save();
    return site;
}

bool SiteManager::update(const Site &site) {
    for (auto &s : sites_) {
        if (s.id == site.id) {
            s = site;
            return save();
        }
    }
    qCWarning(pkdSites) << "Site not found:" << site.id;
    return false;
}

void SiteManager::remove(const QString &id) {
    if (creds_)
        creds_->remove(id);
    for (int i = 0; i < sites_.size(); ++i) {
        if (sites_[i].id == id) {
            sites_.remove(i);
            break;
        }
    }
    save();
}

std::optional<Site> SiteManager::get(const QString &id) const {
    for (const auto &s : sites_) {
        if (s.id == id)
            return s;
    }
    return std::nullopt;
}

std::optional<Site> SiteManager::findByName(const QString &name) const {
    for (const auto &s : sites_) {
        if (s.name.compare(name, Qt::CaseInsensitive) == 0)
            return s;
    }
    return std::nullopt;
}
