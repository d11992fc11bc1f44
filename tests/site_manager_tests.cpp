// SiteManager tests: persistence, password migration and the rule that the
// profile file never carries a password (run via CTest).
#include "SiteManager.hpp"
#include "VaultSecretStore.hpp"

#include <QCoreApplication>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLoggingCategory>
#include <QStringList>
#include <QTemporaryDir>
#include <cstdlib>
#include <iostream>
#include <string>

namespace {

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }
};

std::shared_ptr<CredentialBackend> vaultBackend(const QString &dir) {
    CredentialBackend::Capabilities caps;
    caps.vault = std::make_unique<VaultSecretStore>(
        dir + "/vault.enc", VaultSecretStore::deriveKey("testhost", "tester"));
    return std::make_shared<CredentialBackend>(std::move(caps));
}

std::shared_ptr<CredentialBackend> noBackend() {
    return std::make_shared<CredentialBackend>(CredentialBackend::Capabilities{});
}

// Messages from the portkeydrop.sites category, captured while a
// LogCapture is alive.
QStringList g_siteLog;

void captureSiteLog(QtMsgType, const QMessageLogContext &ctx,
                    const QString &msg) {
    if (ctx.category && QByteArray(ctx.category) == "portkeydrop.sites")
        g_siteLog << msg;
}

struct LogCapture {
    QtMessageHandler previous;
    LogCapture() {
        g_siteLog.clear();
        QLoggingCategory::setFilterRules("portkeydrop.sites.info=true");
        previous = qInstallMessageHandler(captureSiteLog);
    }
    ~LogCapture() { qInstallMessageHandler(previous); }
    bool saw(const QString &needle) const {
        for (const auto &m : g_siteLog)
            if (m.contains(needle))
                return true;
        return false;
    }
};

bool writeLegacySites(const QString &dir, const QJsonObject &site) {
    QFile f(dir + "/sites.json");
    if (!f.open(QIODevice::WriteOnly))
        return false;
    const QByteArray data = QJsonDocument(QJsonArray{site}).toJson();
    return f.write(data) == data.size();
}

QByteArray readAll(const QString &path) {
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly))
        return {};
    return f.readAll();
}

void test_site_to_connection_info(TestContext &t) {
    Site s;
    s.host = "h";
    auto info = s.toConnectionInfo();
    t.check(info.has_value(), "default site converts");
    if (info) {
        t.check(info->protocol == portkeydrop::Protocol::Sftp, "sftp default");
        t.check(info->port == 0, "port 0 kept");
        t.check(info->effectivePort() == 22, "effective port 22");
    }
    s.protocol = "ftps";
    s.port = 2121;
    s.username = "bob";
    s.password = "pw";
    s.keyPath = "/k";
    info = s.toConnectionInfo();
    t.check(info && info->protocol == portkeydrop::Protocol::Ftps &&
                info->port == 2121 && info->username == "bob" &&
                info->password == "pw" && info->keyPath == "/k",
            "fields copied");
    s.protocol = "gopher";
    t.check(!s.toConnectionInfo().has_value(), "unknown protocol rejected");
    t.check(Site{}.initialDir == "/", "initial dir defaults to /");
}

void test_crud_and_persistence(TestContext &t) {
    QTemporaryDir tmp;
    auto creds = vaultBackend(tmp.path());
    QString id;
    {
        SiteManager mgr(tmp.path(), creds);
        t.check(mgr.sites().isEmpty(), "no sites initially");
        Site s;
        s.name = "Work Server";
        s.host = "work.example";
        s.username = "alice";
        s.password = "hunter2";
        s.notes = "primary";
        const Site added = mgr.add(s);
        id = added.id;
        t.check(!id.isEmpty(), "id assigned");
        t.check(mgr.get(id).has_value(), "get by id");
        t.check(mgr.findByName("work server").has_value(),
                "findByName is case-insensitive");
        t.check(!mgr.findByName("nope").has_value(), "findByName miss");

        auto copy = mgr.sites();
        copy[0].name = "changed";
        t.check(mgr.sites()[0].name == "Work Server", "sites() returns a copy");

        Site upd = added;
        upd.port = 2200;
        t.check(mgr.update(upd), "update existing");
        Site ghost;
        ghost.id = "missing";
        t.check(!mgr.update(ghost), "update unknown id fails");
    }

    const QByteArray json = readAll(tmp.filePath("sites.json"));
    t.check(!json.isEmpty(), "sites.json written");
    t.check(!json.contains("hunter2"), "password never in sites.json");
    t.check(!json.contains("\"password\""), "no password field");

    SiteManager reloaded(tmp.path(), creds);
    auto s = reloaded.get(id);
    t.check(s.has_value(), "site persisted");
    t.check(s && s->port == 2200, "update persisted");
    t.check(s && s->notes == "primary", "notes persisted");
    t.check(s && s->password == "hunter2", "password restored from backend");

    reloaded.remove(id);
    t.check(!reloaded.get(id).has_value(), "removed");
    t.check(creds->retrieve(id).isEmpty(), "remove deletes the stored password");
}

void test_plaintext_migration(TestContext &t) {
    QTemporaryDir tmp;
    QJsonObject legacy{{"id", "legacy-1"},      {"name", "Old"},
                       {"protocol", "ftp"},     {"host", "old.example"},
                       {"port", 21},            {"username", "u"},
                       {"password", "plain!"},  {"key_path", ""},
                       {"initial_dir", "/pub"}, {"notes", ""},
                       {"unknown_field", true}};
    t.check(writeLegacySites(tmp.path(), legacy), "legacy file");

    auto creds = vaultBackend(tmp.path());
    LogCapture log;
    SiteManager mgr(tmp.path(), creds);
    t.check(log.saw("Migrated 1"), "migration logged with its count");
    auto s = mgr.get("legacy-1");
    t.check(s && s->password == "plain!", "legacy password loaded");
    t.check(s && s->initialDir == "/pub", "legacy fields loaded");
    t.check(creds->retrieve("legacy-1") == "plain!",
            "legacy password migrated to backend");

    t.check(mgr.save(), "save");
    t.check(!readAll(tmp.filePath("sites.json")).contains("plain!"),
            "plaintext stripped on next save");
}

void test_no_backend_never_persists(TestContext &t) {
    QTemporaryDir tmp;
    auto creds = noBackend();
    {
        SiteManager mgr(tmp.path(), creds);
        Site s;
        s.name = "x";
        s.host = "h";
        s.password = "pw";
        mgr.add(s);
    }
    t.check(!readAll(tmp.filePath("sites.json")).contains("\"pw\""),
            "password not written without a backend");
    SiteManager reloaded(tmp.path(), creds);
    t.check(reloaded.sites().size() == 1, "site kept");
    t.check(reloaded.sites()[0].password.isEmpty(),
            "password does not survive a restart without a backend");
}

void test_plaintext_without_backend(TestContext &t) {
    QTemporaryDir tmp;
    QJsonObject legacy{{"id", "legacy-2"}, {"name", "Old"},
                       {"protocol", "sftp"}, {"host", "old.example"},
                       {"password", "plain!"}};
    t.check(writeLegacySites(tmp.path(), legacy), "legacy file");

    LogCapture log;
    SiteManager mgr(tmp.path(), noBackend());
    t.check(!log.saw("Migrated"), "nothing reported migrated without a backend");
    auto s = mgr.get("legacy-2");
    t.check(s && s->password == "plain!", "password kept for the session");
    t.check(mgr.save(), "save");
    t.check(!readAll(tmp.filePath("sites.json")).contains("plain!"),
            "plaintext stripped even without a backend");
}

void test_corrupt_file(TestContext &t) {
    QTemporaryDir tmp;
    QFile f(tmp.filePath("sites.json"));
    t.check(f.open(QIODevice::WriteOnly), "corrupt fixture");
    f.write("{not json");
    f.close();
    SiteManager mgr(tmp.path(), noBackend());
    t.check(mgr.sites().isEmpty(), "corrupt file loads as empty");
}

} // namespace

int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);
    TestContext t;
    test_site_to_connection_info(t);
    test_crud_and_persistence(t);
    test_plaintext_migration(t);
    test_no_backend_never_persists(t);
    test_plaintext_without_backend(t);
    test_corrupt_file(t);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] portkeydrop_site_manager_tests\n";
    return EXIT_SUCCESS;
}
