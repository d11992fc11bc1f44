#include "AppSettings.hpp"
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLoggingCategory>
#include <QSaveFile>
Q_LOGGING_CATEGORY(pkdSettings, "portkeydrop.settings")

namespace {

// Each reader keeps the current value unless the key holds the right type.
void readInt(const QJsonObject &o, const char *key, int &out) {
    const QJsonValue v = o.value(QLatin1String(key));
    if (v.isDouble())
        out = v.toInt(out);
}

void readBool(const QJsonObject &o, const char *key, bool &out) {
    const QJsonValue v = o.value(QLatin1String(key));
    if (v.isBool())
        out = v.toBool();
}

void readString(const QJsonObject &o, const char *key, QString &out) {
    const QJsonValue v = o.value(QLatin1String(key));
    if (v.isString())
        out = v.toString();
}

QString normalizedDir(const QString &path) {
    QString p = path;
    if (p == "~" || p.startsWith("~/"))
        p = QDir::homePath() + p.mid(1);
    const QFileInfo fi(p);
    const QString canonical = fi.canonicalFilePath();
    return canonical.isEmpty() ? fi.absoluteFilePath() : canonical;
}

} // namespace

QString defaultConfigDir() { return QDir::home().filePath(".portkeydrop"); }

AppSettings loadSettings(const QString &configDir) {
    AppSettings s;
    QFile f(QDir(configDir).filePath("settings.json"));
    if (!f.exists())
        return s;
    if (!f.open(QIODevice::ReadOnly)) {
        qCWarning(pkdSettings) << "Failed to load settings:" << f.errorString();
        return s;
    }
    QJsonParseError perr{};
    const QJsonDocument doc = QJsonDocument::fromJson(f.readAll(), &perr);
    if (perr.error != QJsonParseError::NoError || !doc.isObject()) {
        qCWarning(pkdSettings) << "Failed to load settings:"
                               << perr.errorString();
        return AppSettings{};
    }
    const QJsonObject root = doc.object();

    const QJsonObject t = root.value("transfer").toObject();
    readInt(t, "concurrent_transfers", s.transfer.concurrentTransfers);
    readString(t, "overwrite_mode", s.transfer.overwriteMode);
    readBool(t, "resume_partial", s.transfer.resumePartial);
    readBool(t, "preserve_timestamps", s.transfer.preserveTimestamps);
    readBool(t, "follow_symlinks", s.transfer.followSymlinks);
    readString(t, "default_download_dir", s.transfer.defaultDownloadDir);

    const QJsonObject d = root.value("display").toObject();
    readBool(d, "announce_file_count", s.display.announceFileCount);
    readInt(d, "progress_interval", s.display.progressInterval);
    readBool(d, "show_hidden_files", s.display.showHiddenFiles);
    readString(d, "sort_by", s.display.sortBy);
    readBool(d, "sort_ascending", s.display.sortAscending);
    readString(d, "date_format", s.display.dateFormat);

    const QJsonObject c = root.value("connection").toObject();
    readString(c, "protocol", s.connection.protocol);
    readInt(c, "timeout", s.connection.timeout);
    readInt(c, "keepalive", s.connection.keepalive);
    readInt(c, "max_retries", s.connection.maxRetries);
    readBool(c, "passive_mode", s.connection.passiveMode);
    readString(c, "verify_host_keys", s.connection.verifyHostKeys);

    const QJsonObject sp = root.value("speech").toObject();
    readInt(sp, "rate", s.speech.rate);
    readInt(sp, "volume", s.speech.volume);
    readString(sp, "verbosity", s.speech.verbosity);

    const QJsonObject a = root.value("app").toObject();
    readBool(a, "remember_last_local_folder_on_startup",
             s.app.rememberLastLocalFolderOnStartup);
    const QJsonValue last = a.value("last_local_folder");
    if (last.isString() && !last.toString().isEmpty())
        s.app.lastLocalFolder = last.toString();
    return s;
}

bool saveSettings(const AppSettings &s, const QString &configDir) {
    if (!QDir().mkpath(configDir)) {
        qCWarning(pkdSettings) << "Could not create" << configDir;
        return false;
    }
    QJsonObject t{{"concurrent_transfers", s.transfer.concurrentTransfers},
                  {"overwrite_mode", s.transfer.overwriteMode},
                  {"resume_partial", s.transfer.resumePartial},
                  {"preserve_timestamps", s.transfer.preserveTimestamps},
                  {"follow_symlinks", s.transfer.followSymlinks},
                  {"default_download_dir", s.transfer.defaultDownloadDir}};
    QJsonObject d{{"announce_file_count", s.display.announceFileCount},
                  {"progress_interval", s.display.progressInterval},
                  {"show_hidden_files", s.display.showHiddenFiles},
                  {"sort_by", s.display.sortBy},
                  {"sort_ascending", s.display.sortAscending},
                  {"date_format", s.display.dateFormat}};
    QJsonObject c{{"protocol", s.connection.protocol},
                  {"timeout", s.connection.timeout},
                  {"keepalive", s.connection.keepalive},
                  {"max_retries", s.connection.maxRetries},
                  {"passive_mode", s.connection.passiveMode},
                  {"verify_host_keys", s.connection.verifyHostKeys}};
    QJsonObject sp{{"rate", s.speech.rate},
                   {"volume", s.speech.volume},
                   {"verbosity", s.speech.verbosity}};
    QJsonObject a;
    a["remember_last_local_folder_on_startup"] =
        s.app.rememberLastLocalFolderOnStartup;
    if (s.app.rememberLastLocalFolderOnStartup && s.app.lastLocalFolder)
        a["last_local_folder"] = *s.app.lastLocalFolder;
    else
        a["last_local_folder"] = QJsonValue::Null;

    QJsonObject root{{"transfer", t},
                     {"display", d},
                     {"connection", c},
                     {"speech", sp},
                     {"app", a}};
    QSaveFile f(QDir(configDir).filePath("settings.json"));
    if (!f.open(QIODevice::WriteOnly)) {
        qCWarning(pkdSettings) << "Could not write settings:" << f.errorString();
        return false;
    }
    const QByteArray data = QJsonDocument(root).toJson(QJsonDocument::Indented);
    if (f.write(data) != data.size() || !f.commit()) {
        qCWarning(pkdSettings) << "Could not write settings:" << f.errorString();
        return false;
    }
    return true;
}

QString resolveStartupLocalFolder(AppSettings &settings,
                                  const QString &fallback) {
    const QString fallbackPath =
        fallback.isEmpty() ? QDir::homePath() : fallback;
    if (!settings.app.rememberLastLocalFolderOnStartup)
        return fallbackPath;
    if (!settings.app.lastLocalFolder || settings.app.lastLocalFolder->isEmpty())
        return fallbackPath;

    const QString saved = *settings.app.lastLocalFolder;
    const QString path = normalizedDir(saved);
    if (QFileInfo(path).isDir())
        return path;

    qCWarning(pkdSettings) << "Saved local folder is unavailable:" << saved;
    settings.app.lastLocalFolder.reset();
    return fallbackPath;
}

bool updateLastLocalFolder(AppSettings &settings, const QString &path) {
    if (!settings.app.rememberLastLocalFolderOnStartup) {
        if (settings.app.lastLocalFolder) {
            settings.app.lastLocalFolder.reset();
            return true;
        }
        return false;
    }
    const QString resolved = normalizedDir(path);
    if (settings.app.lastLocalFolder == resolved)
        return false;
    settings.app.lastLocalFolder = resolved;
    return true;
}

void applyConnectionDefaults(const AppSettings &settings,
                             portkeydrop::ConnectionInfo &info) {
    const ConnectionDefaults &c = settings.connection;
    if (c.timeout > 0)
        info.timeoutSeconds = c.timeout;
    if (c.keepalive >= 0)
        info.keepaliveSeconds = c.keepalive;
    info.passiveMode = c.passiveMode;
    info.hostKeyPolicy = c.verifyHostKeys.trimmed().toLower() == "always"
                             ? portkeydrop::HostKeyPolicy::Strict
                             : portkeydrop::HostKeyPolicy::AutoAdd;
}
