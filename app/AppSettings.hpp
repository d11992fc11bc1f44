// Application settings persisted as <configDir>/settings.json, grouped as
// transfer/display/connection/speech/app.
#pragma once
#include "portkeydrop/TransferTypes.hpp"
#include <QDir>
#include <QString>
#include <optional>

struct TransferSettings {
    int concurrentTransfers = 2;
    QString overwriteMode = QStringLiteral("ask"); // ask|overwrite|skip|rename
    bool resumePartial = true;
    bool preserveTimestamps = true;
    bool followSymlinks = false;
    QString defaultDownloadDir = QDir::home().filePath("Downloads");
};

struct DisplaySettings {
    bool announceFileCount = true;
    int progressInterval = 25; // announce every N%
    bool showHiddenFiles = false;
    QString sortBy = QStringLiteral("name");
    bool sortAscending = true;
    QString dateFormat = QStringLiteral("relative");
};

struct ConnectionDefaults {
    QString protocol = QStringLiteral("sftp");
    int timeout = 30;
    int keepalive = 60;
    int maxRetries = 3;
    bool passiveMode = true;
    QString verifyHostKeys = QStringLiteral("ask"); // ask|always|never
};

struct SpeechSettings {
    int rate = 50;
    int volume = 100;
    QString verbosity = QStringLiteral("normal");
};

struct StartupSettings {
    bool rememberLastLocalFolderOnStartup = true;
    std::optional<QString> lastLocalFolder;
};

struct AppSettings {
    TransferSettings transfer;
    DisplaySettings display;
    ConnectionDefaults connection;
    SpeechSettings speech;
    StartupSettings app;
};

// ~/.portkeydrop
QString defaultConfigDir();

// Missing file gives defaults; a malformed one gives defaults and a warning.
// Unknown keys are ignored, missing keys keep their defaults.
AppSettings loadSettings(const QString &configDir);
bool saveSettings(const AppSettings &settings, const QString &configDir);

// Folder to show on startup. Clears a remembered folder that no longer
// exists.
QString resolveStartupLocalFolder(AppSettings &settings,
                                  const QString &fallback = QString());
// Returns true when `settings` changed.
bool updateLastLocalFolder(AppSettings &settings, const QString &path);

// Copies timeout, keepalive, passive mode and host-key policy into `info`.
// "always" maps to Strict; "ask" and "never" map to AutoAdd.
void applyConnectionDefaults(const AppSettings &settings,
                             portkeydrop::ConnectionInfo &info);
