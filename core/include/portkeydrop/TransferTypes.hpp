// Basic types shared between the protocol clients, the transfer manager and
// the UI: connection parameters, directory entries and the error model.
// Kept as plain values so they can be copied freely across threads.
#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace portkeydrop {

enum class Protocol { Ftp, Ftps, Sftp, Scp, WebDav };

// Host key verification policy for SSH based protocols.
enum class HostKeyPolicy {
    AutoAdd, // Accept unknown hosts and remember them in known_hosts.
    Strict,  // Reject hosts that are not already in known_hosts.
    Prompt   // Interactive confirmation. Not supported, connect fails fast.
};

// Lower-case wire name: "ftp", "ftps", "sftp", "scp", "webdav".
const char *protocolName(Protocol p);
std::optional<Protocol> protocolFromString(const std::string &name);
std::uint16_t defaultPort(Protocol p);

const char *hostKeyPolicyName(HostKeyPolicy p);

// Parameters for one connection attempt. Treated as immutable once handed
// to a client.
struct ConnectionInfo {
    Protocol protocol = Protocol::Sftp;
    std::string host;
    std::uint16_t port = 0; // 0 = protocol default
    std::string username;
    std::string password;
    std::string keyPath;
    int timeoutSeconds = 30;
    bool passiveMode = true; // FTP/FTPS only
    HostKeyPolicy hostKeyPolicy = HostKeyPolicy::AutoAdd;

    int keepaliveSeconds = 60;
    bool allowAgent = true;  // SFTP: try ssh-agent identities
    bool lookForKeys = true; // SFTP: try ~/.ssh/id_* keys
    std::optional<std::string> knownHostsPath; // default: ~/.ssh/known_hosts

    std::uint16_t effectivePort() const;
};

struct RemoteFile {
    std::string name;
    std::string path; // absolute
    std::uint64_t size = 0;
    bool isDir = false;
    std::optional<std::int64_t> modified; // epoch seconds, UTC
    std::string permissions;
    std::string owner;
    std::string group;

    // "<DIR>" for directories, otherwise B/KB/MB/GB with one decimal.
    std::string displaySize() const;
    // "YYYY-MM-DD HH:MM" in local time, empty when the time is unknown.
    std::string displayModified() const;
};

std::string formatSize(std::uint64_t bytes);

// floor(min(100, transferred * 100 / total)), 0 when total <= 0.
int progressPercent(std::int64_t transferred, std::int64_t total);

// Renders POSIX mode bits like `ls -l` ("drwxr-xr-x").
std::string formatPermissions(std::uint32_t mode);

enum class ErrorCode {
    None,
    ConnectionFailed,
    NotConnected,
    RemoteOperationFailed,
    TransferInterrupted,
    LocalIoFailed,
    Unsupported
};

const char *errorCodeName(ErrorCode c);

// Failure detail filled by operations that return false.
struct OpError {
    ErrorCode code = ErrorCode::None;
    std::string message;

    bool ok() const { return code == ErrorCode::None; }
    void clear() {
        code = ErrorCode::None;
        message.clear();
    }
    void set(ErrorCode c, std::string msg) {
        code = c;
        message = std::move(msg);
    }
};

// (bytesSoFar, totalBytes) after each chunk.
using ProgressCB = std::function<void(std::uint64_t, std::uint64_t)>;
// Polled at chunk boundaries; returning true aborts the transfer.
using CancelCB = std::function<bool()>;

} // namespace portkeydrop
