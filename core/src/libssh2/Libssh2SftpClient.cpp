// libssh2 backend: manages the TCP socket, SSH session and SFTP channel.
// Host keys are checked against known_hosts according to HostKeyPolicy and
// authentication walks agent, key files and password in that order.
#include "portkeydrop/Libssh2SftpClient.hpp"
#include "portkeydrop/Log.hpp"
#include "portkeydrop/RemotePath.hpp"

#include <libssh2.h>
#include <libssh2_sftp.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// POSIX sockets
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace portkeydrop {

namespace {

std::once_flag g_libssh2InitOnce;
int g_libssh2InitResult = -1;

constexpr std::size_t kChunk = 32 * 1024;
constexpr int kMaxAgentTries = 3;

// Context for keyboard-interactive: answers username and password prompts.
struct KbdIntCtx {
    const char *user;
    const char *pass;
};

char *dupAnswer(const char *s, std::size_t len) {
    char *buf = static_cast<char *>(std::malloc(len + 1));
    if (!buf)
        return nullptr;
    std::memcpy(buf, s, len);
    buf[len] = '\0';
    return buf;
}

bool promptWantsUser(const char *prompt) {
    std::string p(prompt ? prompt : "");
    for (char &c : p)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return p.find("user") != std::string::npos ||
           p.find("login") != std::string::npos;
}

void kbdintCallback(const char *, int, const char *, int, int num_prompts,
                    const LIBSSH2_USERAUTH_KBDINT_PROMPT *prompts,
                    LIBSSH2_USERAUTH_KBDINT_RESPONSE *responses,
                    void **abstract) {
    if (!abstract || !*abstract)
        return;
    const auto *ctx = static_cast<const KbdIntCtx *>(*abstract);
    for (int i = 0; i < num_prompts; ++i) {
        const char *text = (prompts && prompts[i].text)
                               ? reinterpret_cast<const char *>(prompts[i].text)
                               : "";
        const char *ans = promptWantsUser(text) ? ctx->user : ctx->pass;
        const std::size_t alen = ans ? std::strlen(ans) : 0;
        responses[i].text = alen ? dupAnswer(ans, alen) : nullptr;
        responses[i].length =
            responses[i].text ? static_cast<unsigned int>(alen) : 0;
    }
}

std::string homeDir() {
    const char *home = std::getenv("HOME");
    return home ? std::string(home) : std::string();
}

int knownHostKeyType(int keytype) {
    switch (keytype) {
    case LIBSSH2_HOSTKEY_TYPE_RSA:
        return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
    case LIBSSH2_HOSTKEY_TYPE_DSS:
        return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
    case LIBSSH2_HOSTKEY_TYPE_ED25519:
        return LIBSSH2_KNOWNHOST_KEY_ED25519;
#endif
    default:
        return 0;
    }
}

const char *sftpStatusText(unsigned long code) {
    switch (code) {
    case LIBSSH2_FX_NO_SUCH_FILE:
    case LIBSSH2_FX_NO_SUCH_PATH:
        return "no such file or directory";
    case LIBSSH2_FX_PERMISSION_DENIED:
        return "permission denied";
    case LIBSSH2_FX_FILE_ALREADY_EXISTS:
        return "file already exists";
    case LIBSSH2_FX_DIR_NOT_EMPTY:
        return "directory not empty";
    case LIBSSH2_FX_NOT_A_DIRECTORY:
        return "not a directory";
    case LIBSSH2_FX_WRITE_PROTECT:
        return "write protected";
    case LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM:
    case LIBSSH2_FX_QUOTA_EXCEEDED:
        return "no space left";
    case LIBSSH2_FX_OP_UNSUPPORTED:
        return "operation not supported";
    default:
        return "failure";
    }
}

bool isDirMode(unsigned long perms) {
    return (perms & LIBSSH2_SFTP_S_IFMT) == LIBSSH2_SFTP_S_IFDIR;
}

} // namespace

Libssh2SftpClient::Libssh2SftpClient(ConnectionInfo info)
    : TransferClient(std::move(info)) {
    std::call_once(g_libssh2InitOnce,
                   [] { g_libssh2InitResult = libssh2_init(0); });
}

Libssh2SftpClient::~Libssh2SftpClient() { disconnect(); }

bool Libssh2SftpClient::tcpConnect(std::string &err) {
    struct addrinfo hints {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    const std::string portStr = std::to_string(info_.effectivePort());
    struct addrinfo *res = nullptr;
    const int gai =
        getaddrinfo(info_.host.c_str(), portStr.c_str(), &hints, &res);
    if (gai != 0) {
        err = std::string("could not resolve host: ") + gai_strerror(gai);
        return false;
    }

    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1)
            continue;
        int opt = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#ifdef __APPLE__
        int idle = info_.keepaliveSeconds > 0 ? info_.keepaliveSeconds : 60;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPALIVE, &idle, sizeof(idle));
#elif defined(__linux__)
        int idle = info_.keepaliveSeconds > 0 ? info_.keepaliveSeconds : 60;
        int intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        if (::connect(s, rp->ai_addr, rp->ai_addrlen) == 0) {
            sock_ = s;
            freeaddrinfo(res);
            return true;
        }
        ::close(s);
    }
    freeaddrinfo(res);
    err = "unable to reach " + info_.host + ":" + portStr;
    return false;
}

std::string Libssh2SftpClient::lastSessionError() const {
    if (!session_)
        return {};
    char *msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session_, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, static_cast<std::size_t>(len))
                            : std::string();
}

bool Libssh2SftpClient::verifyHostKey(std::string &err) {
    LIBSSH2_KNOWNHOSTS *nh = libssh2_knownhost_init(session_);
    if (!nh) {
        err = "could not initialize known_hosts";
        return false;
    }

    std::string khPath;
    if (info_.knownHostsPath.has_value())
        khPath = *info_.knownHostsPath;
    else if (!homeDir().empty())
        khPath = homeDir() + "/.ssh/known_hosts";

    // Missing or unreadable known_hosts is not fatal: STRICT then simply
    // finds no entry and AUTO_ADD starts a new file.
    if (khPath.empty() ||
        libssh2_knownhost_readfile(nh, khPath.c_str(),
                                   LIBSSH2_KNOWNHOST_FILE_OPENSSH) < 0) {
        PKD_LOGW("could not load system host keys from '%s'", khPath.c_str());
    }

    size_t keylen = 0;
    int keytype = 0;
    const char *hostkey = libssh2_session_hostkey(session_, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        libssh2_knownhost_free(nh);
        err = "server did not present a host key";
        return false;
    }
    const int alg = knownHostKeyType(keytype);
    const int port = static_cast<int>(info_.effectivePort());

    struct libssh2_knownhost *found = nullptr;
    int check = libssh2_knownhost_checkp(
        nh, info_.host.c_str(), port, hostkey, keylen,
        LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg,
        &found);
    if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH &&
        check != LIBSSH2_KNOWNHOST_CHECK_MISMATCH) {
        check = libssh2_knownhost_checkp(
            nh, info_.host.c_str(), port, hostkey, keylen,
            LIBSSH2_KNOWNHOST_TYPE_SHA1 | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg,
            &found);
    }

    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        libssh2_knownhost_free(nh);
        return true;
    }
    if (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH) {
        libssh2_knownhost_free(nh);
        err = "host key for " + info_.host +
              " does not match known_hosts (possible man-in-the-middle attack)";
        return false;
    }
    if (check != LIBSSH2_KNOWNHOST_CHECK_NOTFOUND) {
        libssh2_knownhost_free(nh);
        err = "host key verification failed";
        return false;
    }
    if (info_.hostKeyPolicy == HostKeyPolicy::Strict) {
        libssh2_knownhost_free(nh);
        err = "server " + info_.host +
              " is not in known_hosts and the host key policy is strict";
        return false;
    }

    // AUTO_ADD: remember the key. known_hosts uses "[host]:port" off port 22.
    const std::string entryName =
        port == 22 ? info_.host
                   : "[" + info_.host + "]:" + std::to_string(port);
    const int addMask =
        LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
    if (libssh2_knownhost_addc(nh, entryName.c_str(), nullptr, hostkey, keylen,
                               nullptr, 0, addMask, nullptr) != 0 ||
        khPath.empty() ||
        libssh2_knownhost_writefile(nh, khPath.c_str(),
                                    LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0) {
        PKD_LOGW("accepted new host key but could not save it to '%s'",
                 khPath.c_str());
    } else {
        PKD_LOGI("added new host key for %s to known_hosts",
                 redacted(entryName).c_str());
    }
    libssh2_knownhost_free(nh);
    return true;
}

bool Libssh2SftpClient::authenticate(std::string &err) {
    const std::string &user = info_.username;
    const unsigned userLen = static_cast<unsigned>(user.size());
    const char *passphrase =
        info_.password.empty() ? nullptr : info_.password.c_str();

    std::string authlist;
    if (char *methods = libssh2_userauth_list(session_, user.c_str(), userLen))
        authlist = methods;
    if (libssh2_userauth_authenticated(session_))
        return true;
    auto hasMethod = [&](const char *m) {
        return authlist.find(m) != std::string::npos;
    };

    std::vector<std::string> attempted;
    bool keyUnreadable = false;

    auto tryKeyFile = [&](const std::string &path) {
        int rc = -1;
        for (;;) {
            rc = libssh2_userauth_publickey_fromfile(
                session_, user.c_str(), nullptr, path.c_str(), passphrase);
            if (rc != LIBSSH2_ERROR_EAGAIN)
                break;
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        if (rc == LIBSSH2_ERROR_FILE)
            keyUnreadable = true;
        return rc == 0;
    };

    if (!info_.keyPath.empty()) {
        // An explicit key is used exclusively: no agent, no key discovery.
        attempted.push_back("publickey (" + info_.keyPath + ")");
        if (tryKeyFile(info_.keyPath))
            return true;
    } else if (hasMethod("publickey")) {
        if (info_.allowAgent) {
            attempted.push_back("agent");
            LIBSSH2_AGENT *agent = libssh2_agent_init(session_);
            bool authed = false;
            if (agent && libssh2_agent_connect(agent) == 0 &&
                libssh2_agent_list_identities(agent) == 0) {
                struct libssh2_agent_publickey *identity = nullptr;
                struct libssh2_agent_publickey *prev = nullptr;
                int tries = 0;
                while (tries < kMaxAgentTries &&
                       libssh2_agent_get_identity(agent, &identity, prev) ==
                           0) {
                    prev = identity;
                    ++tries;
                    int arc = -1;
                    for (;;) {
                        arc = libssh2_agent_userauth(agent, user.c_str(),
                                                     identity);
                        if (arc != LIBSSH2_ERROR_EAGAIN)
                            break;
                        std::this_thread::sleep_for(
                            std::chrono::milliseconds(50));
                    }
                    if (arc == 0) {
                        authed = true;
                        break;
                    }
                }
            } else {
                PKD_LOGD("ssh-agent not available: %s",
                         lastSessionError().c_str());
            }
            if (agent) {
                libssh2_agent_disconnect(agent);
                libssh2_agent_free(agent);
            }
            if (authed)
                return true;
        }
        if (info_.lookForKeys && !homeDir().empty()) {
            for (const char *name : {"id_ed25519", "id_ecdsa", "id_rsa", "id_dsa"}) {
                const std::string path = homeDir() + "/.ssh/" + name;
                std::error_code ec;
                if (!std::filesystem::exists(path, ec))
                    continue;
                attempted.push_back(std::string("publickey (~/.ssh/") + name +
                                    ")");
                if (tryKeyFile(path))
                    return true;
            }
        }
    }

    if (!info_.password.empty()) {
        int rc = -1;
        if (authlist.empty() || hasMethod("password")) {
            attempted.push_back("password");
            for (;;) {
                rc = libssh2_userauth_password(session_, user.c_str(),
                                               info_.password.c_str());
                if (rc != LIBSSH2_ERROR_EAGAIN)
                    break;
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
            if (rc == 0)
                return true;
            if (rc == LIBSSH2_ERROR_SOCKET_DISCONNECT ||
                rc == LIBSSH2_ERROR_SOCKET_SEND ||
                rc == LIBSSH2_ERROR_SOCKET_RECV) {
                err = "server closed the connection during password "
                      "authentication";
                return false;
            }
        }
        if (hasMethod("keyboard-interactive")) {
            attempted.push_back("keyboard-interactive");
            KbdIntCtx ctx{user.c_str(), info_.password.c_str()};
            void **abs = libssh2_session_abstract(session_);
            if (abs)
                *abs = &ctx;
            for (;;) {
                rc = libssh2_userauth_keyboard_interactive(session_,
                                                           user.c_str(),
                                                           kbdintCallback);
                if (rc != LIBSSH2_ERROR_EAGAIN)
                    break;
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
            if (abs)
                *abs = nullptr;
            if (rc == 0)
                return true;
        }
    }

    if (attempted.empty()) {
        err = "no authentication method available (server accepts: " +
              (authlist.empty() ? std::string("unknown") : authlist) +
              "); provide a password or key file";
        return false;
    }
    std::string tried;
    for (const auto &m : attempted)
        tried += (tried.empty() ? "" : ", ") + m;
    if (!info_.keyPath.empty() && keyUnreadable && !passphrase) {
        err = "could not use key file " + info_.keyPath +
              " (it may be encrypted and require a passphrase)";
    } else if (!info_.keyPath.empty()) {
        err = "authentication failed using key file " + info_.keyPath;
    } else {
        err = "authentication failed for user '" + redacted(user) + "'";
    }
    err += " (methods tried: " + tried + ")";
    const std::string last = lastSessionError();
    if (!last.empty())
        err += ": " + last;
    return false;
}

bool Libssh2SftpClient::connect(OpError &err) {
    err.clear();
    const std::string prefix = "SFTP connection failed: ";
    if (connected_) {
        err.set(ErrorCode::ConnectionFailed, prefix + "already connected");
        return false;
    }
    if (info_.hostKeyPolicy == HostKeyPolicy::Prompt) {
        err.set(ErrorCode::ConnectionFailed,
                prefix + "host key policy 'prompt' is not supported yet. "
                         "Use STRICT or AUTO_ADD.");
        return false;
    }
    if (info_.host.empty()) {
        err.set(ErrorCode::ConnectionFailed, prefix + "host is required");
        return false;
    }
    if (!info_.keyPath.empty()) {
        std::error_code ec;
        if (!std::filesystem::exists(info_.keyPath, ec)) {
            err.set(ErrorCode::ConnectionFailed,
                    prefix + "key file not found: " + info_.keyPath);
            return false;
        }
    }
    if (g_libssh2InitResult != 0) {
        err.set(ErrorCode::ConnectionFailed,
                prefix + "libssh2 initialization failed");
        return false;
    }

    PKD_LOGI("SFTP connect host=%s port=%u policy=%s agent=%d look_for_keys=%d "
             "key=%d password=%d",
             redacted(info_.host).c_str(),
             static_cast<unsigned>(info_.effectivePort()),
             hostKeyPolicyName(info_.hostKeyPolicy),
             (info_.allowAgent && info_.keyPath.empty()) ? 1 : 0,
             (info_.lookForKeys && info_.keyPath.empty()) ? 1 : 0,
             info_.keyPath.empty() ? 0 : 1, info_.password.empty() ? 0 : 1);

    std::string cause;
    auto fail = [&](const std::string &why) {
        disconnect();
        err.set(ErrorCode::ConnectionFailed, prefix + why);
        PKD_LOGE("%s", err.message.c_str());
        return false;
    };

    if (!tcpConnect(cause))
        return fail(cause);

    session_ = libssh2_session_init();
    if (!session_)
        return fail("could not create SSH session");
    libssh2_session_set_blocking(session_, 1);
    if (info_.timeoutSeconds > 0)
        libssh2_session_set_timeout(session_, info_.timeoutSeconds * 1000L);
    if (libssh2_session_handshake(session_, sock_) != 0)
        return fail("SSH handshake failed: " + lastSessionError());
    if (info_.keepaliveSeconds > 0)
        libssh2_keepalive_config(session_, 1,
                                 static_cast<unsigned>(info_.keepaliveSeconds));

    if (!verifyHostKey(cause))
        return fail(cause);
    if (!authenticate(cause))
        return fail(cause);

    sftp_ = libssh2_sftp_init(session_);
    if (!sftp_)
        return fail("could not start the SFTP subsystem: " +
                    lastSessionError());

    char target[1024];
    const int n = libssh2_sftp_realpath(sftp_, ".", target, sizeof(target));
    cwd_ = n > 0 ? std::string(target, static_cast<std::size_t>(n)) : "/";
    connected_ = true;
    PKD_LOGI("SFTP connected cwd=%s", cwd_.c_str());
    return true;
}

void Libssh2SftpClient::disconnect() {
    if (sftp_) {
        libssh2_sftp_shutdown(sftp_);
        sftp_ = nullptr;
    }
    if (session_) {
        libssh2_session_disconnect(session_, "bye");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != -1) {
        ::close(sock_);
        sock_ = -1;
    }
    connected_ = false;
    cwd_ = "/";
}

std::string Libssh2SftpClient::sftpFailure(const std::string &what) const {
    const unsigned long code = sftp_ ? libssh2_sftp_last_error(sftp_) : 0;
    return what + ": " + sftpStatusText(code);
}

std::string Libssh2SftpClient::resolve(const std::string &path) const {
    return resolveRemotePath(cwd_, path);
}

bool Libssh2SftpClient::listDir(const std::string &path,
                                std::vector<RemoteFile> &out, OpError &err) {
    if (!requireConnected(err))
        return false;
    const std::string dirPath = resolve(path);

    LIBSSH2_SFTP_HANDLE *dir = libssh2_sftp_opendir(sftp_, dirPath.c_str());
    if (!dir) {
        err.set(ErrorCode::RemoteOperationFailed,
                sftpFailure("opendir " + dirPath));
        return false;
    }

    out.clear();
    // Large enough for any POSIX file name and its long-format line.
    char filename[4096];
    char longentry[4608];
    LIBSSH2_SFTP_ATTRIBUTES attrs;

    while (true) {
        std::memset(&attrs, 0, sizeof(attrs));
        longentry[0] = '\0';
        const int rc =
            libssh2_sftp_readdir_ex(dir, filename, sizeof(filename), longentry,
                                    sizeof(longentry), &attrs);
        if (rc == 0)
            break;
        if (rc < 0) {
            err.set(ErrorCode::RemoteOperationFailed,
                    sftpFailure("readdir " + dirPath));
            libssh2_sftp_closedir(dir);
            return false;
        }
        RemoteFile f;
        f.name.assign(filename, static_cast<std::size_t>(rc));
        if (f.name == "." || f.name == "..")
            continue;
        if (!isSafeEntryName(f.name)) {
            PKD_LOGW("skipping entry with unsafe name in %s", dirPath.c_str());
            continue;
        }
        f.path = joinRemotePath(dirPath, f.name);
        if (attrs.flags & LIBSSH2_SFTP_ATTR_SIZE)
            f.size = attrs.filesize;
        if (attrs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME)
            f.modified = static_cast<std::int64_t>(attrs.mtime);
        if (attrs.flags & LIBSSH2_SFTP_ATTR_UIDGID) {
            f.owner = std::to_string(attrs.uid);
            f.group = std::to_string(attrs.gid);
        }
        if (attrs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
            f.permissions =
                formatPermissions(static_cast<std::uint32_t>(attrs.permissions));
            if ((attrs.permissions & LIBSSH2_SFTP_S_IFMT) ==
                LIBSSH2_SFTP_S_IFLNK) {
                // Follow the link; a broken target is listed as a file.
                LIBSSH2_SFTP_ATTRIBUTES target{};
                if (libssh2_sftp_stat_ex(
                        sftp_, f.path.c_str(),
                        static_cast<unsigned>(f.path.size()),
                        LIBSSH2_SFTP_STAT, &target) == 0 &&
                    (target.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS))
                    f.isDir = isDirMode(target.permissions);
            } else {
                f.isDir = isDirMode(attrs.permissions);
            }
        } else {
            f.isDir = longentry[0] == 'd';
        }
        if (f.isDir)
            f.size = 0;
        out.push_back(std::move(f));
    }

    libssh2_sftp_closedir(dir);
    return true;
}

bool Libssh2SftpClient::chdir(const std::string &path, std::string &newCwd,
                              OpError &err) {
    if (!requireConnected(err))
        return false;
    const std::string target = resolve(path);
    LIBSSH2_SFTP_ATTRIBUTES st{};
    if (libssh2_sftp_stat_ex(sftp_, target.c_str(),
                             static_cast<unsigned>(target.size()),
                             LIBSSH2_SFTP_STAT, &st) != 0) {
        err.set(ErrorCode::RemoteOperationFailed,
                sftpFailure("chdir " + target));
        return false;
    }
    if ((st.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) &&
        !isDirMode(st.permissions)) {
        err.set(ErrorCode::RemoteOperationFailed,
                "chdir " + target + ": not a directory");
        return false;
    }
    char real[1024];
    const int n =
        libssh2_sftp_realpath(sftp_, target.c_str(), real, sizeof(real));
    cwd_ = n > 0 ? std::string(real, static_cast<std::size_t>(n)) : target;
    newCwd = cwd_;
    return true;
}

// Streams a remote file into the sink with progress and cooperative cancel.
bool Libssh2SftpClient::download(const std::string &remotePath,
                                 std::ostream &sink, OpError &err,
                                 ProgressCB progress, CancelCB shouldCancel) {
    if (!requireConnected(err))
        return false;
    const std::string remote = resolve(remotePath);

    LIBSSH2_SFTP_ATTRIBUTES st{};
    if (libssh2_sftp_stat_ex(sftp_, remote.c_str(),
                             static_cast<unsigned>(remote.size()),
                             LIBSSH2_SFTP_STAT, &st) != 0) {
        err.set(ErrorCode::RemoteOperationFailed,
                sftpFailure("stat " + remote));
        return false;
    }
    const std::uint64_t total =
        (st.flags & LIBSSH2_SFTP_ATTR_SIZE) ? st.filesize : 0;

    LIBSSH2_SFTP_HANDLE *rh = libssh2_sftp_open_ex(
        sftp_, remote.c_str(), static_cast<unsigned>(remote.size()),
        LIBSSH2_FXF_READ, 0, LIBSSH2_SFTP_OPENFILE);
    if (!rh) {
        err.set(ErrorCode::RemoteOperationFailed,
                sftpFailure("open " + remote));
        return false;
    }

    std::vector<char> buf(kChunk);
    std::uint64_t done = 0;
    while (true) {
        if (shouldCancel && shouldCancel()) {
            libssh2_sftp_close(rh);
            err.set(ErrorCode::TransferInterrupted, "Canceled by user");
            return false;
        }
        const ssize_t n = libssh2_sftp_read(rh, buf.data(), buf.size());
        if (n == 0)
            break;
        if (n < 0) {
            libssh2_sftp_close(rh);
            err.set(ErrorCode::RemoteOperationFailed,
                    sftpFailure("read " + remote));
            return false;
        }
        sink.write(buf.data(), static_cast<std::streamsize>(n));
        if (!sink.good()) {
            libssh2_sftp_close(rh);
            err.set(ErrorCode::LocalIoFailed, "Local write failed");
            return false;
        }
        done += static_cast<std::uint64_t>(n);
        if (progress)
            progress(done, total);
    }
    libssh2_sftp_close(rh);
    return true;
}

// Creates/truncates the remote file and streams the source into it.
bool Libssh2SftpClient::upload(std::istream &source, std::uint64_t size,
                               const std::string &remotePath, OpError &err,
                               ProgressCB progress, CancelCB shouldCancel) {
    if (!requireConnected(err))
        return false;
    const std::string remote = resolve(remotePath);

    LIBSSH2_SFTP_HANDLE *wh = libssh2_sftp_open_ex(
        sftp_, remote.c_str(), static_cast<unsigned>(remote.size()),
        LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC, 0644,
        LIBSSH2_SFTP_OPENFILE);
    if (!wh) {
        err.set(ErrorCode::RemoteOperationFailed,
                sftpFailure("open " + remote));
        return false;
    }

    std::vector<char> buf(kChunk);
    std::uint64_t done = 0;
    while (done < size) {
        const std::size_t want = static_cast<std::size_t>(
            std::min<std::uint64_t>(buf.size(), size - done));
        source.read(buf.data(), static_cast<std::streamsize>(want));
        const std::size_t got = static_cast<std::size_t>(source.gcount());
        if (got == 0) {
            libssh2_sftp_close(wh);
            err.set(ErrorCode::LocalIoFailed, "Local read failed");
            return false;
        }
        const char *p = buf.data();
        std::size_t remain = got;
        while (remain > 0) {
            if (shouldCancel && shouldCancel()) {
                libssh2_sftp_close(wh);
                err.set(ErrorCode::TransferInterrupted, "Canceled by user");
                return false;
            }
            const ssize_t w = libssh2_sftp_write(wh, p, remain);
            if (w < 0) {
                libssh2_sftp_close(wh);
                err.set(ErrorCode::RemoteOperationFailed,
                        sftpFailure("write " + remote));
                return false;
            }
            remain -= static_cast<std::size_t>(w);
            p += w;
            done += static_cast<std::uint64_t>(w);
            if (progress)
                progress(done, size);
        }
    }
    libssh2_sftp_close(wh);
    return true;
}

bool Libssh2SftpClient::removeFile(const std::string &path, OpError &err) {
    if (!requireConnected(err))
        return false;
    const std::string p = resolve(path);
    if (libssh2_sftp_unlink(sftp_, p.c_str()) != 0) {
        err.set(ErrorCode::RemoteOperationFailed, sftpFailure("unlink " + p));
        return false;
    }
    return true;
}

bool Libssh2SftpClient::removeDir(const std::string &path, OpError &err) {
    if (!requireConnected(err))
        return false;
    const std::string p = resolve(path);
    if (libssh2_sftp_rmdir(sftp_, p.c_str()) != 0) {
        err.set(ErrorCode::RemoteOperationFailed, sftpFailure("rmdir " + p));
        return false;
    }
    return true;
}

bool Libssh2SftpClient::mkdir(const std::string &path, OpError &err) {
    if (!requireConnected(err))
        return false;
    const std::string p = resolve(path);
    if (libssh2_sftp_mkdir(sftp_, p.c_str(), 0755) != 0) {
        err.set(ErrorCode::RemoteOperationFailed, sftpFailure("mkdir " + p));
        return false;
    }
    return true;
}

bool Libssh2SftpClient::rename(const std::string &from, const std::string &to,
                               OpError &err) {
    if (!requireConnected(err))
        return false;
    const std::string a = resolve(from);
    const std::string b = resolve(to);
    const long flags = LIBSSH2_SFTP_RENAME_OVERWRITE |
                       LIBSSH2_SFTP_RENAME_ATOMIC | LIBSSH2_SFTP_RENAME_NATIVE;
    if (libssh2_sftp_rename_ex(sftp_, a.c_str(),
                               static_cast<unsigned>(a.size()), b.c_str(),
                               static_cast<unsigned>(b.size()), flags) != 0) {
        err.set(ErrorCode::RemoteOperationFailed,
                sftpFailure("rename " + a + " -> " + b));
        return false;
    }
    return true;
}

bool Libssh2SftpClient::stat(const std::string &path, RemoteFile &out,
                             OpError &err) {
    if (!requireConnected(err))
        return false;
    const std::string p = resolve(path);
    LIBSSH2_SFTP_ATTRIBUTES st{};
    if (libssh2_sftp_stat_ex(sftp_, p.c_str(), static_cast<unsigned>(p.size()),
                             LIBSSH2_SFTP_STAT, &st) != 0) {
        err.set(ErrorCode::RemoteOperationFailed, sftpFailure("stat " + p));
        return false;
    }
    RemoteFile f;
    f.name = baseName(p);
    f.path = p;
    if (st.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS) {
        f.isDir = isDirMode(st.permissions);
        f.permissions =
            formatPermissions(static_cast<std::uint32_t>(st.permissions));
    }
    if ((st.flags & LIBSSH2_SFTP_ATTR_SIZE) && !f.isDir)
        f.size = st.filesize;
    if (st.flags & LIBSSH2_SFTP_ATTR_ACMODTIME)
        f.modified = static_cast<std::int64_t>(st.mtime);
    if (st.flags & LIBSSH2_SFTP_ATTR_UIDGID) {
        f.owner = std::to_string(st.uid);
        f.group = std::to_string(st.gid);
    }
    out = f;
    return true;
}

} // namespace portkeydrop
