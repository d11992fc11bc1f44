// libcurl backend for FTP and FTPS. One easy handle is kept for the lifetime
// of the session so curl reuses the logged-in control connection. Every
// operation resets the handle options, points it at an absolute path URL and
// performs a single request (NOBODY for navigation, QUOTE for commands).
#include "portkeydrop/CurlFtpClient.hpp"
#include "portkeydrop/Log.hpp"
#include "portkeydrop/MlsdParser.hpp"
#include "portkeydrop/RemotePath.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <memory>
#include <mutex>

namespace portkeydrop {

namespace {

std::once_flag g_curlInitOnce;
CURLcode g_curlInitResult = CURLE_FAILED_INIT;

bool ensureCurlInitialized() {
    std::call_once(g_curlInitOnce, [] {
        g_curlInitResult = curl_global_init(CURL_GLOBAL_DEFAULT);
    });
    return g_curlInitResult == CURLE_OK;
}

struct CurlSlistDeleter {
    void operator()(curl_slist *l) const { curl_slist_free_all(l); }
};
using unique_curl_slist = std::unique_ptr<curl_slist, CurlSlistDeleter>;

CURL *easy(void *h) { return static_cast<CURL *>(h); }

size_t writeToString(char *data, size_t size, size_t nmemb, void *userp) {
    auto *out = static_cast<std::string *>(userp);
    out->append(data, size * nmemb);
    return size * nmemb;
}

size_t discardBody(char *, size_t size, size_t nmemb, void *) {
    return size * nmemb;
}

struct DownloadCtx {
    std::ostream *sink = nullptr;
    std::uint64_t done = 0;
    std::uint64_t total = 0;
    const ProgressCB *progress = nullptr;
    const CancelCB *shouldCancel = nullptr;
    bool canceled = false;
    bool sinkFailed = false;
};

size_t writeToSink(char *data, size_t size, size_t nmemb, void *userp) {
    auto *ctx = static_cast<DownloadCtx *>(userp);
    const size_t n = size * nmemb;
    if (*ctx->shouldCancel && (*ctx->shouldCancel)()) {
        ctx->canceled = true;
        return 0;
    }
    ctx->sink->write(data, static_cast<std::streamsize>(n));
    if (!ctx->sink->good()) {
        ctx->sinkFailed = true;
        return 0;
    }
    ctx->done += n;
    if (*ctx->progress)
        (*ctx->progress)(ctx->done, ctx->total);
    return n;
}

struct UploadCtx {
    std::istream *source = nullptr;
    std::uint64_t done = 0;
    std::uint64_t total = 0;
    const ProgressCB *progress = nullptr;
    const CancelCB *shouldCancel = nullptr;
    bool canceled = false;
    bool sourceFailed = false;
};

size_t readFromSource(char *buffer, size_t size, size_t nitems, void *userp) {
    auto *ctx = static_cast<UploadCtx *>(userp);
    if (*ctx->shouldCancel && (*ctx->shouldCancel)()) {
        ctx->canceled = true;
        return CURL_READFUNC_ABORT;
    }
    if (ctx->done >= ctx->total)
        return 0;
    const std::uint64_t remaining = ctx->total - ctx->done;
    const size_t want = static_cast<size_t>(std::min<std::uint64_t>(
        std::min<std::uint64_t>(size * nitems, CurlFtpClient::kChunkSize),
        remaining));
    ctx->source->read(buffer, static_cast<std::streamsize>(want));
    const size_t got = static_cast<size_t>(ctx->source->gcount());
    if (got == 0) {
        // Source shorter than announced: abort rather than truncate silently.
        ctx->sourceFailed = true;
        return CURL_READFUNC_ABORT;
    }
    ctx->done += got;
    if (*ctx->progress)
        (*ctx->progress)(ctx->done, ctx->total);
    return got;
}

std::string describe(CURLcode code, const char *errbuf) {
    std::string msg = curl_easy_strerror(code);
    if (errbuf && *errbuf) {
        std::string detail(errbuf);
        while (!detail.empty() &&
               (detail.back() == '\n' || detail.back() == '\r'))
            detail.pop_back();
        msg += ": " + detail;
    }
    return msg;
}

} // namespace

CurlFtpClient::CurlFtpClient(ConnectionInfo info, Security security)
    : TransferClient(std::move(info)), security_(security) {}

CurlFtpClient::~CurlFtpClient() { disconnect(); }

Protocol CurlFtpClient::protocol() const {
    return security_ == Security::ExplicitTls ? Protocol::Ftps : Protocol::Ftp;
}

const char *CurlFtpClient::label() const {
    return security_ == Security::ExplicitTls ? "FTPS" : "FTP";
}

std::string CurlFtpClient::urlFor(const std::string &absPath,
                                  bool asDir) const {
    std::string host = info_.host;
    if (host.find(':') != std::string::npos && host.front() != '[')
        host = "[" + host + "]";
    std::string url = "ftp://" + host + ":" +
                      std::to_string(info_.effectivePort()) + "/%2F";
    // Escape each segment so names with spaces or '#' survive the URL.
    std::size_t i = 1;
    bool first = true;
    while (i < absPath.size()) {
        std::size_t next = absPath.find('/', i);
        if (next == std::string::npos)
            next = absPath.size();
        const std::string seg = absPath.substr(i, next - i);
        if (!seg.empty()) {
            char *esc = curl_easy_escape(easy(curl_), seg.c_str(),
                                         static_cast<int>(seg.size()));
            if (!first)
                url += '/';
            url += esc ? esc : seg.c_str();
            if (esc)
                curl_free(esc);
            first = false;
        }
        i = next + 1;
    }
    if (asDir && !first)
        url += '/';
    return url;
}

void CurlFtpClient::applyCommonOptions() {
    CURL *c = easy(curl_);
    curl_easy_reset(c);
    curl_easy_setopt(c, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(c, CURLOPT_USERNAME,
                     info_.username.empty() ? "anonymous"
                                            : info_.username.c_str());
    curl_easy_setopt(c, CURLOPT_PASSWORD, info_.password.c_str());
    curl_easy_setopt(c, CURLOPT_CONNECTTIMEOUT,
                     static_cast<long>(info_.timeoutSeconds));
    curl_easy_setopt(c, CURLOPT_SERVER_RESPONSE_TIMEOUT,
                     static_cast<long>(info_.timeoutSeconds));
    curl_easy_setopt(c, CURLOPT_TCP_KEEPALIVE, 1L);
    if (info_.keepaliveSeconds > 0) {
        curl_easy_setopt(c, CURLOPT_TCP_KEEPIDLE,
                         static_cast<long>(info_.keepaliveSeconds));
        curl_easy_setopt(c, CURLOPT_TCP_KEEPINTVL,
                         static_cast<long>(info_.keepaliveSeconds));
    }
    curl_easy_setopt(c, CURLOPT_FTP_FILEMETHOD,
                     static_cast<long>(CURLFTPMETHOD_SINGLECWD));
    if (!info_.passiveMode)
        curl_easy_setopt(c, CURLOPT_FTPPORT, "-");
    if (security_ == Security::ExplicitTls) {
        curl_easy_setopt(c, CURLOPT_USE_SSL, static_cast<long>(CURLUSESSL_ALL));
        curl_easy_setopt(c, CURLOPT_FTPSSLAUTH,
                         static_cast<long>(CURLFTPAUTH_DEFAULT));
    }
    curl_easy_setopt(c, CURLOPT_WRITEFUNCTION, discardBody);
}

bool CurlFtpClient::perform(ErrorCode failCode, const std::string &what,
                            OpError &err) {
    char errbuf[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(easy(curl_), CURLOPT_ERRORBUFFER, errbuf);
    const CURLcode rc = curl_easy_perform(easy(curl_));
    curl_easy_setopt(easy(curl_), CURLOPT_ERRORBUFFER, nullptr);
    if (rc == CURLE_OK)
        return true;
    long response = 0;
    curl_easy_getinfo(easy(curl_), CURLINFO_RESPONSE_CODE, &response);
    std::string msg = what + ": " + describe(rc, errbuf);
    if (response > 0)
        msg += " (server reply " + std::to_string(response) + ")";
    err.set(failCode, msg);
    PKD_LOGW("%s %s", label(), msg.c_str());
    return false;
}

bool CurlFtpClient::connect(OpError &err) {
    err.clear();
    const std::string prefix = std::string(label()) + " connection failed";
    if (connected_) {
        err.set(ErrorCode::ConnectionFailed, prefix + ": already connected");
        return false;
    }
    if (info_.host.empty()) {
        err.set(ErrorCode::ConnectionFailed, prefix + ": host is required");
        return false;
    }
    if (!ensureCurlInitialized()) {
        err.set(ErrorCode::ConnectionFailed,
                prefix + ": libcurl initialization failed");
        return false;
    }
    curl_ = curl_easy_init();
    if (!curl_) {
        err.set(ErrorCode::ConnectionFailed,
                prefix + ": could not create curl handle");
        return false;
    }

    PKD_LOGI("%s connect host=%s port=%u passive=%d", label(),
             redacted(info_.host).c_str(),
             static_cast<unsigned>(info_.effectivePort()),
             info_.passiveMode ? 1 : 0);

    applyCommonOptions();
    curl_easy_setopt(easy(curl_), CURLOPT_URL, urlFor("/", true).c_str());
    curl_easy_setopt(easy(curl_), CURLOPT_NOBODY, 1L);
    if (!perform(ErrorCode::ConnectionFailed, prefix, err)) {
        curl_easy_cleanup(easy(curl_));
        curl_ = nullptr;
        return false;
    }

    char *entry = nullptr;
    curl_easy_getinfo(easy(curl_), CURLINFO_FTP_ENTRY_PATH, &entry);
    cwd_ = (entry && *entry == '/') ? resolveRemotePath("/", entry) : "/";
    connected_ = true;
    PKD_LOGI("%s connected cwd=%s", label(), cwd_.c_str());
    return true;
}

void CurlFtpClient::disconnect() {
    if (curl_) {
        // Cleanup sends QUIT on the cached control connection.
        curl_easy_cleanup(easy(curl_));
        curl_ = nullptr;
    }
    connected_ = false;
    cwd_ = "/";
}

bool CurlFtpClient::listDir(const std::string &path,
                            std::vector<RemoteFile> &out, OpError &err) {
    if (!requireConnected(err))
        return false;
    const std::string dir = resolveRemotePath(cwd_, path);
    std::string body;
    applyCommonOptions();
    curl_easy_setopt(easy(curl_), CURLOPT_URL, urlFor(dir, true).c_str());
    curl_easy_setopt(easy(curl_), CURLOPT_CUSTOMREQUEST, "MLSD");
    curl_easy_setopt(easy(curl_), CURLOPT_WRITEFUNCTION, writeToString);
    curl_easy_setopt(easy(curl_), CURLOPT_WRITEDATA, &body);
    if (!perform(ErrorCode::RemoteOperationFailed, "MLSD " + dir, err))
        return false;
    out = parseMlsdListing(body, dir);
    return true;
}

bool CurlFtpClient::chdir(const std::string &path, std::string &newCwd,
                          OpError &err) {
    if (!requireConnected(err))
        return false;
    const std::string dir = resolveRemotePath(cwd_, path);
    applyCommonOptions();
    curl_easy_setopt(easy(curl_), CURLOPT_URL, urlFor(dir, true).c_str());
    curl_easy_setopt(easy(curl_), CURLOPT_NOBODY, 1L);
    if (!perform(ErrorCode::RemoteOperationFailed, "CWD " + dir, err))
        return false;
    cwd_ = dir;
    newCwd = cwd_;
    return true;
}

bool CurlFtpClient::download(const std::string &remotePath,
                             std::ostream &sink, OpError &err,
                             ProgressCB progress, CancelCB shouldCancel) {
    if (!requireConnected(err))
        return false;
    const std::string path = resolveRemotePath(cwd_, remotePath);

    RemoteFile info;
    if (!stat(path, info, err))
        return false;
    if (info.isDir) {
        err.set(ErrorCode::RemoteOperationFailed,
                "RETR " + path + ": is a directory");
        return false;
    }

    DownloadCtx ctx;
    ctx.sink = &sink;
    ctx.total = info.size;
    ctx.progress = &progress;
    ctx.shouldCancel = &shouldCancel;

    applyCommonOptions();
    curl_easy_setopt(easy(curl_), CURLOPT_URL, urlFor(path, false).c_str());
    curl_easy_setopt(easy(curl_), CURLOPT_BUFFERSIZE,
                     static_cast<long>(kChunkSize));
    curl_easy_setopt(easy(curl_), CURLOPT_WRITEFUNCTION, writeToSink);
    curl_easy_setopt(easy(curl_), CURLOPT_WRITEDATA, &ctx);
    OpError perr;
    if (perform(ErrorCode::RemoteOperationFailed, "RETR " + path, perr))
        return true;
    if (ctx.canceled)
        err.set(ErrorCode::TransferInterrupted, "Canceled by user");
    else if (ctx.sinkFailed)
        err.set(ErrorCode::LocalIoFailed, "Local write failed");
    else
        err = perr;
    return false;
}

bool CurlFtpClient::upload(std::istream &source, std::uint64_t size,
                           const std::string &remotePath, OpError &err,
                           ProgressCB progress, CancelCB shouldCancel) {
    if (!requireConnected(err))
        return false;
    const std::string path = resolveRemotePath(cwd_, remotePath);

    UploadCtx ctx;
    ctx.source = &source;
    ctx.total = size;
    ctx.progress = &progress;
    ctx.shouldCancel = &shouldCancel;

    applyCommonOptions();
    curl_easy_setopt(easy(curl_), CURLOPT_URL, urlFor(path, false).c_str());
    curl_easy_setopt(easy(curl_), CURLOPT_UPLOAD, 1L);
    curl_easy_setopt(easy(curl_), CURLOPT_INFILESIZE_LARGE,
                     static_cast<curl_off_t>(size));
    curl_easy_setopt(easy(curl_), CURLOPT_READFUNCTION, readFromSource);
    curl_easy_setopt(easy(curl_), CURLOPT_READDATA, &ctx);
    OpError perr;
    if (perform(ErrorCode::RemoteOperationFailed, "STOR " + path, perr))
        return true;
    if (ctx.canceled)
        err.set(ErrorCode::TransferInterrupted, "Canceled by user");
    else if (ctx.sourceFailed)
        err.set(ErrorCode::LocalIoFailed, "Local read failed");
    else
        err = perr;
    return false;
}

bool CurlFtpClient::sendCommands(const std::vector<std::string> &commands,
                                 const std::string &what, OpError &err) {
    if (!requireConnected(err))
        return false;
    unique_curl_slist list;
    for (const auto &cmd : commands) {
        curl_slist *appended = curl_slist_append(list.get(), cmd.c_str());
        if (!appended) {
            err.set(ErrorCode::RemoteOperationFailed, what + ": out of memory");
            return false;
        }
        list.release();
        list.reset(appended);
    }
    applyCommonOptions();
    curl_easy_setopt(easy(curl_), CURLOPT_URL, urlFor("/", true).c_str());
    curl_easy_setopt(easy(curl_), CURLOPT_NOBODY, 1L);
    curl_easy_setopt(easy(curl_), CURLOPT_QUOTE, list.get());
    const bool ok = perform(ErrorCode::RemoteOperationFailed, what, err);
    curl_easy_setopt(easy(curl_), CURLOPT_QUOTE, nullptr);
    return ok;
}

bool CurlFtpClient::removeFile(const std::string &path, OpError &err) {
    const std::string p = resolveRemotePath(cwd_, path);
    return sendCommands({"DELE " + p}, "DELE " + p, err);
}

bool CurlFtpClient::removeDir(const std::string &path, OpError &err) {
    const std::string p = resolveRemotePath(cwd_, path);
    return sendCommands({"RMD " + p}, "RMD " + p, err);
}

bool CurlFtpClient::mkdir(const std::string &path, OpError &err) {
    const std::string p = resolveRemotePath(cwd_, path);
    return sendCommands({"MKD " + p}, "MKD " + p, err);
}

bool CurlFtpClient::rename(const std::string &from, const std::string &to,
                           OpError &err) {
    const std::string a = resolveRemotePath(cwd_, from);
    const std::string b = resolveRemotePath(cwd_, to);
    return sendCommands({"RNFR " + a, "RNTO " + b}, "RENAME " + a, err);
}

bool CurlFtpClient::stat(const std::string &path, RemoteFile &out,
                         OpError &err) {
    if (!requireConnected(err))
        return false;
    const std::string p = resolveRemotePath(cwd_, path);

    // Files answer SIZE/MDTM; directories fail SIZE but accept CWD.
    applyCommonOptions();
    curl_easy_setopt(easy(curl_), CURLOPT_URL, urlFor(p, false).c_str());
    curl_easy_setopt(easy(curl_), CURLOPT_NOBODY, 1L);
    curl_easy_setopt(easy(curl_), CURLOPT_FILETIME, 1L);
    OpError fileErr;
    if (p != "/" &&
        perform(ErrorCode::RemoteOperationFailed, "SIZE " + p, fileErr)) {
        RemoteFile f;
        f.name = baseName(p);
        f.path = p;
        curl_off_t len = -1;
        curl_easy_getinfo(easy(curl_), CURLINFO_CONTENT_LENGTH_DOWNLOAD_T,
                          &len);
        f.size = len > 0 ? static_cast<std::uint64_t>(len) : 0;
        curl_off_t ft = -1;
        curl_easy_getinfo(easy(curl_), CURLINFO_FILETIME_T, &ft);
        if (ft >= 0)
            f.modified = static_cast<std::int64_t>(ft);
        out = f;
        return true;
    }

    applyCommonOptions();
    curl_easy_setopt(easy(curl_), CURLOPT_URL, urlFor(p, true).c_str());
    curl_easy_setopt(easy(curl_), CURLOPT_NOBODY, 1L);
    OpError dirErr;
    if (perform(ErrorCode::RemoteOperationFailed, "CWD " + p, dirErr)) {
        RemoteFile f;
        f.name = baseName(p);
        f.path = p;
        f.isDir = true;
        out = f;
        return true;
    }
    err = fileErr.ok() ? dirErr : fileErr;
    return false;
}

} // namespace portkeydrop
