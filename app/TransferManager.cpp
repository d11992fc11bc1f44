// Queue implementation: one detached worker per job. Workers share the State
// block with the manager so they can outlive it safely.
#include "TransferManager.hpp"
#include "portkeydrop/RemotePath.hpp"
#include <QLoggingCategory>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <set>
#include <system_error>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>
Q_LOGGING_CATEGORY(pkdXfer, "portkeydrop.transfer")

using portkeydrop::ErrorCode;
using portkeydrop::LocalEntry;
using portkeydrop::LocalFileSystem;
using portkeydrop::OpError;
using portkeydrop::RemoteFile;
using portkeydrop::TransferClient;

const char *transferStatusName(TransferItem::Status st) {
    switch (st) {
    case TransferItem::Status::Queued:
        return "queued";
    case TransferItem::Status::InProgress:
        return "in_progress";
    case TransferItem::Status::Completed:
        return "completed";
    case TransferItem::Status::Failed:
        return "failed";
    case TransferItem::Status::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

int TransferItem::progressPercent() const {
    return portkeydrop::progressPercent(static_cast<std::int64_t>(transferredBytes),
                                        static_cast<std::int64_t>(totalBytes));
}

QString TransferItem::displayStatus() const {
    if (status == Status::InProgress)
        return QString("%1%").arg(progressPercent());
    return QString::fromLatin1(transferStatusName(status));
}

bool TransferItem::isFinished() const {
    return status == Status::Completed || status == Status::Failed ||
           status == Status::Cancelled;
}

struct TransferManager::State {
    mutable std::mutex mtx;
    mutable std::condition_variable cv;
    QVector<TransferItem> jobs;
    std::unordered_set<quint64> canceled;
    // Clients currently owned by a running job.
    std::unordered_set<const TransferClient *> busyClients;
    quint64 nextId = 1;
    int maxConcurrent = 0;
    int running = 0;
    int activeWorkers = 0;
    OverwritePolicy policy = OverwritePolicy::Overwrite;

    // Guards `notify`; recursive so a slot may call back into the manager.
    std::recursive_mutex notifyMtx;
    std::function<void()> notify;

    // mtx must be held.
    int indexOf(quint64 id) const {
        for (int i = 0; i < jobs.size(); ++i) {
            if (jobs[i].id == id)
                return i;
        }
        return -1;
    }

    bool isCanceled(quint64 id) const {
        std::lock_guard<std::mutex> lk(mtx);
        return canceled.count(id) > 0;
    }

    // Never called with mtx held.
    void notifyChanged() {
        std::lock_guard<std::recursive_mutex> lk(notifyMtx);
        if (notify)
            notify();
    }
};

struct TransferManager::JobSpec {
    enum class Kind { Download, Upload, RecursiveDownload, RecursiveUpload };
    Kind kind = Kind::Download;
    quint64 id = 0;
    std::shared_ptr<TransferClient> client;
    std::shared_ptr<LocalFileSystem> fs;
    std::string remotePath;
    std::string localPath;
    OverwritePolicy policy = OverwritePolicy::Overwrite;
};

namespace {

const char *kindName(int kind) {
    static const char *names[] = {"download", "upload", "recursive_download",
                                  "recursive_upload"};
    return (kind >= 0 && kind < 4) ? names[kind] : "?";
}

// "name.ext" -> "name (n).ext"; dot-files and extensionless names get the
// suffix at the end.
std::string numberedName(const std::string &path, int n) {
    std::size_t slash = path.find_last_of("/\\");
    std::size_t base = (slash == std::string::npos) ? 0 : slash + 1;
    std::size_t dot = path.rfind('.');
    const std::string suffix = " (" + std::to_string(n) + ")";
    if (dot == std::string::npos || dot <= base)
        return path + suffix;
    return path.substr(0, dot) + suffix + path.substr(dot);
}

} // namespace

class TransferManager::Worker {
public:
    Worker(std::shared_ptr<State> d, JobSpec spec)
        : d_(std::move(d)), spec_(std::move(spec)) {}

    void run();

private:
    struct FileTask {
        std::string remote;
        std::string local;
        std::uint64_t size = 0;
    };

    std::shared_ptr<State> d_;
    JobSpec spec_;
    // Bytes of files already finished within this job.
    quint64 done_ = 0;

    bool canceled() const { return d_->isCanceled(spec_.id); }
    bool execute(OpError &err);
    void finish(bool ok, const OpError &err);
    void reportProgress(quint64 transferred, quint64 total);
    void setTotal(quint64 total);

    bool downloadOne(const std::string &remote, std::string local,
                     std::uint64_t size, bool lastFile, OpError &err);
    bool uploadOne(const std::string &local, std::string remote,
                   OpError &err);
    bool recursiveDownload(OpError &err);
    bool recursiveUpload(OpError &err);
    bool walkRemote(const std::string &remoteDir, const std::string &localDir,
                    std::vector<FileTask> &files,
                    std::vector<std::string> &dirs, OpError &err);
    bool walkLocal(const std::string &localDir, const std::string &remoteDir,
                   std::vector<FileTask> &files,
                   std::vector<std::string> &dirs, OpError &err);
    std::string freeLocalName(const std::string &path) const;
    std::string freeRemoteName(const std::string &path) const;
};

void TransferManager::Worker::run() {
    const quint64 id = spec_.id;
    const TransferClient *clientKey = spec_.client.get();
    bool started = false;
    {
        // A client is not thread-safe: one job per client, then the
        // global concurrency limit.
        std::unique_lock<std::mutex> lk(d_->mtx);
        d_->cv.wait(lk, [&] {
            if (d_->canceled.count(id))
                return true;
            if (clientKey && d_->busyClients.count(clientKey))
                return false;
            return d_->maxConcurrent <= 0 ||
                   d_->running < d_->maxConcurrent;
        });
        if (!d_->canceled.count(id)) {
            started = true;
            ++d_->running;
            if (clientKey)
                d_->busyClients.insert(clientKey);
            int i = d_->indexOf(id);
            if (i >= 0)
                d_->jobs[i].status = TransferItem::Status::InProgress;
        }
    }

    if (started) {
        d_->notifyChanged();
        qCInfo(pkdXfer) << "Job started id=" << id
                        << "kind=" << kindName(static_cast<int>(spec_.kind))
                        << "remote=" << QString::fromStdString(spec_.remotePath);
        OpError err;
        bool ok = false;
        try {
            ok = execute(err);
        } catch (const std::exception &e) {
            ok = false;
            err.set(ErrorCode::LocalIoFailed,
                    std::string("Unexpected error: ") + e.what());
        }
        finish(ok, err);
    }

    {
        std::lock_guard<std::mutex> lk(d_->mtx);
        if (started) {
            --d_->running;
            if (clientKey)
                d_->busyClients.erase(clientKey);
        }
        --d_->activeWorkers;
    }
    d_->cv.notify_all();
}

bool TransferManager::Worker::execute(OpError &err) {
    if (!spec_.client) {
        err.set(ErrorCode::NotConnected, "No client for transfer");
        return false;
    }
    switch (spec_.kind) {
    case JobSpec::Kind::Download:
        return downloadOne(spec_.remotePath, spec_.localPath, 0, true, err);
    case JobSpec::Kind::Upload:
        return uploadOne(spec_.localPath, spec_.remotePath, err);
    case JobSpec::Kind::RecursiveDownload:
        return recursiveDownload(err);
    case JobSpec::Kind::RecursiveUpload:
        return recursiveUpload(err);
    }
    return false;
}

void TransferManager::Worker::finish(bool ok, const OpError &err) {
    TransferItem::Status outcome = TransferItem::Status::Failed;
    {
        std::lock_guard<std::mutex> lk(d_->mtx);
        int i = d_->indexOf(spec_.id);
        if (i < 0)
            return;
        TransferItem &j = d_->jobs[i];
        if (j.status == TransferItem::Status::Completed) {
            // committed by the last download
        } else if (d_->canceled.count(spec_.id) ||
                   err.code == ErrorCode::TransferInterrupted) {
            j.status = TransferItem::Status::Cancelled;
        } else if (ok) {
            j.status = TransferItem::Status::Completed;
            if (j.totalBytes < j.transferredBytes)
                j.totalBytes = j.transferredBytes;
        } else {
            j.status = TransferItem::Status::Failed;
            j.error = QString::fromStdString(err.message);
        }
        outcome = j.status;
    }
    d_->notifyChanged();
    if (outcome == TransferItem::Status::Failed)
        qCWarning(pkdXfer) << "Job failed id=" << spec_.id
                           << "error=" << QString::fromStdString(err.message);
    else
        qCInfo(pkdXfer) << "Job finished id=" << spec_.id
                        << "status=" << transferStatusName(outcome);
}

void TransferManager::Worker::reportProgress(quint64 transferred,
                                             quint64 total) {
    {
        std::lock_guard<std::mutex> lk(d_->mtx);
        int i = d_->indexOf(spec_.id);
        if (i < 0)
            return;
        TransferItem &j = d_->jobs[i];
        if (j.isFinished())
            return;
        j.transferredBytes = transferred;
        if (total > 0 && !j.recursive)
            j.totalBytes = total;
    }
    d_->notifyChanged();
}

void TransferManager::Worker::setTotal(quint64 total) {
    {
        std::lock_guard<std::mutex> lk(d_->mtx);
        int i = d_->indexOf(spec_.id);
        if (i >= 0)
            d_->jobs[i].totalBytes = total;
    }
    d_->notifyChanged();
}

std::string
TransferManager::Worker::freeLocalName(const std::string &path) const {
    for (int n = 1; n < 10000; ++n) {
        std::string candidate = numberedName(path, n);
        if (!spec_.fs->exists(candidate))
            return candidate;
    }
    return numberedName(path, 10000);
}

std::string
TransferManager::Worker::freeRemoteName(const std::string &path) const {
    for (int n = 1; n < 10000; ++n) {
        std::string candidate = numberedName(path, n);
        RemoteFile st;
        OpError statErr;
        if (!spec_.client->stat(candidate, st, statErr))
            return candidate;
    }
    return numberedName(path, 10000);
}

bool TransferManager::Worker::downloadOne(const std::string &remote,
                                          std::string local,
                                          std::uint64_t size, bool lastFile,
                                          OpError &err) {
    LocalFileSystem &fs = *spec_.fs;
    const bool single = spec_.kind == JobSpec::Kind::Download;
    if (fs.exists(local)) {
        if (spec_.policy == OverwritePolicy::Skip) {
            qCInfo(pkdXfer) << "Skipping existing"
                            << QString::fromStdString(local);
            // A skipped file still counts as done.
            if (single && size == 0) {
                RemoteFile st;
                OpError statErr;
                if (spec_.client->stat(remote, st, statErr))
                    size = st.size;
            }
            done_ += size;
            reportProgress(done_, single ? size : 0);
            return true;
        }
        if (spec_.policy == OverwritePolicy::Rename)
            local = freeLocalName(local);
    }

    const std::string part = local + ".part";
    std::string ioErr;
    auto out = fs.openForWrite(part, ioErr);
    if (!out) {
        err.set(ErrorCode::LocalIoFailed, ioErr);
        return false;
    }

    const quint64 base = done_;
    quint64 fileBytes = 0;
    bool ok = spec_.client->download(
        remote, *out, err,
        [&](std::uint64_t n, std::uint64_t total) {
            fileBytes = n;
            reportProgress(base + n, single ? total : 0);
        },
        [this] { return canceled(); });
    if (ok) {
        out->flush();
        if (!out->good()) {
            err.set(ErrorCode::LocalIoFailed, "Could not write " + part);
            ok = false;
        }
    }
    out.reset();

    auto dropPart = [&] {
        std::string rmErr;
        if (!fs.remove(part, rmErr))
            qCWarning(pkdXfer) << "Could not remove partial file"
                               << QString::fromStdString(part)
                               << QString::fromStdString(rmErr);
    };
    if (!ok) {
        dropPart();
        return false;
    }

    // Cancellation check, rename and completion are one step under the job
    // lock: a job reported cancelled never leaves a finished destination.
    bool committed = false;
    {
        std::lock_guard<std::mutex> lk(d_->mtx);
        if (d_->canceled.count(spec_.id)) {
            err.set(ErrorCode::TransferInterrupted, "Transfer cancelled");
        } else if (!fs.rename(part, local, ioErr)) {
            err.set(ErrorCode::LocalIoFailed, ioErr);
        } else {
            committed = true;
            done_ = base + fileBytes;
            int i = d_->indexOf(spec_.id);
            if (i >= 0) {
                TransferItem &j = d_->jobs[i];
                j.transferredBytes = done_;
                if (lastFile) {
                    if (j.totalBytes < done_)
                        j.totalBytes = done_;
                    j.status = TransferItem::Status::Completed;
                }
            }
        }
    }
    if (!committed) {
        dropPart();
        return false;
    }
    d_->notifyChanged();
    return true;
}

bool TransferManager::Worker::uploadOne(const std::string &local,
                                        std::string remote, OpError &err) {
    std::uint64_t size = 0;
    std::string ioErr;
    auto in = spec_.fs->openForRead(local, size, ioErr);
    if (!in) {
        err.set(ErrorCode::LocalIoFailed, ioErr);
        return false;
    }
    if (spec_.kind == JobSpec::Kind::Upload)
        setTotal(size);

    if (spec_.policy != OverwritePolicy::Overwrite) {
        RemoteFile st;
        OpError statErr;
        if (spec_.client->stat(remote, st, statErr)) {
            if (spec_.policy == OverwritePolicy::Skip) {
                qCInfo(pkdXfer) << "Skipping existing remote"
                                << QString::fromStdString(remote);
                done_ += size;
                reportProgress(done_, 0);
                return true;
            }
            remote = freeRemoteName(remote);
        }
    }

    const quint64 base = done_;
    bool ok = spec_.client->upload(
        *in, size, remote, err,
        [&](std::uint64_t n, std::uint64_t) { reportProgress(base + n, 0); },
        [this] { return canceled(); });
    if (ok)
        done_ = base + size;
    return ok;
}

bool TransferManager::Worker::walkRemote(const std::string &remoteDir,
                                         const std::string &localDir,
                                         std::vector<FileTask> &files,
                                         std::vector<std::string> &dirs,
                                         OpError &err) {
    if (canceled()) {
        err.set(ErrorCode::TransferInterrupted, "Transfer cancelled");
        return false;
    }
    std::vector<RemoteFile> entries;
    if (!spec_.client->listDir(remoteDir, entries, err))
        return false;
    for (const auto &e : entries) {
        // Entry names come from the server; anything but a plain name would
        // place files outside the destination directory.
        if (!portkeydrop::isSafeEntryName(e.name)) {
            err.set(ErrorCode::RemoteOperationFailed,
                    "Refusing unsafe entry name '" + e.name + "' in " +
                        remoteDir);
            return false;
        }
        const std::string remote = portkeydrop::joinRemotePath(remoteDir, e.name);
        const std::string local = spec_.fs->join(localDir, e.name);
        if (e.isDir) {
            dirs.push_back(local);
            if (!walkRemote(remote, local, files, dirs, err))
                return false;
        } else {
            files.push_back({remote, local, e.size});
        }
    }
    return true;
}

bool TransferManager::Worker::recursiveDownload(OpError &err) {
    std::vector<FileTask> files;
    std::vector<std::string> dirs;
    if (!walkRemote(spec_.remotePath, spec_.localPath, files, dirs, err))
        return false;

    quint64 total = 0;
    for (const auto &f : files)
        total += f.size;
    setTotal(total);

    LocalFileSystem &fs = *spec_.fs;
    std::string ioErr;
    if (!fs.createDirectories(spec_.localPath, ioErr)) {
        err.set(ErrorCode::LocalIoFailed, ioErr);
        return false;
    }
    for (const auto &d : dirs) {
        if (!fs.createDirectories(d, ioErr)) {
            err.set(ErrorCode::LocalIoFailed, ioErr);
            return false;
        }
    }

    for (std::size_t i = 0; i < files.size(); ++i) {
        if (canceled()) {
            err.set(ErrorCode::TransferInterrupted, "Transfer cancelled");
            return false;
        }
        if (!fs.createDirectories(fs.parentPath(files[i].local), ioErr)) {
            err.set(ErrorCode::LocalIoFailed, ioErr);
            return false;
        }
        if (!downloadOne(files[i].remote, files[i].local, files[i].size,
                         i + 1 == files.size(), err))
            return false;
    }
    return true;
}

bool TransferManager::Worker::walkLocal(const std::string &localDir,
                                        const std::string &remoteDir,
                                        std::vector<FileTask> &files,
                                        std::vector<std::string> &dirs,
                                        OpError &err) {
    if (canceled()) {
        err.set(ErrorCode::TransferInterrupted, "Transfer cancelled");
        return false;
    }
    std::vector<LocalEntry> entries;
    std::string ioErr;
    if (!spec_.fs->listDir(localDir, entries, ioErr)) {
        err.set(ErrorCode::LocalIoFailed, ioErr);
        return false;
    }
    for (const auto &e : entries) {
        const std::string remote = portkeydrop::joinRemotePath(remoteDir, e.name);
        if (e.isDir) {
            dirs.push_back(remote);
            if (!walkLocal(e.path, remote, files, dirs, err))
                return false;
        } else {
            files.push_back({remote, e.path, e.size});
        }
    }
    return true;
}

bool TransferManager::Worker::recursiveUpload(OpError &err) {
    if (!spec_.fs->isDirectory(spec_.localPath)) {
        err.set(ErrorCode::LocalIoFailed,
                "Not a directory: " + spec_.localPath);
        return false;
    }
    std::vector<FileTask> files;
    std::vector<std::string> dirs;
    if (!walkLocal(spec_.localPath, spec_.remotePath, files, dirs, err))
        return false;

    quint64 total = 0;
    for (const auto &f : files)
        total += f.size;
    setTotal(total);

    // Sorted so parents are created before children.
    std::set<std::string> toCreate(dirs.begin(), dirs.end());
    toCreate.insert(spec_.remotePath);
    for (const auto &f : files)
        toCreate.insert(portkeydrop::parentOf(f.remote));
    toCreate.erase("/");
    for (const auto &d : toCreate) {
        if (canceled()) {
            err.set(ErrorCode::TransferInterrupted, "Transfer cancelled");
            return false;
        }
        OpError mkErr;
        if (!spec_.client->mkdir(d, mkErr))
            qCDebug(pkdXfer) << "mkdir" << QString::fromStdString(d)
                             << "ignored:" << QString::fromStdString(mkErr.message);
    }

    for (const auto &f : files) {
        if (canceled()) {
            err.set(ErrorCode::TransferInterrupted, "Transfer cancelled");
            return false;
        }
        if (!uploadOne(f.local, f.remote, err))
            return false;
    }
    return true;
}

TransferManager::TransferManager(QObject *parent)
    : TransferManager(std::make_shared<portkeydrop::StdLocalFileSystem>(),
                      parent) {}

TransferManager::TransferManager(std::shared_ptr<LocalFileSystem> fs,
                                 QObject *parent)
    : QObject(parent), d_(std::make_shared<State>()), fs_(std::move(fs)) {
    if (!fs_)
        fs_ = std::make_shared<portkeydrop::StdLocalFileSystem>();
    d_->notify = [this] { emit jobsChanged(); };
}

TransferManager::~TransferManager() {
    {
        std::lock_guard<std::mutex> lk(d_->mtx);
        for (auto &j : d_->jobs) {
            if (!j.isFinished()) {
                d_->canceled.insert(j.id);
                j.status = TransferItem::Status::Cancelled;
            }
        }
    }
    {
        std::lock_guard<std::recursive_mutex> lk(d_->notifyMtx);
        d_->notify = nullptr;
    }
    d_->cv.notify_all();
}

quint64 TransferManager::enqueue(JobSpec spec, TransferItem item) {
    spec.fs = fs_;
    {
        std::lock_guard<std::mutex> lk(d_->mtx);
        item.id = d_->nextId++;
        item.status = TransferItem::Status::Queued;
        spec.id = item.id;
        spec.policy = d_->policy;
        d_->jobs.push_back(item);
        ++d_->activeWorkers;
    }
    d_->notifyChanged();
    qCInfo(pkdXfer) << "Enqueued id=" << item.id
                    << "kind=" << kindName(static_cast<int>(spec.kind))
                    << "remote=" << item.remotePath
                    << "local=" << item.localPath;

    try {
        std::shared_ptr<State> d = d_;
        std::thread([d, spec]() { Worker(d, spec).run(); }).detach();
    } catch (const std::system_error &e) {
        {
            std::lock_guard<std::mutex> lk(d_->mtx);
            int i = d_->indexOf(item.id);
            if (i >= 0) {
                d_->jobs[i].status = TransferItem::Status::Failed;
                d_->jobs[i].error =
                    QString("Could not start worker: %1").arg(e.what());
            }
            --d_->activeWorkers;
        }
        d_->cv.notify_all();
        d_->notifyChanged();
        qCWarning(pkdXfer) << "Could not start worker for id=" << item.id
                           << e.what();
    }
    return item.id;
}

quint64 TransferManager::enqueueDownload(std::shared_ptr<TransferClient> client,
                                         const QString &remotePath,
                                         const QString &localPath,
                                         quint64 knownTotalBytes) {
    JobSpec spec;
    spec.kind = JobSpec::Kind::Download;
    spec.client = std::move(client);
    spec.remotePath = remotePath.toStdString();
    spec.localPath = localPath.toStdString();
    TransferItem item;
    item.direction = TransferItem::Direction::Download;
    item.remotePath = remotePath;
    item.localPath = localPath;
    item.totalBytes = knownTotalBytes;
    return enqueue(std::move(spec), item);
}

quint64 TransferManager::enqueueUpload(std::shared_ptr<TransferClient> client,
                                       const QString &localPath,
                                       const QString &remotePath) {
    JobSpec spec;
    spec.kind = JobSpec::Kind::Upload;
    spec.client = std::move(client);
    spec.remotePath = remotePath.toStdString();
    spec.localPath = localPath.toStdString();
    TransferItem item;
    item.direction = TransferItem::Direction::Upload;
    item.remotePath = remotePath;
    item.localPath = localPath;
    return enqueue(std::move(spec), item);
}

quint64 TransferManager::enqueueRecursiveDownload(
    std::shared_ptr<TransferClient> client, const QString &remoteDir,
    const QString &localDir) {
    JobSpec spec;
    spec.kind = JobSpec::Kind::RecursiveDownload;
    spec.client = std::move(client);
    spec.remotePath = remoteDir.toStdString();
    spec.localPath = localDir.toStdString();
    TransferItem item;
    item.direction = TransferItem::Direction::Download;
    item.remotePath = remoteDir;
    item.localPath = localDir;
    item.recursive = true;
    return enqueue(std::move(spec), item);
}

quint64 TransferManager::enqueueRecursiveUpload(
    std::shared_ptr<TransferClient> client, const QString &localDir,
    const QString &remoteDir) {
    JobSpec spec;
    spec.kind = JobSpec::Kind::RecursiveUpload;
    spec.client = std::move(client);
    spec.remotePath = remoteDir.toStdString();
    spec.localPath = localDir.toStdString();
    TransferItem item;
    item.direction = TransferItem::Direction::Upload;
    item.remotePath = remoteDir;
    item.localPath = localDir;
    item.recursive = true;
    return enqueue(std::move(spec), item);
}

bool TransferManager::cancel(quint64 id) {
    bool changed = false;
    {
        std::lock_guard<std::mutex> lk(d_->mtx);
        int i = d_->indexOf(id);
        if (i < 0) {
            qCWarning(pkdXfer) << "Cancel for unknown job id=" << id;
            return false;
        }
        TransferItem &j = d_->jobs[i];
        if (!j.isFinished()) {
            d_->canceled.insert(id);
            j.status = TransferItem::Status::Cancelled;
            changed = true;
        }
    }
    if (changed) {
        qCInfo(pkdXfer) << "Cancelled id=" << id;
        d_->cv.notify_all();
        d_->notifyChanged();
    }
    return true;
}

QVector<TransferItem> TransferManager::listJobs() const {
    std::lock_guard<std::mutex> lk(d_->mtx);
    return d_->jobs;
}

std::optional<TransferItem> TransferManager::job(quint64 id) const {
    std::lock_guard<std::mutex> lk(d_->mtx);
    int i = d_->indexOf(id);
    if (i < 0)
        return std::nullopt;
    return d_->jobs[i];
}

bool TransferManager::waitForIdle(int timeoutMs) const {
    std::unique_lock<std::mutex> lk(d_->mtx);
    return d_->cv.wait_for(lk, std::chrono::milliseconds(timeoutMs),
                           [this] { return d_->activeWorkers == 0; });
}

void TransferManager::setMaxConcurrent(int n) {
    {
        std::lock_guard<std::mutex> lk(d_->mtx);
        d_->maxConcurrent = n < 0 ? 0 : n;
    }
    d_->cv.notify_all();
}

int TransferManager::maxConcurrent() const {
    std::lock_guard<std::mutex> lk(d_->mtx);
    return d_->maxConcurrent;
}

void TransferManager::setOverwritePolicy(OverwritePolicy p) {
    std::lock_guard<std::mutex> lk(d_->mtx);
    d_->policy = p;
}

TransferManager::OverwritePolicy TransferManager::overwritePolicy() const {
    std::lock_guard<std::mutex> lk(d_->mtx);
    return d_->policy;
}

TransferManager::OverwritePolicy
TransferManager::overwritePolicyFromSetting(const QString &mode) {
    const QString m = mode.trimmed().toLower();
    if (m == "skip")
        return OverwritePolicy::Skip;
    if (m == "rename")
        return OverwritePolicy::Rename;
    return OverwritePolicy::Overwrite;
}
