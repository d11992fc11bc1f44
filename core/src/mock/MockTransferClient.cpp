#include "portkeydrop/MockTransferClient.hpp"
#include "portkeydrop/RemotePath.hpp"

#include <algorithm>
#include <thread>

namespace portkeydrop {

MockTransferClient::MockTransferClient(ConnectionInfo info)
    : TransferClient(std::move(info)) {
    nodes_["/"].isDir = true;
}

ConnectionInfo MockTransferClient::defaultInfo() {
    ConnectionInfo info;
    info.protocol = Protocol::Sftp;
    info.host = "mock.invalid";
    info.username = "tester";
    return info;
}

bool MockTransferClient::connect(OpError &err) {
    std::lock_guard<std::mutex> lk(mtx_);
    err.clear();
    if (info_.host.empty()) {
        err.set(ErrorCode::ConnectionFailed,
                "Mock connection failed: host is required");
        return false;
    }
    if (connectFailure_) {
        err.set(ErrorCode::ConnectionFailed,
                "Mock connection failed: " + *connectFailure_);
        return false;
    }
    connected_ = true;
    cwd_ = home_;
    return true;
}

void MockTransferClient::disconnect() {
    std::lock_guard<std::mutex> lk(mtx_);
    connected_ = false;
    cwd_ = "/";
}

bool MockTransferClient::isConnected() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return connected_;
}

std::string MockTransferClient::cwd() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return cwd_;
}

void MockTransferClient::ensureDirLocked(const std::string &path) {
    std::string p = resolveRemotePath("/", path);
    std::vector<std::string> chain;
    while (p != "/") {
        chain.push_back(p);
        p = parentOf(p);
    }
    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
        Node &n = nodes_[*it];
        n.isDir = true;
    }
}

bool MockTransferClient::checkLocked(const std::string &absPath,
                                     OpError &err) const {
    if (!connected_) {
        err.set(ErrorCode::NotConnected, "Not connected");
        return false;
    }
    auto it = failures_.find(absPath);
    if (it != failures_.end()) {
        err.set(ErrorCode::RemoteOperationFailed, absPath + ": " + it->second);
        return false;
    }
    return true;
}

RemoteFile MockTransferClient::entryLocked(const std::string &absPath,
                                           const Node &n) const {
    RemoteFile f;
    f.name = baseName(absPath);
    f.path = absPath;
    f.isDir = n.isDir;
    f.size = n.isDir ? 0 : n.content.size();
    f.modified = n.modified;
    f.permissions = n.isDir ? "drwxr-xr-x" : "-rw-r--r--";
    f.owner = "1000";
    f.group = "1000";
    return f;
}

bool MockTransferClient::listDir(const std::string &path,
                                 std::vector<RemoteFile> &out, OpError &err) {
    std::lock_guard<std::mutex> lk(mtx_);
    const std::string dir = resolveRemotePath(cwd_, path);
    if (!checkLocked(dir, err))
        return false;
    auto it = nodes_.find(dir);
    if (it == nodes_.end() || !it->second.isDir) {
        err.set(ErrorCode::RemoteOperationFailed,
                dir + ": no such directory");
        return false;
    }
    out.clear();
    for (const auto &kv : nodes_) {
        if (kv.first != "/" && parentOf(kv.first) == dir)
            out.push_back(entryLocked(kv.first, kv.second));
    }
    std::sort(out.begin(), out.end(),
              [](const RemoteFile &a, const RemoteFile &b) {
                  if (a.isDir != b.isDir)
                      return a.isDir > b.isDir; // directories first
                  return a.name < b.name;
              });
    return true;
}

bool MockTransferClient::chdir(const std::string &path, std::string &newCwd,
                               OpError &err) {
    std::lock_guard<std::mutex> lk(mtx_);
    const std::string dir = resolveRemotePath(cwd_, path);
    if (!checkLocked(dir, err))
        return false;
    auto it = nodes_.find(dir);
    if (it == nodes_.end() || !it->second.isDir) {
        err.set(ErrorCode::RemoteOperationFailed,
                dir + ": no such directory");
        return false;
    }
    cwd_ = dir;
    newCwd = cwd_;
    return true;
}

bool MockTransferClient::download(const std::string &remotePath,
                                  std::ostream &sink, OpError &err,
                                  ProgressCB progress, CancelCB shouldCancel) {
    std::string content;
    std::size_t chunk = 0;
    std::chrono::milliseconds delay{0};
    {
        std::lock_guard<std::mutex> lk(mtx_);
        const std::string p = resolveRemotePath(cwd_, remotePath);
        if (!checkLocked(p, err))
            return false;
        auto it = nodes_.find(p);
        if (it == nodes_.end() || it->second.isDir) {
            err.set(ErrorCode::RemoteOperationFailed, p + ": no such file");
            return false;
        }
        content = it->second.content;
        chunk = std::max<std::size_t>(1, chunkSize_);
        delay = chunkDelay_;
    }

    const std::uint64_t total = content.size();
    std::uint64_t done = 0;
    while (done < total) {
        if (shouldCancel && shouldCancel()) {
            err.set(ErrorCode::TransferInterrupted, "Canceled by user");
            return false;
        }
        if (delay.count() > 0)
            std::this_thread::sleep_for(delay);
        const std::size_t n =
            static_cast<std::size_t>(std::min<std::uint64_t>(chunk, total - done));
        sink.write(content.data() + done, static_cast<std::streamsize>(n));
        if (!sink.good()) {
            err.set(ErrorCode::LocalIoFailed, "Local write failed");
            return false;
        }
        done += n;
        if (progress)
            progress(done, total);
    }
    return true;
}

bool MockTransferClient::upload(std::istream &source, std::uint64_t size,
                                const std::string &remotePath, OpError &err,
                                ProgressCB progress, CancelCB shouldCancel) {
    std::string target;
    std::size_t chunk = 0;
    std::chrono::milliseconds delay{0};
    {
        std::lock_guard<std::mutex> lk(mtx_);
        target = resolveRemotePath(cwd_, remotePath);
        if (!checkLocked(target, err))
            return false;
        auto parent = nodes_.find(parentOf(target));
        if (parent == nodes_.end() || !parent->second.isDir) {
            err.set(ErrorCode::RemoteOperationFailed,
                    target + ": parent directory does not exist");
            return false;
        }
        chunk = std::max<std::size_t>(1, chunkSize_);
        delay = chunkDelay_;
    }

    std::string data;
    std::vector<char> buf(chunk);
    std::uint64_t done = 0;
    while (done < size) {
        if (shouldCancel && shouldCancel()) {
            err.set(ErrorCode::TransferInterrupted, "Canceled by user");
            return false;
        }
        if (delay.count() > 0)
            std::this_thread::sleep_for(delay);
        const std::size_t want =
            static_cast<std::size_t>(std::min<std::uint64_t>(chunk, size - done));
        source.read(buf.data(), static_cast<std::streamsize>(want));
        const std::size_t got = static_cast<std::size_t>(source.gcount());
        if (got == 0) {
            err.set(ErrorCode::LocalIoFailed, "Local read failed");
            return false;
        }
        data.append(buf.data(), got);
        done += got;
        if (progress)
            progress(done, size);
    }

    std::lock_guard<std::mutex> lk(mtx_);
    Node &n = nodes_[target];
    n.isDir = false;
    n.content = std::move(data);
    return true;
}

bool MockTransferClient::removeFile(const std::string &path, OpError &err) {
    std::lock_guard<std::mutex> lk(mtx_);
    const std::string p = resolveRemotePath(cwd_, path);
    if (!checkLocked(p, err))
        return false;
    auto it = nodes_.find(p);
    if (it == nodes_.end() || it->second.isDir) {
        err.set(ErrorCode::RemoteOperationFailed, p + ": no such file");
        return false;
    }
    nodes_.erase(it);
    return true;
}

bool MockTransferClient::removeDir(const std::string &path, OpError &err) {
    std::lock_guard<std::mutex> lk(mtx_);
    const std::string p = resolveRemotePath(cwd_, path);
    if (!checkLocked(p, err))
        return false;
    auto it = nodes_.find(p);
    if (p == "/" || it == nodes_.end() || !it->second.isDir) {
        err.set(ErrorCode::RemoteOperationFailed, p + ": no such directory");
        return false;
    }
    for (const auto &kv : nodes_) {
        if (kv.first != p && parentOf(kv.first) == p) {
            err.set(ErrorCode::RemoteOperationFailed,
                    p + ": directory not empty");
            return false;
        }
    }
    nodes_.erase(it);
    return true;
}

bool MockTransferClient::mkdir(const std::string &path, OpError &err) {
    std::lock_guard<std::mutex> lk(mtx_);
    const std::string p = resolveRemotePath(cwd_, path);
    if (!checkLocked(p, err))
        return false;
    if (nodes_.count(p) > 0) {
        err.set(ErrorCode::RemoteOperationFailed, p + ": file exists");
        return false;
    }
    auto parent = nodes_.find(parentOf(p));
    if (parent == nodes_.end() || !parent->second.isDir) {
        err.set(ErrorCode::RemoteOperationFailed,
                p + ": parent directory does not exist");
        return false;
    }
    nodes_[p].isDir = true;
    createdDirs_.push_back(p);
    return true;
}

bool MockTransferClient::rename(const std::string &from, const std::string &to,
                                OpError &err) {
    std::lock_guard<std::mutex> lk(mtx_);
    const std::string a = resolveRemotePath(cwd_, from);
    const std::string b = resolveRemotePath(cwd_, to);
    if (!checkLocked(a, err) || !checkLocked(b, err))
        return false;
    auto it = nodes_.find(a);
    if (a == "/" || it == nodes_.end()) {
        err.set(ErrorCode::RemoteOperationFailed, a + ": no such file");
        return false;
    }
    // Move the node and, for directories, everything below it.
    const std::string prefix = a + "/";
    std::map<std::string, Node> moved;
    for (auto n = nodes_.begin(); n != nodes_.end();) {
        if (n->first == a || n->first.compare(0, prefix.size(), prefix) == 0) {
            moved[b + n->first.substr(a.size())] = n->second;
            n = nodes_.erase(n);
        } else {
            ++n;
        }
    }
    for (auto &kv : moved)
        nodes_[kv.first] = kv.second;
    return true;
}

bool MockTransferClient::stat(const std::string &path, RemoteFile &out,
                              OpError &err) {
    std::lock_guard<std::mutex> lk(mtx_);
    const std::string p = resolveRemotePath(cwd_, path);
    if (!checkLocked(p, err))
        return false;
    auto it = nodes_.find(p);
    if (it == nodes_.end()) {
        err.set(ErrorCode::RemoteOperationFailed, p + ": no such file");
        return false;
    }
    out = entryLocked(p, it->second);
    return true;
}

void MockTransferClient::addDir(const std::string &path) {
    std::lock_guard<std::mutex> lk(mtx_);
    ensureDirLocked(path);
}

void MockTransferClient::addFile(const std::string &path,
                                 const std::string &content,
                                 std::optional<std::int64_t> modified) {
    std::lock_guard<std::mutex> lk(mtx_);
    const std::string p = resolveRemotePath("/", path);
    ensureDirLocked(parentOf(p));
    Node &n = nodes_[p];
    n.isDir = false;
    n.content = content;
    n.modified = modified;
}

bool MockTransferClient::hasDir(const std::string &path) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = nodes_.find(resolveRemotePath("/", path));
    return it != nodes_.end() && it->second.isDir;
}

std::optional<std::string>
MockTransferClient::fileContent(const std::string &path) const {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = nodes_.find(resolveRemotePath("/", path));
    if (it == nodes_.end() || it->second.isDir)
        return std::nullopt;
    return it->second.content;
}

std::vector<std::string> MockTransferClient::createdDirs() const {
    std::lock_guard<std::mutex> lk(mtx_);
    return createdDirs_;
}

void MockTransferClient::setHomeDir(const std::string &path) {
    std::lock_guard<std::mutex> lk(mtx_);
    home_ = resolveRemotePath("/", path);
    ensureDirLocked(home_);
}

void MockTransferClient::setChunkSize(std::size_t bytes) {
    std::lock_guard<std::mutex> lk(mtx_);
    chunkSize_ = bytes;
}

void MockTransferClient::setChunkDelay(std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lk(mtx_);
    chunkDelay_ = delay;
}

void MockTransferClient::failConnect(const std::string &cause) {
    std::lock_guard<std::mutex> lk(mtx_);
    connectFailure_ = cause;
}

void MockTransferClient::failPath(const std::string &path,
                                  const std::string &cause) {
    std::lock_guard<std::mutex> lk(mtx_);
    failures_[resolveRemotePath("/", path)] = cause;
}

} // namespace portkeydrop
