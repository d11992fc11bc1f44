#pragma once
#include "TransferClient.hpp"

#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace portkeydrop {

// In-memory "remote server" used by tests and offline development. The tree
// is guarded by a mutex so tests can inspect it while a worker transfers.
class MockTransferClient : public TransferClient {
public:
    explicit MockTransferClient(ConnectionInfo info = defaultInfo());

    static ConnectionInfo defaultInfo();

    Protocol protocol() const override { return info_.protocol; }

    bool connect(OpError &err) override;
    void disconnect() override;
    bool isConnected() const override;
    std::string cwd() const override;

    bool listDir(const std::string &path, std::vector<RemoteFile> &out,
                 OpError &err) override;
    bool chdir(const std::string &path, std::string &newCwd,
               OpError &err) override;

    bool download(const std::string &remotePath, std::ostream &sink,
                  OpError &err, ProgressCB progress = {},
                  CancelCB shouldCancel = {}) override;
    bool upload(std::istream &source, std::uint64_t size,
                const std::string &remotePath, OpError &err,
                ProgressCB progress = {}, CancelCB shouldCancel = {}) override;

    bool removeFile(const std::string &path, OpError &err) override;
    bool removeDir(const std::string &path, OpError &err) override;
    bool mkdir(const std::string &path, OpError &err) override;
    bool rename(const std::string &from, const std::string &to,
                OpError &err) override;
    bool stat(const std::string &path, RemoteFile &out, OpError &err) override;

    // Seeding and inspection. Parents are created as needed.
    void addDir(const std::string &path);
    void addFile(const std::string &path, const std::string &content,
                 std::optional<std::int64_t> modified = std::nullopt);
    bool hasDir(const std::string &path) const;
    std::optional<std::string> fileContent(const std::string &path) const;
    // Every path passed to a successful mkdir(), in call order.
    std::vector<std::string> createdDirs() const;

    void setHomeDir(const std::string &path);
    void setChunkSize(std::size_t bytes);
    void setChunkDelay(std::chrono::milliseconds delay);
    // Makes connect() fail with ConnectionFailed and this cause.
    void failConnect(const std::string &cause);
    // Makes any operation touching `path` fail as the server would.
    void failPath(const std::string &path, const std::string &cause);

private:
    struct Node {
        bool isDir = false;
        std::string content;
        std::optional<std::int64_t> modified;
    };

    mutable std::mutex mtx_;
    std::map<std::string, Node> nodes_;
    std::map<std::string, std::string> failures_;
    std::vector<std::string> createdDirs_;
    std::string home_ = "/";
    std::string cwd_ = "/";
    bool connected_ = false;
    std::optional<std::string> connectFailure_;
    std::size_t chunkSize_ = 8192;
    std::chrono::milliseconds chunkDelay_{0};

    // Callers hold mtx_.
    void ensureDirLocked(const std::string &path);
    bool checkLocked(const std::string &absPath, OpError &err) const;
    RemoteFile entryLocked(const std::string &absPath, const Node &n) const;
};

} // namespace portkeydrop
