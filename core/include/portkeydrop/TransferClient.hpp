// Abstract interface for remote file operations. Concrete protocol backends
// (libcurl FTP/FTPS, libssh2 SFTP, in-memory mock) implement this API so the
// transfer manager and the UI stay decoupled from the protocol.
//
// A client owns one connection. It is not safe for concurrent use: callers
// either give each job its own client or serialize access.
#pragma once
#include "TransferTypes.hpp"

#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace portkeydrop {

class TransferClient {
public:
    explicit TransferClient(ConnectionInfo info) : info_(std::move(info)) {}
    virtual ~TransferClient() = default;

    TransferClient(const TransferClient &) = delete;
    TransferClient &operator=(const TransferClient &) = delete;

    const ConnectionInfo &info() const { return info_; }
    virtual Protocol protocol() const = 0;

    // Establishes the session. On success cwd() is the server start
    // directory. Failures use ErrorCode::ConnectionFailed.
    virtual bool connect(OpError &err) = 0;
    // Tears the session down. Idempotent, never fails.
    virtual void disconnect() = 0;
    virtual bool isConnected() const = 0;

    // Current working directory, absolute, "/" until connected.
    virtual std::string cwd() const = 0;

    // Lists `path` ("." or empty means cwd) excluding "." and "..".
    virtual bool listDir(const std::string &path, std::vector<RemoteFile> &out,
                         OpError &err) = 0;

    // Changes directory and reports the new absolute cwd.
    virtual bool chdir(const std::string &path, std::string &newCwd,
                       OpError &err) = 0;

    // Streams `remotePath` into `sink`. Cancellation yields
    // ErrorCode::TransferInterrupted.
    virtual bool download(const std::string &remotePath, std::ostream &sink,
                          OpError &err, ProgressCB progress = {},
                          CancelCB shouldCancel = {}) = 0;

    // Streams `size` bytes from `source` into `remotePath` (create/truncate).
    virtual bool upload(std::istream &source, std::uint64_t size,
                        const std::string &remotePath, OpError &err,
                        ProgressCB progress = {},
                        CancelCB shouldCancel = {}) = 0;

    virtual bool removeFile(const std::string &path, OpError &err) = 0;
    virtual bool removeDir(const std::string &path, OpError &err) = 0;
    virtual bool mkdir(const std::string &path, OpError &err) = 0;
    virtual bool rename(const std::string &from, const std::string &to,
                        OpError &err) = 0;
    virtual bool stat(const std::string &path, RemoteFile &out,
                      OpError &err) = 0;

    // chdir(parentOf(cwd())).
    bool parentDir(std::string &newCwd, OpError &err);

protected:
    bool requireConnected(OpError &err) const;

    const ConnectionInfo info_;
};

} // namespace portkeydrop
