#pragma once
#include "TransferClient.hpp"
#include <string>
#include <vector>

// Forward declarations of libssh2's internal struct names
struct _LIBSSH2_SESSION;
struct _LIBSSH2_SFTP;

namespace portkeydrop {

class Libssh2SftpClient : public TransferClient {
public:
    explicit Libssh2SftpClient(ConnectionInfo info);
    ~Libssh2SftpClient() override;

    Protocol protocol() const override { return Protocol::Sftp; }

    bool connect(OpError &err) override;
    void disconnect() override;
    bool isConnected() const override { return connected_; }
    std::string cwd() const override { return cwd_; }

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

private:
    bool connected_ = false;
    std::string cwd_ = "/";
    int sock_ = -1;
    _LIBSSH2_SESSION *session_ = nullptr;
    _LIBSSH2_SFTP *sftp_ = nullptr;

    bool tcpConnect(std::string &err);
    bool verifyHostKey(std::string &err);
    bool authenticate(std::string &err);
    std::string lastSessionError() const;
    std::string sftpFailure(const std::string &what) const;
    std::string resolve(const std::string &path) const;
};

} // namespace portkeydrop
