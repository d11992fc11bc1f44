#pragma once
#include "CurlFtpClient.hpp"

namespace portkeydrop {

// FTP over explicit TLS. Listing, navigation and transfers are the FTP
// implementation's; this class only selects the protected control and data
// channels and reports itself as FTPS.
class FtpsClient : public TransferClient {
public:
    explicit FtpsClient(ConnectionInfo info);

    Protocol protocol() const override { return Protocol::Ftps; }

    bool connect(OpError &err) override { return ftp_.connect(err); }
    void disconnect() override { ftp_.disconnect(); }
    bool isConnected() const override { return ftp_.isConnected(); }
    std::string cwd() const override { return ftp_.cwd(); }

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
    CurlFtpClient ftp_;
};

} // namespace portkeydrop
