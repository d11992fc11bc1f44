#pragma once
#include "TransferClient.hpp"

#include <string>
#include <vector>

namespace portkeydrop {

// FTP backend on top of a single reused libcurl easy handle. The handle
// keeps the control connection alive between operations, so one instance
// behaves like one FTP session.
class CurlFtpClient : public TransferClient {
public:
    enum class Security {
        None,
        ExplicitTls // AUTH TLS, then PBSZ 0 / PROT P before any transfer
    };

    explicit CurlFtpClient(ConnectionInfo info,
                           Security security = Security::None);
    ~CurlFtpClient() override;

    Protocol protocol() const override;

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

    // Download/upload chunk size in bytes.
    static constexpr std::size_t kChunkSize = 8192;

private:
    Security security_;
    bool connected_ = false;
    std::string cwd_ = "/";
    void *curl_ = nullptr; // CURL*

    const char *label() const;
    std::string urlFor(const std::string &absPath, bool asDir) const;
    void applyCommonOptions();
    bool perform(ErrorCode failCode, const std::string &what, OpError &err);
    bool sendCommands(const std::vector<std::string> &commands,
                      const std::string &what, OpError &err);
};

} // namespace portkeydrop
