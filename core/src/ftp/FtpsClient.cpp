#include "portkeydrop/FtpsClient.hpp"

namespace portkeydrop {

FtpsClient::FtpsClient(ConnectionInfo info)
    : TransferClient(info),
      ftp_(std::move(info), CurlFtpClient::Security::ExplicitTls) {}

bool FtpsClient::listDir(const std::string &path, std::vector<RemoteFile> &out,
                         OpError &err) {
    return ftp_.listDir(path, out, err);
}

bool FtpsClient::chdir(const std::string &path, std::string &newCwd,
                       OpError &err) {
    return ftp_.chdir(path, newCwd, err);
}

bool FtpsClient::download(const std::string &remotePath, std::ostream &sink,
                          OpError &err, ProgressCB progress,
                          CancelCB shouldCancel) {
    return ftp_.download(remotePath, sink, err, std::move(progress),
                         std::move(shouldCancel));
}

bool FtpsClient::upload(std::istream &source, std::uint64_t size,
                        const std::string &remotePath, OpError &err,
                        ProgressCB progress, CancelCB shouldCancel) {
    return ftp_.upload(source, size, remotePath, err, std::move(progress),
                       std::move(shouldCancel));
}

bool FtpsClient::removeFile(const std::string &path, OpError &err) {
    return ftp_.removeFile(path, err);
}

bool FtpsClient::removeDir(const std::string &path, OpError &err) {
    return ftp_.removeDir(path, err);
}

bool FtpsClient::mkdir(const std::string &path, OpError &err) {
    return ftp_.mkdir(path, err);
}

bool FtpsClient::rename(const std::string &from, const std::string &to,
                        OpError &err) {
    return ftp_.rename(from, to, err);
}

bool FtpsClient::stat(const std::string &path, RemoteFile &out, OpError &err) {
    return ftp_.stat(path, out, err);
}

} // namespace portkeydrop
