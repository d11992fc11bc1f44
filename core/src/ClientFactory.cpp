#include "portkeydrop/ClientFactory.hpp"
#include "portkeydrop/CurlFtpClient.hpp"
#include "portkeydrop/FtpsClient.hpp"
#include "portkeydrop/Libssh2SftpClient.hpp"
#include "portkeydrop/Log.hpp"

namespace portkeydrop {

std::unique_ptr<TransferClient> createClient(const ConnectionInfo &info,
                                             OpError &err) {
    err.clear();
    switch (info.protocol) {
    case Protocol::Ftp:
        return std::make_unique<CurlFtpClient>(info);
    case Protocol::Ftps:
        return std::make_unique<FtpsClient>(info);
    case Protocol::Sftp:
        return std::make_unique<Libssh2SftpClient>(info);
    case Protocol::Scp:
    case Protocol::WebDav:
        break;
    }
    err.set(ErrorCode::Unsupported, std::string("Protocol ") +
                                        protocolName(info.protocol) +
                                        " is not yet supported");
    PKD_LOGW("%s", err.message.c_str());
    return nullptr;
}

} // namespace portkeydrop
