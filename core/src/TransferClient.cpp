#include "portkeydrop/TransferClient.hpp"
#include "portkeydrop/RemotePath.hpp"

namespace portkeydrop {

bool TransferClient::parentDir(std::string &newCwd, OpError &err) {
    return chdir(parentOf(cwd()), newCwd, err);
}

bool TransferClient::requireConnected(OpError &err) const {
    if (isConnected())
        return true;
    err.set(ErrorCode::NotConnected, "Not connected");
    return false;
}

} // namespace portkeydrop
