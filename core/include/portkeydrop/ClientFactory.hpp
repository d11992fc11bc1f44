#pragma once
#include "TransferClient.hpp"

#include <memory>

namespace portkeydrop {

// Selects the implementation for info.protocol. SCP and WebDAV return
// nullptr with ErrorCode::Unsupported. The client is not connected yet.
std::unique_ptr<TransferClient> createClient(const ConnectionInfo &info,
                                             OpError &err);

} // namespace portkeydrop
