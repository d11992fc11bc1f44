#include "portkeydrop/TransferTypes.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>

namespace portkeydrop {

const char *protocolName(Protocol p) {
    switch (p) {
    case Protocol::Ftp:
        return "ftp";
    case Protocol::Ftps:
        return "ftps";
    case Protocol::Sftp:
        return "sftp";
    case Protocol::Scp:
        return "scp";
    case Protocol::WebDav:
        return "webdav";
    }
    return "unknown";
}

std::optional<Protocol> protocolFromString(const std::string &name) {
    std::string v = name;
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (v == "ftp")
        return Protocol::Ftp;
    if (v == "ftps")
        return Protocol::Ftps;
    if (v == "sftp")
        return Protocol::Sftp;
    if (v == "scp")
        return Protocol::Scp;
    if (v == "webdav")
        return Protocol::WebDav;
    return std::nullopt;
}

std::uint16_t defaultPort(Protocol p) {
    switch (p) {
    case Protocol::Ftp:
        return 21;
    case Protocol::Ftps:
        return 990;
    case Protocol::Sftp:
    case Protocol::Scp:
        return 22;
    case Protocol::WebDav:
        return 443;
    }
    return 22;
}

const char *hostKeyPolicyName(HostKeyPolicy p) {
    switch (p) {
    case HostKeyPolicy::AutoAdd:
        return "auto_add";
    case HostKeyPolicy::Strict:
        return "strict";
    case HostKeyPolicy::Prompt:
        return "prompt";
    }
    return "unknown";
}

std::uint16_t ConnectionInfo::effectivePort() const {
    return port > 0 ? port : defaultPort(protocol);
}

std::string formatSize(std::uint64_t bytes) {
    char buf[64];
    const double b = static_cast<double>(bytes);
    if (bytes < 1024ULL) {
        std::snprintf(buf, sizeof(buf), "%llu B",
                      static_cast<unsigned long long>(bytes));
    } else if (bytes < 1024ULL * 1024ULL) {
        std::snprintf(buf, sizeof(buf), "%.1f KB", b / 1024.0);
    } else if (bytes < 1024ULL * 1024ULL * 1024ULL) {
        std::snprintf(buf, sizeof(buf), "%.1f MB", b / (1024.0 * 1024.0));
    } else {
        std::snprintf(buf, sizeof(buf), "%.1f GB",
                      b / (1024.0 * 1024.0 * 1024.0));
    }
    return buf;
}

std::string RemoteFile::displaySize() const {
    if (isDir)
        return "<DIR>";
    return formatSize(size);
}

std::string RemoteFile::displayModified() const {
    if (!modified.has_value())
        return {};
    const std::time_t t = static_cast<std::time_t>(*modified);
    std::tm tmv{};
#ifdef _WIN32
    localtime_s(&tmv, &t);
#else
    localtime_r(&t, &tmv);
#endif
    char buf[32];
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M", &tmv) == 0)
        return {};
    return buf;
}

int progressPercent(std::int64_t transferred, std::int64_t total) {
    if (total <= 0 || transferred <= 0)
        return 0;
    if (transferred >= total)
        return 100;
    // transferred < total here, so the product stays below 100 * total.
    return static_cast<int>((static_cast<long double>(transferred) * 100) /
                            static_cast<long double>(total));
}

std::string formatPermissions(std::uint32_t mode) {
    std::string s(10, '-');
    switch (mode & 0170000) {
    case 0040000:
        s[0] = 'd';
        break;
    case 0120000:
        s[0] = 'l';
        break;
    default:
        break;
    }
    static const char rwx[] = "rwxrwxrwx";
    for (int i = 0; i < 9; ++i) {
        if (mode & (1u << (8 - i)))
            s[static_cast<std::size_t>(i) + 1] = rwx[i];
    }
    return s;
}

const char *errorCodeName(ErrorCode c) {
    switch (c) {
    case ErrorCode::None:
        return "None";
    case ErrorCode::ConnectionFailed:
        return "ConnectionFailed";
    case ErrorCode::NotConnected:
        return "NotConnected";
    case ErrorCode::RemoteOperationFailed:
        return "RemoteOperationFailed";
    case ErrorCode::TransferInterrupted:
        return "TransferInterrupted";
    case ErrorCode::LocalIoFailed:
        return "LocalIoFailed";
    case ErrorCode::Unsupported:
        return "Unsupported";
    }
    return "Unknown";
}

} // namespace portkeydrop
