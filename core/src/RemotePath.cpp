#include "portkeydrop/RemotePath.hpp"

#include <cctype>
#include <vector>

namespace portkeydrop {

std::string joinRemotePath(const std::string &base, const std::string &name) {
    if (base.empty())
        return std::string("/") + name;
    if (base.back() == '/')
        return base + name;
    return base + "/" + name;
}

bool isSafeEntryName(const std::string &name) {
    if (name.empty() || name == "." || name == "..")
        return false;
    if (name.find_first_of(std::string("/\\\0", 3)) != std::string::npos)
        return false;
#ifdef _WIN32
    // "C:x" is drive-relative on Windows and would leave the target dir.
    if (name.size() >= 2 && name[1] == ':' &&
        std::isalpha(static_cast<unsigned char>(name[0])))
        return false;
#endif
    return true;
}

std::string parentOf(const std::string &path) {
    std::string p = path;
    while (p.size() > 1 && p.back() == '/')
        p.pop_back();
    const auto pos = p.find_last_of('/');
    if (pos == std::string::npos)
        return ".";
    if (pos == 0)
        return "/";
    return p.substr(0, pos);
}

std::string baseName(const std::string &path) {
    std::string p = path;
    while (p.size() > 1 && p.back() == '/')
        p.pop_back();
    if (p == "/")
        return {};
    const auto pos = p.find_last_of('/');
    return pos == std::string::npos ? p : p.substr(pos + 1);
}

std::string resolveRemotePath(const std::string &cwd, const std::string &path) {
    std::string full;
    if (path.empty() || path == ".")
        full = cwd.empty() ? "/" : cwd;
    else if (path.front() == '/')
        full = path;
    else
        full = joinRemotePath(cwd.empty() ? "/" : cwd, path);

    std::vector<std::string> parts;
    std::size_t i = 0;
    while (i <= full.size()) {
        const auto next = full.find('/', i);
        const std::string seg = full.substr(
            i, next == std::string::npos ? std::string::npos : next - i);
        if (seg == "..") {
            if (!parts.empty())
                parts.pop_back();
        } else if (!seg.empty() && seg != ".") {
            parts.push_back(seg);
        }
        if (next == std::string::npos)
            break;
        i = next + 1;
    }
    if (parts.empty())
        return "/";
    std::string out;
    for (const auto &s : parts) {
        out += '/';
        out += s;
    }
    return out;
}

} // namespace portkeydrop
