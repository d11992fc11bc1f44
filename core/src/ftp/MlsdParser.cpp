// MLSD fact parsing (RFC 3659 section 7). Facts are "name=value;" pairs,
// followed by a single space and the entry name, which may itself contain
// spaces or semicolons.
#include "portkeydrop/MlsdParser.hpp"
#include "portkeydrop/RemotePath.hpp"

#include <cctype>
#include <cstdlib>
#include <ctime>
#include <map>

namespace portkeydrop {

namespace {

std::string lower(std::string s) {
    for (char &c : s)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::map<std::string, std::string> splitFacts(const std::string &facts) {
    std::map<std::string, std::string> out;
    std::size_t i = 0;
    while (i < facts.size()) {
        std::size_t end = facts.find(';', i);
        if (end == std::string::npos)
            end = facts.size();
        const std::string item = facts.substr(i, end - i);
        const auto eq = item.find('=');
        if (eq != std::string::npos && eq > 0)
            out[lower(item.substr(0, eq))] = item.substr(eq + 1);
        i = end + 1;
    }
    return out;
}

bool allDigits(const std::string &s) {
    if (s.empty())
        return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c)))
            return false;
    }
    return true;
}

std::time_t utcToEpoch(std::tm *tmv) {
#ifdef _WIN32
    return _mkgmtime(tmv);
#else
    return timegm(tmv);
#endif
}

} // namespace

std::optional<std::int64_t> parseMlsdTime(const std::string &value) {
    if (value.size() < 14)
        return std::nullopt;
    const std::string digits = value.substr(0, 14);
    if (!allDigits(digits))
        return std::nullopt;
    auto field = [&](std::size_t pos, std::size_t len) {
        return std::atoi(digits.substr(pos, len).c_str());
    };
    std::tm tmv{};
    tmv.tm_year = field(0, 4) - 1900;
    tmv.tm_mon = field(4, 2) - 1;
    tmv.tm_mday = field(6, 2);
    tmv.tm_hour = field(8, 2);
    tmv.tm_min = field(10, 2);
    tmv.tm_sec = field(12, 2);
    if (tmv.tm_mon < 0 || tmv.tm_mon > 11 || tmv.tm_mday < 1 ||
        tmv.tm_mday > 31 || tmv.tm_hour > 23 || tmv.tm_min > 59 ||
        tmv.tm_sec > 60)
        return std::nullopt;
    return static_cast<std::int64_t>(utcToEpoch(&tmv));
}

std::optional<RemoteFile> parseMlsdLine(const std::string &rawLine,
                                        const std::string &dirPath) {
    std::string line = rawLine;
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
        line.pop_back();
    const auto sp = line.find(' ');
    if (sp == std::string::npos)
        return std::nullopt;
    const std::string name = line.substr(sp + 1);
    // A name with separators would address a path outside dirPath.
    if (!isSafeEntryName(name))
        return std::nullopt;

    const auto facts = splitFacts(line.substr(0, sp));
    std::string type;
    if (auto it = facts.find("type"); it != facts.end())
        type = lower(it->second);
    if (type == "cdir" || type == "pdir")
        return std::nullopt;

    RemoteFile f;
    f.name = name;
    f.path = joinRemotePath(dirPath, name);
    f.isDir = (type == "dir");
    if (!f.isDir) {
        if (auto it = facts.find("size");
            it != facts.end() && allDigits(it->second))
            f.size = std::strtoull(it->second.c_str(), nullptr, 10);
    }
    if (auto it = facts.find("modify"); it != facts.end())
        f.modified = parseMlsdTime(it->second);
    if (auto it = facts.find("perm"); it != facts.end())
        f.permissions = it->second;
    if (auto it = facts.find("unix.owner"); it != facts.end())
        f.owner = it->second;
    else if (auto uid = facts.find("unix.uid"); uid != facts.end())
        f.owner = uid->second;
    if (auto it = facts.find("unix.group"); it != facts.end())
        f.group = it->second;
    else if (auto gid = facts.find("unix.gid"); gid != facts.end())
        f.group = gid->second;
    return f;
}

std::vector<RemoteFile> parseMlsdListing(const std::string &body,
                                         const std::string &dirPath) {
    std::vector<RemoteFile> out;
    std::size_t i = 0;
    while (i < body.size()) {
        std::size_t end = body.find('\n', i);
        if (end == std::string::npos)
            end = body.size();
        if (auto f = parseMlsdLine(body.substr(i, end - i), dirPath))
            out.push_back(std::move(*f));
        i = end + 1;
    }
    return out;
}

} // namespace portkeydrop
