#include "portkeydrop/LocalFileSystem.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace portkeydrop {

std::unique_ptr<std::istream>
StdLocalFileSystem::openForRead(const std::string &path, std::uint64_t &size,
                                std::string &err) {
    std::error_code ec;
    const auto sz = fs::file_size(fs::u8path(path), ec);
    if (ec) {
        err = "Could not read local file " + path + ": " + ec.message();
        return nullptr;
    }
    auto in = std::make_unique<std::ifstream>(fs::u8path(path),
                                              std::ios::binary);
    if (!in->is_open()) {
        err = "Could not open local file for reading: " + path;
        return nullptr;
    }
    size = static_cast<std::uint64_t>(sz);
    return in;
}

std::unique_ptr<std::ostream>
StdLocalFileSystem::openForWrite(const std::string &path, std::string &err) {
    auto out = std::make_unique<std::ofstream>(
        fs::u8path(path), std::ios::binary | std::ios::trunc);
    if (!out->is_open()) {
        err = "Could not open local file for writing: " + path;
        return nullptr;
    }
    return out;
}

bool StdLocalFileSystem::createDirectories(const std::string &path,
                                           std::string &err) {
    std::error_code ec;
    fs::create_directories(fs::u8path(path), ec);
    if (ec) {
        err = "Could not create local directory " + path + ": " + ec.message();
        return false;
    }
    return true;
}

bool StdLocalFileSystem::exists(const std::string &path) const {
    std::error_code ec;
    return fs::exists(fs::u8path(path), ec);
}

bool StdLocalFileSystem::isDirectory(const std::string &path) const {
    std::error_code ec;
    return fs::is_directory(fs::u8path(path), ec);
}

bool StdLocalFileSystem::listDir(const std::string &path,
                                 std::vector<LocalEntry> &out,
                                 std::string &err) {
    std::error_code ec;
    fs::directory_iterator it(fs::u8path(path), ec);
    if (ec) {
        err = "Could not list local directory " + path + ": " + ec.message();
        return false;
    }
    out.clear();
    for (const auto &entry : it) {
        LocalEntry e;
        e.name = entry.path().filename().u8string();
        e.path = entry.path().u8string();
        std::error_code ec2;
        e.isDir = entry.is_directory(ec2);
        if (!e.isDir)
            e.size = static_cast<std::uint64_t>(entry.file_size(ec2));
        out.push_back(std::move(e));
    }
    std::sort(out.begin(), out.end(),
              [](const LocalEntry &a, const LocalEntry &b) {
                  return a.name < b.name;
              });
    return true;
}

bool StdLocalFileSystem::rename(const std::string &from, const std::string &to,
                                std::string &err) {
    std::error_code ec;
    fs::rename(fs::u8path(from), fs::u8path(to), ec);
    if (ec) {
        err = "Could not rename " + from + " to " + to + ": " + ec.message();
        return false;
    }
    return true;
}

bool StdLocalFileSystem::remove(const std::string &path, std::string &err) {
    std::error_code ec;
    fs::remove(fs::u8path(path), ec);
    if (ec) {
        err = "Could not remove " + path + ": " + ec.message();
        return false;
    }
    return true;
}

std::string StdLocalFileSystem::join(const std::string &dir,
                                     const std::string &name) const {
    return (fs::u8path(dir) / fs::u8path(name)).u8string();
}

std::string StdLocalFileSystem::parentPath(const std::string &path) const {
    return fs::u8path(path).parent_path().u8string();
}

} // namespace portkeydrop
