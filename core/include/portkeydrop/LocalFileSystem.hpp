// Local side of a transfer: sources for uploads and destinations for
// downloads. Abstracted so the transfer manager can be tested against any
// filesystem and so the UI can supply its own.
#pragma once
#include <cstdint>
#include <istream>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace portkeydrop {

struct LocalEntry {
    std::string name;
    std::string path;
    bool isDir = false;
    std::uint64_t size = 0;
};

class LocalFileSystem {
public:
    virtual ~LocalFileSystem() = default;

    // Opens a file for reading and reports its size. nullptr on failure.
    virtual std::unique_ptr<std::istream>
    openForRead(const std::string &path, std::uint64_t &size,
                std::string &err) = 0;
    // Creates/truncates a file for binary writing. nullptr on failure.
    virtual std::unique_ptr<std::ostream>
    openForWrite(const std::string &path, std::string &err) = 0;
    virtual bool createDirectories(const std::string &path,
                                   std::string &err) = 0;
    virtual bool exists(const std::string &path) const = 0;
    virtual bool isDirectory(const std::string &path) const = 0;
    virtual bool listDir(const std::string &path, std::vector<LocalEntry> &out,
                         std::string &err) = 0;
    // Replaces `to` if it exists.
    virtual bool rename(const std::string &from, const std::string &to,
                        std::string &err) = 0;
    virtual bool remove(const std::string &path, std::string &err) = 0;

    // Joins with the platform separator.
    virtual std::string join(const std::string &dir,
                             const std::string &name) const = 0;
    virtual std::string parentPath(const std::string &path) const = 0;
};

// std::filesystem + fstream implementation.
class StdLocalFileSystem : public LocalFileSystem {
public:
    std::unique_ptr<std::istream> openForRead(const std::string &path,
                                              std::uint64_t &size,
                                              std::string &err) override;
    std::unique_ptr<std::ostream> openForWrite(const std::string &path,
                                               std::string &err) override;
    bool createDirectories(const std::string &path, std::string &err) override;
    bool exists(const std::string &path) const override;
    bool isDirectory(const std::string &path) const override;
    bool listDir(const std::string &path, std::vector<LocalEntry> &out,
                 std::string &err) override;
    bool rename(const std::string &from, const std::string &to,
                std::string &err) override;
    bool remove(const std::string &path, std::string &err) override;
    std::string join(const std::string &dir,
                     const std::string &name) const override;
    std::string parentPath(const std::string &path) const override;
};

} // namespace portkeydrop
