// POSIX-style remote path helpers. Remote servers always use '/'.
#pragma once
#include <string>

namespace portkeydrop {

// Joins a directory and an entry name without doubling separators.
std::string joinRemotePath(const std::string &base, const std::string &name);

// Parent of an absolute path; the parent of "/" is "/".
std::string parentOf(const std::string &path);

// Last path component ("" for "/").
std::string baseName(const std::string &path);

// True when a listing entry name is a single path component that can be
// appended to a local directory: not empty, not "." or ".." and without
// separators (or a drive prefix on Windows).
bool isSafeEntryName(const std::string &name);

// Resolves `path` against `cwd` when relative and collapses "." and "..".
std::string resolveRemotePath(const std::string &cwd, const std::string &path);

} // namespace portkeydrop
