// Parser for RFC 3659 machine-readable listings (MLSD/MLST facts).
#pragma once
#include "TransferTypes.hpp"

#include <optional>
#include <string>
#include <vector>

namespace portkeydrop {

// Parses one "fact=value;fact=value; name" line. Returns nullopt for lines
// without facts and for the self/parent entries (".", "..", cdir, pdir).
std::optional<RemoteFile> parseMlsdLine(const std::string &line,
                                        const std::string &dirPath);

// Parses a whole MLSD response body (CRLF or LF separated).
std::vector<RemoteFile> parseMlsdListing(const std::string &body,
                                         const std::string &dirPath);

// "YYYYMMDDHHMMSS[.sss]" in UTC to epoch seconds; nullopt when malformed.
std::optional<std::int64_t> parseMlsdTime(const std::string &value);

} // namespace portkeydrop
