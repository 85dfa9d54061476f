#ifndef INCLUDE_SANDPOOL_UTILS_H_
#define INCLUDE_SANDPOOL_UTILS_H_

#include <string>
#include <vector>

#include <sandpool/session.h>

// random UUIDv4 text
std::string GenerateSessionId();

// trim, drop empty entries and collapse duplicates
LibrarySet NormalizeLibraries(const std::vector<std::string>&);
// package names (and version specifiers) only; no shell metacharacters or quotes
bool IsValidLibraryName(const std::string&);
std::vector<std::string> SplitList(const std::string&, char delim = ',');
std::string Trim(const std::string&);

// logging
std::string FormatLibraries(const LibrarySet&);

#endif  // INCLUDE_SANDPOOL_UTILS_H_
