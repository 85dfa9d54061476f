#include <sandpool/utils.h>

#include <mutex>
#include <random>
#include <sstream>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace {

std::mutex rng_mtx;

std::mt19937_64& Rng() {
  static std::mt19937_64 rng(std::random_device{}());
  return rng;
}

} // namespace

std::string GenerateSessionId() {
  uint64_t hi, lo;
  {
    std::lock_guard lck(rng_mtx);
    hi = Rng()();
    lo = Rng()();
  }
  // version 4, variant 10xx
  hi = (hi & 0xffffffffffff0fffULL) | 0x0000000000004000ULL;
  lo = (lo & 0x3fffffffffffffffULL) | 0x8000000000000000ULL;
  return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
      hi >> 32, (hi >> 16) & 0xffff, hi & 0xffff, lo >> 48, lo & 0xffffffffffffULL);
}

std::string Trim(const std::string& str) {
  constexpr char kWhites[] = " \n\r\t";
  size_t start = str.find_first_not_of(kWhites);
  if (start == std::string::npos) return "";
  return str.substr(start, str.find_last_not_of(kWhites) - start + 1);
}

std::vector<std::string> SplitList(const std::string& str, char delim) {
  std::vector<std::string> ret;
  std::stringstream ss(str);
  std::string item;
  while (std::getline(ss, item, delim)) {
    item = Trim(item);
    if (item.size()) ret.push_back(std::move(item));
  }
  return ret;
}

LibrarySet NormalizeLibraries(const std::vector<std::string>& libraries) {
  LibrarySet ret;
  for (auto& i : libraries) {
    std::string name = Trim(i);
    if (name.size()) ret.insert(std::move(name));
  }
  return ret;
}

bool IsValidLibraryName(const std::string& name) {
  if (name.empty() || name.size() > 200) return false;
  for (char c : name) {
    if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')) continue;
    switch (c) {
      // pip/npm/go style names with version specifiers
      case '.': case '_': case '-': case '=': case '<': case '>':
      case '@': case '/': case '+': case '~': case '!': case ':':
        continue;
    }
    return false;
  }
  return name[0] != '-';
}

std::string FormatLibraries(const LibrarySet& libraries) {
  return fmt::format("[{}]", fmt::join(libraries, ","));
}
