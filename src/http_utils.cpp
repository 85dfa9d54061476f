#include "http_utils.h"
#include <fmt/ranges.h>

namespace http_utils {

std::string FormatOneParam(const char* str) {
  return str;
}
std::string FormatOneParam(const std::string& str) {
  if (str.size() > 200) return str.substr(0, 200) + "...";
  return str;
}
std::string FormatOneParam(const httplib::Params& params) {
  return fmt::format("{}", params);
}
std::string FormatOneParam(const httplib::Headers& headers) {
  return "";
}

std::string FormatParam() {
  return "(none)";
}

bool IsSuccess(int code) {
  return code >= 200 && code < 300;
}

std::string BearerToken(const httplib::Request& req) {
  constexpr char kPrefix[] = "Bearer ";
  constexpr size_t kPrefixLen = sizeof(kPrefix) - 1;
  std::string auth = req.get_header_value("Authorization");
  if (auth.size() <= kPrefixLen || auth.compare(0, kPrefixLen, kPrefix) != 0) return "";
  return auth.substr(kPrefixLen);
}

} // namespace http_utils

bool IsSuccess(const httplib::Result& res) {
  return res && http_utils::IsSuccess(res->status);
}

std::string DescribeFailure(const httplib::Result& res) {
  if (!res) return "connection error: " + httplib::to_string(res.error());
  return fmt::format("status {}: {}", res->status, res->body);
}
