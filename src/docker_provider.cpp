#include "docker_provider.h"

#include <thread>
#include <chrono>

#include <httplib.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <sandpool/errors.h>
#include <sandpool/utils.h>

#include "languages.h"
#include "http_utils.h"

namespace {

using nlohmann::json;

const std::string kWorkDir = "/sandbox";
const std::string kLabel = "sandpool.language";
constexpr int kPullRetries = 2;
constexpr int kInspectRetries = 20;

httplib::Client MakeClient(const std::string& socket_path) {
  // a plain path is taken as the host; the request goes over the unix socket
  httplib::Client cli(socket_path);
  cli.set_address_family(AF_UNIX);
  cli.set_connection_timeout(std::chrono::seconds(10));
  // execution time is bounded by the caller; a forced removal ends the stream
  cli.set_read_timeout(std::chrono::hours(24));
  return cli;
}

std::string DockerMessage(const httplib::Result& res) {
  if (!res) return DescribeFailure(res);
  json body = json::parse(res->body, nullptr, false);
  if (body.is_object() && body.contains("message") && body["message"].is_string()) {
    return fmt::format("status {}: {}", res->status, body["message"].get<std::string>());
  }
  return DescribeFailure(res);
}

[[noreturn]] void ThrowDocker(const std::string& what, const httplib::Result& res) {
  throw ProviderError(what + " failed: " + DockerMessage(res));
}

std::string JoinLibraries(const LibrarySet& libraries) {
  std::string ret;
  for (auto& i : libraries) {
    if (ret.size()) ret.push_back(' ');
    ret += i;
  }
  return ret;
}

// "repo/name:tag" -> {"repo/name", "tag"}
std::pair<std::string, std::string> SplitImage(const std::string& image) {
  size_t colon = image.rfind(':');
  size_t slash = image.rfind('/');
  if (colon == std::string::npos || (slash != std::string::npos && colon < slash)) {
    return {image, "latest"};
  }
  return {image.substr(0, colon), image.substr(colon + 1)};
}

uint32_t ReadBigEndian32(const std::string& str, size_t pos) {
  return (uint32_t)(uint8_t)str[pos] << 24 | (uint32_t)(uint8_t)str[pos + 1] << 16 |
         (uint32_t)(uint8_t)str[pos + 2] << 8 | (uint32_t)(uint8_t)str[pos + 3];
}

void AppendCapped(std::string& dest, const char* data, size_t len, size_t cap) {
  if (dest.size() >= cap) return;
  dest.append(data, std::min(len, cap - dest.size()));
}

} // namespace

void DemuxDockerStream(const std::string& raw, size_t max_output,
                       std::string& std_out, std::string& std_err) {
  constexpr size_t kHeaderSize = 8;
  size_t pos = 0;
  while (pos < raw.size()) {
    if (raw.size() - pos < kHeaderSize) throw ProviderError("Truncated stream header");
    uint8_t stream = raw[pos];
    size_t len = ReadBigEndian32(raw, pos + 4);
    pos += kHeaderSize;
    if (raw.size() - pos < len) throw ProviderError("Truncated stream frame");
    // stdin frames (0) never appear on output; treat unknown streams as stdout
    AppendCapped(stream == 2 ? std_err : std_out, raw.data() + pos, len, max_output);
    pos += len;
  }
}

std::string DockerHandle::Describe() const {
  return fmt::format("container {} ({})", container_id.substr(0, 12), language);
}

DockerProvider::DockerProvider(const DockerOptions& opts) : opts_(opts) {}

std::string DockerProvider::ImageOf_(const std::string& language) const {
  if (auto it = opts_.images.find(language); it != opts_.images.end()) return it->second;
  auto lang = GetLanguage(language);
  if (!lang) throw UnsupportedLanguageError(language);
  return LanguageDefaultImage(*lang);
}

void DockerProvider::PullImage_(const std::string& image) {
  auto [name, tag] = SplitImage(image);
  spdlog::info("Pulling image {}", image);
  auto cli = MakeClient(opts_.socket_path);
  auto res = RequestRetry<HTTPPost>(kPullRetries, cli,
      httplib::append_query_params("/images/create", {{"fromImage", name}, {"tag", tag}}),
      "", "text/plain");
  if (!IsSuccess(res)) ThrowDocker("Pulling image " + image, res);
}

std::string DockerProvider::CreateContainer_(const std::string& language) {
  std::string image = ImageOf_(language);
  json host_config = json::object();
  if (opts_.data_mount_source.size()) {
    host_config["Binds"] = json::array({opts_.data_mount_source + ':' + opts_.data_mount_target + ":ro"});
  }
  if (opts_.memory_limit_mb > 0) host_config["Memory"] = opts_.memory_limit_mb * 1024 * 1024;
  if (opts_.network_mode.size()) host_config["NetworkMode"] = opts_.network_mode;
  json body{
    {"Image", image},
    {"Cmd", json::array({"sleep", "infinity"})},
    {"WorkingDir", kWorkDir},
    {"Labels", {{kLabel, language}}},
    {"HostConfig", host_config},
  };
  std::string payload = body.dump();

  auto cli = MakeClient(opts_.socket_path);
  auto res = HTTPRequest<HTTPPost>(cli, "/containers/create", payload, "application/json");
  if (res && res->status == 404) {
    // image not present locally
    PullImage_(image);
    res = HTTPRequest<HTTPPost>(cli, "/containers/create", payload, "application/json");
  }
  if (!IsSuccess(res)) ThrowDocker("Creating container from " + image, res);
  json reply = json::parse(res->body, nullptr, false);
  if (!reply.is_object() || !reply.contains("Id") || !reply["Id"].is_string()) {
    throw ProviderError("Malformed container creation reply");
  }
  return reply["Id"].get<std::string>();
}

std::unique_ptr<SandboxHandle> DockerProvider::Create(
    const std::string& language, const LibrarySet& libraries) {
  if (!GetLanguage(language)) throw UnsupportedLanguageError(language);
  std::string id = CreateContainer_(language);
  auto cli = MakeClient(opts_.socket_path);
  auto res = HTTPRequest<HTTPPost>(cli, "/containers/" + id + "/start", "", "text/plain");
  if (!IsSuccess(res)) {
    std::string msg = DockerMessage(res);
    auto del = HTTPRequest<HTTPDelete>(cli, "/containers/" + id + "?force=true&v=true");
    if (!IsSuccess(del)) spdlog::warn("Failed to remove unstarted container {}: {}", id, DockerMessage(del));
    throw ProviderError("Starting container failed: " + msg);
  }
  spdlog::debug("Container started: id={} language={}", id, language);
  return std::make_unique<DockerHandle>(id, language);
}

RunOutput DockerProvider::Exec_(const DockerHandle& handle, const std::string& cmd,
                                const std::vector<std::string>& env) {
  auto cli = MakeClient(opts_.socket_path);
  json create{
    {"AttachStdout", true},
    {"AttachStderr", true},
    {"Cmd", json::array({"sh", "-c", cmd})},
    {"Env", env},
    {"WorkingDir", kWorkDir},
  };
  auto res = HTTPRequest<HTTPPost>(cli, "/containers/" + handle.container_id + "/exec",
                                   create.dump(), "application/json");
  if (!IsSuccess(res)) ThrowDocker("Creating exec", res);
  json reply = json::parse(res->body, nullptr, false);
  if (!reply.is_object() || !reply.contains("Id") || !reply["Id"].is_string()) {
    throw ProviderError("Malformed exec creation reply");
  }
  std::string exec_id = reply["Id"].get<std::string>();

  json start{{"Detach", false}, {"Tty", false}};
  res = HTTPRequest<HTTPPost>(cli, "/exec/" + exec_id + "/start", start.dump(), "application/json");
  if (!IsSuccess(res)) ThrowDocker("Starting exec", res);
  RunOutput ret;
  DemuxDockerStream(res->body, opts_.max_output, ret.std_out, ret.std_err);

  // the stream may close slightly before the exit code is recorded
  for (int i = 0; i < kInspectRetries; i++) {
    auto inspect = HTTPRequest<HTTPGet>(cli, "/exec/" + exec_id + "/json");
    if (!IsSuccess(inspect)) ThrowDocker("Inspecting exec", inspect);
    json info = json::parse(inspect->body, nullptr, false);
    if (!info.is_object()) throw ProviderError("Malformed exec inspect reply");
    if (info.contains("ExitCode") && info["ExitCode"].is_number_integer() &&
        !(info.contains("Running") && info["Running"] == true)) {
      ret.exit_code = info["ExitCode"].get<int>();
      return ret;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  throw ProviderError("Exit code unavailable for exec " + exec_id);
}

InstallOutput DockerProvider::InstallLibraries(SandboxHandle& handle, const LibrarySet& libraries) {
  auto& docker = dynamic_cast<DockerHandle&>(handle);
  InstallOutput ret;
  if (libraries.empty()) return ret;
  for (auto& i : libraries) {
    if (!IsValidLibraryName(i)) throw ProviderError("Invalid library name: " + i);
  }
  const char* cmd = LanguageInstallCommand(*GetLanguage(docker.language));
  if (!cmd[0]) {
    ret.exit_code = 1;
    ret.std_err = "Library installation is not supported for " + docker.language;
    return ret;
  }
  RunOutput out = Exec_(docker, cmd, {"SANDPOOL_LIBS=" + JoinLibraries(libraries)});
  ret.exit_code = out.exit_code;
  ret.std_err = std::move(out.std_err);
  return ret;
}

RunOutput DockerProvider::Run(SandboxHandle& handle, const std::string& code) {
  auto& docker = dynamic_cast<DockerHandle&>(handle);
  Language lang = *GetLanguage(docker.language);
  std::string cmd = fmt::format("printf '%s' \"$SANDPOOL_CODE\" > {} && {}",
                                LanguageSourceFile(lang), LanguageRunCommand(lang));
  return Exec_(docker, cmd, {"SANDPOOL_CODE=" + code});
}

void DockerProvider::Destroy(SandboxHandle& handle) {
  auto& docker = dynamic_cast<DockerHandle&>(handle);
  auto cli = MakeClient(opts_.socket_path);
  auto res = HTTPRequest<HTTPDelete>(cli, "/containers/" + docker.container_id + "?force=true&v=true");
  if (res && res->status == 404) {
    spdlog::debug("Container already gone: {}", docker.container_id);
    return;
  }
  if (!IsSuccess(res)) ThrowDocker("Removing container " + docker.container_id, res);
}
