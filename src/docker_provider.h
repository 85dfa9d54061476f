#ifndef DOCKER_PROVIDER_H_
#define DOCKER_PROVIDER_H_

#include <map>
#include <string>
#include <vector>

#include <sandpool/provider.h>

struct DockerOptions {
  std::string socket_path;
  // language -> image; falls back to the built-in table
  std::map<std::string, std::string> images;
  // read-only bind mount; empty source = none
  std::string data_mount_source, data_mount_target;
  long memory_limit_mb; // 0 = unlimited
  std::string network_mode; // empty = daemon default
  size_t max_output; // bytes kept per stream

  DockerOptions() :
      socket_path("/var/run/docker.sock"), data_mount_target("/data"),
      memory_limit_mb(0), max_output(1 << 20) {}
};

class DockerHandle : public SandboxHandle {
 public:
  const std::string container_id;
  const std::string language;
  DockerHandle(std::string id, std::string lang) :
      container_id(std::move(id)), language(std::move(lang)) {}
  std::string Describe() const override;
};

// One long-running container per session, driven through the Docker Engine API
//  on its unix socket.
class DockerProvider : public SandboxProvider {
  const DockerOptions opts_;

  std::string ImageOf_(const std::string& language) const;
  std::string CreateContainer_(const std::string& language);
  void PullImage_(const std::string& image);
  // run a shell command in the container; env entries are "KEY=value"
  RunOutput Exec_(const DockerHandle&, const std::string& cmd,
                  const std::vector<std::string>& env);

 public:
  explicit DockerProvider(const DockerOptions& opts = DockerOptions());

  std::unique_ptr<SandboxHandle> Create(
      const std::string& language, const LibrarySet& libraries) override;
  InstallOutput InstallLibraries(SandboxHandle&, const LibrarySet& libraries) override;
  RunOutput Run(SandboxHandle&, const std::string& code) override;
  void Destroy(SandboxHandle&) override;
};

// Split the raw exec stream into stdout and stderr.
// Each frame is an 8-byte header {stream, 0, 0, 0, size (big-endian u32)} followed
//  by the payload; stream 1 is stdout and 2 is stderr. Output beyond max_output per
//  stream is dropped. Throws ProviderError on a truncated frame.
void DemuxDockerStream(const std::string& raw, size_t max_output,
                       std::string& std_out, std::string& std_err);

#endif  // DOCKER_PROVIDER_H_
