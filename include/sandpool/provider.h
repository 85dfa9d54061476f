#ifndef INCLUDE_SANDPOOL_PROVIDER_H_
#define INCLUDE_SANDPOOL_PROVIDER_H_

#include <memory>
#include <string>

#include <sandpool/session.h>

// Opaque resource representing one live isolated environment.
// Each provider derives its own handle type from this.
class SandboxHandle {
 public:
  virtual ~SandboxHandle() = default;
  // for logging only
  virtual std::string Describe() const { return "(sandbox)"; }
};

struct RunOutput {
  std::string std_out, std_err;
  int exit_code;
  RunOutput() : exit_code(0) {}
};

struct InstallOutput {
  int exit_code;
  std::string std_err;
  InstallOutput() : exit_code(0) {}
};

// The external capability that creates, runs and destroys environments.
// All calls may block for seconds; all of them report faults by throwing
//  (ProviderError or any std::exception).
// Calls on distinct handles may run concurrently. Destroy may be called while a
//  Run on the same handle is still in flight and must make that Run return.
class SandboxProvider {
 public:
  virtual ~SandboxProvider() = default;

  virtual std::unique_ptr<SandboxHandle> Create(
      const std::string& language, const LibrarySet& libraries) = 0;
  // best-effort; a non-zero exit code is not an exception
  virtual InstallOutput InstallLibraries(SandboxHandle&, const LibrarySet& libraries) = 0;
  virtual RunOutput Run(SandboxHandle&, const std::string& code) = 0;
  virtual void Destroy(SandboxHandle&) = 0;
};

#endif  // INCLUDE_SANDPOOL_PROVIDER_H_
