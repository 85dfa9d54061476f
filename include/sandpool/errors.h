#ifndef INCLUDE_SANDPOOL_ERRORS_H_
#define INCLUDE_SANDPOOL_ERRORS_H_

#include <stdexcept>
#include <string>

class SandpoolError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Thrown by SandboxProvider implementations for any fault on their side
//  (transport failure, non-success response, malformed reply)
class ProviderError : public SandpoolError {
 public:
  using SandpoolError::SandpoolError;
};

// An environment could not be created; the pool state is left untouched
class ProviderCreationError : public SandpoolError {
 public:
  using SandpoolError::SandpoolError;
};

class PoolShutdownError : public SandpoolError {
 public:
  PoolShutdownError() : SandpoolError("Session pool is shutting down") {}
};

class UnsupportedLanguageError : public SandpoolError {
 public:
  explicit UnsupportedLanguageError(const std::string& language) :
      SandpoolError("Unsupported language: " + language) {}
};

#endif  // INCLUDE_SANDPOOL_ERRORS_H_
