#pragma once

#include <stdexcept>
#include <string>

namespace atelier::util {

/*
  Central error types.

  StorageError is the only one that crosses component boundaries.
  MalformedSource never leaves ConfigResolver::Resolve.
*/

class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Lock held elsewhere past the busy timeout; the operation may be retried.
class StorageBusy : public StorageError {
 public:
  explicit StorageBusy(const std::string& msg) : StorageError(msg) {
  }
};

class MalformedSource : public std::runtime_error {
 public:
  explicit MalformedSource(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace atelier::util
