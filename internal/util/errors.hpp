#pragma once

#include <stdexcept>
#include <string>

namespace mediacache::util {

/*
  Central error types.

  Registry and cache layers throw these; only CorruptState is handled
  locally (Load degrades to an empty registry).
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Same identifier claimed by two different paths.
class Conflict : public std::runtime_error {
 public:
  explicit Conflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CorruptState : public std::runtime_error {
 public:
  explicit CorruptState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A registry entry (or a freshly produced artifact) has no usable backing file.
class IntegrityViolation : public std::runtime_error {
 public:
  explicit IntegrityViolation(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace mediacache::util
