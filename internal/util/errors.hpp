#pragma once

#include <stdexcept>
#include <string>

namespace foreman::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Worker executable missing or the OS refused to start it.
class SpawnError : public std::runtime_error {
 public:
  explicit SpawnError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Illegal pipeline state edge. Carries the rejected pair by name.
class InvalidTransition : public std::runtime_error {
 public:
  InvalidTransition(std::string from, std::string to)
      : std::runtime_error("Invalid state transition: " + from + " -> " + to), from_(std::move(from)), to_(std::move(to)) {
  }

  const std::string& from() const {
    return from_;
  }
  const std::string& to() const {
    return to_;
  }

 private:
  std::string from_;
  std::string to_;
};

class ResourceExhausted : public std::runtime_error {
 public:
  explicit ResourceExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace foreman::util
