#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace foreman::protocol {

/*
  Maps worker session ids to the worker that first reported them.

  Shared by every stream parser of one supervisor; all methods are
  thread-safe.
*/
class SessionIndex {
 public:
  // Returns true when the session was not known before. An existing mapping is never replaced.
  bool Register(const std::string& session_id, const std::string& agent_id);

  std::optional<std::string> Lookup(const std::string& session_id) const;

  void   ForgetAgent(const std::string& agent_id);
  size_t Size() const;

 private:
  mutable std::mutex                           mutex_;
  std::unordered_map<std::string, std::string> agent_by_session_;
};

} // namespace foreman::protocol
