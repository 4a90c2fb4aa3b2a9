#include "session_index.hpp"

namespace foreman::protocol {

bool SessionIndex::Register(const std::string& session_id, const std::string& agent_id) {
  std::lock_guard lock(mutex_);
  return agent_by_session_.emplace(session_id, agent_id).second;
}

std::optional<std::string> SessionIndex::Lookup(const std::string& session_id) const {
  std::lock_guard lock(mutex_);
  auto it = agent_by_session_.find(session_id);
  if (it == agent_by_session_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void SessionIndex::ForgetAgent(const std::string& agent_id) {
  std::lock_guard lock(mutex_);
  for (auto it = agent_by_session_.begin(); it != agent_by_session_.end();) {
    if (it->second == agent_id) {
      it = agent_by_session_.erase(it);
    } else {
      ++it;
    }
  }
}

size_t SessionIndex::Size() const {
  std::lock_guard lock(mutex_);
  return agent_by_session_.size();
}

} // namespace foreman::protocol
