#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "process_launcher.hpp"

namespace foreman::supervisor {

/*
  Builds the command line and environment for one worker CLI process.

  Environment overrides win over the configuration:
    CLAUDE_PATH               worker executable
    CLAUDE_CODE_MODEL         model, unless empty or "auto"
    CLAUDE_CODE_API_KEY_MODE  "blocked" (default) strips ANTHROPIC_API_KEY
*/
class WorkerCommand {
 public:
  explicit WorkerCommand(foreman::runtime::config::WorkerConfig config);

  // Throws util::SpawnError when no executable can be found.
  std::string ResolveExecutable() const;

  // Explicit request, then CLAUDE_CODE_MODEL, then the configured model.
  std::optional<std::string> ResolveModel(const std::string& requested) const;

  std::vector<std::string>           BuildArgs(const std::optional<std::string>& model) const;
  std::map<std::string, std::string> BuildEnvironment(const std::string& agent_id) const;

  LaunchSpec Build(const std::string& agent_id, const std::string& working_dir, const std::string& requested_model) const;

 private:
  foreman::runtime::config::WorkerConfig config_;
};

} // namespace foreman::supervisor
