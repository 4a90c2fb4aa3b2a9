#include "worker_command.hpp"

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <sstream>

#include "internal/util/errors.hpp"

extern char** environ;

namespace foreman::supervisor {

namespace {

namespace fs = std::filesystem;

constexpr const char* kBlockedEnvVars[] = {"ANTHROPIC_API_KEY"};

std::string Env(const char* name) {
  const char* value = std::getenv(name);
  return value != nullptr ? std::string(value) : std::string();
}

std::string Trim(const std::string& text) {
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

std::string Lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

bool UsableModel(const std::string& model) {
  const auto normalized = Lower(Trim(model));
  return !normalized.empty() && normalized != "auto";
}

bool IsExecutable(const fs::path& path) {
  std::error_code ec;
  return fs::is_regular_file(path, ec) && ::access(path.c_str(), X_OK) == 0;
}

std::optional<std::string> SearchPath(const std::string& name) {
  std::stringstream dirs(Env("PATH"));
  std::string       dir;
  while (std::getline(dirs, dir, ':')) {
    if (dir.empty()) {
      continue;
    }
    const auto candidate = fs::path(dir) / name;
    if (IsExecutable(candidate)) {
      return candidate.string();
    }
  }
  return std::nullopt;
}

// Absolute or relative paths are taken as-is; bare names go through PATH.
std::optional<std::string> Locate(const std::string& executable) {
  if (executable.find('/') != std::string::npos) {
    if (IsExecutable(executable)) {
      return fs::absolute(executable).string();
    }
    return std::nullopt;
  }
  return SearchPath(executable);
}

std::vector<fs::path> WellKnownLocations() {
  std::vector<fs::path> locations;
  const auto            home = Env("HOME");
  if (!home.empty()) {
    locations.push_back(fs::path(home) / ".local/bin/claude");

    std::error_code ec;
    const auto      nvm = fs::path(home) / ".nvm/versions/node";
    if (fs::is_directory(nvm, ec)) {
      std::vector<fs::path> versions;
      for (const auto& entry : fs::directory_iterator(nvm, ec)) {
        versions.push_back(entry.path() / "bin/claude");
      }
      // newest node version first
      std::sort(versions.rbegin(), versions.rend());
      locations.insert(locations.end(), versions.begin(), versions.end());
    }
  }
  locations.emplace_back("/usr/local/bin/claude");
  return locations;
}

} // namespace

WorkerCommand::WorkerCommand(foreman::runtime::config::WorkerConfig config) : config_(std::move(config)) {
}

std::string WorkerCommand::ResolveExecutable() const {
  const auto from_env = Env("CLAUDE_PATH");
  if (!from_env.empty()) {
    if (auto found = Locate(from_env)) {
      return *found;
    }
    throw util::SpawnError("CLAUDE_PATH does not point to an executable: " + from_env);
  }

  if (!config_.executable().empty()) {
    if (auto found = Locate(config_.executable())) {
      return *found;
    }
    throw util::SpawnError("configured worker executable not found: " + config_.executable());
  }

  for (const auto& candidate : WellKnownLocations()) {
    if (IsExecutable(candidate)) {
      return candidate.string();
    }
  }
  if (auto found = SearchPath("claude")) {
    return *found;
  }
  throw util::SpawnError("worker executable 'claude' not found; set CLAUDE_PATH or workers.executable");
}

std::optional<std::string> WorkerCommand::ResolveModel(const std::string& requested) const {
  if (UsableModel(requested)) {
    return Trim(requested);
  }
  const auto from_env = Env("CLAUDE_CODE_MODEL");
  if (UsableModel(from_env)) {
    return Trim(from_env);
  }
  if (UsableModel(config_.model())) {
    return Trim(config_.model());
  }
  return std::nullopt;
}

std::vector<std::string> WorkerCommand::BuildArgs(const std::optional<std::string>& model) const {
  std::vector<std::string> args = {
      "-p", "--verbose", "--permission-mode", "bypassPermissions", "--input-format", "stream-json", "--output-format", "stream-json",
  };
  if (model) {
    args.push_back("--model");
    args.push_back(*model);
  }
  for (const auto& extra : config_.extra_args()) {
    args.push_back(extra);
  }
  return args;
}

std::map<std::string, std::string> WorkerCommand::BuildEnvironment(const std::string& agent_id) const {
  auto mode = Env("CLAUDE_CODE_API_KEY_MODE");
  if (mode.empty()) {
    mode = config_.api_key_mode().empty() ? "blocked" : config_.api_key_mode();
  }
  const bool blocked = Lower(Trim(mode)) == "blocked";

  std::map<std::string, std::string> env;
  for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
    const std::string pair(*entry);
    const auto        eq = pair.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    auto key = pair.substr(0, eq);
    if (blocked && std::find(std::begin(kBlockedEnvVars), std::end(kBlockedEnvVars), key) != std::end(kBlockedEnvVars)) {
      continue;
    }
    env[std::move(key)] = pair.substr(eq + 1);
  }
  env["CLAUDE_AGENT_ID"] = agent_id;
  return env;
}

LaunchSpec WorkerCommand::Build(const std::string& agent_id, const std::string& working_dir, const std::string& requested_model) const {
  LaunchSpec spec;
  spec.executable  = ResolveExecutable();
  spec.args        = BuildArgs(ResolveModel(requested_model));
  spec.working_dir = working_dir;
  spec.env         = BuildEnvironment(agent_id);
  return spec;
}

} // namespace foreman::supervisor
