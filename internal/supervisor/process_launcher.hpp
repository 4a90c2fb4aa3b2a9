#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace foreman::supervisor {

struct LaunchSpec {
  std::string                        executable; // absolute path
  std::vector<std::string>           args;       // without argv[0]
  std::string                        working_dir;
  std::map<std::string, std::string> env;        // complete child environment
};

enum class OutputStream {
  kStdout,
  kStderr,
};

/*
  Handle to a running worker process.

  ReadLine on stdout and stderr may run on two different threads, and
  WriteLine / Terminate may run concurrently with both. Wait may be called
  from several threads; the exit status is reaped once and cached.
*/
class ChildProcess {
 public:
  virtual ~ChildProcess() = default;

  virtual int Pid() const = 0;

  // Blocks until a full line (without the newline) or EOF; nullopt at EOF.
  virtual std::optional<std::string> ReadLine(OutputStream stream) = 0;

  // false once the child's stdin is closed.
  virtual bool WriteLine(std::string_view line) = 0;
  virtual void CloseStdin()                     = 0;

  // SIGTERM to the process group, SIGKILL after `grace`. Reaps the child.
  virtual void Terminate(std::chrono::milliseconds grace) = 0;

  // Exit code, 128 + signal when killed by a signal.
  virtual int  Wait()          = 0;
  virtual bool Exited() const  = 0;
};

class ProcessLauncher {
 public:
  virtual ~ProcessLauncher() = default;

  // Throws util::SpawnError when the process cannot be started.
  virtual std::unique_ptr<ChildProcess> Launch(const LaunchSpec& spec) = 0;
};

} // namespace foreman::supervisor
