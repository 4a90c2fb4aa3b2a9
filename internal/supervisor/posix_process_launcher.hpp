#pragma once

#include <sys/types.h>

#include <condition_variable>
#include <mutex>

#include "process_launcher.hpp"

namespace foreman::supervisor {

/*
  fork/execve launcher. The child gets its own session (and process group)
  so a stop takes down everything the worker started.
*/
class PosixProcessLauncher final : public ProcessLauncher {
 public:
  PosixProcessLauncher();

  std::unique_ptr<ChildProcess> Launch(const LaunchSpec& spec) override;
};

class PosixChildProcess final : public ChildProcess {
 public:
  PosixChildProcess(pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd);
  ~PosixChildProcess() override;

  PosixChildProcess(const PosixChildProcess&)            = delete;
  PosixChildProcess& operator=(const PosixChildProcess&) = delete;

  int Pid() const override {
    return static_cast<int>(pid_);
  }

  std::optional<std::string> ReadLine(OutputStream stream) override;
  bool                       WriteLine(std::string_view line) override;
  void                       CloseStdin() override;
  void                       Terminate(std::chrono::milliseconds grace) override;
  int                        Wait() override;
  bool                       Exited() const override;

 private:
  struct Reader {
    int         fd = -1;
    std::string buffer;
    bool        eof = false;
    std::mutex  mutex;
  };

  void RecordExit(int status);
  bool TryReap();

  pid_t pid_;

  std::mutex stdin_mutex_;
  int        stdin_fd_;

  Reader stdout_;
  Reader stderr_;

  mutable std::mutex      exit_mutex_;
  std::condition_variable exit_cv_;
  bool                    reaped_    = false;
  int                     exit_code_ = -1;
};

} // namespace foreman::supervisor
