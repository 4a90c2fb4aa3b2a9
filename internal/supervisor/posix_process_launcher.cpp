#include "posix_process_launcher.hpp"

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <thread>

#include "internal/util/errors.hpp"

namespace foreman::supervisor {

namespace {

constexpr auto kReapPollInterval = std::chrono::milliseconds(20);
constexpr auto kReapWaitLimit    = std::chrono::seconds(5);

void CloseFd(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

class PipeSet {
 public:
  ~PipeSet() {
    for (auto& pipe : fds_) {
      CloseFd(pipe[0]);
      CloseFd(pipe[1]);
    }
  }

  void Open() {
    for (auto& pipe : fds_) {
      if (::pipe2(pipe, O_CLOEXEC) != 0) {
        throw util::SpawnError(std::string("pipe failed: ") + std::strerror(errno));
      }
    }
  }

  int& In(int end) {
    return fds_[0][end];
  }
  int& Out(int end) {
    return fds_[1][end];
  }
  int& Err(int end) {
    return fds_[2][end];
  }
  int& Exec(int end) {
    return fds_[3][end];
  }

 private:
  int fds_[4][2] = {{-1, -1}, {-1, -1}, {-1, -1}, {-1, -1}};
};

[[noreturn]] void ChildFail(int report_fd) {
  const int error = errno;
  [[maybe_unused]] auto written = ::write(report_fd, &error, sizeof(error));
  ::_exit(127);
}

int DecodeStatus(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

} // namespace

PosixProcessLauncher::PosixProcessLauncher() {
  // A worker that exits while we write its stdin must surface as EPIPE, not kill the daemon.
  ::signal(SIGPIPE, SIG_IGN);
}

std::unique_ptr<ChildProcess> PosixProcessLauncher::Launch(const LaunchSpec& spec) {
  std::vector<std::string> argv_storage;
  argv_storage.reserve(spec.args.size() + 1);
  argv_storage.push_back(spec.executable);
  argv_storage.insert(argv_storage.end(), spec.args.begin(), spec.args.end());

  std::vector<char*> argv;
  for (auto& arg : argv_storage) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);

  std::vector<std::string> env_storage;
  for (const auto& [key, value] : spec.env) {
    env_storage.push_back(key + "=" + value);
  }
  std::vector<char*> envp;
  for (auto& entry : env_storage) {
    envp.push_back(entry.data());
  }
  envp.push_back(nullptr);

  PipeSet pipes;
  pipes.Open();

  const pid_t pid = ::fork();
  if (pid < 0) {
    throw util::SpawnError(std::string("fork failed: ") + std::strerror(errno));
  }

  if (pid == 0) {
    ::setsid();
    ::signal(SIGPIPE, SIG_DFL);
    if (!spec.working_dir.empty() && ::chdir(spec.working_dir.c_str()) != 0) {
      ChildFail(pipes.Exec(1));
    }
    if (::dup2(pipes.In(0), STDIN_FILENO) < 0 || ::dup2(pipes.Out(1), STDOUT_FILENO) < 0 || ::dup2(pipes.Err(1), STDERR_FILENO) < 0) {
      ChildFail(pipes.Exec(1));
    }
    ::execve(spec.executable.c_str(), argv.data(), envp.data());
    ChildFail(pipes.Exec(1));
  }

  CloseFd(pipes.In(0));
  CloseFd(pipes.Out(1));
  CloseFd(pipes.Err(1));
  CloseFd(pipes.Exec(1));

  int     child_errno = 0;
  ssize_t n           = 0;
  do {
    n = ::read(pipes.Exec(0), &child_errno, sizeof(child_errno));
  } while (n < 0 && errno == EINTR);

  if (n == static_cast<ssize_t>(sizeof(child_errno))) {
    int status = 0;
    ::waitpid(pid, &status, 0);
    throw util::SpawnError("Failed to start " + spec.executable + ": " + std::strerror(child_errno));
  }

  auto child = std::make_unique<PosixChildProcess>(pid, pipes.In(1), pipes.Out(0), pipes.Err(0));
  pipes.In(1)  = -1;
  pipes.Out(0) = -1;
  pipes.Err(0) = -1;
  return child;
}

PosixChildProcess::PosixChildProcess(pid_t pid, int stdin_fd, int stdout_fd, int stderr_fd) : pid_(pid), stdin_fd_(stdin_fd) {
  stdout_.fd = stdout_fd;
  stderr_.fd = stderr_fd;
}

PosixChildProcess::~PosixChildProcess() {
  if (!Exited()) {
    Terminate(std::chrono::milliseconds(0));
  }
  CloseStdin();
  CloseFd(stdout_.fd);
  CloseFd(stderr_.fd);
}

std::optional<std::string> PosixChildProcess::ReadLine(OutputStream stream) {
  auto&           reader = stream == OutputStream::kStdout ? stdout_ : stderr_;
  std::lock_guard lock(reader.mutex);

  while (true) {
    const auto newline = reader.buffer.find('\n');
    if (newline != std::string::npos) {
      std::string line = reader.buffer.substr(0, newline);
      reader.buffer.erase(0, newline + 1);
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      return line;
    }

    if (reader.eof || reader.fd < 0) {
      if (reader.buffer.empty()) {
        return std::nullopt;
      }
      std::string rest;
      rest.swap(reader.buffer);
      return rest;
    }

    char          chunk[4096];
    const ssize_t n = ::read(reader.fd, chunk, sizeof(chunk));
    if (n > 0) {
      reader.buffer.append(chunk, static_cast<size_t>(n));
    } else if (n == 0 || errno != EINTR) {
      reader.eof = true;
    }
  }
}

bool PosixChildProcess::WriteLine(std::string_view line) {
  std::lock_guard lock(stdin_mutex_);
  if (stdin_fd_ < 0) {
    return false;
  }

  std::string data(line);
  data.push_back('\n');

  size_t offset = 0;
  while (offset < data.size()) {
    const ssize_t n = ::write(stdin_fd_, data.data() + offset, data.size() - offset);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    offset += static_cast<size_t>(n);
  }
  return true;
}

void PosixChildProcess::CloseStdin() {
  std::lock_guard lock(stdin_mutex_);
  CloseFd(stdin_fd_);
}

void PosixChildProcess::Terminate(std::chrono::milliseconds grace) {
  if (Exited()) {
    return;
  }

  ::kill(-pid_, SIGTERM);

  const auto deadline = std::chrono::steady_clock::now() + grace;
  while (std::chrono::steady_clock::now() < deadline) {
    if (TryReap()) {
      return;
    }
    std::this_thread::sleep_for(kReapPollInterval);
  }

  ::kill(-pid_, SIGKILL);
  ::kill(pid_, SIGKILL);
  Wait();
}

int PosixChildProcess::Wait() {
  {
    std::lock_guard lock(exit_mutex_);
    if (reaped_) {
      return exit_code_;
    }
  }

  int   status = 0;
  pid_t result = 0;
  do {
    result = ::waitpid(pid_, &status, 0);
  } while (result < 0 && errno == EINTR);

  if (result == pid_) {
    RecordExit(status);
  }

  // Another thread reaped first (ECHILD); wait for it to publish the status.
  std::unique_lock lock(exit_mutex_);
  if (!exit_cv_.wait_for(lock, kReapWaitLimit, [&] { return reaped_; })) {
    reaped_ = true;
  }
  return exit_code_;
}

bool PosixChildProcess::Exited() const {
  std::lock_guard lock(exit_mutex_);
  return reaped_;
}

void PosixChildProcess::RecordExit(int status) {
  {
    std::lock_guard lock(exit_mutex_);
    if (reaped_) {
      return;
    }
    reaped_    = true;
    exit_code_ = DecodeStatus(status);
  }
  exit_cv_.notify_all();
}

bool PosixChildProcess::TryReap() {
  if (Exited()) {
    return true;
  }
  int         status = 0;
  const pid_t result = ::waitpid(pid_, &status, WNOHANG);
  if (result == pid_) {
    RecordExit(status);
    return true;
  }
  if (result < 0 && errno == ECHILD) {
    // reaped by a concurrent Wait
    std::unique_lock lock(exit_mutex_);
    return exit_cv_.wait_for(lock, kReapPollInterval, [&] { return reaped_; });
  }
  return false;
}

} // namespace foreman::supervisor
