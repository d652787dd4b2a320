#include <localfn/scheduler/process.hpp>

#include <localfn/common/exceptions.hpp>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

extern char** environ;

namespace localfn::scheduler {

  Environment Environment::inherit()
  {
    Environment env;
    for (char** var = environ; var && *var; ++var) {

      std::string_view entry{*var};
      auto pos = entry.find('=');
      if (pos == std::string_view::npos) {
        continue;
      }
      env.set(std::string{entry.substr(0, pos)}, std::string{entry.substr(pos + 1)});
    }
    return env;
  }

  void Environment::set(const std::string& key, const std::string& value)
  {
    auto it = std::find_if(_vars.begin(), _vars.end(), [&](const auto& var) {
      return var.first == key;
    });

    if (it != _vars.end()) {
      it->second = value;
    } else {
      _vars.emplace_back(key, value);
    }
  }

  void Environment::set(const env_t& vars)
  {
    for (const auto& [key, value] : vars) {
      set(key, value);
    }
  }

  std::optional<std::string> Environment::get(const std::string& key) const
  {
    auto it = std::find_if(_vars.begin(), _vars.end(), [&](const auto& var) {
      return var.first == key;
    });

    if (it == _vars.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  std::vector<std::string> Environment::entries() const
  {
    std::vector<std::string> result;
    result.reserve(_vars.size());
    for (const auto& [key, value] : _vars) {
      result.push_back(fmt::format("{}={}", key, value));
    }
    return result;
  }

  ChildProcess::ChildProcess(ChildProcess&& obj) noexcept
      : _pid(obj._pid), _pid_fd(obj._pid_fd), _status(obj._status)
  {
    obj._pid = -1;
    obj._pid_fd = -1;
    obj._status.reset();
  }

  ChildProcess& ChildProcess::operator=(ChildProcess&& obj) noexcept
  {
    if (this != &obj) {
      _release();

      _pid = obj._pid;
      _pid_fd = obj._pid_fd;
      _status = obj._status;

      obj._pid = -1;
      obj._pid_fd = -1;
      obj._status.reset();
    }
    return *this;
  }

  ChildProcess::~ChildProcess()
  {
    _release();
  }

  void ChildProcess::_release()
  {
    if (running()) {
      kill();
    }

    if (_pid_fd != -1) {
      close(_pid_fd);
      _pid_fd = -1;
    }
  }

  ChildProcess ChildProcess::spawn(const Command& cmd, const Environment& env)
  {
    if (cmd.args.empty()) {
      throw common::SpawnError{"Cannot spawn an empty command!"};
    }

    // Everything the child needs is prepared before fork - after fork, only
    // async-signal-safe calls are allowed.
    std::vector<char*> argv;
    for (const auto& arg : cmd.args) {
      argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<std::string> entries = env.entries();
    std::vector<char*> envp;
    for (const auto& entry : entries) {
      envp.push_back(const_cast<char*>(entry.c_str()));
    }
    envp.push_back(nullptr);

    int exec_pipe[2];
    if (pipe2(exec_pipe, O_CLOEXEC) == -1) {
      throw common::SpawnError{
          fmt::format("Could not create exec status pipe, reason: {}", strerror(errno))};
    }

    pid_t pid = fork();
    if (pid < 0) {
      int err = errno;
      close(exec_pipe[0]);
      close(exec_pipe[1]);
      throw common::SpawnError{
          fmt::format("Fork failed! {}, reason {} {}", pid, err, strerror(err))};
    }

    if (pid == 0) {

      close(exec_pipe[0]);
      setpgid(0, 0);

      execvpe(argv[0], argv.data(), envp.data());

      // Only reached if exec failed.
      int err = errno;
      [[maybe_unused]] auto ret = write(exec_pipe[1], &err, sizeof(err));
      _exit(127);
    }

    close(exec_pipe[1]);
    // Both parent and child set the group to avoid racing with an early kill.
    setpgid(pid, pid);

    int exec_errno = 0;
    ssize_t bytes = 0;
    do {
      bytes = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (bytes == -1 && errno == EINTR);
    close(exec_pipe[0]);

    if (bytes == sizeof(exec_errno)) {
      int status{};
      waitpid(pid, &status, 0);
      throw common::SpawnError{fmt::format(
          "Could not execute {}, reason: {} {}", cmd.args[0], exec_errno, strerror(exec_errno)
      )};
    }

    int pid_fd = static_cast<int>(syscall(SYS_pidfd_open, pid, 0));
    if (pid_fd == -1) {
      int err = errno;
      ::kill(-pid, SIGKILL);
      int status{};
      waitpid(pid, &status, 0);
      throw common::SpawnError{
          fmt::format("Could not open a descriptor of process {}, reason: {}", pid, strerror(err))};
    }

    SPDLOG_DEBUG("Started process {} with PID {}", cmd.args[0], pid);

    return ChildProcess{pid, pid_fd};
  }

  int ChildProcess::wait()
  {
    if (_status.has_value()) {
      return _status.value();
    }

    int status{};
    pid_t ret = 0;
    do {
      ret = waitpid(_pid, &status, 0);
    } while (ret == -1 && errno == EINTR);

    if (ret == -1) {
      spdlog::error("Waiting for process {} failed, reason: {}", _pid, strerror(errno));
      // The child is gone, there is nothing more to wait for.
      status = 0;
    }

    _status = status;
    return status;
  }

  void ChildProcess::kill()
  {
    if (!running()) {
      return;
    }

    if (::kill(-_pid, SIGKILL) == -1) {
      ::kill(_pid, SIGKILL);
    }
    wait();
  }

  int ChildProcess::exit_code(int status)
  {
    if (WIFEXITED(status)) {
      return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
      return -WTERMSIG(status);
    }
    return 0;
  }

} // namespace localfn::scheduler
