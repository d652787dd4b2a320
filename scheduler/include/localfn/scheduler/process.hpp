#ifndef LOCALFN_SCHEDULER_PROCESS_HPP
#define LOCALFN_SCHEDULER_PROCESS_HPP

#include <localfn/scheduler/command.hpp>
#include <localfn/scheduler/metadata.hpp>

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <sys/types.h>

namespace localfn::scheduler {

  // Ordered set of environment variables; setting an existing variable
  // replaces its value in place.
  class Environment {
  public:
    // Copy of the environment of the current process.
    static Environment inherit();

    void set(const std::string& key, const std::string& value);

    void set(const env_t& vars);

    std::optional<std::string> get(const std::string& key) const;

    // Entries in the KEY=VALUE form expected by exec.
    std::vector<std::string> entries() const;

    size_t size() const
    {
      return _vars.size();
    }

  private:
    std::vector<std::pair<std::string, std::string>> _vars;
  };

  /**
   * @brief Owner of one forked child process.
   *
   * The child runs in its own process group so that killing it also stops
   * everything it started, e.g., the build tool and the function binary behind
   * a file watcher. A child that is still running when the object is destroyed
   * is killed.
   */
  class ChildProcess {
  public:
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;
    ChildProcess(ChildProcess&& obj) noexcept;
    ChildProcess& operator=(ChildProcess&& obj) noexcept;
    ~ChildProcess();

    /**
     * @brief Forks and executes the command.
     *
     * Failures of exec are reported back through a close-on-exec pipe, so a
     * missing executable is detected here and not as an early exit.
     *
     * @throws common::SpawnError if the process could not be started
     */
    static ChildProcess spawn(const Command& cmd, const Environment& env);

    pid_t pid() const
    {
      return _pid;
    }

    // Process descriptor; becomes readable when the child exits.
    int fd() const
    {
      return _pid_fd;
    }

    bool running() const
    {
      return _pid > 0 && !_status.has_value();
    }

    // Blocks until the child exits and reaps it; returns the wait status.
    int wait();

    // Sends SIGKILL to the whole process group and reaps the child.
    void kill();

    std::optional<int> status() const
    {
      return _status;
    }

    // Exit code, or the negated signal number if the child was killed.
    static int exit_code(int status);

  private:
    ChildProcess(pid_t pid, int pid_fd) : _pid(pid), _pid_fd(pid_fd) {}

    void _release();

    pid_t _pid{-1};

    int _pid_fd{-1};

    std::optional<int> _status;
  };

} // namespace localfn::scheduler

#endif
