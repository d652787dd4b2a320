#ifndef LOCALFN_COMMON_TASKS_HPP
#define LOCALFN_COMMON_TASKS_HPP

#include <atomic>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <spdlog/spdlog.h>

namespace localfn::common {

  /**
   * @brief Runs long-lived tasks, each on its own thread.
   *
   * A task that throws is considered to have ended in error: the exception is
   * logged and does not affect other tasks. Threads of finished tasks are
   * joined lazily when a new task starts, and all remaining ones by `join_all`.
   */
  class TaskGroup {
  public:
    TaskGroup();

    ~TaskGroup()
    {
      join_all();
    }

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup(TaskGroup&&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;
    TaskGroup& operator=(TaskGroup&&) = delete;

    void start(std::string name, std::function<void()>&& func);

    void join_all();

    // Number of tasks that have not finished yet.
    int active() const;

  private:
    struct Task {
      std::string name;
      std::thread thread;
      std::atomic<bool> finished{false};
    };

    void _join_finished();

    mutable std::mutex _lock;

    std::list<std::unique_ptr<Task>> _tasks;

    std::shared_ptr<spdlog::logger> _logger;
  };

} // namespace localfn::common

#endif
