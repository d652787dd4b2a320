#include <localfn/common/tasks.hpp>

#include <localfn/common/util.hpp>

#include <exception>

namespace localfn::common {

  TaskGroup::TaskGroup()
  {
    _logger = util::create_logger("Tasks");
  }

  void TaskGroup::start(std::string name, std::function<void()>&& func)
  {
    std::lock_guard<std::mutex> lock(_lock);
    _join_finished();

    auto task = std::make_unique<Task>();
    Task* ptr = task.get();
    ptr->name = std::move(name);

    SPDLOG_LOGGER_DEBUG(_logger, "Starting task {}", ptr->name);

    // The thread may finish before it is stored in the list; it only touches
    // the task object, whose address is stable.
    ptr->thread = std::thread([this, ptr, func = std::move(func)]() mutable {
      try {
        func();
      } catch (const std::exception& exc) {
        _logger->error("Task {} ended with an error: {}", ptr->name, exc.what());
      }
      ptr->finished = true;
    });

    _tasks.push_back(std::move(task));
  }

  void TaskGroup::_join_finished()
  {
    for (auto it = _tasks.begin(); it != _tasks.end();) {
      if ((*it)->finished) {
        (*it)->thread.join();
        it = _tasks.erase(it);
      } else {
        ++it;
      }
    }
  }

  void TaskGroup::join_all()
  {
    // Tasks can be started while we join - repeat until nothing is left.
    while (true) {
      std::list<std::unique_ptr<Task>> tasks;
      {
        std::lock_guard<std::mutex> lock(_lock);
        tasks.swap(_tasks);
      }

      if (tasks.empty()) {
        break;
      }

      for (auto& task : tasks) {
        if (task->thread.joinable()) {
          task->thread.join();
        }
      }
    }
  }

  int TaskGroup::active() const
  {
    std::lock_guard<std::mutex> lock(_lock);
    int count = 0;
    for (const auto& task : _tasks) {
      if (!task->finished) {
        ++count;
      }
    }
    return count;
  }

} // namespace localfn::common
