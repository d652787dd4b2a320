#include <localfn/scheduler/requests.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace localfn::scheduler {

  void InvocationQueue::push(Invocation&& invocation)
  {
    std::lock_guard<std::mutex> lock(_lock);
    _invocations.push_back(std::move(invocation));
  }

  std::optional<Invocation> InvocationQueue::pop()
  {
    std::lock_guard<std::mutex> lock(_lock);
    if (_invocations.empty()) {
      return std::nullopt;
    }

    Invocation invoc = std::move(_invocations.front());
    _invocations.pop_front();
    return invoc;
  }

  std::vector<Invocation> InvocationQueue::drain()
  {
    std::lock_guard<std::mutex> lock(_lock);

    std::vector<Invocation> result;
    result.reserve(_invocations.size());
    for (auto& invoc : _invocations) {
      result.push_back(std::move(invoc));
    }
    _invocations.clear();

    return result;
  }

  size_t InvocationQueue::size() const
  {
    std::lock_guard<std::mutex> lock(_lock);
    return _invocations.size();
  }

  std::string InvocationRegistry::runtime_api(const std::string& function_name) const
  {
    return fmt::format("{}/{}", _server_address, function_name);
  }

  std::optional<NewFunction> InvocationRegistry::upsert(Invocation&& invocation)
  {
    std::string name = invocation.function_name;

    rw_acc_t acc;
    bool inserted = false;
    if (!_queues.find(acc, name)) {
      // The queue is allocated before the entry becomes visible, so an entry
      // never holds an empty pointer. Insertion returns true only for the
      // caller that created the entry; a racing caller sees the existing queue.
      inserted = _queues.insert(acc, {name, std::make_shared<InvocationQueue>()});
    }
    acc->second->push(std::move(invocation));

    if (inserted) {
      SPDLOG_DEBUG("New function {}, queued invocation", name);
      return NewFunction{name, runtime_api(name)};
    }
    return std::nullopt;
  }

  std::optional<NewFunction> InvocationRegistry::reserve(const std::string& function_name)
  {
    rw_acc_t acc;
    if (_queues.find(acc, function_name)) {
      return std::nullopt;
    }

    if (!_queues.insert(acc, {function_name, std::make_shared<InvocationQueue>()})) {
      return std::nullopt;
    }
    return NewFunction{function_name, runtime_api(function_name)};
  }

  std::optional<Invocation> InvocationRegistry::pop(const std::string& function_name)
  {
    rw_acc_t acc;
    if (!_queues.find(acc, function_name)) {
      return std::nullopt;
    }

    return acc->second->pop();
  }

  std::vector<Invocation> InvocationRegistry::clean(const std::string& function_name)
  {
    rw_acc_t acc;
    if (!_queues.find(acc, function_name)) {
      return {};
    }

    std::vector<Invocation> leftovers = acc->second->drain();
    _queues.erase(acc);

    return leftovers;
  }

  std::vector<Invocation> InvocationRegistry::drain()
  {
    std::vector<std::string> functions;
    for (const auto& entry : _queues) {
      functions.push_back(entry.first);
    }

    std::vector<Invocation> result;
    for (const auto& function : functions) {
      for (auto& invoc : clean(function)) {
        result.push_back(std::move(invoc));
      }
    }
    return result;
  }

  bool InvocationRegistry::contains(const std::string& function_name) const
  {
    return _queues.count(function_name) > 0;
  }

  size_t InvocationRegistry::size() const
  {
    return _queues.size();
  }

} // namespace localfn::scheduler
