#include <localfn/scheduler/responses.hpp>

#include <json/json.h>

namespace localfn::scheduler {

  response_t failed_response(const std::string& reason, drogon::HttpStatusCode code)
  {
    Json::Value json;
    json["reason"] = reason;
    auto resp = drogon::HttpResponse::newHttpJsonResponse(json);
    resp->setStatusCode(code);
    return resp;
  }

  void ResponseRegistry::push(const std::string& request_id, callback_t&& callback)
  {
    rw_acc_t acc;
    _callbacks.insert(acc, request_id);
    acc->second = std::move(callback);
  }

  std::optional<callback_t> ResponseRegistry::pop(const std::string& request_id)
  {
    rw_acc_t acc;
    if (!_callbacks.find(acc, request_id)) {
      return std::nullopt;
    }

    callback_t callback = std::move(acc->second);
    _callbacks.erase(acc);
    return callback;
  }

  bool ResponseRegistry::resolve(const std::string& request_id, const response_t& response)
  {
    auto callback = pop(request_id);
    if (!callback.has_value()) {
      return false;
    }

    // Called without holding the accessor - the callback may take a while.
    if (*callback) {
      (*callback)(response);
    }
    return true;
  }

  std::vector<callback_t> ResponseRegistry::drain()
  {
    std::vector<std::string> requests;
    for (const auto& entry : _callbacks) {
      requests.push_back(entry.first);
    }

    std::vector<callback_t> result;
    for (const auto& request_id : requests) {
      auto callback = pop(request_id);
      if (callback.has_value()) {
        result.push_back(std::move(callback.value()));
      }
    }
    return result;
  }

  size_t ResponseRegistry::size() const
  {
    return _callbacks.size();
  }

} // namespace localfn::scheduler
