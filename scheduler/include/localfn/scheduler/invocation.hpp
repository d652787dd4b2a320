#ifndef LOCALFN_SCHEDULER_INVOCATION_HPP
#define LOCALFN_SCHEDULER_INVOCATION_HPP

#include <chrono>
#include <functional>
#include <string>

#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <drogon/HttpTypes.h>

namespace localfn::scheduler {

  using request_t = drogon::HttpRequestPtr;
  using response_t = drogon::HttpResponsePtr;
  using callback_t = std::function<void(const drogon::HttpResponsePtr&)>;

  struct Invocation {

    std::string function_name;

    // Supplied by the HTTP layer, unique per invocation.
    std::string request_id;

    request_t request;

    // Single-use; the HTTP caller stays open until it is called.
    callback_t callback;

    std::chrono::high_resolution_clock::time_point start{
        std::chrono::high_resolution_clock::now()};
  };

  response_t failed_response(
      const std::string& reason, drogon::HttpStatusCode code = drogon::k500InternalServerError
  );

} // namespace localfn::scheduler

#endif
