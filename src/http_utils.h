#ifndef HTTP_UTILS_H_
#define HTTP_UTILS_H_

/// Log HTTP requests

#include <chrono>
#include <string>
#include <utility>
#include <httplib.h>
#include <spdlog/spdlog.h>

#define ENUM_METHOD_ \
  X(GET, Get) \
  X(POST, Post)

namespace http_utils {

std::string FormatOneParam(const httplib::Params&);
// body, shortened
std::string FormatBody(const std::string&);

bool IsSuccess(int code);

} // namespace http_utils

#define X(name, func) \
struct HTTP##func { \
  constexpr static char method_name[] = #name; \
  template <class Handler> \
  void operator()(httplib::Server& svr, const std::string& pattern, Handler&& handler) { \
    svr.func(pattern, std::forward<Handler>(handler)); \
  } \
};
  ENUM_METHOD_
#undef X

// register a handler that logs the request and its outcome
template <class Method, class Handler>
void Route(httplib::Server& svr, const std::string& pattern, Handler handler) {
  Method()(svr, pattern, [pattern, handler](const httplib::Request& req, httplib::Response& res) {
    auto start = std::chrono::steady_clock::now();
    spdlog::debug("{} {} from {} params {} body {}", Method::method_name, pattern, req.remote_addr,
                  http_utils::FormatOneParam(req.params), http_utils::FormatBody(req.body));
    handler(req, res);
    auto dur = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    if (http_utils::IsSuccess(res.status)) {
      spdlog::info("{} {} {} {:.3f}s", Method::method_name, pattern, res.status, dur);
    } else {
      spdlog::warn("{} {} {} {:.3f}s", Method::method_name, pattern, res.status, dur);
    }
  });
}

#endif  // HTTP_UTILS_H_
