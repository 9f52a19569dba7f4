#include "server_io.h"

#include <atomic>
#include <chrono>

#include <httplib.h>
#include <spdlog/spdlog.h>
#include <coderun/utils.h>

#include "http_utils.h"

std::string kHost = "0.0.0.0";
int kPort = 5000;

namespace {

std::atomic_bool stopping = false;
std::atomic<httplib::Server*> server = nullptr;

nlohmann::json ErrorBody(const std::string& msg) {
  return {{"error", msg}};
}

void SendJson(httplib::Response& res, int status, const nlohmann::json& body) {
  using nlohmann::json;
  res.status = status;
  // program output is already valid UTF-8; this only guards messages built from request text
  res.set_content(body.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
}

constexpr auto kCancelPollInterval = std::chrono::milliseconds(50);

} // namespace

CancelWatch::CancelWatch(std::function<bool()> client_gone) : cancel_(false), done_(false) {
  thread_ = std::thread([this, client_gone = std::move(client_gone)]() {
    std::unique_lock<std::mutex> lck(mtx_);
    while (!done_) {
      if (stopping || (client_gone && client_gone())) {
        spdlog::info("Client gone or server stopping, cancelling execution");
        cancel_ = true;
        return;
      }
      cv_.wait_for(lck, kCancelPollInterval, [this]{ return done_; });
    }
  });
}

CancelWatch::~CancelWatch() {
  {
    std::lock_guard<std::mutex> lck(mtx_);
    done_ = true;
  }
  cv_.notify_one();
  thread_.join();
}

Reply HandleRun(const Dispatcher& dispatcher, const std::string& body, const std::atomic_bool* cancel) {
  using nlohmann::json;
  json req = json::parse(body, nullptr, false);
  if (req.is_discarded() || !req.is_object()) return {400, ErrorBody("Invalid JSON body")};

  ExecutionRequest exec_req;
  // "code" as sent by the page, "source" for API clients
  auto code = req.find("code");
  if (code == req.end()) code = req.find("source");
  if (code == req.end() || !code->is_string()) return {400, ErrorBody("No code provided")};
  exec_req.source = code->get<std::string>();
  if (auto lang = req.find("language"); lang != req.end() && lang->is_string()) {
    exec_req.language = lang->get<std::string>();
  } else {
    exec_req.language = LanguageName(Language::PYTHON);
  }

  ExecutionResult res = dispatcher.Dispatch(exec_req, cancel);
  json ret{{res.is_error ? "error" : "output", res.text}, {"execution_time", res.execution_time}};
  return {res.kind == ResultKind::INPUT_ERROR ? 400 : 200, std::move(ret)};
}

nlohmann::json LanguageList() {
  nlohmann::json langs = nlohmann::json::array();
  for (int i = 0; i < kLanguageCount; i++) {
    Language lang = (Language)i;
    langs.push_back(nlohmann::json{
        {"id", LanguageName(lang)},
        {"name", LanguageDisplayName(lang)},
        {"extension", LanguageExtension(lang)}});
  }
  return {{"languages", std::move(langs)}};
}

nlohmann::json HealthStatus(const ExecutionLimiter& limiter) {
  return {{"status", "healthy"}, {"running", limiter.Running()}, {"queued", limiter.Waiting()}};
}

bool ServerWorkLoop(const Dispatcher& dispatcher, const ExecutionLimiter& limiter) {
  httplib::Server svr;
  auto run_handler = [&dispatcher](const httplib::Request& req, httplib::Response& res) {
    CancelWatch watch([&req]() {
      return req.is_connection_closed && req.is_connection_closed();
    });
    Reply reply = HandleRun(dispatcher, req.body, watch.Flag());
    SendJson(res, reply.status, reply.body);
  };
  Route<HTTPPost>(svr, "/run", run_handler);
  Route<HTTPPost>(svr, "/api/run", run_handler);
  Route<HTTPGet>(svr, "/api/languages", [](const httplib::Request&, httplib::Response& res) {
    SendJson(res, 200, LanguageList());
  });
  Route<HTTPGet>(svr, "/health", [&limiter](const httplib::Request&, httplib::Response& res) {
    SendJson(res, 200, HealthStatus(limiter));
  });

  if (!svr.bind_to_port(kHost, kPort)) {
    spdlog::error("Failed to bind {}:{}", kHost, kPort);
    return false;
  }
  server = &svr;
  if (stopping) {
    server = nullptr;
    return true;
  }
  spdlog::warn("Listening on {}:{}", kHost, kPort);
  bool ret = svr.listen_after_bind();
  server = nullptr;
  return ret;
}

void StopServer() {
  stopping = true;
  if (auto svr = server.load()) svr->stop();
}
