#ifndef SERVER_IO_H_
#define SERVER_IO_H_

#include <mutex>
#include <atomic>
#include <string>
#include <thread>
#include <functional>
#include <condition_variable>
#include <nlohmann/json.hpp>
#include <coderun/dispatcher.h>

extern std::string kHost;
extern int kPort;

struct Reply {
  int status;
  nlohmann::json body;
};

// Cancellation source of one request: set once the server stops or client_gone
//   returns true. client_gone is polled on a separate thread while the object lives.
class CancelWatch {
  std::atomic_bool cancel_;
  bool done_;
  std::mutex mtx_;
  std::condition_variable cv_;
  std::thread thread_;
 public:
  explicit CancelWatch(std::function<bool()> client_gone);
  CancelWatch(const CancelWatch&) = delete;
  CancelWatch& operator=(const CancelWatch&) = delete;
  ~CancelWatch();

  const std::atomic_bool* Flag() const { return &cancel_; }
};

// POST /run, /api/run
Reply HandleRun(const Dispatcher&, const std::string& body, const std::atomic_bool* cancel);
// GET /api/languages
nlohmann::json LanguageList();
// GET /health
nlohmann::json HealthStatus(const ExecutionLimiter&);

// Serve until StopServer is called; false if the address cannot be bound
bool ServerWorkLoop(const Dispatcher&, const ExecutionLimiter&);
// Cancel running executions and make ServerWorkLoop return
void StopServer();

#endif  // SERVER_IO_H_
