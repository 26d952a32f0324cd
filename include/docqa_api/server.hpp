#pragma once
#include <crow.h>
#include <crow/middlewares/cors.h>

#include <atomic>
#include <cstdint>
#include <future>
#include <string>

namespace docqa_api {

// Every response carries CORS headers so browser front-ends can call the API.
using App = crow::App<crow::CORSHandler>;

// Owns the Crow application and runs it on a background thread so the caller
// keeps the main thread for signal handling.
class Server {
 public:
  Server(const std::string &host, int port, unsigned int concurrency = 0);
  ~Server();

  // Disable move and copy operations since crow::App doesn't support them
  Server(const Server &) = delete;
  Server &operator=(const Server &) = delete;
  Server(Server &&) = delete;
  Server &operator=(Server &&) = delete;

  App &get_app() {
    return app_;
  }

  // Non-blocking; a bind failure surfaces from stop().
  void start();

  // Idempotent. Waits for in-flight requests to finish.
  void stop();

  bool is_running() const {
    return running_;
  }

  const std::string &host() const {
    return host_;
  }
  int port() const {
    return port_;
  }

 private:
  App app_;
  std::string host_;
  int port_;
  unsigned int concurrency_;  // 0 picks one worker per hardware thread
  std::future<void> server_thread_future_;
  std::atomic<bool> running_ = false;
};

}  // namespace docqa_api
