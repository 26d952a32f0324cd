#include "docqa_api/server.hpp"

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace docqa_api {

Server::Server(const std::string &host, int port, unsigned int concurrency)
    : host_(host), port_(port), concurrency_(concurrency) {
  if (port_ <= 0 || port_ > UINT16_MAX) {
    throw std::invalid_argument("Invalid port: " + std::to_string(port_));
  }
  if (concurrency_ == 0) {
    concurrency_ = std::max(1u, std::thread::hardware_concurrency());
  }

  // Any origin, method and header.
  app_.get_middleware<crow::CORSHandler>()
      .global()
      .origin("*")
      .methods(crow::HTTPMethod::GET, crow::HTTPMethod::POST, crow::HTTPMethod::OPTIONS)
      .headers("*");
}

Server::~Server() {
  stop();
}

void Server::start() {
  if (running_) {
    return;
  }
  app_.port(static_cast<std::uint16_t>(port_)).bindaddr(host_).concurrency(concurrency_);
  server_thread_future_ = std::async(std::launch::async, [this] { app_.run(); });
  running_ = true;
  std::cout << "Listening on " << host_ << ":" << port_ << " with " << concurrency_ << " threads"
            << std::endl;
}

void Server::stop() {
  if (!running_.exchange(false)) {
    return;
  }
  app_.stop();

  if (server_thread_future_.valid()) {
    try {
      server_thread_future_.get();
    } catch (const std::exception &e) {
      std::cerr << "Server thread exited with error: " << e.what() << std::endl;
    }
  }
}

}  // namespace docqa_api
