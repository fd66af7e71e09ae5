#include "server.hpp"
#include "connection.hpp"

#include <spdlog/spdlog.h>

#include <thread>

memkv::server::server(const config &cfg, std::shared_ptr<store> db)
    : listen_fd_(io::listen_tcp(cfg.bind, cfg.port, cfg.tcp_backlog)),
      port_(io::local_port(listen_fd_.value())), db_(std::move(db)),
      limits_(cfg.limits) {
  spdlog::info("listening on {}:{}", cfg.bind, port_);
}

void memkv::server::run() {
  while (!stopping_) {
    io::accepted client;
    try {
      client = io::accept(listen_fd_.value());
    } catch (const std::system_error &e) {
      if (stopping_)
        break;
      if (e.code() == std::errc::connection_aborted) {
        spdlog::warn("accept: {}", e.what());
        continue;
      }
      throw;
    }

    spdlog::info("accepted connection from {}", client.peer);

    auto conn = std::make_unique<connection>(
        std::move(client.fd), std::move(client.peer), db_, limits_);
    std::thread([conn = std::move(conn)] { conn->run(); }).detach();
  }
}

void memkv::server::stop() {
  if (stopping_.exchange(true))
    return;
  // wakes a blocked accept() with EINVAL
  io::posix_call(::shutdown, listen_fd_.value(), SHUT_RDWR);
}
