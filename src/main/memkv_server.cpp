#include "config.hpp"
#include "server.hpp"
#include "store.hpp"

#include <spdlog/spdlog.h>

#include <iostream>
#include <memory>

#include <signal.h>

namespace {

void install_sig_handlers() {
  // a client hanging up mid reply must not kill the server
  struct sigaction sa {};
  sa.sa_handler = SIG_IGN;
  memkv::io::posix_call(::sigaction, SIGPIPE, &sa, nullptr);
}

} // namespace

int main(int argc, char *argv[]) {
  std::optional<memkv::config> cfg;
  try {
    cfg = memkv::parse_args(argc, argv);
  } catch (const memkv::config_error &e) {
    std::cerr << "memkv-server: " << e.what() << "\n\n" << memkv::usage;
    return 1;
  }

  if (!cfg) {
    std::cout << memkv::usage;
    return 0;
  }

  spdlog::set_level(cfg->loglevel);

  try {
    install_sig_handlers();
    memkv::server server(*cfg, std::make_shared<memkv::store>(cfg->shards));
    server.run();
  } catch (const std::exception &e) {
    spdlog::error("fatal: {}", e.what());
    return 1;
  }
}
