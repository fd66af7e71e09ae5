#ifndef MEMKV_SERVER_SERVER_HPP
#define MEMKV_SERVER_SERVER_HPP

#include "config.hpp"
#include "io.hpp"
#include "resp.hpp"
#include "store.hpp"

#include <atomic>
#include <cstdint>
#include <memory>

namespace memkv {

/**
 * Accepts clients on the configured address and serves each on its own
 * thread. The listening socket is bound on construction.
 */
class server {
public:
  server(const config &cfg, std::shared_ptr<store> db);

  server(const server &) = delete;
  server &operator=(const server &) = delete;

  /**
   * Accept connections until stop() is called.
   * @throws std::system_error if accepting fails for a reason other than a
   * client giving up
   */
  void run();

  /**
   * Make run() return. Connections already accepted carry on until their
   * clients hang up.
   */
  void stop();

  [[nodiscard]] std::uint16_t port() const noexcept { return port_; }

private:
  io::file_descriptor listen_fd_;
  std::uint16_t port_;
  std::shared_ptr<store> db_;
  resp::limits limits_;
  std::atomic<bool> stopping_{false};
};

} // namespace memkv

#endif // MEMKV_SERVER_SERVER_HPP
