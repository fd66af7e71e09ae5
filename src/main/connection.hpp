#ifndef MEMKV_SERVER_CONNECTION_HPP
#define MEMKV_SERVER_CONNECTION_HPP

#include "command_handler.hpp"
#include "io.hpp"
#include "resp.hpp"
#include "store.hpp"

#include <memory>
#include <string>

namespace memkv {

/**
 * One client: reads requests off its socket, runs them and writes back the
 * replies in order, until the client hangs up or breaks the protocol.
 */
class connection {
public:
  connection(io::file_descriptor fd, std::string peer,
             std::shared_ptr<store> db, resp::limits limits);

  connection(const connection &) = delete;
  connection &operator=(const connection &) = delete;

  /**
   * Serve the client until the connection ends. Never throws.
   */
  void run() noexcept;

private:
  void serve();

  /**
   * Execute every complete request in the input buffer, appending replies to
   * the output buffer.
   * @return false if the client sent something undecodable
   */
  bool process();

  io::file_descriptor fd_;
  std::string peer_;
  resp::decoder decoder_;
  command_handler handler_;
  std::string in_;
  std::string out_;
};

} // namespace memkv

#endif // MEMKV_SERVER_CONNECTION_HPP
