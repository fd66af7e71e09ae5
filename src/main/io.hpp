#ifndef MEMKV_SERVER_IO_HPP
#define MEMKV_SERVER_IO_HPP

#include <cstdint>

#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace memkv::io {

/**
 * Call a posix style function under TEMP_FAILURE_RETRY and throw if there's an
 * error condition.
 * @throws std::system_error carrying errno
 */
template <typename Function, typename... Args>
inline auto posix_call(Function function, Args... args)
    -> decltype(function(std::forward<Args>(args)...)) {
  using result_t = decltype(function(std::forward<Args>(args)...));
  result_t result{};
  TEMP_FAILURE_RETRY(result = function(std::forward<Args>(args)...));
  if (result == (result_t)-1)
    throw std::system_error(errno, std::generic_category());
  return result;
}

/**
 * RAII wrapper around a file descriptor that calls ::close() on destruction.
 */
class file_descriptor {
  friend void swap(file_descriptor &, file_descriptor &) noexcept;

public:
  file_descriptor() noexcept : value_(-1) {}

  /**
   * Take ownership of the descriptor returned by function(args...).
   */
  template <typename Function, typename... Args>
  explicit file_descriptor(Function function, Args... args);

  file_descriptor(const file_descriptor &) = delete;
  file_descriptor &operator=(const file_descriptor &) = delete;
  file_descriptor(file_descriptor &&that) noexcept;
  file_descriptor &operator=(file_descriptor &&that) noexcept;

  int release() noexcept;
  void reset() noexcept;

  ~file_descriptor() noexcept;

  [[nodiscard]] int value() const noexcept;

  explicit operator bool() const noexcept { return value_ != -1; }

private:
  int value_;
};

void swap(file_descriptor &lhs, file_descriptor &rhs) noexcept;

template <typename T>
void set_socket_option(int fd, int level, int opt_name, T opt_val) {
  posix_call(::setsockopt, fd, level, opt_name, &opt_val, sizeof(opt_val));
}

/**
 * A blocking IPv4 socket bound to address:port and listening.
 * @throws std::system_error
 * @throws std::invalid_argument if address isn't a dotted quad
 */
file_descriptor listen_tcp(const std::string &address, std::uint16_t port,
                           int backlog);

/**
 * The port a socket is bound to, useful after binding port 0.
 */
std::uint16_t local_port(int fd);

struct accepted {
  file_descriptor fd;
  std::string peer;
};

/**
 * Block until a client connects.
 */
accepted accept(int listen_fd);

/**
 * Read whatever is available, blocking until something is.
 * @return 0 at end of stream
 */
std::size_t read_some(int fd, char *buf, std::size_t len);

/**
 * Write all of data, without raising SIGPIPE if the peer has gone.
 */
void write_all(int fd, std::string_view data);

} // namespace memkv::io

template <typename Function, typename... Args>
memkv::io::file_descriptor::file_descriptor(Function function, Args... args)
    : value_(posix_call(function, std::forward<Args>(args)...)) {}

#endif // MEMKV_SERVER_IO_HPP
