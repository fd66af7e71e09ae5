#include "io.hpp"

#include <array>
#include <stdexcept>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>

namespace ns = memkv::io;

ns::file_descriptor::file_descriptor(file_descriptor &&that) noexcept
    : value_(-1) {
  swap(*this, that);
}

ns::file_descriptor &
ns::file_descriptor::operator=(file_descriptor &&that) noexcept {
  reset();
  swap(*this, that);
  return *this;
}

int ns::file_descriptor::release() noexcept {
  return std::exchange(value_, -1);
}

void ns::file_descriptor::reset() noexcept {
  if (auto released = release(); released != -1)
    ::close(released);
}

ns::file_descriptor::~file_descriptor() noexcept { reset(); }

int ns::file_descriptor::value() const noexcept { return value_; }

void ns::swap(ns::file_descriptor &lhs, ns::file_descriptor &rhs) noexcept {
  using std::swap;
  swap(lhs.value_, rhs.value_);
}

namespace {

std::string to_string(const sockaddr_in &address) {
  std::array<char, INET_ADDRSTRLEN> buf{};
  if (!::inet_ntop(AF_INET, &address.sin_addr, buf.data(), buf.size()))
    throw std::system_error(errno, std::generic_category());
  return std::string(buf.data()) + ":" +
         std::to_string(ntohs(address.sin_port));
}

} // namespace

ns::file_descriptor ns::listen_tcp(const std::string &address,
                                   std::uint16_t port, int backlog) {
  sockaddr_in listen_address{
      .sin_family = AF_INET,
      .sin_port = htons(port),
  };

  if (::inet_pton(AF_INET, address.c_str(), &listen_address.sin_addr) != 1)
    throw std::invalid_argument("invalid IPv4 address '" + address + "'");

  file_descriptor sockfd(::socket, AF_INET, SOCK_STREAM, 0);

  set_socket_option(sockfd.value(), SOL_SOCKET, SO_REUSEADDR, 1);

  posix_call(::bind, sockfd.value(),
             reinterpret_cast<sockaddr *>(&listen_address),
             sizeof(listen_address));

  posix_call(::listen, sockfd.value(), backlog);

  return sockfd;
}

std::uint16_t ns::local_port(int fd) {
  sockaddr_in address{};
  socklen_t len = sizeof(address);
  posix_call(::getsockname, fd, reinterpret_cast<sockaddr *>(&address), &len);
  return ntohs(address.sin_port);
}

ns::accepted ns::accept(int listen_fd) {
  sockaddr_in address{};
  socklen_t len = sizeof(address);
  file_descriptor fd(::accept, listen_fd,
                     reinterpret_cast<sockaddr *>(&address), &len);
  set_socket_option(fd.value(), IPPROTO_TCP, TCP_NODELAY, 1);
  return {std::move(fd), to_string(address)};
}

std::size_t ns::read_some(int fd, char *buf, std::size_t len) {
  return static_cast<std::size_t>(posix_call(::read, fd, buf, len));
}

void ns::write_all(int fd, std::string_view data) {
  while (!data.empty()) {
    const auto n =
        posix_call(::send, fd, data.data(), data.size(), MSG_NOSIGNAL);
    data.remove_prefix(static_cast<std::size_t>(n));
  }
}
