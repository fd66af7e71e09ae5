#include "connection.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <variant>

memkv::connection::connection(io::file_descriptor fd, std::string peer,
                              std::shared_ptr<store> db, resp::limits limits)
    : fd_(std::move(fd)), peer_(std::move(peer)), decoder_(limits),
      handler_(std::move(db)) {}

void memkv::connection::run() noexcept {
  try {
    serve();
    spdlog::debug("connection from {} closed", peer_);
  } catch (const std::system_error &e) {
    spdlog::warn("connection from {} failed: {}", peer_, e.what());
  } catch (const std::exception &e) {
    spdlog::error("connection from {} aborted: {}", peer_, e.what());
  }
}

void memkv::connection::serve() {
  std::array<char, 1 << 14> chunk{};

  for (;;) {
    const auto n = io::read_some(fd_.value(), chunk.data(), chunk.size());
    if (n == 0)
      return;

    in_.append(chunk.data(), n);

    const bool healthy = process();

    if (!out_.empty()) {
      io::write_all(fd_.value(), out_);
      out_.clear();
    }

    if (!healthy)
      return;
  }
}

bool memkv::connection::process() {
  std::size_t offset = 0;

  for (;;) {
    auto result = decoder_.decode(std::string_view(in_).substr(offset));

    if (auto *c = std::get_if<resp::complete>(&result)) {
      offset += c->consumed;
      const bool tracing =
          spdlog::default_logger_raw()->should_log(spdlog::level::trace);
      if (tracing)
        spdlog::trace("{} -> {}", peer_, resp::to_string(c->value));
      const auto reply = handler_.execute(c->value);
      if (tracing)
        spdlog::trace("{} <- {}", peer_, resp::to_string(reply));
      resp::encode(reply, out_);
      continue;
    }

    if (auto *e = std::get_if<resp::protocol_error>(&result)) {
      spdlog::warn("protocol error from {}: {}", peer_, e->reason);
      resp::encode(resp::make_error("ERR Protocol error: " + e->reason), out_);
      in_.clear();
      return false;
    }

    break;
  }

  in_.erase(0, offset);
  return true;
}
