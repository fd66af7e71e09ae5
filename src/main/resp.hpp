#ifndef MEMKV_SERVER_RESP_HPP
#define MEMKV_SERVER_RESP_HPP

#include "frame.hpp"

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

namespace memkv::resp {

class resp_error : public std::runtime_error {
public:
  using runtime_error::runtime_error;
};

struct limits {
  std::size_t max_depth = 128;
  std::int64_t max_bulk_length = 512 * 1024 * 1024;
  std::int64_t max_aggregate_length = 1024 * 1024;
  std::size_t max_inline_length = 64 * 1024;
};

/**
 * A whole frame was parsed from the first `consumed` bytes of the buffer.
 */
struct complete {
  frame value;
  std::size_t consumed;
};

/**
 * The buffer holds a well formed but truncated frame; retry once more bytes
 * have been appended.
 */
struct incomplete {};

/**
 * The buffer can never become a valid frame. Framing is lost, so the stream
 * should be closed.
 */
struct protocol_error {
  std::string reason;
};

using decode_result = std::variant<complete, incomplete, protocol_error>;

class decoder {
public:
  explicit decoder(limits bounds = {});

  /**
   * Parse one frame from the start of buffer. Nothing is retained between
   * calls: after incomplete the caller appends to the same buffer and calls
   * decode again, which re-parses from the beginning.
   */
  [[nodiscard]] decode_result decode(std::string_view buffer) const;

private:
  limits limits_;
};

/**
 * Append the wire representation of f to out.
 */
void encode(const frame &f, std::string &out);

[[nodiscard]] std::string encode(const frame &f);

} // namespace memkv::resp

#endif // MEMKV_SERVER_RESP_HPP
