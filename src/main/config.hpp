#ifndef MEMKV_SERVER_CONFIG_HPP
#define MEMKV_SERVER_CONFIG_HPP

#include "resp.hpp"

#include <spdlog/common.h>

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace memkv {

class config_error : public std::runtime_error {
public:
  using runtime_error::runtime_error;
};

/**
 * Server settings, read once at startup from a redis.conf style file and the
 * command line.
 */
struct config {
  std::string bind = "0.0.0.0";
  std::uint16_t port = 6379;
  int tcp_backlog = 511;
  spdlog::level::level_enum loglevel = spdlog::level::info;
  std::size_t shards = 64;
  resp::limits limits;

  /**
   * Set one directive, e.g. apply("port", "7000").
   * @throws config_error for an unknown directive or a bad value
   */
  void apply(std::string_view directive, std::string_view value);

  /**
   * Apply every "directive value" line of in; source names it in errors.
   */
  void load(std::istream &in, std::string_view source);

  void load_file(const std::string &path);
};

/**
 * Build the configuration for
 * "memkv-server [config-file] [--directive value ...]".
 * @return nullopt if --help was asked for
 * @throws config_error
 */
std::optional<config> parse_args(int argc, const char *const argv[]);

extern const std::string_view usage;

} // namespace memkv

#endif // MEMKV_SERVER_CONFIG_HPP
