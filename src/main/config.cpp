#include "config.hpp"
#include "util.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <fstream>
#include <limits>
#include <utility>

const std::string_view memkv::usage =
    "Usage: memkv-server [/path/to/memkv.conf] [--directive value ...]\n"
    "\n"
    "Directives:\n"
    "  bind <address>                    IPv4 listen address (0.0.0.0)\n"
    "  port <port>                       TCP port, 0 for any (6379)\n"
    "  tcp-backlog <n>                   listen backlog (511)\n"
    "  loglevel <level>                  trace, debug, info, warn, error or "
    "off (info)\n"
    "  shards <n>                        store shards, a power of two (64)\n"
    "  proto-max-depth <n>               maximum aggregate nesting (128)\n"
    "  proto-max-bulk-len <bytes>        maximum bulk string length "
    "(536870912)\n"
    "  proto-max-multibulk-len <n>       maximum aggregate length (1048576)\n"
    "  proto-max-inline-len <bytes>      maximum simple line length (65536)\n"
    "\n"
    "Examples:\n"
    "  memkv-server\n"
    "  memkv-server /etc/memkv.conf --loglevel debug\n"
    "  memkv-server --port 7777\n";

namespace {

std::string_view trim(std::string_view s) {
  auto space = [](unsigned char c) { return std::isspace(c) != 0; };
  while (!s.empty() && space(s.front()))
    s.remove_prefix(1);
  while (!s.empty() && space(s.back()))
    s.remove_suffix(1);
  return s;
}

std::string lower(std::string_view s) {
  std::string result(s);
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return result;
}

template <typename Integer>
Integer number(std::string_view directive, std::string_view value,
               Integer min, Integer max = std::numeric_limits<Integer>::max()) {
  const auto result = memkv::util::parse_int<std::int64_t>(value);
  if (!result || *result < static_cast<std::int64_t>(min) ||
      static_cast<std::uint64_t>(*result) > static_cast<std::uint64_t>(max))
    throw memkv::config_error("invalid value '" + std::string(value) +
                              "' for " + std::string(directive));
  return static_cast<Integer>(*result);
}

spdlog::level::level_enum level(std::string_view value) {
  static constexpr std::array<std::pair<std::string_view,
                                        spdlog::level::level_enum>,
                              9>
      levels{{
          {"trace", spdlog::level::trace},
          {"debug", spdlog::level::debug},
          {"verbose", spdlog::level::debug},
          {"info", spdlog::level::info},
          {"notice", spdlog::level::info},
          {"warn", spdlog::level::warn},
          {"warning", spdlog::level::warn},
          {"error", spdlog::level::err},
          {"off", spdlog::level::off},
      }};

  const auto name = lower(value);
  for (const auto &[n, l] : levels)
    if (n == name)
      return l;
  throw memkv::config_error("invalid loglevel '" + std::string(value) + "'");
}

} // namespace

void memkv::config::apply(std::string_view directive, std::string_view value) {
  const auto name = lower(directive);

  if (name == "bind") {
    bind = value;
  } else if (name == "port") {
    port = number<std::uint16_t>(name, value, 0);
  } else if (name == "tcp-backlog") {
    tcp_backlog = number<int>(name, value, 1);
  } else if (name == "loglevel") {
    loglevel = level(value);
  } else if (name == "shards") {
    shards = number<std::size_t>(name, value, 1, std::size_t(1) << 16);
    if ((shards & (shards - 1)) != 0)
      throw config_error("shards must be a power of two");
  } else if (name == "proto-max-depth") {
    limits.max_depth = number<std::size_t>(name, value, 1);
  } else if (name == "proto-max-bulk-len") {
    limits.max_bulk_length = number<std::int64_t>(name, value, 1);
  } else if (name == "proto-max-multibulk-len") {
    limits.max_aggregate_length = number<std::int64_t>(name, value, 1);
  } else if (name == "proto-max-inline-len") {
    limits.max_inline_length = number<std::size_t>(name, value, 1);
  } else {
    throw config_error("unknown directive '" + std::string(directive) + "'");
  }
}

void memkv::config::load(std::istream &in, std::string_view source) {
  std::string text;
  for (std::size_t lineno = 1; std::getline(in, text); ++lineno) {
    std::string_view line = text;
    line = trim(line.substr(0, line.find('#')));
    if (line.empty())
      continue;

    const auto split = std::find_if(line.begin(), line.end(), [](char c) {
      return std::isspace(static_cast<unsigned char>(c)) != 0;
    });
    const auto directive = line.substr(0, split - line.begin());
    const auto value = trim(line.substr(directive.size()));

    try {
      if (value.empty())
        throw config_error("missing value for " + std::string(directive));
      apply(directive, value);
    } catch (const config_error &e) {
      throw config_error(std::string(source) + ":" + std::to_string(lineno) +
                         ": " + e.what());
    }
  }

  if (in.bad())
    throw config_error("can't read " + std::string(source));
}

void memkv::config::load_file(const std::string &path) {
  std::ifstream in(path);
  if (!in)
    throw config_error("can't open config file '" + path + "'");
  load(in, path);
}

std::optional<memkv::config> memkv::parse_args(int argc,
                                               const char *const argv[]) {
  config result;

  int i = 1;
  if (i < argc) {
    const std::string_view first = argv[i];
    if (first == "--help" || first == "-h")
      return {};
    if (!first.starts_with("--")) {
      result.load_file(argv[i]);
      ++i;
    }
  }

  for (; i < argc; ++i) {
    const std::string_view arg = argv[i];
    if (arg == "--help" || arg == "-h")
      return {};
    if (!arg.starts_with("--") || arg.size() == 2)
      throw config_error("unexpected argument '" + std::string(arg) + "'");
    if (i + 1 == argc)
      throw config_error("missing value for " + std::string(arg));
    result.apply(arg.substr(2), argv[++i]);
  }

  return result;
}
