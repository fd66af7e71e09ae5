#include "catch2/catch_all.hpp"

#include <config.hpp>

#include <sstream>
#include <vector>

namespace {

std::optional<memkv::config> parse(std::vector<const char *> args) {
  args.insert(args.begin(), "memkv-server");
  return memkv::parse_args(static_cast<int>(args.size()), args.data());
}

} // namespace

TEST_CASE("defaults") {
  const auto cfg = parse({});
  REQUIRE(cfg);
  CHECK(cfg->bind == "0.0.0.0");
  CHECK(cfg->port == 6379);
  CHECK(cfg->tcp_backlog == 511);
  CHECK(cfg->loglevel == spdlog::level::info);
  CHECK(cfg->shards == 64);
  CHECK(cfg->limits.max_depth == 128);
  CHECK(cfg->limits.max_bulk_length == 536870912);
  CHECK(cfg->limits.max_aggregate_length == 1048576);
  CHECK(cfg->limits.max_inline_length == 65536);
}

TEST_CASE("command line directives") {
  const auto cfg = parse({"--port", "7000", "--bind", "127.0.0.1",
                          "--loglevel", "debug", "--shards", "16",
                          "--proto-max-bulk-len", "1024"});
  REQUIRE(cfg);
  CHECK(cfg->port == 7000);
  CHECK(cfg->bind == "127.0.0.1");
  CHECK(cfg->loglevel == spdlog::level::debug);
  CHECK(cfg->shards == 16);
  CHECK(cfg->limits.max_bulk_length == 1024);
}

TEST_CASE("help") {
  CHECK_FALSE(parse({"--help"}));
  CHECK_FALSE(parse({"--port", "1", "-h"}));
}

TEST_CASE("bad command lines") {
  CHECK_THROWS_AS(parse({"--port"}), memkv::config_error);
  CHECK_THROWS_AS(parse({"--port", "65536"}), memkv::config_error);
  CHECK_THROWS_AS(parse({"--port", "-1"}), memkv::config_error);
  CHECK_THROWS_AS(parse({"--nonsense", "1"}), memkv::config_error);
  CHECK_THROWS_AS(parse({"--port", "1", "stray"}), memkv::config_error);
  CHECK_THROWS_AS(parse({"/no/such/memkv.conf"}), memkv::config_error);
}

TEST_CASE("loglevel names") {
  auto [name, expected] =
      GENERATE(table<const char *, spdlog::level::level_enum>({
          {"trace", spdlog::level::trace},
          {"debug", spdlog::level::debug},
          {"verbose", spdlog::level::debug},
          {"info", spdlog::level::info},
          {"notice", spdlog::level::info},
          {"warn", spdlog::level::warn},
          {"WARNING", spdlog::level::warn},
          {"error", spdlog::level::err},
          {"off", spdlog::level::off},
      }));

  memkv::config cfg;
  cfg.apply("loglevel", name);
  CHECK(cfg.loglevel == expected);
}

TEST_CASE("out of range values") {
  memkv::config cfg;
  CHECK_THROWS_AS(cfg.apply("loglevel", "chatty"), memkv::config_error);
  CHECK_THROWS_AS(cfg.apply("shards", "3"), memkv::config_error);
  CHECK_THROWS_AS(cfg.apply("shards", "0"), memkv::config_error);
  CHECK_THROWS_AS(cfg.apply("tcp-backlog", "0"), memkv::config_error);
  CHECK_THROWS_AS(cfg.apply("proto-max-depth", "0"), memkv::config_error);
  CHECK_THROWS_AS(cfg.apply("proto-max-inline-len", "x"), memkv::config_error);
  CHECK(cfg.shards == 64);
}

TEST_CASE("port 0 is allowed") {
  memkv::config cfg;
  cfg.apply("PORT", "0");
  CHECK(cfg.port == 0);
}

TEST_CASE("config file") {
  std::istringstream in("# memkv.conf\n"
                        "\n"
                        "port 6380   # not the default\n"
                        "  bind   127.0.0.1\n"
                        "proto-max-depth 16\n"
                        "proto-max-multibulk-len 100\n"
                        "proto-max-inline-len 1000\n");
  memkv::config cfg;
  cfg.load(in, "memkv.conf");
  CHECK(cfg.port == 6380);
  CHECK(cfg.bind == "127.0.0.1");
  CHECK(cfg.limits.max_depth == 16);
  CHECK(cfg.limits.max_aggregate_length == 100);
  CHECK(cfg.limits.max_inline_length == 1000);
}

TEST_CASE("config file errors name the line") {
  SECTION("unknown directive") {
    std::istringstream in("port 6380\nsave 900 1\n");
    memkv::config cfg;
    CHECK_THROWS_WITH(cfg.load(in, "memkv.conf"),
                      "memkv.conf:2: unknown directive 'save'");
  }

  SECTION("missing value") {
    std::istringstream in("\n\nport\n");
    memkv::config cfg;
    CHECK_THROWS_WITH(cfg.load(in, "memkv.conf"),
                      "memkv.conf:3: missing value for port");
  }

  SECTION("bad number") {
    std::istringstream in("tcp-backlog lots\n");
    memkv::config cfg;
    CHECK_THROWS_WITH(cfg.load(in, "memkv.conf"),
                      "memkv.conf:1: invalid value 'lots' for tcp-backlog");
  }
}
