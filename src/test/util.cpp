#include "catch2/catch_all.hpp"

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>
#include <util.hpp>

namespace ns = memkv::util;
using namespace std::literals;

TEST_CASE("ci_hash") {
  ns::ci_hash h;
  CHECK(h("hello world"s) != 0);
  CHECK(h("hello world"s) == h("Hello World"sv));
  CHECK(h("hello world") == h("HellO WorlD"s));
  CHECK(h("hgetall"sv) != h("hget"sv));
}

TEST_CASE("ci_equal") {
  ns::ci_equal eq;
  CHECK(eq("hello world"sv, "Hello World"s));
  CHECK(eq("hello world\xff"sv, "Hello World\xff"s));
  CHECK_FALSE(eq("hello"sv, "hello "sv));
  CHECK_FALSE(eq("hello"sv, "hellp"sv));
}

TEST_CASE("cs_hash is case sensitive") {
  ns::cs_hash h;
  CHECK(h("key"sv) == h("key"s));
  CHECK(h("key"sv) != h("KEY"sv));
}

TEST_CASE("parse_int accepts") {
  auto [text, expected] = GENERATE(table<std::string_view, std::int64_t>({
      {"0", 0},
      {"42", 42},
      {"-42", -42},
      {"9223372036854775807", std::numeric_limits<std::int64_t>::max()},
      {"-9223372036854775808", std::numeric_limits<std::int64_t>::min()},
  }));

  CAPTURE(text);
  const auto result = ns::parse_int(text);
  REQUIRE(result);
  CHECK(*result == expected);
}

TEST_CASE("parse_int rejects") {
  auto text = GENERATE(""sv, "+"sv, "-"sv, "+-1"sv, "+42"sv, "1a"sv, " 1"sv,
                       "1 "sv, "1.0"sv, "9223372036854775808"sv);

  CAPTURE(text);
  CHECK_FALSE(ns::parse_int(text));
}

TEST_CASE("to_chars") {
  auto [buf, len] = ns::to_chars(std::numeric_limits<std::int64_t>::min());
  CHECK(std::string_view(buf.data(), len) == "-9223372036854775808");

  auto [buf2, len2] = ns::to_chars(std::size_t(0));
  CHECK(std::string_view(buf2.data(), len2) == "0");
}
