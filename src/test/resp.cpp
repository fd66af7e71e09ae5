#include "catch2/catch_all.hpp"

#include <resp.hpp>

#include <limits>
#include <string>
#include <vector>

namespace {
using namespace std::literals;
namespace ns = memkv::resp;

ns::frame decoded(std::string_view s, ns::limits bounds = {}) {
  auto result = ns::decoder(bounds).decode(s);
  auto *c = std::get_if<ns::complete>(&result);
  REQUIRE(c);
  CHECK(c->consumed == s.size());
  return std::move(c->value);
}

std::string reason(std::string_view s, ns::limits bounds = {}) {
  const auto result = ns::decoder(bounds).decode(s);
  const auto *e = std::get_if<ns::protocol_error>(&result);
  REQUIRE(e);
  return e->reason;
}

bool incomplete(std::string_view s) {
  return std::holds_alternative<ns::incomplete>(ns::decoder().decode(s));
}

ns::frame nested(std::size_t depth) {
  auto f = ns::make_integer(1);
  for (std::size_t i = 0; i < depth; ++i)
    f = ns::make_array({std::move(f)});
  return f;
}

std::vector<ns::frame> samples() {
  const auto nan = std::numeric_limits<double>::quiet_NaN();
  const auto inf = std::numeric_limits<double>::infinity();
  return {
      ns::make_null(),
      ns::make_boolean(true),
      ns::make_boolean(false),
      ns::make_integer(0),
      ns::make_integer(std::numeric_limits<std::int64_t>::min()),
      ns::make_integer(std::numeric_limits<std::int64_t>::max()),
      ns::make_double(1.5),
      ns::make_double(-0.1),
      ns::make_double(1e300),
      ns::make_double(inf),
      ns::make_double(-inf),
      ns::make_double(nan),
      ns::make_simple_string("OK"),
      ns::make_simple_string(""),
      ns::make_error("ERR something went wrong"),
      ns::make_bulk_string(""),
      ns::make_bulk_string("binary\r\n\0safe"sv),
      ns::make_null_bulk_string(),
      ns::make_bulk_error("SYNTAX invalid syntax"),
      ns::make_array({}),
      ns::make_null_array(),
      ns::make_array({ns::make_bulk_string("SET"), ns::make_bulk_string("k"),
                      ns::make_bulk_string("v")}),
      ns::make_map({}),
      ns::make_map({{ns::make_bulk_string("f"), ns::make_integer(1)},
                    {ns::make_simple_string("g"),
                     ns::make_array({ns::make_null(), ns::make_double(2)})}}),
      ns::make_set({ns::make_bulk_string("a"), ns::make_bulk_string("b")}),
      nested(10),
  };
}

} // namespace

TEST_CASE("simple string") {
  CHECK(decoded("+hello world\r\n") == ns::make_simple_string("hello world"));
}

TEST_CASE("simple error") {
  CHECK(decoded("-ERR bad\r\n") == ns::make_error("ERR bad"));
}

TEST_CASE("integer") {
  CHECK(decoded(":12345\r\n") == ns::make_integer(12345));
  CHECK(decoded(":-12345\r\n") == ns::make_integer(-12345));
  CHECK(decoded(":+7\r\n") == ns::make_integer(7));
}

TEST_CASE("bulk string") {
  CHECK(decoded("$5\r\nabcde\r\n") == ns::make_bulk_string("abcde"));
  CHECK(decoded("$0\r\n\r\n") == ns::make_bulk_string(""));
  CHECK(decoded("$-1\r\n") == ns::make_null_bulk_string());
  CHECK(decoded("$4\r\na\r\nb\r\n") == ns::make_bulk_string("a\r\nb"));
}

TEST_CASE("array") {
  CHECK(decoded("*1\r\n*1\r\n+a string\r\n") ==
        ns::make_array({ns::make_array({ns::make_simple_string("a string")})}));
  CHECK(decoded("*0\r\n") == ns::make_array({}));
  CHECK(decoded("*-1\r\n") == ns::make_null_array());
}

TEST_CASE("resp3 scalars") {
  CHECK(decoded("_\r\n") == ns::make_null());
  CHECK(decoded("#t\r\n") == ns::make_boolean(true));
  CHECK(decoded("#f\r\n") == ns::make_boolean(false));
  CHECK(decoded(",3.25\r\n") == ns::make_double(3.25));
  CHECK(decoded(",+3.25\r\n") == ns::make_double(3.25));
  CHECK(decoded(",-inf\r\n") ==
        ns::make_double(-std::numeric_limits<double>::infinity()));
  CHECK(decoded("!5\r\noops!\r\n") == ns::make_bulk_error("oops!"));
}

TEST_CASE("resp3 aggregates") {
  CHECK(decoded("%1\r\n+k\r\n:1\r\n") ==
        ns::make_map({{ns::make_simple_string("k"), ns::make_integer(1)}}));
  CHECK(decoded("~2\r\n:1\r\n:2\r\n") ==
        ns::make_set({ns::make_integer(1), ns::make_integer(2)}));
}

TEST_CASE("decode stops after the first frame") {
  const auto s = "+one\r\n+two\r\n"s;
  auto result = ns::decoder().decode(s);
  auto *c = std::get_if<ns::complete>(&result);
  REQUIRE(c);
  CHECK(c->value == ns::make_simple_string("one"));
  CHECK(c->consumed == 6);
}

TEST_CASE("encoding") {
  CHECK(ns::encode(ns::make_null()) == "_\r\n");
  CHECK(ns::encode(ns::make_boolean(true)) == "#t\r\n");
  CHECK(ns::encode(ns::make_integer(-42)) == ":-42\r\n");
  CHECK(ns::encode(ns::make_double(1.5)) == ",1.5\r\n");
  CHECK(ns::encode(ns::make_double(std::numeric_limits<double>::infinity())) ==
        ",inf\r\n");
  CHECK(ns::encode(ns::make_double(std::numeric_limits<double>::quiet_NaN())) ==
        ",nan\r\n");
  CHECK(ns::encode(ns::make_simple_string("OK")) == "+OK\r\n");
  CHECK(ns::encode(ns::make_error("ERR x")) == "-ERR x\r\n");
  CHECK(ns::encode(ns::make_bulk_string("abc")) == "$3\r\nabc\r\n");
  CHECK(ns::encode(ns::make_null_bulk_string()) == "$-1\r\n");
  CHECK(ns::encode(ns::make_bulk_error("err")) == "!3\r\nerr\r\n");
  CHECK(ns::encode(ns::make_null_array()) == "*-1\r\n");
  CHECK(ns::encode(ns::make_array({ns::make_integer(1),
                                   ns::make_bulk_string("a")})) ==
        "*2\r\n:1\r\n$1\r\na\r\n");
  CHECK(ns::encode(ns::make_map(
            {{ns::make_bulk_string("f"), ns::make_bulk_string("v")}})) ==
        "%1\r\n$1\r\nf\r\n$1\r\nv\r\n");
  CHECK(ns::encode(ns::make_set({ns::make_integer(1)})) == "~1\r\n:1\r\n");
}

TEST_CASE("simple strings and errors stay on one line") {
  const auto error = ns::make_error("ERR a\r\n+OK");
  CHECK(ns::encode(error) == "-ERR a  +OK\r\n");
  CHECK(decoded(ns::encode(error)) == error);

  const auto status = ns::make_simple_string("\nOK\r");
  CHECK(ns::encode(status) == "+ OK \r\n");
  CHECK(decoded(ns::encode(status)) == status);
}

TEST_CASE("encode appends") {
  std::string out = "+first\r\n";
  ns::encode(ns::make_integer(2), out);
  CHECK(out == "+first\r\n:2\r\n");
}

TEST_CASE("decode undoes encode") {
  for (const auto &f : samples()) {
    CAPTURE(f);
    CHECK(decoded(ns::encode(f)) == f);
  }
}

TEST_CASE("every proper prefix is incomplete") {
  for (const auto &f : samples()) {
    const auto s = ns::encode(f);
    CAPTURE(f);
    for (std::size_t n = 0; n < s.size(); ++n) {
      CAPTURE(n);
      CHECK(incomplete(std::string_view(s).substr(0, n)));
    }
  }
}

TEST_CASE("deep nesting round trips within the limit") {
  const auto f = nested(1000);
  CHECK(decoded(ns::encode(f), {.max_depth = 1000}) == f);
}

TEST_CASE("protocol errors") {
  auto [input, expected] = GENERATE(table<std::string_view, std::string_view>({
      {"?x\r\n", "invalid type prefix"},
      {"$abc\r\n", "invalid length"},
      {"$-2\r\n", "invalid bulk length"},
      {"!-1\r\n", "invalid bulk length"},
      {"*-2\r\n", "invalid multibulk length"},
      {"%-1\r\n", "invalid multibulk length"},
      {"~-1\r\n", "invalid multibulk length"},
      {"$3\r\nabcd\r\n", "bulk string not terminated by CRLF"},
      {"$3\r\nabc\rx", "bulk string not terminated by CRLF"},
      {"+ok\rx", "carriage return without newline"},
      {"+ok\n", "newline without carriage return"},
      {":12a\r\n", "invalid integer"},
      {":\r\n", "invalid integer"},
      {"#x\r\n", "invalid boolean"},
      {"#tt\r\n", "invalid boolean"},
      {"_x\r\n", "invalid null"},
      {",abc\r\n", "invalid double"},
      {"*1\r\n?\r\n", "invalid type prefix"},
  }));

  CAPTURE(input);
  CHECK(reason(input) == expected);
}

TEST_CASE("malformed lengths fail before the line ends") {
  auto input = GENERATE("$12x"sv, "*1x"sv, ":1-"sv, "#x"sv, "_x"sv,
                        "$3\r\nabcX"sv, "$1\r\na\rX"sv);

  CAPTURE(input);
  CHECK(std::holds_alternative<ns::protocol_error>(ns::decoder().decode(input)));
}

TEST_CASE("limits") {
  SECTION("bulk length") {
    CHECK(reason("$6\r\n", {.max_bulk_length = 5}) == "invalid bulk length");
    CHECK(decoded("$5\r\nabcde\r\n", {.max_bulk_length = 5}) ==
          ns::make_bulk_string("abcde"));
  }

  SECTION("aggregate length") {
    CHECK(reason("*3\r\n", {.max_aggregate_length = 2}) ==
          "invalid multibulk length");
    CHECK(reason("%3\r\n", {.max_aggregate_length = 2}) ==
          "invalid multibulk length");
  }

  SECTION("nesting") {
    CHECK(decoded("*1\r\n*1\r\n:1\r\n", {.max_depth = 2}) == nested(2));
    CHECK(reason("*1\r\n*1\r\n*1\r\n:1\r\n", {.max_depth = 2}) ==
          "nesting too deep");
  }

  SECTION("inline length") {
    CHECK(decoded("+abcd\r\n", {.max_inline_length = 4}) ==
          ns::make_simple_string("abcd"));
    CHECK(reason("+abcde\r\n", {.max_inline_length = 4}) == "line too long");
    CHECK(reason("+abcde", {.max_inline_length = 4}) == "line too long");
  }
}

TEST_CASE("a huge declared length doesn't allocate up front") {
  const auto result = ns::decoder().decode("*1048576\r\n:1\r\n");
  CHECK(std::holds_alternative<ns::incomplete>(result));
}
