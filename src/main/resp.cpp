#include "resp.hpp"
#include "util.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <optional>
#include <vector>

namespace {

namespace ns = memkv::resp;
using memkv::util::overloaded;

constexpr std::string_view crlf = "\r\n";
constexpr char cr = '\r';
constexpr char lf = '\n';

// the longest well formed length or integer line, "-9223372036854775808"
constexpr std::size_t max_number_length = 20;

bool is_digit(char c) { return c >= '0' && c <= '9'; }

/**
 * Throw if the unterminated text received so far can never become a number.
 */
void check_number_prefix(std::string_view partial, bool allow_plus) {
  if (!partial.empty() && partial.back() == cr)
    partial.remove_suffix(1);
  if (partial.size() > max_number_length)
    throw ns::resp_error("invalid number");
  for (std::size_t i = 0; i < partial.size(); ++i) {
    const char c = partial[i];
    if (i == 0 && (c == '-' || (allow_plus && c == '+')))
      continue;
    if (!is_digit(c))
      throw ns::resp_error("invalid number");
  }
}

std::optional<double> parse_double(std::string_view s) {
  if (s.size() > 1 && s.front() == '+' && s[1] != '-')
    s.remove_prefix(1);
  double result{};
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), result);
  if (s.empty() || ec != std::errc() || ptr != s.data() + s.size())
    return {};
  return result;
}

struct pending_aggregate {
  char type;
  std::size_t expected;
  std::vector<ns::frame> children;

  ns::frame finish() && {
    switch (type) {
    case '%': {
      std::vector<std::pair<ns::frame, ns::frame>> entries;
      entries.reserve(children.size() / 2);
      for (std::size_t i = 0; i + 1 < children.size(); i += 2)
        entries.emplace_back(std::move(children[i]),
                             std::move(children[i + 1]));
      return ns::make_map(std::move(entries));
    }
    case '~':
      return ns::make_set(std::move(children));
    default:
      return ns::make_array(std::move(children));
    }
  }
};

/**
 * One attempt at parsing a frame from the start of a buffer. Aggregates are
 * tracked on an explicit stack so that adversarial nesting is bounded by
 * limits::max_depth rather than by the call stack.
 */
class decode_pass {
public:
  decode_pass(std::string_view buf, const ns::limits &limits)
      : buf_(buf), limits_(limits) {}

  ns::decode_result run() {
    for (;;) {
      switch (parse_header()) {
      case step::truncated:
        return ns::incomplete{};
      case step::nested:
        continue;
      case step::value:
        break;
      }

      for (;;) {
        if (stack_.empty())
          return ns::complete{std::move(value_), pos_};
        auto &top = stack_.back();
        top.children.push_back(std::move(value_));
        if (top.children.size() < top.expected)
          break;
        value_ = std::move(top).finish();
        stack_.pop_back();
      }
    }
  }

private:
  enum class step { value, nested, truncated };

  [[nodiscard]] std::string_view rest() const { return buf_.substr(pos_); }

  /**
   * Return the line starting at pos_ and advance past its CRLF, or nullopt
   * (leaving pos_ alone) if the CRLF hasn't arrived yet.
   */
  std::optional<std::string_view> line() {
    for (auto i = pos_; i < buf_.size(); ++i) {
      if (buf_[i] == lf)
        throw ns::resp_error("newline without carriage return");
      if (buf_[i] == cr) {
        if (i + 1 == buf_.size())
          return {};
        if (buf_[i + 1] != lf)
          throw ns::resp_error("carriage return without newline");
        const auto result = buf_.substr(pos_, i - pos_);
        pos_ = i + crlf.size();
        return result;
      }
      if (i - pos_ >= limits_.max_inline_length)
        throw ns::resp_error("line too long");
    }
    return {};
  }

  std::optional<std::int64_t> length() {
    const auto l = line();
    if (!l) {
      check_number_prefix(rest(), false);
      return {};
    }
    std::int64_t result{};
    auto [ptr, ec] = std::from_chars(l->data(), l->data() + l->size(), result);
    if (l->empty() || ec != std::errc() || ptr != l->data() + l->size())
      throw ns::resp_error("invalid length");
    return result;
  }

  step parse_header() {
    if (pos_ == buf_.size())
      return step::truncated;

    const char type = buf_[pos_++];

    switch (type) {
    case '+':
      if (const auto l = line()) {
        value_ = ns::make_simple_string(*l);
        return step::value;
      }
      return step::truncated;
    case '-':
      if (const auto l = line()) {
        value_ = ns::make_error(*l);
        return step::value;
      }
      return step::truncated;
    case ':':
      if (auto l = line()) {
        if (l->size() > 1 && l->front() == '+' && (*l)[1] != '-')
          l->remove_prefix(1);
        const auto i = memkv::util::parse_int(*l);
        if (!i)
          throw ns::resp_error("invalid integer");
        value_ = ns::make_integer(*i);
        return step::value;
      }
      check_number_prefix(rest(), true);
      return step::truncated;
    case '#':
      if (const auto l = line()) {
        if (*l == "t")
          value_ = ns::make_boolean(true);
        else if (*l == "f")
          value_ = ns::make_boolean(false);
        else
          throw ns::resp_error("invalid boolean");
        return step::value;
      }
      if (const auto r = rest();
          !r.empty() && r.front() != 't' && r.front() != 'f')
        throw ns::resp_error("invalid boolean");
      return step::truncated;
    case ',':
      if (const auto l = line()) {
        const auto d = parse_double(*l);
        if (!d)
          throw ns::resp_error("invalid double");
        value_ = ns::make_double(*d);
        return step::value;
      }
      return step::truncated;
    case '_':
      if (const auto l = line()) {
        if (!l->empty())
          throw ns::resp_error("invalid null");
        value_ = ns::make_null();
        return step::value;
      }
      if (const auto r = rest(); !r.empty() && r.front() != cr)
        throw ns::resp_error("invalid null");
      return step::truncated;
    case '$':
    case '!':
      return parse_bulk(type);
    case '*':
    case '%':
    case '~':
      return parse_aggregate(type);
    default:
      throw ns::resp_error("invalid type prefix");
    }
  }

  step parse_bulk(char type) {
    const auto len = length();
    if (!len)
      return step::truncated;

    if (*len == -1 && type == '$') {
      value_ = ns::make_null_bulk_string();
      return step::value;
    }

    if (*len < 0 || *len > limits_.max_bulk_length)
      throw ns::resp_error("invalid bulk length");

    const auto n = static_cast<std::size_t>(*len);
    const auto available = buf_.size() - pos_;

    // check whatever part of the terminator has already arrived
    if (available > n && buf_[pos_ + n] != cr)
      throw ns::resp_error("bulk string not terminated by CRLF");
    if (available > n + 1 && buf_[pos_ + n + 1] != lf)
      throw ns::resp_error("bulk string not terminated by CRLF");
    if (available < n + crlf.size())
      return step::truncated;

    const auto payload = buf_.substr(pos_, n);
    pos_ += n + crlf.size();
    value_ = type == '$' ? ns::make_bulk_string(payload)
                         : ns::make_bulk_error(payload);
    return step::value;
  }

  step parse_aggregate(char type) {
    const auto len = length();
    if (!len)
      return step::truncated;

    if (stack_.size() >= limits_.max_depth)
      throw ns::resp_error("nesting too deep");

    if (*len == -1 && type == '*') {
      value_ = ns::make_null_array();
      return step::value;
    }

    if (*len < 0 || *len > limits_.max_aggregate_length)
      throw ns::resp_error("invalid multibulk length");

    if (*len == 0) {
      value_ = pending_aggregate{type, 0, {}}.finish();
      return step::value;
    }

    const auto expected =
        static_cast<std::size_t>(*len) * (type == '%' ? 2 : 1);

    // every child takes at least three bytes, so don't trust the header
    // for more than the buffer could possibly hold
    std::vector<ns::frame> children;
    children.reserve(std::min(expected, (buf_.size() - pos_) / 3 + 1));
    stack_.push_back({type, expected, std::move(children)});
    return step::nested;
  }

  std::string_view buf_;
  const ns::limits &limits_;
  std::size_t pos_ = 0;
  std::vector<pending_aggregate> stack_;
  ns::frame value_;
};

void header(std::string &out, char type, std::size_t len) {
  auto [buf, n] = memkv::util::to_chars(len);
  out += type;
  out.append(buf.data(), n);
  out += crlf;
}

void line(std::string &out, char type, std::string_view text) {
  out += type;
  out += text;
  out += crlf;
}

void bulk(std::string &out, char type, std::string_view payload) {
  header(out, type, payload.size());
  out += payload;
  out += crlf;
}

void real(std::string &out, double d) {
  if (std::isnan(d))
    return line(out, ',', "nan");
  if (std::isinf(d))
    return line(out, ',', d < 0 ? "-inf" : "inf");
  std::array<char, 32> buf{};
  auto [ptr, ec] = std::to_chars(buf.begin(), buf.end(), d);
  if (ec != std::errc())
    throw std::logic_error("can't render a double");
  line(out, ',', std::string_view(buf.data(), ptr - buf.data()));
}

} // namespace

ns::decoder::decoder(limits bounds) : limits_(bounds) {}

ns::decode_result ns::decoder::decode(std::string_view buffer) const {
  try {
    return decode_pass(buffer, limits_).run();
  } catch (const resp_error &e) {
    return protocol_error{e.what()};
  }
}

void ns::encode(const frame &f, std::string &out) {
  // depth first, children pushed in reverse so they pop in order
  std::vector<const frame *> work{&f};

  while (!work.empty()) {
    const frame &current = *work.back();
    work.pop_back();

    std::visit(
        overloaded{
            [&](const null &) { line(out, '_', {}); },
            [&](bool b) { line(out, '#', b ? "t" : "f"); },
            [&](std::int64_t i) {
              auto [buf, len] = memkv::util::to_chars(i);
              line(out, ':', std::string_view(buf.data(), len));
            },
            [&](double d) { real(out, d); },
            [&](const simple_string &s) { line(out, '+', s.value); },
            [&](const simple_error &e) { line(out, '-', e.value); },
            [&](const bulk_string &s) {
              if (s.value)
                bulk(out, '$', *s.value);
              else
                line(out, '$', "-1");
            },
            [&](const bulk_error &e) { bulk(out, '!', e.value); },
            [&](const array &a) {
              if (!a.elements)
                return line(out, '*', "-1");
              header(out, '*', a.elements->size());
              for (auto i = a.elements->rbegin(); i != a.elements->rend(); ++i)
                work.push_back(&*i);
            },
            [&](const map &m) {
              header(out, '%', m.entries.size());
              for (auto i = m.entries.rbegin(); i != m.entries.rend(); ++i) {
                work.push_back(&i->second);
                work.push_back(&i->first);
              }
            },
            [&](const set &s) {
              header(out, '~', s.elements.size());
              for (auto i = s.elements.rbegin(); i != s.elements.rend(); ++i)
                work.push_back(&*i);
            },
        },
        current.value());
  }
}

std::string ns::encode(const frame &f) {
  std::string result;
  encode(f, result);
  return result;
}
