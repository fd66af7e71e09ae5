#include "frame.hpp"
#include "util.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <ostream>

namespace memkv::resp {
namespace {

using util::overloaded;

// simple strings and errors are terminated by the first CR or LF
std::string single_line(std::string_view value) {
  std::string result(value);
  std::replace_if(
      result.begin(), result.end(),
      [](char c) { return c == '\r' || c == '\n'; }, ' ');
  return result;
}

std::weak_ordering compare(const null &, const null &) {
  return std::weak_ordering::equivalent;
}

std::weak_ordering compare(bool lhs, bool rhs) { return lhs <=> rhs; }

std::weak_ordering compare(std::int64_t lhs, std::int64_t rhs) {
  return lhs <=> rhs;
}

// NaN is equivalent to NaN and sorts after every other value, so that a
// decoded ",nan\r\n" equals the frame it was encoded from.
std::weak_ordering compare(double lhs, double rhs) {
  const bool lhs_nan = std::isnan(lhs);
  const bool rhs_nan = std::isnan(rhs);
  if (lhs_nan || rhs_nan)
    return lhs_nan <=> rhs_nan;
  if (lhs < rhs)
    return std::weak_ordering::less;
  if (rhs < lhs)
    return std::weak_ordering::greater;
  return std::weak_ordering::equivalent;
}

std::weak_ordering compare(const std::string &lhs, const std::string &rhs) {
  return std::string_view(lhs) <=> std::string_view(rhs);
}

std::weak_ordering compare(const std::vector<frame> &lhs,
                           const std::vector<frame> &rhs) {
  return std::lexicographical_compare_three_way(lhs.begin(), lhs.end(),
                                                rhs.begin(), rhs.end());
}

std::weak_ordering compare(const std::vector<std::pair<frame, frame>> &lhs,
                           const std::vector<std::pair<frame, frame>> &rhs) {
  return std::lexicographical_compare_three_way(
      lhs.begin(), lhs.end(), rhs.begin(), rhs.end(),
      [](const auto &l, const auto &r) -> std::weak_ordering {
        if (auto c = l.first <=> r.first; c != 0)
          return c;
        return l.second <=> r.second;
      });
}

template <typename T>
std::weak_ordering compare(const std::optional<T> &lhs,
                           const std::optional<T> &rhs) {
  if (lhs && rhs)
    return compare(*lhs, *rhs);
  return bool(lhs) <=> bool(rhs);
}

std::weak_ordering compare(const simple_string &lhs, const simple_string &rhs) {
  return compare(lhs.value, rhs.value);
}

std::weak_ordering compare(const simple_error &lhs, const simple_error &rhs) {
  return compare(lhs.value, rhs.value);
}

std::weak_ordering compare(const bulk_string &lhs, const bulk_string &rhs) {
  return compare(lhs.value, rhs.value);
}

std::weak_ordering compare(const bulk_error &lhs, const bulk_error &rhs) {
  return compare(lhs.value, rhs.value);
}

std::weak_ordering compare(const array &lhs, const array &rhs) {
  return compare(lhs.elements, rhs.elements);
}

std::weak_ordering compare(const map &lhs, const map &rhs) {
  return compare(lhs.entries, rhs.entries);
}

std::weak_ordering compare(const set &lhs, const set &rhs) {
  return compare(lhs.elements, rhs.elements);
}

void quote(std::string &out, std::string_view s) {
  constexpr std::string_view hex = "0123456789abcdef";
  out += '"';
  for (const unsigned char c : s) {
    if (c == '"' || c == '\\') {
      out += '\\';
      out += static_cast<char>(c);
    } else if (c >= 0x20 && c < 0x7f) {
      out += static_cast<char>(c);
    } else {
      out += "\\x";
      out += hex[c >> 4];
      out += hex[c & 0xf];
    }
  }
  out += '"';
}

void render(std::string &out, const frame &f);

void render(std::string &out, const std::vector<frame> &elements) {
  for (std::size_t i = 0; i < elements.size(); ++i) {
    if (i)
      out += ", ";
    render(out, elements[i]);
  }
}

void render(std::string &out, const frame &f) {
  std::visit(
      overloaded{
          [&](const null &) { out += "(null)"; },
          [&](bool b) { out += b ? "true" : "false"; },
          [&](std::int64_t i) {
            auto [buf, len] = util::to_chars(i);
            out.append(buf.data(), len);
          },
          [&](double d) {
            std::array<char, 32> buf{};
            auto [ptr, ec] = std::to_chars(buf.begin(), buf.end(), d);
            out.append(buf.begin(), ptr);
          },
          [&](const simple_string &s) {
            out += '+';
            out += s.value;
          },
          [&](const simple_error &e) {
            out += '-';
            out += e.value;
          },
          [&](const bulk_string &s) {
            if (s.value)
              quote(out, *s.value);
            else
              out += "(nil)";
          },
          [&](const bulk_error &e) {
            out += '!';
            quote(out, e.value);
          },
          [&](const array &a) {
            if (!a.elements) {
              out += "(nil array)";
              return;
            }
            out += '[';
            render(out, *a.elements);
            out += ']';
          },
          [&](const map &m) {
            out += '{';
            for (std::size_t i = 0; i < m.entries.size(); ++i) {
              if (i)
                out += ", ";
              render(out, m.entries[i].first);
              out += ": ";
              render(out, m.entries[i].second);
            }
            out += '}';
          },
          [&](const set &s) {
            out += "~{";
            render(out, s.elements);
            out += '}';
          },
      },
      f.value());
}

} // namespace

std::weak_ordering operator<=>(const frame &lhs, const frame &rhs) {
  if (auto c = lhs.value_.index() <=> rhs.value_.index(); c != 0)
    return c;
  return std::visit(
      [&rhs](const auto &l) -> std::weak_ordering {
        using T = std::decay_t<decltype(l)>;
        return compare(l, std::get<T>(rhs.value_));
      },
      lhs.value_);
}

bool operator==(const frame &lhs, const frame &rhs) {
  return (lhs <=> rhs) == 0;
}

std::string_view frame::type_name() const noexcept {
  return std::visit(overloaded{
                        [](const null &) { return "null"; },
                        [](bool) { return "boolean"; },
                        [](std::int64_t) { return "integer"; },
                        [](double) { return "double"; },
                        [](const simple_string &) { return "simple string"; },
                        [](const simple_error &) { return "simple error"; },
                        [](const bulk_string &) { return "bulk string"; },
                        [](const bulk_error &) { return "bulk error"; },
                        [](const array &) { return "array"; },
                        [](const map &) { return "map"; },
                        [](const set &) { return "set"; },
                    },
                    value_);
}

frame make_null() { return frame(); }

frame make_boolean(bool value) {
  return frame(std::in_place_type<bool>, value);
}

frame make_integer(std::int64_t value) {
  return frame(std::in_place_type<std::int64_t>, value);
}

frame make_double(double value) {
  return frame(std::in_place_type<double>, value);
}

frame make_simple_string(std::string_view value) {
  return frame(std::in_place_type<simple_string>,
               simple_string{single_line(value)});
}

frame make_error(std::string_view value) {
  return frame(std::in_place_type<simple_error>,
               simple_error{single_line(value)});
}

frame make_bulk_string(std::string_view value) {
  return frame(std::in_place_type<bulk_string>,
               bulk_string{std::string(value)});
}

frame make_null_bulk_string() {
  return frame(std::in_place_type<bulk_string>, bulk_string{std::nullopt});
}

frame make_bulk_error(std::string_view value) {
  return frame(std::in_place_type<bulk_error>,
               bulk_error{std::string(value)});
}

frame make_array(std::vector<frame> elements) {
  return frame(std::in_place_type<array>, array{std::move(elements)});
}

frame make_null_array() {
  return frame(std::in_place_type<array>, array{std::nullopt});
}

frame make_map(std::vector<std::pair<frame, frame>> entries) {
  return frame(std::in_place_type<map>, map{std::move(entries)});
}

frame make_set(std::vector<frame> elements) {
  return frame(std::in_place_type<set>, set{std::move(elements)});
}

std::string to_string(const frame &f) {
  std::string result;
  render(result, f);
  return result;
}

std::ostream &operator<<(std::ostream &os, const frame &f) {
  return os << to_string(f);
}

} // namespace memkv::resp
