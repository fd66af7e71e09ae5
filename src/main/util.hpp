#ifndef MEMKV_SERVER_UTIL_HPP
#define MEMKV_SERVER_UTIL_HPP

#include <ankerl/unordered_dense.h>

#include <array>
#include <cassert>
#include <charconv>
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <system_error>
#include <tuple>
#include <utility>

namespace memkv::util {

// yields a hash that's approx 6x faster than using toupper
inline constexpr auto ucase_lookup = []() {
  std::array<unsigned char, 256> result{};
  for (std::size_t c = 0; c < result.size(); ++c)
    result[c] = static_cast<unsigned char>(
        (c >= 'a' && c <= 'z') ? c - ('a' - 'A') : c);
  return result;
}();

class cs_hash {
public:
  using is_transparent = void;
  using is_avalanching = void;

  auto operator()(const std::string_view s) const noexcept {
    return ankerl::unordered_dense::hash<std::string_view>{}(s);
  }
};

class ci_hash {
public:
  using is_transparent = void;

  template <typename T>
  auto operator()(const T &t) const noexcept
      -> decltype(std::string_view(t), std::size_t{}) {
    std::uint64_t result{};
    for (const unsigned char c : std::string_view(t))
      result = 17000069 * result + ucase_lookup[c];
    return result;
  }
};

class ci_equal {
public:
  using is_transparent = void;

  bool operator()(const std::string_view lhs,
                  const std::string_view rhs) const noexcept {
    if (lhs.size() != rhs.size())
      return false;

    for (auto i = lhs.begin(), e = lhs.end(), j = rhs.begin(); i != e;
         ++i, ++j) {
      if (ucase_lookup[static_cast<unsigned char>(*i)] !=
          ucase_lookup[static_cast<unsigned char>(*j)]) {
        return false;
      }
    }

    assert(ci_hash()(lhs) == ci_hash()(rhs));
    return true;
  }
};

/**
 * Parse the whole of s as a base 10 integer. Only '-' may lead.
 * @return nullopt if s is empty, has trailing garbage or is out of range
 */
template <typename Integer = std::int64_t>
std::optional<Integer> parse_int(std::string_view s) noexcept {
  Integer result{};
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), result);
  if (s.empty() || ec != std::errc() || ptr != s.data() + s.size())
    return {};
  return result;
}

template <typename Integer> auto to_chars(Integer i) {
  std::tuple<std::array<char, std::numeric_limits<Integer>::digits10 + 2>,
             std::size_t>
      result;
  auto &[buf, len] = result;
  auto [ptr, ec] = std::to_chars(buf.begin(), buf.end(), i);
  if (ec != std::errc())
    throw std::logic_error("can't render an integer");
  len = ptr - buf.begin();
  return result;
}

template <typename... Ts> struct overloaded : Ts... {
  using Ts::operator()...;
};

template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace memkv::util

#endif // MEMKV_SERVER_UTIL_HPP
