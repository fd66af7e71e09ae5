#ifndef MEMKV_SERVER_FRAME_HPP
#define MEMKV_SERVER_FRAME_HPP

#include <compare>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace memkv::resp {

class frame;

struct null {};

struct simple_string {
  std::string value;
};

struct simple_error {
  std::string value;
};

/**
 * nullopt is the null bulk string ("$-1\r\n"), distinct from "$0\r\n\r\n".
 */
struct bulk_string {
  std::optional<std::string> value;
};

struct bulk_error {
  std::string value;
};

/**
 * nullopt is the null array ("*-1\r\n"), distinct from "*0\r\n".
 */
struct array {
  std::optional<std::vector<frame>> elements;
};

struct map {
  std::vector<std::pair<frame, frame>> entries;
};

struct set {
  std::vector<frame> elements;
};

/**
 * One unit of the wire protocol. Frames are values: once constructed they are
 * only ever read, copied or moved.
 */
class frame {
public:
  using value_t =
      std::variant<null, bool, std::int64_t, double, simple_string,
                   simple_error, bulk_string, bulk_error, array, map, set>;

  frame() = default;

  template <typename T, typename... Args>
  explicit frame(std::in_place_type_t<T> type, Args &&...args)
      : value_(type, std::forward<Args>(args)...) {}

  [[nodiscard]] const value_t &value() const noexcept { return value_; }

  template <typename T> [[nodiscard]] bool is() const noexcept {
    return std::holds_alternative<T>(value_);
  }

  template <typename T> [[nodiscard]] const T &get() const {
    return std::get<T>(value_);
  }

  template <typename T> [[nodiscard]] const T *get_if() const noexcept {
    return std::get_if<T>(&value_);
  }

  [[nodiscard]] bool is_error() const noexcept {
    return is<simple_error>() || is<bulk_error>();
  }

  [[nodiscard]] std::string_view type_name() const noexcept;

  friend std::weak_ordering operator<=>(const frame &lhs, const frame &rhs);
  friend bool operator==(const frame &lhs, const frame &rhs);

private:
  value_t value_;
};

std::weak_ordering operator<=>(const frame &lhs, const frame &rhs);
bool operator==(const frame &lhs, const frame &rhs);

frame make_null();
frame make_boolean(bool value);
frame make_integer(std::int64_t value);
frame make_double(double value);
// CR and LF in value are replaced by spaces
frame make_simple_string(std::string_view value);
frame make_error(std::string_view value);
frame make_bulk_string(std::string_view value);
frame make_null_bulk_string();
frame make_bulk_error(std::string_view value);
frame make_array(std::vector<frame> elements);
frame make_null_array();
frame make_map(std::vector<std::pair<frame, frame>> entries);
frame make_set(std::vector<frame> elements);

/**
 * Render a frame for logs and test diagnostics, e.g. ["SET", "key", "value"].
 * Non-printable bytes are escaped as \xNN.
 */
std::string to_string(const frame &f);

std::ostream &operator<<(std::ostream &os, const frame &f);

} // namespace memkv::resp

#endif // MEMKV_SERVER_FRAME_HPP
