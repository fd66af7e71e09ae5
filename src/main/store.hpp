#ifndef MEMKV_SERVER_STORE_HPP
#define MEMKV_SERVER_STORE_HPP

#include "util.hpp"

#include <ankerl/unordered_dense.h>

#include <cstddef>
#include <exception>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>
#include <vector>

namespace memkv {

class wrong_type : public std::runtime_error {
public:
  wrong_type()
      : std::runtime_error(
            "WRONGTYPE Operation against a key holding the wrong kind of "
            "value") {}
};

enum class if_absent { create, skip };

/**
 * Keys mapped to strings, hashes, lists and sets, safe to share between
 * connection threads.
 *
 * The key space is split into shards, each guarded by its own reader/writer
 * lock, so every operation below is atomic with respect to any other
 * operation on the same key while keys in different shards never contend.
 * Callbacks run with the shard lock held and must not block or call back
 * into the store.
 */
class store {
public:
  using string_t = std::string;
  using hash_t = ankerl::unordered_dense::map<std::string, std::string,
                                              util::cs_hash, std::equal_to<>>;
  using list_t = std::list<std::string>;
  using set_t =
      ankerl::unordered_dense::set<std::string, util::cs_hash, std::equal_to<>>;
  using value_t = std::variant<string_t, hash_t, list_t, set_t>;

  explicit store(std::size_t shard_count = 64);

  store(const store &) = delete;
  store &operator=(const store &) = delete;

  /**
   * A copy of the value at key, taken under the shard's shared lock.
   */
  [[nodiscard]] std::optional<value_t> get(std::string_view key) const;

  /**
   * Call fn(const T *) under a shared lock: nullptr if key is absent.
   * @throws wrong_type if key holds something other than a T
   */
  template <typename T, typename Function>
  auto read(std::string_view key, Function fn) const
      -> decltype(fn(static_cast<const T *>(nullptr)));

  /**
   * Call fn(T *) under an exclusive lock. With if_absent::create a missing
   * key is created from initial first, otherwise fn sees nullptr. A
   * container fn leaves empty is removed, as is a key created for fn if fn
   * throws.
   * @throws wrong_type if key holds something other than a T, before fn runs
   */
  template <typename T, typename Function>
  auto write(std::string_view key, if_absent mode, Function fn, T initial = {})
      -> decltype(fn(static_cast<T *>(nullptr)));

  /**
   * Store value as a string at key, replacing whatever was there.
   */
  void set(std::string_view key, std::string_view value);

  bool del(std::string_view key);

  [[nodiscard]] bool exists(std::string_view key) const;

  /**
   * "string", "hash", "list", "set", or "none" for a missing key.
   */
  [[nodiscard]] std::string_view type(std::string_view key) const;

  [[nodiscard]] std::size_t size() const;

  void clear();

private:
  using map_t = ankerl::unordered_dense::map<std::string, value_t,
                                             util::cs_hash, std::equal_to<>>;

  struct shard {
    mutable std::shared_mutex mutex;
    map_t map;
  };

  shard &shard_for(std::string_view key);
  const shard &shard_for(std::string_view key) const;

  std::vector<shard> shards_;
};

namespace detail {

/**
 * On scope exit removes key from map if it names an empty hash, list or set,
 * or if it was created for this scope and the scope is being unwound.
 */
template <typename Map> class erase_if_empty {
public:
  erase_if_empty(Map &map, std::string_view key, bool created)
      : map_(map), key_(key), created_(created),
        exceptions_(std::uncaught_exceptions()) {}
  erase_if_empty(const erase_if_empty &) = delete;
  erase_if_empty &operator=(const erase_if_empty &) = delete;

  ~erase_if_empty() {
    const auto pos = map_.find(key_);
    if (pos == map_.end())
      return;
    const bool unwinding = std::uncaught_exceptions() > exceptions_;
    if ((created_ && unwinding) ||
        std::visit([](const auto &v) { return is_empty(v); }, pos->second))
      map_.erase(pos);
  }

private:
  template <typename T> static bool is_empty(const T &value) {
    if constexpr (std::is_same_v<T, std::string>)
      return false;
    else
      return value.empty();
  }

  Map &map_;
  std::string_view key_;
  bool created_;
  int exceptions_;
};

} // namespace detail

} // namespace memkv

template <typename T, typename Function>
auto memkv::store::read(std::string_view key, Function fn) const
    -> decltype(fn(static_cast<const T *>(nullptr))) {
  const auto &s = shard_for(key);
  std::shared_lock lock(s.mutex);

  if (const auto pos = s.map.find(key); pos != s.map.end()) {
    const T *value = std::get_if<T>(&pos->second);
    if (!value)
      throw wrong_type();
    return fn(value);
  }
  return fn(static_cast<const T *>(nullptr));
}

template <typename T, typename Function>
auto memkv::store::write(std::string_view key, if_absent mode, Function fn,
                         T initial) -> decltype(fn(static_cast<T *>(nullptr))) {
  auto &s = shard_for(key);
  std::unique_lock lock(s.mutex);

  auto pos = s.map.find(key);
  const bool created = pos == s.map.end();
  if (created) {
    if (mode == if_absent::skip)
      return fn(static_cast<T *>(nullptr));
    pos = s.map
              .emplace(std::piecewise_construct, std::forward_as_tuple(key),
                       std::forward_as_tuple(std::in_place_type<T>,
                                             std::move(initial)))
              .first;
  }

  T *value = std::get_if<T>(&pos->second);
  if (!value)
    throw wrong_type();

  detail::erase_if_empty cleanup(s.map, key, created);

  return fn(value);
}

#endif // MEMKV_SERVER_STORE_HPP
