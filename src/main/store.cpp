#include "store.hpp"

#include <numeric>

using memkv::util::overloaded;

namespace {

std::size_t validated_shard_count(std::size_t n) {
  if (n == 0 || (n & (n - 1)) != 0)
    throw std::invalid_argument("shard count must be a power of two");
  return n;
}

} // namespace

memkv::store::store(std::size_t shard_count)
    : shards_(validated_shard_count(shard_count)) {}

memkv::store::shard &memkv::store::shard_for(std::string_view key) {
  return shards_[util::cs_hash{}(key) & (shards_.size() - 1)];
}

const memkv::store::shard &
memkv::store::shard_for(std::string_view key) const {
  return shards_[util::cs_hash{}(key) & (shards_.size() - 1)];
}

std::optional<memkv::store::value_t>
memkv::store::get(std::string_view key) const {
  const auto &s = shard_for(key);
  std::shared_lock lock(s.mutex);
  if (const auto pos = s.map.find(key); pos != s.map.end())
    return pos->second;
  return {};
}

void memkv::store::set(std::string_view key, std::string_view value) {
  auto &s = shard_for(key);
  std::unique_lock lock(s.mutex);
  if (auto pos = s.map.find(key); pos == s.map.end()) {
    s.map.emplace(std::piecewise_construct, std::forward_as_tuple(key),
                  std::forward_as_tuple(std::in_place_type<string_t>, value));
  } else {
    pos->second.emplace<string_t>(value);
  }
}

bool memkv::store::del(std::string_view key) {
  auto &s = shard_for(key);
  std::unique_lock lock(s.mutex);
  if (const auto pos = s.map.find(key); pos != s.map.end()) {
    s.map.erase(pos);
    return true;
  }
  return false;
}

bool memkv::store::exists(std::string_view key) const {
  const auto &s = shard_for(key);
  std::shared_lock lock(s.mutex);
  return s.map.contains(key);
}

std::string_view memkv::store::type(std::string_view key) const {
  const auto &s = shard_for(key);
  std::shared_lock lock(s.mutex);
  if (const auto pos = s.map.find(key); pos != s.map.end()) {
    return std::visit(overloaded{
                          [](const string_t &) { return "string"; },
                          [](const hash_t &) { return "hash"; },
                          [](const list_t &) { return "list"; },
                          [](const set_t &) { return "set"; },
                      },
                      pos->second);
  }
  return "none";
}

std::size_t memkv::store::size() const {
  return std::accumulate(shards_.begin(), shards_.end(), std::size_t(0),
                         [](std::size_t n, const shard &s) {
                           std::shared_lock lock(s.mutex);
                           return n + s.map.size();
                         });
}

void memkv::store::clear() {
  for (auto &s : shards_) {
    std::unique_lock lock(s.mutex);
    s.map.clear();
  }
}
