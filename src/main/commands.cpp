#include "commands.hpp"
#include "util.hpp"

#include <algorithm>
#include <iterator>
#include <limits>
#include <span>
#include <vector>

namespace {

namespace resp = memkv::resp;
using memkv::if_absent;
using memkv::store;
using memkv::commands::args_t;
using memkv::commands::command_error;
using memkv::commands::context;
using memkv::commands::not_an_int;

constexpr std::string_view server_name = "memkv";
constexpr std::string_view server_version = "1.0.0";

resp::frame ok() { return resp::make_simple_string("OK"); }

resp::frame error(std::string_view msg) { return resp::make_error(msg); }

resp::frame bulk_string(std::string_view value) {
  return resp::make_bulk_string(value);
}

template <typename Integer> resp::frame integer(Integer i) {
  return resp::make_integer(static_cast<std::int64_t>(i));
}

/**
 * The "no value" reply: a null bulk string for RESP2 clients, null for RESP3.
 */
resp::frame nil(const context &ctx) {
  return ctx.client.protocol >= 3 ? resp::make_null()
                                  : resp::make_null_bulk_string();
}

/**
 * Field/value pairs as a map for RESP3 clients, flattened for RESP2.
 */
resp::frame pairs(const context &ctx,
                  std::vector<std::pair<resp::frame, resp::frame>> entries) {
  if (ctx.client.protocol >= 3)
    return resp::make_map(std::move(entries));

  std::vector<resp::frame> flat;
  flat.reserve(entries.size() * 2);
  for (auto &[field, value] : entries) {
    flat.push_back(std::move(field));
    flat.push_back(std::move(value));
  }
  return resp::make_array(std::move(flat));
}

std::int64_t parse_int(std::string_view s) {
  if (const auto result = memkv::util::parse_int(s))
    return *result;
  throw not_an_int();
}

std::span<const std::string_view> tail(const args_t &args, std::size_t from) {
  return std::span(args).subspan(from);
}

/**
 * Remove the elements matching pred from an unordered_dense map or set.
 * erase() moves the last element into the hole, so this filters the
 * underlying vector instead, keeping what's left in insertion order.
 */
template <typename Container, typename Predicate>
std::size_t erase_ordered(Container &c, Predicate pred) {
  auto values = c.extract();
  const auto removed = std::erase_if(values, pred);
  c.replace(std::move(values));
  return removed;
}

} // namespace

namespace memkv::commands {

resp::frame cmd_ping(const args_t &args, context &) {
  switch (args.size()) {
  case 1:
    return resp::make_simple_string("PONG");
  case 2:
    return bulk_string(args[1]);
  default:
    return error("ERR wrong number of arguments for 'ping' command");
  }
}

resp::frame cmd_echo(const args_t &args, context &) {
  return bulk_string(args[1]);
}

resp::frame cmd_hello(const args_t &args, context &ctx) {
  if (args.size() > 2)
    return error("ERR Syntax error in HELLO option");

  if (args.size() == 2) {
    const auto version = util::parse_int(args[1]);
    if (!version)
      return error("ERR Protocol version is not an integer or out of range");
    if (*version != 2 && *version != 3)
      return error("NOPROTO unsupported protocol version");
    ctx.client.protocol = static_cast<int>(*version);
  }

  std::vector<std::pair<resp::frame, resp::frame>> info;
  info.emplace_back(bulk_string("server"), bulk_string(server_name));
  info.emplace_back(bulk_string("version"), bulk_string(server_version));
  info.emplace_back(bulk_string("proto"), integer(ctx.client.protocol));
  info.emplace_back(bulk_string("mode"), bulk_string("standalone"));
  info.emplace_back(bulk_string("role"), bulk_string("master"));
  info.emplace_back(bulk_string("modules"), resp::make_array({}));
  return pairs(ctx, std::move(info));
}

resp::frame cmd_get(const args_t &args, context &ctx) {
  return ctx.db.read<store::string_t>(
      args[1], [&](const store::string_t *value) {
        return value ? bulk_string(*value) : nil(ctx);
      });
}

resp::frame cmd_set(const args_t &args, context &ctx) {
  ctx.db.set(args[1], args[2]);
  return ok();
}

resp::frame cmd_append(const args_t &args, context &ctx) {
  return integer(ctx.db.write<store::string_t>(
      args[1], if_absent::create, [&](store::string_t *value) {
        value->append(args[2]);
        return value->size();
      }));
}

resp::frame cmd_strlen(const args_t &args, context &ctx) {
  return integer(ctx.db.read<store::string_t>(
      args[1], [](const store::string_t *value) -> std::size_t {
        return value ? value->size() : 0;
      }));
}

namespace {

resp::frame incr_by(const args_t &args, context &ctx, std::int64_t delta) {
  return integer(ctx.db.write<store::string_t>(
      args[1], if_absent::create,
      [&](store::string_t *value) {
        using limits = std::numeric_limits<std::int64_t>;
        auto i = parse_int(*value);

        if ((delta > 0 && i > limits::max() - delta) ||
            (delta < 0 && i < limits::min() - delta))
          throw command_error("ERR increment or decrement would overflow");

        i += delta;

        auto [buf, len] = util::to_chars(i);
        value->assign(buf.data(), len);
        return i;
      },
      "0"));
}

} // namespace

resp::frame cmd_incr(const args_t &args, context &ctx) {
  return incr_by(args, ctx, 1);
}

resp::frame cmd_decr(const args_t &args, context &ctx) {
  return incr_by(args, ctx, -1);
}

resp::frame cmd_incrby(const args_t &args, context &ctx) {
  return incr_by(args, ctx, parse_int(args[2]));
}

resp::frame cmd_decrby(const args_t &args, context &ctx) {
  const auto delta = parse_int(args[2]);
  if (delta == std::numeric_limits<std::int64_t>::min())
    return error("ERR decrement would overflow");
  return incr_by(args, ctx, -delta);
}

resp::frame cmd_del(const args_t &args, context &ctx) {
  std::int64_t count{};
  for (const auto &key : tail(args, 1)) {
    if (ctx.db.del(key))
      ++count;
  }
  return integer(count);
}

resp::frame cmd_exists(const args_t &args, context &ctx) {
  std::int64_t count{};
  for (const auto &key : tail(args, 1)) {
    if (ctx.db.exists(key))
      ++count;
  }
  return integer(count);
}

resp::frame cmd_type(const args_t &args, context &ctx) {
  return resp::make_simple_string(ctx.db.type(args[1]));
}

resp::frame cmd_dbsize(const args_t &, context &ctx) {
  return integer(ctx.db.size());
}

resp::frame cmd_flushdb(const args_t &, context &ctx) {
  ctx.db.clear();
  return ok();
}

resp::frame cmd_hset(const args_t &args, context &ctx) {
  return ctx.db.write<store::hash_t>(
      args[1], if_absent::create, [&](store::hash_t *hash) {
        const auto inserted = hash->insert_or_assign(std::string(args[2]),
                                                     std::string(args[3]))
                                  .second;
        return integer(inserted ? 1 : 0);
      });
}

resp::frame cmd_hget(const args_t &args, context &ctx) {
  return ctx.db.read<store::hash_t>(
      args[1], [&](const store::hash_t *hash) {
        if (hash) {
          if (const auto pos = hash->find(args[2]); pos != hash->end())
            return bulk_string(pos->second);
        }
        return nil(ctx);
      });
}

resp::frame cmd_hgetall(const args_t &args, context &ctx) {
  auto entries = ctx.db.read<store::hash_t>(
      args[1], [](const store::hash_t *hash) {
        std::vector<std::pair<resp::frame, resp::frame>> result;
        if (hash) {
          result.reserve(hash->size());
          for (const auto &[field, value] : *hash)
            result.emplace_back(bulk_string(field), bulk_string(value));
        }
        return result;
      });
  return pairs(ctx, std::move(entries));
}

resp::frame cmd_hdel(const args_t &args, context &ctx) {
  const auto fields = tail(args, 2);
  return integer(ctx.db.write<store::hash_t>(
      args[1], if_absent::skip, [&](store::hash_t *hash) -> std::size_t {
        if (!hash)
          return 0;
        return erase_ordered(*hash, [&](const auto &entry) {
          return std::find(fields.begin(), fields.end(), entry.first) !=
                 fields.end();
        });
      }));
}

resp::frame cmd_hexists(const args_t &args, context &ctx) {
  return integer(ctx.db.read<store::hash_t>(
      args[1], [&](const store::hash_t *hash) {
        return hash && hash->contains(args[2]);
      }));
}

resp::frame cmd_hlen(const args_t &args, context &ctx) {
  return integer(ctx.db.read<store::hash_t>(
      args[1], [](const store::hash_t *hash) -> std::size_t {
        return hash ? hash->size() : 0;
      }));
}

namespace {

resp::frame rpush_lpush(const args_t &args, context &ctx,
                        void (*push)(store::list_t &, std::string_view)) {
  return integer(ctx.db.write<store::list_t>(
      args[1], if_absent::create, [&](store::list_t *list) {
        for (const auto &s : tail(args, 2))
          push(*list, s);
        return list->size();
      }));
}

resp::frame lpop_rpop(const args_t &args, context &ctx,
                      std::string (*pop)(store::list_t &)) {
  return ctx.db.write<store::list_t>(
      args[1], if_absent::skip, [&](store::list_t *list) {
        if (!list || list->empty())
          return nil(ctx);
        return bulk_string(pop(*list));
      });
}

} // namespace

resp::frame cmd_rpush(const args_t &args, context &ctx) {
  return rpush_lpush(args, ctx, [](auto &list, auto s) {
    list.emplace_back(s);
  });
}

resp::frame cmd_lpush(const args_t &args, context &ctx) {
  return rpush_lpush(args, ctx, [](auto &list, auto s) {
    list.emplace_front(s);
  });
}

resp::frame cmd_lpop(const args_t &args, context &ctx) {
  return lpop_rpop(args, ctx, [](auto &list) {
    auto result = std::move(list.front());
    list.pop_front();
    return result;
  });
}

resp::frame cmd_rpop(const args_t &args, context &ctx) {
  return lpop_rpop(args, ctx, [](auto &list) {
    auto result = std::move(list.back());
    list.pop_back();
    return result;
  });
}

resp::frame cmd_llen(const args_t &args, context &ctx) {
  return integer(ctx.db.read<store::list_t>(
      args[1], [](const store::list_t *list) -> std::size_t {
        return list ? list->size() : 0;
      }));
}

resp::frame cmd_lrange(const args_t &args, context &ctx) {
  const auto first = parse_int(args[2]);
  const auto last = parse_int(args[3]);

  return ctx.db.read<store::list_t>(args[1], [&](const store::list_t *list) {
    std::vector<resp::frame> result;
    if (!list)
      return resp::make_array(std::move(result));

    const auto size = static_cast<std::int64_t>(list->size());

    auto normalise_index = [&](std::int64_t i) -> std::int64_t {
      return i < 0 ? size + i : i;
    };

    const auto start = std::max(std::int64_t(0), normalise_index(first));
    const auto stop = std::min(size - 1, normalise_index(last)) + 1;

    if (start < stop) {
      auto iter = list->begin();
      std::advance(iter, start);
      result.reserve(stop - start);
      for (auto i = start; i < stop; ++i, ++iter)
        result.push_back(bulk_string(*iter));
    }

    return resp::make_array(std::move(result));
  });
}

resp::frame cmd_sadd(const args_t &args, context &ctx) {
  return integer(ctx.db.write<store::set_t>(
      args[1], if_absent::create, [&](store::set_t *set) {
        std::size_t added{};
        for (const auto &member : tail(args, 2))
          added += set->emplace(member).second;
        return added;
      }));
}

resp::frame cmd_srem(const args_t &args, context &ctx) {
  const auto members = tail(args, 2);
  return integer(ctx.db.write<store::set_t>(
      args[1], if_absent::skip, [&](store::set_t *set) -> std::size_t {
        if (!set)
          return 0;
        return erase_ordered(*set, [&](const std::string &member) {
          return std::find(members.begin(), members.end(), member) !=
                 members.end();
        });
      }));
}

resp::frame cmd_sismember(const args_t &args, context &ctx) {
  return integer(ctx.db.read<store::set_t>(
      args[1], [&](const store::set_t *set) {
        return set && set->contains(args[2]);
      }));
}

resp::frame cmd_scard(const args_t &args, context &ctx) {
  return integer(ctx.db.read<store::set_t>(
      args[1], [](const store::set_t *set) -> std::size_t {
        return set ? set->size() : 0;
      }));
}

resp::frame cmd_smembers(const args_t &args, context &ctx) {
  auto members = ctx.db.read<store::set_t>(
      args[1], [](const store::set_t *set) {
        std::vector<resp::frame> result;
        if (set) {
          result.reserve(set->size());
          for (const auto &member : *set)
            result.push_back(bulk_string(member));
        }
        return result;
      });
  return ctx.client.protocol >= 3 ? resp::make_set(std::move(members))
                                  : resp::make_array(std::move(members));
}

} // namespace memkv::commands
