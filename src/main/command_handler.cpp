#include "command_handler.hpp"

#include <spdlog/spdlog.h>

#include <vector>

namespace {

namespace resp = memkv::resp;

/**
 * The request as argument views into the frame, or nullopt if it isn't a
 * non-empty array of non-null bulk strings.
 */
std::optional<memkv::commands::args_t> arguments(const resp::frame &request) {
  const auto *a = request.get_if<resp::array>();
  if (!a || !a->elements || a->elements->empty())
    return {};

  memkv::commands::args_t args;
  args.reserve(a->elements->size());
  for (const auto &element : *a->elements) {
    const auto *s = element.get_if<resp::bulk_string>();
    if (!s || !s->value)
      return {};
    args.emplace_back(*s->value);
  }
  return args;
}

bool arity_matches(std::int32_t arity, std::size_t n) {
  return arity >= 0 ? n == static_cast<std::size_t>(arity)
                    : n >= static_cast<std::size_t>(-arity);
}

// the name and the argument list are each quoted back up to this length
constexpr std::size_t max_quoted_length = 128;

resp::frame unknown_command(const memkv::commands::args_t &args) {
  std::string quoted;
  for (std::size_t i = 1; i < args.size() && quoted.size() < max_quoted_length;
       ++i) {
    quoted += '\'';
    quoted += args[i].substr(0, max_quoted_length - quoted.size());
    quoted += "' ";
  }

  std::string msg = "ERR unknown command '";
  msg += args[0].substr(0, max_quoted_length);
  msg += "', with args beginning with: ";
  msg += quoted;
  return resp::make_error(msg);
}

} // namespace

void memkv::command_table::add(std::string_view name, std::int32_t arity,
                               commands::cmd_t fn) {
  std::string lower(name);
  for (auto &c : lower)
    if (c >= 'A' && c <= 'Z')
      c = static_cast<char>(c - 'A' + 'a');
  auto key = lower;
  entries_.insert_or_assign(std::move(key),
                            entry{std::move(lower), arity, fn});
}

const memkv::command_table::entry *
memkv::command_table::find(std::string_view name) const {
  if (const auto pos = entries_.find(name); pos != entries_.end())
    return &pos->second;
  return nullptr;
}

const memkv::command_table &memkv::command_table::builtin() {
  static const command_table table = [] {
    using namespace commands;
    command_table t;
    t.add("ping", -1, cmd_ping);
    t.add("echo", 2, cmd_echo);
    t.add("hello", -1, cmd_hello);

    t.add("get", 2, cmd_get);
    t.add("set", 3, cmd_set);
    t.add("append", 3, cmd_append);
    t.add("strlen", 2, cmd_strlen);
    t.add("incr", 2, cmd_incr);
    t.add("decr", 2, cmd_decr);
    t.add("incrby", 3, cmd_incrby);
    t.add("decrby", 3, cmd_decrby);

    t.add("del", -2, cmd_del);
    t.add("exists", -2, cmd_exists);
    t.add("type", 2, cmd_type);
    t.add("dbsize", 1, cmd_dbsize);
    t.add("flushdb", 1, cmd_flushdb);
    t.add("flushall", 1, cmd_flushdb);

    t.add("hset", 4, cmd_hset);
    t.add("hget", 3, cmd_hget);
    t.add("hgetall", 2, cmd_hgetall);
    t.add("hdel", -3, cmd_hdel);
    t.add("hexists", 3, cmd_hexists);
    t.add("hlen", 2, cmd_hlen);

    t.add("lpush", -3, cmd_lpush);
    t.add("rpush", -3, cmd_rpush);
    t.add("lpop", 2, cmd_lpop);
    t.add("rpop", 2, cmd_rpop);
    t.add("llen", 2, cmd_llen);
    t.add("lrange", 4, cmd_lrange);

    t.add("sadd", -3, cmd_sadd);
    t.add("srem", -3, cmd_srem);
    t.add("sismember", 3, cmd_sismember);
    t.add("scard", 2, cmd_scard);
    t.add("smembers", 2, cmd_smembers);
    return t;
  }();
  return table;
}

memkv::command_handler::command_handler(std::shared_ptr<store> db,
                                        const command_table &cmds)
    : db_(std::move(db)), cmds_(cmds) {}

memkv::resp::frame
memkv::command_handler::execute(const resp::frame &request) {
  const auto args = arguments(request);
  if (!args)
    return resp::make_error(
        "ERR Protocol error: expected an array of bulk strings");

  const auto *cmd = cmds_.find(args->front());
  if (!cmd) {
    spdlog::debug("unknown command {}", resp::to_string(request));
    return unknown_command(*args);
  }

  if (!arity_matches(cmd->arity, args->size()))
    return resp::make_error("ERR wrong number of arguments for '" + cmd->name +
                            "' command");

  const auto protocol = session_.protocol;
  commands::context ctx{*db_, session_};
  try {
    auto reply = cmd->fn(*args, ctx);
    if (session_.protocol != protocol)
      spdlog::debug("protocol switched from RESP{} to RESP{}", protocol,
                    session_.protocol);
    return reply;
  } catch (const wrong_type &e) {
    return resp::make_error(e.what());
  } catch (const commands::command_error &e) {
    return resp::make_error(e.what());
  }
}
