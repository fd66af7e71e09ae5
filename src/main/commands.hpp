#ifndef MEMKV_SERVER_COMMANDS_HPP
#define MEMKV_SERVER_COMMANDS_HPP

#include "frame.hpp"
#include "store.hpp"

#include <stdexcept>
#include <string_view>
#include <vector>

namespace memkv {

/**
 * Per connection state that outlives a single request.
 */
struct session {
  int protocol = 2;
};

} // namespace memkv

namespace memkv::commands {

/**
 * A request that can't be carried out; what() is the text of the error reply.
 */
class command_error : public std::runtime_error {
public:
  using runtime_error::runtime_error;
};

class not_an_int : public command_error {
public:
  not_an_int() : command_error("ERR value is not an integer or out of range") {}
};

struct context {
  store &db;
  session &client;
};

using args_t = std::vector<std::string_view>;
using cmd_t = resp::frame (*)(const args_t &, context &);

resp::frame cmd_ping(const args_t &, context &);
resp::frame cmd_echo(const args_t &, context &);
resp::frame cmd_hello(const args_t &, context &);

resp::frame cmd_get(const args_t &, context &);
resp::frame cmd_set(const args_t &, context &);
resp::frame cmd_append(const args_t &, context &);
resp::frame cmd_strlen(const args_t &, context &);
resp::frame cmd_incr(const args_t &, context &);
resp::frame cmd_decr(const args_t &, context &);
resp::frame cmd_incrby(const args_t &, context &);
resp::frame cmd_decrby(const args_t &, context &);

resp::frame cmd_del(const args_t &, context &);
resp::frame cmd_exists(const args_t &, context &);
resp::frame cmd_type(const args_t &, context &);
resp::frame cmd_dbsize(const args_t &, context &);
resp::frame cmd_flushdb(const args_t &, context &);

resp::frame cmd_hset(const args_t &, context &);
resp::frame cmd_hget(const args_t &, context &);
resp::frame cmd_hgetall(const args_t &, context &);
resp::frame cmd_hdel(const args_t &, context &);
resp::frame cmd_hexists(const args_t &, context &);
resp::frame cmd_hlen(const args_t &, context &);

resp::frame cmd_lpush(const args_t &, context &);
resp::frame cmd_rpush(const args_t &, context &);
resp::frame cmd_lpop(const args_t &, context &);
resp::frame cmd_rpop(const args_t &, context &);
resp::frame cmd_llen(const args_t &, context &);
resp::frame cmd_lrange(const args_t &, context &);

resp::frame cmd_sadd(const args_t &, context &);
resp::frame cmd_srem(const args_t &, context &);
resp::frame cmd_sismember(const args_t &, context &);
resp::frame cmd_scard(const args_t &, context &);
resp::frame cmd_smembers(const args_t &, context &);

} // namespace memkv::commands

#endif // MEMKV_SERVER_COMMANDS_HPP
