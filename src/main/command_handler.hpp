#ifndef MEMKV_SERVER_COMMAND_HANDLER_HPP
#define MEMKV_SERVER_COMMAND_HANDLER_HPP

#include "commands.hpp"
#include "frame.hpp"
#include "store.hpp"
#include "util.hpp"

#include <ankerl/unordered_dense.h>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace memkv {

/**
 * Command names mapped to their arity and implementation. Lookup ignores
 * case.
 */
class command_table {
public:
  struct entry {
    std::string name;
    // exactly n arguments (name included) if positive, at least -n if negative
    std::int32_t arity;
    commands::cmd_t fn;
  };

  void add(std::string_view name, std::int32_t arity, commands::cmd_t fn);

  [[nodiscard]] const entry *find(std::string_view name) const;

  /**
   * Every command the server understands.
   */
  static const command_table &builtin();

private:
  ankerl::unordered_dense::map<std::string, entry, util::ci_hash,
                               util::ci_equal>
      entries_;
};

/**
 * Turns request frames into reply frames for one connection.
 */
class command_handler {
public:
  explicit command_handler(
      std::shared_ptr<store> db,
      const command_table &cmds = command_table::builtin());

  command_handler(const command_handler &) = delete;
  command_handler &operator=(const command_handler &) = delete;

  /**
   * Run one request. Every failure a client can cause comes back as an error
   * frame rather than an exception.
   */
  [[nodiscard]] resp::frame execute(const resp::frame &request);

  [[nodiscard]] const session &client() const noexcept { return session_; }

private:
  std::shared_ptr<store> db_;
  const command_table &cmds_;
  session session_;
};

} // namespace memkv

#endif // MEMKV_SERVER_COMMAND_HANDLER_HPP
