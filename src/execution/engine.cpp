#include <spdlog/spdlog.h>
#include <accountstore/blake3/hash.hpp>
#include <accountstore/common/error.hpp>
#include <accountstore/execution/engine.hpp>
#include <chrono>
#include <tuple>
#include <utility>

using accountstore::common::error;
using namespace accountstore::schema;

namespace {

using args_t = std::vector<std::string>;

void require_args(const std::string_view function,
                  const args_t& args,
                  std::size_t expected) {
  if (args.size() != expected) {
    throw error{error_code::invalid_argument,
                std::string{function} + " expects " +
                    std::to_string(expected) + " argument(s), got " +
                    std::to_string(args.size())};
  }
}

balance_t parse_amount(const std::string_view what, const std::string& text) {
  auto value = try_parse_int64(text);
  if (!value) {
    throw error{error_code::invalid_argument,
                std::string{what} + " is not a valid integer: " + text};
  }
  return *value;
}

timestamp_milliseconds_t now_milliseconds() {
  return static_cast<timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

}  // namespace

namespace accountstore::execution {

engine::engine(accountstore::registry::encoder_t& encoder,
               accountstore::storage::storage<
                   accountstore::storage::rocksdb_storage_tag>& storage)
    : encoder_{encoder},
      storage_{storage},
      participants_{encoder},
      accounts_{encoder},
      transfers_{accounts_},
      history_{encoder} {
  register_functions();
  spdlog::info("Execution engine ready with {} function(s)",
               functions_.size());
}

invocation_result_t engine::invoke(const invocation_t& invocation) {
  return run(invocation, true);
}

invocation_result_t engine::query(const invocation_t& invocation) {
  return run(invocation, false);
}

invocation_result_t engine::run(const invocation_t& invocation, bool commit) {
  auto lock = std::scoped_lock{mutex_};

  auto result = invocation_result_t{};
  result.tx_id = invocation.tx_id.empty() ? make_tx_id(invocation)
                                          : invocation.tx_id;

  auto fail = [&](const error_code code, const std::string& message) {
    result.code = static_cast<uint32_t>(code);
    result.info = std::string{to_string(code)};
    result.log = message;
    result.codespace = std::string{kCodespace};
    result.payload.clear();
  };

  try {
    auto handler = functions_.find(invocation.function);
    if (handler == std::end(functions_)) {
      throw error{error_code::unknown_function,
                  "unknown function: " + invocation.function};
    }
    auto context = storage_.begin(result.tx_id, now_milliseconds());
    result.payload = handler->second(context, invocation.args);
    if (commit) {
      context.commit();
    }
  } catch (const error& e) {
    spdlog::debug("{} failed in tx {}: {} ({})", invocation.function,
                  result.tx_id, e.what(), to_string(e.code()));
    fail(e.code(), e.what());
  } catch (const std::exception& e) {
    spdlog::error("{} failed in tx {}: {}", invocation.function, result.tx_id,
                  e.what());
    fail(error_code::storage_unavailable, e.what());
  }
  return result;
}

std::string engine::make_tx_id(const invocation_t& invocation) {
  auto material = encoder_.encode(
      std::tuple{invocation.function, invocation.args, ++invocation_sequence_,
                 now_milliseconds()});
  return to_hex(accountstore::blake3::hash(
      bytes_view_t{material.data(), material.size()}));
}

void engine::register_functions() {
  functions_.emplace(
      "participant_exists",
      [this](accountstore::registry::context_t& context, const args_t& args) {
        require_args("participant_exists", args, 1);
        return encoder_.encode(participants_.exists(context, args[0]));
      });
  functions_.emplace(
      "create_participant",
      [this](accountstore::registry::context_t& context, const args_t& args) {
        require_args("create_participant", args, 5);
        participants_.create(context, args[0], args[1], args[2], args[3],
                             args[4]);
        return bytes_t{};
      });
  functions_.emplace(
      "read_participant",
      [this](accountstore::registry::context_t& context, const args_t& args) {
        require_args("read_participant", args, 1);
        return encoder_.encode(participants_.read(context, args[0]));
      });
  functions_.emplace(
      "list_participants",
      [this](accountstore::registry::context_t& context, const args_t& args) {
        require_args("list_participants", args, 0);
        return encoder_.encode(participants_.list_all(context).collect());
      });
  functions_.emplace(
      "account_exists",
      [this](accountstore::registry::context_t& context, const args_t& args) {
        require_args("account_exists", args, 1);
        return encoder_.encode(accounts_.exists(context, args[0]));
      });
  functions_.emplace(
      "create_account",
      [this](accountstore::registry::context_t& context, const args_t& args) {
        require_args("create_account", args, 4);
        accounts_.create(context, args[0], args[1],
                         parse_amount("balance", args[2]), args[3]);
        return bytes_t{};
      });
  functions_.emplace(
      "read_account",
      [this](accountstore::registry::context_t& context, const args_t& args) {
        require_args("read_account", args, 1);
        return encoder_.encode(accounts_.read(context, args[0]));
      });
  functions_.emplace(
      "list_participant_accounts",
      [this](accountstore::registry::context_t& context, const args_t& args) {
        require_args("list_participant_accounts", args, 1);
        return encoder_.encode(
            accounts_.list_for_participant(context, args[0]).collect());
      });
  functions_.emplace(
      "transfer",
      [this](accountstore::registry::context_t& context, const args_t& args) {
        require_args("transfer", args, 3);
        transfers_.transfer(context, args[0], args[1],
                            parse_amount("amount", args[2]));
        return bytes_t{};
      });
  functions_.emplace(
      "account_history",
      [this](accountstore::registry::context_t& context, const args_t& args) {
        require_args("account_history", args, 1);
        return encoder_.encode(history_.history(context, args[0]).collect());
      });
}

}  // namespace accountstore::execution
