#include "vaultcore/api/command_router.hpp"

#include <charconv>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace vaultcore {
namespace api {

namespace {

std::vector<std::string_view> tokenize(std::string_view line) {
  std::vector<std::string_view> tokens;
  std::size_t pos = 0;
  while (pos < line.size()) {
    while (pos < line.size() && (line[pos] == ' ' || line[pos] == '\t' || line[pos] == '\r')) {
      ++pos;
    }
    const std::size_t start = pos;
    while (pos < line.size() && line[pos] != ' ' && line[pos] != '\t' && line[pos] != '\r') {
      ++pos;
    }
    if (pos > start) {
      tokens.push_back(line.substr(start, pos - start));
    }
  }
  return tokens;
}

std::uint64_t parse_u64(std::string_view token, const char* what) {
  std::uint64_t value = 0;
  const auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
  if (ec != std::errc{} || ptr != token.data() + token.size()) {
    throw std::invalid_argument(std::string("invalid ") + what + ": " + std::string(token));
  }
  return value;
}

void expect_args(const std::vector<std::string_view>& args, std::size_t min, std::size_t max, const char* usage) {
  if (args.size() < min || args.size() > max) {
    throw std::invalid_argument(std::string("usage: ") + usage);
  }
}

std::string join(const std::vector<common::Amount>& amounts) {
  std::ostringstream oss;
  oss << "[";
  for (std::size_t i = 0; i < amounts.size(); ++i) {
    if (i != 0) {
      oss << ",";
    }
    oss << amounts[i];
  }
  oss << "]";
  return oss.str();
}

}  // namespace

void CommandRouter::register_command(std::string name, CommandHandler handler) {
  if (handlers_.find(name) == handlers_.end()) {
    names_.push_back(name);
  }
  handlers_[std::move(name)] = std::move(handler);
}

bool CommandRouter::has_command(const std::string& name) const {
  return handlers_.find(name) != handlers_.end();
}

std::optional<std::string> CommandRouter::dispatch(std::string_view line) {
  auto tokens = tokenize(line);
  if (tokens.empty() || tokens.front().front() == '#') {
    return std::nullopt;
  }

  const std::string name{tokens.front()};
  auto it = handlers_.find(name);
  if (it == handlers_.end()) {
    return "error: unknown command '" + name + "'";
  }

  tokens.erase(tokens.begin());
  try {
    return it->second(tokens);
  } catch (const std::invalid_argument& ex) {
    return std::string("error: ") + ex.what();
  }
}

void register_custody_commands(CommandRouter& router, CustodyService& service, executor::TransferFn transfer) {
  router.register_command("deposit", [&service](const std::vector<std::string_view>& args) {
    expect_args(args, 2, 2, "deposit <caller> <amount>");
    return format_result(service.deposit(parse_u64(args[0], "caller"), parse_u64(args[1], "amount")));
  });

  router.register_command("send", [&service](const std::vector<std::string_view>& args) {
    expect_args(args, 2, 2, "send <caller> <amount>");
    return format_result(service.receive(parse_u64(args[0], "caller"), parse_u64(args[1], "amount")));
  });

  router.register_command("withdraw", [&service, transfer = std::move(transfer)](const std::vector<std::string_view>& args) {
    expect_args(args, 2, 2, "withdraw <caller> <amount>");
    return format_result(service.withdraw(parse_u64(args[0], "caller"), parse_u64(args[1], "amount"), transfer));
  });

  router.register_command("balance", [&service](const std::vector<std::string_view>& args) {
    expect_args(args, 1, 1, "balance <account>");
    const auto account = parse_u64(args[0], "account");
    return "balance account=" + std::to_string(account) + " value=" + std::to_string(service.balance_of(account));
  });

  router.register_command("capacity", [&service](const std::vector<std::string_view>& args) {
    expect_args(args, 0, 0, "capacity");
    return "capacity remaining=" + std::to_string(service.remaining_capacity());
  });

  router.register_command("stats", [&service](const std::vector<std::string_view>& args) {
    expect_args(args, 0, 0, "stats");
    const auto stats = service.global_stats();
    return "stats deposits=" + std::to_string(stats.total_deposit_operations) +
           " withdrawals=" + std::to_string(stats.total_withdraw_operations) +
           " held=" + std::to_string(stats.held_balance);
  });

  router.register_command("history", [&service](const std::vector<std::string_view>& args) {
    constexpr const char* kUsage = "history <caller> <account> [nonce signature_hex]";
    expect_args(args, 2, 4, kUsage);
    if (args.size() == 3) {
      expect_args(args, 2, 2, kUsage);
    }
    const auto caller = parse_u64(args[0], "caller");
    const auto account = parse_u64(args[1], "account");

    std::optional<auth::Signature> signature;
    std::uint64_t nonce = 0;
    if (args.size() == 4) {
      nonce = parse_u64(args[2], "nonce");
      signature = auth::Authenticator::parse_signature(args[3]);
      if (!signature) {
        throw std::invalid_argument("invalid signature: " + std::string(args[3]));
      }
    }

    const auto result = service.history_of(caller, account, signature, nonce);
    if (!result.ok()) {
      return "rejected history account=" + std::to_string(account) + ": " + ledger::describe(result.rejection);
    }
    return "history account=" + std::to_string(account) + " deposits=" + join(result.history.deposits) +
           " withdrawals=" + join(result.history.withdrawals);
  });
}

std::string format_result(const executor::OperationResult& result) {
  std::ostringstream oss;
  oss << (result.ok() ? "ok " : "rejected ") << common::to_string(result.kind)
      << " principal=" << result.principal
      << " amount=" << result.amount
      << " balance=" << result.balance;
  if (!result.ok()) {
    oss << ": " << ledger::describe(result.rejection);
  }
  if (!result.detail.empty()) {
    oss << " (" << result.detail << ")";
  }
  return oss.str();
}

}  // namespace api
}  // namespace vaultcore
