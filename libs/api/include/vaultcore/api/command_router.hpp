#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "vaultcore/api/custody_service.hpp"
#include "vaultcore/executor/guarded_executor.hpp"

namespace vaultcore {
namespace api {

// Handlers receive the tokens after the command name and return one line of
// output. They throw std::invalid_argument for malformed arguments.
using CommandHandler = std::function<std::string(const std::vector<std::string_view>&)>;

class CommandRouter {
 public:
  void register_command(std::string name, CommandHandler handler);
  [[nodiscard]] bool has_command(const std::string& name) const;
  [[nodiscard]] const std::vector<std::string>& commands() const noexcept { return names_; }

  // Blank lines and lines starting with '#' produce no output.
  std::optional<std::string> dispatch(std::string_view line);

 private:
  std::vector<std::string> names_{};
  std::unordered_map<std::string, CommandHandler> handlers_{};
};

// deposit, send, withdraw, balance, capacity, stats, history
void register_custody_commands(CommandRouter& router, CustodyService& service, executor::TransferFn transfer);

[[nodiscard]] std::string format_result(const executor::OperationResult& result);

}  // namespace api
}  // namespace vaultcore
