#pragma once

#include "sigtrader/console/operator_api.hpp"

#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace sigtrader {

enum class ConsoleState {
  MainMenu,
  ViewingSignal,
  AwaitingValue,
};

enum class AwaitedValue {
  StopLoss,
  TakeProfit,
  TesterText,
};

const char* toString(ConsoleState state);
const char* toString(AwaitedValue value);

struct ConsoleSession {
  ConsoleState state{ConsoleState::MainMenu};
  domain::SignalId signal_id{0};  // ViewingSignal, and SL/TP input
  AwaitedValue awaiting{AwaitedValue::StopLoss};
};

struct ConsoleReply {
  bool ok{true};
  std::string text;
  ConsoleState state{ConsoleState::MainMenu};
};

// -----------------------------------------------------------------------------
// ConsoleSessionManager
// -----------------------------------------------------------------------------
//
// @brief  Per-user menu state machine on top of OperatorApi.
//
// @details
//   MainMenu       signals | positions | history [n] | signal <id> |
//                  report <channel> | compare | summary | tester
//   ViewingSignal  close | half | riskfree | tp | sl | tps |
//                  closelot <ticket> <lots> | back
//                  (plus every MainMenu input)
//   AwaitingValue  a free-text value, or cancel / back
//
// "menu" returns to MainMenu from anywhere. Unknown input leaves the state
// unchanged and answers with the inputs valid in it. A user without a
// session starts in MainMenu.
//
// Thread-safety: handle() locks; sessions are independent of each other.
// -----------------------------------------------------------------------------
class ConsoleSessionManager {
 public:
  explicit ConsoleSessionManager(OperatorApi& api, bool decimal_comma = false);

  ConsoleReply handle(const std::string& user_id, const std::string& input);

  std::optional<ConsoleSession> session(const std::string& user_id) const;
  void reset(const std::string& user_id);

 private:
  ConsoleReply onMainInput(const std::string& user_id, ConsoleSession& s,
                           const std::string& verb, const std::string& arg);
  ConsoleReply onSignalInput(const std::string& user_id, ConsoleSession& s,
                             const std::string& verb, const std::string& arg);
  ConsoleReply onValue(const std::string& user_id, ConsoleSession& s,
                       const std::string& input);

  ConsoleReply showSignal(ConsoleSession& s, domain::SignalId id);
  ConsoleReply closeLot(const std::string& user_id, ConsoleSession& s,
                        const std::string& arg);
  ConsoleReply command(const std::string& user_id, ConsoleSession& s,
                       domain::CommandKind kind,
                       std::optional<double> stop_loss = std::nullopt,
                       std::vector<double> take_profits = {});

  OperatorApi& api_;
  bool decimal_comma_;
  mutable std::mutex mutex_;
  std::map<std::string, ConsoleSession> sessions_;
};

}  // namespace sigtrader
