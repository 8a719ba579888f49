#pragma once

#include "sigtrader/domain/venue_types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace sigtrader {

// -----------------------------------------------------------------------------
// Parser tables
// -----------------------------------------------------------------------------
// One ordered list of regular expressions per extracted field. Patterns are
// ECMAScript, matched case-insensitively, and may use the placeholders
// {NUM}, {NUMLIST} and {IDX} (see parser/pattern_matcher.hpp).
// -----------------------------------------------------------------------------
struct PatternEntry {
  std::string pattern;
  int group{1};       // capture group holding the value
  std::string value;  // direction tables: "buy" or "sell"
};

struct PatternTables {
  std::vector<PatternEntry> direction;
  std::vector<PatternEntry> symbol;
  std::vector<PatternEntry> first_price;
  std::vector<PatternEntry> second_price;
  std::vector<PatternEntry> stop_loss;
  std::vector<PatternEntry> take_profit;
};

struct ParserConfig {
  PatternTables patterns;
  std::map<std::string, std::string> symbol_aliases;
  bool require_stop_loss{false};
  bool decimal_comma{false};
  bool dual_entry_enabled{false};  // mirrors sizing.dual_entry.enabled
};

struct KeywordTables {
  std::vector<std::string> delete_keywords;
  std::vector<std::string> risk_free;
  std::vector<std::string> half_close;
  std::vector<std::string> take_profit;
  std::vector<std::string> edit;
};

struct CommandConfig {
  KeywordTables keywords;
  bool half_modifier_overrides_delete{true};
  bool edit_applies_to_last_signal{false};
};

struct TradingWindow {
  bool enabled{false};
  int start_minute{0};
  int end_minute{0};
  int utc_offset_minutes{0};
};

struct FilterConfig {
  std::vector<std::string> channel_allow;
  std::vector<std::string> channel_block;
  std::vector<std::string> symbol_allow;
  std::vector<std::string> symbol_block;
  TradingWindow trading_window;
};

enum class SizingMode {
  Fixed,             // `value` is the volume
  PercentOfBalance,  // `value` percent of the basis, as notional
  RiskPercent,       // `value` percent of the basis, lost at the stop-loss
};

enum class SizingBasis {
  Balance,
  Equity,
};

struct SizingConfig {
  SizingMode mode{SizingMode::PercentOfBalance};
  double value{1.0};
  SizingBasis basis{SizingBasis::Balance};
  // An entry this close to the current quote is sent as a market order.
  double closer_price{0.0};
  bool dual_entry_enabled{false};
  double dual_entry_ratio{0.5};  // share of volume on the first entry
};

enum class ProfitMetric {
  PriceDistance,     // price units in the position's favour
  FloatingProfit,    // venue-reported profit in account currency
  TakeProfitLevels,  // step i crosses when price reaches the signal's TP i
};

struct TrailingConfig {
  bool enabled{false};
  ProfitMetric metric{ProfitMetric::PriceDistance};
  double threshold{0.0};
  double step{0.0};  // distance kept between price and the trailed SL
};

struct ProfitStep {
  double threshold{0.0};
  double fraction{0.0};  // share of the remaining volume, (0, 1]
};

struct ProfitSavingConfig {
  bool enabled{false};
  ProfitMetric metric{ProfitMetric::TakeProfitLevels};
  std::vector<ProfitStep> steps;
};

struct OrderPolicyConfig {
  int pending_expiry_minutes{0};  // 0 disables expiry
  bool cancel_pending_on_trail{true};
  bool take_profit_closes_open_positions{false};
};

struct MonitorConfig {
  std::chrono::milliseconds interval{1000};
  int missing_ticks_to_close{2};
};

struct RetryConfig {
  int max_attempts{3};
  std::chrono::milliseconds initial_backoff{200};
  double multiplier{2.0};
  std::chrono::milliseconds max_backoff{5000};
};

struct VenueConfig {
  std::chrono::milliseconds call_timeout{5000};
  RetryConfig retry;
};

struct SourceConfig {
  std::string name;
  std::string type;
  std::string endpoint;
  nlohmann::json options = nlohmann::json::object();
};

struct IpcConfig {
  std::string command_endpoint;    // empty disables the IPC server
  std::string telemetry_endpoint;
};

struct PaperVenueConfig {
  double balance{10000.0};
  std::vector<domain::InstrumentInfo> instruments;
};

// -----------------------------------------------------------------------------
// EngineConfig
// -----------------------------------------------------------------------------
// Complete, immutable configuration of one engine instance. Built once at
// startup from JSON; every key is optional and falls back to defaultConfig().
// -----------------------------------------------------------------------------
struct EngineConfig {
  std::size_t lanes{4};
  std::string store_path;  // empty keeps signals in memory only
  std::size_t store_compact_every{256};  // journal lines between snapshots
  IpcConfig ipc;
  std::vector<SourceConfig> sources;
  ParserConfig parser;
  CommandConfig commands;
  FilterConfig filters;
  SizingConfig sizing;
  TrailingConfig trailing;
  ProfitSavingConfig profit_saving;
  OrderPolicyConfig orders;
  MonitorConfig monitor;
  VenueConfig venue;
  PaperVenueConfig paper_venue;
};

// Malformed configuration. The message names the offending key.
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

PatternTables defaultPatternTables();
KeywordTables defaultKeywords();
std::map<std::string, std::string> defaultSymbolAliases();

// Built-in configuration: default tables, 1% of balance sizing, no IPC, no
// sources, in-memory store.
EngineConfig defaultConfig();

// -----------------------------------------------------------------------------
// parseConfig(json) / loadConfigFile(path)
// -----------------------------------------------------------------------------
// @brief  Overlay a JSON document onto defaultConfig().
// @throws ConfigError on a wrong type, an unknown enum value, an invalid
//         "HH:MM" time, or (loadConfigFile) an unreadable / unparsable file.
// -----------------------------------------------------------------------------
EngineConfig parseConfig(const nlohmann::json& root);
EngineConfig loadConfigFile(const std::string& path);

const char* toString(ProfitMetric metric);

}  // namespace sigtrader
