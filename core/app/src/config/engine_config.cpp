#include "sigtrader/config/engine_config.hpp"
#include "sigtrader/time/time_utils.hpp"

#include <fstream>
#include <utility>

namespace sigtrader {

namespace {

using nlohmann::json;

// -----------------------------------------------------------------------------
// Typed accessors: leave `out` untouched when the key is absent or null,
// convert type errors into ConfigError naming the full key path.
// -----------------------------------------------------------------------------
template <typename T>
void read(const json& node, const std::string& path, const char* key, T& out) {
  auto it = node.find(key);
  if (it == node.end() || it->is_null()) {
    return;
  }
  try {
    out = it->get<T>();
  } catch (const json::exception& e) {
    throw ConfigError("config key '" + path + key + "': " + e.what());
  }
}

void readMillis(const json& node, const std::string& path, const char* key,
                std::chrono::milliseconds& out) {
  long long ms = out.count();
  read(node, path, key, ms);
  if (ms < 0) {
    throw ConfigError("config key '" + path + key + "' must not be negative");
  }
  out = std::chrono::milliseconds(ms);
}

const json& section(const json& root, const char* key) {
  static const json kEmpty = json::object();
  auto it = root.find(key);
  if (it == root.end() || it->is_null()) {
    return kEmpty;
  }
  if (!it->is_object()) {
    throw ConfigError(std::string("config section '") + key +
                      "' must be an object");
  }
  return *it;
}

ProfitMetric parseMetric(const std::string& text, const std::string& key) {
  if (text == "price" || text == "price_distance") {
    return ProfitMetric::PriceDistance;
  }
  if (text == "profit" || text == "floating_profit") {
    return ProfitMetric::FloatingProfit;
  }
  if (text == "take_profit_levels" || text == "tp_levels") {
    return ProfitMetric::TakeProfitLevels;
  }
  throw ConfigError("config key '" + key + "': unknown metric '" + text + "'");
}

SizingMode parseSizingMode(const std::string& text) {
  if (text == "fixed") {
    return SizingMode::Fixed;
  }
  if (text == "percentOfBalance" || text == "percent_of_balance") {
    return SizingMode::PercentOfBalance;
  }
  if (text == "riskPercent" || text == "risk_percent") {
    return SizingMode::RiskPercent;
  }
  throw ConfigError("config key 'sizing.mode': unknown mode '" + text + "'");
}

// "1%" means one percent of balance, "0.05" a fixed volume.
void applyLotShorthand(const std::string& lot, SizingConfig& sizing) {
  std::string number = lot;
  const bool percent = !number.empty() && number.back() == '%';
  if (percent) {
    number.pop_back();
  }
  try {
    std::size_t used = 0;
    const double v = std::stod(number, &used);
    if (used != number.size() || v <= 0.0) {
      throw ConfigError("config key 'sizing.lot': invalid lot '" + lot + "'");
    }
    sizing.mode = percent ? SizingMode::PercentOfBalance : SizingMode::Fixed;
    sizing.value = v;
  } catch (const std::logic_error&) {
    throw ConfigError("config key 'sizing.lot': invalid lot '" + lot + "'");
  }
}

std::vector<PatternEntry> parsePatternList(const json& node,
                                           const std::string& key) {
  if (!node.is_array()) {
    throw ConfigError("config key '" + key + "' must be an array");
  }
  std::vector<PatternEntry> entries;
  for (const auto& item : node) {
    PatternEntry entry;
    if (item.is_string()) {
      entry.pattern = item.get<std::string>();
    } else if (item.is_object()) {
      read(item, key + ".", "pattern", entry.pattern);
      read(item, key + ".", "group", entry.group);
      read(item, key + ".", "value", entry.value);
    } else {
      throw ConfigError("config key '" + key +
                        "' entries must be strings or objects");
    }
    if (entry.pattern.empty() || entry.group < 0) {
      throw ConfigError("config key '" + key + "' has an invalid entry");
    }
    entries.push_back(std::move(entry));
  }
  return entries;
}

void readPatterns(const json& node, PatternTables& tables) {
  const std::pair<const char*, std::vector<PatternEntry>*> fields[] = {
      {"direction", &tables.direction},
      {"symbol", &tables.symbol},
      {"first_price", &tables.first_price},
      {"second_price", &tables.second_price},
      {"stop_loss", &tables.stop_loss},
      {"take_profit", &tables.take_profit},
  };
  for (const auto& [key, target] : fields) {
    auto it = node.find(key);
    if (it != node.end() && !it->is_null()) {
      *target = parsePatternList(*it, std::string("parser.patterns.") + key);
    }
  }
}

int readClock(const json& node, const char* key) {
  std::string text;
  read(node, "filters.trading_window.", key, text);
  auto minutes = parseClockMinutes(text);
  if (!minutes) {
    throw ConfigError(std::string("config key 'filters.trading_window.") +
                      key + "': expected HH:MM, got '" + text + "'");
  }
  return *minutes;
}

domain::InstrumentInfo parseInstrument(const json& node) {
  const std::string path = "paper_venue.instruments.";
  domain::InstrumentInfo info;
  read(node, path, "symbol", info.symbol);
  read(node, path, "contract_size", info.contract_size);
  read(node, path, "min_volume", info.min_volume);
  read(node, path, "max_volume", info.max_volume);
  read(node, path, "volume_step", info.volume_step);
  read(node, path, "tradable", info.tradable);
  read(node, path, "bid", info.bid);
  read(node, path, "ask", info.ask);
  read(node, path, "margin_rate", info.margin_rate);
  if (info.symbol.empty()) {
    throw ConfigError("config key 'paper_venue.instruments' entry has no symbol");
  }
  return info;
}

}  // namespace

// -----------------------------------------------------------------------------
// Defaults
// -----------------------------------------------------------------------------

PatternTables defaultPatternTables() {
  PatternTables t;

  t.direction = {
      {R"re(\b(BUY|LONG)\b)re", 1, "buy"},
      {R"re(\b(SELL|SHORT)\b)re", 1, "sell"},
      {R"re((خرید))re", 1, "buy"},
      {R"re((فروش))re", 1, "sell"},
  };

  t.symbol = {
      {R"re(\b([A-Z]{3}\s?/\s?[A-Z]{3})\b)re", 1, ""},
      {R"re(\b((?:AUD|CAD|CHF|EUR|GBP|JPY|NZD|USD|XAU|XAG|BTC|ETH)[A-Z]{3})\b)re",
       1, ""},
      {R"re(\b(US30|US100|US500|NAS100|SPX500|GER40|UK100|USOIL|UKOIL)\b)re", 1,
       ""},
      {R"re(\b(?:BUY|SELL)\s+(?:LIMIT\s+|STOP\s+|NOW\s+)?([A-Z][A-Z0-9]{2,9})\b)re",
       1, ""},
      {R"re(\b([A-Z][A-Z0-9]{2,9})\s+(?:BUY|SELL)\b)re", 1, ""},
  };

  t.first_price = {
      {R"re(@\s*({NUM}))re", 1, ""},
      {R"re(\b(?:ENTRY|ENTER|PRICE|OPEN)(?:\s*PRICE)?\s*[:@=\-]?\s*({NUM}))re", 1,
       ""},
      {R"re(\b(?:BUY|SELL)\s+(?:LIMIT\s+|STOP\s+|NOW\s+)?[A-Z/]{3,10}\s*(?:NOW\s*)?[:@=\-]?\s*({NUM}))re",
       1, ""},
      {R"re(\b[A-Z/]{3,10}\s+(?:BUY|SELL)\s+(?:LIMIT\s+|STOP\s+|NOW\s+)?[:@=\-]?\s*({NUM}))re",
       1, ""},
      {R"re(\b(?:BUY|SELL)\s+(?:LIMIT\s+|STOP\s+|NOW\s+)?[:@=\-]?\s*({NUM}))re", 1,
       ""},
      {R"re((?:خرید|فروش)[^0-9\n]*({NUM}))re", 1, ""},
      {R"re((?:^|[^A-Z0-9.])({NUM}))re", 1, ""},
  };

  t.second_price = {
      {R"re(@\s*{NUM}\s*(?:-|_|/|＿)+\s*({NUM}))re", 1, ""},
      {R"re(\b{NUM}\s*(?:_|＿)+\s*({NUM}))re", 1, ""},
      {R"re(\b2(?:ND)?\s*(?:LIMIT|ENTRY)\s*[:@=\-]?\s*({NUM}))re", 1, ""},
      {R"re(\bENTRY\s*2\s*[:@=\-]\s*({NUM}))re", 1, ""},
      {R"re(\b(?:BUY|SELL)\b[^0-9\n]*{NUM}\s*-\s*({NUM}))re", 1, ""},
      {R"re((?:خرید|فروش)[^0-9\n]*{NUM}\s*و\s*({NUM}))re", 1, ""},
  };

  t.stop_loss = {
      {R"re(\b(?:STOP\s*LOSS|STOPLOSS|SL|S\.L)\s*[:@=\-.]*\s*({NUM}))re", 1, ""},
      {R"re((?:حد\s*ضرر|استاپ\s*لاس|استاپ|ضرر)\s*[:@=\-]*\s*({NUM}))re", 1, ""},
      {R"re(حد\s*[:@=\-]*\s*({NUM}))re", 1, ""},
      {R"re(\bSTOP\s*[:@=\-]+\s*({NUM}))re", 1, ""},
  };

  t.take_profit = {
      {R"re(\bTP\s*{IDX}\s*[:@=\-.)]*\s*({NUMLIST}))re", 1, ""},
      {R"re(\bTAKE\s*PROFIT\s*{IDX}\s*[:@=\-.)]*\s*({NUMLIST}))re", 1, ""},
      {R"re(\bTARGETS?\s*{IDX}\s*[:@=\-.)]*\s*({NUMLIST}))re", 1, ""},
      {R"re(تی\s*پی\s*{IDX}\s*[:@=\-.)]*\s*({NUMLIST}))re", 1, ""},
      {R"re((?:تارگت|هدف)\s*{IDX}\s*[:@=\-.)]*\s*({NUMLIST}))re", 1, ""},
  };

  return t;
}

KeywordTables defaultKeywords() {
  KeywordTables k;
  k.delete_keywords = {"delete", "close", "cancel", "exit",
                       "حذف",    "ببند",  "کنسل"};
  k.risk_free = {"risk free", "riskfree",  "risk-free", "breakeven",
                 "break even", "ریسک فری", "سر به سر"};
  k.half_close = {"half", "close half", "نصف", "نیمی"};
  k.take_profit = {"tp", "take profit", "target hit", "تی پی", "تارگت"};
  k.edit = {"edit",  "update", "change", "modify", "move sl",
            "new sl", "ادیت",   "تغییر",  "اصلاح"};
  return k;
}

std::map<std::string, std::string> defaultSymbolAliases() {
  return {
      {"GOLD", "XAUUSD"},   {"XAU", "XAUUSD"},     {"طلا", "XAUUSD"},
      {"SILVER", "XAGUSD"}, {"US30", "DJIUSD"},    {"DJ30", "DJIUSD"},
      {"DOW", "DJIUSD"},    {"BITCOIN", "BTCUSD"}, {"OIL", "USOIL"},
  };
}

EngineConfig defaultConfig() {
  EngineConfig config;
  config.parser.patterns = defaultPatternTables();
  config.parser.symbol_aliases = defaultSymbolAliases();
  config.commands.keywords = defaultKeywords();
  config.profit_saving.steps = {
      {0.0, 0.25}, {0.0, 0.25}, {0.0, 0.25}, {0.0, 0.25}};
  return config;
}

// -----------------------------------------------------------------------------
// parseConfig()
// -----------------------------------------------------------------------------
EngineConfig parseConfig(const json& root) {
  if (!root.is_object()) {
    throw ConfigError("config root must be a JSON object");
  }
  EngineConfig config = defaultConfig();

  // --- engine / ipc ----------------------------------------------------------
  const json& engine = section(root, "engine");
  read(engine, "engine.", "lanes", config.lanes);
  read(engine, "engine.", "store_path", config.store_path);
  read(engine, "engine.", "store_compact_every", config.store_compact_every);
  if (config.lanes == 0) {
    throw ConfigError("config key 'engine.lanes' must be at least 1");
  }
  if (config.store_compact_every == 0) {
    throw ConfigError(
        "config key 'engine.store_compact_every' must be at least 1");
  }

  const json& ipc = section(root, "ipc");
  read(ipc, "ipc.", "command_endpoint", config.ipc.command_endpoint);
  read(ipc, "ipc.", "telemetry_endpoint", config.ipc.telemetry_endpoint);

  // --- sources ---------------------------------------------------------------
  if (auto it = root.find("sources"); it != root.end() && !it->is_null()) {
    if (!it->is_array()) {
      throw ConfigError("config key 'sources' must be an array");
    }
    for (const auto& node : *it) {
      SourceConfig source;
      read(node, "sources.", "name", source.name);
      read(node, "sources.", "type", source.type);
      read(node, "sources.", "endpoint", source.endpoint);
      if (auto opts = node.find("options"); opts != node.end()) {
        source.options = *opts;
      }
      if (source.type.empty()) {
        throw ConfigError("config key 'sources.type' is required");
      }
      if (source.name.empty()) {
        source.name = source.type;
      }
      config.sources.push_back(std::move(source));
    }
  }

  // --- parser ----------------------------------------------------------------
  const json& parser = section(root, "parser");
  read(parser, "parser.", "require_stop_loss", config.parser.require_stop_loss);
  read(parser, "parser.", "decimal_comma", config.parser.decimal_comma);
  readPatterns(section(parser, "patterns"), config.parser.patterns);
  std::map<std::string, std::string> aliases;
  read(parser, "parser.", "symbol_aliases", aliases);
  for (auto& [alias, symbol] : aliases) {
    config.parser.symbol_aliases[alias] = symbol;
  }

  // --- commands --------------------------------------------------------------
  const json& commands = section(root, "commands");
  const json& keywords = section(commands, "keywords");
  KeywordTables& kw = config.commands.keywords;
  read(keywords, "commands.keywords.", "delete", kw.delete_keywords);
  read(keywords, "commands.keywords.", "risk_free", kw.risk_free);
  read(keywords, "commands.keywords.", "half_close", kw.half_close);
  read(keywords, "commands.keywords.", "take_profit", kw.take_profit);
  read(keywords, "commands.keywords.", "edit", kw.edit);
  read(commands, "commands.", "half_modifier_overrides_delete",
       config.commands.half_modifier_overrides_delete);
  read(commands, "commands.", "edit_applies_to_last_signal",
       config.commands.edit_applies_to_last_signal);

  // --- filters ---------------------------------------------------------------
  const json& filters = section(root, "filters");
  const json& channels = section(filters, "channels");
  read(channels, "filters.channels.", "allow", config.filters.channel_allow);
  read(channels, "filters.channels.", "block", config.filters.channel_block);
  const json& symbols = section(filters, "symbols");
  read(symbols, "filters.symbols.", "allow", config.filters.symbol_allow);
  read(symbols, "filters.symbols.", "block", config.filters.symbol_block);
  const json& window = section(filters, "trading_window");
  if (window.contains("start") || window.contains("end")) {
    TradingWindow& tw = config.filters.trading_window;
    tw.enabled = true;
    tw.start_minute = readClock(window, "start");
    tw.end_minute = readClock(window, "end");
    read(window, "filters.trading_window.", "utc_offset_minutes",
         tw.utc_offset_minutes);
  }

  // --- sizing ----------------------------------------------------------------
  const json& sizing = section(root, "sizing");
  SizingConfig& sz = config.sizing;
  std::string mode;
  read(sizing, "sizing.", "mode", mode);
  if (!mode.empty()) {
    sz.mode = parseSizingMode(mode);
  }
  read(sizing, "sizing.", "value", sz.value);
  std::string lot;
  read(sizing, "sizing.", "lot", lot);
  if (!lot.empty()) {
    applyLotShorthand(lot, sz);
  }
  std::string basis;
  read(sizing, "sizing.", "basis", basis);
  if (basis == "equity") {
    sz.basis = SizingBasis::Equity;
  } else if (basis == "balance" || basis.empty()) {
    sz.basis = SizingBasis::Balance;
  } else {
    throw ConfigError("config key 'sizing.basis': unknown basis '" + basis +
                      "'");
  }
  read(sizing, "sizing.", "closer_price", sz.closer_price);
  const json& dual = section(sizing, "dual_entry");
  read(dual, "sizing.dual_entry.", "enabled", sz.dual_entry_enabled);
  read(dual, "sizing.dual_entry.", "ratio", sz.dual_entry_ratio);
  if (sz.dual_entry_ratio <= 0.0 || sz.dual_entry_ratio >= 1.0) {
    throw ConfigError("config key 'sizing.dual_entry.ratio' must be in (0, 1)");
  }
  if (sz.value <= 0.0) {
    throw ConfigError("config key 'sizing.value' must be positive");
  }
  config.parser.dual_entry_enabled = sz.dual_entry_enabled;

  // --- trailing / profit saving ----------------------------------------------
  const json& trailing = section(root, "trailing");
  read(trailing, "trailing.", "enabled", config.trailing.enabled);
  read(trailing, "trailing.", "threshold", config.trailing.threshold);
  read(trailing, "trailing.", "step", config.trailing.step);
  std::string metric;
  read(trailing, "trailing.", "metric", metric);
  if (!metric.empty()) {
    config.trailing.metric = parseMetric(metric, "trailing.metric");
  }
  if (config.trailing.metric == ProfitMetric::TakeProfitLevels) {
    throw ConfigError("config key 'trailing.metric' cannot be take_profit_levels");
  }

  const json& saving = section(root, "profit_saving");
  read(saving, "profit_saving.", "enabled", config.profit_saving.enabled);
  metric.clear();
  read(saving, "profit_saving.", "metric", metric);
  if (!metric.empty()) {
    config.profit_saving.metric = parseMetric(metric, "profit_saving.metric");
  }
  if (auto it = saving.find("steps"); it != saving.end() && !it->is_null()) {
    if (!it->is_array()) {
      throw ConfigError("config key 'profit_saving.steps' must be an array");
    }
    config.profit_saving.steps.clear();
    for (const auto& node : *it) {
      ProfitStep step;
      if (node.is_number()) {
        // Shorthand: a plain percentage per take-profit level.
        step.fraction = node.get<double>() / 100.0;
      } else {
        read(node, "profit_saving.steps.", "threshold", step.threshold);
        read(node, "profit_saving.steps.", "fraction", step.fraction);
      }
      if (step.fraction <= 0.0 || step.fraction > 1.0) {
        throw ConfigError(
            "config key 'profit_saving.steps.fraction' must be in (0, 1]");
      }
      config.profit_saving.steps.push_back(step);
    }
  }

  // --- orders / monitor / venue ----------------------------------------------
  const json& orders = section(root, "orders");
  read(orders, "orders.", "pending_expiry_minutes",
       config.orders.pending_expiry_minutes);
  read(orders, "orders.", "cancel_pending_on_trail",
       config.orders.cancel_pending_on_trail);
  read(orders, "orders.", "take_profit_closes_open_positions",
       config.orders.take_profit_closes_open_positions);

  const json& monitor = section(root, "monitor");
  readMillis(monitor, "monitor.", "interval_ms", config.monitor.interval);
  read(monitor, "monitor.", "missing_ticks_to_close",
       config.monitor.missing_ticks_to_close);
  if (config.monitor.missing_ticks_to_close < 1) {
    throw ConfigError("config key 'monitor.missing_ticks_to_close' must be >= 1");
  }

  const json& venue = section(root, "venue");
  readMillis(venue, "venue.", "call_timeout_ms", config.venue.call_timeout);
  const json& retry = section(venue, "retry");
  RetryConfig& rc = config.venue.retry;
  read(retry, "venue.retry.", "max_attempts", rc.max_attempts);
  readMillis(retry, "venue.retry.", "initial_backoff_ms", rc.initial_backoff);
  read(retry, "venue.retry.", "multiplier", rc.multiplier);
  readMillis(retry, "venue.retry.", "max_backoff_ms", rc.max_backoff);
  if (rc.max_attempts < 1 || rc.multiplier < 1.0) {
    throw ConfigError(
        "config keys 'venue.retry.max_attempts' >= 1 and "
        "'venue.retry.multiplier' >= 1 required");
  }

  // --- paper venue -----------------------------------------------------------
  const json& paper = section(root, "paper_venue");
  read(paper, "paper_venue.", "balance", config.paper_venue.balance);
  if (auto it = paper.find("instruments"); it != paper.end() && it->is_array()) {
    for (const auto& node : *it) {
      config.paper_venue.instruments.push_back(parseInstrument(node));
    }
  }

  return config;
}

EngineConfig loadConfigFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open config file '" + path + "'");
  }
  json root;
  try {
    in >> root;
  } catch (const json::exception& e) {
    throw ConfigError("config file '" + path + "' is not valid JSON: " +
                      e.what());
  }
  return parseConfig(root);
}

const char* toString(ProfitMetric metric) {
  switch (metric) {
    case ProfitMetric::PriceDistance:    return "price_distance";
    case ProfitMetric::FloatingProfit:   return "floating_profit";
    case ProfitMetric::TakeProfitLevels: return "take_profit_levels";
  }
  return "unknown";
}

}  // namespace sigtrader
