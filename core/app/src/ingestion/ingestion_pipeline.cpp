#include "sigtrader/ingestion/ingestion_pipeline.hpp"

#include "sigtrader/parser/level_rules.hpp"
#include "sigtrader/time/time_utils.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>
#include <utility>

namespace sigtrader {

using domain::Command;
using domain::CommandKind;
using domain::CommandOrigin;
using domain::MessageKey;

namespace {

bool listed(const std::vector<std::string>& list, const std::string& value) {
  return std::find(list.begin(), list.end(), value) != list.end();
}

std::vector<std::string> upperAll(std::vector<std::string> values) {
  for (auto& v : values) {
    std::transform(v.begin(), v.end(), v.begin(), [](char ch) {
      const auto c = static_cast<unsigned char>(ch);
      return c < 0x80 ? static_cast<char>(std::toupper(c)) : ch;
    });
  }
  return values;
}

std::string editQualifier(const std::string& text) {
  std::ostringstream out;
  out << "edit:" << std::hex << stableHash(text);
  return out.str();
}

MessageKey keyOf(const domain::MessageRecord& record, std::string qualifier = {}) {
  return MessageKey{record.channel_id, record.message_id, std::move(qualifier)};
}

}  // namespace

std::uint64_t stableHash(const std::string& text) {
  std::uint64_t hash = 0xcbf29ce484222325ULL;
  for (unsigned char c : text) {
    hash ^= c;
    hash *= 0x100000001b3ULL;
  }
  return hash;
}

IngestionPipeline::IngestionPipeline(const FilterConfig& filters,
                                     const CommandConfig& commands,
                                     const SignalParser& parser,
                                     const CommandClassifier& classifier,
                                     const ISignalStore& store,
                                     SignalIdGenerator& ids,
                                     const ITimeProvider& clock,
                                     RouteSink route, RejectionSink reject)
    : filters_(filters),
      edit_applies_to_last_signal_(commands.edit_applies_to_last_signal),
      parser_(parser),
      classifier_(classifier),
      store_(store),
      ids_(ids),
      clock_(clock),
      route_(std::move(route)),
      reject_(std::move(reject)) {
  filters_.symbol_allow = upperAll(filters_.symbol_allow);
  filters_.symbol_block = upperAll(filters_.symbol_block);

  EventBus& bus = loop_.eventBus();
  subscriptions_.emplace_back(
      bus, bus.subscribe<MessageEvent>(
               [this](const MessageEvent& e) { handleMessage(e); }));
  subscriptions_.emplace_back(
      bus, bus.subscribe<CommandEvent>(
               [this](const CommandEvent& e) { handleCommand(e); }));
}

IngestionPipeline::~IngestionPipeline() { stop(); }

void IngestionPipeline::start() { loop_.start(); }

void IngestionPipeline::stop() { loop_.stop(); }

bool IngestionPipeline::submitMessage(const domain::MessageRecord& record,
                                      AckCallback ack) {
  if (halted_.load() || !loop_.running()) {
    return false;
  }
  loop_.push(MessageEvent{record, std::move(ack)});
  return true;
}

bool IngestionPipeline::submitCommand(const Command& command, AckCallback ack) {
  if (halted_.load() || !loop_.running()) {
    return false;
  }
  loop_.push(CommandEvent{command, std::move(ack)});
  return true;
}

void IngestionPipeline::halt(const std::string& reason) {
  if (!halted_.exchange(true)) {
    std::cerr << "[IngestionPipeline] ingestion halted: " << reason << "\n";
  }
}

void IngestionPipeline::resume() {
  if (halted_.exchange(false)) {
    std::cout << "[IngestionPipeline] ingestion resumed\n";
  }
}

bool IngestionPipeline::waitIdle(std::chrono::milliseconds timeout) {
  return loop_.waitIdle(timeout);
}

// -----------------------------------------------------------------------------
// handleMessage
// -----------------------------------------------------------------------------
void IngestionPipeline::handleMessage(const MessageEvent& event) {
  const domain::MessageRecord& record = event.record;

  std::string why;
  if (!channelAllowed(record, why)) {
    reject(RejectionStage::Filter, why, keyOf(record), event.ack);
    return;
  }

  const auto bound = resolve(record.channel_id, record.message_id);
  if (record.deleted) {
    if (bound) {
      handleDeletion(event, *bound);
    } else {
      std::cout << "[IngestionPipeline] deletion of unbound message "
                << keyOf(record).str() << " ignored\n";
      if (event.ack) {
        event.ack();
      }
    }
    return;
  }
  if (record.edited && bound) {
    handleEdit(event, *bound);
    return;
  }
  if (record.reply_to) {
    handleReply(event);
    return;
  }
  handleNewMessage(event);
}

bool IngestionPipeline::channelAllowed(const domain::MessageRecord& record,
                                       std::string& why) const {
  if (listed(filters_.channel_block, record.channel_id)) {
    why = "channel_blocked";
    return false;
  }
  if (!filters_.channel_allow.empty() &&
      !listed(filters_.channel_allow, record.channel_id)) {
    why = "channel_not_allowed";
    return false;
  }
  return true;
}

void IngestionPipeline::handleDeletion(const MessageEvent& event,
                                       domain::SignalId target) {
  Command command;
  command.kind = CommandKind::Delete;
  command.target = target;
  command.source = keyOf(event.record, "deleted");
  command.origin = CommandOrigin::Deletion;
  routeCommand(std::move(command), event.ack);
}

void IngestionPipeline::handleEdit(const MessageEvent& event,
                                   domain::SignalId target) {
  const domain::MessageRecord& record = event.record;
  const MessageKey key = keyOf(record, editQualifier(record.text));

  LevelUpdate levels;
  ParseOutcome parsed = parser_.parse(record.text);
  if (const auto* signal = std::get_if<domain::Signal>(&parsed)) {
    levels.stop_loss = signal->stop_loss;
    levels.take_profits = signal->take_profits;
  } else {
    levels = parser_.extractLevels(record.text);
  }
  if (levels.empty()) {
    reject(RejectionStage::Parse, "edit_without_values", key, event.ack,
           target);
    return;
  }

  Command command;
  command.kind = CommandKind::Edit;
  command.target = target;
  command.source = key;
  command.origin = CommandOrigin::Edit;
  command.new_stop_loss = levels.stop_loss;
  command.new_take_profits = std::move(levels.take_profits);
  routeCommand(std::move(command), event.ack);
}

void IngestionPipeline::handleReply(const MessageEvent& event) {
  const domain::MessageRecord& record = event.record;
  const MessageKey key = keyOf(record);

  ClassifyOutcome outcome = classifier_.classify(record.text);
  if (const auto* none = std::get_if<NotACommand>(&outcome)) {
    reject(RejectionStage::Classify, none->reason, key, event.ack);
    return;
  }

  const auto target = resolve(record.channel_id, *record.reply_to);
  if (!target) {
    reject(RejectionStage::Target, "unresolved_command_target", key, event.ack);
    return;
  }

  Command command = std::get<Command>(std::move(outcome));
  command.target = *target;
  command.source = key;
  command.origin = CommandOrigin::Reply;
  routeCommand(std::move(command), event.ack);
}

void IngestionPipeline::handleNewMessage(const MessageEvent& event) {
  const domain::MessageRecord& record = event.record;
  const MessageKey key = keyOf(record);

  const TradingWindow& window = filters_.trading_window;
  if (window.enabled &&
      !withinDailyWindow(minuteOfDay(clock_.now_ms(), window.utc_offset_minutes),
                         window.start_minute, window.end_minute)) {
    reject(RejectionStage::Filter, "outside_trading_window", key, event.ack);
    return;
  }

  ParseOutcome parsed = parser_.parse(record.text);
  if (const auto* rejected = std::get_if<domain::ParseRejected>(&parsed)) {
    if (edit_applies_to_last_signal_ && tryLastSignalEdit(event)) {
      return;
    }
    reject(RejectionStage::Parse, rejected->reason, key, event.ack);
    return;
  }

  domain::Signal signal = std::get<domain::Signal>(std::move(parsed));
  if (listed(filters_.symbol_block, signal.symbol) ||
      (!filters_.symbol_allow.empty() &&
       !listed(filters_.symbol_allow, signal.symbol))) {
    reject(RejectionStage::Parse, "symbol_not_allowed", key, event.ack);
    return;
  }

  auto snap = store_.snapshot();
  if (snap->isProcessed(key)) {
    std::cout << "[IngestionPipeline] " << key.str()
              << " already processed\n";
    if (event.ack) {
      event.ack();
    }
    return;
  }

  const std::string binding = domain::bindingKey(key.channel_id, key.message_id);
  auto known = routes_.find(binding);
  signal.id = known != routes_.end() ? known->second : ids_.next_id();
  signal.source = key;
  signal.provider = record.source_name;

  routes_[binding] = signal.id;
  latest_[key.channel_id] = signal.id;
  assigned_.insert(signal.id);

  std::cout << "[IngestionPipeline] " << key.str() << " -> signal "
            << signal.id << " " << signal.symbol << "\n";
  const domain::SignalId id = signal.id;
  route_(id, NewSignalEvent{std::move(signal), key, event.ack});

  if (routes_.size() >= next_sweep_at_) {
    pruneRoutes();
    next_sweep_at_ = std::max(kRouteSweepSize, 2 * routes_.size());
  }
}

std::size_t IngestionPipeline::pruneRoutes() {
  auto snap = store_.snapshot();
  std::size_t dropped = 0;
  for (auto it = routes_.begin(); it != routes_.end();) {
    if (snap->findSignal(it->second) != nullptr) {
      it = routes_.erase(it);
      ++dropped;
    } else {
      ++it;
    }
  }
  for (auto it = assigned_.begin(); it != assigned_.end();) {
    if (snap->findSignal(*it) != nullptr) {
      it = assigned_.erase(it);
      ++dropped;
    } else {
      ++it;
    }
  }
  for (auto it = latest_.begin(); it != latest_.end();) {
    if (snap->latestSignalFor(it->first) == it->second) {
      it = latest_.erase(it);
      ++dropped;
    } else {
      ++it;
    }
  }
  if (dropped > 0) {
    std::cout << "[IngestionPipeline] route table pruned: " << dropped
              << " entr" << (dropped == 1 ? "y" : "ies") << ", "
              << routes_.size() << " route(s) left\n";
  }
  return dropped;
}

bool IngestionPipeline::tryLastSignalEdit(const MessageEvent& event) {
  ClassifyOutcome outcome = classifier_.classify(event.record.text);
  const auto* command = std::get_if<Command>(&outcome);
  if (command == nullptr || command->kind != CommandKind::Edit) {
    return false;
  }
  const auto target = latestFor(event.record.channel_id);
  if (!target) {
    return false;
  }
  Command edit = *command;
  edit.target = *target;
  edit.source = keyOf(event.record);
  edit.origin = CommandOrigin::Reply;
  routeCommand(std::move(edit), event.ack);
  return true;
}

// -----------------------------------------------------------------------------
// handleCommand: operator commands
// -----------------------------------------------------------------------------
void IngestionPipeline::handleCommand(const CommandEvent& event) {
  if (event.command.target == 0 || !signalKnown(event.command.target)) {
    reject(RejectionStage::Target, "unresolved_command_target",
           event.command.source, event.ack, event.command.target);
    return;
  }
  routeCommand(event.command, event.ack);
}

std::optional<domain::SignalId> IngestionPipeline::resolve(
    const std::string& channel_id, std::int64_t message_id) const {
  auto it = routes_.find(domain::bindingKey(channel_id, message_id));
  if (it != routes_.end()) {
    return it->second;
  }
  return store_.snapshot()->signalForMessage(channel_id, message_id);
}

std::optional<domain::SignalId> IngestionPipeline::latestFor(
    const std::string& channel_id) const {
  auto it = latest_.find(channel_id);
  if (it != latest_.end()) {
    return it->second;
  }
  return store_.snapshot()->latestSignalFor(channel_id);
}

bool IngestionPipeline::signalKnown(domain::SignalId id) const {
  return assigned_.count(id) > 0 || store_.snapshot()->findSignal(id) != nullptr;
}

void IngestionPipeline::routeCommand(Command command, const AckCallback& ack) {
  std::cout << "[IngestionPipeline] " << toString(command.kind) << " from "
            << command.source.str() << " -> signal " << command.target << "\n";
  const domain::SignalId target = command.target;
  route_(target, CommandEvent{std::move(command), ack});
}

void IngestionPipeline::reject(RejectionStage stage, const std::string& reason,
                               const MessageKey& source, const AckCallback& ack,
                               domain::SignalId id) {
  std::cout << "[IngestionPipeline] " << source.str() << " rejected ("
            << toString(stage) << "): " << reason << "\n";
  if (reject_) {
    reject_(RejectionEvent{stage, reason, source, id, clock_.now_ms()});
  }
  if (ack) {
    ack();
  }
}

}  // namespace sigtrader
