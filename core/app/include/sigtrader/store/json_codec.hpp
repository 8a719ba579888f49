#pragma once

#include "sigtrader/domain/message.hpp"
#include "sigtrader/domain/signal.hpp"
#include "sigtrader/domain/ticket.hpp"
#include "sigtrader/report/channel_report.hpp"
#include "sigtrader/store/store_mutation.hpp"
#include "sigtrader/store/store_snapshot.hpp"

#include <nlohmann/json.hpp>

// -----------------------------------------------------------------------------
// nlohmann::json converters for the persisted domain types. Found by ADL, so
// `nlohmann::json j = signal;` and `j.get<domain::Ticket>()` just work. Enums
// are written as their display names; optional prices as number or null.
// Shared by JsonFileSignalStore (persistence) and the IPC server (telemetry
// and query replies).
// -----------------------------------------------------------------------------

namespace sigtrader {
namespace domain {

void to_json(nlohmann::json& j, const MessageKey& key);
void from_json(const nlohmann::json& j, MessageKey& key);

void to_json(nlohmann::json& j, const Signal& signal);
void from_json(const nlohmann::json& j, Signal& signal);

void to_json(nlohmann::json& j, const Ticket& ticket);
void from_json(const nlohmann::json& j, Ticket& ticket);

void to_json(nlohmann::json& j, const SignalHistoryEntry& entry);
void from_json(const nlohmann::json& j, SignalHistoryEntry& entry);

}  // namespace domain

void to_json(nlohmann::json& j, const StoreSnapshot& snapshot);
void from_json(const nlohmann::json& j, StoreSnapshot& snapshot);

// One journal record: {"op": "<kind>", ...} with only the fields the kind
// uses.
void to_json(nlohmann::json& j, const StoreMutation& mutation);
void from_json(const nlohmann::json& j, StoreMutation& mutation);

// Query replies only; never persisted.
void to_json(nlohmann::json& j, const ChannelStats& stats);

}  // namespace sigtrader
