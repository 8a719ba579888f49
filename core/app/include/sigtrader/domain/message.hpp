#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace sigtrader {
namespace domain {

// -----------------------------------------------------------------------------
// MessageKey
// -----------------------------------------------------------------------------
// Idempotency key of one inbound instruction. `qualifier` is empty for an
// ordinary message, "edit:<hash>" for an edited revision and "deleted" for a
// deletion notice, so each revision of a message is processed once.
// -----------------------------------------------------------------------------
struct MessageKey {
  std::string channel_id;
  std::int64_t message_id{0};
  std::string qualifier;

  std::string str() const {
    std::string s = channel_id + "#" + std::to_string(message_id);
    if (!qualifier.empty()) {
      s += "#" + qualifier;
    }
    return s;
  }

  bool operator==(const MessageKey& other) const {
    return channel_id == other.channel_id && message_id == other.message_id &&
           qualifier == other.qualifier;
  }
  bool operator!=(const MessageKey& other) const { return !(*this == other); }
};

// Key of the (channel, message) binding, independent of the revision.
inline std::string bindingKey(const std::string& channel_id,
                              std::int64_t message_id) {
  return channel_id + "#" + std::to_string(message_id);
}

// -----------------------------------------------------------------------------
// MessageRecord
// -----------------------------------------------------------------------------
// One message as delivered by a message source adapter.
// -----------------------------------------------------------------------------
struct MessageRecord {
  std::string source_name;
  std::string channel_id;
  std::int64_t message_id{0};
  std::optional<std::int64_t> reply_to;
  std::string text;
  bool edited{false};
  bool deleted{false};
  std::int64_t received_at_ms{0};
};

}  // namespace domain
}  // namespace sigtrader
