#pragma once

#include "sigtrader/config/engine_config.hpp"
#include "sigtrader/source/i_message_source.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace sigtrader {

// -----------------------------------------------------------------------------
// MessageSourceRegistry
// -----------------------------------------------------------------------------
//
// @brief  Maps a source type name ("zmq", ...) to a factory.
//
// @details
// The process-wide instance() is filled once at startup by
// registerBuiltinSources(); the engine then builds one source per entry of
// EngineConfig::sources. Tests construct their own registry and register
// in-process source types.
//
// Thread-safety: all methods lock an internal mutex.
// -----------------------------------------------------------------------------
class MessageSourceRegistry {
 public:
  using Factory = std::function<std::unique_ptr<IMessageSource>(
      const SourceConfig&, MessageSink)>;

  MessageSourceRegistry() = default;

  MessageSourceRegistry(const MessageSourceRegistry&) = delete;
  MessageSourceRegistry& operator=(const MessageSourceRegistry&) = delete;

  static MessageSourceRegistry& instance();

  // @return false if `type` was already registered (the first one stays).
  bool registerType(const std::string& type, Factory factory);

  bool contains(const std::string& type) const;
  std::vector<std::string> types() const;

  // @throws ConfigError for an unknown type.
  std::unique_ptr<IMessageSource> create(const SourceConfig& config,
                                         MessageSink sink) const;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, Factory> factories_;
};

// Registers the source types shipped with the engine ("zmq").
void registerBuiltinSources(MessageSourceRegistry& registry);

}  // namespace sigtrader
