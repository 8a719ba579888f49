#include "sigtrader/source/message_source_registry.hpp"

#include "sigtrader/source/zmq_message_source.hpp"

#include <utility>

namespace sigtrader {

MessageSourceRegistry& MessageSourceRegistry::instance() {
  static MessageSourceRegistry registry;
  return registry;
}

bool MessageSourceRegistry::registerType(const std::string& type,
                                         Factory factory) {
  std::lock_guard lock(mutex_);
  return factories_.emplace(type, std::move(factory)).second;
}

bool MessageSourceRegistry::contains(const std::string& type) const {
  std::lock_guard lock(mutex_);
  return factories_.count(type) > 0;
}

std::vector<std::string> MessageSourceRegistry::types() const {
  std::lock_guard lock(mutex_);
  std::vector<std::string> out;
  for (const auto& [type, factory] : factories_) {
    out.push_back(type);
  }
  return out;
}

std::unique_ptr<IMessageSource> MessageSourceRegistry::create(
    const SourceConfig& config, MessageSink sink) const {
  Factory factory;
  {
    std::lock_guard lock(mutex_);
    auto it = factories_.find(config.type);
    if (it == factories_.end()) {
      throw ConfigError("sources: unknown type '" + config.type +
                        "' for source '" + config.name + "'");
    }
    factory = it->second;
  }
  return factory(config, std::move(sink));
}

void registerBuiltinSources(MessageSourceRegistry& registry) {
  registry.registerType("zmq", [](const SourceConfig& config, MessageSink sink) {
    return std::make_unique<ZmqMessageSource>(config, std::move(sink));
  });
}

}  // namespace sigtrader
