#include "sigtrader/store/json_file_signal_store.hpp"
#include "sigtrader/domain/errors.hpp"
#include "sigtrader/store/json_codec.hpp"

#include <cstdint>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <mutex>
#include <utility>

namespace sigtrader {

JsonFileSignalStore::JsonFileSignalStore(std::string path,
                                         std::size_t compact_every)
    : path_(std::move(path)),
      compact_every_(compact_every == 0 ? 1 : compact_every) {
  StoreSnapshot contents;
  {
    std::ifstream in(path_);
    if (in) {
      try {
        nlohmann::json root;
        in >> root;
        contents = root.get<StoreSnapshot>();
      } catch (const std::exception& e) {
        throw domain::StoreUnavailable("cannot load store file '" + path_ +
                                       "': " + e.what());
      }
    }
  }

  bool torn = false;
  const std::size_t replayed = replayJournal(contents, torn);
  if (replayed > 0 || torn) {
    compact(contents);
  }
  replaceContents(std::move(contents));

  const auto loaded = snapshot();
  std::cout << "[JsonFileSignalStore] loaded " << loaded->signals.size()
            << " signals, " << loaded->tickets.size() << " tickets from "
            << path_ << " (" << replayed << " journal entries replayed)\n";
}

std::size_t JsonFileSignalStore::replayJournal(StoreSnapshot& s,
                                               bool& torn) const {
  std::ifstream in(journalPath());
  if (!in) {
    return 0;
  }
  std::size_t applied = 0;
  std::size_t line_no = 0;
  std::string line;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty()) {
      continue;
    }
    if (torn) {
      throw domain::StoreUnavailable("journal '" + journalPath() +
                                     "' is corrupt before line " +
                                     std::to_string(line_no));
    }
    nlohmann::json entry;
    try {
      entry = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error&) {
      std::cerr << "[JsonFileSignalStore] dropping unreadable journal line "
                << line_no << "\n";
      torn = true;
      continue;
    }
    try {
      const auto version = entry.at("version").get<std::uint64_t>();
      if (version <= s.version) {
        continue;
      }
      applyMutation(s, entry.get<StoreMutation>());
      s.version = version;
      ++applied;
    } catch (const std::exception& e) {
      throw domain::StoreUnavailable("bad journal entry at line " +
                                     std::to_string(line_no) + ": " + e.what());
    }
  }
  return applied;
}

bool JsonFileSignalStore::ping() {
  const std::string check = path_ + ".ping";
  {
    std::ofstream out(check, std::ios::trunc);
    if (!out || !(out << "ok") || !out.flush()) {
      return false;
    }
  }
  std::remove(check.c_str());
  return true;
}

std::size_t JsonFileSignalStore::journalEntries() const {
  return journal_entries_;
}

void JsonFileSignalStore::persist(const StoreSnapshot& next,
                                  const StoreMutation& change) {
  if (must_compact_ || journal_entries_ + 1 >= compact_every_) {
    compact(next);
    return;
  }

  nlohmann::json entry = change;
  entry["version"] = next.version;
  std::ofstream out(journalPath(), std::ios::app);
  if (!out) {
    throw domain::StoreUnavailable("cannot open '" + journalPath() +
                                   "' for appending");
  }
  out << entry.dump() << '\n';
  out.flush();
  if (!out) {
    must_compact_ = true;
    throw domain::StoreUnavailable("append to '" + journalPath() + "' failed");
  }
  ++journal_entries_;
}

void JsonFileSignalStore::compact(const StoreSnapshot& s) {
  writeSnapshot(s);
  must_compact_ = false;
  journal_entries_ = 0;
  // Lines left behind are older than the snapshot and skipped on load.
  std::ofstream truncate(journalPath(), std::ios::trunc);
  if (!truncate) {
    std::cerr << "[JsonFileSignalStore] cannot truncate " << journalPath()
              << "\n";
  }
}

void JsonFileSignalStore::writeSnapshot(const StoreSnapshot& s) {
  const std::string tmp = path_ + ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      throw domain::StoreUnavailable("cannot open '" + tmp + "' for writing");
    }
    out << nlohmann::json(s).dump();
    out.flush();
    if (!out) {
      throw domain::StoreUnavailable("write to '" + tmp + "' failed");
    }
  }
  if (std::rename(tmp.c_str(), path_.c_str()) != 0) {
    throw domain::StoreUnavailable("cannot replace '" + path_ + "'");
  }
}

}  // namespace sigtrader
