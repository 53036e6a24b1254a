#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

#include "msgforge/common.hpp"
#include "msgforge/config.hpp"

namespace msgforge {

// In-process settings source. Watchers receive the complete values of every
// key they watch, never a single changed key, stamped with the registry
// revision those values were read at. Deliveries from concurrent writers may
// arrive out of order; a higher revision always carries newer values.
class SettingsRegistry {
 public:
  using Watcher = std::function<void(const json& values, uint64_t revision)>;

  explicit SettingsRegistry(json initial = default_settings_json()) : values_(std::move(initial)) {
    if (!values_.is_object()) {
      values_ = json::object();
    }
  }

  json get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mu_);
    return values_.contains(key) ? values_[key] : json();
  }

  json all() const {
    std::lock_guard<std::mutex> lock(mu_);
    return values_;
  }

  uint64_t revision() const {
    std::lock_guard<std::mutex> lock(mu_);
    return revision_;
  }

  void set(const std::string& key, const json& value) { set_many(json{{key, value}}); }

  // Applies every change first, then notifies each affected watcher once.
  void set_many(const json& changes) {
    if (!changes.is_object() || changes.empty()) {
      return;
    }

    std::vector<std::tuple<std::size_t, Watcher, json>> pending;
    uint64_t revision = 0;
    {
      std::lock_guard<std::mutex> lock(mu_);
      for (auto it = changes.begin(); it != changes.end(); ++it) {
        values_[it.key()] = it.value();
      }
      revision = ++revision_;
      for (auto& [id, w] : watchers_) {
        if (w.removed) {
          continue;
        }
        const bool touched = std::any_of(w.keys.begin(), w.keys.end(),
                                         [&](const std::string& k) { return changes.contains(k); });
        if (touched) {
          ++w.in_flight;
          pending.emplace_back(id, w.cb, values_for(w.keys));
        }
      }
    }

    for (const auto& [id, cb, values] : pending) {
      if (still_watching(id)) {
        try {
          cb(values, revision);
        } catch (const std::exception& e) {
          Logger::log(Logger::Level::kError, std::string("Settings watcher failed: ") + e.what());
        }
      }
      finish_delivery(id);
    }
  }

  // Registers a watcher and invokes it right away with the current values.
  std::size_t watch_multiple(std::vector<std::string> keys, Watcher cb) {
    json initial;
    std::size_t id = 0;
    uint64_t revision = 0;
    {
      std::lock_guard<std::mutex> lock(mu_);
      id = ++next_id_;
      initial = values_for(keys);
      revision = revision_;
      watchers_[id] = WatchEntry{std::move(keys), cb};
    }
    cb(initial, revision);
    return id;
  }

  // Returns once no delivery to this watcher is running. Must not be called
  // from inside that watcher.
  void unwatch(std::size_t id) {
    std::unique_lock<std::mutex> lock(mu_);
    auto it = watchers_.find(id);
    if (it == watchers_.end()) {
      return;
    }
    it->second.removed = true;
    idle_.wait(lock, [&] { return it->second.in_flight == 0; });
    watchers_.erase(it);
  }

 private:
  struct WatchEntry {
    std::vector<std::string> keys;
    Watcher cb;
    int in_flight{0};
    bool removed{false};
  };

  json values_for(const std::vector<std::string>& keys) const {
    json out = json::object();
    for (const auto& k : keys) {
      if (values_.contains(k)) {
        out[k] = values_[k];
      }
    }
    return out;
  }

  bool still_watching(std::size_t id) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = watchers_.find(id);
    return it != watchers_.end() && !it->second.removed;
  }

  void finish_delivery(std::size_t id) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      auto it = watchers_.find(id);
      if (it != watchers_.end()) {
        --it->second.in_flight;
      }
    }
    idle_.notify_all();
  }

  mutable std::mutex mu_;
  std::condition_variable idle_;
  json values_;
  std::map<std::size_t, WatchEntry> watchers_;
  std::size_t next_id_{0};
  uint64_t revision_{0};
};

// Keeps the current ConfigSnapshot. Each settings notification builds a whole
// new snapshot that replaces the previous one in a single swap. Notifications
// older than the last applied revision are dropped.
class ConfigWatcher {
 public:
  explicit ConfigWatcher(SettingsRegistry& settings, bool parser_enabled = !markdown_parser_disabled_by_env())
      : settings_(settings), parser_enabled_(parser_enabled) {
    current_ = std::make_shared<const ConfigSnapshot>(build_snapshot(settings_.all(), 0, parser_enabled_));
  }

  ~ConfigWatcher() { stop(); }

  ConfigWatcher(const ConfigWatcher&) = delete;
  ConfigWatcher& operator=(const ConfigWatcher&) = delete;

  void start() {
    std::lock_guard<std::mutex> lock(watch_mu_);
    if (watch_id_ != 0) {
      return;
    }
    watch_id_ = settings_.watch_multiple(pipeline_setting_keys(), [this](const json& values, uint64_t revision) {
      rebuild(values, revision);
    });
  }

  // Waits for a rebuild already in progress before returning.
  void stop() {
    std::lock_guard<std::mutex> lock(watch_mu_);
    if (watch_id_ == 0) {
      return;
    }
    settings_.unwatch(watch_id_);
    watch_id_ = 0;
  }

  std::shared_ptr<const ConfigSnapshot> current() const {
    std::lock_guard<std::mutex> lock(mu_);
    return current_;
  }

 private:
  void rebuild(const json& values, uint64_t revision) {
    std::lock_guard<std::mutex> lock(mu_);
    if (applied_revision_ && revision < *applied_revision_) {
      Logger::log(Logger::Level::kDebug, "Stale settings notification dropped",
                  json{{"revision", revision}, {"applied", *applied_revision_}});
      return;
    }
    applied_revision_ = revision;
    const uint64_t version = current_ ? current_->version + 1 : 1;
    current_ = std::make_shared<const ConfigSnapshot>(build_snapshot(values, version, parser_enabled_));
    Logger::log(Logger::Level::kDebug, "Pipeline config snapshot v" + std::to_string(version) + " active");
  }

  SettingsRegistry& settings_;
  bool parser_enabled_;
  mutable std::mutex mu_;
  std::shared_ptr<const ConfigSnapshot> current_;
  std::optional<uint64_t> applied_revision_;
  std::mutex watch_mu_;
  std::size_t watch_id_{0};
};

}  // namespace msgforge
