#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

#include "msgforge/collaborators.hpp"
#include "msgforge/common.hpp"
#include "msgforge/message.hpp"

namespace msgforge {

// Process-local collaborators backing the CLI and the tests.

class InMemoryMessages : public MessageLookup, public MessageStore {
 public:
  struct Reaction {
    std::string user_id;
    std::string reaction;
  };

  void put(const Message& m) {
    std::lock_guard<std::mutex> lock(mu_);
    messages_[m.id] = m;
  }

  std::optional<Message> find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = messages_.find(id);
    if (it == messages_.end()) {
      return std::nullopt;
    }
    return it->second;
  }

  std::vector<Reaction> reactions(const std::string& message_id) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = reactions_.find(message_id);
    return it == reactions_.end() ? std::vector<Reaction>{} : it->second;
  }

  std::vector<Message> find_visible_by_ids(const std::vector<std::string>& ids) override {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<Message> out;
    for (const auto& id : ids) {
      auto it = messages_.find(id);
      if (it != messages_.end() && !hidden_.count(id)) {
        out.push_back(it->second);
      }
    }
    return out;
  }

  std::string insert(const Message& message) override {
    std::lock_guard<std::mutex> lock(mu_);
    Message m = message;
    if (m.id.empty()) {
      m.id = random_id();
    }
    messages_[m.id] = m;
    return m.id;
  }

  void update(const Message& message) override {
    std::lock_guard<std::mutex> lock(mu_);
    if (!messages_.count(message.id)) {
      throw std::runtime_error("message not found: " + message.id);
    }
    messages_[message.id] = message;
  }

  void remove(const std::string& message_id) override {
    std::lock_guard<std::mutex> lock(mu_);
    messages_.erase(message_id);
    reactions_.erase(message_id);
  }

  void set_reaction(const std::string& user_id, const std::string& message_id, const std::string& reaction,
                    bool should_react) override {
    std::lock_guard<std::mutex> lock(mu_);
    if (!messages_.count(message_id)) {
      throw std::runtime_error("message not found: " + message_id);
    }
    auto& list = reactions_[message_id];
    auto it = std::find_if(list.begin(), list.end(), [&](const Reaction& r) {
      return r.user_id == user_id && r.reaction == reaction;
    });
    if (should_react && it == list.end()) {
      list.push_back(Reaction{user_id, reaction});
    } else if (!should_react && it != list.end()) {
      list.erase(it);
    }
  }

  std::string create_system_message(const std::string& type, const std::string& room_id, const std::string& text,
                                    const UserRef& owner, bool read_receipts, const json& extra) override {
    Message m;
    m.id = random_id();
    m.type = type;
    m.room_id = room_id;
    m.text = text;
    m.sender = owner;
    m.ts = now_ms();
    std::lock_guard<std::mutex> lock(mu_);
    messages_[m.id] = m;
    system_meta_[m.id] = json{{"unread", read_receipts}, {"extra", extra}};
    return m.id;
  }

  json system_meta(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = system_meta_.find(id);
    return it == system_meta_.end() ? json() : it->second;
  }

  void hide(const std::string& id) {
    std::lock_guard<std::mutex> lock(mu_);
    hidden_.insert(id);
  }

 private:
  mutable std::mutex mu_;
  std::map<std::string, Message> messages_;
  std::map<std::string, std::vector<Reaction>> reactions_;
  std::map<std::string, json> system_meta_;
  std::set<std::string> hidden_;
};

class InMemoryRooms : public RoomLookup {
 public:
  void put(const Room& r) {
    std::lock_guard<std::mutex> lock(mu_);
    rooms_[r.id] = r;
  }

  std::vector<Room> find_by_ids(const std::vector<std::string>& ids) override {
    std::lock_guard<std::mutex> lock(mu_);
    std::vector<Room> out;
    for (const auto& id : ids) {
      auto it = rooms_.find(id);
      if (it != rooms_.end()) {
        out.push_back(it->second);
      }
    }
    return out;
  }

 private:
  std::mutex mu_;
  std::map<std::string, Room> rooms_;
};

// Room membership plus permission grants. A grant is either global
// ("mention-all") or room scoped ("<room_id>:mention-all").
class StaticAuthorization : public AuthorizationCheck {
 public:
  void allow_room(const std::string& room_id, const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mu_);
    access_[room_id].insert(user_id);
  }

  void grant(const std::string& user_id, const std::string& permission, const std::string& scope = "") {
    std::lock_guard<std::mutex> lock(mu_);
    grants_[user_id].insert(scope.empty() ? permission : scope + ":" + permission);
  }

  bool can_access_room(const Room& room, const ActingUser& user) override {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = access_.find(room.id);
    return it != access_.end() && it->second.count(user.id) > 0;
  }

  bool has_permission(const std::string& user_id, const std::string& permission,
                      const std::string& scope = "") override {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = grants_.find(user_id);
    if (it == grants_.end()) {
      return false;
    }
    return it->second.count(scope.empty() ? permission : scope + ":" + permission) > 0;
  }

 private:
  std::mutex mu_;
  std::map<std::string, std::set<std::string>> access_;
  std::map<std::string, std::set<std::string>> grants_;
};

class FixedUsageMeter : public UsageMeter {
 public:
  explicit FixedUsageMeter(bool within_limit) : within_limit_(within_limit) {}

  bool is_within_contact_limit(const Room&) override { return within_limit_; }

 private:
  bool within_limit_;
};

class LogBroadcaster : public EventBroadcaster {
 public:
  void broadcast(const std::string& event, const json& payload) override {
    Logger::log(Logger::Level::kInfo, "broadcast " + event + " " + payload.dump());
  }
};

class LogNotifier : public EphemeralNotifier {
 public:
  void notify(const std::string& user_id, const std::string& room_id, const std::string& text) override {
    Logger::log(Logger::Level::kInfo, "ephemeral to " + user_id + " in " + room_id + ": " + text);
  }
};

struct Fixtures {
  std::shared_ptr<InMemoryMessages> messages{std::make_shared<InMemoryMessages>()};
  std::shared_ptr<InMemoryRooms> rooms{std::make_shared<InMemoryRooms>()};
  std::shared_ptr<StaticAuthorization> authorization{std::make_shared<StaticAuthorization>()};
  std::shared_ptr<UsageMeter> usage;
};

// {"messages": [...], "rooms": [...], "access": {"<rid>": ["<uid>"]},
//  "permissions": {"<uid>": ["mention-all", "<rid>:mention-here"]},
//  "withinContactLimit": true}
inline Fixtures load_fixtures(const json& root) {
  Fixtures fx;
  if (!root.is_object()) {
    return fx;
  }
  if (root.contains("messages") && root["messages"].is_array()) {
    for (const auto& m : root["messages"]) {
      fx.messages->put(m.get<Message>());
    }
  }
  if (root.contains("rooms") && root["rooms"].is_array()) {
    for (const auto& r : root["rooms"]) {
      fx.rooms->put(r.get<Room>());
    }
  }
  if (root.contains("access") && root["access"].is_object()) {
    for (auto it = root["access"].begin(); it != root["access"].end(); ++it) {
      if (!it.value().is_array()) {
        continue;
      }
      for (const auto& uid : it.value()) {
        if (uid.is_string()) {
          fx.authorization->allow_room(it.key(), uid.get<std::string>());
        }
      }
    }
  }
  if (root.contains("permissions") && root["permissions"].is_object()) {
    for (auto it = root["permissions"].begin(); it != root["permissions"].end(); ++it) {
      if (!it.value().is_array()) {
        continue;
      }
      for (const auto& p : it.value()) {
        if (!p.is_string()) {
          continue;
        }
        const std::string perm = p.get<std::string>();
        const auto colon = perm.find(':');
        if (colon == std::string::npos) {
          fx.authorization->grant(it.key(), perm);
        } else {
          fx.authorization->grant(it.key(), perm.substr(colon + 1), perm.substr(0, colon));
        }
      }
    }
  }
  if (root.contains("withinContactLimit")) {
    fx.usage = std::make_shared<FixedUsageMeter>(root.value("withinContactLimit", true));
  }
  return fx;
}

}  // namespace msgforge
