#pragma once

#include <string>
#include <vector>

#include "msgforge/common.hpp"
#include "msgforge/message.hpp"

namespace msgforge {

// Interfaces the pipeline and service consume. Implementations used by the
// concurrent validation checks must be safe to call from several threads.

class MessageLookup {
 public:
  virtual ~MessageLookup() = default;
  virtual std::vector<Message> find_visible_by_ids(const std::vector<std::string>& ids) = 0;
};

class RoomLookup {
 public:
  virtual ~RoomLookup() = default;
  virtual std::vector<Room> find_by_ids(const std::vector<std::string>& ids) = 0;
};

class AuthorizationCheck {
 public:
  virtual ~AuthorizationCheck() = default;
  virtual bool can_access_room(const Room& room, const ActingUser& user) = 0;
  // An empty scope asks for the global grant.
  virtual bool has_permission(const std::string& user_id, const std::string& permission,
                              const std::string& scope = "") = 0;
};

class AvatarResolver {
 public:
  virtual ~AvatarResolver() = default;
  virtual std::string avatar_url(const std::string& username) = 0;
};

class UsageMeter {
 public:
  virtual ~UsageMeter() = default;
  virtual bool is_within_contact_limit(const Room& room) = 0;
};

class EphemeralNotifier {
 public:
  virtual ~EphemeralNotifier() = default;
  virtual void notify(const std::string& user_id, const std::string& room_id, const std::string& text) = 0;
};

class MessageStore {
 public:
  virtual ~MessageStore() = default;
  virtual std::string insert(const Message& message) = 0;
  virtual void update(const Message& message) = 0;
  virtual void remove(const std::string& message_id) = 0;
  virtual void set_reaction(const std::string& user_id, const std::string& message_id, const std::string& reaction,
                            bool should_react) = 0;
  virtual std::string create_system_message(const std::string& type, const std::string& room_id,
                                            const std::string& text, const UserRef& owner, bool read_receipts,
                                            const json& extra) = 0;
};

class EventBroadcaster {
 public:
  virtual ~EventBroadcaster() = default;
  virtual void broadcast(const std::string& event, const json& payload) = 0;
};

// Avatar URLs served by this deployment: <site>/avatar/<username>.
class SiteAvatarResolver : public AvatarResolver {
 public:
  explicit SiteAvatarResolver(std::string site_url) : site_url_(std::move(site_url)) {
    while (!site_url_.empty() && site_url_.back() == '/') {
      site_url_.pop_back();
    }
  }

  std::string avatar_url(const std::string& username) override {
    if (username.empty()) {
      return "";
    }
    return site_url_ + "/avatar/" + username;
  }

 private:
  std::string site_url_;
};

}  // namespace msgforge
