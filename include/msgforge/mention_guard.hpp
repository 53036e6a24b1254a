#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "msgforge/collaborators.hpp"
#include "msgforge/common.hpp"
#include "msgforge/message.hpp"
#include "msgforge/veto.hpp"

namespace msgforge {

struct MentionRule {
  VetoKind kind;
  std::vector<std::string> tokens;
  std::string permission;
  std::string action;
};

inline MentionRule everyone_mention_rule() {
  return MentionRule{VetoKind::kMentionAll, {"all", "everyone"}, "mention-all", "Notify all in this room"};
}

inline MentionRule here_mention_rule() {
  return MentionRule{VetoKind::kMentionHere, {"here"}, "mention-here", "Notify active users in this room"};
}

// True when "@<token>" appears as a standalone mention.
inline bool contains_mention(const std::string& text, const std::string& token) {
  const std::string needle = "@" + token;
  for (auto pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) {
    if (pos > 0 && !std::isspace(static_cast<unsigned char>(text[pos - 1]))) {
      continue;
    }
    const std::size_t end = pos + needle.size();
    if (end < text.size()) {
      const auto c = static_cast<unsigned char>(text[end]);
      if (std::isalnum(c) || c == '_' || c == '-' || c == '.' || c >= 0x80) {
        // "@all." ends a sentence, "@all.team" names a user.
        if (!(c == '.' && (end + 1 == text.size() || std::isspace(static_cast<unsigned char>(text[end + 1]))))) {
          continue;
        }
      }
    }
    return true;
  }
  return false;
}

class MentionGuardStage {
 public:
  MentionGuardStage(std::shared_ptr<AuthorizationCheck> authorization,
                    std::shared_ptr<EphemeralNotifier> notifier = nullptr)
      : authorization_(std::move(authorization)), notifier_(std::move(notifier)) {}

  std::optional<Veto> check(const Message& message, const ActingUser& user, const Room& room,
                            const MentionRule& rule) const {
    const bool mentioned = std::any_of(rule.tokens.begin(), rule.tokens.end(),
                                       [&](const std::string& t) { return contains_mention(message.text, t); });
    if (!mentioned) {
      return std::nullopt;
    }

    const std::string room_id = room.id.empty() ? message.room_id : room.id;
    if (authorization_ && (authorization_->has_permission(user.id, rule.permission) ||
                           authorization_->has_permission(user.id, rule.permission, room_id))) {
      return std::nullopt;
    }

    if (notifier_) {
      try {
        notifier_->notify(user.id, room_id, "Action not allowed: " + rule.action);
      } catch (const std::exception& e) {
        Logger::log(Logger::Level::kWarn, std::string("Ephemeral notice failed: ") + e.what());
      }
    }
    return Veto{rule.kind, "error-action-not-allowed", "Notify @" + rule.tokens.front() + " not allowed"};
  }

 private:
  std::shared_ptr<AuthorizationCheck> authorization_;
  std::shared_ptr<EphemeralNotifier> notifier_;
};

}  // namespace msgforge
