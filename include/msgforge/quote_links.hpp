#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "msgforge/collaborators.hpp"
#include "msgforge/common.hpp"
#include "msgforge/config.hpp"
#include "msgforge/message.hpp"
#include "msgforge/metrics.hpp"
#include "msgforge/url_scanner.hpp"

namespace msgforge {

struct QuoteLinkCandidate {
  std::string url;
  std::string message_id;
};

// Permalinks of the form <site_url>/...?msg=<id>, in order of appearance.
inline std::vector<QuoteLinkCandidate> find_quote_links(const std::string& text, std::string site_url) {
  std::vector<QuoteLinkCandidate> out;
  while (!site_url.empty() && site_url.back() == '/') {
    site_url.pop_back();
  }
  if (site_url.empty()) {
    return out;
  }
  const std::string site = to_lower(site_url);

  for (const auto& u : extract_urls(text)) {
    if (!starts_with(to_lower(u.url), site)) {
      continue;
    }
    if (u.url.size() > site.size()) {
      const char next = u.url[site.size()];
      if (next != '/' && next != '?' && next != '#') {
        continue;
      }
    }
    std::string id = url_query_param(u.url, "msg");
    if (id.empty()) {
      continue;
    }
    out.push_back(QuoteLinkCandidate{u.url, std::move(id)});
  }
  return out;
}

// Keeps nested quotes to depth chain_limit - 1 and drops them entirely below
// a limit of 2.
inline void trim_nested_quotes(std::vector<Attachment>& attachments, int chain_limit, int depth = 1) {
  if (depth == 1 && chain_limit < 2) {
    attachments.clear();
    return;
  }
  for (auto& a : attachments) {
    if (a.kind != AttachmentKind::kQuotedMessage) {
      continue;
    }
    if (depth < chain_limit - 1) {
      trim_nested_quotes(a.attachments, chain_limit, depth + 1);
    } else {
      a.attachments.clear();
    }
  }
}

inline std::string quote_author_name(const Message& quoted, bool use_real_name) {
  if (!quoted.alias.empty()) {
    return quoted.alias;
  }
  if (use_real_name && !trim(quoted.sender.name).empty()) {
    return quoted.sender.name;
  }
  return quoted.sender.username;
}

// Resolves permalinks to other messages into quoted_message attachments, at
// most chain_limit per message. Every failure is a silent skip.
class QuoteLinkStage {
 public:
  QuoteLinkStage(std::shared_ptr<MessageLookup> messages, std::shared_ptr<RoomLookup> rooms,
                 std::shared_ptr<AuthorizationCheck> authorization, std::shared_ptr<AvatarResolver> avatars)
      : messages_(std::move(messages)),
        rooms_(std::move(rooms)),
        authorization_(std::move(authorization)),
        avatars_(std::move(avatars)) {}

  Message apply(Message message, const ActingUser& user, const QuoteOptions& opts) const {
    if (opts.chain_limit <= 0 || !messages_ || !rooms_ || message.text.empty()) {
      return message;
    }

    std::vector<QuoteLinkCandidate> candidates;
    for (auto& c : find_quote_links(message.text, opts.site_url)) {
      if (c.message_id != message.id) {
        candidates.push_back(std::move(c));
      }
    }
    if (candidates.empty()) {
      return message;
    }

    const auto quoted = lookup_messages(candidates);
    const auto rooms = lookup_rooms(quoted);

    int appended = 0;
    for (const auto& c : candidates) {
      if (appended >= opts.chain_limit) {
        break;
      }
      auto mit = quoted.find(c.message_id);
      if (mit == quoted.end()) {
        continue;
      }
      const Message& q = mit->second;
      auto rit = rooms.find(q.room_id);
      if (rit == rooms.end()) {
        continue;
      }
      if (!can_read(message, rit->second, user)) {
        continue;
      }

      Attachment a;
      a.kind = AttachmentKind::kQuotedMessage;
      a.url = c.url;
      a.author_name = quote_author_name(q, opts.use_real_name);
      a.author_username = q.sender.username;
      a.text = q.text;
      a.avatar_url = avatar_for(q.sender.username);
      a.room_id = q.room_id;
      a.message_id = q.id;
      a.ts = q.ts;
      a.attachments = q.attachments;
      trim_nested_quotes(a.attachments, opts.chain_limit);

      message.attachments.push_back(std::move(a));
      ++appended;
    }

    if (appended > 0) {
      metrics().inc("quotes.attached", static_cast<uint64_t>(appended));
    }
    return message;
  }

 private:
  std::unordered_map<std::string, Message> lookup_messages(const std::vector<QuoteLinkCandidate>& candidates) const {
    std::vector<std::string> ids;
    std::unordered_set<std::string> seen;
    for (const auto& c : candidates) {
      if (seen.insert(c.message_id).second) {
        ids.push_back(c.message_id);
      }
    }

    std::unordered_map<std::string, Message> out;
    try {
      for (auto& m : messages_->find_visible_by_ids(ids)) {
        const std::string id = m.id;
        out.emplace(id, std::move(m));
      }
    } catch (const std::exception& e) {
      Logger::log(Logger::Level::kWarn, std::string("Quoted message lookup failed: ") + e.what());
    }
    return out;
  }

  std::unordered_map<std::string, Room> lookup_rooms(const std::unordered_map<std::string, Message>& quoted) const {
    std::unordered_map<std::string, Room> out;
    if (quoted.empty()) {
      return out;
    }
    std::vector<std::string> ids;
    std::unordered_set<std::string> seen;
    for (const auto& kv : quoted) {
      if (seen.insert(kv.second.room_id).second) {
        ids.push_back(kv.second.room_id);
      }
    }
    try {
      for (auto& r : rooms_->find_by_ids(ids)) {
        const std::string id = r.id;
        out.emplace(id, std::move(r));
      }
    } catch (const std::exception& e) {
      Logger::log(Logger::Level::kWarn, std::string("Quoted room lookup failed: ") + e.what());
    }
    return out;
  }

  bool can_read(const Message& message, const Room& room, const ActingUser& user) const {
    // Livechat visitors may always quote from their own conversation.
    if (!message.token.empty() && !room.visitor_token.empty() && message.token == room.visitor_token) {
      return true;
    }
    if (!authorization_ || user.id.empty()) {
      return false;
    }
    try {
      return authorization_->can_access_room(room, user);
    } catch (const std::exception& e) {
      Logger::log(Logger::Level::kWarn, "Access check for room " + room.id + " failed: " + e.what());
      return false;
    }
  }

  std::string avatar_for(const std::string& username) const {
    if (!avatars_ || username.empty()) {
      return "";
    }
    try {
      return avatars_->avatar_url(username);
    } catch (const std::exception& e) {
      Logger::log(Logger::Level::kDebug, "Avatar lookup failed for " + username + ": " + e.what());
      return "";
    }
  }

  std::shared_ptr<MessageLookup> messages_;
  std::shared_ptr<RoomLookup> rooms_;
  std::shared_ptr<AuthorizationCheck> authorization_;
  std::shared_ptr<AvatarResolver> avatars_;
};

}  // namespace msgforge
