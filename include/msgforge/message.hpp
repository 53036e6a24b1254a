#pragma once

#include <optional>
#include <string>
#include <vector>

#include "msgforge/common.hpp"

namespace msgforge {

enum class AttachmentKind { kStreamingLink, kQuotedMessage };

inline const char* attachment_kind_name(AttachmentKind kind) {
  return kind == AttachmentKind::kStreamingLink ? "streaming_link" : "quoted_message";
}

struct Attachment {
  AttachmentKind kind{AttachmentKind::kQuotedMessage};
  std::string url;

  // streaming_link
  std::string service;
  std::string resource_type;
  std::string resource_id;
  std::string title;
  std::string thumbnail_url;

  // quoted_message
  std::string author_name;
  std::string author_username;
  std::string text;
  std::string avatar_url;
  std::string room_id;
  std::string message_id;
  std::optional<int64_t> ts;
  std::vector<Attachment> attachments;
};

struct UserRef {
  std::string id;
  std::string username;
  std::string name;
};

struct Message {
  std::string id;
  std::string room_id;
  UserRef sender;
  std::string text;
  std::optional<std::string> rendered;
  std::vector<Attachment> attachments;
  std::optional<int64_t> ts;
  std::optional<int64_t> edited_at;
  std::string edited_by;
  std::string type;
  std::string alias;
  std::string token;

  bool is_edited() const { return edited_at.has_value(); }
  bool is_encrypted() const { return type == "e2e"; }
};

struct Room {
  std::string id;
  std::string type{"c"};
  std::string name;
  std::string parent_id;
  std::string visitor_token;

  bool is_omnichannel() const { return type == "l"; }
};

struct ActingUser {
  std::string id;
  std::string username;
  std::string name;
  std::string language{"en"};
};

inline void to_json(json& j, const Attachment& a) {
  j = json{{"kind", attachment_kind_name(a.kind)}, {"url", a.url}};
  if (a.kind == AttachmentKind::kStreamingLink) {
    j["service"] = a.service;
    j["resourceType"] = a.resource_type;
    j["resourceId"] = a.resource_id;
    if (!a.title.empty()) {
      j["title"] = a.title;
    }
    if (!a.thumbnail_url.empty()) {
      j["thumbnailUrl"] = a.thumbnail_url;
    }
    return;
  }
  j["authorName"] = a.author_name;
  j["authorUsername"] = a.author_username;
  j["text"] = a.text;
  j["authorIcon"] = a.avatar_url;
  j["rid"] = a.room_id;
  j["mid"] = a.message_id;
  if (a.ts) {
    j["ts"] = *a.ts;
  }
  j["attachments"] = a.attachments;
}

inline void from_json(const json& j, Attachment& a) {
  a.kind = j.value("kind", "quoted_message") == "streaming_link" ? AttachmentKind::kStreamingLink
                                                                  : AttachmentKind::kQuotedMessage;
  a.url = j.value("url", "");
  a.service = j.value("service", "");
  a.resource_type = j.value("resourceType", "");
  a.resource_id = j.value("resourceId", "");
  a.title = j.value("title", "");
  a.thumbnail_url = j.value("thumbnailUrl", "");
  a.author_name = j.value("authorName", "");
  a.author_username = j.value("authorUsername", "");
  a.text = j.value("text", "");
  a.avatar_url = j.value("authorIcon", "");
  a.room_id = j.value("rid", "");
  a.message_id = j.value("mid", "");
  a.ts.reset();
  if (j.contains("ts") && j["ts"].is_number_integer()) {
    a.ts = j["ts"].get<int64_t>();
  }
  a.attachments.clear();
  if (j.contains("attachments") && j["attachments"].is_array()) {
    a.attachments = j["attachments"].get<std::vector<Attachment>>();
  }
}

inline void to_json(json& j, const UserRef& u) {
  j = json{{"_id", u.id}, {"username", u.username}, {"name", u.name}};
}

inline void from_json(const json& j, UserRef& u) {
  u.id = j.value("_id", "");
  u.username = j.value("username", "");
  u.name = j.value("name", "");
}

inline void to_json(json& j, const Message& m) {
  j = json{{"_id", m.id}, {"rid", m.room_id}, {"u", m.sender}, {"msg", m.text}, {"attachments", m.attachments}};
  if (m.rendered) {
    j["html"] = *m.rendered;
  }
  if (m.ts) {
    j["ts"] = *m.ts;
  }
  if (m.edited_at) {
    j["editedAt"] = *m.edited_at;
    j["editedBy"] = m.edited_by;
  }
  if (!m.type.empty()) {
    j["t"] = m.type;
  }
  if (!m.alias.empty()) {
    j["alias"] = m.alias;
  }
  if (!m.token.empty()) {
    j["token"] = m.token;
  }
}

inline void from_json(const json& j, Message& m) {
  m.id = j.value("_id", "");
  m.room_id = j.value("rid", "");
  m.sender = j.contains("u") && j["u"].is_object() ? j["u"].get<UserRef>() : UserRef{};
  m.text = j.value("msg", "");
  m.rendered.reset();
  if (j.contains("html") && j["html"].is_string()) {
    m.rendered = j["html"].get<std::string>();
  }
  m.attachments.clear();
  if (j.contains("attachments") && j["attachments"].is_array()) {
    m.attachments = j["attachments"].get<std::vector<Attachment>>();
  }
  m.ts.reset();
  if (j.contains("ts") && j["ts"].is_number_integer()) {
    m.ts = j["ts"].get<int64_t>();
  }
  m.edited_at.reset();
  if (j.contains("editedAt") && j["editedAt"].is_number_integer()) {
    m.edited_at = j["editedAt"].get<int64_t>();
  }
  m.edited_by = j.value("editedBy", "");
  m.type = j.value("t", "");
  m.alias = j.value("alias", "");
  m.token = j.value("token", "");
}

inline void to_json(json& j, const Room& r) {
  j = json{{"_id", r.id}, {"t", r.type}, {"name", r.name}};
  if (!r.parent_id.empty()) {
    j["prid"] = r.parent_id;
  }
  if (!r.visitor_token.empty()) {
    j["v"] = {{"token", r.visitor_token}};
  }
}

inline void from_json(const json& j, Room& r) {
  r.id = j.value("_id", "");
  r.type = j.value("t", "c");
  r.name = j.value("name", "");
  r.parent_id = j.value("prid", "");
  r.visitor_token.clear();
  if (j.contains("v") && j["v"].is_object()) {
    r.visitor_token = j["v"].value("token", "");
  }
}

inline void to_json(json& j, const ActingUser& u) {
  j = json{{"_id", u.id}, {"username", u.username}, {"name", u.name}, {"language", u.language}};
}

inline void from_json(const json& j, ActingUser& u) {
  u.id = j.value("_id", "");
  u.username = j.value("username", "");
  u.name = j.value("name", "");
  u.language = j.value("language", "en");
}

}  // namespace msgforge
