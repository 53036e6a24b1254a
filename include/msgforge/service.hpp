#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "msgforge/bad_words.hpp"
#include "msgforge/collaborators.hpp"
#include "msgforge/common.hpp"
#include "msgforge/config.hpp"
#include "msgforge/constraint_check.hpp"
#include "msgforge/markdown.hpp"
#include "msgforge/mention_guard.hpp"
#include "msgforge/message.hpp"
#include "msgforge/pipeline.hpp"
#include "msgforge/quote_links.hpp"
#include "msgforge/settings.hpp"
#include "msgforge/streaming_links.hpp"
#include "msgforge/veto.hpp"

namespace msgforge {

struct ServiceDependencies {
  std::shared_ptr<MessageLookup> messages;
  std::shared_ptr<RoomLookup> rooms;
  std::shared_ptr<AuthorizationCheck> authorization;
  std::shared_ptr<AvatarResolver> avatars;
  std::shared_ptr<UsageMeter> usage;
  std::shared_ptr<EphemeralNotifier> notifier;
  std::shared_ptr<StreamingPreviewResolver> previews;
  std::shared_ptr<MessageStore> store;
  std::shared_ptr<EventBroadcaster> broadcaster;
};

// Markdown, bad words, streaming links, quotes; then constraint, @all, @here.
inline PipelineOrchestrator make_default_pipeline(const ServiceDependencies& deps) {
  auto markdown = std::make_shared<MarkdownStage>();
  auto bad_words = std::make_shared<BadWordsStage>();
  auto streaming = std::make_shared<LinkEnrichmentStage>(deps.previews);
  auto quotes = std::make_shared<QuoteLinkStage>(deps.messages, deps.rooms, deps.authorization, deps.avatars);
  auto mentions = std::make_shared<MentionGuardStage>(deps.authorization, deps.notifier);

  std::vector<ConstraintPolicy> policies{max_length_policy()};
  if (deps.usage) {
    policies.push_back(contact_limit_policy(deps.usage));
  }
  auto constraints = std::make_shared<ConstraintCheckStage>(std::move(policies));

  std::vector<PipelineStage> stages{
      {"markdown", [markdown](Message m, const PipelineContext& ctx) {
         return markdown->apply(std::move(m), ctx.config.markdown);
       }},
      {"bad_words", [bad_words](Message m, const PipelineContext& ctx) {
         return bad_words->apply(std::move(m), ctx.config);
       }},
      {"streaming_links", [streaming](Message m, const PipelineContext& ctx) {
         return streaming->apply(std::move(m), ctx.config.streaming);
       }},
      {"quote_links", [quotes](Message m, const PipelineContext& ctx) {
         return quotes->apply(std::move(m), ctx.user, ctx.config.quotes);
       }},
  };

  std::vector<ValidationCheck> checks{
      {"constraints", [constraints](const Message& m, const PipelineContext& ctx) {
         return constraints->check(m, ctx.room, ctx.config);
       }},
      {"mention_all", [mentions](const Message& m, const PipelineContext& ctx) {
         return mentions->check(m, ctx.user, ctx.room, everyone_mention_rule());
       }},
      {"mention_here", [mentions](const Message& m, const PipelineContext& ctx) {
         return mentions->check(m, ctx.user, ctx.room, here_mention_rule());
       }},
  };

  return PipelineOrchestrator(std::move(stages), std::move(checks));
}

class MessageService {
 public:
  MessageService(SettingsRegistry& settings, ServiceDependencies deps)
      : deps_(std::move(deps)), config_(settings), pipeline_(make_default_pipeline(deps_)) {}

  MessageService(SettingsRegistry& settings, ServiceDependencies deps, PipelineOrchestrator pipeline)
      : deps_(std::move(deps)), config_(settings), pipeline_(std::move(pipeline)) {}

  void created() { config_.start(); }

  std::shared_ptr<const ConfigSnapshot> config() const { return config_.current(); }

  // Reads the snapshot once; the whole run uses that version.
  PipelineResult process(Message message, const Room& room, const ActingUser& user) const {
    const auto cfg = config_.current();
    return pipeline_.run(std::move(message), room, user, *cfg);
  }

  Message before_save(Message message, const Room& room, const ActingUser& user) const {
    PipelineResult result = process(std::move(message), room, user);
    if (!result.accepted) {
      throw VetoError(*result.veto);
    }
    return std::move(result.message);
  }

  Message send_message(const ActingUser& user, Message message, const Room& room) {
    MessageStore& store = require_store();
    if (message.room_id.empty()) {
      message.room_id = room.id;
    }
    if (message.id.empty()) {
      message.id = random_id();
    }
    if (!message.ts) {
      message.ts = now_ms();
    }
    if (message.sender.id.empty()) {
      message.sender = UserRef{user.id, user.username, user.name};
    }

    Message saved = before_save(std::move(message), room, user);
    saved.id = store.insert(saved);
    broadcast_sent(saved.id);
    return saved;
  }

  void update_message(Message message, const ActingUser& user, const Room& room) {
    MessageStore& store = require_store();
    message.edited_at = now_ms();
    message.edited_by = user.username;
    store.update(before_save(std::move(message), room, user));
  }

  void delete_message(const ActingUser& user, const Message& message) {
    Logger::log(Logger::Level::kDebug, "User " + user.id + " deletes message " + message.id);
    require_store().remove(message.id);
  }

  void react_to_message(const std::string& user_id, const std::string& reaction, const std::string& message_id,
                        bool should_react = true) {
    require_store().set_reaction(user_id, message_id, reaction, should_react);
  }

  std::string save_system_message(const std::string& type, const std::string& room_id, const std::string& text,
                                  const UserRef& owner, const json& extra = json::object()) {
    if (owner.username.empty()) {
      throw std::invalid_argument("The username cannot be empty.");
    }
    const std::string id =
        require_store().create_system_message(type, room_id, text, owner, config_.current()->read_receipts, extra);
    broadcast_sent(id);
    return id;
  }

 private:
  MessageStore& require_store() {
    if (!deps_.store) {
      throw std::runtime_error("MessageService has no message store");
    }
    return *deps_.store;
  }

  void broadcast_sent(const std::string& id) {
    if (!deps_.broadcaster) {
      return;
    }
    try {
      deps_.broadcaster->broadcast("message.sent", json{{"_id", id}});
    } catch (const std::exception& e) {
      Logger::log(Logger::Level::kWarn, "message.sent broadcast failed for " + id + ": " + e.what());
    }
  }

  ServiceDependencies deps_;
  ConfigWatcher config_;
  PipelineOrchestrator pipeline_;
};

}  // namespace msgforge
