#pragma once

#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include "msgforge/common.hpp"
#include "msgforge/config.hpp"
#include "msgforge/message.hpp"
#include "msgforge/metrics.hpp"
#include "msgforge/veto.hpp"

namespace msgforge {

struct PipelineContext {
  const Room& room;
  const ActingUser& user;
  const ConfigSnapshot& config;
  int64_t now_ms;
};

// A rewriting stage. It may change text and append attachments but must keep
// the message and room ids.
struct PipelineStage {
  std::string name;
  std::function<Message(Message, const PipelineContext&)> apply;
};

// A read-only check run in the concurrent validation group.
struct ValidationCheck {
  std::string name;
  std::function<std::optional<Veto>(const Message&, const PipelineContext&)> run;
};

struct PipelineResult {
  bool accepted{true};
  bool validated{false};
  Message message;
  std::optional<Veto> veto;
};

inline bool is_fresh_and_unedited(const Message& message, int64_t now, int tolerance_s) {
  if (message.is_edited()) {
    return false;
  }
  if (!message.ts) {
    return true;
  }
  // Window bounds saturate so extreme timestamps never overflow.
  constexpr int64_t kMin = std::numeric_limits<int64_t>::min();
  constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
  const int64_t tolerance_ms = static_cast<int64_t>((std::max)(0, tolerance_s)) * 1000;
  const int64_t lo = now < kMin + tolerance_ms ? kMin : now - tolerance_ms;
  const int64_t hi = now > kMax - tolerance_ms ? kMax : now + tolerance_ms;
  return *message.ts >= lo && *message.ts <= hi;
}

class PipelineOrchestrator {
 public:
  PipelineOrchestrator(std::vector<PipelineStage> stages, std::vector<ValidationCheck> checks)
      : stages_(std::move(stages)), checks_(std::move(checks)) {}

  // Runs every stage in order, then the validation group when the freshness
  // gate allows it. The transformed message is returned even when vetoed.
  // Exceptions thrown by a validation check propagate after all checks join.
  PipelineResult run(Message message, const Room& room, const ActingUser& user, const ConfigSnapshot& cfg,
                     int64_t now = now_ms()) const {
    metrics().inc("pipeline.runs");
    const PipelineContext ctx{room, user, cfg, now};

    for (const auto& stage : stages_) {
      message = apply_stage(stage, std::move(message), ctx);
    }

    PipelineResult result;
    const bool fresh = is_fresh_and_unedited(message, now, cfg.validation.freshness_tolerance_s);
    if (!checks_.empty() && (fresh || cfg.validation.validate_edited_messages)) {
      result.validated = true;
      result.veto = run_checks(message, ctx);
    } else {
      metrics().inc("pipeline.validation_skipped");
    }

    result.accepted = !result.veto.has_value();
    result.message = std::move(message);
    if (result.accepted) {
      metrics().inc("pipeline.accepted");
    } else {
      metrics().inc(std::string("pipeline.rejected.") + veto_kind_name(result.veto->kind));
      Logger::log(Logger::Level::kInfo, "Message rejected",
                  json{{"message", result.message.id},
                       {"kind", veto_kind_name(result.veto->kind)},
                       {"code", result.veto->code}});
    }
    return result;
  }

  std::vector<std::string> stage_names() const {
    std::vector<std::string> out;
    for (const auto& s : stages_) {
      out.push_back(s.name);
    }
    return out;
  }

 private:
  static Message apply_stage(const PipelineStage& stage, Message message, const PipelineContext& ctx) {
    try {
      Message next = stage.apply(message, ctx);
      if (next.id != message.id || next.room_id != message.room_id ||
          next.attachments.size() < message.attachments.size()) {
        Logger::log(Logger::Level::kError, "Stage output dropped: message identity changed",
                    json{{"stage", stage.name}, {"message", message.id}});
        return message;
      }
      return next;
    } catch (const std::exception& e) {
      Logger::log(Logger::Level::kWarn, std::string("Stage failed, skipping: ") + e.what(),
                  json{{"stage", stage.name}, {"message", message.id}});
      return message;
    }
  }

  // Launches every check, waits for all of them, and reports the first veto in
  // launch order.
  std::optional<Veto> run_checks(const Message& message, const PipelineContext& ctx) const {
    std::vector<std::future<std::optional<Veto>>> pending;
    pending.reserve(checks_.size());
    for (const auto& check : checks_) {
      pending.push_back(std::async(std::launch::async, [&check, &message, &ctx]() { return check.run(message, ctx); }));
    }

    std::optional<Veto> first;
    std::exception_ptr failure;
    for (std::size_t i = 0; i < pending.size(); ++i) {
      try {
        auto veto = pending[i].get();
        if (veto && !first) {
          first = std::move(veto);
        }
      } catch (const std::exception& e) {
        Logger::log(Logger::Level::kError, std::string("Validation check failed: ") + e.what(),
                    json{{"check", checks_[i].name}});
        if (!failure) {
          failure = std::current_exception();
        }
      }
    }
    if (failure) {
      std::rethrow_exception(failure);
    }
    return first;
  }

  std::vector<PipelineStage> stages_;
  std::vector<ValidationCheck> checks_;
};

}  // namespace msgforge
