#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "msgforge/collaborators.hpp"
#include "msgforge/common.hpp"
#include "msgforge/config.hpp"
#include "msgforge/message.hpp"
#include "msgforge/veto.hpp"

namespace msgforge {

using ConstraintPolicy =
    std::function<std::optional<Veto>(const Message& message, const Room& room, const ConfigSnapshot& cfg)>;

// Message_MaxAllowedSize, counted in code points. Zero or less disables it.
inline ConstraintPolicy max_length_policy() {
  return [](const Message& message, const Room&, const ConfigSnapshot& cfg) -> std::optional<Veto> {
    const int limit = cfg.validation.max_message_size;
    if (limit <= 0) {
      return std::nullopt;
    }
    const std::size_t len = utf8_length(message.text);
    if (len <= static_cast<std::size_t>(limit)) {
      return std::nullopt;
    }
    return Veto{VetoKind::kConstraint, "error-message-size-exceeded",
                "Message size " + std::to_string(len) + " exceeds " + std::to_string(limit)};
  };
}

// Monthly active contacts: omnichannel rooms may only receive messages while
// the deployment is inside its contact limit.
inline ConstraintPolicy contact_limit_policy(std::shared_ptr<UsageMeter> meter) {
  return [meter](const Message&, const Room& room, const ConfigSnapshot&) -> std::optional<Veto> {
    if (!meter || !room.is_omnichannel()) {
      return std::nullopt;
    }
    if (meter->is_within_contact_limit(room)) {
      return std::nullopt;
    }
    return Veto{VetoKind::kConstraint, "error-mac-limit-reached", "Monthly active contact limit reached"};
  };
}

class ConstraintCheckStage {
 public:
  explicit ConstraintCheckStage(std::vector<ConstraintPolicy> policies) : policies_(std::move(policies)) {}

  std::optional<Veto> check(const Message& message, const Room& room, const ConfigSnapshot& cfg) const {
    for (const auto& policy : policies_) {
      if (auto veto = policy(message, room, cfg)) {
        return veto;
      }
    }
    return std::nullopt;
  }

 private:
  std::vector<ConstraintPolicy> policies_;
};

}  // namespace msgforge
