#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace msgforge {

enum class VetoKind { kMentionAll, kMentionHere, kConstraint };

inline const char* veto_kind_name(VetoKind kind) {
  switch (kind) {
    case VetoKind::kMentionAll:
      return "mention_all";
    case VetoKind::kMentionHere:
      return "mention_here";
    case VetoKind::kConstraint:
    default:
      return "constraint";
  }
}

struct Veto {
  VetoKind kind{VetoKind::kConstraint};
  std::string code;
  std::string reason;
};

class VetoError : public std::runtime_error {
 public:
  explicit VetoError(Veto veto) : std::runtime_error(veto.code + ": " + veto.reason), veto_(std::move(veto)) {}

  const Veto& veto() const { return veto_; }
  VetoKind kind() const { return veto_.kind; }

 private:
  Veto veto_;
};

}  // namespace msgforge
