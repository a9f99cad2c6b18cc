#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace danmaku::model {

// Persisted as the integer value.
enum class LifecycleStatus : std::uint8_t {
  kPending  = 0,
  kVerified = 1,
  kLost     = 2,
};

constexpr bool IsTerminal(LifecycleStatus status) {
  return status == LifecycleStatus::kVerified || status == LifecycleStatus::kLost;
}

constexpr bool CanTransition(LifecycleStatus from, LifecycleStatus to) {
  return from == LifecycleStatus::kPending && IsTerminal(to);
}

constexpr std::string_view ToString(LifecycleStatus status) {
  switch (status) {
    case LifecycleStatus::kPending:
      return "pending";
    case LifecycleStatus::kVerified:
      return "verified";
    case LifecycleStatus::kLost:
      return "lost";
  }
  return "unknown";
}

constexpr std::optional<LifecycleStatus> ParseLifecycleStatus(std::string_view text) {
  if (text == "pending") return LifecycleStatus::kPending;
  if (text == "verified") return LifecycleStatus::kVerified;
  if (text == "lost") return LifecycleStatus::kLost;
  return std::nullopt;
}

} // namespace danmaku::model
