#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/danmaku.hpp"

namespace danmaku::validation {

inline constexpr std::size_t kMaxMessageLength = 100;

// Symbols the provider refuses outright.
inline constexpr const char* kForbiddenSymbols[] = {"☢", "⚠", "☣", "☠", "⚡", "💣", "⚔", "🔥"};

struct ValidatorOptions {
  bool                     enabled = false;
  std::vector<std::string> blocked_keywords;
};

struct ValidationIssue {
  std::size_t             index = 0;
  danmaku::model::Danmaku item;
  std::string             reason;
};

// UTF-8 code points in `s`.
std::size_t CodePointLength(const std::string& s);

/*
  Checks items against the provider's posting rules and the user's
  blocked keywords. Sets is_valid on every item; returns one issue per
  rejected item with all reasons joined by ", ".

  duration_ms <= 0 disables the timestamp check.
*/
std::vector<ValidationIssue> ValidateItems(std::vector<danmaku::model::Danmaku>& items, int64_t duration_ms,
                                           const ValidatorOptions& options);

} // namespace danmaku::validation
