#include "item_validator.hpp"

#include <algorithm>
#include <cctype>

namespace danmaku::validation {

namespace {

std::string AsciiLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string Join(const std::vector<std::string>& parts, const std::string& sep) {
  std::string out;
  for (const auto& p : parts) {
    if (!out.empty()) out += sep;
    out += p;
  }
  return out;
}

} // namespace

std::size_t CodePointLength(const std::string& s) {
  return static_cast<std::size_t>(
      std::count_if(s.begin(), s.end(), [](unsigned char c) { return (c & 0xC0) != 0x80; }));
}

std::vector<ValidationIssue> ValidateItems(std::vector<danmaku::model::Danmaku>& items, int64_t duration_ms,
                                           const ValidatorOptions& options) {
  std::vector<ValidationIssue> issues;

  for (std::size_t i = 0; i < items.size(); ++i) {
    auto&                    dm = items[i];
    std::vector<std::string> reasons;

    if (dm.msg.find('\n') != std::string::npos || dm.msg.find("\\n") != std::string::npos || dm.msg.find("/n") != std::string::npos) {
      reasons.emplace_back("contains a line break");
    }

    if (CodePointLength(dm.msg) > kMaxMessageLength) {
      reasons.emplace_back("longer than 100 characters");
    }

    if (duration_ms > 0 && dm.progress_ms > duration_ms) {
      reasons.emplace_back("timestamp beyond video duration");
    }

    for (const char* symbol : kForbiddenSymbols) {
      if (dm.msg.find(symbol) != std::string::npos) {
        // first hit only
        reasons.push_back(std::string("contains forbidden symbol '") + symbol + "'");
        break;
      }
    }

    if (options.enabled && !options.blocked_keywords.empty()) {
      const std::string        lower = AsciiLower(dm.msg);
      std::vector<std::string> hits;
      for (const auto& kw : options.blocked_keywords) {
        if (!kw.empty() && lower.find(AsciiLower(kw)) != std::string::npos) {
          hits.push_back("'" + kw + "'");
        }
      }
      if (!hits.empty()) {
        reasons.push_back("matches blocked keyword: " + Join(hits, ", "));
      }
    }

    dm.is_valid = reasons.empty();
    if (!dm.is_valid) {
      issues.push_back({i, dm, Join(reasons, ", ")});
    }
  }

  return issues;
}

} // namespace danmaku::validation
