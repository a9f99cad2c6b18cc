#pragma once

#include <cstdint>
#include <string>
#include <tuple>

namespace danmaku::model {

inline constexpr int      kDefaultMode     = 1;
inline constexpr int      kDefaultFontSize = 25;
inline constexpr uint32_t kDefaultColor    = 0xFFFFFF;

/*
  One submittable danmaku.

  dmid stays empty until the provider assigns one on a successful
  submission; the sender fills it in place.
*/
struct Danmaku {
  std::string msg;
  int64_t     progress_ms = 0;
  int         mode        = kDefaultMode;
  int         font_size   = kDefaultFontSize;
  uint32_t    color       = kDefaultColor;

  std::string dmid;
  bool        is_valid = true;

  bool IsSent() const {
    return !dmid.empty();
  }
};

/*
  Content fingerprint used to recognise an item across runs.
*/
struct Fingerprint {
  std::string msg;
  int64_t     progress_ms = 0;
  int         mode        = kDefaultMode;
  int         font_size   = kDefaultFontSize;
  uint32_t    color       = kDefaultColor;

  static Fingerprint Of(const Danmaku& dm) {
    return {dm.msg, dm.progress_ms, dm.mode, dm.font_size, dm.color};
  }

  bool operator<(const Fingerprint& other) const {
    return std::tie(msg, progress_ms, mode, font_size, color) <
           std::tie(other.msg, other.progress_ms, other.mode, other.font_size, other.color);
  }

  bool operator==(const Fingerprint& other) const = default;
};

/*
  Where items are submitted: video (bvid) and part (cid).
*/
struct VideoTarget {
  std::string bvid;
  int64_t     cid = 0;
  std::string title;

  const std::string& DisplayString() const {
    return title.empty() ? bvid : title;
  }
};

} // namespace danmaku::model
