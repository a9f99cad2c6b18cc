#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace danmaku::model {

struct VideoPart {
  int64_t     cid  = 0;
  int         page = 0;
  std::string title;
  int64_t     duration_sec = 0;
};

struct VideoInfo {
  std::string            bvid;
  std::string            title;
  int64_t                duration_sec = 0;
  std::vector<VideoPart> parts;

  std::optional<VideoPart> FindPart(int64_t cid) const {
    for (const auto& part : parts) {
      if (part.cid == cid) {
        return part;
      }
    }
    return std::nullopt;
  }
};

} // namespace danmaku::model
