#pragma once

#include <string>

#include "danmaku.hpp"

namespace danmaku::model {

// An item the run did not deliver, with the reason shown to the user.
struct UnsentItem {
  Danmaku     dm;
  std::string reason;
};

} // namespace danmaku::model
