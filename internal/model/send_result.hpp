#pragma once

#include <string>

namespace danmaku::model {

/*
  Outcome of one submission attempt. Built once, never mutated.
*/
struct SendResult {
  int         code       = 0;
  bool        is_success = false;
  std::string raw_message;
  std::string display_message;
  std::string dmid;
  bool        is_visible = true;
};

} // namespace danmaku::model
