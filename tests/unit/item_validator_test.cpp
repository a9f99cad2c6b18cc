#include "internal/validation/item_validator.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

using danmaku::model::Danmaku;
using danmaku::validation::CodePointLength;
using danmaku::validation::ValidateItems;
using danmaku::validation::ValidatorOptions;

namespace {

Danmaku Item(const std::string& msg, int64_t progress_ms = 1000) {
  Danmaku dm;
  dm.msg         = msg;
  dm.progress_ms = progress_ms;
  return dm;
}

void TestCodePointLength() {
  assert(CodePointLength("") == 0);
  assert(CodePointLength("abc") == 3);
  assert(CodePointLength("你好") == 2);
  assert(CodePointLength("💣x") == 2);
}

void TestCleanItemsPass() {
  std::vector<Danmaku> items = {Item("hello"), Item(std::string(100, 'a'))};
  auto                 issues = ValidateItems(items, 60000, {});
  assert(issues.empty());
  assert(items[0].is_valid && items[1].is_valid);
}

void TestEachRule() {
  std::vector<Danmaku> items = {
      Item("line\\nbreak"),
      Item("slash/nbreak"),
      Item(std::string(101, 'b')),
      Item("late", 70000),
      Item("boom 💣 🔥"),
      Item("fine"),
  };

  auto issues = ValidateItems(items, 60000, {});
  assert(issues.size() == 5);

  assert(issues[0].index == 0 && issues[0].reason == "contains a line break");
  assert(issues[1].index == 1 && issues[1].reason == "contains a line break");
  assert(issues[2].reason == "longer than 100 characters");
  assert(issues[3].reason == "timestamp beyond video duration");
  // first forbidden symbol in table order
  assert(issues[4].reason == "contains forbidden symbol '💣'");

  assert(!items[0].is_valid);
  assert(items[5].is_valid);
}

void TestReasonsAreJoined() {
  std::vector<Danmaku> items = {Item(std::string(120, 'c') + "\\n", 99000)};
  auto                 issues = ValidateItems(items, 60000, {});
  assert(issues.size() == 1);
  assert(issues[0].reason == "contains a line break, longer than 100 characters, timestamp beyond video duration");
}

void TestUnknownDurationSkipsTimestampCheck() {
  std::vector<Danmaku> items = {Item("late", 999999)};
  assert(ValidateItems(items, 0, {}).empty());
}

void TestBlockedKeywords() {
  ValidatorOptions opts;
  opts.enabled          = true;
  opts.blocked_keywords = {"Spam", "ad", ""};

  std::vector<Danmaku> items = {Item("buy SPAM now, an AD"), Item("clean")};
  auto                 issues = ValidateItems(items, 0, opts);
  assert(issues.size() == 1);
  assert(issues[0].reason == "matches blocked keyword: 'Spam', 'ad'");

  opts.enabled = false;
  items[0].is_valid = true;
  assert(ValidateItems(items, 0, opts).empty());
}

} // namespace

int main() {
  TestCodePointLength();
  TestCleanItemsPass();
  TestEachRule();
  TestReasonsAreJoined();
  TestUnknownDurationSkipsTimestampCheck();
  TestBlockedKeywords();

  std::cout << "danmaku_sender_unit_item_validator: pass\n";
  return 0;
}
