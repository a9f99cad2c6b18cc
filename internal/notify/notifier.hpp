#pragma once

#include <string>

namespace danmaku::notify {

/*
  End-of-run notification sink. Implementations must not throw into the
  caller's run; the orchestrator still guards every call.
*/
class Notifier {
 public:
  virtual ~Notifier() = default;

  virtual void Notify(const std::string& title, const std::string& message) = 0;
};

// Writes notifications to the process logger.
class LogNotifier final : public Notifier {
 public:
  void Notify(const std::string& title, const std::string& message) override;
};

} // namespace danmaku::notify
