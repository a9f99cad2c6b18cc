#include "notifier.hpp"

#include "internal/observability/logging.hpp"

namespace danmaku::notify {

void LogNotifier::Notify(const std::string& title, const std::string& message) {
  DANMAKU_LOG_INFO("notification", {danmaku::observability::StringField("title", title),
                                    danmaku::observability::StringField("message", message)});
}

} // namespace danmaku::notify
