#include "video_service.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace danmaku::service {

using danmaku::observability::IntField;
using danmaku::observability::StringField;

VideoService::VideoService(std::shared_ptr<client::ApiClient> client) : client_(std::move(client)) {
  if (!client_) {
    throw util::InvalidArgument("VideoService requires an api client");
  }
}

danmaku::model::VideoInfo VideoService::FetchInfo(const std::string& bvid) {
  danmaku::provider::v1::VideoView view;
  try {
    view = client_->FetchVideoInfo(bvid);
  } catch (const util::ApiError& e) {
    const std::string msg = "API request failed [code " + std::to_string(e.Code()) + "]: " + e.Message();
    DANMAKU_LOG_ERROR("video info fetch failed", {StringField("bvid", bvid), StringField("error", msg)});
    throw std::runtime_error(msg);
  }

  danmaku::model::VideoInfo info;
  info.bvid         = bvid;
  info.title        = view.title().empty() ? "unknown title" : view.title();
  info.duration_sec = view.duration();

  if (view.pages().empty()) {
    DANMAKU_LOG_WARN("video has no parts", {StringField("bvid", bvid)});
  }

  for (int i = 0; i < view.pages_size(); ++i) {
    const auto& page = view.pages(i);
    if (page.cid() == 0) {
      const std::string msg = "part " + std::to_string(i + 1) + " has no cid";
      DANMAKU_LOG_ERROR("malformed video info", {StringField("bvid", bvid), StringField("error", msg)});
      throw util::InvalidArgument(msg);
    }

    danmaku::model::VideoPart part;
    part.cid          = page.cid();
    part.page         = page.page() != 0 ? page.page() : i + 1;
    part.title        = page.part().empty() ? "P" + std::to_string(i + 1) : page.part();
    part.duration_sec = page.duration();
    info.parts.push_back(std::move(part));
  }

  DANMAKU_LOG_INFO("video info fetched",
                   {StringField("bvid", bvid), StringField("title", info.title), IntField("parts", static_cast<int64_t>(info.parts.size()))});
  return info;
}

}
