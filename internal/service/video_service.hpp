#pragma once

#include <memory>
#include <string>

#include "internal/client/api_client.hpp"
#include "internal/model/video.hpp"

namespace danmaku::service {

class VideoService {
public:
  explicit VideoService(std::shared_ptr<client::ApiClient> client);

  // Throws std::runtime_error carrying the provider code on API failure,
  // util::InvalidArgument when a part has no cid.
  danmaku::model::VideoInfo FetchInfo(const std::string& bvid);

private:
  std::shared_ptr<client::ApiClient> client_;
};

}
