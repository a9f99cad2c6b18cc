#pragma once

#include <cstdint>
#include <string>

#include "danmaku/provider/v1/provider.pb.h"
#include "internal/model/danmaku.hpp"

namespace danmaku::client {

/*
  Provider API surface used by the engine.

  Transport failures surface as util::ApiError subclasses (TimeoutError,
  ConnectionError, HttpError, RequestError, ResponseParseError). Provider
  business errors raise ApiError with the provider code, except on
  SubmitDanmaku which returns the raw response so the caller can classify it.
*/
class ApiClient {
 public:
  virtual ~ApiClient() = default;

  virtual danmaku::provider::v1::VideoView FetchVideoInfo(const std::string& bvid) = 0;

  virtual danmaku::provider::v1::PostDanmakuResponse SubmitDanmaku(const danmaku::model::VideoTarget& target,
                                                                   const danmaku::model::Danmaku&     dm) = 0;

  // Raw listing XML of the currently visible items of a part.
  virtual std::string FetchLiveListing(int64_t cid) = 0;
};

} // namespace danmaku::client
