#pragma once

#include <chrono>
#include <string>

#include "api_client.hpp"
#include "wbi_signer.hpp"

namespace danmaku::client {

inline constexpr const char* kDefaultUserAgent =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36";

struct ClientOptions {
  std::string               sessdata;
  std::string               bili_jct;
  bool                      use_system_proxy = true;
  std::chrono::milliseconds timeout{10000};
  std::string               user_agent = kDefaultUserAgent;
};

/*
  libcurl implementation of ApiClient.

  One easy handle per request; safe to share between the sender and the
  monitor threads. WBI keys are fetched on first submission and cached.
*/
class CurlApiClient final : public ApiClient {
 public:
  // Throws util::InvalidArgument when credentials are missing.
  explicit CurlApiClient(ClientOptions options);

  danmaku::provider::v1::VideoView FetchVideoInfo(const std::string& bvid) override;

  danmaku::provider::v1::PostDanmakuResponse SubmitDanmaku(const danmaku::model::VideoTarget& target,
                                                           const danmaku::model::Danmaku&     dm) override;

  std::string FetchLiveListing(int64_t cid) override;

 private:
  enum class Method { kGet, kPost };

  std::string Perform(Method method, const std::string& url, const std::string& body = {}) const;

  WbiSigner::Keys EnsureWbiKeys();

  ClientOptions options_;
  WbiSigner     signer_;
};

} // namespace danmaku::client
