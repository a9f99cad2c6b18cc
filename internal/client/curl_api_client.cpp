#include "curl_api_client.hpp"

#include <curl/curl.h>
#include <google/protobuf/util/json_util.h>

#include <memory>
#include <mutex>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace danmaku::client {

using danmaku::observability::IntField;
using danmaku::observability::StringField;

namespace {

constexpr const char* kViewUrl    = "https://api.bilibili.com/x/web-interface/view";
constexpr const char* kNavUrl     = "https://api.bilibili.com/x/web-interface/nav";
constexpr const char* kPostUrl    = "https://api.bilibili.com/x/v2/dm/post";
constexpr const char* kListingUrl = "https://api.bilibili.com/x/v1/dm/list.so";
constexpr const char* kReferer    = "https://www.bilibili.com/";

void EnsureCurlGlobalInit() {
  static std::once_flag once;
  std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t WriteToString(const char* ptr, const size_t size, const size_t nmemb, void* userdata) {
  auto* out = static_cast<std::string*>(userdata);
  out->append(ptr, size * nmemb);
  return size * nmemb;
}

struct CurlDeleter {
  void operator()(CURL* h) const {
    curl_easy_cleanup(h);
  }
};

struct SlistDeleter {
  void operator()(curl_slist* l) const {
    curl_slist_free_all(l);
  }
};

using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

template <typename Message>
void ParseJson(const std::string& body, const std::string& url, Message* out) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(body, out, options);
  if (!status.ok()) {
    DANMAKU_LOG_ERROR("response decode failed", {StringField("url", url), StringField("error", std::string(status.message()))});
    throw util::ResponseParseError("malformed response: " + std::string(status.message()));
  }
}

} // namespace

CurlApiClient::CurlApiClient(ClientOptions options) : options_(std::move(options)) {
  if (options_.sessdata.empty() || options_.bili_jct.empty()) {
    throw util::InvalidArgument("SESSDATA and bili_jct must not be empty");
  }
  EnsureCurlGlobalInit();

  if (!options_.use_system_proxy) {
    DANMAKU_LOG_INFO("system proxy disabled, connecting directly");
  }
}

std::string CurlApiClient::Perform(Method method, const std::string& url, const std::string& body) const {
  CurlHandle curl(curl_easy_init());
  if (!curl) {
    throw util::RequestError("curl_easy_init failed");
  }

  std::string response;
  const std::string cookie = "SESSDATA=" + options_.sessdata + "; bili_jct=" + options_.bili_jct;

  HeaderList headers;
  if (method == Method::kPost) {
    headers.reset(curl_slist_append(nullptr, "Content-Type: application/x-www-form-urlencoded"));
  }

  CURL* h = curl.get();
  curl_easy_setopt(h, CURLOPT_URL, url.c_str());
  curl_easy_setopt(h, CURLOPT_USERAGENT, options_.user_agent.c_str());
  curl_easy_setopt(h, CURLOPT_REFERER, kReferer);
  curl_easy_setopt(h, CURLOPT_COOKIE, cookie.c_str());
  curl_easy_setopt(h, CURLOPT_ACCEPT_ENCODING, "");
  curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(options_.timeout.count()));
  curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, WriteToString);
  curl_easy_setopt(h, CURLOPT_WRITEDATA, &response);
  if (!options_.use_system_proxy) {
    curl_easy_setopt(h, CURLOPT_NOPROXY, "*");
  }
  if (headers) {
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());
  }
  if (method == Method::kPost) {
    curl_easy_setopt(h, CURLOPT_POST, 1L);
    curl_easy_setopt(h, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
  }

  const CURLcode res = curl_easy_perform(h);
  if (res != CURLE_OK) {
    const std::string err = curl_easy_strerror(res);
    DANMAKU_LOG_ERROR("request failed", {StringField("url", url), StringField("error", err)});

    switch (res) {
      case CURLE_OPERATION_TIMEDOUT:
        throw util::TimeoutError("request timed out: " + err);
      case CURLE_COULDNT_CONNECT:
      case CURLE_COULDNT_RESOLVE_HOST:
      case CURLE_COULDNT_RESOLVE_PROXY:
      case CURLE_SEND_ERROR:
      case CURLE_RECV_ERROR:
      case CURLE_GOT_NOTHING:
        throw util::ConnectionError("connection failed: " + err);
      default:
        throw util::RequestError("request error: " + err);
    }
  }

  long status = 0;
  curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &status);
  if (status >= 400) {
    DANMAKU_LOG_ERROR("http error", {StringField("url", url), IntField("status", status)});
    throw util::HttpError(status, "HTTP status " + std::to_string(status));
  }

  return response;
}

danmaku::provider::v1::VideoView CurlApiClient::FetchVideoInfo(const std::string& bvid) {
  const std::string url = std::string(kViewUrl) + "?bvid=" + WbiSigner::UrlEncode(bvid);
  DANMAKU_LOG_INFO("fetching video info", {StringField("bvid", bvid)});

  danmaku::provider::v1::VideoViewResponse resp;
  ParseJson(Perform(Method::kGet, url), url, &resp);

  if (resp.code() != 0) {
    DANMAKU_LOG_WARN("provider rejected request",
                     {StringField("url", url), IntField("code", resp.code()), StringField("message", resp.message())});
    throw util::ApiError(resp.code(), resp.message().empty() ? "unknown error" : resp.message());
  }
  return resp.data();
}

std::string CurlApiClient::FetchLiveListing(int64_t cid) {
  const std::string url = std::string(kListingUrl) + "?oid=" + std::to_string(cid);
  return Perform(Method::kGet, url);
}

WbiSigner::Keys CurlApiClient::EnsureWbiKeys() {
  if (auto cached = signer_.CachedKeys()) {
    return *cached;
  }

  // nav answers -101 for anonymous sessions but still carries the keys
  danmaku::provider::v1::NavResponse nav;
  ParseJson(Perform(Method::kGet, kNavUrl), kNavUrl, &nav);

  WbiSigner::Keys keys{WbiSigner::KeyFromUrl(nav.data().wbi_img().img_url()),
                       WbiSigner::KeyFromUrl(nav.data().wbi_img().sub_url())};
  if (keys.img_key.empty() || keys.sub_key.empty()) {
    DANMAKU_LOG_CRITICAL("failed to obtain WBI keys", {IntField("code", nav.code())});
    throw util::ApiError(-1, "failed to obtain WBI signing keys");
  }

  signer_.SetKeys(keys);
  DANMAKU_LOG_DEBUG("WBI keys cached");
  return keys;
}

danmaku::provider::v1::PostDanmakuResponse CurlApiClient::SubmitDanmaku(const danmaku::model::VideoTarget& target,
                                                                       const danmaku::model::Danmaku&     dm) {
  const auto keys = EnsureWbiKeys();

  WbiSigner::Params params = {
      {"type", "1"},
      {"oid", std::to_string(target.cid)},
      {"bvid", target.bvid},
      {"msg", dm.msg},
      {"progress", std::to_string(dm.progress_ms)},
      {"mode", std::to_string(dm.mode)},
      {"fontsize", std::to_string(dm.font_size)},
      {"color", std::to_string(dm.color)},
      {"pool", "0"},
      {"rnd", std::to_string(util::ToUnixMicros(util::Now()))},
      {"csrf", options_.bili_jct},
  };

  const std::string body = WbiSigner::Sign(std::move(params), keys, util::ToUnixSeconds(util::Now()));

  danmaku::provider::v1::PostDanmakuResponse resp;
  ParseJson(Perform(Method::kPost, kPostUrl, body), kPostUrl, &resp);
  return resp;
}

} // namespace danmaku::client
