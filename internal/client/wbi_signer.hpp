#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace danmaku::client {

/*
  Request signing for provider endpoints that require a w_rid.

  The signer only does the math; fetching img_key/sub_key from the nav
  endpoint is the client's job. Keys are cached until Reset().
*/
class WbiSigner {
 public:
  using Params = std::map<std::string, std::string>;

  struct Keys {
    std::string img_key;
    std::string sub_key;
  };

  // "https://i0.hdslb.com/bfs/wbi/7cd0...png" -> "7cd0..."
  static std::string KeyFromUrl(const std::string& url);

  // 32 characters picked from img_key + sub_key by the fixed permutation.
  static std::string MixinKey(const std::string& img_key, const std::string& sub_key);

  static std::string Md5Hex(const std::string& data);

  // Percent-encodes everything except RFC 3986 unreserved characters.
  static std::string UrlEncode(const std::string& value);

  // Adds wts and w_rid; returns the encoded, key-sorted query string.
  static std::string Sign(Params params, const Keys& keys, int64_t wts);

  void SetKeys(Keys keys);
  std::optional<Keys> CachedKeys() const;
  void Reset();

 private:
  mutable std::mutex  mutex_;
  std::optional<Keys> keys_;
};

} // namespace danmaku::client
