#include "wbi_signer.hpp"

#include <openssl/evp.h>

#include <array>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace danmaku::client {

namespace {

constexpr std::array<int, 64> kMixinKeyEncTab = {
    46, 47, 18, 2,  53, 8,  23, 32, 15, 50, 10, 31, 58, 3,  45, 35, 27, 43, 5,  49, 33, 9,
    42, 19, 29, 28, 14, 39, 12, 38, 41, 13, 37, 48, 7,  16, 24, 55, 40, 61, 26, 17, 0,  1,
    60, 51, 30, 4,  22, 25, 54, 21, 56, 59, 6,  63, 57, 62, 11, 36, 20, 34, 44, 52};

constexpr std::size_t kMixinKeyLength = 32;

std::string StripForbidden(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (char c : value) {
    if (c == '!' || c == '\'' || c == '(' || c == ')' || c == '*') continue;
    out.push_back(c);
  }
  return out;
}

} // namespace

std::string WbiSigner::KeyFromUrl(const std::string& url) {
  const auto slash = url.find_last_of('/');
  std::string file = slash == std::string::npos ? url : url.substr(slash + 1);
  const auto dot   = file.find('.');
  return dot == std::string::npos ? file : file.substr(0, dot);
}

std::string WbiSigner::MixinKey(const std::string& img_key, const std::string& sub_key) {
  const std::string raw = img_key + sub_key;

  std::string out;
  out.reserve(kMixinKeyLength);
  for (int idx : kMixinKeyEncTab) {
    if (static_cast<std::size_t>(idx) < raw.size()) {
      out.push_back(raw[static_cast<std::size_t>(idx)]);
    }
    if (out.size() == kMixinKeyLength) break;
  }
  return out;
}

std::string WbiSigner::Md5Hex(const std::string& data) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int  len = 0;
  if (EVP_Digest(data.data(), data.size(), digest, &len, EVP_md5(), nullptr) != 1) {
    throw std::runtime_error("md5 digest failed");
  }

  std::ostringstream oss;
  for (unsigned int i = 0; i < len; ++i) oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
  return oss.str();
}

std::string WbiSigner::UrlEncode(const std::string& value) {
  static constexpr char kHex[] = "0123456789ABCDEF";

  std::string out;
  out.reserve(value.size() * 3);
  for (unsigned char c : value) {
    if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' ||
        c == '~') {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0F]);
    }
  }
  return out;
}

std::string WbiSigner::Sign(Params params, const Keys& keys, int64_t wts) {
  const std::string mixin_key = MixinKey(keys.img_key, keys.sub_key);

  params["wts"] = std::to_string(wts);

  // std::map keeps keys sorted
  std::string query;
  for (const auto& [key, value] : params) {
    if (!query.empty()) query.push_back('&');
    query += UrlEncode(key);
    query.push_back('=');
    query += UrlEncode(StripForbidden(value));
  }

  return query + "&w_rid=" + Md5Hex(query + mixin_key);
}

void WbiSigner::SetKeys(Keys keys) {
  std::lock_guard lock(mutex_);
  keys_ = std::move(keys);
}

std::optional<WbiSigner::Keys> WbiSigner::CachedKeys() const {
  std::lock_guard lock(mutex_);
  return keys_;
}

void WbiSigner::Reset() {
  std::lock_guard lock(mutex_);
  keys_.reset();
}

} // namespace danmaku::client
