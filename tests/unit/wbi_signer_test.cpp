#include "internal/client/wbi_signer.hpp"

#include <cassert>
#include <iostream>
#include <string>

using danmaku::client::WbiSigner;

namespace {

const WbiSigner::Keys kKeys{"7cd084941338484aae1ad9425b84077c", "4932caff0ff746eab6f01bf08b70ac45"};

void TestKeyFromUrl() {
  assert(WbiSigner::KeyFromUrl("https://i0.hdslb.com/bfs/wbi/7cd084941338484aae1ad9425b84077c.png") ==
         "7cd084941338484aae1ad9425b84077c");
  assert(WbiSigner::KeyFromUrl("plainkey") == "plainkey");
}

void TestMixinKey() {
  const auto key = WbiSigner::MixinKey(kKeys.img_key, kKeys.sub_key);
  assert(key.size() == 32);
  assert(key == "ea1db124af3c7062474693fa704f4ff8");
}

void TestMd5() {
  assert(WbiSigner::Md5Hex("") == "d41d8cd98f00b204e9800998ecf8427e");
}

void TestUrlEncode() {
  assert(WbiSigner::UrlEncode("a-b_c.d~e") == "a-b_c.d~e");
  assert(WbiSigner::UrlEncode("a b&c=d") == "a%20b%26c%3Dd");
  assert(WbiSigner::UrlEncode("你好") == "%E4%BD%A0%E5%A5%BD");
}

void TestSignKnownVector() {
  const auto query = WbiSigner::Sign({{"foo", "114"}, {"bar", "514"}, {"zab", "1919810"}}, kKeys, 1702204169);
  assert(query == "bar=514&foo=114&wts=1702204169&zab=1919810&w_rid=8f6f2b5b3d485fe1886cec6a0be8c5d4");
}

void TestSignStripsAndEncodes() {
  const auto query = WbiSigner::Sign({{"msg", "(你好)! hi*"}}, kKeys, 100);
  assert(query == "msg=%E4%BD%A0%E5%A5%BD%20hi&wts=100&w_rid=1b0583af3df0f5a67d812eec17283356");
}

void TestKeyCache() {
  WbiSigner signer;
  assert(!signer.CachedKeys());
  signer.SetKeys(kKeys);
  assert(signer.CachedKeys()->sub_key == kKeys.sub_key);
  signer.Reset();
  assert(!signer.CachedKeys());
}

} // namespace

int main() {
  TestKeyFromUrl();
  TestMixinKey();
  TestMd5();
  TestUrlEncode();
  TestSignKnownVector();
  TestSignStripsAndEncodes();
  TestKeyCache();

  std::cout << "danmaku_sender_unit_wbi_signer: pass\n";
  return 0;
}
