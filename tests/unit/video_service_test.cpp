#include "internal/service/video_service.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"
#include "tests/support/fake_api_client.hpp"

using danmaku::service::VideoService;
using danmaku::testing::FakeApiClient;

namespace {

void TestFillsDefaults() {
  auto                             client = std::make_shared<FakeApiClient>();
  danmaku::provider::v1::VideoView view;
  view.set_duration(600);
  auto* p1 = view.add_pages();
  p1->set_cid(101);
  p1->set_page(1);
  p1->set_part("Opening");
  p1->set_duration(300);
  auto* p2 = view.add_pages();
  p2->set_cid(102);
  p2->set_duration(300);
  client->SetView(view);

  VideoService service(client);
  auto         info = service.FetchInfo("BV1xx411c7mD");

  assert(info.bvid == "BV1xx411c7mD");
  assert(info.title == "unknown title");
  assert(info.parts.size() == 2);
  assert(info.parts[0].title == "Opening");
  assert(info.parts[1].title == "P2");
  assert(info.parts[1].page == 2);
  assert(info.FindPart(102)->duration_sec == 300);
  assert(!info.FindPart(999));
}

void TestApiErrorCarriesCode() {
  auto client = std::make_shared<FakeApiClient>();
  client->FailView(-404, "nothing here");

  VideoService service(client);
  bool         threw = false;
  try {
    (void)service.FetchInfo("BV1missing");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()) == "API request failed [code -404]: nothing here";
  }
  assert(threw);
}

void TestPartWithoutCidRejected() {
  auto                             client = std::make_shared<FakeApiClient>();
  danmaku::provider::v1::VideoView view;
  view.set_title("broken");
  view.add_pages()->set_part("no cid");
  client->SetView(view);

  VideoService service(client);
  bool         threw = false;
  try {
    (void)service.FetchInfo("BV1broken");
  } catch (const danmaku::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestNoPartsIsNotAnError() {
  auto                             client = std::make_shared<FakeApiClient>();
  danmaku::provider::v1::VideoView view;
  view.set_title("empty");
  client->SetView(view);

  VideoService service(client);
  auto         info = service.FetchInfo("BV1empty");
  assert(info.title == "empty");
  assert(info.parts.empty());
}

} // namespace

int main() {
  TestFillsDefaults();
  TestApiErrorCarriesCode();
  TestPartWithoutCidRejected();
  TestNoPartsIsNotAnError();

  std::cout << "danmaku_sender_unit_video_service: pass\n";
  return 0;
}
