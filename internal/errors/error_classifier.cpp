#include "error_classifier.hpp"

#include <unordered_map>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace danmaku::errors {

using danmaku::observability::IntField;
using danmaku::observability::StringField;

namespace {

const std::unordered_map<int, ErrorInfo>& Table() {
  static const std::unordered_map<int, ErrorInfo> kTable = [] {
    const ErrorInfo entries[] = {
        {kSuccessCode, "danmaku sent", false},

        // auth
        {-101, "not logged in or session expired, check SESSDATA and bili_jct", true},
        {-102, "account is banned", true},
        {-111, "CSRF check failed, bili_jct may be stale", true},

        // request
        {-400, "bad request, invalid parameters", false},
        {-404, "requested resource does not exist", true},

        // business limits
        {36700, "system is upgrading, danmaku cannot be sent right now", true},
        {36701, "danmaku contains forbidden content", false},
        {36702, "danmaku is longer than 100 characters", false},
        {kFreqLimitCode, "sending too fast, slow down or retry later", false},
        {36704, "danmaku cannot be sent to a video under review", true},
        {36705, "account level too low to send danmaku", true},
        {36706, "account level too low for top danmaku", false},
        {36707, "account level too low for bottom danmaku", false},
        {36708, "account level too low for coloured danmaku", false},
        {36709, "account level too low for advanced danmaku", false},
        {36710, "insufficient permission for this danmaku style", false},
        {36711, "danmaku are disabled for this video", true},
        {36712, "level 1 accounts are limited to 20 characters", false},
        {36713, "video is not paid for, danmaku unavailable", true},
        {36714, "danmaku progress is invalid", false},
        {36715, "daily operation limit exceeded", false},
        {36718, "premium membership required", false},

        // synthetic
        {kGenericFailureCode, "operation failed, see the raw message or retry later", false},
        {util::kParseErrorCode, "malformed response from provider", true},
        {util::kHttpErrorCode, "HTTP protocol error while sending danmaku", true},
        {util::kConnectionErrorCode, "connection failure while sending danmaku, check the network", true},
        {util::kTimeoutErrorCode, "request timed out while sending danmaku, check the network", true},
        {util::kUnknownErrorCode, "unknown error while sending danmaku", true},
        {util::kNetworkErrorCode, "network or request failure while sending danmaku", true},
    };

    std::unordered_map<int, ErrorInfo> table;
    for (const auto& entry : entries) {
      table.emplace(entry.code, entry);
    }
    return table;
  }();
  return kTable;
}

bool IsTransportCode(int code) {
  return code == util::kHttpErrorCode || code == util::kConnectionErrorCode || code == util::kTimeoutErrorCode ||
         code == util::kNetworkErrorCode;
}

Classification FromKnown(const ErrorInfo& info) {
  Classification c;
  c.code   = info.code;
  c.reason = std::string(info.description);

  if (info.code == kSuccessCode) {
    c.outcome = Outcome::kSuccess;
  } else if (IsTransportCode(info.code)) {
    c.outcome = Outcome::kNetwork;
  } else if (info.code == util::kUnknownErrorCode) {
    c.outcome = Outcome::kUnknown;
  } else {
    c.outcome = info.is_fatal ? Outcome::kFatal : Outcome::kRetryable;
  }

  c.needs_cooldown = info.code == kFreqLimitCode;
  return c;
}

Classification FromUnknown(int code, std::string_view raw_message) {
  DANMAKU_LOG_WARN("unrecognised provider code, treating as fatal",
                   {IntField("code", code), StringField("message", raw_message)});

  Classification c;
  c.outcome = Outcome::kUnknown;
  c.code    = code;
  c.reason  = std::string(UnknownError().description) + " (code " + std::to_string(code) + ")";
  if (!raw_message.empty()) {
    c.reason += ": " + std::string(raw_message);
  }
  return c;
}

} // namespace

std::string_view ToString(Outcome outcome) {
  switch (outcome) {
    case Outcome::kSuccess:
      return "success";
    case Outcome::kRetryable:
      return "retryable";
    case Outcome::kFatal:
      return "fatal";
    case Outcome::kNetwork:
      return "network";
    case Outcome::kUnknown:
      return "unknown";
  }
  return "unknown";
}

const ErrorInfo* Lookup(int code) {
  const auto& table = Table();
  auto        it    = table.find(code);
  return it == table.end() ? nullptr : &it->second;
}

const ErrorInfo& UnknownError() {
  return Table().at(util::kUnknownErrorCode);
}

std::string ResolveMessage(int code, std::string_view raw_message) {
  if (const auto* info = Lookup(code)) {
    return std::string(info->description);
  }
  if (raw_message.find_first_not_of(" \t\r\n") != std::string_view::npos) {
    return std::string(raw_message);
  }
  return std::string(Lookup(kGenericFailureCode)->description);
}

Classification Classify(int code, std::string_view raw_message) {
  if (const auto* info = Lookup(code)) {
    return FromKnown(*info);
  }
  return FromUnknown(code, raw_message);
}

Classification ClassifyException(const std::exception& e) {
  if (const auto* api = dynamic_cast<const util::ApiError*>(&e)) {
    if (const auto* info = Lookup(api->Code())) {
      return FromKnown(*info);
    }
    if (api->IsNetworkError()) {
      return FromKnown(*Lookup(util::kNetworkErrorCode));
    }
    return FromUnknown(api->Code(), api->Message());
  }

  DANMAKU_LOG_ERROR("unexpected exception while sending", {StringField("error", e.what())});
  return FromKnown(UnknownError());
}

model::SendResult ResultFromResponse(const danmaku::provider::v1::PostDanmakuResponse& response) {
  model::SendResult result;
  result.code            = response.code();
  result.is_success      = response.code() == kSuccessCode;
  result.raw_message     = response.message().empty() ? "no message from provider" : response.message();
  result.display_message = ResolveMessage(response.code(), response.message());

  if (response.has_data()) {
    const auto& data = response.data();
    if (!data.dmid_str().empty()) {
      result.dmid = data.dmid_str();
    } else if (data.dmid() != 0) {
      result.dmid = std::to_string(data.dmid());
    }
    result.is_visible = data.has_visible() ? data.visible() : true;
  }

  return result;
}

model::SendResult ResultFromClassification(const Classification& classification, std::string raw_message) {
  model::SendResult result;
  result.code            = classification.code;
  result.is_success      = classification.IsSuccess();
  result.raw_message     = std::move(raw_message);
  result.display_message = classification.reason;
  return result;
}

} // namespace danmaku::errors
