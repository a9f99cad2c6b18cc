#pragma once

#include <exception>
#include <string>
#include <string_view>

#include "danmaku/provider/v1/provider.pb.h"
#include "internal/model/send_result.hpp"

namespace danmaku::errors {

/*
  Provider response taxonomy.

  Success, retryable failures (content / rate issues, the batch may go on)
  and everything that halts a batch: fatal provider codes, transport
  failures and codes missing from the table.
*/
enum class Outcome {
  kSuccess,
  kRetryable,
  kFatal,
  kNetwork,
  kUnknown,
};

struct ErrorInfo {
  int              code;
  std::string_view description;
  bool             is_fatal;
};

inline constexpr int kSuccessCode        = 0;
inline constexpr int kGenericFailureCode = -1;
inline constexpr int kFreqLimitCode      = 36703;

struct Classification {
  Outcome     outcome = Outcome::kSuccess;
  int         code    = kSuccessCode;
  std::string reason;
  // provider asked for a longer recovery window (frequency limit)
  bool        needs_cooldown = false;

  bool IsSuccess() const {
    return outcome == Outcome::kSuccess;
  }

  bool HaltsBatch() const {
    return outcome == Outcome::kFatal || outcome == Outcome::kNetwork || outcome == Outcome::kUnknown;
  }
};

std::string_view ToString(Outcome outcome);

// nullptr for codes outside the table
const ErrorInfo* Lookup(int code);

// Entry used for unrecognised codes and unexpected exceptions.
const ErrorInfo& UnknownError();

// Table description when known, else the provider's own text, else a generic one.
std::string ResolveMessage(int code, std::string_view raw_message);

Classification Classify(int code, std::string_view raw_message = {});

// Maps API client exceptions (and anything else) onto the taxonomy.
Classification ClassifyException(const std::exception& e);

model::SendResult ResultFromResponse(const danmaku::provider::v1::PostDanmakuResponse& response);

model::SendResult ResultFromClassification(const Classification& classification, std::string raw_message);

} // namespace danmaku::errors
