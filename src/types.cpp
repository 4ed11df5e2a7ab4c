/**
 * @file types.cpp
 * @brief Name tables for phases and error kinds
 */

#include "slide_reel/types.hpp"

#include <fmt/core.h>

namespace slide_reel {

const char *phase_name(Phase phase) {
  switch (phase) {
  case Phase::kLoading:
    return "loading";
  case Phase::kPreparing:
    return "preparing";
  case Phase::kProcessing:
    return "processing";
  case Phase::kFinalizing:
    return "finalizing";
  case Phase::kCompleted:
    return "completed";
  case Phase::kError:
    return "error";
  }
  return "error";
}

std::optional<Phase> phase_from_name(const std::string &name) {
  for (Phase p : {Phase::kLoading, Phase::kPreparing, Phase::kProcessing,
                  Phase::kFinalizing, Phase::kCompleted, Phase::kError}) {
    if (name == phase_name(p))
      return p;
  }
  return std::nullopt;
}

const char *error_kind_name(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::kEngineUnavailable:
    return "EngineUnavailable";
  case ErrorKind::kAssetWriteFailed:
    return "AssetWriteFailed";
  case ErrorKind::kEncodeStepFailed:
    return "EncodeStepFailed";
  case ErrorKind::kCancelled:
    return "Cancelled";
  case ErrorKind::kTimedOut:
    return "TimedOut";
  }
  return "EncodeStepFailed";
}

std::optional<ErrorKind> error_kind_from_name(const std::string &name) {
  for (ErrorKind k :
       {ErrorKind::kEngineUnavailable, ErrorKind::kAssetWriteFailed,
        ErrorKind::kEncodeStepFailed, ErrorKind::kCancelled,
        ErrorKind::kTimedOut}) {
    if (name == error_kind_name(k))
      return k;
  }
  return std::nullopt;
}

std::string describe(const ErrorDetail &error) {
  std::string reason;
  switch (error.kind) {
  case ErrorKind::kEngineUnavailable:
    reason = "encoding engine unavailable";
    break;
  case ErrorKind::kAssetWriteFailed:
    reason = fmt::format("could not prepare asset '{}'", error.subject);
    break;
  case ErrorKind::kEncodeStepFailed:
    reason = fmt::format("encode step '{}' failed", error.subject);
    break;
  case ErrorKind::kCancelled:
    reason = "run cancelled";
    break;
  case ErrorKind::kTimedOut:
    reason = "run exceeded its deadline";
    break;
  }
  if (!error.cause.empty())
    reason += ": " + error.cause;
  return reason;
}

} // namespace slide_reel
